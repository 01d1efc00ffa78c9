#include "tsync/events/components.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using tsync::events::EventBus;
using tsync::events::FileSyncedEvent;
using tsync::events::JobFinishedEvent;
using tsync::events::JobRetryingEvent;
using tsync::events::JobSkippedEvent;
using tsync::events::RunStatsComponent;
using tsync::schedule::RunStatus;

namespace {

FileSyncedEvent synced(const char* path, tsync::sync::FileOutcome outcome, std::uint64_t bytes) {
    tsync::sync::FileStatus status;
    status.path = path;
    status.outcome = outcome;
    status.bytes = bytes;
    return FileSyncedEvent{"docs", status};
}

JobFinishedEvent finished(RunStatus status) {
    JobFinishedEvent event;
    event.job.id = "docs";
    event.result.job_id = "docs";
    event.result.status = status;
    return event;
}

} // namespace

TEST(RunStatsComponentTest, TracksRunAndTransferCounters) {
    EventBus bus;
    RunStatsComponent stats(bus);

    bus.emit(synced("a.txt", tsync::sync::FileOutcome::Copied, 1024));
    bus.emit(synced("b.txt", tsync::sync::FileOutcome::Updated, 2048));
    bus.emit(synced("c.txt", tsync::sync::FileOutcome::Failed, 0));
    bus.emit(synced("d.txt", tsync::sync::FileOutcome::Unchanged, 0));

    bus.emit(finished(RunStatus::Success));
    bus.emit(finished(RunStatus::CompletedWithErrors));
    bus.emit(finished(RunStatus::Failed));
    bus.emit(finished(RunStatus::Failed));
    bus.emit(JobSkippedEvent{"docs", "already running"});
    bus.emit(JobRetryingEvent{"docs", 1, std::chrono::milliseconds{500}, "connection: refused"});

    const auto& s = stats.get_stats();
    EXPECT_EQ(s.files_transferred.load(), 2u);
    EXPECT_EQ(s.files_failed.load(), 1u);
    EXPECT_EQ(s.bytes_transferred.load(), 3072u);
    EXPECT_EQ(s.runs_succeeded.load(), 1u);
    EXPECT_EQ(s.runs_with_errors.load(), 1u);
    EXPECT_EQ(s.runs_failed.load(), 2u);
    EXPECT_EQ(s.runs_skipped.load(), 1u);
    EXPECT_EQ(s.retries.load(), 1u);
}

TEST(RunStatsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        RunStatsComponent stats(bus);
        EXPECT_EQ(bus.subscriber_count<JobFinishedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<FileSyncedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<JobFinishedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<FileSyncedEvent>(), 0u);
    bus.emit(finished(RunStatus::Success));
}
