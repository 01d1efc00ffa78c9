#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tsync::events;

namespace {

FileSyncedEvent file_event(const std::string& path, std::uint64_t bytes) {
    tsync::sync::FileStatus status;
    status.path = path;
    status.outcome = tsync::sync::FileOutcome::Copied;
    status.bytes = bytes;
    return FileSyncedEvent{"photos", status};
}

} // namespace

TEST(EventBusTest, DeliversToTheMatchingEventTypeOnly) {
    EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe<FileSyncedEvent>([&](const FileSyncedEvent& e) { seen.push_back("file " + e.status.path); });
    bus.subscribe<JobSkippedEvent>([&](const JobSkippedEvent& e) { seen.push_back("skip " + e.job_id); });

    bus.emit(file_event("a.jpg", 10));
    bus.emit(JobSkippedEvent{"nightly", "previous run still active"});
    bus.emit(SyncStartedEvent{"photos", "local:/a", "local:/b", tsync::sync::SyncMode::Mirror});

    EXPECT_EQ(seen, (std::vector<std::string>{"file a.jpg", "skip nightly"}));
}

TEST(EventBusTest, EveryHandlerSeesTheEventInSubscriptionOrder) {
    EventBus bus;
    std::string order;

    bus.subscribe<SyncFinishedEvent>([&](const SyncFinishedEvent&) { order += "log,"; });
    bus.subscribe<SyncFinishedEvent>([&](const SyncFinishedEvent&) { order += "stats,"; });
    bus.subscribe<SyncFinishedEvent>([&](const SyncFinishedEvent& e) { order += e.summary; });

    bus.emit(SyncFinishedEvent{"photos", tsync::sync::SyncOutcome::Success, "done"});

    EXPECT_EQ(order, "log,stats,done");
}

TEST(EventBusTest, UnsubscribedHandlerIsNotCalled) {
    EventBus bus;
    int calls = 0;

    const auto id = bus.subscribe<JobQueuedEvent>([&](const JobQueuedEvent&) { ++calls; });
    bus.emit(JobQueuedEvent{"nightly"});
    bus.unsubscribe<JobQueuedEvent>(id);
    bus.emit(JobQueuedEvent{"nightly"});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriber_count<JobQueuedEvent>(), 0u);

    // Unknown ids and types are ignored
    bus.unsubscribe<JobQueuedEvent>(id);
    bus.unsubscribe<SchedulerStoppedEvent>(99);
}

TEST(EventBusTest, EmitWithoutSubscribersIsHarmless) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(SchedulerStartedEvent{3}));
    EXPECT_NO_THROW(publish<SchedulerStoppedEvent>(nullptr, SchedulerStoppedEvent{}));
}

TEST(EventBusTest, CountsAndClearsSubscribers) {
    EventBus bus;
    bus.subscribe<ChunkCommittedEvent>([](const ChunkCommittedEvent&) {});
    bus.subscribe<ChunkCommittedEvent>([](const ChunkCommittedEvent&) {});
    bus.subscribe<JobRegisteredEvent>([](const JobRegisteredEvent&) {});

    EXPECT_EQ(bus.subscriber_count<ChunkCommittedEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<JobRegisteredEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<ChunkCommittedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<JobRegisteredEvent>(), 0u);
}

TEST(EventBusTest, ConcurrentWorkersEmitSafely) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};
    bus.subscribe<FileSyncedEvent>([&](const FileSyncedEvent& e) { bytes += e.status.bytes; });

    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&bus, w] {
            for (int i = 0; i < 50; ++i) {
                bus.emit(file_event("w" + std::to_string(w) + "/" + std::to_string(i), 4));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(bytes.load(), 8u * 50u * 4u);
}

TEST(EventBusTest, SubscribingFromManyThreadsRegistersEveryHandler) {
    EventBus bus;
    std::atomic<int> calls{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&] {
            bus.subscribe<JobDisabledEvent>([&](const JobDisabledEvent&) { ++calls; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(JobDisabledEvent{"broken", "invalid minute field"});
    EXPECT_EQ(calls.load(), 10);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStarveTheRest) {
    EventBus bus;
    int delivered = 0;

    bus.subscribe<JobRetryingEvent>([](const JobRetryingEvent&) { throw std::runtime_error("sink offline"); });
    bus.subscribe<JobRetryingEvent>([&](const JobRetryingEvent& e) { delivered += static_cast<int>(e.attempt); });

    EXPECT_NO_THROW(bus.emit(JobRetryingEvent{"nightly", 2, std::chrono::milliseconds(100), "timeout"}));
    EXPECT_EQ(delivered, 2);
}

TEST(EventBusTest, HandlersMayUseTheBusReentrantly) {
    EventBus bus;
    std::vector<std::string> trail;

    // A finished sync triggers a follow-up event from inside the handler
    bus.subscribe<SyncFinishedEvent>([&](const SyncFinishedEvent& e) {
        trail.push_back("finished " + e.task_id);
        bus.subscribe<JobQueuedEvent>([&](const JobQueuedEvent& q) { trail.push_back("queued " + q.job_id); });
        bus.emit(JobQueuedEvent{e.task_id});
    });

    bus.emit(SyncFinishedEvent{"photos", tsync::sync::SyncOutcome::Success, ""});

    EXPECT_EQ(trail, (std::vector<std::string>{"finished photos", "queued photos"}));
}
