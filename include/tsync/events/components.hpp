/**
 * @file components.hpp
 * @brief Ready-made subscribers for scheduler and sync events
 *
 * WHY THIS FILE EXISTS:
 * The core classes only publish. Turning events into log lines or counters
 * is done here, so a daemon gets both by constructing two objects and a
 * test can leave them out.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * RunStatsComponent stats(bus);
 */

#pragma once

#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace tsync::events {

/**
 * @brief Logs every event through spdlog
 *
 * Lifecycle events at info, per-chunk progress at debug, failures at
 * warn/error. Unsubscribes on destruction.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<SchedulerStartedEvent>([](const SchedulerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Scheduler started with {} job(s)", e.job_count);
            spdlog::info("════════════════════════════════════════════");
        });

        track<SchedulerStoppedEvent>([](const SchedulerStoppedEvent&) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Scheduler stopped");
            spdlog::info("════════════════════════════════════════════");
        });

        track<JobRegisteredEvent>([](const JobRegisteredEvent& e) {
            spdlog::info("[JobRegistered] job={} next_run={}", e.job_id,
                         e.next_run ? to_iso8601(*e.next_run, TimeZone::Local) : std::string("never"));
        });

        track<JobDisabledEvent>([](const JobDisabledEvent& e) {
            spdlog::error("[JobDisabled] job={} reason={}", e.job_id, e.reason);
        });

        track<JobStartedEvent>([](const JobStartedEvent& e) {
            spdlog::info("[JobStarted] job={} name={} attempt={}", e.job_id, e.job_name, e.attempt);
        });

        track<JobSkippedEvent>([](const JobSkippedEvent& e) {
            spdlog::warn("[JobSkipped] job={} reason={}", e.job_id, e.reason);
        });

        track<JobQueuedEvent>([](const JobQueuedEvent& e) {
            spdlog::info("[JobQueued] job={}", e.job_id);
        });

        track<JobRetryingEvent>([](const JobRetryingEvent& e) {
            spdlog::warn("[JobRetrying] job={} failed_attempt={} delay={}ms error={}",
                         e.job_id, e.attempt, e.delay.count(), e.error);
        });

        track<JobFinishedEvent>([](const JobFinishedEvent& e) {
            const auto& r = e.result;
            if (r.status == schedule::RunStatus::Success) {
                spdlog::info("[JobFinished] job={} status={} exit_code={} duration={}ms attempts={}",
                             r.job_id, schedule::to_string(r.status), r.exit_code, r.duration().count(), r.attempts);
            } else {
                spdlog::warn("[JobFinished] job={} status={} exit_code={} duration={}ms attempts={} error={}",
                             r.job_id, schedule::to_string(r.status), r.exit_code, r.duration().count(),
                             r.attempts, r.error);
            }
        });

        track<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] task={} {} -> {} mode={}", e.task_id, e.source, e.target, sync::to_string(e.mode));
        });

        track<SyncPlannedEvent>([](const SyncPlannedEvent& e) {
            spdlog::info("[SyncPlanned] task={} copy={} update={} delete={} skip={} bytes={}",
                         e.task_id, e.copies, e.updates, e.deletes, e.skips, e.planned_bytes);
        });

        track<ChunkCommittedEvent>([](const ChunkCommittedEvent& e) {
            spdlog::debug("[ChunkCommitted] task={} path={} {}/{}", e.task_id, e.path, e.bytes_done, e.total_bytes);
        });

        track<FileSyncedEvent>([](const FileSyncedEvent& e) {
            const auto& s = e.status;
            if (s.outcome == sync::FileOutcome::Failed) {
                spdlog::error("[FileFailed] task={} path={} error={}", e.task_id, s.path, s.message);
            } else if (s.outcome == sync::FileOutcome::Skipped) {
                spdlog::warn("[FileSkipped] task={} path={} reason={}", e.task_id, s.path, s.message);
            } else if (s.outcome != sync::FileOutcome::Unchanged) {
                spdlog::info("[FileSynced] task={} path={} outcome={} bytes={}{}",
                             e.task_id, s.path, sync::to_string(s.outcome), s.bytes, s.resumed ? " (resumed)" : "");
            }
        });

        track<SyncFinishedEvent>([](const SyncFinishedEvent& e) {
            if (e.outcome == sync::SyncOutcome::Success) {
                spdlog::info("[SyncFinished] task={} {}", e.task_id, e.summary);
            } else {
                spdlog::warn("[SyncFinished] task={} outcome={} {}", e.task_id, sync::to_string(e.outcome), e.summary);
            }
        });
    }

    ~LoggerComponent() {
        for (const auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts runs and transferred data
 *
 * USAGE:
 * RunStatsComponent stats(bus);
 * // Later...
 * spdlog::info("failed runs: {}", stats.get_stats().runs_failed.load());
 */
class RunStatsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> runs_succeeded{0};
        std::atomic<std::uint64_t> runs_failed{0};
        std::atomic<std::uint64_t> runs_with_errors{0};
        std::atomic<std::uint64_t> runs_skipped{0};
        std::atomic<std::uint64_t> retries{0};
        std::atomic<std::uint64_t> files_transferred{0};
        std::atomic<std::uint64_t> files_failed{0};
        std::atomic<std::uint64_t> bytes_transferred{0};
    };

    explicit RunStatsComponent(EventBus& bus) : bus_(bus) {
        ids_.finished = bus_.subscribe<JobFinishedEvent>([this](const JobFinishedEvent& e) {
            on_job_finished(e);
        });

        ids_.skipped = bus_.subscribe<JobSkippedEvent>([this](const JobSkippedEvent&) {
            stats_.runs_skipped++;
        });

        ids_.retrying = bus_.subscribe<JobRetryingEvent>([this](const JobRetryingEvent&) {
            stats_.retries++;
        });

        ids_.file = bus_.subscribe<FileSyncedEvent>([this](const FileSyncedEvent& e) {
            on_file_synced(e);
        });
    }

    ~RunStatsComponent() {
        bus_.unsubscribe<JobFinishedEvent>(ids_.finished);
        bus_.unsubscribe<JobSkippedEvent>(ids_.skipped);
        bus_.unsubscribe<JobRetryingEvent>(ids_.retrying);
        bus_.unsubscribe<FileSyncedEvent>(ids_.file);
    }

    RunStatsComponent(const RunStatsComponent&) = delete;
    RunStatsComponent& operator=(const RunStatsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Run Statistics:");
        spdlog::info("  Runs succeeded:    {}", stats_.runs_succeeded.load());
        spdlog::info("  Runs with errors:  {}", stats_.runs_with_errors.load());
        spdlog::info("  Runs failed:       {}", stats_.runs_failed.load());
        spdlog::info("  Runs skipped:      {}", stats_.runs_skipped.load());
        spdlog::info("  Retries:           {}", stats_.retries.load());
        spdlog::info("  Files transferred: {}", stats_.files_transferred.load());
        spdlog::info("  Files failed:      {}", stats_.files_failed.load());
        spdlog::info("  Bytes transferred: {}", stats_.bytes_transferred.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_job_finished(const JobFinishedEvent& e) {
        switch (e.result.status) {
            case schedule::RunStatus::Success: stats_.runs_succeeded++; break;
            case schedule::RunStatus::CompletedWithErrors: stats_.runs_with_errors++; break;
            case schedule::RunStatus::Failed: stats_.runs_failed++; break;
        }
    }

    void on_file_synced(const FileSyncedEvent& e) {
        switch (e.status.outcome) {
            case sync::FileOutcome::Copied:
            case sync::FileOutcome::Updated:
                stats_.files_transferred++;
                break;
            case sync::FileOutcome::Failed:
                stats_.files_failed++;
                break;
            default:
                break;
        }
        stats_.bytes_transferred += e.status.bytes;
    }

    struct HandlerIds {
        EventBus::HandlerId finished = 0;
        EventBus::HandlerId skipped = 0;
        EventBus::HandlerId retrying = 0;
        EventBus::HandlerId file = 0;
    };

    EventBus& bus_;
    Stats stats_;
    HandlerIds ids_;
};

} // namespace tsync::events
