/**
 * @file events.hpp
 * @brief Event types published by the scheduler and the sync engine
 *
 * NAMING CONVENTION:
 * Events are past tense and carry plain data. Every event records when it
 * was created.
 */

#pragma once

#include "tsync/core/time.hpp"
#include "tsync/schedule/job.hpp"
#include "tsync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tsync::events {

// ════════════════════════════════════════════════════════
// Scheduler lifecycle
// ════════════════════════════════════════════════════════

struct SchedulerStartedEvent {
    std::size_t job_count = 0;
    TimePoint timestamp = Clock::now();
};

struct SchedulerStoppedEvent {
    TimePoint timestamp = Clock::now();
};

/// A job entered the registry (add, update or reload).
struct JobRegisteredEvent {
    std::string job_id;
    std::optional<TimePoint> next_run;
    TimePoint timestamp = Clock::now();
};

/// A job was disabled because its trigger cannot be evaluated.
struct JobDisabledEvent {
    std::string job_id;
    std::string reason;
    TimePoint timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Job runs
// ════════════════════════════════════════════════════════

struct JobStartedEvent {
    std::string job_id;
    std::string job_name;
    std::size_t attempt = 1;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief A fire was not executed
 *
 * WHO EMITS: RunCoordinator (job already running under the skip policy,
 * or a second queued run), Scheduler (misfire beyond the grace period).
 */
struct JobSkippedEvent {
    std::string job_id;
    std::string reason;
    TimePoint timestamp = Clock::now();
};

/// A fire arrived while running and was queued to follow the current run.
struct JobQueuedEvent {
    std::string job_id;
    TimePoint timestamp = Clock::now();
};

struct JobRetryingEvent {
    std::string job_id;
    std::size_t attempt = 1;   ///< The attempt that just failed
    std::chrono::milliseconds delay{0};
    std::string error;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief A run (including its retries) is over
 *
 * WHO SUBSCRIBES: LoggerComponent, RunStatsComponent, NotificationRelay.
 */
struct JobFinishedEvent {
    schedule::Job job;
    schedule::ExecutionResult result;
    std::optional<TimePoint> next_run;
    TimePoint timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Synchronization
// ════════════════════════════════════════════════════════

struct SyncStartedEvent {
    std::string task_id;
    std::string source;
    std::string target;
    sync::SyncMode mode = sync::SyncMode::Incremental;
    TimePoint timestamp = Clock::now();
};

struct SyncPlannedEvent {
    std::string task_id;
    std::size_t copies = 0;
    std::size_t updates = 0;
    std::size_t deletes = 0;
    std::size_t skips = 0;
    std::uint64_t planned_bytes = 0;
    TimePoint timestamp = Clock::now();
};

/// One chunk landed on the target and its checkpoint was recorded.
struct ChunkCommittedEvent {
    std::string task_id;
    std::string path;
    std::uint64_t bytes_done = 0;
    std::uint64_t total_bytes = 0;
    TimePoint timestamp = Clock::now();
};

struct FileSyncedEvent {
    std::string task_id;
    sync::FileStatus status;
    TimePoint timestamp = Clock::now();
};

struct SyncFinishedEvent {
    std::string task_id;
    sync::SyncOutcome outcome = sync::SyncOutcome::Success;
    std::string summary;
    TimePoint timestamp = Clock::now();
};

} // namespace tsync::events
