#pragma once

#include "tsync/core/cancellation.hpp"
#include "tsync/core/time.hpp"
#include "tsync/schedule/job.hpp"
#include "tsync/schedule/task_runner.hpp"

#include <boost/asio/thread_pool.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace tsync::events {
class EventBus;
}

namespace tsync::schedule {

enum class RunState { Idle, Running };

/// What a trigger fire turned into.
enum class FireDecision { Started, Queued, Skipped };

const char* to_string(RunState state) noexcept;
const char* to_string(FireDecision decision) noexcept;

/**
 * @brief Per-job exclusivity and retry controller
 *
 * State machine: Idle -> Running -> Idle. A fire while Running follows the
 * job's concurrency policy: Skip drops it, QueueOne remembers at most one
 * pending run that starts as soon as the current one ends.
 *
 * A run is attempted up to retry.count + 1 times with exponential backoff
 * while it ends Failed. Backoff waits are cut short by cancel(). An
 * exception escaping the runner ends that attempt as Failed.
 *
 * Runs execute on the shared pool; the coordinator must be owned by a
 * shared_ptr so an in-flight run keeps it alive.
 */
class RunCoordinator : public std::enable_shared_from_this<RunCoordinator> {
public:
    using NowFn = std::function<TimePoint()>;

    /// Called on the worker thread after every run with the next fire time.
    using Completion = std::function<void(const Job&, const ExecutionResult&, std::optional<TimePoint> next_run)>;

    RunCoordinator(Job job,
                   TaskRunner& runner,
                   boost::asio::thread_pool& pool,
                   const events::EventBus* bus = nullptr,
                   Completion on_complete = {},
                   NowFn now = {});

    RunCoordinator(const RunCoordinator&) = delete;
    RunCoordinator& operator=(const RunCoordinator&) = delete;

    FireDecision fire();

    /// New definition, used from the next run on.
    void update(Job job);

    /// Cancel the active run, interrupt its backoff and drop a queued run.
    void cancel();

    /// Block until no run is active or queued.
    void wait_idle();

    [[nodiscard]] RunState state() const;
    [[nodiscard]] bool pending() const;
    [[nodiscard]] Job job() const;
    [[nodiscard]] std::optional<ExecutionResult> last_result() const;

private:
    void execute(Job job, CancellationToken cancel);
    ExecutionResult run_with_retry(const Job& job, const CancellationToken& cancel);
    ExecutionResult run_once(const Job& job, const CancellationToken& cancel, std::size_t attempt);
    void interruptible_sleep(std::chrono::milliseconds delay, const CancellationToken& cancel);
    std::optional<TimePoint> next_fire(const Job& job) const;

    TaskRunner& runner_;
    boost::asio::thread_pool& pool_;
    const events::EventBus* bus_;
    Completion on_complete_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::condition_variable wake_cv_;
    Job job_;
    RunState state_ = RunState::Idle;
    bool pending_ = false;
    CancellationToken cancel_;
    std::optional<ExecutionResult> last_result_;
};

} // namespace tsync::schedule
