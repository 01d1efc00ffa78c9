#pragma once

#include "tsync/core/result.hpp"
#include "tsync/core/time.hpp"
#include "tsync/schedule/job.hpp"
#include "tsync/schedule/run_coordinator.hpp"
#include "tsync/schedule/task_runner.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tsync::events {
class EventBus;
}

namespace tsync::schedule {

struct SchedulerSettings {
    std::size_t worker_threads = 10;
    std::chrono::seconds misfire_grace{60};
    /// Upper bound on how long the control loop sleeps between checks.
    std::chrono::milliseconds poll_interval{1000};
};

/// Point-in-time view of one registered job.
struct JobSnapshot {
    std::string id;
    std::string name;
    TaskType type = TaskType::Command;
    bool enabled = true;
    RunState state = RunState::Idle;
    bool pending = false;
    std::optional<TimePoint> last_run;
    std::optional<TimePoint> next_run;
    std::optional<RunStatus> last_status;
    std::string last_error;
};

/**
 * @brief Owns the job registry and the control loop
 *
 * One loop thread wakes at the earliest next fire (or after poll_interval),
 * hands due jobs to their RunCoordinator and goes back to sleep; the runs
 * themselves happen on a pool of worker_threads, so a slow job never holds
 * up another job's trigger.
 *
 * A fire overdue by more than misfire_grace (the process was suspended, the
 * clock jumped) is skipped and the job moves on to its next time.
 *
 * stop() ends the loop, cancels active runs and waits for them. Jobs can
 * still be run with run_now() afterwards; the pool lives as long as the
 * scheduler.
 */
class Scheduler {
public:
    using NowFn = std::function<TimePoint()>;

    explicit Scheduler(TaskRunner& runner,
                       const events::EventBus* bus = nullptr,
                       SchedulerSettings settings = {},
                       NowFn now = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Register a job. InvalidArgument for an empty or duplicate id. A
     * malformed trigger still registers the job, disabled, and returns the
     * Scheduling error.
     */
    Result<void> add_job(Job job);

    /// Replace a job's definition; a run in progress finishes with the old one.
    Result<void> update_job(Job job);

    Result<void> remove_job(const std::string& id);

    /// Replace the whole registry. Returns the errors of jobs that were rejected or disabled.
    std::vector<Error> reload(std::vector<Job> jobs);

    /// Fire a job immediately through the normal exclusivity rules.
    Result<FireDecision> run_now(const std::string& id);

    void start();
    void stop();
    [[nodiscard]] bool running() const;

    /// One pass of the control loop at `now`; returns how many fires were handed out.
    std::size_t dispatch_due(TimePoint now);

    [[nodiscard]] std::optional<TimePoint> next_wakeup() const;

    [[nodiscard]] std::vector<JobSnapshot> jobs() const;
    [[nodiscard]] std::optional<JobSnapshot> job(const std::string& id) const;

    /// Block until every job is idle with nothing queued.
    void wait_idle();

private:
    struct Entry {
        Job job;
        std::shared_ptr<RunCoordinator> coordinator;
        std::optional<RunStatus> last_status;
        std::string last_error;
    };

    Result<void> register_locked(Job job, std::vector<std::function<void()>>& notices);
    void retire_locked(std::map<std::string, Entry>::iterator it);
    std::vector<std::shared_ptr<RunCoordinator>> all_coordinators_locked() const;
    std::shared_ptr<RunCoordinator> make_coordinator(const Job& job);
    void on_complete(const Job& job, const ExecutionResult& result, std::optional<TimePoint> next_run);
    std::optional<TimePoint> compute_next(const Job& job, TimePoint after) const;
    JobSnapshot snapshot_locked(const Entry& entry) const;
    void loop();

    TaskRunner& runner_;
    const events::EventBus* bus_;
    SchedulerSettings settings_;
    NowFn now_;
    boost::asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Entry> entries_;
    // Coordinators of removed jobs that may still be running; a job added
    // back under the same id takes its old coordinator over
    std::map<std::string, std::shared_ptr<RunCoordinator>> retired_;
    bool running_ = false;
    bool stopping_ = false;
    bool changed_ = false;
    std::thread loop_thread_;
};

} // namespace tsync::schedule
