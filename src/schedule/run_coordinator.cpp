#include "tsync/schedule/run_coordinator.hpp"

#include "tsync/core/retry.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"
#include "tsync/schedule/cron.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace tsync::schedule {

const char* to_string(RunState state) noexcept {
    return state == RunState::Running ? "running" : "idle";
}

const char* to_string(FireDecision decision) noexcept {
    switch (decision) {
        case FireDecision::Started: return "started";
        case FireDecision::Queued: return "queued";
        case FireDecision::Skipped: return "skipped";
    }
    return "unknown";
}

RunCoordinator::RunCoordinator(Job job,
                               TaskRunner& runner,
                               boost::asio::thread_pool& pool,
                               const events::EventBus* bus,
                               Completion on_complete,
                               NowFn now)
    : runner_(runner),
      pool_(pool),
      bus_(bus),
      on_complete_(std::move(on_complete)),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })),
      job_(std::move(job)) {}

FireDecision RunCoordinator::fire() {
    std::unique_lock lock(mutex_);
    if (state_ == RunState::Idle) {
        state_ = RunState::Running;
        cancel_ = CancellationToken{};
        Job snapshot = job_;
        CancellationToken token = cancel_;
        lock.unlock();

        boost::asio::post(pool_, [self = shared_from_this(), snapshot = std::move(snapshot), token]() mutable {
            self->execute(std::move(snapshot), std::move(token));
        });
        return FireDecision::Started;
    }

    const std::string id = job_.id;
    if (job_.concurrency == ConcurrencyPolicy::QueueOne && !pending_) {
        pending_ = true;
        lock.unlock();
        spdlog::debug("Job {} is running, queued one more run", id);
        events::publish(bus_, events::JobQueuedEvent{id});
        return FireDecision::Queued;
    }

    const char* reason = pending_ ? "a run is already queued" : "previous run still active";
    lock.unlock();
    events::publish(bus_, events::JobSkippedEvent{id, reason});
    return FireDecision::Skipped;
}

void RunCoordinator::update(Job job) {
    std::lock_guard lock(mutex_);
    job_ = std::move(job);
}

void RunCoordinator::cancel() {
    {
        std::lock_guard lock(mutex_);
        pending_ = false;
        cancel_.cancel();
    }
    wake_cv_.notify_all();
}

void RunCoordinator::wait_idle() {
    std::unique_lock lock(mutex_);
    state_cv_.wait(lock, [this] { return state_ == RunState::Idle; });
}

RunState RunCoordinator::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool RunCoordinator::pending() const {
    std::lock_guard lock(mutex_);
    return pending_;
}

Job RunCoordinator::job() const {
    std::lock_guard lock(mutex_);
    return job_;
}

std::optional<ExecutionResult> RunCoordinator::last_result() const {
    std::lock_guard lock(mutex_);
    return last_result_;
}

std::optional<TimePoint> RunCoordinator::next_fire(const Job& job) const {
    if (!job.enabled) {
        return std::nullopt;
    }
    auto next = next_fire_time(job.trigger, now_(), job.timezone);
    if (next.is_error()) {
        spdlog::error("Job {}: {}", job.id, next.error().describe());
        return std::nullopt;
    }
    return next.value();
}

void RunCoordinator::execute(Job job, CancellationToken cancel) {
    for (;;) {
        ExecutionResult result = run_with_retry(job, cancel);
        job.last_run = result.started;
        job.next_run = next_fire(job);

        events::publish(bus_, events::JobFinishedEvent{job, result, job.next_run});
        if (on_complete_) {
            on_complete_(job, result, job.next_run);
        }

        std::unique_lock lock(mutex_);
        last_result_ = std::move(result);
        if (pending_) {
            // The queued run picks up the latest definition
            pending_ = false;
            job = job_;
            cancel_ = CancellationToken{};
            cancel = cancel_;
            continue;
        }
        state_ = RunState::Idle;
        lock.unlock();
        state_cv_.notify_all();
        return;
    }
}

ExecutionResult RunCoordinator::run_once(const Job& job, const CancellationToken& cancel, std::size_t attempt) {
    events::publish(bus_, events::JobStartedEvent{job.id, job.name, attempt});
    try {
        ExecutionResult result = runner_.run(RunContext{job, cancel, attempt});
        result.attempts = attempt;
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Job {} terminated unexpectedly: {}", job.id, e.what());
        ExecutionResult result;
        result.job_id = job.id;
        result.job_name = job.name;
        result.type = job.type();
        result.started = result.finished = Clock::now();
        result.status = RunStatus::Failed;
        result.exit_code = -1;
        result.error = std::string("unexpected termination: ") + e.what();
        result.attempts = attempt;
        return result;
    }
}

void RunCoordinator::interruptible_sleep(std::chrono::milliseconds delay, const CancellationToken& cancel) {
    std::unique_lock lock(mutex_);
    wake_cv_.wait_for(lock, delay, [&cancel] { return cancel.is_cancelled(); });
}

ExecutionResult RunCoordinator::run_with_retry(const Job& job, const CancellationToken& cancel) {
    RetryPolicy policy = job.retry.policy([this, &cancel](std::chrono::milliseconds delay) {
        interruptible_sleep(delay, cancel);
    });

    const TimePoint first_start = Clock::now();
    std::optional<ExecutionResult> previous;
    ExecutionResult result = retry_call(
        policy,
        [&](std::size_t attempt) {
            // Cancelled during backoff: end as a cancelled run instead of starting another
            if (previous && cancel.is_cancelled()) {
                ExecutionResult cancelled = *previous;
                cancelled.status = RunStatus::Failed;
                cancelled.exit_code = -1;
                cancelled.error = "cancelled";
                cancelled.finished = Clock::now();
                spdlog::info("Job {} cancelled while waiting to retry", job.id);
                return cancelled;
            }
            previous = run_once(job, cancel, attempt);
            return *previous;
        },
        [&](const ExecutionResult& outcome) {
            if (outcome.status != RunStatus::Failed || cancel.is_cancelled()) {
                return false;
            }
            if (outcome.attempts >= policy.max_attempts) {
                return false;
            }
            const auto delay = policy.delay_for(outcome.attempts);
            spdlog::warn("Job {} attempt {} failed ({}), retrying in {}ms",
                         job.id, outcome.attempts, outcome.error, delay.count());
            events::publish(bus_, events::JobRetryingEvent{job.id, outcome.attempts, delay, outcome.error});
            return true;
        });

    if (result.started > first_start) {
        result.started = first_start;
    }
    return result;
}

} // namespace tsync::schedule
