#include "tsync/schedule/scheduler.hpp"

#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"
#include "tsync/schedule/cron.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <utility>

namespace tsync::schedule {

Scheduler::Scheduler(TaskRunner& runner, const events::EventBus* bus, SchedulerSettings settings, NowFn now)
    : runner_(runner),
      bus_(bus),
      settings_(settings),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })),
      pool_(std::max<std::size_t>(1, settings.worker_threads)) {}

Scheduler::~Scheduler() {
    stop();
    {
        std::lock_guard lock(mutex_);
        for (const auto& coordinator : all_coordinators_locked()) {
            coordinator->cancel();
        }
    }
    pool_.join();
}

std::vector<std::shared_ptr<RunCoordinator>> Scheduler::all_coordinators_locked() const {
    std::vector<std::shared_ptr<RunCoordinator>> coordinators;
    for (const auto& [id, entry] : entries_) {
        coordinators.push_back(entry.coordinator);
    }
    for (const auto& [id, coordinator] : retired_) {
        coordinators.push_back(coordinator);
    }
    return coordinators;
}

void Scheduler::retire_locked(std::map<std::string, Entry>::iterator it) {
    for (auto old = retired_.begin(); old != retired_.end();) {
        const bool idle = old->second->state() == RunState::Idle && !old->second->pending();
        old = idle ? retired_.erase(old) : std::next(old);
    }
    const auto& coordinator = it->second.coordinator;
    if (coordinator->state() != RunState::Idle || coordinator->pending()) {
        retired_[it->first] = coordinator;
    }
    entries_.erase(it);
}

std::optional<TimePoint> Scheduler::compute_next(const Job& job, TimePoint after) const {
    if (!job.enabled) {
        return std::nullopt;
    }
    auto next = next_fire_time(job.trigger, after, job.timezone);
    if (next.is_error()) {
        return std::nullopt;
    }
    if (!next.value()) {
        spdlog::warn("Job {}: trigger '{}' never fires", job.id, job.trigger);
    }
    return next.value();
}

std::shared_ptr<RunCoordinator> Scheduler::make_coordinator(const Job& job) {
    return std::make_shared<RunCoordinator>(
        job, runner_, pool_, bus_,
        [this](const Job& finished, const ExecutionResult& result, std::optional<TimePoint> next_run) {
            on_complete(finished, result, next_run);
        },
        now_);
}

Result<void> Scheduler::register_locked(Job job, std::vector<std::function<void()>>& notices) {
    if (job.id.empty()) {
        return Err<void, Error>(Error{ErrorKind::InvalidArgument, "job id must not be empty"});
    }

    for (const auto& extractor : job.extractors) {
        if (auto valid = validate_extractor(extractor); valid.is_error()) {
            spdlog::warn("Job {}: extractor {} ignored: {}", job.id, extractor.name, valid.error().message);
        }
    }

    Result<void> status = Ok();
    auto parsed = CronExpression::parse(job.trigger);
    if (parsed.is_error()) {
        job.enabled = false;
        job.next_run.reset();
        status = Err<void, Error>(parsed.error());
        spdlog::error("Job {} disabled: {}", job.id, parsed.error().message);
        notices.push_back([this, id = job.id, reason = parsed.error().message] {
            events::publish(bus_, events::JobDisabledEvent{id, reason});
        });
    } else {
        job.next_run = job.enabled ? parsed.value().next_after(now_(), job.timezone) : std::nullopt;
        notices.push_back([this, id = job.id, next = job.next_run] {
            events::publish(bus_, events::JobRegisteredEvent{id, next});
        });
    }

    auto it = entries_.find(job.id);
    if (it == entries_.end()) {
        Entry entry;
        if (auto retired = retired_.find(job.id); retired != retired_.end()) {
            // Its earlier run is still going; sharing the coordinator keeps the job exclusive
            entry.coordinator = retired->second;
            entry.coordinator->update(job);
            retired_.erase(retired);
        } else {
            entry.coordinator = make_coordinator(job);
        }
        entry.job = std::move(job);
        const std::string id = entry.job.id;
        entries_.emplace(id, std::move(entry));
    } else {
        job.last_run = it->second.job.last_run;
        it->second.coordinator->update(job);
        it->second.job = std::move(job);
    }
    changed_ = true;
    return status;
}

Result<void> Scheduler::add_job(Job job) {
    std::vector<std::function<void()>> notices;
    Result<void> status = Ok();
    {
        std::lock_guard lock(mutex_);
        if (entries_.count(job.id) != 0) {
            return Err<void, Error>(Error{ErrorKind::InvalidArgument, "job " + job.id + " already exists"});
        }
        status = register_locked(std::move(job), notices);
    }
    cv_.notify_all();
    for (const auto& notice : notices) {
        notice();
    }
    return status;
}

Result<void> Scheduler::update_job(Job job) {
    std::vector<std::function<void()>> notices;
    Result<void> status = Ok();
    {
        std::lock_guard lock(mutex_);
        if (entries_.count(job.id) == 0) {
            return Err<void, Error>(Error{ErrorKind::NotFound, "no job " + job.id});
        }
        status = register_locked(std::move(job), notices);
    }
    cv_.notify_all();
    for (const auto& notice : notices) {
        notice();
    }
    return status;
}

Result<void> Scheduler::remove_job(const std::string& id) {
    std::shared_ptr<RunCoordinator> coordinator;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return Err<void, Error>(Error{ErrorKind::NotFound, "no job " + id});
        }
        coordinator = it->second.coordinator;
        retire_locked(it);
        changed_ = true;
    }
    cv_.notify_all();
    if (coordinator->state() == RunState::Running) {
        spdlog::info("Job {} removed, its active run will finish", id);
    } else {
        spdlog::info("Job {} removed", id);
    }
    return Ok();
}

std::vector<Error> Scheduler::reload(std::vector<Job> jobs) {
    std::vector<Error> errors;
    std::vector<std::function<void()>> notices;
    std::size_t registered = 0;
    {
        std::lock_guard lock(mutex_);
        std::set<std::string> wanted;
        for (auto& job : jobs) {
            if (!wanted.insert(job.id).second) {
                errors.emplace_back(ErrorKind::InvalidArgument, "duplicate job id " + job.id);
                continue;
            }
            if (auto status = register_locked(std::move(job), notices); status.is_error()) {
                errors.push_back(status.error());
            }
        }
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (wanted.count(it->first) == 0) {
                spdlog::info("Job {} no longer configured", it->first);
                retire_locked(it++);
            } else {
                ++it;
            }
        }
        registered = entries_.size();
        changed_ = true;
    }
    cv_.notify_all();
    for (const auto& notice : notices) {
        notice();
    }
    spdlog::info("Registry reloaded: {} job(s), {} problem(s)", registered, errors.size());
    return errors;
}

Result<FireDecision> Scheduler::run_now(const std::string& id) {
    std::shared_ptr<RunCoordinator> coordinator;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return Err<FireDecision>(ErrorKind::NotFound, "no job " + id);
        }
        coordinator = it->second.coordinator;
    }
    spdlog::info("Running job {} on request", id);
    return Ok(coordinator->fire());
}

void Scheduler::on_complete(const Job& job, const ExecutionResult& result, std::optional<TimePoint> next_run) {
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(job.id);
        if (it == entries_.end()) {
            return;
        }
        Entry& entry = it->second;
        entry.job.last_run = result.started;
        entry.last_status = result.status;
        entry.last_error = result.error;
        // Fires that came due during the run were already handed out or skipped
        if (entry.job.enabled && next_run && (!entry.job.next_run || *entry.job.next_run < *next_run)) {
            entry.job.next_run = next_run;
        }
        changed_ = true;
    }
    cv_.notify_all();
}

std::size_t Scheduler::dispatch_due(TimePoint now) {
    std::vector<std::shared_ptr<RunCoordinator>> due;
    std::vector<std::string> misfired;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : entries_) {
            Job& job = entry.job;
            if (!job.enabled || !job.next_run || *job.next_run > now) {
                continue;
            }
            if (now - *job.next_run > settings_.misfire_grace) {
                misfired.push_back(id);
            } else {
                due.push_back(entry.coordinator);
            }
            job.next_run = compute_next(job, now);
        }
    }

    for (const auto& id : misfired) {
        spdlog::warn("Job {} missed its fire time by more than {}s, skipping", id, settings_.misfire_grace.count());
        events::publish(bus_, events::JobSkippedEvent{id, "misfire"});
    }
    std::size_t dispatched = 0;
    for (const auto& coordinator : due) {
        if (coordinator->fire() != FireDecision::Skipped) {
            ++dispatched;
        }
    }
    return dispatched;
}

std::optional<TimePoint> Scheduler::next_wakeup() const {
    std::lock_guard lock(mutex_);
    std::optional<TimePoint> earliest;
    for (const auto& [id, entry] : entries_) {
        const auto& next = entry.job.next_run;
        if (entry.job.enabled && next && (!earliest || *next < *earliest)) {
            earliest = next;
        }
    }
    return earliest;
}

void Scheduler::loop() {
    spdlog::debug("Scheduler loop started");
    for (;;) {
        dispatch_due(now_());

        const TimePoint now = now_();
        auto delay = settings_.poll_interval;
        if (auto wake = next_wakeup()) {
            const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*wake - now);
            delay = std::clamp(until, std::chrono::milliseconds(0), settings_.poll_interval);
        }

        std::unique_lock lock(mutex_);
        if (stopping_) {
            break;
        }
        cv_.wait_for(lock, delay, [this] { return stopping_ || changed_; });
        changed_ = false;
        if (stopping_) {
            break;
        }
    }
    spdlog::debug("Scheduler loop stopped");
}

void Scheduler::start() {
    std::size_t job_count = 0;
    {
        std::lock_guard lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        stopping_ = false;
        job_count = entries_.size();
        // Re-anchor triggers so downtime does not look like a misfire
        const TimePoint now = now_();
        for (auto& [id, entry] : entries_) {
            entry.job.next_run = compute_next(entry.job, now);
        }
    }
    loop_thread_ = std::thread([this] { loop(); });
    spdlog::info("Scheduler started with {} job(s), {} worker(s)", job_count, settings_.worker_threads);
    events::publish(bus_, events::SchedulerStartedEvent{job_count});
}

void Scheduler::stop() {
    std::vector<std::shared_ptr<RunCoordinator>> coordinators;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        stopping_ = true;
        coordinators = all_coordinators_locked();
    }
    cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    for (const auto& coordinator : coordinators) {
        coordinator->cancel();
    }
    for (const auto& coordinator : coordinators) {
        coordinator->wait_idle();
    }
    spdlog::info("Scheduler stopped");
    events::publish(bus_, events::SchedulerStoppedEvent{});
}

bool Scheduler::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

JobSnapshot Scheduler::snapshot_locked(const Entry& entry) const {
    JobSnapshot snapshot;
    snapshot.id = entry.job.id;
    snapshot.name = entry.job.name;
    snapshot.type = entry.job.type();
    snapshot.enabled = entry.job.enabled;
    snapshot.state = entry.coordinator->state();
    snapshot.pending = entry.coordinator->pending();
    snapshot.last_run = entry.job.last_run;
    snapshot.next_run = entry.job.next_run;
    snapshot.last_status = entry.last_status;
    snapshot.last_error = entry.last_error;
    return snapshot;
}

std::vector<JobSnapshot> Scheduler::jobs() const {
    std::lock_guard lock(mutex_);
    std::vector<JobSnapshot> snapshots;
    snapshots.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        snapshots.push_back(snapshot_locked(entry));
    }
    return snapshots;
}

std::optional<JobSnapshot> Scheduler::job(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return snapshot_locked(it->second);
}

void Scheduler::wait_idle() {
    std::vector<std::shared_ptr<RunCoordinator>> coordinators;
    {
        std::lock_guard lock(mutex_);
        coordinators = all_coordinators_locked();
    }
    for (const auto& coordinator : coordinators) {
        coordinator->wait_idle();
    }
}

} // namespace tsync::schedule
