#include "tsync/schedule/job.hpp"

#include <algorithm>

namespace tsync::schedule {

const char* to_string(TaskType type) noexcept {
    return type == TaskType::Sync ? "sync" : "command";
}

const char* to_string(ConcurrencyPolicy policy) noexcept {
    return policy == ConcurrencyPolicy::QueueOne ? "queue_one" : "skip";
}

const char* to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Success: return "success";
        case RunStatus::Failed: return "failed";
        case RunStatus::CompletedWithErrors: return "completed_with_errors";
    }
    return "unknown";
}

std::optional<TaskType> parse_task_type(const std::string& name) {
    if (name == "command") return TaskType::Command;
    if (name == "sync") return TaskType::Sync;
    return std::nullopt;
}

std::optional<ConcurrencyPolicy> parse_concurrency_policy(const std::string& name) {
    if (name == "skip") return ConcurrencyPolicy::Skip;
    if (name == "queue_one" || name == "queue") return ConcurrencyPolicy::QueueOne;
    return std::nullopt;
}

RetryPolicy RetrySettings::policy(RetryPolicy::Sleeper sleeper) const {
    auto result = RetryPolicy::exponential(count + 1, backoff, std::max(backoff, max_backoff));
    result.sleep = std::move(sleeper);
    return result;
}

} // namespace tsync::schedule
