#pragma once

#include "tsync/core/retry.hpp"
#include "tsync/core/time.hpp"
#include "tsync/schedule/output_parser.hpp"
#include "tsync/sync/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tsync::schedule {

struct CommandTask {
    std::string command;
    std::string working_dir;
    std::optional<std::chrono::seconds> timeout;
};

using sync::SyncTask;
using TaskPayload = std::variant<CommandTask, SyncTask>;

enum class TaskType { Command, Sync };

/// What happens when a job fires while its previous run is still active.
enum class ConcurrencyPolicy { Skip, QueueOne };

enum class RunStatus { Success, Failed, CompletedWithErrors };

const char* to_string(TaskType type) noexcept;
const char* to_string(ConcurrencyPolicy policy) noexcept;
const char* to_string(RunStatus status) noexcept;
std::optional<TaskType> parse_task_type(const std::string& name);
std::optional<ConcurrencyPolicy> parse_concurrency_policy(const std::string& name);

struct RetrySettings {
    std::size_t count = 0;   ///< Extra attempts after the first
    std::chrono::milliseconds backoff{1000};
    std::chrono::milliseconds max_backoff{60000};

    /// Exponential policy over count + 1 attempts.
    [[nodiscard]] RetryPolicy policy(RetryPolicy::Sleeper sleeper = {}) const;
};

struct Job {
    std::string id;
    std::string name;
    std::string description;
    std::string trigger;   ///< Cron expression, 5 or 6 fields
    TaskPayload payload;
    bool enabled = true;
    ConcurrencyPolicy concurrency = ConcurrencyPolicy::Skip;
    RetrySettings retry;
    TimeZone timezone = TimeZone::Local;
    std::vector<OutputExtractor> extractors;
    std::optional<TimePoint> last_run;
    std::optional<TimePoint> next_run;

    [[nodiscard]] TaskType type() const noexcept {
        return std::holds_alternative<SyncTask>(payload) ? TaskType::Sync : TaskType::Command;
    }
};

struct ExecutionResult {
    std::string job_id;
    std::string job_name;
    TaskType type = TaskType::Command;
    TimePoint started{};
    TimePoint finished{};
    RunStatus status = RunStatus::Failed;
    int exit_code = 0;
    std::string output;
    std::string error_output;
    std::optional<sync::SyncResult> sync;
    std::map<std::string, std::string> custom_vars;
    std::string error;        ///< Why the run failed, empty on success
    std::size_t attempts = 1;

    [[nodiscard]] bool succeeded() const noexcept { return status == RunStatus::Success; }

    [[nodiscard]] std::chrono::milliseconds duration() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(finished - started);
    }
};

} // namespace tsync::schedule
