#pragma once

#include "tsync/core/result.hpp"
#include "tsync/core/time.hpp"
#include "tsync/transport/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsync::sync {

using transport::Endpoint;
using transport::FileEntry;
using transport::FileKind;

enum class SyncMode { Mirror, Incremental, AddOnly };

enum class CompareMethod { SizeTime, Size, Time, Checksum };

/// Preset modification-time windows, resolved against the planning time.
enum class TimeWindow { Any, Today, Yesterday, LastDays3, LastDays7, LastDays30, Custom };

const char* to_string(SyncMode mode) noexcept;
const char* to_string(CompareMethod method) noexcept;
std::optional<SyncMode> parse_sync_mode(const std::string& name);
std::optional<CompareMethod> parse_compare_method(const std::string& name);
std::optional<TimeWindow> parse_time_window(const std::string& name);

struct FilterRules {
    std::vector<std::string> include;   ///< Glob patterns; files only
    std::vector<std::string> exclude;   ///< Glob patterns; win over include
    std::vector<std::string> exclude_dirs{".git", "__pycache__", "node_modules", ".svn"};
    bool include_hidden = false;
    std::uint64_t min_size = 0;         ///< 0 = unbounded
    std::uint64_t max_size = 0;         ///< 0 = unbounded
    TimeWindow window = TimeWindow::Any;
    std::optional<TimePoint> modified_after;   ///< Custom window bounds
    std::optional<TimePoint> modified_before;
};

struct SyncTask {
    Endpoint source;
    Endpoint target;
    SyncMode mode = SyncMode::Incremental;
    CompareMethod compare = CompareMethod::SizeTime;
    FilterRules filters;
    std::size_t max_workers = 4;

    static constexpr std::size_t kMaxWorkers = 16;

    [[nodiscard]] std::size_t worker_count() const noexcept {
        if (max_workers < 1) return 1;
        return max_workers > kMaxWorkers ? kMaxWorkers : max_workers;
    }
};

// ───────────────────────── Plan ─────────────────────────

enum class OperationKind { Copy, Update, Delete, Skip };

const char* to_string(OperationKind kind) noexcept;

struct FileOperation {
    OperationKind kind = OperationKind::Skip;
    std::string path;
    FileKind entry_kind = FileKind::File;
    std::optional<FileEntry> source;
    std::optional<FileEntry> target;
    std::string reason;
    bool warning = false;   ///< Skip that needs attention (special file, type clash)
};

struct DiffPlan {
    std::vector<FileOperation> operations;

    [[nodiscard]] std::size_t count(OperationKind kind) const;

    /// True when nothing would be copied, updated or deleted.
    [[nodiscard]] bool converged() const;

    /// Sum of source sizes over file copies and updates.
    [[nodiscard]] std::uint64_t planned_bytes() const;
};

// ───────────────────────── Results ─────────────────────────

enum class FileOutcome { Copied, Updated, Created, Deleted, Unchanged, Skipped, Failed, Cancelled };

const char* to_string(FileOutcome outcome) noexcept;

struct FileStatus {
    std::string path;
    OperationKind operation = OperationKind::Skip;
    FileKind entry_kind = FileKind::File;
    FileOutcome outcome = FileOutcome::Unchanged;
    std::uint64_t bytes = 0;   ///< Bytes written during this run
    bool resumed = false;
    std::string message;
};

enum class SyncOutcome { Success, CompletedWithErrors, ConnectionFailed, PlanningFailed, Cancelled };

const char* to_string(SyncOutcome outcome) noexcept;

struct SyncResult {
    SyncOutcome outcome = SyncOutcome::Success;
    std::size_t copied = 0;
    std::size_t updated = 0;
    std::size_t deleted = 0;
    std::size_t failed = 0;
    std::size_t unchanged = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;
    std::size_t directories_created = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::vector<FileStatus> files;
    std::optional<Error> error;
    std::string message;
    TimePoint started{};
    TimePoint finished{};
    std::string source_description;
    std::string target_description;
    SyncMode mode = SyncMode::Incremental;

    /// Recount the counters from `files` and pick the outcome.
    void tally(bool cancel_requested);

    [[nodiscard]] std::string summary() const;

    [[nodiscard]] bool succeeded() const noexcept { return outcome == SyncOutcome::Success; }
};

/// Suffix of in-flight partial files on the target
inline constexpr const char* kPartSuffix = ".tsync-part";

inline bool is_part_file(const std::string& path) {
    const std::string suffix = kPartSuffix;
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// "1.5 MB" style rendering shared by summaries and notifications.
std::string format_size(std::uint64_t bytes);

} // namespace tsync::sync
