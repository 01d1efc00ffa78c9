#include "tsync/sync/types.hpp"

#include <array>
#include <cstdio>

namespace tsync::sync {

const char* to_string(SyncMode mode) noexcept {
    switch (mode) {
        case SyncMode::Mirror: return "mirror";
        case SyncMode::Incremental: return "incremental";
        case SyncMode::AddOnly: return "add_only";
    }
    return "unknown";
}

const char* to_string(CompareMethod method) noexcept {
    switch (method) {
        case CompareMethod::SizeTime: return "size_time";
        case CompareMethod::Size: return "size";
        case CompareMethod::Time: return "time";
        case CompareMethod::Checksum: return "checksum";
    }
    return "unknown";
}

std::optional<SyncMode> parse_sync_mode(const std::string& name) {
    if (name == "mirror") return SyncMode::Mirror;
    if (name == "incremental") return SyncMode::Incremental;
    if (name == "add_only") return SyncMode::AddOnly;
    return std::nullopt;
}

std::optional<CompareMethod> parse_compare_method(const std::string& name) {
    if (name == "size_time") return CompareMethod::SizeTime;
    if (name == "size") return CompareMethod::Size;
    if (name == "time") return CompareMethod::Time;
    if (name == "checksum" || name == "hash") return CompareMethod::Checksum;
    return std::nullopt;
}

std::optional<TimeWindow> parse_time_window(const std::string& name) {
    if (name == "none" || name == "any") return TimeWindow::Any;
    if (name == "today") return TimeWindow::Today;
    if (name == "yesterday") return TimeWindow::Yesterday;
    if (name == "days_3") return TimeWindow::LastDays3;
    if (name == "days_7") return TimeWindow::LastDays7;
    if (name == "days_30") return TimeWindow::LastDays30;
    if (name == "custom") return TimeWindow::Custom;
    return std::nullopt;
}

const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Copy: return "copy";
        case OperationKind::Update: return "update";
        case OperationKind::Delete: return "delete";
        case OperationKind::Skip: return "skip";
    }
    return "unknown";
}

const char* to_string(FileOutcome outcome) noexcept {
    switch (outcome) {
        case FileOutcome::Copied: return "copied";
        case FileOutcome::Updated: return "updated";
        case FileOutcome::Created: return "created";
        case FileOutcome::Deleted: return "deleted";
        case FileOutcome::Unchanged: return "unchanged";
        case FileOutcome::Skipped: return "skipped";
        case FileOutcome::Failed: return "failed";
        case FileOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(SyncOutcome outcome) noexcept {
    switch (outcome) {
        case SyncOutcome::Success: return "success";
        case SyncOutcome::CompletedWithErrors: return "completed_with_errors";
        case SyncOutcome::ConnectionFailed: return "connection_failed";
        case SyncOutcome::PlanningFailed: return "planning_failed";
        case SyncOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::size_t DiffPlan::count(OperationKind kind) const {
    std::size_t total = 0;
    for (const auto& op : operations) {
        if (op.kind == kind) {
            ++total;
        }
    }
    return total;
}

bool DiffPlan::converged() const {
    for (const auto& op : operations) {
        if (op.kind != OperationKind::Skip) {
            return false;
        }
    }
    return true;
}

std::uint64_t DiffPlan::planned_bytes() const {
    std::uint64_t total = 0;
    for (const auto& op : operations) {
        if ((op.kind == OperationKind::Copy || op.kind == OperationKind::Update) &&
            op.entry_kind == FileKind::File && op.source) {
            total += op.source->size;
        }
    }
    return total;
}

void SyncResult::tally(bool cancel_requested) {
    copied = updated = deleted = failed = unchanged = skipped = cancelled = directories_created = 0;
    bytes_transferred = 0;
    for (const auto& file : files) {
        bytes_transferred += file.bytes;
        switch (file.outcome) {
            case FileOutcome::Copied: ++copied; break;
            case FileOutcome::Updated: ++updated; break;
            case FileOutcome::Created: ++directories_created; break;
            case FileOutcome::Deleted: ++deleted; break;
            case FileOutcome::Unchanged: ++unchanged; break;
            case FileOutcome::Skipped: ++skipped; break;
            case FileOutcome::Failed: ++failed; break;
            case FileOutcome::Cancelled: ++cancelled; break;
        }
    }

    if (cancel_requested && cancelled > 0) {
        outcome = SyncOutcome::Cancelled;
    } else if (failed > 0) {
        outcome = SyncOutcome::CompletedWithErrors;
    } else {
        outcome = SyncOutcome::Success;
    }
    message = summary();
}

std::string SyncResult::summary() const {
    switch (outcome) {
        case SyncOutcome::ConnectionFailed:
        case SyncOutcome::PlanningFailed:
            return std::string(to_string(outcome)) + (error ? ": " + error->message : std::string());
        default:
            break;
    }

    std::string text = "copied " + std::to_string(copied) + ", updated " + std::to_string(updated) +
                       ", deleted " + std::to_string(deleted) + ", failed " + std::to_string(failed) +
                       ", unchanged " + std::to_string(unchanged);
    if (skipped > 0) {
        text += ", skipped " + std::to_string(skipped);
    }
    if (cancelled > 0) {
        text += ", cancelled " + std::to_string(cancelled);
    }
    text += " (" + format_size(bytes_transferred) + ")";
    return text;
}

std::string format_size(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    }
    return buffer;
}

} // namespace tsync::sync
