#include "tsync/events/notification.hpp"

#include "tsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace tsync::events {

namespace {

constexpr const char* kTimeFormat = "%Y-%m-%d %H:%M:%S";
constexpr std::size_t kFileListCap = 50;
constexpr std::size_t kFileListShortCap = 10;
constexpr std::size_t kFileListDefaultCap = 20;
constexpr std::size_t kFileListFullCap = 100;

std::string hostname() {
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
        return "unknown";
    }
    return buffer.data();
}

std::string username() {
    if (const passwd* entry = ::getpwuid(::geteuid()); entry != nullptr && entry->pw_name != nullptr) {
        return entry->pw_name;
    }
    return "unknown";
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string first_line(const std::string& text) {
    return trim(text.substr(0, text.find('\n')));
}

std::string last_line(const std::string& text) {
    const std::string trimmed = trim(text);
    const auto pos = trimmed.rfind('\n');
    return trim(pos == std::string::npos ? trimmed : trimmed.substr(pos + 1));
}

std::size_t line_count(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

std::string server_of(const transport::Endpoint& endpoint) {
    if (endpoint.kind == transport::EndpointKind::Local) {
        return "local";
    }
    std::string server = endpoint.host + ":" + std::to_string(endpoint.effective_port());
    return endpoint.username.empty() ? server : endpoint.username + "@" + server;
}

const char* action_of(const sync::FileStatus& status) {
    switch (status.outcome) {
        case sync::FileOutcome::Copied: return "copy";
        case sync::FileOutcome::Updated: return "update";
        case sync::FileOutcome::Created: return "mkdir";
        case sync::FileOutcome::Deleted: return "delete";
        case sync::FileOutcome::Unchanged: return "unchanged";
        case sync::FileOutcome::Skipped: return "skip";
        case sync::FileOutcome::Cancelled: return "cancelled";
        case sync::FileOutcome::Failed: return sync::to_string(status.operation);
    }
    return "unknown";
}

std::string more_line(std::size_t total, std::size_t cap) {
    return "... " + std::to_string(total - cap) + " more";
}

/// "• a\n• b", "(none)" when empty
std::string bullet_list(const std::vector<std::string>& paths, std::size_t cap) {
    if (paths.empty()) {
        return "(none)";
    }
    std::ostringstream out;
    const std::size_t shown = std::min(paths.size(), cap);
    for (std::size_t i = 0; i < shown; ++i) {
        out << (i ? "\n" : "") << "• " << paths[i];
    }
    if (paths.size() > cap) {
        out << "\n" << more_line(paths.size(), cap);
    }
    return out.str();
}

/// "✓ [copy] a" lines; markdown consumers get blank-line separators
std::string action_list(const std::vector<sync::FileStatus>& files, std::size_t cap, const char* separator) {
    if (files.empty()) {
        return "(none)";
    }
    std::ostringstream out;
    const std::size_t shown = std::min(files.size(), cap);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& file = files[i];
        out << (i ? separator : "") << (file.outcome == sync::FileOutcome::Failed ? "✗" : "✓")
            << " [" << action_of(file) << "] " << file.path;
    }
    if (files.size() > cap) {
        out << separator << more_line(files.size(), cap);
    }
    return out.str();
}

void add_sync_fields(nlohmann::json& payload, const sync::SyncTask& task, const sync::SyncResult& sync) {
    std::vector<std::string> copied, updated, deleted, failed, unchanged;
    for (const auto& file : sync.files) {
        switch (file.outcome) {
            case sync::FileOutcome::Copied: copied.push_back(file.path); break;
            case sync::FileOutcome::Updated: updated.push_back(file.path); break;
            case sync::FileOutcome::Deleted: deleted.push_back(file.path); break;
            case sync::FileOutcome::Failed: failed.push_back(file.path); break;
            case sync::FileOutcome::Unchanged:
            case sync::FileOutcome::Skipped: unchanged.push_back(file.path); break;
            default: break;
        }
    }

    const std::size_t total_processed = sync.copied + sync.updated + sync.deleted;
    std::string sync_message;
    if (sync.outcome == sync::SyncOutcome::ConnectionFailed || sync.outcome == sync::SyncOutcome::PlanningFailed) {
        sync_message = sync.message;
    } else if (total_processed == 0 && sync.failed == 0) {
        sync_message = "all files up to date";
    } else if (sync.failed > 0) {
        sync_message = "finished with " + std::to_string(sync.failed) + " failed file(s)";
    } else {
        sync_message = "copied " + std::to_string(sync.copied) + ", updated " + std::to_string(sync.updated) +
                       ", deleted " + std::to_string(sync.deleted);
    }

    payload["source_path"] = task.source.path;
    payload["target_path"] = task.target.path;
    payload["source_server"] = server_of(task.source);
    payload["target_server"] = server_of(task.target);
    payload["source"] = sync.source_description;
    payload["target"] = sync.target_description;
    payload["sync_mode"] = sync::to_string(task.mode);
    payload["sync_outcome"] = sync::to_string(sync.outcome);
    payload["copied_files"] = sync.copied;
    payload["updated_files"] = sync.updated;
    payload["deleted_files"] = sync.deleted;
    payload["skipped_files"] = sync.skipped;
    payload["failed_files"] = sync.failed;
    payload["unchanged_files"] = sync.unchanged;
    payload["total_files"] = sync.files.size();
    payload["transferred_bytes"] = sync.bytes_transferred;
    payload["transferred_size"] = sync::format_size(sync.bytes_transferred);
    payload["total_processed"] = total_processed;
    payload["sync_message"] = sync_message;
    payload["file_list"] = action_list(sync.files, kFileListDefaultCap, "\n\n");
    payload["file_list_short"] = action_list(sync.files, kFileListShortCap, "\n\n");
    payload["file_list_full"] = action_list(sync.files, kFileListFullCap, "\n");
    payload["copied_file_list"] = bullet_list(copied, kFileListCap);
    payload["updated_file_list"] = bullet_list(updated, kFileListCap);
    payload["deleted_file_list"] = bullet_list(deleted, kFileListCap);
    payload["failed_file_list"] = bullet_list(failed, kFileListCap);
    payload["unchanged_file_list"] = bullet_list(unchanged, kFileListCap);
    payload["summary"] = "copied:" + std::to_string(sync.copied) + " updated:" + std::to_string(sync.updated) +
                         " deleted:" + std::to_string(sync.deleted) + " failed:" + std::to_string(sync.failed);
}

} // namespace

std::string format_duration(std::chrono::milliseconds duration) {
    const double seconds = static_cast<double>(duration.count()) / 1000.0;
    char buffer[64];
    if (seconds < 60.0) {
        std::snprintf(buffer, sizeof(buffer), "%.1fs", seconds);
    } else if (seconds < 3600.0) {
        const auto whole = static_cast<long long>(seconds);
        std::snprintf(buffer, sizeof(buffer), "%lldm %llds", whole / 60, whole % 60);
    } else {
        const auto whole = static_cast<long long>(seconds);
        std::snprintf(buffer, sizeof(buffer), "%lldh %lldm", whole / 3600, (whole % 3600) / 60);
    }
    return buffer;
}

std::string utf8_prefix(const std::string& text, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        // Continuation bytes (10xxxxxx) belong to the code point before them
        if ((byte & 0xC0) != 0x80 && chars++ == max_chars) {
            return text.substr(0, i);
        }
    }
    return text;
}

std::string dump_payload(const nlohmann::json& payload, int indent) {
    return payload.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json build_notification_payload(const schedule::Job& job, const schedule::ExecutionResult& result) {
    const auto duration = result.duration();
    const double seconds = static_cast<double>(duration.count()) / 1000.0;

    nlohmann::json payload = {
        {"task_id", job.id},
        {"task_name", job.name.empty() ? job.id : job.name},
        {"task_type", schedule::to_string(job.type())},
        {"status", schedule::to_string(result.status)},
        {"success", result.succeeded()},
        {"exit_code", result.exit_code},
        {"attempts", result.attempts},
        {"output", utf8_prefix(result.output, kOutputPreviewChars)},
        {"output_full", result.output},
        {"output_first_line", first_line(result.output)},
        {"output_last_line", last_line(result.output)},
        {"output_line_count", line_count(result.output)},
        {"error", utf8_prefix(result.error_output, kErrorPreviewChars)},
        {"error_full", result.error_output},
        {"error_detail", result.error},
        {"start_time", to_iso8601(result.started, TimeZone::Local)},
        {"end_time", to_iso8601(result.finished, TimeZone::Local)},
        {"start_time_fmt", format_time(result.started, kTimeFormat)},
        {"end_time_fmt", format_time(result.finished, kTimeFormat)},
        {"date", format_time(result.started, "%Y-%m-%d")},
        {"time", format_time(result.started, "%H:%M:%S")},
        {"duration", static_cast<double>(static_cast<long long>(seconds * 100.0 + 0.5)) / 100.0},
        {"duration_ms", duration.count()},
        {"duration_str", format_duration(duration)},
        {"hostname", hostname()},
        {"username", username()},
    };

    if (const auto* task = std::get_if<sync::SyncTask>(&job.payload); task != nullptr && result.sync) {
        add_sync_fields(payload, *task, *result.sync);
    }

    for (const auto& [key, value] : result.custom_vars) {
        payload["var_" + key] = value;
    }
    return payload;
}

NotificationRelay::NotificationRelay(EventBus& bus) : bus_(bus) {
    thread_ = std::thread([this] { worker(); });
    subscription_ = bus_.subscribe<JobFinishedEvent>([this](const JobFinishedEvent& e) {
        if (!queue_.push(build_notification_payload(e.job, e.result))) {
            spdlog::warn("Notification for job {} dropped, relay is shutting down", e.job.id);
        }
    });
}

NotificationRelay::~NotificationRelay() {
    bus_.unsubscribe<JobFinishedEvent>(subscription_);
    queue_.shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void NotificationRelay::add_sink(std::string name, Sink sink) {
    std::lock_guard lock(sinks_mutex_);
    sinks_.emplace_back(std::move(name), std::move(sink));
}

void NotificationRelay::worker() {
    while (auto payload = queue_.pop()) {
        std::vector<std::pair<std::string, Sink>> sinks;
        {
            std::lock_guard lock(sinks_mutex_);
            sinks = sinks_;
        }
        for (const auto& [name, sink] : sinks) {
            try {
                sink(*payload);
                delivered_++;
            } catch (const std::exception& e) {
                failed_++;
                spdlog::warn("Notification sink {} failed for {}: {}", name,
                             payload->value("task_id", std::string()), e.what());
            }
        }
    }
}

NotificationRelay::Sink make_json_lines_sink(std::string path) {
    auto mutex = std::make_shared<std::mutex>();
    return [path = std::move(path), mutex](const nlohmann::json& payload) {
        std::lock_guard lock(*mutex);
        std::ofstream out(path, std::ios::app);
        if (!out) {
            throw std::runtime_error("cannot open " + path);
        }
        out << dump_payload(payload) << '\n';
        if (!out) {
            throw std::runtime_error("cannot write " + path);
        }
    };
}

} // namespace tsync::events
