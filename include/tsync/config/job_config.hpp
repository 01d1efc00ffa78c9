#pragma once

#include "tsync/core/logging.hpp"
#include "tsync/core/result.hpp"
#include "tsync/core/time.hpp"
#include "tsync/schedule/job.hpp"
#include "tsync/schedule/scheduler.hpp"
#include "tsync/sync/engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace tsync::config {

struct AppSettings {
    LoggingSettings logging;
    std::string checkpoint_dir = "checkpoints";
    std::string notification_log;   ///< JSON-lines file for run payloads; empty = off
    std::chrono::milliseconds poll_interval{1000};
    std::size_t worker_threads = 10;
    std::chrono::seconds misfire_grace{60};
    TimeZone timezone = TimeZone::Local;
    std::size_t chunk_size = sync::TransferOptions::kDefaultChunkSize;
    std::size_t transport_retry_attempts = 3;
    std::chrono::seconds operation_timeout{300};

    [[nodiscard]] schedule::SchedulerSettings scheduler_settings() const;
    [[nodiscard]] sync::EngineSettings engine_settings() const;
};

struct Config {
    AppSettings settings;
    std::vector<schedule::Job> jobs;

    /// nullptr when no job has `id`.
    [[nodiscard]] const schedule::Job* find_job(const std::string& id) const;
};

/**
 * @brief Build typed settings and jobs from a parsed document
 *
 * Missing keys take their defaults. Wrong types, unknown enum names and
 * jobs without an id come back as InvalidArgument naming the job and key.
 */
Result<Config> config_from_json(const nlohmann::json& document);

Result<Config> parse_config(const std::string& text);

/// Io when the file cannot be read.
Result<Config> load_config(const std::filesystem::path& path);

/// "2024-05-01", "2024-05-01 12:30:00", "2024-05-01T12:30:00" in `zone`.
std::optional<TimePoint> parse_date_time(const std::string& text, TimeZone zone = TimeZone::Local);

} // namespace tsync::config
