#include "tsync/config/job_config.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tsync::config {

using json = nlohmann::json;

namespace {

/// Thrown inside this file only; config_from_json turns it into an Error.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

template<typename T>
T required_enum(std::optional<T> parsed, const std::string& where, const std::string& value) {
    if (!parsed) {
        throw ConfigError(where + ": unknown value '" + value + "'");
    }
    return *parsed;
}

std::vector<std::string> string_list(const json& node, const char* key) {
    std::vector<std::string> items;
    if (!node.contains(key)) {
        return items;
    }
    for (const auto& item : node.at(key)) {
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::optional<TimePoint> time_value(const json& node, const char* key, TimeZone zone, const std::string& where) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    const json& value = node.at(key);
    if (value.is_number_integer()) {
        return from_unix_seconds(value.get<std::int64_t>());
    }
    const std::string text = value.get<std::string>();
    auto parsed = parse_date_time(text, zone);
    if (!parsed) {
        throw ConfigError(where + "." + key + ": cannot parse time '" + text + "'");
    }
    return parsed;
}

transport::Endpoint endpoint_from_json(const json& node, const std::string& where) {
    transport::Endpoint endpoint;
    const std::string kind = node.value("kind", node.value("type", std::string("local")));
    endpoint.kind = required_enum(transport::parse_endpoint_kind(kind), where + ".kind", kind);
    endpoint.host = node.value("host", "");
    endpoint.port = node.value("port", static_cast<std::uint16_t>(0));
    endpoint.username = node.value("username", "");
    endpoint.password = node.value("password", "");
    endpoint.private_key_path = node.value("private_key_path", "");
    endpoint.known_hosts_path = node.value("known_hosts_path", "");
    endpoint.path = node.value("path", "");
    endpoint.timeout = std::chrono::seconds(node.value("timeout_seconds", 30));
    endpoint.passive_mode = node.value("passive_mode", true);

    if (endpoint.kind != transport::EndpointKind::Local && endpoint.host.empty()) {
        throw ConfigError(where + ": host is required for " + transport::to_string(endpoint.kind));
    }
    if (endpoint.kind == transport::EndpointKind::Local && endpoint.path.empty()) {
        throw ConfigError(where + ": path is required for a local endpoint");
    }
    return endpoint;
}

sync::FilterRules filters_from_json(const json& node, TimeZone zone, const std::string& where) {
    sync::FilterRules rules;
    rules.include = string_list(node, "include");
    rules.exclude = string_list(node, "exclude");
    if (node.contains("exclude_dirs")) {
        rules.exclude_dirs = string_list(node, "exclude_dirs");
    }
    rules.include_hidden = node.value("include_hidden", false);
    rules.min_size = node.value("min_size", static_cast<std::uint64_t>(0));
    rules.max_size = node.value("max_size", static_cast<std::uint64_t>(0));
    rules.modified_after = time_value(node, "modified_after", zone, where);
    rules.modified_before = time_value(node, "modified_before", zone, where);

    const std::string window = node.value("time_window", std::string("none"));
    rules.window = required_enum(sync::parse_time_window(window), where + ".time_window", window);
    if (rules.window == sync::TimeWindow::Any && (rules.modified_after || rules.modified_before)) {
        rules.window = sync::TimeWindow::Custom;
    }
    return rules;
}

sync::SyncTask sync_task_from_json(const json& node, TimeZone zone, const std::string& where) {
    sync::SyncTask task;
    if (!node.contains("source") || !node.contains("target")) {
        throw ConfigError(where + ": source and target are required");
    }
    task.source = endpoint_from_json(node.at("source"), where + ".source");
    task.target = endpoint_from_json(node.at("target"), where + ".target");

    const std::string mode = node.value("mode", std::string("incremental"));
    task.mode = required_enum(sync::parse_sync_mode(mode), where + ".mode", mode);
    const std::string compare = node.value("compare", std::string("size_time"));
    task.compare = required_enum(sync::parse_compare_method(compare), where + ".compare", compare);
    if (node.contains("filters")) {
        task.filters = filters_from_json(node.at("filters"), zone, where + ".filters");
    }
    task.max_workers = node.value("max_workers", static_cast<std::size_t>(4));
    if (task.max_workers != task.worker_count()) {
        spdlog::warn("{}: max_workers {} clamped to {}", where, task.max_workers, task.worker_count());
        task.max_workers = task.worker_count();
    }
    return task;
}

schedule::CommandTask command_task_from_json(const json& node, const std::string& where) {
    schedule::CommandTask task;
    task.command = node.value("command", "");
    if (task.command.empty()) {
        throw ConfigError(where + ": command is required");
    }
    task.working_dir = node.value("working_dir", "");
    if (node.contains("timeout_seconds") && !node.at("timeout_seconds").is_null()) {
        const auto seconds = node.at("timeout_seconds").get<std::int64_t>();
        if (seconds > 0) {
            task.timeout = std::chrono::seconds(seconds);
        }
    }
    return task;
}

schedule::OutputExtractor extractor_from_json(const json& node, const std::string& where) {
    schedule::OutputExtractor extractor;
    extractor.name = node.value("name", "");
    const std::string kind = node.value("type", std::string("regex"));
    extractor.kind = required_enum(schedule::parse_extractor_kind(kind), where + ".type", kind);
    extractor.expression = node.value("expression", "");
    extractor.default_value = node.value("default", "");
    extractor.enabled = node.value("enabled", true);
    return extractor;
}

schedule::Job job_from_json(const json& node, const AppSettings& settings, std::size_t index) {
    schedule::Job job;
    job.id = node.value("id", "");
    if (job.id.empty()) {
        throw ConfigError("jobs[" + std::to_string(index) + "]: id is required");
    }
    const std::string where = "job " + job.id;
    job.name = node.value("name", job.id);
    job.description = node.value("description", "");
    job.trigger = node.value("trigger", "");
    job.enabled = node.value("enabled", true);

    const std::string concurrency = node.value("concurrency", std::string("skip"));
    job.concurrency = required_enum(schedule::parse_concurrency_policy(concurrency), where + ".concurrency", concurrency);

    job.timezone = settings.timezone;
    if (node.contains("timezone")) {
        const std::string zone = node.at("timezone").get<std::string>();
        job.timezone = required_enum(parse_time_zone(zone), where + ".timezone", zone);
    }

    if (node.contains("retry")) {
        const json& retry = node.at("retry");
        job.retry.count = retry.value("count", static_cast<std::size_t>(0));
        job.retry.backoff = std::chrono::milliseconds(retry.value("backoff_ms", 1000));
        job.retry.max_backoff = std::chrono::milliseconds(retry.value("max_backoff_ms", 60000));
    }

    if (node.contains("output_extractors")) {
        std::size_t i = 0;
        for (const auto& item : node.at("output_extractors")) {
            job.extractors.push_back(extractor_from_json(item, where + ".output_extractors[" + std::to_string(i++) + "]"));
        }
    }

    const std::string type = node.value("type", std::string("command"));
    const auto task_type = required_enum(schedule::parse_task_type(type), where + ".type", type);
    const json payload = node.value("payload", json::object());
    if (task_type == schedule::TaskType::Sync) {
        job.payload = sync_task_from_json(payload, job.timezone, where + ".payload");
    } else {
        job.payload = command_task_from_json(payload, where + ".payload");
    }
    return job;
}

AppSettings settings_from_json(const json& node) {
    AppSettings settings;
    settings.logging.level = node.value("log_level", settings.logging.level);
    settings.logging.file = node.value("log_file", settings.logging.file);
    settings.logging.pattern = node.value("log_pattern", settings.logging.pattern);
    settings.checkpoint_dir = node.value("checkpoint_dir", settings.checkpoint_dir);
    settings.notification_log = node.value("notification_log", settings.notification_log);
    settings.poll_interval = std::chrono::milliseconds(node.value("poll_interval_ms", 1000));
    settings.worker_threads = node.value("worker_threads", settings.worker_threads);
    settings.misfire_grace = std::chrono::seconds(node.value("misfire_grace_seconds", 60));
    settings.chunk_size = node.value("chunk_size", settings.chunk_size);
    settings.transport_retry_attempts = node.value("transport_retry_attempts", settings.transport_retry_attempts);
    settings.operation_timeout = std::chrono::seconds(node.value("operation_timeout_seconds", 300));

    const std::string zone = node.value("timezone", std::string("local"));
    settings.timezone = required_enum(parse_time_zone(zone), "settings.timezone", zone);

    if (settings.worker_threads == 0 || settings.chunk_size == 0) {
        throw ConfigError("settings: worker_threads and chunk_size must be positive");
    }
    return settings;
}

} // namespace

schedule::SchedulerSettings AppSettings::scheduler_settings() const {
    schedule::SchedulerSettings result;
    result.worker_threads = worker_threads;
    result.misfire_grace = misfire_grace;
    result.poll_interval = poll_interval;
    return result;
}

sync::EngineSettings AppSettings::engine_settings() const {
    sync::EngineSettings result;
    result.transport.retry = RetryPolicy::fixed(transport_retry_attempts, std::chrono::milliseconds(500));
    result.transport.operation_timeout = operation_timeout;
    result.chunk_size = chunk_size;
    return result;
}

const schedule::Job* Config::find_job(const std::string& id) const {
    for (const auto& job : jobs) {
        if (job.id == id) {
            return &job;
        }
    }
    return nullptr;
}

std::optional<TimePoint> parse_date_time(const std::string& text, TimeZone zone) {
    for (const char* format : {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"}) {
        std::tm fields{};
        std::istringstream in(text);
        in >> std::get_time(&fields, format);
        if (!in.fail() && in.peek() == std::char_traits<char>::eof()) {
            return from_calendar(fields, zone);
        }
    }
    return std::nullopt;
}

Result<Config> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<Config>(ErrorKind::InvalidArgument, "configuration must be a JSON object");
    }
    try {
        Config config;
        config.settings = settings_from_json(document.value("settings", json::object()));

        const json jobs = document.value("jobs", json::array());
        if (!jobs.is_array()) {
            return Err<Config>(ErrorKind::InvalidArgument, "jobs must be an array");
        }
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            config.jobs.push_back(job_from_json(jobs.at(i), config.settings, i));
        }
        return Ok(std::move(config));
    } catch (const ConfigError& e) {
        return Err<Config>(ErrorKind::InvalidArgument, e.what());
    } catch (const json::exception& e) {
        return Err<Config>(ErrorKind::InvalidArgument, std::string("malformed configuration: ") + e.what());
    }
}

Result<Config> parse_config(const std::string& text) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<Config>(ErrorKind::InvalidArgument, "configuration is not valid JSON");
    }
    return config_from_json(document);
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<Config>(ErrorKind::Io, "cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto config = parse_config(buffer.str());
    if (config.is_error()) {
        return Err<Config>(config.error().kind, path.string() + ": " + config.error().message);
    }
    return config;
}

} // namespace tsync::config
