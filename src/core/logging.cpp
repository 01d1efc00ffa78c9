#include "tsync/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace tsync {

void configure_logging(const LoggingSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file '{}': {}", settings.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("tsync", sinks.begin(), sinks.end());
    logger->set_pattern(settings.pattern);

    const auto level = spdlog::level::from_str(settings.level);
    // from_str maps unknown names to "off"; only honour that when asked for explicitly
    if (level == spdlog::level::off && settings.level != "off") {
        logger->set_level(spdlog::level::info);
    } else {
        logger->set_level(level);
    }
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

} // namespace tsync
