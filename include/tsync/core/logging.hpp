#pragma once

#include <string>

namespace tsync {

struct LoggingSettings {
    std::string level = "info";
    std::string file;   ///< Optional; empty means console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Install the process-wide spdlog logger described by `settings`
 *
 * Console output is always enabled. When a file is named, records are
 * appended to it as well. Calling again replaces the previous logger.
 */
void configure_logging(const LoggingSettings& settings);

} // namespace tsync
