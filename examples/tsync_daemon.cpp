/**
 * @file tsync_daemon.cpp
 * @brief Long-running scheduler process
 *
 * USAGE:
 *   tsync_daemon --config jobs.json
 *
 * Loads the configuration, registers every job and runs until SIGINT or
 * SIGTERM. Active runs are cancelled on shutdown; interrupted transfers
 * keep their checkpoints and resume on the next run.
 */

#include "tsync/config/job_config.hpp"
#include "tsync/core/logging.hpp"
#include "tsync/events/components.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/events/notification.hpp"
#include "tsync/schedule/scheduler.hpp"
#include "tsync/schedule/task_runner.hpp"
#include "tsync/sync/checkpoint_store.hpp"
#include "tsync/sync/engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int) {
    g_stop_requested = 1;
}

void print_usage(const char* program) {
    spdlog::info("Usage: {} --config <file>", program);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }
    if (config_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = tsync::config::load_config(config_path);
    if (loaded.is_error()) {
        spdlog::error("Cannot load configuration: {}", loaded.error().describe());
        return 1;
    }
    const tsync::config::Config& config = loaded.value();
    tsync::configure_logging(config.settings.logging);

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("tsync daemon");
    spdlog::info("════════════════════════════════════════════");

    tsync::events::EventBus bus;
    tsync::events::LoggerComponent logger(bus);
    tsync::events::RunStatsComponent stats(bus);
    tsync::events::NotificationRelay relay(bus);
    if (!config.settings.notification_log.empty()) {
        relay.add_sink("json-lines", tsync::events::make_json_lines_sink(config.settings.notification_log));
    }

    tsync::sync::CheckpointStore checkpoints(config.settings.checkpoint_dir);
    tsync::sync::SyncEngine engine(checkpoints, &bus, config.settings.engine_settings());
    tsync::schedule::JobRunner runner(engine);
    tsync::schedule::Scheduler scheduler(runner, &bus, config.settings.scheduler_settings());

    for (const auto& error : scheduler.reload(config.jobs)) {
        spdlog::error("Job not scheduled: {}", error.describe());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    scheduler.start();
    spdlog::info("Press Ctrl+C to stop");

    while (g_stop_requested == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutdown requested");
    scheduler.stop();
    stats.print_stats();
    return 0;
}
