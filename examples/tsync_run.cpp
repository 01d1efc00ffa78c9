/**
 * @file tsync_run.cpp
 * @brief Run one configured job once, outside the schedule
 *
 * USAGE:
 *   tsync_run --config jobs.json --job nightly-backup [--dry-run]
 *
 * Prints the notification payload of the run as JSON on stdout. With
 * --dry-run a sync job only prints its plan. Exit status: 0 success,
 * 1 failed, 3 completed with errors, 2 usage or configuration problems.
 */

#include "tsync/config/job_config.hpp"
#include "tsync/core/logging.hpp"
#include "tsync/events/components.hpp"
#include "tsync/events/event_bus.hpp"
#include "tsync/events/notification.hpp"
#include "tsync/schedule/run_coordinator.hpp"
#include "tsync/schedule/task_runner.hpp"
#include "tsync/sync/checkpoint_store.hpp"
#include "tsync/sync/engine.hpp"

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} --config <file> --job <id> [--dry-run]", program);
}

int print_plan(tsync::sync::SyncEngine& engine, const tsync::sync::SyncTask& task) {
    auto plan = engine.plan(task);
    if (plan.is_error()) {
        spdlog::error("Planning failed: {}", plan.error().describe());
        return 1;
    }
    json operations = json::array();
    for (const auto& op : plan.value().operations) {
        operations.push_back({
            {"operation", tsync::sync::to_string(op.kind)},
            {"path", op.path},
            {"kind", tsync::transport::to_string(op.entry_kind)},
            {"reason", op.reason},
            {"warning", op.warning},
        });
    }
    const json document{{"operations", operations}, {"planned_bytes", plan.value().planned_bytes()}};
    std::cout << tsync::events::dump_payload(document, 2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string job_id;
    bool dry_run = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--job") == 0 && i + 1 < argc) {
            job_id = argv[++i];
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        }
    }
    if (config_path.empty() || job_id.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = tsync::config::load_config(config_path);
    if (loaded.is_error()) {
        spdlog::error("Cannot load configuration: {}", loaded.error().describe());
        return 2;
    }
    const tsync::config::Config& config = loaded.value();
    tsync::configure_logging(config.settings.logging);

    const tsync::schedule::Job* job = config.find_job(job_id);
    if (job == nullptr) {
        spdlog::error("No job '{}' in {}", job_id, config_path);
        return 2;
    }

    tsync::events::EventBus bus;
    tsync::events::LoggerComponent logger(bus);
    tsync::sync::CheckpointStore checkpoints(config.settings.checkpoint_dir);
    tsync::sync::SyncEngine engine(checkpoints, &bus, config.settings.engine_settings());

    if (dry_run) {
        if (job->type() != tsync::schedule::TaskType::Sync) {
            spdlog::error("--dry-run only applies to sync jobs");
            return 2;
        }
        return print_plan(engine, std::get<tsync::sync::SyncTask>(job->payload));
    }

    tsync::schedule::JobRunner runner(engine);
    boost::asio::thread_pool pool(1);
    auto coordinator = std::make_shared<tsync::schedule::RunCoordinator>(*job, runner, pool, &bus);
    coordinator->fire();
    coordinator->wait_idle();
    pool.join();

    const auto result = coordinator->last_result();
    if (!result) {
        spdlog::error("Job {} produced no result", job_id);
        return 1;
    }
    std::cout << tsync::events::dump_payload(tsync::events::build_notification_payload(*job, *result), 2)
              << std::endl;

    switch (result->status) {
        case tsync::schedule::RunStatus::Success: return 0;
        case tsync::schedule::RunStatus::CompletedWithErrors: return 3;
        case tsync::schedule::RunStatus::Failed: return 1;
    }
    return 1;
}
