#pragma once

#include "tsync/core/cancellation.hpp"
#include "tsync/core/result.hpp"
#include "tsync/sync/checkpoint_store.hpp"
#include "tsync/sync/diff_planner.hpp"
#include "tsync/sync/transfer_executor.hpp"
#include "tsync/sync/types.hpp"
#include "tsync/transport/client.hpp"

#include <functional>
#include <memory>
#include <string>

namespace tsync::events {
class EventBus;
}

namespace tsync::sync {

using TransportFactory =
    std::function<std::unique_ptr<transport::TransportClient>(const Endpoint&, const transport::TransportOptions&)>;

struct EngineSettings {
    transport::TransportOptions transport;
    std::size_t chunk_size = TransferOptions::kDefaultChunkSize;
    bool preserve_modified_time = true;
};

/**
 * @brief Runs one SyncTask end to end
 *
 * connect both sides -> list both trees -> plan -> transfer -> result.
 * Anything that goes wrong before the first byte moves is reported as a
 * task-level outcome (ConnectionFailed or PlanningFailed) with no file
 * touched; failures after that are per file.
 */
class SyncEngine {
public:
    explicit SyncEngine(CheckpointStore& checkpoints,
                        const events::EventBus* bus = nullptr,
                        EngineSettings settings = {},
                        TransportFactory factory = {});

    /// Connect, list and plan without changing anything.
    Result<DiffPlan> plan(const SyncTask& task);

    SyncResult run(const std::string& task_id, const SyncTask& task, const CancellationToken& cancel = {});

private:
    struct Session {
        std::unique_ptr<transport::TransportClient> source;
        std::unique_ptr<transport::TransportClient> target;
        DiffPlan plan;
    };

    /// Error kind tells the caller which outcome it maps to.
    Result<Session> prepare(const SyncTask& task);

    Result<std::unique_ptr<transport::TransportClient>> open(const Endpoint& endpoint, const char* role);

    CheckpointStore& checkpoints_;
    const events::EventBus* bus_;
    EngineSettings settings_;
    TransportFactory factory_;
};

} // namespace tsync::sync
