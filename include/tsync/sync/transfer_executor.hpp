#pragma once

#include "tsync/core/cancellation.hpp"
#include "tsync/sync/checkpoint_store.hpp"
#include "tsync/sync/types.hpp"
#include "tsync/transport/client.hpp"

#include <cstddef>
#include <string>

namespace tsync::events {
class EventBus;
}

namespace tsync::sync {

struct TransferOptions {
    static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

    std::string task_id;
    std::size_t max_workers = 4;
    std::size_t chunk_size = kDefaultChunkSize;
    bool preserve_modified_time = true;
};

/**
 * @brief Applies a DiffPlan from one transport to another
 *
 * Three phases: directory creation in plan order, file copies and updates
 * on a bounded pool, then deletes in plan order. File data is streamed in
 * chunks to "<path>.tsync-part" with a checkpoint after every chunk and
 * renamed into place when complete, so the live target file is never seen
 * half-written. A failing file is recorded and the rest continue.
 *
 * Cancellation stops new files from starting; a file in progress stops
 * between chunks, keeping its partial file and checkpoint for the next run.
 */
class TransferExecutor {
public:
    TransferExecutor(transport::TransportClient& source,
                     transport::TransportClient& target,
                     CheckpointStore& checkpoints,
                     const events::EventBus* bus = nullptr);

    SyncResult apply(const DiffPlan& plan, const TransferOptions& options, const CancellationToken& cancel = {});

    static std::string part_path(const std::string& path) { return path + kPartSuffix; }

private:
    FileStatus create_directory(const FileOperation& op);
    FileStatus transfer_file(const FileOperation& op, const TransferOptions& options, const CancellationToken& cancel);
    FileStatus delete_entry(const FileOperation& op);
    void report(const std::string& task_id, const FileStatus& status) const;

    transport::TransportClient& source_;
    transport::TransportClient& target_;
    CheckpointStore& checkpoints_;
    const events::EventBus* bus_;
};

} // namespace tsync::sync
