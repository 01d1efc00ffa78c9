#include "tsync/sync/transfer_executor.hpp"

#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace tsync::sync {

namespace {

FileStatus status_for(const FileOperation& op, FileOutcome outcome, std::string message = {}) {
    FileStatus status;
    status.path = op.path;
    status.operation = op.kind;
    status.entry_kind = op.entry_kind;
    status.outcome = outcome;
    status.message = std::move(message);
    return status;
}

} // namespace

TransferExecutor::TransferExecutor(transport::TransportClient& source,
                                   transport::TransportClient& target,
                                   CheckpointStore& checkpoints,
                                   const events::EventBus* bus)
    : source_(source), target_(target), checkpoints_(checkpoints), bus_(bus) {}

void TransferExecutor::report(const std::string& task_id, const FileStatus& status) const {
    events::publish(bus_, events::FileSyncedEvent{task_id, status});
}

SyncResult TransferExecutor::apply(const DiffPlan& plan, const TransferOptions& options, const CancellationToken& cancel) {
    SyncResult result;
    result.started = Clock::now();
    result.total_bytes = plan.planned_bytes();

    std::vector<const FileOperation*> directories;
    std::vector<const FileOperation*> files;
    std::vector<const FileOperation*> deletes;
    for (const auto& op : plan.operations) {
        switch (op.kind) {
            case OperationKind::Copy:
            case OperationKind::Update:
                (op.entry_kind == FileKind::Directory ? directories : files).push_back(&op);
                break;
            case OperationKind::Delete:
                deletes.push_back(&op);
                break;
            case OperationKind::Skip:
                result.files.push_back(status_for(op, op.warning ? FileOutcome::Skipped : FileOutcome::Unchanged, op.reason));
                break;
        }
    }

    for (const auto* op : directories) {
        FileStatus status = cancel.is_cancelled() ? status_for(*op, FileOutcome::Cancelled, "cancelled before start")
                                                  : create_directory(*op);
        report(options.task_id, status);
        result.files.push_back(std::move(status));
    }

    // Each slot is written by exactly one worker
    std::vector<FileStatus> file_statuses(files.size());
    {
        const std::size_t workers = std::max<std::size_t>(1, std::min(options.max_workers, std::max<std::size_t>(1, files.size())));
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < files.size(); ++i) {
            boost::asio::post(pool, [this, &files, &file_statuses, &options, &cancel, i] {
                const FileOperation& op = *files[i];
                if (cancel.is_cancelled()) {
                    file_statuses[i] = status_for(op, FileOutcome::Cancelled, "cancelled before start");
                } else {
                    try {
                        file_statuses[i] = transfer_file(op, options, cancel);
                    } catch (const std::exception& e) {
                        file_statuses[i] = status_for(op, FileOutcome::Failed, e.what());
                    }
                }
                report(options.task_id, file_statuses[i]);
            });
        }
        pool.join();
    }
    std::move(file_statuses.begin(), file_statuses.end(), std::back_inserter(result.files));

    for (const auto* op : deletes) {
        FileStatus status = cancel.is_cancelled() ? status_for(*op, FileOutcome::Cancelled, "cancelled before start")
                                                  : delete_entry(*op);
        report(options.task_id, status);
        result.files.push_back(std::move(status));
    }

    result.finished = Clock::now();
    result.tally(cancel.is_cancelled());
    return result;
}

FileStatus TransferExecutor::create_directory(const FileOperation& op) {
    if (auto created = target_.mkdir(op.path); created.is_error()) {
        spdlog::error("Cannot create directory {}: {}", op.path, created.error().describe());
        return status_for(op, FileOutcome::Failed, created.error().describe());
    }
    return status_for(op, FileOutcome::Created);
}

FileStatus TransferExecutor::delete_entry(const FileOperation& op) {
    if (auto removed = target_.remove(op.path, op.entry_kind); removed.is_error()) {
        if (removed.error().kind == ErrorKind::NotFound) {
            // Already gone, nothing left to do
            return status_for(op, FileOutcome::Deleted);
        }
        spdlog::error("Cannot delete {}: {}", op.path, removed.error().describe());
        return status_for(op, FileOutcome::Failed, removed.error().describe());
    }
    return status_for(op, FileOutcome::Deleted);
}

FileStatus TransferExecutor::transfer_file(const FileOperation& op,
                                           const TransferOptions& options,
                                           const CancellationToken& cancel) {
    const FileEntry& source = *op.source;
    const std::string part = part_path(op.path);
    const FileOutcome done = op.kind == OperationKind::Update ? FileOutcome::Updated : FileOutcome::Copied;

    std::optional<std::uint64_t> partial_size;
    if (auto existing = target_.stat(part); existing.is_ok() && existing.value().is_file()) {
        partial_size = existing.value().size;
    }
    const ResumePoint resume = resolve_resume(checkpoints_, options.task_id, source, partial_size);

    FileStatus status = status_for(op, done);
    status.resumed = resume.resumed;
    if (resume.resumed) {
        spdlog::info("Resuming {} at byte {}", op.path, resume.offset);
    }

    std::uint64_t offset = resume.offset;
    const std::size_t chunk_size = std::max<std::size_t>(1, options.chunk_size);

    if (offset == 0 && source.size == 0) {
        if (auto written = target_.write_range(part, 0, {}); written.is_error()) {
            return status_for(op, FileOutcome::Failed, written.error().describe());
        }
    }

    while (offset < source.size) {
        if (cancel.is_cancelled()) {
            status.outcome = FileOutcome::Cancelled;
            status.message = "cancelled at byte " + std::to_string(offset);
            return status;
        }

        const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, source.size - offset));
        auto chunk = source_.read_range(op.path, offset, length);
        if (chunk.is_error()) {
            spdlog::error("Read of {} failed at byte {}: {}", op.path, offset, chunk.error().describe());
            status.outcome = FileOutcome::Failed;
            status.message = chunk.error().describe();
            return status;
        }
        if (chunk.value().size() != length) {
            // Source shrank underneath us; the next run starts over
            if (auto cleared = checkpoints_.clear(options.task_id, op.path); cleared.is_error()) {
                spdlog::warn("Could not clear checkpoint for {}: {}", op.path, cleared.error().describe());
            }
            status.outcome = FileOutcome::Failed;
            status.message = "source changed during transfer";
            return status;
        }

        if (auto written = target_.write_range(part, offset, chunk.value()); written.is_error()) {
            spdlog::error("Write of {} failed at byte {}: {}", op.path, offset, written.error().describe());
            status.outcome = FileOutcome::Failed;
            status.message = written.error().describe();
            return status;
        }
        offset += length;
        status.bytes += length;

        Checkpoint checkpoint;
        checkpoint.task_id = options.task_id;
        checkpoint.path = op.path;
        checkpoint.bytes_transferred = offset;
        checkpoint.total_bytes = source.size;
        checkpoint.updated = Clock::now();
        checkpoint.source_size = source.size;
        checkpoint.source_modified = source.modified;
        if (auto saved = checkpoints_.set(checkpoint); saved.is_error()) {
            spdlog::warn("Checkpoint for {} not saved: {}", op.path, saved.error().describe());
        }
        events::publish(bus_, events::ChunkCommittedEvent{options.task_id, op.path, offset, source.size});
    }

    if (auto renamed = target_.rename(part, op.path); renamed.is_error()) {
        spdlog::error("Cannot move {} into place: {}", op.path, renamed.error().describe());
        status.outcome = FileOutcome::Failed;
        status.message = renamed.error().describe();
        return status;
    }

    if (options.preserve_modified_time && source.modified != TimePoint{}) {
        if (auto touched = target_.set_modified_time(op.path, source.modified); touched.is_error()) {
            spdlog::warn("Could not set modification time on {}: {}", op.path, touched.error().describe());
        }
    }

    if (auto cleared = checkpoints_.clear(options.task_id, op.path); cleared.is_error()) {
        spdlog::warn("Could not clear checkpoint for {}: {}", op.path, cleared.error().describe());
    }
    return status;
}

} // namespace tsync::sync
