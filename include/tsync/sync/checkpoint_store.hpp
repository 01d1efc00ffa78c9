#pragma once

#include "tsync/core/result.hpp"
#include "tsync/core/time.hpp"
#include "tsync/transport/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tsync::sync {

/**
 * @brief Progress of one partially transferred file
 *
 * `source_size` and `source_modified` pin the checkpoint to the version of
 * the source it was taken from; a changed source invalidates it.
 */
struct Checkpoint {
    std::string task_id;
    std::string path;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    TimePoint updated{};
    std::uint64_t source_size = 0;
    TimePoint source_modified{};
};

/**
 * @brief Durable (task id, file path) -> Checkpoint map
 *
 * One JSON document per task under the store directory, rewritten through
 * a temporary file and rename. All access is serialized by one mutex, so
 * concurrent workers never lose each other's updates. A document that does
 * not parse is logged and treated as empty. Paths are keyed hex encoded, so
 * names that are not UTF-8 persist unchanged. A failed write leaves the
 * in-memory view as it was.
 */
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path directory);

    std::optional<Checkpoint> get(const std::string& task_id, const std::string& path) const;

    /// InvalidArgument when bytes_transferred exceeds total_bytes.
    Result<void> set(const Checkpoint& checkpoint);

    Result<void> clear(const std::string& task_id, const std::string& path);
    Result<void> clear_task(const std::string& task_id);

    std::vector<Checkpoint> list(const std::string& task_id) const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    using TaskCheckpoints = std::map<std::string, Checkpoint>;

    std::filesystem::path file_for(const std::string& task_id) const;
    TaskCheckpoints& load(const std::string& task_id) const;
    Result<void> persist(const std::string& task_id, const TaskCheckpoints& checkpoints) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, TaskCheckpoints> cache_;
};

/// Where to restart a file transfer.
struct ResumePoint {
    std::uint64_t offset = 0;
    bool resumed = false;
};

/**
 * @brief Decide whether a file continues from its checkpoint
 *
 * Resumes at B only when a checkpoint with bytes_transferred == B exists,
 * still describes the current source, and the partial file on the target
 * is exactly B bytes long. Any other stored checkpoint is cleared and the
 * file restarts from zero; that inconsistency is logged, not reported.
 */
ResumePoint resolve_resume(CheckpointStore& store,
                           const std::string& task_id,
                           const transport::FileEntry& source,
                           std::optional<std::uint64_t> partial_size);

} // namespace tsync::sync
