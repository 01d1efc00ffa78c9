#include "tsync/sync/checkpoint_store.hpp"

#include "tsync/core/hash.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>

namespace tsync::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json to_json_entry(const Checkpoint& checkpoint) {
    return json{
        {"bytes_transferred", checkpoint.bytes_transferred},
        {"total_bytes", checkpoint.total_bytes},
        {"updated_at", to_unix_seconds(checkpoint.updated)},
        {"source_size", checkpoint.source_size},
        {"source_mtime", to_unix_seconds(checkpoint.source_modified)},
    };
}

// Paths are raw bytes and need not be UTF-8; keys carry them hex encoded
std::string encode_key(const std::string& path) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(path.size() * 2);
    for (unsigned char c : path) {
        out += kDigits[c >> 4];
        out += kDigits[c & 0x0f];
    }
    return out;
}

std::optional<std::string> decode_key(const std::string& key) {
    if (key.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    std::string out;
    out.reserve(key.size() / 2);
    for (std::size_t i = 0; i < key.size(); i += 2) {
        const int high = nibble(key[i]);
        const int low = nibble(key[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((high << 4) | low);
    }
    return out;
}

Checkpoint from_json_entry(const std::string& task_id, const std::string& path, const json& j) {
    Checkpoint checkpoint;
    checkpoint.task_id = task_id;
    checkpoint.path = path;
    checkpoint.bytes_transferred = j.at("bytes_transferred").get<std::uint64_t>();
    checkpoint.total_bytes = j.at("total_bytes").get<std::uint64_t>();
    checkpoint.updated = from_unix_seconds(j.value("updated_at", std::int64_t{0}));
    checkpoint.source_size = j.value("source_size", checkpoint.total_bytes);
    checkpoint.source_modified = from_unix_seconds(j.value("source_mtime", std::int64_t{0}));
    return checkpoint;
}

} // namespace

CheckpointStore::CheckpointStore(fs::path directory) : directory_(std::move(directory)) {}

fs::path CheckpointStore::file_for(const std::string& task_id) const {
    std::string safe;
    for (unsigned char c : task_id) {
        safe += (std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_';
    }
    // Hash suffix keeps ids that sanitize alike apart
    Fnv1a hash;
    hash.update(reinterpret_cast<const std::uint8_t*>(task_id.data()), task_id.size());
    return directory_ / (safe + "-" + hash.hex().substr(0, 8) + ".json");
}

CheckpointStore::TaskCheckpoints& CheckpointStore::load(const std::string& task_id) const {
    auto cached = cache_.find(task_id);
    if (cached != cache_.end()) {
        return cached->second;
    }

    TaskCheckpoints checkpoints;
    const auto file = file_for(task_id);
    std::error_code ec;
    if (fs::exists(file, ec)) {
        std::ifstream input(file);
        try {
            const json document = json::parse(input);
            for (const auto& item : document.at("files").items()) {
                const auto path = decode_key(item.key());
                if (!path) {
                    spdlog::warn("Skipping malformed checkpoint key '{}' in {}", item.key(), file.string());
                    continue;
                }
                checkpoints.emplace(*path, from_json_entry(task_id, *path, item.value()));
            }
        } catch (const json::exception& e) {
            spdlog::warn("Ignoring unreadable checkpoint file {}: {}", file.string(), e.what());
            checkpoints.clear();
        }
    }
    return cache_.emplace(task_id, std::move(checkpoints)).first->second;
}

Result<void> CheckpointStore::persist(const std::string& task_id, const TaskCheckpoints& checkpoints) const {
    const auto file = file_for(task_id);
    std::error_code ec;
    if (checkpoints.empty()) {
        fs::remove(file, ec);
        if (ec) {
            return Err<void>(ErrorKind::Io, "cannot remove " + file.string() + ": " + ec.message());
        }
        return Ok();
    }

    fs::create_directories(directory_, ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "cannot create " + directory_.string() + ": " + ec.message());
    }

    json files = json::object();
    for (const auto& [path, checkpoint] : checkpoints) {
        auto entry = to_json_entry(checkpoint);
        entry["path"] = path;   // informational; the key is authoritative
        files[encode_key(path)] = std::move(entry);
    }
    const json document{{"task_id", task_id}, {"files", files}};

    std::string text;
    try {
        text = document.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return Err<void>(ErrorKind::Io, "cannot encode checkpoints for " + task_id + ": " + e.what());
    }

    auto temporary = file;
    temporary += ".tmp";
    {
        std::ofstream output(temporary, std::ios::trunc);
        output << text;
        output.flush();
        if (!output) {
            return Err<void>(ErrorKind::Io, "cannot write " + temporary.string());
        }
    }
    fs::rename(temporary, file, ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "cannot replace " + file.string() + ": " + ec.message());
    }
    return Ok();
}

std::optional<Checkpoint> CheckpointStore::get(const std::string& task_id, const std::string& path) const {
    std::lock_guard lock(mutex_);
    const auto& checkpoints = load(task_id);
    const auto it = checkpoints.find(path);
    if (it == checkpoints.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> CheckpointStore::set(const Checkpoint& checkpoint) {
    if (checkpoint.bytes_transferred > checkpoint.total_bytes) {
        return Err<void>(ErrorKind::InvalidArgument,
                         "checkpoint for " + checkpoint.path + " exceeds the file size");
    }
    std::lock_guard lock(mutex_);
    auto& checkpoints = load(checkpoint.task_id);
    std::optional<Checkpoint> previous;
    if (auto it = checkpoints.find(checkpoint.path); it != checkpoints.end()) {
        previous = it->second;
    }
    checkpoints[checkpoint.path] = checkpoint;
    auto persisted = persist(checkpoint.task_id, checkpoints);
    if (persisted.is_error()) {
        // Keep memory in line with the file so one failure stays with its path
        if (previous) {
            checkpoints[checkpoint.path] = *previous;
        } else {
            checkpoints.erase(checkpoint.path);
        }
    }
    return persisted;
}

Result<void> CheckpointStore::clear(const std::string& task_id, const std::string& path) {
    std::lock_guard lock(mutex_);
    auto& checkpoints = load(task_id);
    if (checkpoints.erase(path) == 0) {
        return Ok();
    }
    return persist(task_id, checkpoints);
}

Result<void> CheckpointStore::clear_task(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    auto& checkpoints = load(task_id);
    checkpoints.clear();
    return persist(task_id, checkpoints);
}

std::vector<Checkpoint> CheckpointStore::list(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    std::vector<Checkpoint> out;
    for (const auto& [path, checkpoint] : load(task_id)) {
        out.push_back(checkpoint);
    }
    return out;
}

ResumePoint resolve_resume(CheckpointStore& store,
                           const std::string& task_id,
                           const transport::FileEntry& source,
                           std::optional<std::uint64_t> partial_size) {
    const auto checkpoint = store.get(task_id, source.path);
    if (!checkpoint) {
        return {};
    }

    const bool same_source = checkpoint->source_size == source.size &&
                             to_unix_seconds(checkpoint->source_modified) == to_unix_seconds(source.modified);
    const bool consistent = checkpoint->bytes_transferred <= checkpoint->total_bytes &&
                            checkpoint->total_bytes == source.size;
    if (same_source && consistent && partial_size && *partial_size == checkpoint->bytes_transferred) {
        return ResumePoint{checkpoint->bytes_transferred, checkpoint->bytes_transferred > 0};
    }

    spdlog::info("Restarting {} from zero: checkpoint at {} bytes does not match {}", source.path,
                 checkpoint->bytes_transferred,
                 partial_size ? std::to_string(*partial_size) + "-byte partial file" : std::string("a missing partial file"));
    if (auto cleared = store.clear(task_id, source.path); cleared.is_error()) {
        spdlog::warn("Could not clear checkpoint for {}: {}", source.path, cleared.error().describe());
    }
    return {};
}

} // namespace tsync::sync
