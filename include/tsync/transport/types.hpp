#pragma once

#include "tsync/core/retry.hpp"
#include "tsync/core/time.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsync::transport {

enum class EndpointKind { Local, Sftp, Ftp };

enum class FileKind { File, Directory, Other };

const char* to_string(EndpointKind kind) noexcept;
const char* to_string(FileKind kind) noexcept;
std::optional<EndpointKind> parse_endpoint_kind(const std::string& name);

/**
 * @brief Where a tree lives and how to reach it
 *
 * `path` is the root of the tree on the endpoint. For remote endpoints
 * `port == 0` selects the protocol default.
 */
struct Endpoint {
    EndpointKind kind = EndpointKind::Local;
    std::string host;
    std::uint16_t port = 0;
    std::string username;
    std::string password;
    std::string private_key_path;
    std::string known_hosts_path;
    std::string path;
    std::chrono::seconds timeout{30};
    bool passive_mode = true;

    [[nodiscard]] std::uint16_t effective_port() const noexcept;

    /// "local:/data", "sftp://user@host:22/srv/data" (never includes secrets)
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief One node of a listed tree
 *
 * `path` is relative to the endpoint root, '/'-separated, without a
 * leading slash.
 */
struct FileEntry {
    std::string path;
    std::uint64_t size = 0;
    TimePoint modified{};
    std::optional<std::string> checksum;
    FileKind kind = FileKind::File;

    [[nodiscard]] bool is_file() const noexcept { return kind == FileKind::File; }
    [[nodiscard]] bool is_directory() const noexcept { return kind == FileKind::Directory; }
};

using Bytes = std::vector<std::uint8_t>;

struct TransportOptions {
    RetryPolicy retry = RetryPolicy::fixed(3, std::chrono::milliseconds(500));
    std::chrono::seconds operation_timeout{300};
};

/// Join two relative paths with '/', ignoring empty parts.
std::string join_path(const std::string& base, const std::string& child);

/// Parent of a relative path ("a/b/c" -> "a/b", "c" -> "").
std::string parent_path(const std::string& path);

/// Final component of a relative path.
std::string file_name(const std::string& path);

} // namespace tsync::transport
