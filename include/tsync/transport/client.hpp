#pragma once

#include "tsync/core/result.hpp"
#include "tsync/transport/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tsync::transport {

/**
 * @brief Uniform file access over a local directory, SFTP or FTP server
 *
 * Paths are relative to the endpoint root. The public operations wrap the
 * protected `do_*` primitives with the bounded retry policy from
 * TransportOptions: Connection, Timeout and Io errors are attempted again,
 * NotFound and PermissionDenied come back immediately. A Connection error
 * drops the session; the next attempt reconnects before retrying.
 *
 * Implementations must tolerate concurrent calls from transfer workers.
 */
class TransportClient {
public:
    explicit TransportClient(TransportOptions options = {});
    virtual ~TransportClient() = default;

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    Result<void> connect();
    void disconnect();
    [[nodiscard]] bool is_connected() const;

    /// Recursive listing below `path`, ordered by path.
    Result<std::vector<FileEntry>> list(const std::string& path = "");

    /// Up to `length` bytes starting at `offset`; shorter at end of file.
    Result<Bytes> read_range(const std::string& path, std::uint64_t offset, std::size_t length);

    /**
     * Offset 0 creates or truncates the file. A positive offset appends and
     * requires the current size to equal `offset`, so a chunk lands exactly
     * once or not at all.
     */
    Result<void> write_range(const std::string& path, std::uint64_t offset, const Bytes& data);

    Result<void> remove(const std::string& path, FileKind kind);
    Result<void> mkdir(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);
    Result<FileEntry> stat(const std::string& path);
    Result<void> set_modified_time(const std::string& path, TimePoint modified);

    /// Streamed FNV-1a over read_range.
    Result<std::string> checksum(const std::string& path);

    [[nodiscard]] virtual std::string describe() const = 0;

    [[nodiscard]] const TransportOptions& options() const noexcept { return options_; }

    static constexpr std::size_t kChecksumBlock = 1024 * 1024;

protected:
    virtual Result<void> do_connect() = 0;
    virtual void do_disconnect() = 0;
    [[nodiscard]] virtual bool do_is_connected() const = 0;

    virtual Result<std::vector<FileEntry>> do_list(const std::string& path) = 0;
    virtual Result<Bytes> do_read_range(const std::string& path, std::uint64_t offset, std::size_t length) = 0;
    virtual Result<void> do_write_range(const std::string& path, std::uint64_t offset, const Bytes& data) = 0;
    virtual Result<void> do_remove(const std::string& path, FileKind kind) = 0;
    virtual Result<void> do_mkdir(const std::string& path) = 0;
    virtual Result<void> do_rename(const std::string& from, const std::string& to) = 0;
    virtual Result<FileEntry> do_stat(const std::string& path) = 0;
    virtual Result<void> do_set_modified_time(const std::string& path, TimePoint modified) = 0;

private:
    Result<void> ensure_connected();

    template<typename Op>
    auto with_retry(const char* what, Op&& op);

    TransportOptions options_;
    std::mutex connect_mutex_;
};

/// Picks the implementation matching `endpoint.kind`.
std::unique_ptr<TransportClient> make_transport(const Endpoint& endpoint, TransportOptions options = {});

} // namespace tsync::transport
