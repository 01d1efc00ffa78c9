#pragma once

#include "tsync/transport/client.hpp"
#include "tsync/transport/listing.hpp"

#include <curl/curl.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tsync::transport {

struct CurlHandleDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

/// Translate a libcurl failure into the shared error taxonomy.
ErrorKind classify_curl_error(CURLcode code) noexcept;

/**
 * @brief Shared libcurl plumbing for the SFTP and FTP transports
 *
 * Easy handles are pooled: each operation leases one, so transfer workers
 * run in parallel over separate sessions while libcurl keeps connections
 * alive between calls. Paths handed to the protocol hooks are absolute on
 * the server ("/srv/data/a.txt").
 */
class CurlTransport : public TransportClient {
public:
    CurlTransport(Endpoint endpoint, TransportOptions options);
    ~CurlTransport() override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

    /// Absolute server path of a root-relative path.
    [[nodiscard]] std::string absolute(const std::string& relative) const;

protected:
    class Lease {
    public:
        Lease(CurlTransport& owner, CurlHandle handle);
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        [[nodiscard]] CURL* get() const noexcept { return handle_.get(); }

    private:
        CurlTransport& owner_;
        CurlHandle handle_;
    };

    Result<void> do_connect() override;
    void do_disconnect() override;
    [[nodiscard]] bool do_is_connected() const override;

    Result<std::vector<FileEntry>> do_list(const std::string& path) override;
    Result<Bytes> do_read_range(const std::string& path, std::uint64_t offset, std::size_t length) override;
    Result<void> do_write_range(const std::string& path, std::uint64_t offset, const Bytes& data) override;
    Result<void> do_remove(const std::string& path, FileKind kind) override;
    Result<void> do_mkdir(const std::string& path) override;
    Result<void> do_rename(const std::string& from, const std::string& to) override;
    Result<FileEntry> do_stat(const std::string& path) override;
    Result<void> do_set_modified_time(const std::string& path, TimePoint modified) override;

    // Protocol hooks
    [[nodiscard]] virtual const char* scheme() const = 0;
    [[nodiscard]] virtual std::string url_path(const std::string& absolute_path, bool directory) const = 0;
    virtual void apply_protocol_options(CURL* handle) const = 0;
    virtual Result<std::vector<ListedEntry>> list_directory(const std::string& absolute_dir) = 0;
    [[nodiscard]] virtual std::vector<std::string> remove_commands(const std::string& absolute_path, FileKind kind) const = 0;
    [[nodiscard]] virtual std::string mkdir_command(const std::string& absolute_path) const = 0;
    [[nodiscard]] virtual std::vector<std::string> rename_commands(const std::string& from, const std::string& to) const = 0;
    [[nodiscard]] virtual std::string mtime_command(const std::string& absolute_path, TimePoint modified) const = 0;

    /// Hook for protocols whose listings carry imprecise times.
    virtual Result<FileEntry> refine(FileEntry entry) { return Ok(std::move(entry)); }

    Result<Lease> lease();
    void prepare(CURL* handle, const std::string& absolute_path, bool directory) const;
    Result<void> perform(CURL* handle, const std::string& what, CURLcode* code = nullptr) const;

    /// Fetch the body of a directory URL, optionally with a custom request verb.
    Result<std::string> fetch_listing(const std::string& absolute_dir, const char* custom_request);

    /// Send quote commands without transferring a body.
    Result<void> run_commands(const std::vector<std::string>& commands);

    /// Connection parameters shared by every request (auth, timeouts).
    Endpoint endpoint_;

private:
    void release(CurlHandle handle);
    Result<FileEntry> stat_absolute(const std::string& absolute_path, const std::string& relative);
    Result<std::vector<FileEntry>> walk(const std::string& relative);

    std::string root_;
    std::mutex pool_mutex_;
    std::vector<CurlHandle> pool_;
    std::atomic<bool> connected_{false};
};

/**
 * @brief SFTP over libcurl's libssh2/libssh backend
 *
 * Listings come from the server's long format; each file is then stat'ed
 * for an exact size and modification time.
 */
class SftpTransport : public CurlTransport {
public:
    SftpTransport(Endpoint endpoint, TransportOptions options = {});

protected:
    const char* scheme() const override { return "sftp"; }
    std::string url_path(const std::string& absolute_path, bool directory) const override;
    void apply_protocol_options(CURL* handle) const override;
    Result<std::vector<ListedEntry>> list_directory(const std::string& absolute_dir) override;
    std::vector<std::string> remove_commands(const std::string& absolute_path, FileKind kind) const override;
    std::string mkdir_command(const std::string& absolute_path) const override;
    std::vector<std::string> rename_commands(const std::string& from, const std::string& to) const override;
    std::string mtime_command(const std::string& absolute_path, TimePoint modified) const override;
    Result<FileEntry> refine(FileEntry entry) override;
};

/// FTP with MLSD listings and MFMT for modification times.
class FtpTransport : public CurlTransport {
public:
    FtpTransport(Endpoint endpoint, TransportOptions options = {});

protected:
    const char* scheme() const override { return "ftp"; }
    std::string url_path(const std::string& absolute_path, bool directory) const override;
    void apply_protocol_options(CURL* handle) const override;
    Result<std::vector<ListedEntry>> list_directory(const std::string& absolute_dir) override;
    std::vector<std::string> remove_commands(const std::string& absolute_path, FileKind kind) const override;
    std::string mkdir_command(const std::string& absolute_path) const override;
    std::vector<std::string> rename_commands(const std::string& from, const std::string& to) const override;
    std::string mtime_command(const std::string& absolute_path, TimePoint modified) const override;
};

} // namespace tsync::transport
