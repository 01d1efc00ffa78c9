#pragma once

#include "tsync/transport/client.hpp"

#include <atomic>
#include <filesystem>

namespace tsync::transport {

/**
 * @brief TransportClient over a directory on local disk
 *
 * Symbolic links and special files are reported as FileKind::Other and
 * never followed. The root directory is created on connect.
 */
class LocalTransport : public TransportClient {
public:
    explicit LocalTransport(std::filesystem::path root, TransportOptions options = {});

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

protected:
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

private:
    [[nodiscard]] std::filesystem::path resolve(const std::string& relative) const;
    Result<FileEntry> describe_entry(const std::filesystem::path& absolute, std::string relative) const;

    std::filesystem::path root_;
    std::atomic<bool> connected_{false};
};

} // namespace tsync::transport
