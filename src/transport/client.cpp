#include "tsync/transport/client.hpp"

#include "tsync/core/hash.hpp"
#include "tsync/transport/curl_transport.hpp"
#include "tsync/transport/local_transport.hpp"

#include <algorithm>

namespace tsync::transport {

TransportClient::TransportClient(TransportOptions options)
    : options_(std::move(options)) {}

Result<void> TransportClient::ensure_connected() {
    std::lock_guard lock(connect_mutex_);
    if (do_is_connected()) {
        return Ok();
    }
    return do_connect();
}

template<typename Op>
auto TransportClient::with_retry(const char* what, Op&& op) {
    using R = std::invoke_result_t<Op&>;
    return retry_result(options_.retry, [&](std::size_t) -> R {
        if (auto connected = ensure_connected(); connected.is_error()) {
            return R(ErrValue<Error>(connected.error()));
        }
        R result = op();
        if (result.is_error() && result.error().kind == ErrorKind::Connection) {
            std::lock_guard lock(connect_mutex_);
            do_disconnect();
        }
        return result;
    }, what);
}

Result<void> TransportClient::connect() {
    return retry_result(options_.retry, [&](std::size_t) { return ensure_connected(); }, "connect");
}

void TransportClient::disconnect() {
    std::lock_guard lock(connect_mutex_);
    do_disconnect();
}

bool TransportClient::is_connected() const {
    return do_is_connected();
}

Result<std::vector<FileEntry>> TransportClient::list(const std::string& path) {
    auto result = with_retry("list", [&] { return do_list(path); });
    if (result.is_ok()) {
        auto& entries = result.value();
        std::sort(entries.begin(), entries.end(),
                  [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
    }
    return result;
}

Result<Bytes> TransportClient::read_range(const std::string& path, std::uint64_t offset, std::size_t length) {
    return with_retry("read", [&] { return do_read_range(path, offset, length); });
}

Result<void> TransportClient::write_range(const std::string& path, std::uint64_t offset, const Bytes& data) {
    return with_retry("write", [&] { return do_write_range(path, offset, data); });
}

Result<void> TransportClient::remove(const std::string& path, FileKind kind) {
    return with_retry("remove", [&] { return do_remove(path, kind); });
}

Result<void> TransportClient::mkdir(const std::string& path) {
    return with_retry("mkdir", [&] { return do_mkdir(path); });
}

Result<void> TransportClient::rename(const std::string& from, const std::string& to) {
    return with_retry("rename", [&] { return do_rename(from, to); });
}

Result<FileEntry> TransportClient::stat(const std::string& path) {
    return with_retry("stat", [&] { return do_stat(path); });
}

Result<void> TransportClient::set_modified_time(const std::string& path, TimePoint modified) {
    return with_retry("set_modified_time", [&] { return do_set_modified_time(path, modified); });
}

Result<std::string> TransportClient::checksum(const std::string& path) {
    Fnv1a hash;
    std::uint64_t offset = 0;
    for (;;) {
        auto block = read_range(path, offset, kChecksumBlock);
        if (block.is_error()) {
            return Err<std::string>(block.error());
        }
        const auto& bytes = block.value();
        hash.update(bytes.data(), bytes.size());
        offset += bytes.size();
        if (bytes.size() < kChecksumBlock) {
            break;
        }
    }
    return Ok(hash.hex());
}

std::unique_ptr<TransportClient> make_transport(const Endpoint& endpoint, TransportOptions options) {
    switch (endpoint.kind) {
        case EndpointKind::Sftp:
            return std::make_unique<SftpTransport>(endpoint, std::move(options));
        case EndpointKind::Ftp:
            return std::make_unique<FtpTransport>(endpoint, std::move(options));
        case EndpointKind::Local:
            break;
    }
    return std::make_unique<LocalTransport>(endpoint.path, std::move(options));
}

} // namespace tsync::transport
