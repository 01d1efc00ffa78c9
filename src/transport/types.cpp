#include "tsync/transport/types.hpp"

namespace tsync::transport {

const char* to_string(EndpointKind kind) noexcept {
    switch (kind) {
        case EndpointKind::Local: return "local";
        case EndpointKind::Sftp: return "sftp";
        case EndpointKind::Ftp: return "ftp";
    }
    return "unknown";
}

const char* to_string(FileKind kind) noexcept {
    switch (kind) {
        case FileKind::File: return "file";
        case FileKind::Directory: return "directory";
        case FileKind::Other: return "other";
    }
    return "unknown";
}

std::optional<EndpointKind> parse_endpoint_kind(const std::string& name) {
    if (name == "local") return EndpointKind::Local;
    if (name == "sftp") return EndpointKind::Sftp;
    if (name == "ftp") return EndpointKind::Ftp;
    return std::nullopt;
}

std::uint16_t Endpoint::effective_port() const noexcept {
    if (port != 0) {
        return port;
    }
    switch (kind) {
        case EndpointKind::Sftp: return 22;
        case EndpointKind::Ftp: return 21;
        case EndpointKind::Local: break;
    }
    return 0;
}

std::string Endpoint::describe() const {
    if (kind == EndpointKind::Local) {
        return std::string("local:") + path;
    }
    std::string out = std::string(to_string(kind)) + "://";
    if (!username.empty()) {
        out += username + "@";
    }
    out += host + ":" + std::to_string(effective_port());
    if (path.empty() || path.front() != '/') {
        out += "/";
    }
    out += path;
    return out;
}

std::string join_path(const std::string& base, const std::string& child) {
    if (base.empty()) return child;
    if (child.empty()) return base;
    if (base.back() == '/') return base + child;
    return base + "/" + child;
}

std::string parent_path(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

std::string file_name(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace tsync::transport
