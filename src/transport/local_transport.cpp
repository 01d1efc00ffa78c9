#include "tsync/transport/local_transport.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <system_error>

namespace tsync::transport {
namespace fs = std::filesystem;

namespace {

Error from_errc(const std::error_code& ec, const std::string& context) {
    ErrorKind kind = ErrorKind::Io;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        kind = ErrorKind::NotFound;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        kind = ErrorKind::PermissionDenied;
    } else if (ec == std::errc::directory_not_empty) {
        kind = ErrorKind::Transfer;
    }
    return Error{kind, context + ": " + ec.message()};
}

Error from_errno(int err, const std::string& context) {
    return from_errc(std::error_code(err, std::generic_category()), context);
}

TimePoint to_time_point(const struct timespec& ts) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

} // namespace

LocalTransport::LocalTransport(fs::path root, TransportOptions options)
    : TransportClient(std::move(options)), root_(std::move(root)) {}

std::string LocalTransport::describe() const {
    return "local:" + root_.string();
}

fs::path LocalTransport::resolve(const std::string& relative) const {
    return relative.empty() ? root_ : root_ / fs::path(relative);
}

Result<void> LocalTransport::do_connect() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return Err<void>(from_errc(ec, "create root " + root_.string()));
    }
    if (!fs::is_directory(root_, ec)) {
        return Err<void>(ErrorKind::Connection, root_.string() + " is not a directory");
    }
    connected_ = true;
    return Ok();
}

void LocalTransport::do_disconnect() {
    connected_ = false;
}

bool LocalTransport::do_is_connected() const {
    return connected_;
}

Result<FileEntry> LocalTransport::describe_entry(const fs::path& absolute, std::string relative) const {
    struct stat info{};
    if (::lstat(absolute.c_str(), &info) != 0) {
        return Err<FileEntry>(from_errno(errno, "stat " + absolute.string()));
    }

    FileEntry entry;
    entry.path = std::move(relative);
    entry.modified = to_time_point(info.st_mtim);
    if (S_ISREG(info.st_mode)) {
        entry.kind = FileKind::File;
        entry.size = static_cast<std::uint64_t>(info.st_size);
    } else if (S_ISDIR(info.st_mode)) {
        entry.kind = FileKind::Directory;
    } else {
        entry.kind = FileKind::Other;
    }
    return Ok(std::move(entry));
}

Result<std::vector<FileEntry>> LocalTransport::do_list(const std::string& path) {
    const fs::path base = resolve(path);
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(base, ec))) {
        if (ec) {
            return Err<std::vector<FileEntry>>(from_errc(ec, "list " + base.string()));
        }
        return Err<std::vector<FileEntry>>(ErrorKind::NotFound, base.string() + " is not a directory");
    }

    std::vector<FileEntry> entries;
    fs::recursive_directory_iterator it(base, fs::directory_options::none, ec);
    if (ec) {
        return Err<std::vector<FileEntry>>(from_errc(ec, "list " + base.string()));
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<FileEntry>>(from_errc(ec, "list " + base.string()));
        }
        const auto relative = it->path().lexically_relative(root_).generic_string();
        auto entry = describe_entry(it->path(), relative);
        if (entry.is_error()) {
            // Vanished between readdir and lstat
            if (entry.error().kind == ErrorKind::NotFound) {
                continue;
            }
            return Err<std::vector<FileEntry>>(entry.error());
        }
        entries.push_back(std::move(entry.value()));
    }
    if (ec) {
        return Err<std::vector<FileEntry>>(from_errc(ec, "list " + base.string()));
    }
    return Ok(std::move(entries));
}

Result<Bytes> LocalTransport::do_read_range(const std::string& path, std::uint64_t offset, std::size_t length) {
    const auto absolute = resolve(path);
    std::ifstream input(absolute, std::ios::binary);
    if (!input) {
        std::error_code ec;
        if (!fs::exists(absolute, ec)) {
            return Err<Bytes>(ErrorKind::NotFound, "no such file: " + absolute.string());
        }
        return Err<Bytes>(ErrorKind::PermissionDenied, "cannot open " + absolute.string());
    }

    Bytes buffer(length);
    input.seekg(static_cast<std::streamoff>(offset));
    if (!input) {
        return Err<Bytes>(ErrorKind::Io, "seek failed in " + absolute.string());
    }
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (input.bad()) {
        return Err<Bytes>(ErrorKind::Io, "read failed in " + absolute.string());
    }
    buffer.resize(static_cast<std::size_t>(input.gcount()));
    return Ok(std::move(buffer));
}

Result<void> LocalTransport::do_write_range(const std::string& path, std::uint64_t offset, const Bytes& data) {
    const auto absolute = resolve(path);
    std::error_code ec;
    fs::create_directories(absolute.parent_path(), ec);
    if (ec) {
        return Err<void>(from_errc(ec, "create parent of " + absolute.string()));
    }

    std::ios::openmode mode = std::ios::binary;
    if (offset == 0) {
        mode |= std::ios::trunc;
    } else {
        const auto current = fs::file_size(absolute, ec);
        if (ec) {
            return Err<void>(from_errc(ec, "size of " + absolute.string()));
        }
        if (current != offset) {
            return Err<void>(ErrorKind::Transfer,
                             "append offset " + std::to_string(offset) + " does not match size " +
                             std::to_string(current) + " of " + absolute.string());
        }
        mode |= std::ios::app;
    }

    std::ofstream output(absolute, mode);
    if (!output) {
        return Err<void>(ErrorKind::PermissionDenied, "cannot open " + absolute.string() + " for writing");
    }
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    output.flush();
    if (!output) {
        output.close();
        // Roll the file back so the chunk is either fully present or absent
        fs::resize_file(absolute, offset, ec);
        if (ec) {
            spdlog::error("Could not roll back partial chunk in {}: {}", absolute.string(), ec.message());
        }
        return Err<void>(ErrorKind::Io, "write failed in " + absolute.string());
    }
    return Ok();
}

Result<void> LocalTransport::do_remove(const std::string& path, FileKind kind) {
    const auto absolute = resolve(path);
    std::error_code ec;
    // Directories go only once empty; the planner removes children first
    if (!fs::remove(absolute, ec) && !ec) {
        return Err<void>(ErrorKind::NotFound, std::string("no such ") +
                         (kind == FileKind::Directory ? "directory: " : "file: ") + absolute.string());
    }
    if (ec) {
        return Err<void>(from_errc(ec, "remove " + absolute.string()));
    }
    return Ok();
}

Result<void> LocalTransport::do_mkdir(const std::string& path) {
    const auto absolute = resolve(path);
    std::error_code ec;
    fs::create_directories(absolute, ec);
    if (ec) {
        return Err<void>(from_errc(ec, "mkdir " + absolute.string()));
    }
    return Ok();
}

Result<void> LocalTransport::do_rename(const std::string& from, const std::string& to) {
    const auto source = resolve(from);
    const auto destination = resolve(to);
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (!ec) {
        fs::rename(source, destination, ec);
    }
    if (ec) {
        return Err<void>(from_errc(ec, "rename " + source.string() + " -> " + destination.string()));
    }
    return Ok();
}

Result<FileEntry> LocalTransport::do_stat(const std::string& path) {
    return describe_entry(resolve(path), path);
}

Result<void> LocalTransport::do_set_modified_time(const std::string& path, TimePoint modified) {
    const auto absolute = resolve(path);
    const auto since_epoch = modified.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);

    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(seconds.count());
    times[1].tv_nsec = static_cast<long>(nanos.count());
    if (::utimensat(AT_FDCWD, absolute.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return Err<void>(from_errno(errno, "set mtime on " + absolute.string()));
    }
    return Ok();
}

} // namespace tsync::transport
