#pragma once

#include "tsync/transport/client.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tsync::test_support {

using transport::Bytes;
using transport::FileEntry;
using transport::FileKind;

/**
 * @brief In-memory TransportClient with failure injection
 *
 * Paths are flat keys; parents are created implicitly like the local
 * transport does. Failures are armed per operation and path and fire a
 * bounded number of times (-1 = always).
 */
class MemoryTransport : public transport::TransportClient {
public:
    struct Node {
        FileKind kind = FileKind::File;
        Bytes data;
        TimePoint modified{};
    };

    explicit MemoryTransport(std::string name = "memory")
        : TransportClient(no_retry()), name_(std::move(name)) {}

    MemoryTransport(std::string name, transport::TransportOptions options)
        : TransportClient(std::move(options)), name_(std::move(name)) {}

    static transport::TransportOptions no_retry() {
        transport::TransportOptions options;
        options.retry = RetryPolicy::none();
        return options;
    }

    // ───────────── fixture helpers ─────────────

    void put_file(const std::string& path, const std::string& content, TimePoint modified = from_unix_seconds(1700000000)) {
        std::lock_guard lock(mutex_);
        make_parents(path);
        nodes_[path] = Node{FileKind::File, Bytes(content.begin(), content.end()), modified};
    }

    void put_dir(const std::string& path) {
        std::lock_guard lock(mutex_);
        make_parents(path);
        nodes_[path] = Node{FileKind::Directory, {}, from_unix_seconds(1700000000)};
    }

    void put_special(const std::string& path) {
        std::lock_guard lock(mutex_);
        make_parents(path);
        nodes_[path] = Node{FileKind::Other, {}, from_unix_seconds(1700000000)};
    }

    std::optional<std::string> content(const std::string& path) const {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end() || it->second.kind != FileKind::File) {
            return std::nullopt;
        }
        return std::string(it->second.data.begin(), it->second.data.end());
    }

    std::optional<Node> node(const std::string& path) const {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool exists(const std::string& path) const {
        std::lock_guard lock(mutex_);
        return nodes_.count(path) != 0;
    }

    std::vector<std::string> paths() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        for (const auto& [path, node] : nodes_) {
            result.push_back(path);
        }
        return result;
    }

    // ───────────── failure injection ─────────────

    enum class Op { Connect, List, Read, Write, Remove, Mkdir, Rename, Stat };

    void fail(Op op, ErrorKind kind, std::string path = {}, int times = -1) {
        std::lock_guard lock(mutex_);
        failures_.push_back(Failure{op, std::move(path), kind, times});
    }

    /// Deliver a write but report it as lost, like a connection dropping after the server applied it.
    void fail_after_write(const std::string& path, int times = 1) {
        fail(Op::Write, ErrorKind::Connection, path + "#after", times);
    }

    std::size_t calls(Op op) const {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    std::size_t connects() const { return connects_.load(); }

    [[nodiscard]] std::string describe() const override { return name_; }

protected:
    Result<void> do_connect() override {
        connects_++;
        if (auto failure = take_failure(Op::Connect, "")) {
            return Err<void, Error>(*failure);
        }
        connected_ = true;
        return Ok();
    }

    void do_disconnect() override { connected_ = false; }

    [[nodiscard]] bool do_is_connected() const override { return connected_.load(); }

    Result<std::vector<FileEntry>> do_list(const std::string& path) override {
        if (auto failure = take_failure(Op::List, path)) {
            return Err<std::vector<FileEntry>>(*failure);
        }
        std::lock_guard lock(mutex_);
        if (!path.empty()) {
            auto it = nodes_.find(path);
            if (it == nodes_.end() || it->second.kind != FileKind::Directory) {
                return Err<std::vector<FileEntry>>(ErrorKind::NotFound, "no directory " + path);
            }
        }
        std::vector<FileEntry> entries;
        const std::string prefix = path.empty() ? "" : path + "/";
        for (const auto& [name, node] : nodes_) {
            if (name.compare(0, prefix.size(), prefix) == 0) {
                entries.push_back(to_entry(name, node));
            }
        }
        return Ok(std::move(entries));
    }

    Result<Bytes> do_read_range(const std::string& path, std::uint64_t offset, std::size_t length) override {
        if (auto failure = take_failure(Op::Read, path)) {
            return Err<Bytes>(*failure);
        }
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end() || it->second.kind != FileKind::File) {
            return Err<Bytes>(ErrorKind::NotFound, "no file " + path);
        }
        const Bytes& data = it->second.data;
        if (offset >= data.size()) {
            return Ok(Bytes{});
        }
        const auto end = std::min<std::uint64_t>(data.size(), offset + length);
        return Ok(Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset), data.begin() + static_cast<std::ptrdiff_t>(end)));
    }

    Result<void> do_write_range(const std::string& path, std::uint64_t offset, const Bytes& data) override {
        if (auto failure = take_failure(Op::Write, path)) {
            return Err<void, Error>(*failure);
        }
        {
            std::lock_guard lock(mutex_);
            auto it = nodes_.find(path);
            if (offset == 0) {
                make_parents(path);
                nodes_[path] = Node{FileKind::File, data, Clock::now()};
            } else {
                if (it == nodes_.end() || it->second.data.size() != offset) {
                    return Err<void>(ErrorKind::Transfer, "append offset mismatch on " + path);
                }
                it->second.data.insert(it->second.data.end(), data.begin(), data.end());
                it->second.modified = Clock::now();
            }
        }
        if (auto failure = take_failure(Op::Write, path + "#after")) {
            return Err<void, Error>(*failure);
        }
        return Ok();
    }

    Result<void> do_remove(const std::string& path, FileKind kind) override {
        if (auto failure = take_failure(Op::Remove, path)) {
            return Err<void, Error>(*failure);
        }
        std::lock_guard lock(mutex_);
        if (nodes_.count(path) == 0) {
            return Err<void>(ErrorKind::NotFound, "no such entry " + path);
        }
        if (kind == FileKind::Directory) {
            const std::string prefix = path + "/";
            const auto child = nodes_.lower_bound(prefix);
            if (child != nodes_.end() && child->first.compare(0, prefix.size(), prefix) == 0) {
                return Err<void>(ErrorKind::Transfer, "directory not empty: " + path);
            }
        }
        nodes_.erase(path);
        return Ok();
    }

    Result<void> do_mkdir(const std::string& path) override {
        if (auto failure = take_failure(Op::Mkdir, path)) {
            return Err<void, Error>(*failure);
        }
        std::lock_guard lock(mutex_);
        make_parents(path);
        auto& node = nodes_[path];
        node.kind = FileKind::Directory;
        node.modified = Clock::now();
        return Ok();
    }

    Result<void> do_rename(const std::string& from, const std::string& to) override {
        if (auto failure = take_failure(Op::Rename, from)) {
            return Err<void, Error>(*failure);
        }
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(from);
        if (it == nodes_.end()) {
            return Err<void>(ErrorKind::NotFound, "no such entry " + from);
        }
        Node moved = std::move(it->second);
        nodes_.erase(it);
        make_parents(to);
        nodes_[to] = std::move(moved);
        return Ok();
    }

    Result<FileEntry> do_stat(const std::string& path) override {
        if (auto failure = take_failure(Op::Stat, path)) {
            return Err<FileEntry>(*failure);
        }
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return Err<FileEntry>(ErrorKind::NotFound, "no such entry " + path);
        }
        return Ok(to_entry(path, it->second));
    }

    Result<void> do_set_modified_time(const std::string& path, TimePoint modified) override {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return Err<void>(ErrorKind::NotFound, "no such entry " + path);
        }
        it->second.modified = modified;
        return Ok();
    }

private:
    struct Failure {
        Op op;
        std::string path;   ///< Empty matches every path
        ErrorKind kind;
        int remaining;
    };

    static FileEntry to_entry(const std::string& path, const Node& node) {
        FileEntry entry;
        entry.path = path;
        entry.kind = node.kind;
        entry.size = node.kind == FileKind::File ? node.data.size() : 0;
        entry.modified = node.modified;
        return entry;
    }

    void make_parents(const std::string& path) {
        for (auto pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1)) {
            auto& parent = nodes_[path.substr(0, pos)];
            parent.kind = FileKind::Directory;
        }
    }

    std::optional<Error> take_failure(Op op, const std::string& path) {
        std::lock_guard lock(mutex_);
        calls_[op]++;
        for (auto& failure : failures_) {
            if (failure.op != op || failure.remaining == 0) {
                continue;
            }
            if (!failure.path.empty() && failure.path != path) {
                continue;
            }
            if (failure.remaining > 0) {
                failure.remaining--;
            }
            return Error{failure.kind, "injected failure on " + path};
        }
        return std::nullopt;
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, Node> nodes_;
    std::vector<Failure> failures_;
    std::map<Op, std::size_t> calls_;
    std::atomic<bool> connected_{false};
    std::atomic<std::size_t> connects_{0};
};

} // namespace tsync::test_support
