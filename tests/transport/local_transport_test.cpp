#include "tsync/transport/local_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace tsync::transport;
using tsync::ErrorKind;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("tsync_local_transport_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

Bytes bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

TransportOptions no_retry() {
    TransportOptions options;
    options.retry = tsync::RetryPolicy::none();
    return options;
}

} // namespace

TEST(LocalTransportTest, ListsRecursivelyInPathOrder) {
    const auto root = create_temp_dir();
    write_file(root / "b.txt", "bee");
    write_file(root / "a" / "nested.txt", "nested");
    fs::create_directories(root / "empty");

    LocalTransport transport(root, no_retry());
    ASSERT_TRUE(transport.connect().is_ok());

    auto listing = transport.list();
    ASSERT_TRUE(listing.is_ok()) << listing.error().describe();
    const auto& entries = listing.value();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].path, "a");
    EXPECT_TRUE(entries[0].is_directory());
    EXPECT_EQ(entries[1].path, "a/nested.txt");
    EXPECT_EQ(entries[1].size, 6u);
    EXPECT_EQ(entries[2].path, "b.txt");
    EXPECT_EQ(entries[3].path, "empty");

    fs::remove_all(root);
}

TEST(LocalTransportTest, SymlinksAreReportedButNotFollowed) {
    const auto root = create_temp_dir();
    write_file(root / "real" / "file.txt", "data");
    fs::create_directory_symlink(root / "real", root / "alias");

    LocalTransport transport(root, no_retry());
    auto listing = transport.list();
    ASSERT_TRUE(listing.is_ok());

    bool saw_alias = false;
    for (const auto& entry : listing.value()) {
        EXPECT_NE(entry.path, "alias/file.txt");
        if (entry.path == "alias") {
            saw_alias = true;
            EXPECT_EQ(entry.kind, FileKind::Other);
        }
    }
    EXPECT_TRUE(saw_alias);

    fs::remove_all(root);
}

TEST(LocalTransportTest, MissingRootListingIsNotFound) {
    const auto root = create_temp_dir();
    LocalTransport transport(root, no_retry());
    auto listing = transport.list("does/not/exist");
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().kind, ErrorKind::NotFound);

    fs::remove_all(root);
}

TEST(LocalTransportTest, WriteRangeAppendsOnlyAtCurrentSize) {
    const auto root = create_temp_dir();
    LocalTransport transport(root, no_retry());

    ASSERT_TRUE(transport.write_range("deep/dir/out.bin", 0, bytes("hello ")).is_ok());
    ASSERT_TRUE(transport.write_range("deep/dir/out.bin", 6, bytes("world")).is_ok());
    EXPECT_EQ(read_file(root / "deep" / "dir" / "out.bin"), "hello world");

    auto mismatch = transport.write_range("deep/dir/out.bin", 4, bytes("XX"));
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error().kind, ErrorKind::Transfer);
    EXPECT_EQ(read_file(root / "deep" / "dir" / "out.bin"), "hello world");

    // Offset zero starts over
    ASSERT_TRUE(transport.write_range("deep/dir/out.bin", 0, bytes("again")).is_ok());
    EXPECT_EQ(read_file(root / "deep" / "dir" / "out.bin"), "again");

    fs::remove_all(root);
}

TEST(LocalTransportTest, ReadRangeIsShortAtEndOfFile) {
    const auto root = create_temp_dir();
    write_file(root / "data.txt", "0123456789");
    LocalTransport transport(root, no_retry());

    auto middle = transport.read_range("data.txt", 2, 4);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(middle.value(), bytes("2345"));

    auto tail = transport.read_range("data.txt", 8, 100);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(tail.value(), bytes("89"));

    auto missing = transport.read_range("nope.txt", 0, 4);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    fs::remove_all(root);
}

TEST(LocalTransportTest, RenameRemoveAndModifiedTime) {
    const auto root = create_temp_dir();
    write_file(root / "draft.txt", "text");
    LocalTransport transport(root, no_retry());

    ASSERT_TRUE(transport.rename("draft.txt", "final/report.txt").is_ok());
    EXPECT_FALSE(fs::exists(root / "draft.txt"));
    EXPECT_EQ(read_file(root / "final" / "report.txt"), "text");

    const auto stamp = tsync::from_unix_seconds(1600000000);
    ASSERT_TRUE(transport.set_modified_time("final/report.txt", stamp).is_ok());
    auto info = transport.stat("final/report.txt");
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(tsync::to_unix_seconds(info.value().modified), 1600000000);
    EXPECT_EQ(info.value().size, 4u);

    ASSERT_TRUE(transport.remove("final/report.txt", FileKind::File).is_ok());
    auto again = transport.remove("final/report.txt", FileKind::File);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::NotFound);

    ASSERT_TRUE(transport.remove("final", FileKind::Directory).is_ok());
    EXPECT_FALSE(fs::exists(root / "final"));

    fs::remove_all(root);
}

TEST(LocalTransportTest, RemovingADirectoryNeverTakesItsContents) {
    const auto root = create_temp_dir();
    write_file(root / "logs" / "keep.bak", "backup");
    LocalTransport transport(root, no_retry());

    auto removed = transport.remove("logs", FileKind::Directory);
    ASSERT_TRUE(removed.is_error());
    EXPECT_EQ(removed.error().kind, ErrorKind::Transfer);
    EXPECT_EQ(read_file(root / "logs" / "keep.bak"), "backup");

    auto missing = transport.remove("nowhere", FileKind::Directory);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    fs::remove_all(root);
}

TEST(LocalTransportTest, ChecksumMatchesForEqualContent) {
    const auto root = create_temp_dir();
    write_file(root / "one.txt", "same content");
    write_file(root / "two.txt", "same content");
    write_file(root / "three.txt", "other content");
    LocalTransport transport(root, no_retry());

    auto one = transport.checksum("one.txt");
    auto two = transport.checksum("two.txt");
    auto three = transport.checksum("three.txt");
    ASSERT_TRUE(one.is_ok());
    ASSERT_TRUE(two.is_ok());
    ASSERT_TRUE(three.is_ok());
    EXPECT_EQ(one.value(), two.value());
    EXPECT_NE(one.value(), three.value());

    fs::remove_all(root);
}
