#include "tsync/events/event_bus.hpp"
#include "tsync/events/events.hpp"
#include "tsync/sync/engine.hpp"

#include "support/memory_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace tsync::sync;
using tsync::ErrorKind;
using tsync::test_support::MemoryTransport;
using Op = MemoryTransport::Op;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("tsync_engine_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
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

Endpoint local(const fs::path& path) {
    Endpoint endpoint;
    endpoint.kind = tsync::transport::EndpointKind::Local;
    endpoint.path = path.string();
    return endpoint;
}

EngineSettings quick_settings() {
    EngineSettings settings;
    settings.transport.retry = tsync::RetryPolicy::none();
    settings.chunk_size = 8;
    return settings;
}

} // namespace

class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        source_ = root_ / "source";
        target_ = root_ / "target";
        fs::create_directories(source_);
    }
    void TearDown() override { fs::remove_all(root_); }

    SyncTask task(SyncMode mode = SyncMode::Mirror) const {
        SyncTask t;
        t.source = local(source_);
        t.target = local(target_);
        t.mode = mode;
        return t;
    }

    fs::path root_;
    fs::path source_;
    fs::path target_;
};

TEST_F(SyncEngineTest, MirrorsIntoMissingTargetAndConverges) {
    write_file(source_ / "photos" / "2024" / "beach.jpg", std::string(100, 'x'));
    write_file(source_ / "notes.txt", "remember the milk");

    CheckpointStore checkpoints(root_ / "checkpoints");
    tsync::events::EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe<tsync::events::SyncStartedEvent>([&](const auto&) { seen.push_back("started"); });
    bus.subscribe<tsync::events::SyncPlannedEvent>([&](const auto& e) {
        seen.push_back("planned " + std::to_string(e.copies));
    });
    bus.subscribe<tsync::events::SyncFinishedEvent>([&](const auto& e) {
        seen.push_back(std::string("finished ") + to_string(e.outcome));
    });

    SyncEngine engine(checkpoints, &bus, quick_settings());
    const auto result = engine.run("photos", task());

    EXPECT_EQ(result.outcome, SyncOutcome::Success);
    EXPECT_EQ(result.copied, 2u);
    EXPECT_EQ(result.directories_created, 2u);
    EXPECT_EQ(read_file(target_ / "photos" / "2024" / "beach.jpg"), std::string(100, 'x'));
    EXPECT_EQ(read_file(target_ / "notes.txt"), "remember the milk");
    EXPECT_EQ(result.mode, SyncMode::Mirror);
    EXPECT_FALSE(result.source_description.empty());
    EXPECT_EQ(seen, (std::vector<std::string>{"started", "planned 4", "finished success"}));

    auto again = engine.plan(task());
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value().converged());
}

TEST_F(SyncEngineTest, IncrementalKeepsExtraTargetFiles) {
    write_file(source_ / "a.txt", "a");
    write_file(target_ / "keep.txt", "keep");

    CheckpointStore checkpoints(root_ / "checkpoints");
    SyncEngine engine(checkpoints, nullptr, quick_settings());
    const auto result = engine.run("inc", task(SyncMode::Incremental));

    EXPECT_EQ(result.outcome, SyncOutcome::Success);
    EXPECT_EQ(result.deleted, 0u);
    EXPECT_TRUE(fs::exists(target_ / "keep.txt"));
    EXPECT_TRUE(fs::exists(target_ / "a.txt"));
}

TEST_F(SyncEngineTest, MirrorSparesFilteredTargetContent) {
    write_file(source_ / "small.bin", std::string(50, 's'));
    write_file(target_ / "small.bin", std::string(200, 't'));
    write_file(target_ / "logs" / "keep.bak", "backup");
    write_file(target_ / "logs" / "stale.txt", "stale");
    write_file(target_ / "gone" / "old.txt", "old");

    auto t = task();
    t.filters.min_size = 100;
    t.filters.exclude = {"*.bak"};

    CheckpointStore checkpoints(root_ / "checkpoints");
    SyncEngine engine(checkpoints, nullptr, quick_settings());
    const auto result = engine.run("spare", t);

    EXPECT_EQ(result.outcome, SyncOutcome::Success);
    EXPECT_EQ(read_file(target_ / "small.bin"), std::string(200, 't'));
    EXPECT_EQ(read_file(target_ / "logs" / "keep.bak"), "backup");
    EXPECT_FALSE(fs::exists(target_ / "logs" / "stale.txt"));
    EXPECT_FALSE(fs::exists(target_ / "gone"));
    EXPECT_EQ(result.deleted, 3u);
}

TEST_F(SyncEngineTest, ChecksumCompareDetectsSameSizeEdits) {
    write_file(source_ / "data.bin", "AAAA");
    write_file(target_ / "data.bin", "BBBB");
    fs::last_write_time(target_ / "data.bin", fs::last_write_time(source_ / "data.bin"));

    auto t = task();
    t.compare = CompareMethod::Checksum;

    CheckpointStore checkpoints(root_ / "checkpoints");
    SyncEngine engine(checkpoints, nullptr, quick_settings());
    const auto result = engine.run("sum", t);

    EXPECT_EQ(result.updated, 1u);
    EXPECT_EQ(read_file(target_ / "data.bin"), "AAAA");
}

TEST_F(SyncEngineTest, UnreachableEndpointIsConnectionFailed) {
    CheckpointStore checkpoints(root_ / "checkpoints");
    auto factory = [](const Endpoint&, const tsync::transport::TransportOptions&) {
        auto transport = std::make_unique<MemoryTransport>("down");
        transport->fail(Op::Connect, ErrorKind::Connection);
        return std::unique_ptr<tsync::transport::TransportClient>(std::move(transport));
    };
    SyncEngine engine(checkpoints, nullptr, quick_settings(), factory);

    const auto result = engine.run("down", task());
    EXPECT_EQ(result.outcome, SyncOutcome::ConnectionFailed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::Connection);
    EXPECT_TRUE(result.files.empty());
    EXPECT_NE(result.message.find("connection_failed"), std::string::npos);
}

TEST_F(SyncEngineTest, UnlistableSourceIsPlanningFailed) {
    CheckpointStore checkpoints(root_ / "checkpoints");
    auto factory = [](const Endpoint&, const tsync::transport::TransportOptions&) {
        auto transport = std::make_unique<MemoryTransport>("locked");
        transport->fail(Op::List, ErrorKind::PermissionDenied);
        return std::unique_ptr<tsync::transport::TransportClient>(std::move(transport));
    };
    SyncEngine engine(checkpoints, nullptr, quick_settings(), factory);

    const auto result = engine.run("locked", task());
    EXPECT_EQ(result.outcome, SyncOutcome::PlanningFailed);
    EXPECT_EQ(result.error->kind, ErrorKind::Planning);
}

TEST_F(SyncEngineTest, InvalidFilterFailsBeforeTouchingFiles) {
    write_file(source_ / "a.txt", "a");
    auto t = task();
    t.filters.exclude = {"[broken"};

    CheckpointStore checkpoints(root_ / "checkpoints");
    SyncEngine engine(checkpoints, nullptr, quick_settings());
    const auto result = engine.run("bad-filter", t);

    EXPECT_EQ(result.outcome, SyncOutcome::PlanningFailed);
    EXPECT_FALSE(fs::exists(target_ / "a.txt"));
}
