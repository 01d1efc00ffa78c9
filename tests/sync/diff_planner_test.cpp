#include "tsync/sync/diff_planner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace tsync::sync;
using tsync::TimePoint;

namespace {

const TimePoint kBase = tsync::from_unix_seconds(1700000000);

FileEntry file(const std::string& path, std::uint64_t size, TimePoint modified = kBase) {
    FileEntry entry;
    entry.path = path;
    entry.size = size;
    entry.modified = modified;
    return entry;
}

FileEntry dir(const std::string& path) {
    FileEntry entry;
    entry.path = path;
    entry.kind = FileKind::Directory;
    entry.modified = kBase;
    return entry;
}

FileEntry special(const std::string& path) {
    FileEntry entry;
    entry.path = path;
    entry.kind = FileKind::Other;
    return entry;
}

DiffPlan plan_for(SyncMode mode,
                  const std::vector<FileEntry>& source,
                  const std::vector<FileEntry>& target,
                  CompareMethod compare = CompareMethod::SizeTime) {
    PlanOptions options;
    options.mode = mode;
    options.compare = compare;
    auto plan = DiffPlanner(options).plan(source, target, kBase);
    EXPECT_TRUE(plan.is_ok());
    return plan.value();
}

std::vector<std::string> describe(const DiffPlan& plan) {
    std::vector<std::string> out;
    for (const auto& op : plan.operations) {
        out.push_back(std::string(to_string(op.kind)) + " " + op.path);
    }
    return out;
}

} // namespace

TEST(DiffPlannerTest, MirrorCopiesUpdatesAndDeletesInOrder) {
    const std::vector<FileEntry> source{
        dir("docs"), file("docs/a.txt", 10), file("docs/b.txt", 20), file("readme.md", 5)};
    const std::vector<FileEntry> target{
        dir("docs"), file("docs/b.txt", 21), file("readme.md", 5),
        dir("old"), file("old/x.txt", 1)};

    const auto plan = plan_for(SyncMode::Mirror, source, target);
    EXPECT_EQ(describe(plan), (std::vector<std::string>{
        "copy docs/a.txt", "update docs/b.txt", "skip readme.md", "delete old/x.txt", "delete old"}));
    EXPECT_EQ(plan.count(OperationKind::Delete), 2u);
    EXPECT_EQ(plan.planned_bytes(), 30u);
    EXPECT_FALSE(plan.converged());
}

TEST(DiffPlannerTest, IncrementalAndAddOnlyNeverDelete) {
    const std::vector<FileEntry> source{file("a.txt", 10)};
    const std::vector<FileEntry> target{file("a.txt", 12), file("extra.txt", 3)};

    const auto incremental = plan_for(SyncMode::Incremental, source, target);
    EXPECT_EQ(incremental.count(OperationKind::Delete), 0u);
    EXPECT_EQ(incremental.count(OperationKind::Update), 1u);

    const auto add_only = plan_for(SyncMode::AddOnly, source, target);
    EXPECT_EQ(add_only.count(OperationKind::Delete), 0u);
    EXPECT_EQ(add_only.count(OperationKind::Update), 0u);
    EXPECT_TRUE(add_only.converged());
}

TEST(DiffPlannerTest, SmallClockSkewIsTolerated) {
    const std::vector<FileEntry> source{file("a.txt", 10, kBase + std::chrono::seconds(1))};
    const std::vector<FileEntry> target{file("a.txt", 10, kBase)};
    EXPECT_TRUE(plan_for(SyncMode::Mirror, source, target).converged());

    const std::vector<FileEntry> newer{file("a.txt", 10, kBase + std::chrono::seconds(5))};
    EXPECT_FALSE(plan_for(SyncMode::Mirror, newer, target).converged());
    EXPECT_TRUE(plan_for(SyncMode::Mirror, newer, target, CompareMethod::Size).converged());
}

TEST(DiffPlannerTest, ChecksumComparisonUsesDigests) {
    auto src = file("a.bin", 10);
    auto tgt = file("a.bin", 10);
    src.checksum = "aaaa";
    tgt.checksum = "bbbb";
    EXPECT_EQ(plan_for(SyncMode::Mirror, {src}, {tgt}, CompareMethod::Checksum).count(OperationKind::Update), 1u);

    tgt.checksum = "aaaa";
    tgt.modified = kBase + std::chrono::hours(1);
    EXPECT_TRUE(plan_for(SyncMode::Mirror, {src}, {tgt}, CompareMethod::Checksum).converged());
}

TEST(DiffPlannerTest, SpecialFilesAndTypeClashesAreWarnings) {
    const std::vector<FileEntry> source{special("link"), file("clash", 4)};
    const std::vector<FileEntry> target{dir("clash"), special("target-only-link")};

    const auto plan = plan_for(SyncMode::Mirror, source, target);
    ASSERT_EQ(plan.operations.size(), 2u);
    for (const auto& op : plan.operations) {
        EXPECT_EQ(op.kind, OperationKind::Skip);
        EXPECT_TRUE(op.warning);
    }
    EXPECT_EQ(plan.operations[0].reason, "type mismatch");
    EXPECT_EQ(plan.operations[1].reason, "special file");
}

TEST(DiffPlannerTest, MirrorConvergesOnceApplied) {
    const std::vector<FileEntry> source{dir("a"), file("a/one", 1), file("a/two", 2), file("three", 3)};

    const auto first = plan_for(SyncMode::Mirror, source, {});
    EXPECT_EQ(first.count(OperationKind::Copy), 4u);

    const auto second = plan_for(SyncMode::Mirror, source, source);
    EXPECT_TRUE(second.converged());
    EXPECT_EQ(second.count(OperationKind::Skip), 3u);
}

TEST(DiffPlannerTest, PartialFilesAreInvisible) {
    const std::vector<FileEntry> source{file("big.iso", 100)};
    const std::vector<FileEntry> target{file("big.iso.tsync-part", 40)};

    const auto plan = plan_for(SyncMode::Mirror, source, target);
    EXPECT_EQ(describe(plan), (std::vector<std::string>{"copy big.iso"}));
}

TEST(DiffPlannerTest, FilteredEntriesAreNeitherCopiedNorDeleted) {
    PlanOptions options;
    options.mode = SyncMode::Mirror;
    options.filters.exclude = {"*.log"};

    const std::vector<FileEntry> source{file("app.log", 10), file("app.cfg", 10)};
    const std::vector<FileEntry> target{file("old.log", 10)};
    auto plan = DiffPlanner(options).plan(source, target, kBase);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(describe(plan.value()), (std::vector<std::string>{"copy app.cfg"}));
}

TEST(DiffPlannerTest, InvalidFilterIsAPlanningError) {
    PlanOptions options;
    options.filters.include = {"[unterminated"};
    auto plan = DiffPlanner(options).plan({}, {}, kBase);
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().kind, tsync::ErrorKind::Planning);
}

TEST(DiffPlannerTest, MirrorKeepsTargetFilesWhoseSourceIsFilteredOut) {
    PlanOptions options;
    options.mode = SyncMode::Mirror;
    options.filters.min_size = 100;

    const std::vector<FileEntry> source{file("a.bin", 50), file("big.bin", 500)};
    const std::vector<FileEntry> target{file("a.bin", 200), file("big.bin", 500)};
    auto plan = DiffPlanner(options).plan(source, target, kBase);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(describe(plan.value()), (std::vector<std::string>{"skip big.bin"}));
}

TEST(DiffPlannerTest, MirrorKeepsDirectoriesHoldingExcludedFiles) {
    PlanOptions options;
    options.mode = SyncMode::Mirror;
    options.filters.exclude = {"*.bak"};

    const std::vector<FileEntry> source{file("readme.md", 5)};
    const std::vector<FileEntry> target{
        file("readme.md", 5), dir("logs"), dir("logs/2024"), file("logs/2024/keep.bak", 3),
        file("logs/2024/today.txt", 3), dir("tmp"), file("tmp/x", 1)};
    auto plan = DiffPlanner(options).plan(source, target, kBase);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(describe(plan.value()), (std::vector<std::string>{
        "skip readme.md", "delete tmp/x", "delete tmp", "delete logs/2024/today.txt"}));
}

TEST(DiffPlannerTest, SizeAndTimeBoundsApplyToSourceOnly) {
    PlanOptions options;
    options.mode = SyncMode::Mirror;
    options.filters.window = TimeWindow::Custom;
    options.filters.modified_after = kBase - std::chrono::hours(1);

    // The target copy is older than the window but the source one is not
    const std::vector<FileEntry> source{file("report.csv", 10)};
    const std::vector<FileEntry> target{file("report.csv", 8, kBase - std::chrono::hours(48))};
    auto plan = DiffPlanner(options).plan(source, target, kBase);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(describe(plan.value()), (std::vector<std::string>{"update report.csv"}));
}
