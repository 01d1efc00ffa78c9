#include "tsync/schedule/task_runner.hpp"
#include "tsync/sync/checkpoint_store.hpp"
#include "tsync/sync/engine.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace tsync::schedule;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("tsync_runner_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

CommandTask command(const std::string& text, std::optional<std::chrono::seconds> timeout = std::nullopt) {
    CommandTask task;
    task.command = text;
    task.timeout = timeout;
    return task;
}

} // namespace

TEST(CommandRunnerTest, CapturesStdoutAndStderrSeparately) {
    CommandRunner runner;
    const auto result = runner.execute(command("echo hello; echo oops >&2"), {});
    EXPECT_EQ(result.status, RunStatus::Success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_EQ(result.error_output, "oops\n");
    EXPECT_TRUE(result.error.empty());
    EXPECT_GE(result.finished, result.started);
}

TEST(CommandRunnerTest, NonZeroExitIsFailure) {
    CommandRunner runner;
    const auto result = runner.execute(command("exit 3"), {});
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.error, "exit code 3");
}

TEST(CommandRunnerTest, SignalledCommandReports128PlusSignal) {
    CommandRunner runner;
    const auto result = runner.execute(command("kill -TERM $$"), {});
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.exit_code, 128 + 15);
}

TEST(CommandRunnerTest, TimeoutKillsTheWholeGroup) {
    CommandRunner runner;
    const auto begin = std::chrono::steady_clock::now();
    const auto result = runner.execute(command("sleep 30 & sleep 30; echo never", 1s), {});
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.error_output, "Execution timeout");
    EXPECT_LT(elapsed, 10s);
}

TEST(CommandRunnerTest, TimeoutAppliesAfterOutputIsClosed) {
    CommandRunner runner;
    const auto result = runner.execute(command("exec >/dev/null 2>&1; sleep 30", 1s), {});
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.error_output, "Execution timeout");
}

TEST(CommandRunnerTest, CancellationStopsTheCommand) {
    CommandRunner runner;
    tsync::CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(200ms);
        cancel.cancel();
    });
    const auto result = runner.execute(command("sleep 30"), cancel);
    canceller.join();

    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.error, "cancelled");
}

TEST(CommandRunnerTest, RunsInWorkingDirectory) {
    const auto dir = create_temp_dir();
    CommandRunner runner;
    auto task = command("pwd");
    task.working_dir = dir.string();
    const auto result = runner.execute(task, {});
    EXPECT_EQ(result.output, fs::canonical(dir).string() + "\n");

    // Missing directory falls back to the current one
    task.working_dir = (dir / "missing").string();
    EXPECT_EQ(runner.execute(task, {}).status, RunStatus::Success);

    fs::remove_all(dir);
}

TEST(CommandRunnerTest, EmptyCommandFailsToStart) {
    CommandRunner runner;
    const auto result = runner.execute(command(""), {});
    EXPECT_EQ(result.status, RunStatus::Failed);
    EXPECT_EQ(result.exit_code, -1);
}

TEST(JobRunnerTest, ExtractsVariablesFromCommandOutput) {
    Job job;
    job.id = "release";
    job.name = "Release build";
    job.trigger = "0 3 * * *";
    job.payload = command("echo VERSION=1.2.3; echo 'built 12 targets'");
    OutputExtractor targets;
    targets.name = "TARGETS";
    targets.expression = R"(built (\d+) targets)";
    job.extractors.push_back(targets);

    tsync::sync::CheckpointStore checkpoints(fs::temp_directory_path() / "tsync_runner_test_unused");
    tsync::sync::SyncEngine engine(checkpoints);
    JobRunner runner(engine);

    const auto result = runner.run(RunContext{job, {}, 2});
    EXPECT_EQ(result.job_id, "release");
    EXPECT_EQ(result.job_name, "Release build");
    EXPECT_EQ(result.attempts, 2u);
    EXPECT_EQ(result.custom_vars.at("VERSION"), "1.2.3");
    EXPECT_EQ(result.custom_vars.at("TARGETS"), "12");
}
