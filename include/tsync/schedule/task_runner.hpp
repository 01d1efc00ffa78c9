#pragma once

#include "tsync/core/cancellation.hpp"
#include "tsync/schedule/job.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace tsync::sync {
class SyncEngine;
}

namespace tsync::schedule {

struct RunContext {
    const Job& job;
    CancellationToken cancel;
    std::size_t attempt = 1;
};

/// Executes one attempt of a job and reports how it went.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    /**
     * Failures are reported in the result, never thrown. The coordinator
     * still treats an escaping std::exception as an unexpected termination.
     */
    virtual ExecutionResult run(const RunContext& context) = 0;
};

/**
 * @brief Runs a CommandTask through /bin/sh -c
 *
 * The child gets its own process group so a timeout or cancellation can
 * kill everything the shell started. stdout and stderr are captured
 * separately. Exit code is the shell's status, 128 + N after signal N,
 * or -1 when the command timed out or could not be started.
 */
class CommandRunner : public TaskRunner {
public:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    ExecutionResult run(const RunContext& context) override;

    ExecutionResult execute(const CommandTask& task, const CancellationToken& cancel) const;
};

/// Runs a SyncTask through the engine; the job id keys its checkpoints.
class SyncRunner : public TaskRunner {
public:
    explicit SyncRunner(sync::SyncEngine& engine) : engine_(engine) {}

    ExecutionResult run(const RunContext& context) override;

private:
    sync::SyncEngine& engine_;
};

/**
 * @brief Dispatches on the job's payload and extracts custom variables
 *
 * This is the one runner the coordinator talks to.
 */
class JobRunner : public TaskRunner {
public:
    explicit JobRunner(sync::SyncEngine& engine) : sync_runner_(engine) {}

    ExecutionResult run(const RunContext& context) override;

private:
    CommandRunner command_runner_;
    SyncRunner sync_runner_;
};

} // namespace tsync::schedule
