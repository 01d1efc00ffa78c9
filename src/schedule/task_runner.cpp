#include "tsync/schedule/task_runner.hpp"

#include "tsync/schedule/output_parser.hpp"
#include "tsync/sync/engine.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>
#include <variant>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tsync::schedule {

namespace fs = std::filesystem;

namespace {

/// Owns one pipe end and closes it on scope exit.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

bool make_pipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end = Fd(fds[0]);
    write_end = Fd(fds[1]);
    return true;
}

std::string resolve_working_dir(const std::string& requested) {
    std::error_code ec;
    if (!requested.empty() && fs::is_directory(requested, ec)) {
        return fs::absolute(requested, ec).string();
    }
    if (!requested.empty()) {
        spdlog::warn("Working directory {} does not exist, using the current directory", requested);
    }
    return fs::current_path(ec).string();
}

/// Drain whatever is readable on `fd` into `sink`; false at end of stream.
bool drain(int fd, std::string& sink) {
    std::array<char, 8192> buffer{};
    for (;;) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

ExecutionResult failed_to_start(ExecutionResult result, const std::string& why) {
    result.finished = Clock::now();
    result.status = RunStatus::Failed;
    result.exit_code = -1;
    result.error_output = why;
    result.error = why;
    spdlog::error("Command could not be started: {}", why);
    return result;
}

} // namespace

ExecutionResult CommandRunner::execute(const CommandTask& task, const CancellationToken& cancel) const {
    ExecutionResult result;
    result.type = TaskType::Command;
    result.started = Clock::now();

    if (task.command.empty()) {
        return failed_to_start(std::move(result), "empty command");
    }

    const std::string working_dir = resolve_working_dir(task.working_dir);

    Fd out_read, out_write, err_read, err_write;
    if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write)) {
        return failed_to_start(std::move(result), std::string("pipe: ") + std::strerror(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        return failed_to_start(std::move(result), std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: new process group, redirected output, then the shell.
        ::setpgid(0, 0);
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        if (::chdir(working_dir.c_str()) != 0) {
            ::_exit(127);
        }
        ::execl("/bin/sh", "sh", "-c", task.command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    out_write.reset();
    err_write.reset();
    ::fcntl(out_read.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_read.get(), F_SETFL, O_NONBLOCK);

    spdlog::debug("Started pid {}: {}", pid, task.command);

    const auto deadline = task.timeout ? std::optional<TimePoint>(result.started + *task.timeout) : std::nullopt;
    bool timed_out = false;
    bool cancelled = false;

    while (out_read.valid() || err_read.valid()) {
        if (deadline && Clock::now() >= *deadline) {
            timed_out = true;
            break;
        }
        if (cancel.is_cancelled()) {
            cancelled = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_read.valid()) {
            fds[count++] = pollfd{out_read.get(), POLLIN, 0};
        }
        if (err_read.valid()) {
            fds[count++] = pollfd{err_read.get(), POLLIN, 0};
        }
        const int ready = ::poll(fds.data(), count, static_cast<int>(kPollInterval.count()));
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("poll on pid {} failed: {}", pid, std::strerror(errno));
            break;
        }
        if (ready <= 0) {
            continue;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == out_read.get()) {
                if (!drain(out_read.get(), result.output)) {
                    out_read.reset();
                }
            } else if (!drain(err_read.get(), result.error_output)) {
                err_read.reset();
            }
        }
    }

    int status = 0;
    if (!timed_out && !cancelled) {
        // Output closed; the shell may still be running
        for (;;) {
            const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
            if (reaped == pid || (reaped < 0 && errno != EINTR)) {
                break;
            }
            if (deadline && Clock::now() >= *deadline) {
                timed_out = true;
                break;
            }
            if (cancel.is_cancelled()) {
                cancelled = true;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    if (timed_out || cancelled) {
        ::kill(-pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    // Pick up anything written before the group went away
    if (out_read.valid()) {
        drain(out_read.get(), result.output);
    }
    if (err_read.valid()) {
        drain(err_read.get(), result.error_output);
    }

    result.finished = Clock::now();
    if (timed_out) {
        result.exit_code = -1;
        result.error_output = "Execution timeout";
        result.error = "timed out after " + std::to_string(task.timeout->count()) + "s";
        result.status = RunStatus::Failed;
        spdlog::warn("Command timed out after {}s: {}", task.timeout->count(), task.command);
        return result;
    }
    if (cancelled) {
        result.exit_code = -1;
        result.error = "cancelled";
        result.status = RunStatus::Failed;
        return result;
    }

    result.exit_code = decode_status(status);
    result.status = result.exit_code == 0 ? RunStatus::Success : RunStatus::Failed;
    if (result.exit_code != 0) {
        result.error = "exit code " + std::to_string(result.exit_code);
    }
    return result;
}

ExecutionResult CommandRunner::run(const RunContext& context) {
    const auto& task = std::get<CommandTask>(context.job.payload);
    ExecutionResult result = execute(task, context.cancel);
    result.job_id = context.job.id;
    result.job_name = context.job.name;
    result.attempts = context.attempt;
    return result;
}

ExecutionResult SyncRunner::run(const RunContext& context) {
    const auto& task = std::get<SyncTask>(context.job.payload);

    ExecutionResult result;
    result.job_id = context.job.id;
    result.job_name = context.job.name;
    result.type = TaskType::Sync;
    result.attempts = context.attempt;

    sync::SyncResult outcome = engine_.run(context.job.id, task, context.cancel);
    result.started = outcome.started;
    result.finished = outcome.finished;
    result.output = outcome.message;

    switch (outcome.outcome) {
        case sync::SyncOutcome::Success:
            result.status = RunStatus::Success;
            result.exit_code = 0;
            break;
        case sync::SyncOutcome::CompletedWithErrors:
            result.status = RunStatus::CompletedWithErrors;
            result.exit_code = 1;
            result.error = std::to_string(outcome.failed) + " file(s) failed";
            break;
        case sync::SyncOutcome::ConnectionFailed:
        case sync::SyncOutcome::PlanningFailed:
        case sync::SyncOutcome::Cancelled:
            result.status = RunStatus::Failed;
            result.exit_code = 1;
            result.error = outcome.error ? outcome.error->describe() : outcome.message;
            break;
    }

    for (const auto& file : outcome.files) {
        if (file.outcome == sync::FileOutcome::Failed) {
            result.error_output += file.path + ": " + file.message + "\n";
        }
    }
    result.sync = std::move(outcome);
    return result;
}

ExecutionResult JobRunner::run(const RunContext& context) {
    ExecutionResult result = std::visit(
        [&](const auto& task) {
            using T = std::decay_t<decltype(task)>;
            if constexpr (std::is_same_v<T, CommandTask>) {
                return command_runner_.run(context);
            } else {
                return sync_runner_.run(context);
            }
        },
        context.job.payload);
    result.custom_vars = extract_variables(result.output, result.error_output, context.job.extractors);
    return result;
}

} // namespace tsync::schedule
