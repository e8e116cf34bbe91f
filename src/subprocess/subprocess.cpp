#include <runbox/subprocess/subprocess.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/common/linux.hpp>
#include <runbox/common/which.hpp>
#include <runbox/logging.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <algorithm>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runbox {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;
constexpr auto WAIT_POLL_PERIOD = std::chrono::milliseconds{5};

/// Exit status of a child that failed between fork and exec (same as a shell's "command not found")
constexpr int CHILD_SETUP_FAILURE = 127;

/// Everything the child needs after fork(2), prepared beforehand.
/// Only async-signal-safe calls may be made in the child, so no allocation happens there.
struct ChildSetup
{
    const char* exec;
    char* const* argv;
    const char* working_dir; // nullptr = inherit
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int status_fd; // close-on-exec; receives errno if anything before exec fails
};

[[noreturn]] void report_child_failure(int status_fd, int err) {
    std::ignore = ::write(status_fd, &err, sizeof(err));
    ::_exit(CHILD_SETUP_FAILURE);
}

[[noreturn]] void exec_child(const ChildSetup& setup) {
    if (::setpgid(0, 0) == -1) {
        report_child_failure(setup.status_fd, errno);
    }

    if (::dup2(setup.stdin_fd, STDIN_FILENO) == -1 || ::dup2(setup.stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(setup.stderr_fd, STDERR_FILENO) == -1) {
        report_child_failure(setup.status_fd, errno);
    }

    if (setup.working_dir != nullptr && ::chdir(setup.working_dir) == -1) {
        report_child_failure(setup.status_fd, errno);
    }

    // Ignored signals and the signal mask survive exec; the child gets a clean slate
    ::signal(SIGPIPE, SIG_DFL);
    sigset_t empty_set;
    ::sigemptyset(&empty_set);
    ::sigprocmask(SIG_SETMASK, &empty_set, nullptr);

    ::execv(setup.exec, setup.argv);

    report_child_failure(setup.status_fd, errno);
}

void close_if_open(int& fd) {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path working_dir,
                       std::size_t output_limit)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , working_dir_{std::move(working_dir)}
    , output_limit_{output_limit} {}

Subprocess::~Subprocess() {
    release();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , working_dir_{std::move(other.working_dir_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , stdout_fd_{std::exchange(other.stdout_fd_, -1)}
    , stderr_fd_{std::exchange(other.stderr_fd_, -1)}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stderr_buffer_{std::exchange(other.stderr_buffer_, {})}
    , output_limit_{other.output_limit_}
    , output_limit_reached_{std::exchange(other.output_limit_reached_, false)}
    , run_result_{std::exchange(other.run_result_, std::nullopt)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    release();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    working_dir_ = std::move(rhs.working_dir_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    stdout_fd_ = std::exchange(rhs.stdout_fd_, -1);
    stderr_fd_ = std::exchange(rhs.stderr_fd_, -1);
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stderr_buffer_ = std::exchange(rhs.stderr_buffer_, {});
    output_limit_ = rhs.output_limit_;
    output_limit_reached_ = std::exchange(rhs.output_limit_reached_, false);
    run_result_ = std::exchange(rhs.run_result_, std::nullopt);

    return *this;
}

void Subprocess::release() noexcept {
    close_pipes();

    // if child_pid_ == 0, then the process was never started, or the object was moved from
    if (is_alive()) {
        LOG_DEBUG("Subprocess {} still alive on release; killing", child_pid_);
        std::ignore = kill();
        std::ignore = wait_for_exit();
    }
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess::start called twice");

    std::optional<std::string> resolved = which(exec_);

    if (!resolved) {
        LOG_WARN("Cannot spawn {:?}: executable not found", exec_);
        return ErrorKind::SpawnFailure;
    }

    // argv[0] is the name as given, like a shell would do
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args_.size() + 1);
    argv_storage.push_back(exec_);
    argv_storage.insert(argv_storage.end(), args_.begin(), args_.end());

    // Reason: execv requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> argv(argv_storage.size() + 1, nullptr);
    for (std::size_t i = 0; i < argv_storage.size(); ++i) {
        argv[i] = const_cast<char*>(argv_storage[i].c_str());
    }
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    const std::string working_dir = working_dir_.string();

    int devnull = -1;
    linux::Pipe out_pipe{-1, -1};
    linux::Pipe err_pipe{-1, -1};
    linux::Pipe status_pipe{-1, -1};

    // Whatever was not handed over to *this by the end is closed here, on every path
    auto close_leftover_fds = gsl::finally([&] {
        close_if_open(devnull);
        close_if_open(out_pipe.read_fd);
        close_if_open(out_pipe.write_fd);
        close_if_open(err_pipe.read_fd);
        close_if_open(err_pipe.write_fd);
        close_if_open(status_pipe.read_fd);
        close_if_open(status_pipe.write_fd);
    });

    // O_CLOEXEC everywhere: children spawned concurrently by other threads must not inherit our pipe ends,
    // or we would never see EOF on them
    devnull = TRYE(linux::open("/dev/null", O_RDONLY | O_CLOEXEC), SpawnFailure);
    out_pipe = TRYE(linux::pipe2(O_CLOEXEC), SpawnFailure);
    err_pipe = TRYE(linux::pipe2(O_CLOEXEC), SpawnFailure);
    status_pipe = TRYE(linux::pipe2(O_CLOEXEC), SpawnFailure);

    const ChildSetup setup{
        .exec = resolved->c_str(),
        .argv = argv.data(),
        .working_dir = working_dir.empty() ? nullptr : working_dir.c_str(),
        .stdin_fd = devnull,
        .stdout_fd = out_pipe.write_fd,
        .stderr_fd = err_pipe.write_fd,
        .status_fd = status_pipe.write_fd,
    };

    linux::Fork fork_res = TRYE(linux::fork(), SpawnFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        exec_child(setup);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    // Racing with the child's own setpgid, so the group exists before we could ever need to kill it.
    // Fails with EACCES if the child already exec'd, at which point it has set the group itself
    std::ignore = linux::setpgid(child_pid_, child_pid_);

    // Close the pipe ends being used in the child proc
    close_if_open(devnull);
    close_if_open(out_pipe.write_fd);
    close_if_open(err_pipe.write_fd);
    close_if_open(status_pipe.write_fd);

    // EOF on the status pipe = exec succeeded (the write end was close-on-exec)
    int child_errno = 0;
    while (true) {
        auto status = linux::read(status_pipe.read_fd, sizeof(child_errno));

        if (!status && status.error() == std::errc::interrupted) {
            continue;
        }

        if (status && status->size() == sizeof(child_errno)) {
            std::memcpy(&child_errno, status->data(), sizeof(child_errno));
        }

        break;
    }

    if (child_errno != 0) {
        LOG_WARN("Failed to exec {:?} in {:?}: {}", *resolved, working_dir, get_err_msg(child_errno));
        std::ignore = wait_for_exit();
        return ErrorKind::SpawnFailure;
    }

    // Make reading from the output pipes non-blocking
    for (int read_fd : {out_pipe.read_fd, err_pipe.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(read_fd, F_GETFL), SyscallFailure);

        TRYE(linux::fcntl(read_fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
             SyscallFailure);
    }

    stdout_fd_ = std::exchange(out_pipe.read_fd, -1);
    stderr_fd_ = std::exchange(err_pipe.read_fd, -1);

    LOG_DEBUG("Spawned {:?} {} (pid {})", *resolved, args_, child_pid_);

    return {};
}

Result<bool> Subprocess::drain_until(Clock::time_point deadline) {
    using namespace std::chrono_literals;

    while (stdout_fd_ != -1 || stderr_fd_ != -1) {
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());

        if (remaining <= 0ms) {
            return false;
        }

        // poll(2) ignores negative fds, so an already closed stream simply drops out
        std::array<pollfd, 2> poll_fds{{
            {.fd = stdout_fd_, .events = POLLIN, .revents = 0},
            {.fd = stderr_fd_, .events = POLLIN, .revents = 0},
        }};

        auto poll_res = linux::poll(poll_fds, gsl::narrow_cast<int>(remaining.count()));

        if (!poll_res) {
            if (poll_res.error() == std::errc::interrupted) {
                continue;
            }

            LOG_WARN("Error polling output pipes of pid {}: '{}'", child_pid_, poll_res.error().message());
            return ErrorKind::SyscallFailure;
        }

        // Timeout occured; the loop condition re-checks the deadline
        if (*poll_res == 0) {
            continue;
        }

        // POLLHUP without POLLIN still needs a read to observe EOF
        if (poll_fds[0].revents != 0) {
            TRY(read_available(stdout_fd_, stdout_buffer_));
        }
        if (poll_fds[1].revents != 0) {
            TRY(read_available(stderr_fd_, stderr_buffer_));
        }

        if (output_limit_reached_) {
            return false;
        }
    }

    return true;
}

Result<void> Subprocess::read_available(int& fd, std::string& buffer) {
    while (fd != -1) {
        auto chunk = linux::read(fd, READ_CHUNK_SIZE);

        if (!chunk) {
            if (chunk.error() == std::errc::resource_unavailable_try_again) {
                return {};
            }
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }

            return ErrorKind::SyscallFailure;
        }

        // EOF: every writer (the child and anything it forked) is gone
        if (chunk->empty()) {
            close_if_open(fd);
            return {};
        }

        const std::size_t room = output_limit_ - std::min(output_limit_, buffer.size());

        if (chunk->size() > room) {
            buffer.append(*chunk, 0, room);

            if (!output_limit_reached_) {
                LOG_DEBUG("pid {} exceeded the output limit of {} bytes", child_pid_, output_limit_);
            }
            output_limit_reached_ = true;

            // A fast enough writer would otherwise keep us here past the deadline
            return {};
        }

        buffer += *chunk;
    }

    return {};
}

Result<RunResult> Subprocess::wait_for_exit(Clock::time_point deadline) {
    if (run_result_) {
        return *run_result_;
    }

    DEBUG_ASSERT(child_pid_ != 0, "wait_for_exit on a process that was never started");

    while (true) {
        auto waitid_res = linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED | WNOHANG);

        if (!waitid_res) {
            if (waitid_res.error() == std::errc::interrupted) {
                continue;
            }

            return ErrorKind::SyscallFailure;
        }

        // si_pid will only be 0 if waitid returned early from WNOHANG
        // see waitid(2)
        if (waitid_res->si_pid != 0) {
            return record_exit(*waitid_res);
        }

        if (Clock::now() >= deadline) {
            return ErrorKind::TimedOut;
        }

        std::this_thread::sleep_for(WAIT_POLL_PERIOD);
    }
}

Result<RunResult> Subprocess::wait_for_exit() {
    if (run_result_) {
        return *run_result_;
    }

    DEBUG_ASSERT(child_pid_ != 0, "wait_for_exit on a process that was never started");

    while (true) {
        auto waitid_res = linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED);

        if (!waitid_res) {
            if (waitid_res.error() == std::errc::interrupted) {
                continue;
            }

            return ErrorKind::SyscallFailure;
        }

        return record_exit(*waitid_res);
    }
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    // The negative pid addresses the process group, taking grandchildren down with it
    auto group_res = linux::kill(-child_pid_, SIGKILL);

    if (!group_res && group_res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    // Only possible if the group was never formed; the child itself still must go
    if (!group_res) {
        auto pid_res = linux::kill(child_pid_, SIGKILL);

        if (!pid_res && pid_res.error() != std::errc::no_such_process) {
            return ErrorKind::SyscallFailure;
        }
    }

    LOG_DEBUG("Sent SIGKILL to process group {}", child_pid_);

    return {};
}

void Subprocess::close_pipes() {
    close_if_open(stdout_fd_);
    close_if_open(stderr_fd_);
}

RunResult Subprocess::record_exit(const siginfo_t& info) {
    RunResult result = info.si_code == CLD_EXITED ? RunResult::make_exited(info.si_status)
                                                  : RunResult::make_killed(info.si_status);

    LOG_DEBUG("pid {} finished: si_code={}, si_status={}", child_pid_, info.si_code, info.si_status);

    run_result_ = result;

    return result;
}

} // namespace runbox
