#pragma once

#include <runbox/common/class_traits.hpp>
#include <runbox/common/error_types.hpp>
#include <runbox/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/types.h>

namespace runbox {

/// A child process with separately captured stdout and stderr.
///
/// The child is exec'd directly (no shell) as the leader of a new process group, so that
/// ``kill()`` also reaches anything it forked. stdin is connected to /dev/null.
class Subprocess : NonCopyable
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t NO_OUTPUT_LIMIT = std::numeric_limits<std::size_t>::max();

    /// Prepares (but does not start) ``exec`` with ``args`` in ``working_dir``.
    /// ``exec`` is looked up on PATH if it contains no '/'. ENV variables are inherited.
    /// At most ``output_limit`` bytes are kept per stream; the rest is read and discarded.
    explicit Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path working_dir = {},
                        std::size_t output_limit = NO_OUTPUT_LIMIT);

    /// Kills and reaps the child if it is still around
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Forks and execs the child.
    /// Fails with SpawnFailure if the executable could not be found or exec'd
    Result<void> start();

    /// Reads both output pipes until they are closed by the child (returns true),
    /// or until ``deadline`` passes or either stream exceeds the output limit (returns false)
    Result<bool> drain_until(Clock::time_point deadline);

    /// Blocks until exit or ``deadline``; TimedOut error on deadline
    Result<RunResult> wait_for_exit(Clock::time_point deadline);

    /// Blocks until exit
    Result<RunResult> wait_for_exit();

    /// SIGKILL the child's entire process group
    Result<void> kill();

    /// Close our ends of the output pipes. Any unread data is discarded
    void close_pipes();

    /// Whether the child has been started and not yet reaped
    bool is_alive() const { return child_pid_ != 0 && !run_result_.has_value(); }

    pid_t get_pid() const { return child_pid_; }

    const std::string& get_stdout() const { return stdout_buffer_; }

    const std::string& get_stderr() const { return stderr_buffer_; }

    /// Whether the child wrote more than the output limit to either stream
    bool output_limit_reached() const { return output_limit_reached_; }

    const std::optional<RunResult>& get_run_result() const { return run_result_; }

private:
    /// Closes pipes, then kills and reaps a child that is still running
    void release() noexcept;

    /// Reads everything currently available on ``fd`` into ``buffer``, stopping early once the output limit is hit.
    /// Closes ``fd`` (and sets it to -1) on EOF
    Result<void> read_available(int& fd, std::string& buffer);

    /// Converts a waitid(2) result into a RunResult and records it
    RunResult record_exit(const siginfo_t& info);

    std::string exec_;
    std::vector<std::string> args_;
    std::filesystem::path working_dir_;

    pid_t child_pid_{};

    /// read ends of the child's stdout and stderr pipes
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::size_t output_limit_;
    bool output_limit_reached_{false};

    std::optional<RunResult> run_result_;
};

} // namespace runbox
