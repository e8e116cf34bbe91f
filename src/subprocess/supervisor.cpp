#include <runbox/subprocess/supervisor.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/logging.hpp>
#include <runbox/subprocess/run_result.hpp>
#include <runbox/subprocess/subprocess.hpp>

#include <chrono>
#include <csignal>
#include <optional>
#include <tuple>
#include <utility>

namespace runbox {

Result<TerminalStatus> Supervisor::run(const LaunchSpec& spec, std::chrono::milliseconds timeout,
                                       const KillHook& on_kill) {
    using Clock = Subprocess::Clock;

    Subprocess proc{spec.exec, spec.args, spec.working_dir, spec.output_limit};

    const auto start_time = Clock::now();
    const auto deadline = start_time + timeout;

    TRY(proc.start());

    std::optional<RunResult> run_result;

    // Normal path: both streams hit EOF, then the child exits, all before the deadline
    if (TRY(proc.drain_until(deadline))) {
        auto exit_res = proc.wait_for_exit(deadline);

        if (exit_res) {
            run_result = *exit_res;
        } else if (exit_res.error() != ErrorKind::TimedOut) {
            return exit_res.error();
        }
    }

    if (!run_result) {
        const bool over_limit = proc.output_limit_reached();

        if (over_limit) {
            LOG_INFO("{:?} (pid {}) wrote more than {} bytes to one stream; killing", spec.exec, proc.get_pid(),
                     spec.output_limit);
        } else {
            LOG_INFO("{:?} (pid {}) exceeded its {} deadline; killing", spec.exec, proc.get_pid(), timeout);
        }

        TRY(proc.kill());

        if (on_kill) {
            on_kill();
        }

        // Keep what the child managed to write before it died
        std::ignore = proc.drain_until(Clock::now() + POST_KILL_DRAIN_PERIOD);
        proc.close_pipes();

        RunResult killed = TRY(proc.wait_for_exit());

        run_result = over_limit ? killed : RunResult::make_timed_out(killed.get_code());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time);

    LOG_DEBUG("{:?} finished after {} (exit code {}, timed out: {}, output truncated: {})", spec.exec, elapsed,
              run_result->get_exit_code().value_or(-1), run_result->timed_out(), proc.output_limit_reached());

    return TerminalStatus{
        .run_result = *run_result,
        .stdout_text = proc.get_stdout(),
        .stderr_text = proc.get_stderr(),
        .elapsed = elapsed,
        .output_truncated = proc.output_limit_reached(),
    };
}

} // namespace runbox
