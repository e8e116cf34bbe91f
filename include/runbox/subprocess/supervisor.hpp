#pragma once

#include <runbox/common/error_types.hpp>
#include <runbox/subprocess/run_result.hpp>

#include <runbox/subprocess/subprocess.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace runbox {

/// What to spawn: an executable (resolved on PATH), its arguments, and where to run it
struct LaunchSpec
{
    std::string exec;
    std::vector<std::string> args;
    std::filesystem::path working_dir;

    /// Bytes kept per output stream; writing more gets the child killed
    std::size_t output_limit = Subprocess::NO_OUTPUT_LIMIT;
};

/// Everything the supervisor observed about one child, once it is gone and its pipes are drained
struct TerminalStatus
{
    RunResult run_result;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds elapsed;

    /// The child was killed for exceeding ``LaunchSpec::output_limit``; the captured output is cut at the limit
    bool output_truncated = false;
};

/// Runs a child under a wall-clock deadline.
///
/// Both output streams are drained from the moment of spawn, so a chatty child can never block on a
/// full pipe. If the deadline passes first, or the child writes more than its output limit, the
/// child's process group gets a single SIGKILL (no grace period), ``on_kill`` is invoked once, and
/// whatever output was captured is kept.
///
/// Exactly one process is spawned per call; a failed spawn is reported as SpawnFailure, never retried.
class Supervisor
{
public:
    using KillHook = std::function<void()>;

    /// Upper bound on how long output is still collected after a forced kill. Only matters if the child
    /// handed its pipes to a process outside its group.
    static constexpr std::chrono::milliseconds POST_KILL_DRAIN_PERIOD{2000};

    static Result<TerminalStatus> run(const LaunchSpec& spec, std::chrono::milliseconds timeout,
                                      const KillHook& on_kill = {});
};

} // namespace runbox
