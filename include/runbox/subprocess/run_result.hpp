#pragma once

#include <optional>

namespace runbox {

/// How a supervised child process reached its terminal state
class RunResult
{
public:
    enum class Kind {
        Exited,   ///< Returned from main / called exit; code is the exit status
        Killed,   ///< Terminated by a signal it did not handle; code is the signal number
        TimedOut, ///< Forcefully killed by us after its deadline; code is the signal we sent
    };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal);
    static RunResult make_timed_out(int signal);

    Kind get_kind() const;
    int get_code() const;

    /// The natural exit status, if there is one. Killed and timed out processes have none.
    std::optional<int> get_exit_code() const;

    bool timed_out() const { return kind_ == Kind::TimedOut; }

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace runbox
