#include <runbox/subprocess/run_result.hpp>

#include <optional>

namespace runbox {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal) {
    return {Kind::Killed, signal};
}

RunResult RunResult::make_timed_out(int signal) {
    return {Kind::TimedOut, signal};
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

std::optional<int> RunResult::get_exit_code() const {
    if (kind_ != Kind::Exited) {
        return std::nullopt;
    }

    return code_;
}

} // namespace runbox
