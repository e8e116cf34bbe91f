#pragma once

#include <runbox/common/error_types.hpp>
#include <runbox/common/expected.hpp>
#include <runbox/subprocess/supervisor.hpp>

#include <optional>
#include <string>

namespace runbox {

/// The immutable outcome of one execution attempt
struct ExecutionResult
{
    std::string stdout_text;
    std::string stderr_text;

    /// Absent when the process did not exit on its own (killed by a signal or on timeout)
    std::optional<int> exit_code;
    bool timed_out = false;

    /// Only set by the containerized project runner
    std::optional<std::string> image_used;

    /// The process was killed for writing more than its output limit
    bool output_truncated = false;
};

/// Why an attempt produced no ExecutionResult
struct ExecutionError
{
    ErrorKind kind;
    std::string message;
};

using RunOutcome = Expected<ExecutionResult, ExecutionError>;

/// Folds the supervisor's view of a finished child into an ExecutionResult.
/// A timed out run never carries an exit code.
ExecutionResult assemble_result(TerminalStatus status, std::optional<std::string> image_used = std::nullopt) noexcept;

} // namespace runbox
