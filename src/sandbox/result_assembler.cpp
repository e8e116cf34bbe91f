#include <runbox/sandbox/execution_result.hpp>

#include <runbox/subprocess/run_result.hpp>
#include <runbox/subprocess/supervisor.hpp>

#include <libassert/assert.hpp>

#include <optional>
#include <string>
#include <utility>

namespace runbox {

ExecutionResult assemble_result(TerminalStatus status, std::optional<std::string> image_used) noexcept {
    const RunResult& run_result = status.run_result;

    ExecutionResult result{
        .stdout_text = std::move(status.stdout_text),
        .stderr_text = std::move(status.stderr_text),
        .exit_code = run_result.get_exit_code(),
        .timed_out = run_result.timed_out(),
        .image_used = std::move(image_used),
        .output_truncated = status.output_truncated,
    };

    DEBUG_ASSERT(!(result.timed_out && result.exit_code.has_value()), "a timed out run cannot have an exit code");

    // the timeout flag is authoritative
    if (result.timed_out) {
        result.exit_code.reset();
    }

    return result;
}

} // namespace runbox
