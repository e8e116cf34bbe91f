#include <runbox/sandbox/direct_runner.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/logging.hpp>
#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/workspace/workspace.hpp>

#include <filesystem>
#include <string>
#include <utility>

namespace runbox {

DirectRunner::DirectRunner(std::filesystem::path scratch_root, DirectRunnerConfig config)
    : config_{std::move(config)}
    , sandbox_{std::move(scratch_root), nullptr} {}

RunOutcome DirectRunner::run(const SingleFileRequest& request) const {
    if (request.code.empty()) {
        return ExecutionError{.kind = ErrorKind::InvalidInput, .message = CODE_REQUIRED_MSG};
    }

    const bool is_python = request.language == Language::Python;
    const std::string& interpreter = is_python ? config_.python_interpreter : config_.javascript_interpreter;
    const std::string& source_file = is_python ? config_.python_file : config_.javascript_file;

    LOG_DEBUG("Direct run: {} bytes of {} with {:?}", request.code.size(), to_string(request.language), interpreter);

    const Sandbox::Options opts{
        .workspace_prefix = config_.workspace_prefix,
        .timeout = config_.timeout,
        .output_limit = config_.output_limit,
        .failure_message = FAILURE_MSG,
    };

    return sandbox_.run(opts, [&](Workspace& workspace) -> Expected<LaunchStrategy, ExecutionError> {
        if (auto res = workspace.write(source_file, request.code); !res) {
            return ExecutionError{.kind = res.error(), .message = FAILURE_MSG};
        }

        return DirectLaunch{.interpreter = interpreter, .source_file = source_file};
    });
}

} // namespace runbox
