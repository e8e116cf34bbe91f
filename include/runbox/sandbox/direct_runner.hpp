#pragma once

#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/execution_result.hpp>
#include <runbox/sandbox/runner_config.hpp>
#include <runbox/sandbox/sandbox.hpp>

#include <filesystem>

namespace runbox {

/// Runs a single source file with a bare interpreter on the host, bounded only by a wall-clock timeout
class DirectRunner
{
public:
    DirectRunner(std::filesystem::path scratch_root, DirectRunnerConfig config);

    /// Error messages that reach callers
    static constexpr const char* CODE_REQUIRED_MSG = "Code required";
    static constexpr const char* FAILURE_MSG = "Failed to execute";

    RunOutcome run(const SingleFileRequest& request) const;

    const DirectRunnerConfig& get_config() const { return config_; }

private:
    DirectRunnerConfig config_;
    Sandbox sandbox_;
};

} // namespace runbox
