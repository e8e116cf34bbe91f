#pragma once

#include <runbox/sandbox/container_launcher.hpp>
#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/execution_result.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/sandbox/runner_config.hpp>
#include <runbox/sandbox/sandbox.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace runbox {

/// Materializes a multi-file project into a workspace and runs it in a disposable container
///
/// The container has no network, capped memory and CPU, and sees only the workspace (mounted at
/// the policy's mount path). On timeout both the runtime client and the container are killed.
class ProjectRunner
{
public:
    /// Error messages that reach callers
    static constexpr const char* FILES_REQUIRED_MSG = "files[] required";
    static constexpr const char* FAILURE_MSG = "Docker execution failed";

    ProjectRunner(std::filesystem::path scratch_root, ProjectRunnerConfig config,
                  std::shared_ptr<const ContainerLauncher> launcher);

    /// Uses a DockerLauncher built from ``config.container``
    ProjectRunner(std::filesystem::path scratch_root, ProjectRunnerConfig config);

    RunOutcome run(const ProjectRequest& request) const;

    /// The image and default command for ``language`` (case-insensitive, empty meaning node)
    ContainerLaunch select_launch(std::string_view language) const;

    const ProjectRunnerConfig& get_config() const { return config_; }

private:
    ProjectRunnerConfig config_;
    Sandbox sandbox_;
};

} // namespace runbox
