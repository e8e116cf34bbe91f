#pragma once

#include <runbox/common/expected.hpp>
#include <runbox/sandbox/container_launcher.hpp>
#include <runbox/sandbox/execution_result.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/workspace/workspace.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace runbox {

/// The shared lifecycle of every execution attempt:
///   create workspace -> prepare (write sources, pick a launch strategy) -> supervise -> assemble -> destroy
///
/// The workspace is destroyed on every path out of ``run``, including validation and spawn failures.
/// Instances hold no per-attempt state, so concurrent calls to ``run`` are independent.
class Sandbox
{
public:
    using Prepare = std::function<Expected<LaunchStrategy, ExecutionError>(Workspace&)>;

    struct Options
    {
        std::string_view workspace_prefix;
        std::chrono::milliseconds timeout;
        std::size_t output_limit;

        /// Reported to callers for any failure that is not the request's fault
        std::string_view failure_message;
    };

    /// ``launcher`` may be null if no ContainerLaunch will ever be prepared
    Sandbox(std::filesystem::path scratch_root, std::shared_ptr<const ContainerLauncher> launcher);

    RunOutcome run(const Options& opts, const Prepare& prepare) const;

    const std::filesystem::path& get_scratch_root() const { return scratch_root_; }

private:
    std::filesystem::path scratch_root_;
    std::shared_ptr<const ContainerLauncher> launcher_;
};

} // namespace runbox
