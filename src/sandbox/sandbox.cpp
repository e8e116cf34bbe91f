#include <runbox/sandbox/sandbox.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/common/overloaded.hpp>
#include <runbox/logging.hpp>
#include <runbox/sandbox/container_launcher.hpp>
#include <runbox/sandbox/execution_result.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/subprocess/supervisor.hpp>
#include <runbox/workspace/workspace.hpp>

#include <libassert/assert.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace runbox {

namespace {

ExecutionError make_failure(ErrorKind kind, std::string_view message) {
    // Low-level failures surface as whichever kind the caller can act on
    if (kind == ErrorKind::SyscallFailure || kind == ErrorKind::UnknownError) {
        kind = ErrorKind::ResourceFailure;
    }

    return ExecutionError{.kind = kind, .message = std::string{message}};
}

} // namespace

Sandbox::Sandbox(std::filesystem::path scratch_root, std::shared_ptr<const ContainerLauncher> launcher)
    : scratch_root_{std::move(scratch_root)}
    , launcher_{std::move(launcher)} {}

RunOutcome Sandbox::run(const Options& opts, const Prepare& prepare) const {
    auto workspace_res = Workspace::create(scratch_root_, opts.workspace_prefix);

    if (!workspace_res) {
        return make_failure(workspace_res.error(), opts.failure_message);
    }

    Workspace workspace = std::move(workspace_res.value());

    auto strategy_res = prepare(workspace);

    if (!strategy_res) {
        LOG_DEBUG("Preparing {:?} failed: {}", workspace.get_name(), strategy_res.error().message);
        return strategy_res.error();
    }

    const LaunchStrategy& strategy = strategy_res.value();

    const ContainerLaunch* container = std::get_if<ContainerLaunch>(&strategy);

    LaunchSpec spec = std::visit(
        Overloaded{
            [&](const DirectLaunch& launch) {
                return LaunchSpec{.exec = launch.interpreter,
                                  .args = {launch.source_file.string()},
                                  .working_dir = workspace.get_path()};
            },
            [&](const ContainerLaunch& launch) {
                ASSERT(launcher_ != nullptr, "container launch requested without a container launcher");
                return launcher_->make_launch_spec(launch, workspace.get_path());
            },
        },
        strategy);

    spec.output_limit = opts.output_limit;

    Supervisor::KillHook on_kill;

    if (container != nullptr) {
        on_kill = [this, container] { launcher_->terminate(*container); };
    }

    LOG_DEBUG("Launching {:?} {} in {:?}", spec.exec, spec.args, workspace.get_name());

    auto status_res = Supervisor::run(spec, opts.timeout, on_kill);

    if (!status_res) {
        LOG_WARN("Execution in {:?} failed: {}", workspace.get_name(), status_res.error());
        return make_failure(status_res.error(), opts.failure_message);
    }

    std::optional<std::string> image_used;

    if (container != nullptr) {
        image_used = container->image;
    }

    return assemble_result(std::move(status_res.value()), std::move(image_used));
}

} // namespace runbox
