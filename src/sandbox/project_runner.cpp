#include <runbox/sandbox/project_runner.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/logging.hpp>
#include <runbox/sandbox/container_launcher.hpp>
#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/workspace/workspace.hpp>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace runbox {

namespace {

std::string to_lower(std::string_view str) {
    return str | ranges::views::transform([](char chr) {
               return static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
           }) |
           ranges::to<std::string>();
}

} // namespace

ProjectRunner::ProjectRunner(std::filesystem::path scratch_root, ProjectRunnerConfig config,
                             std::shared_ptr<const ContainerLauncher> launcher)
    : config_{std::move(config)}
    , sandbox_{std::move(scratch_root), std::move(launcher)} {}

ProjectRunner::ProjectRunner(std::filesystem::path scratch_root, ProjectRunnerConfig config)
    : ProjectRunner{std::move(scratch_root), config, std::make_shared<DockerLauncher>(config.container)} {}

ContainerLaunch ProjectRunner::select_launch(std::string_view language) const {
    std::string lang = to_lower(language);

    if (lang.empty()) {
        lang = "node";
    }

    if (lang == "python") {
        return ContainerLaunch{.image = config_.python_image, .command = config_.python_command, .container_name = {}};
    }

    return ContainerLaunch{.image = config_.node_image, .command = config_.node_command, .container_name = {}};
}

RunOutcome ProjectRunner::run(const ProjectRequest& request) const {
    if (request.files.empty()) {
        return ExecutionError{.kind = ErrorKind::InvalidInput, .message = FILES_REQUIRED_MSG};
    }

    ContainerLaunch launch = select_launch(request.language);

    if (request.command && !request.command->empty()) {
        launch.command = *request.command;
    }

    LOG_DEBUG("Project run: {} file(s), image {:?}, command {:?}", request.files.size(), launch.image, launch.command);

    const Sandbox::Options opts{
        .workspace_prefix = config_.workspace_prefix,
        .timeout = config_.timeout,
        .output_limit = config_.output_limit,
        .failure_message = FAILURE_MSG,
    };

    return sandbox_.run(opts, [&](Workspace& workspace) -> Expected<LaunchStrategy, ExecutionError> {
        for (const ProjectFile& file : request.files) {
            std::string path = sanitize_relative_path(file.path);

            if (path.empty()) {
                path = config_.fallback_file;
            }

            auto res = workspace.write(path, file.content);

            if (!res && res.error() == ErrorKind::InvalidInput) {
                return ExecutionError{.kind = ErrorKind::InvalidInput,
                                      .message = fmt::format("Invalid file path: {}", file.path)};
            }

            if (!res) {
                return ExecutionError{.kind = res.error(), .message = FAILURE_MSG};
            }
        }

        launch.container_name = workspace.get_name();

        return launch;
    });
}

} // namespace runbox
