#include <runbox/sandbox/container_launcher.hpp>

#include <runbox/logging.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/sandbox/runner_config.hpp>
#include <runbox/subprocess/supervisor.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace runbox {

namespace {

/// One ``key=value`` field of a ``--mount`` option, which the runtime splits as a CSV record.
/// ``-v`` is not used because it splits on ':', which paths may contain
std::string mount_field(std::string_view key, std::string_view value) {
    std::string field = fmt::format("{}={}", key, value);

    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }

    std::string quoted = "\"";
    for (char chr : field) {
        if (chr == '"') {
            quoted += '"';
        }
        quoted += chr;
    }
    quoted += '"';

    return quoted;
}

} // namespace

DockerLauncher::DockerLauncher(ContainerPolicy policy)
    : policy_{std::move(policy)} {}

LaunchSpec DockerLauncher::make_launch_spec(const ContainerLaunch& launch,
                                            const std::filesystem::path& workspace) const {
    std::vector<std::string> args{
        "run",
        "--rm",
        "--name",
        launch.container_name,
        "--network",
        policy_.network,
        "--memory",
        policy_.memory_limit,
        "--cpus",
        policy_.cpu_limit,
        "--mount",
        fmt::format("type=bind,{},{}", mount_field("source", workspace.string()),
                    mount_field("target", policy_.mount_path)),
        "-w",
        policy_.mount_path,
        launch.image,
        policy_.shell,
        policy_.shell_flags,
        launch.command,
    };

    return LaunchSpec{.exec = policy_.runtime, .args = std::move(args), .working_dir = workspace};
}

void DockerLauncher::terminate(const ContainerLaunch& launch) const {
    LOG_DEBUG("Killing container {:?}", launch.container_name);

    const LaunchSpec kill_spec{.exec = policy_.runtime, .args = {"kill", launch.container_name}, .working_dir = {}};

    auto res = Supervisor::run(kill_spec, policy_.kill_timeout);

    if (!res) {
        LOG_WARN("Could not run `{} kill {}`: {}", policy_.runtime, launch.container_name, res.error());
        return;
    }

    // Non-zero is expected if the container was never created, or already exited and got removed
    if (res->run_result.get_exit_code() != 0) {
        LOG_DEBUG("`{} kill {}` did not succeed: {}", policy_.runtime, launch.container_name, res->stderr_text);
    }
}

} // namespace runbox
