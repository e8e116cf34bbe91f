#pragma once

#include <runbox/common/error_types.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/sandbox/runner_config.hpp>
#include <runbox/subprocess/supervisor.hpp>

#include <filesystem>

namespace runbox {

/// Translates a ContainerLaunch into a host process, and tears the container down on request.
///
/// The runtime client process is what the supervisor watches; ``terminate`` is called once if that
/// client has to be killed, so that the container itself does not outlive it.
class ContainerLauncher
{
public:
    virtual ~ContainerLauncher() = default;

    virtual LaunchSpec make_launch_spec(const ContainerLaunch& launch,
                                        const std::filesystem::path& workspace) const = 0;

    /// Best effort; must not throw
    virtual void terminate(const ContainerLaunch& launch) const = 0;
};

class DockerLauncher : public ContainerLauncher
{
public:
    explicit DockerLauncher(ContainerPolicy policy);

    LaunchSpec make_launch_spec(const ContainerLaunch& launch, const std::filesystem::path& workspace) const override;

    void terminate(const ContainerLaunch& launch) const override;

    const ContainerPolicy& get_policy() const { return policy_; }

private:
    ContainerPolicy policy_;
};

} // namespace runbox
