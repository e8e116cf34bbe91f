#pragma once

#include <filesystem>
#include <string>
#include <variant>

namespace runbox {

/// Run ``interpreter source_file`` directly on the host, inside the workspace
struct DirectLaunch
{
    std::string interpreter;
    std::filesystem::path source_file;
};

/// Run ``command`` in a fresh container of ``image`` with the workspace mounted
struct ContainerLaunch
{
    std::string image;
    std::string command;

    /// Unique per attempt, so that the container can be addressed (killed) after a timeout
    std::string container_name;
};

using LaunchStrategy = std::variant<DirectLaunch, ContainerLaunch>;

} // namespace runbox
