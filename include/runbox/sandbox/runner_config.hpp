#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace runbox {

/// Bytes of stdout (and separately stderr) kept before a run is killed
inline constexpr std::size_t DEFAULT_OUTPUT_LIMIT = 1024 * 1024;

/// Resource limits and invocation details for the container runtime
struct ContainerPolicy
{
    /// Runtime client binary; resolved on PATH
    std::string runtime = "docker";

    /// Where the workspace is mounted inside the container; also the working directory
    std::string mount_path = "/app";

    std::string memory_limit = "512m";
    std::string cpu_limit = "1";
    std::string network = "none";

    std::string shell = "bash";
    std::string shell_flags = "-lc";

    /// How long ``docker kill`` may take before it is given up on
    std::chrono::milliseconds kill_timeout{5000};
};

struct DirectRunnerConfig
{
    std::string python_interpreter = "python3";
    std::string javascript_interpreter = "node";

    std::string python_file = "main.py";
    std::string javascript_file = "main.js";

    std::string workspace_prefix = "runbox-run-";

    std::chrono::milliseconds timeout{8000};

    /// Per stream
    std::size_t output_limit = DEFAULT_OUTPUT_LIMIT;
};

struct ProjectRunnerConfig
{
    std::string python_image = "python:3.11";
    std::string node_image = "node:18";

    std::string python_command = "python main.py";
    std::string node_command = "node main.js";

    /// Substituted for a file path that is empty after sanitization
    std::string fallback_file = "main.js";

    std::string workspace_prefix = "runbox-project-";

    std::chrono::milliseconds timeout{20000};

    /// Per stream
    std::size_t output_limit = DEFAULT_OUTPUT_LIMIT;

    ContainerPolicy container;
};

struct RunnerConfig
{
    /// Where workspaces are created
    std::filesystem::path scratch_root = std::filesystem::temp_directory_path();

    DirectRunnerConfig direct;
    ProjectRunnerConfig project;
};

} // namespace runbox
