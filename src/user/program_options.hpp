#pragma once

#include <runbox/common/expected.hpp>
#include <runbox/sandbox/runner_config.hpp>

#include <fmt/format.h>
#include <spdlog/common.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace runbox {

struct ProgramOptions
{
    // ###### Argument fields

    enum class Mode { Run, RunProject } mode = Mode::Run;

    /// JSON request body. Read from stdin if not specified.
    std::optional<std::filesystem::path> request_file;

    std::filesystem::path scratch_root = default_scratch_root();

    std::string container_runtime = default_container_runtime();

    /// Only applied if specified; otherwise the build type / LOG_LEVEL decide
    std::optional<spdlog::level::level_enum> log_level;

    // ###### Argument defaults

    static constexpr std::string_view SCRATCH_ROOT_ENV = "RUNBOX_SCRATCH_ROOT";
    static constexpr std::string_view CONTAINER_RUNTIME_ENV = "RUNBOX_CONTAINER_RUNTIME";

    static std::filesystem::path default_scratch_root() {
        if (const char* env = std::getenv(SCRATCH_ROOT_ENV.data()); env != nullptr && *env != '\0') {
            return env;
        }

        return RunnerConfig{}.scratch_root;
    }

    static std::string default_container_runtime() {
        if (const char* env = std::getenv(CONTAINER_RUNTIME_ENV.data()); env != nullptr && *env != '\0') {
            return env;
        }

        return ContainerPolicy{}.runtime;
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        namespace fs = std::filesystem;

        if (!fs::is_directory(scratch_root)) {
            return fmt::format("Scratch root {:?} is not a directory", scratch_root.string());
        }

        if (request_file && !fs::is_regular_file(*request_file)) {
            return fmt::format("Request file {:?} is not a regular file", request_file->string());
        }

        if (container_runtime.empty()) {
            return std::string{"Container runtime must not be empty"};
        }

        return {};
    }

    /// The runner configuration these options describe
    RunnerConfig to_runner_config() const {
        RunnerConfig config;

        config.scratch_root = scratch_root;
        config.project.container.runtime = container_runtime;

        return config;
    }
};

} // namespace runbox

template <>
struct fmt::formatter<::runbox::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::runbox::ProgramOptions& from, fmt::format_context& ctx) const {
        const std::string_view mode = from.mode == ::runbox::ProgramOptions::Mode::Run ? "run" : "run-project";

        return fmt::format_to(ctx.out(), "{{mode={}, request_file={}, scratch_root={}, container_runtime={}}}", mode,
                              from.request_file ? from.request_file->string() : "<stdin>", from.scratch_root.string(),
                              from.container_runtime);
    }
};
