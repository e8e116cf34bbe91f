#include <runbox/common/which.hpp>

#include <runbox/common/linux.hpp>
#include <runbox/logging.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace runbox {

namespace {

// Used by execvp(3) when PATH is unset
constexpr std::string_view DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

/// Children chdir before exec, so a path relative to our working directory would find the wrong file
std::optional<std::string> to_absolute(const std::string& path) {
    std::error_code err;
    std::filesystem::path abs_path = std::filesystem::absolute(path, err);

    if (err) {
        LOG_DEBUG("Cannot make {:?} absolute: {}", path, err.message());
        return std::nullopt;
    }

    return abs_path.lexically_normal().string();
}

} // namespace

std::optional<std::string> which(std::string_view command) {
    if (command.empty()) {
        return std::nullopt;
    }

    if (command.find('/') != std::string_view::npos) {
        std::string path{command};

        if (linux::is_executable(path)) {
            return to_absolute(path);
        }

        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search_path{path_env != nullptr ? std::string_view{path_env} : DEFAULT_PATH};

    for (auto&& dir_range : search_path | ranges::views::split(':')) {
        auto dir = dir_range | ranges::to<std::string>();

        // An empty PATH element means the current directory
        if (dir.empty()) {
            dir = ".";
        }

        std::string candidate = (std::filesystem::path{dir} / command).string();

        if (linux::is_executable(candidate)) {
            LOG_TRACE("Resolved {:?} to {:?}", command, candidate);
            return to_absolute(candidate);
        }
    }

    LOG_DEBUG("{:?} not found in PATH ({:?})", command, search_path);

    return std::nullopt;
}

} // namespace runbox
