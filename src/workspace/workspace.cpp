#include <runbox/workspace/workspace.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/common/linux.hpp>
#include <runbox/logging.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace runbox {

namespace fs = std::filesystem;

std::string sanitize_relative_path(std::string_view path) {
    const auto first_kept = path.find_first_not_of("/\\");

    if (first_kept == std::string_view::npos) {
        return "";
    }

    return std::string{path.substr(first_kept)};
}

Workspace::Workspace(fs::path path)
    : path_{std::move(path)} {}

Workspace::~Workspace() {
    destroy();
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        destroy();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

Result<Workspace> Workspace::create(const fs::path& root, std::string_view prefix) {
    std::error_code err;
    fs::path abs_root = fs::absolute(root, err).lexically_normal();

    if (err) {
        LOG_WARN("Cannot resolve scratch root {:?}: {}", root.string(), err.message());
        return ErrorKind::ResourceFailure;
    }

    auto created = linux::mkdtemp((abs_root / fmt::format("{}XXXXXX", prefix)).string());

    if (!created) {
        LOG_WARN("Cannot create workspace under {:?}: {}", abs_root.string(), created.error().message());
        return ErrorKind::ResourceFailure;
    }

    LOG_DEBUG("Created workspace {:?}", *created);

    return Workspace{fs::path{*created}};
}

Result<fs::path> Workspace::resolve(std::string_view relative_path) const {
    DEBUG_ASSERT(is_active(), "resolve() on a destroyed workspace");

    const std::string sanitized = sanitize_relative_path(relative_path);

    if (sanitized.empty()) {
        LOG_DEBUG("Rejecting empty path {:?}", relative_path);
        return ErrorKind::InvalidInput;
    }

    const fs::path resolved = (path_ / sanitized).lexically_normal();

    // Every component of the root must prefix the resolved path, and there must be something after it
    auto [root_iter, resolved_iter] = std::mismatch(path_.begin(), path_.end(), resolved.begin(), resolved.end());

    if (root_iter != path_.end() || resolved_iter == resolved.end() || resolved_iter->empty()) {
        LOG_WARN("Rejecting path {:?}: resolves to {:?}, outside of workspace {:?}", relative_path,
                 resolved.string(), path_.string());
        return ErrorKind::InvalidInput;
    }

    return resolved;
}

Result<fs::path> Workspace::write(std::string_view relative_path, std::string_view content) {
    fs::path target = TRY(resolve(relative_path));

    std::error_code err;
    fs::create_directories(target.parent_path(), err);

    if (err) {
        LOG_WARN("Cannot create directory {:?}: {}", target.parent_path().string(), err.message());
        return ErrorKind::ResourceFailure;
    }

    std::ofstream out{target, std::ios::binary | std::ios::trunc};
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();

    if (!out) {
        LOG_WARN("Failed to write {} bytes to {:?}", content.size(), target.string());
        return ErrorKind::ResourceFailure;
    }

    LOG_TRACE("Wrote {} bytes to {:?}", content.size(), target.string());

    return target;
}

void Workspace::destroy() noexcept {
    if (!is_active()) {
        return;
    }

    std::error_code err;
    fs::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove workspace {:?}: {}", path_.string(), err.message());
    } else {
        LOG_DEBUG("Removed workspace {:?}", path_.string());
    }

    path_.clear();
}

} // namespace runbox
