#pragma once

#include <runbox/common/class_traits.hpp>
#include <runbox/common/error_types.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace runbox {

/// Strips leading path separators ('/' and '\\') so that user supplied paths are always relative
std::string sanitize_relative_path(std::string_view path);

/// A uniquely-named scratch directory owned by exactly one execution attempt.
///
/// The directory is recursively removed when the Workspace is destroyed (or ``destroy()`` is called),
/// whichever comes first. Removal failures are logged, never reported: they must not mask the result
/// of the run that used the workspace.
class Workspace : NonCopyable
{
public:
    /// Creates ``root``/``prefix``XXXXXX with a random, collision-free suffix.
    /// Fails with ResourceFailure if ``root`` is missing, unwritable or full.
    static Result<Workspace> create(const std::filesystem::path& root, std::string_view prefix);

    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;

    /// Resolves ``relative_path`` (after sanitization) to an absolute path inside the workspace.
    /// Fails with InvalidInput if the result would be the root itself or lie outside of it.
    Result<std::filesystem::path> resolve(std::string_view relative_path) const;

    /// Writes ``content`` to ``relative_path``, creating parent directories as needed.
    /// Returns the absolute path written to.
    Result<std::filesystem::path> write(std::string_view relative_path, std::string_view content);

    /// Best-effort recursive delete. Idempotent.
    void destroy() noexcept;

    const std::filesystem::path& get_path() const { return path_; }

    /// The final path component, e.g. "runbox-run-a1B2c3"
    std::string get_name() const { return path_.filename().string(); }

    bool is_active() const { return !path_.empty(); }

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
};

} // namespace runbox
