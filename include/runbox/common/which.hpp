#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace runbox {

/// Resolves ``command`` the way execvp(3) would: names containing a '/' are used as-is,
/// anything else is searched for in each directory of ``PATH``.
///
/// The result is always an absolute path, even for relative PATH entries.
/// Returns nullopt if no executable regular file was found.
std::optional<std::string> which(std::string_view command);

} // namespace runbox
