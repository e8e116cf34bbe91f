#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runbox {

/// Languages understood by the direct runner
enum class Language {
    JavaScript,
    Python,
};

/// Maps a free-form language name to a Language. Only an exact "python" selects Python;
/// everything else (including an empty string) is JavaScript.
constexpr Language parse_language(std::string_view name) {
    return name == "python" ? Language::Python : Language::JavaScript;
}

constexpr std::string_view to_string(Language lang) {
    switch (lang) {
    case Language::JavaScript:
        return "javascript";
    case Language::Python:
        return "python";
    }

    return "<unknown>";
}

/// A single source file to run on the host with a bare interpreter
struct SingleFileRequest
{
    std::string code;
    Language language = Language::JavaScript;
};

struct ProjectFile
{
    std::string path;
    std::string content;
};

/// A multi-file project to run inside a disposable container
struct ProjectRequest
{
    std::vector<ProjectFile> files;

    /// Compared case-insensitively; empty means "node"
    std::string language;

    /// Shell command run inside the container. Absent or empty selects the language default.
    std::optional<std::string> command;
};

} // namespace runbox
