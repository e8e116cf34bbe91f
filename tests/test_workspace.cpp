#include "catch2_custom.hpp"

#include "scratch_dir.hpp"

#include <runbox/common/error_types.hpp>
#include <runbox/workspace/workspace.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace fs = std::filesystem;

using runbox::ErrorKind;
using runbox::Workspace;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

Workspace make_workspace(const ScratchDir& scratch) {
    auto res = Workspace::create(scratch.get_path(), "runbox-test-");
    REQUIRE(res);
    return std::move(res.value());
}

} // namespace

TEST_CASE("sanitize_relative_path strips leading separators") {
    using runbox::sanitize_relative_path;

    REQUIRE(sanitize_relative_path("main.js") == "main.js");
    REQUIRE(sanitize_relative_path("/main.js") == "main.js");
    REQUIRE(sanitize_relative_path("///src/app.py") == "src/app.py");
    REQUIRE(sanitize_relative_path("\\\\server\\share.txt") == "server\\share.txt");
    REQUIRE(sanitize_relative_path("/\\/mixed") == "mixed");
    REQUIRE(sanitize_relative_path("/").empty());
    REQUIRE(sanitize_relative_path("").empty());

    // Only leading separators are touched
    REQUIRE(sanitize_relative_path("a//b/") == "a//b/");
}

TEST_CASE("Workspaces are unique directories under the scratch root") {
    ScratchDir scratch;

    Workspace first = make_workspace(scratch);
    Workspace second = make_workspace(scratch);

    REQUIRE(first.get_path() != second.get_path());
    REQUIRE(fs::is_directory(first.get_path()));
    REQUIRE(first.get_path().parent_path() == scratch.get_path());
    REQUIRE(first.get_name().starts_with("runbox-test-"));
    REQUIRE(scratch.count_entries() == 2);
}

TEST_CASE("Creating a workspace under a missing root is a ResourceFailure") {
    ScratchDir scratch;

    REQUIRE(Workspace::create(scratch.get_path() / "missing", "runbox-test-") == ErrorKind::ResourceFailure);
}

TEST_CASE("Files are written with their parent directories") {
    ScratchDir scratch;
    Workspace workspace = make_workspace(scratch);

    auto written = workspace.write("/src/lib/util.py", "print('hi')\n");
    REQUIRE(written);
    REQUIRE(*written == workspace.get_path() / "src" / "lib" / "util.py");
    REQUIRE(read_file(*written) == "print('hi')\n");

    SECTION("Empty content makes an empty file") {
        auto empty = workspace.write("empty.txt", "");
        REQUIRE(empty);
        REQUIRE(fs::is_regular_file(*empty));
        REQUIRE(fs::file_size(*empty) == 0);
    }

    SECTION("Writing the same path twice overwrites") {
        REQUIRE(workspace.write("src/lib/util.py", "x"));
        REQUIRE(read_file(*written) == "x");
    }

    SECTION("Binary-unsafe content is kept verbatim") {
        const std::string content{"a\0b\r\n\xff", 6};
        auto path = workspace.write("bin.dat", content);
        REQUIRE(path);
        REQUIRE(read_file(*path) == content);
    }
}

TEST_CASE("Paths escaping the workspace are rejected") {
    ScratchDir scratch;
    Workspace workspace = make_workspace(scratch);

    REQUIRE(workspace.write("../escape.txt", "x") == ErrorKind::InvalidInput);
    REQUIRE(workspace.write("/../../escape.txt", "x") == ErrorKind::InvalidInput);
    REQUIRE(workspace.write("src/../../escape.txt", "x") == ErrorKind::InvalidInput);
    REQUIRE(workspace.write("..", "x") == ErrorKind::InvalidInput);

    // Resolving to the root itself is not a file either
    REQUIRE(workspace.write(".", "x") == ErrorKind::InvalidInput);
    REQUIRE(workspace.write("src/..", "x") == ErrorKind::InvalidInput);
    REQUIRE(workspace.write("/", "x") == ErrorKind::InvalidInput);

    REQUIRE_FALSE(fs::exists(scratch.get_path() / "escape.txt"));
    REQUIRE_FALSE(fs::exists(scratch.get_path().parent_path() / "escape.txt"));

    // Dot-dots that stay inside are fine
    REQUIRE(workspace.write("src/../main.js", "x"));
    REQUIRE(fs::exists(workspace.get_path() / "main.js"));
}

TEST_CASE("Workspaces are removed exactly once") {
    ScratchDir scratch;

    SECTION("On destruction") {
        {
            Workspace workspace = make_workspace(scratch);
            REQUIRE(workspace.write("a/b/c.txt", "x"));
            REQUIRE(scratch.count_entries() == 1);
        }

        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("On explicit destroy, which is idempotent") {
        Workspace workspace = make_workspace(scratch);
        const fs::path path = workspace.get_path();

        workspace.destroy();
        REQUIRE_FALSE(workspace.is_active());
        REQUIRE_FALSE(fs::exists(path));

        workspace.destroy();
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("Moved-from workspaces own nothing") {
        Workspace original = make_workspace(scratch);
        const fs::path path = original.get_path();

        Workspace moved{std::move(original)};
        REQUIRE_FALSE(original.is_active()); // NOLINT(bugprone-use-after-move)
        REQUIRE(moved.get_path() == path);

        original.destroy(); // NOLINT(bugprone-use-after-move)
        REQUIRE(fs::exists(path));

        moved.destroy();
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("Even if the directory is already gone") {
        Workspace workspace = make_workspace(scratch);
        fs::remove_all(workspace.get_path());

        workspace.destroy();
        REQUIRE_FALSE(workspace.is_active());
    }
}
