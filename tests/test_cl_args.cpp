#include "catch2_custom.hpp"

#include "scratch_dir.hpp"

#include "app/runbox_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using runbox::CommandLineArgs;
using runbox::ProgramOptions;
using runbox::RunboxApp;

namespace {

auto parse(std::vector<const char*> args) {
    args.insert(args.begin(), "runbox");

    CommandLineArgs cl_args{args};
    return cl_args.parse();
}

std::filesystem::path write_request(const ScratchDir& scratch, const std::string& body) {
    auto path = scratch.get_path() / "request.json";
    std::ofstream{path} << body;
    return path;
}

} // namespace

TEST_CASE("Subcommands select the runner") {
    SECTION("run") {
        auto opts = parse({"run"});
        REQUIRE(opts);
        REQUIRE(opts->mode == ProgramOptions::Mode::Run);
        REQUIRE_FALSE(opts->request_file.has_value());
    }

    SECTION("run-project") {
        auto opts = parse({"run-project"});
        REQUIRE(opts);
        REQUIRE(opts->mode == ProgramOptions::Mode::RunProject);
    }

    SECTION("A subcommand is required") {
        REQUIRE(parse({}).has_error());
    }

    SECTION("Unknown subcommands are rejected") {
        REQUIRE(parse({"exec"}).has_error());
    }
}

TEST_CASE("Request files are checked while parsing") {
    ScratchDir scratch;
    const auto request = write_request(scratch, "{}");

    auto opts = parse({"run", "--request", request.c_str()});
    REQUIRE(opts);
    REQUIRE(opts->request_file == request);

    const auto missing = (scratch.get_path() / "missing.json").string();
    REQUIRE(parse({"run", "--request", missing.c_str()}).has_error());
}

TEST_CASE("Global options configure the runners") {
    ScratchDir scratch;
    const std::string root = scratch.get_path().string();

    auto opts = parse({"--scratch-root", root.c_str(), "--runtime", "podman", "run-project"});
    REQUIRE(opts);
    REQUIRE(opts->scratch_root == scratch.get_path());
    REQUIRE(opts->container_runtime == "podman");
    REQUIRE(opts->validate());

    auto config = opts->to_runner_config();
    REQUIRE(config.scratch_root == scratch.get_path());
    REQUIRE(config.project.container.runtime == "podman");

    REQUIRE(parse({"--scratch-root", "/definitely/not/a/real/dir", "run"}).has_error());
}

TEST_CASE("Invalid requests exit with the invalid input status") {
    ScratchDir scratch;

    ProgramOptions opts;
    opts.mode = ProgramOptions::Mode::Run;
    opts.scratch_root = scratch.get_path();

    SECTION("Malformed JSON") {
        opts.request_file = write_request(scratch, "{\"code\": ");
    }

    SECTION("Empty code") {
        opts.request_file = write_request(scratch, R"({"code": "", "language": "python"})");
    }

    SECTION("No project files") {
        opts.mode = ProgramOptions::Mode::RunProject;
        opts.request_file = write_request(scratch, R"({"files": []})");
    }

    RunboxApp app{opts};
    REQUIRE(app.run() == RunboxApp::EXIT_INVALID_INPUT);

    // Only the request file itself remains
    REQUIRE(scratch.count_entries() == 1);
}
