#include "catch2_custom.hpp"

#include "scratch_dir.hpp"

#include <runbox/common/error_types.hpp>
#include <runbox/sandbox/container_launcher.hpp>
#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/launch_strategy.hpp>
#include <runbox/sandbox/project_runner.hpp>
#include <runbox/sandbox/runner_config.hpp>
#include <runbox/subprocess/supervisor.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

using runbox::ContainerLaunch;
using runbox::ErrorKind;
using runbox::LaunchSpec;
using runbox::ProjectFile;
using runbox::ProjectRequest;
using runbox::ProjectRunner;
using runbox::ProjectRunnerConfig;

namespace {

/// Runs the container command with the host's /bin/sh in the workspace, and records what it was asked to do
class FakeLauncher : public runbox::ContainerLauncher
{
public:
    LaunchSpec make_launch_spec(const ContainerLaunch& launch, const std::filesystem::path& workspace) const override {
        const std::scoped_lock lock{mutex_};
        last_launch_ = launch;
        last_workspace_ = workspace;

        return LaunchSpec{.exec = "/bin/sh", .args = {"-c", launch.command}, .working_dir = workspace};
    }

    void terminate(const ContainerLaunch& launch) const override {
        const std::scoped_lock lock{mutex_};
        terminated_name_ = launch.container_name;
        ++terminate_calls_;
    }

    std::optional<ContainerLaunch> get_last_launch() const {
        const std::scoped_lock lock{mutex_};
        return last_launch_;
    }

    std::filesystem::path get_last_workspace() const {
        const std::scoped_lock lock{mutex_};
        return last_workspace_;
    }

    std::string get_terminated_name() const {
        const std::scoped_lock lock{mutex_};
        return terminated_name_;
    }

    int get_terminate_calls() const { return terminate_calls_; }

private:
    mutable std::mutex mutex_;
    mutable std::optional<ContainerLaunch> last_launch_;
    mutable std::filesystem::path last_workspace_;
    mutable std::string terminated_name_;
    mutable std::atomic<int> terminate_calls_{0};
};

struct ProjectRunnerFixture
{
    ProjectRunnerFixture() {
        config.timeout = 2s;
        launcher = std::make_shared<FakeLauncher>();
    }

    ProjectRunner make_runner() const { return ProjectRunner{scratch.get_path(), config, launcher}; }

    ScratchDir scratch;
    ProjectRunnerConfig config;
    std::shared_ptr<FakeLauncher> launcher;
};

ProjectRequest make_request(std::vector<ProjectFile> files, std::string language,
                            std::optional<std::string> command) {
    return ProjectRequest{.files = std::move(files), .language = std::move(language), .command = std::move(command)};
}

} // namespace

TEST_CASE("Image and default command selection") {
    const ProjectRunner runner{std::filesystem::temp_directory_path(), ProjectRunnerConfig{},
                               std::make_shared<FakeLauncher>()};

    auto python = runner.select_launch("python");
    REQUIRE(python.image == "python:3.11");
    REQUIRE(python.command == "python main.py");

    // Case-insensitive
    REQUIRE(runner.select_launch("PyThOn").image == "python:3.11");

    auto node = runner.select_launch("node");
    REQUIRE(node.image == "node:18");
    REQUIRE(node.command == "node main.js");

    // Absent and unknown languages fall back to node
    REQUIRE(runner.select_launch("").image == "node:18");
    REQUIRE(runner.select_launch("ruby").image == "node:18");
    REQUIRE(runner.select_launch("ruby").command == "node main.js");
}

TEST_CASE_METHOD(ProjectRunnerFixture, "An empty file list is rejected without creating a workspace") {
    auto outcome = make_runner().run(make_request({}, "node", "echo hi"));

    REQUIRE(outcome.has_error());
    REQUIRE(outcome.error().kind == ErrorKind::InvalidInput);
    REQUIRE(outcome.error().message == "files[] required");
    REQUIRE(scratch.count_entries() == 0);
    REQUIRE_FALSE(launcher->get_last_launch().has_value());
}

TEST_CASE_METHOD(ProjectRunnerFixture, "Project files are materialized before the command runs") {
    auto outcome = make_runner().run(make_request(
        {
            {.path = "/main.js", .content = "A"},
            {.path = "src/lib/util.js", .content = "B"},
            {.path = "\\notes.txt", .content = ""},
        },
        "node", "cat main.js src/lib/util.js notes.txt; echo; echo err >&2"));

    REQUIRE(outcome);
    REQUIRE(outcome->stdout_text == "AB\n");
    REQUIRE(outcome->stderr_text == "err\n");
    REQUIRE(outcome->exit_code == 0);
    REQUIRE_FALSE(outcome->timed_out);
    REQUIRE(outcome->image_used == "node:18");

    auto launch = launcher->get_last_launch();
    REQUIRE(launch.has_value());
    REQUIRE(launch->container_name == launcher->get_last_workspace().filename().string());
    REQUIRE(launch->container_name.starts_with("runbox-project-"));

    REQUIRE(launcher->get_terminate_calls() == 0);
    REQUIRE(scratch.count_entries() == 0);
}

TEST_CASE_METHOD(ProjectRunnerFixture, "A path that is empty after sanitization becomes main.js") {
    auto outcome = make_runner().run(make_request({{.path = "///", .content = "fallback"}}, "", "cat main.js"));

    REQUIRE(outcome);
    REQUIRE(outcome->stdout_text == "fallback");
}

TEST_CASE_METHOD(ProjectRunnerFixture, "The command defaults by language and can be overridden") {
    const std::vector<ProjectFile> files{{.path = "main.py", .content = "print(1)"}};

    SECTION("Explicit command") {
        REQUIRE(make_runner().run(make_request(files, "python", "exit 4"))->exit_code == 4);
        REQUIRE(launcher->get_last_launch()->command == "exit 4");
        REQUIRE(launcher->get_last_launch()->image == "python:3.11");
    }

    SECTION("Absent command") {
        std::ignore = make_runner().run(make_request(files, "python", std::nullopt));
        REQUIRE(launcher->get_last_launch()->command == "python main.py");
    }

    SECTION("Empty command") {
        auto outcome = make_runner().run(make_request(files, "Ruby", ""));
        REQUIRE(launcher->get_last_launch()->command == "node main.js");
        REQUIRE(outcome->image_used == "node:18");
    }
}

TEST_CASE_METHOD(ProjectRunnerFixture, "Path traversal is rejected and nothing is left behind") {
    auto outcome = make_runner().run(make_request(
        {
            {.path = "main.js", .content = "ok"},
            {.path = "../../evil.js", .content = "bad"},
        },
        "node", "cat main.js"));

    REQUIRE(outcome.has_error());
    REQUIRE(outcome.error().kind == ErrorKind::InvalidInput);
    REQUIRE_THAT(outcome.error().message, Catch::Matchers::ContainsSubstring("../../evil.js"));

    REQUIRE_FALSE(launcher->get_last_launch().has_value());
    REQUIRE(scratch.count_entries() == 0);
    REQUIRE_FALSE(std::filesystem::exists(scratch.get_path().parent_path() / "evil.js"));
}

TEST_CASE_METHOD(ProjectRunnerFixture, "Containers are terminated at the timeout") {
    config.timeout = 500ms;

    auto outcome =
        make_runner().run(make_request({{.path = "main.js", .content = ""}}, "node", "echo started; sleep 30"));

    REQUIRE(outcome);
    REQUIRE(outcome->timed_out);
    REQUIRE_FALSE(outcome->exit_code.has_value());
    REQUIRE(outcome->stdout_text == "started\n");
    REQUIRE(outcome->image_used == "node:18");

    REQUIRE(launcher->get_terminate_calls() == 1);
    REQUIRE(launcher->get_terminated_name() == launcher->get_last_launch()->container_name);
    REQUIRE(scratch.count_entries() == 0);
}

TEST_CASE_METHOD(ProjectRunnerFixture, "A missing container runtime is reported, never retried") {
    config.container.runtime = "definitely-not-a-real-binary-3f9a";

    const ProjectRunner runner{scratch.get_path(), config};

    auto outcome = runner.run(make_request({{.path = "main.js", .content = "console.log(1)"}}, "node", std::nullopt));

    REQUIRE(outcome.has_error());
    REQUIRE(outcome.error().kind == ErrorKind::SpawnFailure);
    REQUIRE(outcome.error().message == "Docker execution failed");
    REQUIRE(scratch.count_entries() == 0);
}
