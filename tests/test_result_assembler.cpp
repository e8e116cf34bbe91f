#include "catch2_custom.hpp"

#include <runbox/sandbox/execution_result.hpp>
#include <runbox/subprocess/run_result.hpp>
#include <runbox/subprocess/supervisor.hpp>

#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <utility>

using namespace std::chrono_literals;

using runbox::assemble_result;
using runbox::RunResult;
using runbox::TerminalStatus;

namespace {

TerminalStatus make_status(RunResult run_result) {
    return TerminalStatus{
        .run_result = run_result, .stdout_text = "out", .stderr_text = "err", .elapsed = 10ms};
}

} // namespace

TEST_CASE("Normal exits keep their exit code") {
    auto result = assemble_result(make_status(RunResult::make_exited(3)));

    REQUIRE(result.stdout_text == "out");
    REQUIRE(result.stderr_text == "err");
    REQUIRE(result.exit_code == 3);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE_FALSE(result.image_used.has_value());
}

TEST_CASE("Timed out runs have no exit code") {
    auto result = assemble_result(make_status(RunResult::make_timed_out(SIGKILL)));

    REQUIRE(result.timed_out);
    REQUIRE_FALSE(result.exit_code.has_value());
    REQUIRE(result.stdout_text == "out");
}

TEST_CASE("Signal deaths have no exit code and did not time out") {
    auto result = assemble_result(make_status(RunResult::make_killed(SIGSEGV)));

    REQUIRE_FALSE(result.timed_out);
    REQUIRE_FALSE(result.exit_code.has_value());
}

TEST_CASE("The image used is carried through") {
    auto result = assemble_result(make_status(RunResult::make_exited(0)), "node:18");

    REQUIRE(result.image_used == "node:18");
    REQUIRE(result.exit_code == 0);
}

TEST_CASE("Runs killed for flooding their output are reported as truncated") {
    TerminalStatus status = make_status(RunResult::make_killed(SIGKILL));
    status.output_truncated = true;

    auto result = assemble_result(std::move(status));

    REQUIRE(result.output_truncated);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE_FALSE(result.exit_code.has_value());
}
