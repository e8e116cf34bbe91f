#include "app/runbox_app.hpp"

#include "user/program_options.hpp"

#include <runbox/codec/json_codec.hpp>
#include <runbox/common/error_types.hpp>
#include <runbox/logging.hpp>
#include <runbox/sandbox/direct_runner.hpp>
#include <runbox/sandbox/execution_result.hpp>
#include <runbox/sandbox/project_runner.hpp>
#include <runbox/sandbox/runner_config.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace runbox {

std::string RunboxApp::read_request() const {
    std::ostringstream body;

    if (OPTS.request_file) {
        std::ifstream file{*OPTS.request_file, std::ios::binary};

        if (!file) {
            throw std::runtime_error(fmt::format("Could not open request file {:?}", OPTS.request_file->string()));
        }

        body << file.rdbuf();
    } else {
        body << std::cin.rdbuf();
    }

    return body.str();
}

RunOutcome RunboxApp::dispatch(const std::string& body) const {
    const RunnerConfig config = OPTS.to_runner_config();

    switch (OPTS.mode) {
    case ProgramOptions::Mode::Run: {
        auto request = json::decode_single_file_request(body);

        if (!request) {
            return request.error();
        }

        return DirectRunner{config.scratch_root, config.direct}.run(*request);
    }

    case ProgramOptions::Mode::RunProject: {
        auto request = json::decode_project_request(body);

        if (!request) {
            return request.error();
        }

        return ProjectRunner{config.scratch_root, config.project}.run(*request);
    }
    }

    UNREACHABLE("invalid mode");
}

int RunboxApp::run_impl() {
    const std::string body = read_request();

    LOG_DEBUG("Read {} byte request", body.size());

    RunOutcome outcome = dispatch(body);

    if (!outcome) {
        const ExecutionError& error = outcome.error();

        LOG_WARN("Request failed ({}, HTTP {}): {}", error.kind, json::http_status(error.kind), error.message);
        fmt::print("{}\n", json::encode_error(error));

        return error.kind == ErrorKind::InvalidInput ? EXIT_INVALID_INPUT : EXIT_FAILURE_OTHER;
    }

    if (outcome->timed_out) {
        LOG_INFO("Request timed out");
    }

    fmt::print("{}\n", json::encode_result(*outcome));
    std::fflush(stdout);

    return EXIT_RESULT;
}

} // namespace runbox
