#pragma once

#include "app/app.hpp" // IWYU pragma: export

#include <runbox/sandbox/execution_result.hpp>

#include <string>

namespace runbox {

/// Reads one JSON request, runs it with the runner selected by the subcommand, and prints one JSON document
class RunboxApp final : public App
{
public:
    using App::App;

    static constexpr int EXIT_RESULT = 0;
    static constexpr int EXIT_FAILURE_OTHER = 1;
    static constexpr int EXIT_INVALID_INPUT = 2;

private:
    int run_impl() override;

    /// The request body, from --request FILE or stdin
    std::string read_request() const;

    RunOutcome dispatch(const std::string& body) const;
};

} // namespace runbox
