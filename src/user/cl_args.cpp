#include "user/cl_args.hpp"

#include "user/program_options.hpp"
#include "version.hpp"

#include <runbox/common/expected.hpp>
#include <runbox/logging.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace runbox {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), RUNBOX_VERSION_STRING, argparse::default_arguments::help}
    , run_parser_{"run", RUNBOX_VERSION_STRING, argparse::default_arguments::help}
    , run_project_parser_{"run-project", RUNBOX_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

void ensure_is_regular_file(const std::filesystem::path& path, fmt::format_string<std::string> fmt) {
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument(fmt::format(fmt, path.string()) + " does not exist");
    }
    if (!std::filesystem::is_regular_file(path)) {
        throw std::invalid_argument(fmt::format(fmt, path.string()) + " is not a regular file");
    }
}

void ensure_is_directory(const std::filesystem::path& path, fmt::format_string<std::string> fmt) {
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument(fmt::format(fmt, path.string()) + " does not exist");
    }
    if (!std::filesystem::is_directory(path)) {
        throw std::invalid_argument(fmt::format(fmt, path.string()) + " is not a directory");
    }
}

} // namespace

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("runbox v{} - run untrusted code in a disposable, time-bounded sandbox",
                                            RUNBOX_VERSION_STRING));
    arg_parser_.add_epilog("Requests are JSON documents read from --request FILE or stdin; results are printed as JSON "
                           "to stdout.\nExit status: 0 on a result (including timeouts), 2 on invalid input, 1 "
                           "otherwise.");

    // clang-format off
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", RUNBOX_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.log_level = spdlog::level::debug;
            })
        .help("Log lifecycle details to stderr");

    arg_parser_.add_argument("--trace")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.log_level = spdlog::level::trace;
            })
        .help("Log everything to stderr, including every syscall failure");

    arg_parser_.add_argument("--scratch-root")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                ensure_is_directory(opt, "Scratch root {:?}");

                opts_buffer_.scratch_root = opt;
        })
        .help(fmt::format("Directory under which workspaces are created. Defaults to ${} or {:?}",
                          ProgramOptions::SCRATCH_ROOT_ENV, opts_buffer_.scratch_root.string()));

    arg_parser_.add_argument("--runtime")
        .metavar("BIN")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.container_runtime = opt;
        })
        .help(fmt::format("Container runtime client for run-project. Defaults to ${} or {:?}",
                          ProgramOptions::CONTAINER_RUNTIME_ENV, opts_buffer_.container_runtime));

    for (argparse::ArgumentParser* sub : {&run_parser_, &run_project_parser_}) {
        sub->add_argument("-r", "--request")
            .metavar("FILE")
            .nargs(1)
            .action([this] (const std::string& opt) {
                    ensure_is_regular_file(opt, "Request file {:?}");

                    opts_buffer_.request_file = opt;
            })
            .help("JSON request body. Read from stdin if omitted.");
    }
    // clang-format on

    run_parser_.add_description(R"(Run a single source file on the host: {"code": "...", "language": "python"})");
    run_project_parser_.add_description(
        R"(Run a project in a container: {"files": [{"path": "...", "content": "..."}], "language": "node", )"
        R"("command": "..."})");

    arg_parser_.add_subparser(run_parser_);
    arg_parser_.add_subparser(run_project_parser_);
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (arg_parser_.is_subcommand_used(run_parser_)) {
        opts_buffer_.mode = ProgramOptions::Mode::Run;
    } else if (arg_parser_.is_subcommand_used(run_project_parser_)) {
        opts_buffer_.mode = ProgramOptions::Mode::RunProject;
    } else {
        return std::string{"Expected a subcommand: run or run-project"};
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (opts_res) {
        if (auto valid = opts_res->validate(); !valid) {
            opts_res = valid.error();
        }
    }

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace runbox
