#include "app/runbox_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <runbox/logging.hpp>

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    runbox::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    runbox::ProgramOptions options = runbox::parse_args_or_exit(args);

    if (options.log_level) {
        spdlog::set_level(*options.log_level);
    }

    runbox::RunboxApp app{std::move(options)};

    return app.run();
}
