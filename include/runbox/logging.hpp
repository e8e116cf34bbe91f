#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <system_error>

// Set log level based on the build type
// Needs to be done before including spdlog
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

namespace runbox {

/// Obtain Linux error code message given by ``err`` via libc functions
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Obtain Linux error (i.e., ``errno``) message via libc functions
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

/// Sets up the default logger. Must be called once, before any other thread logs.
inline void init_loggers() {
    try {
        // Log to stderr; stdout is reserved for results
        // Runners may be driven from several threads, hence the _mt sink
        spdlog::set_default_logger(spdlog::stderr_color_mt("default"));

#if defined(TRACE)
        spdlog::set_level(spdlog::level::trace);
#elif defined(DEBUG)
        spdlog::set_level(spdlog::level::debug);
#elif defined(RELEASE)
        spdlog::set_level(spdlog::level::warn);
#else
        spdlog::set_level(spdlog::level::info);
#endif

        // Override any previously set log-level with the environment variable LOG_LEVEL, if set
        // Same syntax as SPDLOG_LEVEL, e.g. LOG_LEVEL=debug
        if (const char* env_levels = std::getenv("LOG_LEVEL"); env_levels != nullptr) {
            spdlog::cfg::helpers::load_levels(env_levels);
        }

#if defined(DEBUG) || defined(TRACE)
        spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [tid %6t] [%20!s:%-4#] %v");
#else
        // Pattern:
        //   time - [HH:MM:SS.MS]
        //   level (colored, center aligned) - [ info ]
        //   process id - [pid 12345]
        //   message - "foo bar"
        spdlog::set_pattern("[%T.%e] [%^%=8l%$] [pid %6P] %v");
#endif
    } catch (const std::exception& ex) {
        (void)std::fprintf(stderr, "Failed to initialize spdlog! (%s)\n", ex.what()); // NOLINT(*vararg)
        std::exit(1);
    }
}

} // namespace runbox
