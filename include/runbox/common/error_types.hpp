#pragma once

#include <runbox/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace runbox {

// NOLINTNEXTLINE
enum class ErrorKind {
    InvalidInput,    ///< Missing or malformed request fields (empty code, no files, path traversal)
    ResourceFailure, ///< Workspace could not be created or written (disk, permissions)
    SpawnFailure,    ///< Interpreter or container runtime could not be launched
    TimedOut,        ///< Program / operation surpassed its deadline
    SyscallFailure,  ///< A Linux syscall failed
    UnknownError,    ///< As named; use this as little as possible
};

template <typename T>
using Result = Expected<T, ErrorKind>;

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:
        return "InvalidInput";
    case ErrorKind::ResourceFailure:
        return "ResourceFailure";
    case ErrorKind::SpawnFailure:
        return "SpawnFailure";
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::UnknownError:
        return "UnknownError";
    }

    return "<unknown>";
}

} // namespace runbox

template <>
struct fmt::formatter<::runbox::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::runbox::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::runbox::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::runbox::ErrorKind;                                                                            \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
