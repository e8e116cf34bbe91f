#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <runbox/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace runbox {

class App : NonCopyable
{
public:
    /// Returned by ``run`` if ``run_impl`` throws
    static constexpr int UNHANDLED_EXCEPTION_EXIT_CODE = 1;

    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(UNHANDLED_EXCEPTION_EXIT_CODE);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace runbox
