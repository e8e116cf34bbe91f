#pragma once

namespace runbox {

/// Visitor built from a set of lambdas, for use with ``std::visit`` over a ``LaunchStrategy`` or similar variant
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

} // namespace runbox
