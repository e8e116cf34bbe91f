#pragma once

#include <type_traits>

namespace runbox {

/**
 * \brief A movable, but non-copyable type.
 *
 * Use as a superclass to annotate a subclass as owning a unique resource (fd, pid, directory).
 */
class NonCopyable
{
public:
    NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;

    ~NonCopyable() = default;
};

static_assert(!std::is_copy_constructible_v<NonCopyable> && !std::is_copy_assignable_v<NonCopyable> &&
                  std::is_trivially_move_constructible_v<NonCopyable> &&
                  std::is_trivially_move_assignable_v<NonCopyable>,
              "NonCopyable should be trivially movable, but not copyable");

} // namespace runbox
