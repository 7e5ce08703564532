#pragma once

#include <inline-core/assert.hh>
#include <inline-core/fwd.hh>

#include <cstring>
#include <type_traits>

// Small building blocks used by the containers, kept free of <utility> and <new>:
//   ic::move / ic::forward / ic::exchange
//   ic::placement_new and ic::storage_for<T> for explicitly managed lifetimes
//   ic::memcpy / ic::memmove with signed byte counts
//   ic::unit and ic::sentinel

namespace ic
{
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// stores replacement in target and hands back what was there before
///   auto const old_size = ic::exchange(_size, 0);
template <class T, class U = T>
[[nodiscard]] IC_FORCE_INLINE constexpr T exchange(T& target, U&& replacement) // NOLINT
{
    T previous = ic::move(target);
    target = ic::forward<U>(replacement);
    return previous;
}

/// selects the operator new at the bottom of this file:
///   new (ic::placement_new, slot) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Correctly sized and aligned room for one T that starts out dead
/// Whoever holds it decides when value is constructed and destroyed.
/// Trivially destructible / copyable exactly when T is.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

// byte copies that accept a null pointer together with a zero count
IC_FORCE_INLINE void memcpy(void* dest, void const* src, isize bytes)
{
    IC_ASSERT(bytes >= 0, "negative byte count");
    if (bytes > 0)
        std::memcpy(dest, src, std::size_t(bytes));
}
IC_FORCE_INLINE void memmove(void* dest, void const* src, isize bytes)
{
    IC_ASSERT(bytes >= 0, "negative byte count");
    if (bytes > 0)
        std::memmove(dest, src, std::size_t(bytes));
}

/// "no value" success payload: result<unit, E>
struct unit
{
    friend constexpr bool operator==(unit, unit) { return true; }
};

/// end() of a range that only learns it is done while advancing
struct sentinel
{
};
} // namespace ic

[[nodiscard]] IC_FORCE_INLINE void* operator new(std::size_t, ic::placement_new_t, void* slot) noexcept
{
    return slot;
}
// only invoked by the compiler when the constructor in a placement new-expression throws
IC_FORCE_INLINE void operator delete(void*, ic::placement_new_t, void*) noexcept {}
