#pragma once

#include <inline-core/fwd.hh>
#include <inline-core/utility.hh>

#include <type_traits>

// Constructing and destroying Ts in raw slots.
//
// Nothing here tracks which slots are alive, the owning container does (fixed_vector::_size, the drain cursors).
// Every *_create_objects_to(p_end, ...) builds at p_end and bumps p_end after each finished object:
// if a constructor throws, [p_end before the call, p_end) is exactly what the caller has to destroy.

namespace ic::impl
{
/// Constructs one T from args in the uninitialized slot p_end, then advances p_end past it.
/// If the constructor throws, p_end is unchanged and the slot stays uninitialized.
template <class T, class... Args>
IC_FORCE_INLINE constexpr void emplace_at_end(T*& p_end, Args&&... args)
{
    new (ic::placement_new, p_end) T(ic::forward<Args>(args)...);
    ++p_end;
}

/// Copies count trivially copyable objects from src to the uninitialized slots at p_end, advancing p_end by count.
/// The ranges must not overlap. count == 0 is a no-op and allows nullptr for both pointers.
template <class T>
IC_FORCE_INLINE constexpr void bitwise_append(T*& p_end, T const* src, isize count)
{
    static_assert(std::is_trivially_copyable_v<T>, "bitwise copies need a trivially copyable element type");

    ic::memcpy(p_end, src, count * isize(sizeof(T)));
    p_end += count;
}

/// Runs ~T() on every object of [first, last), front to back.
///
/// Precondition: every slot in the range holds a live object.
/// Afterwards every slot in the range is uninitialized memory.
/// first == last (including two nullptrs) is a no-op, and so is the whole call for trivially destructible T.
template <class T>
constexpr void destroy_objects(T* first, T* last)
{
    static_assert(sizeof(T) > 0, "incomplete element type");

    if constexpr (!std::is_trivially_destructible_v<T>)
        for (; first != last; ++first)
            first->~T();
}

/// Value-initializes count objects starting at p_end (T(), so arithmetic types become zero).
///
/// Precondition: [p_end, p_end + count) is uninitialized memory.
/// On success p_end has advanced by count.
/// If a constructor throws, p_end points at the slot whose construction failed and everything before it is alive.
/// count <= 0 is a no-op.
template <class T>
constexpr void default_create_objects_to(T*& p_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "element type is not default constructible");

    for (isize i = 0; i < count; ++i)
        impl::emplace_at_end(p_end);
}

/// Copy-constructs count objects from value starting at p_end.
///
/// value must not live inside [p_end, p_end + count).
/// Same precondition and progress guarantee as default_create_objects_to.
template <class T>
constexpr void fill_create_objects_to(T*& p_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "element type is not copy constructible");

    for (isize i = 0; i < count; ++i)
        impl::emplace_at_end(p_end, value);
}

/// Copy-constructs the objects of [first, last) into the uninitialized slots starting at p_end.
///
/// The source range must be alive and must not overlap the destination.
/// On success p_end has advanced by last - first.
/// If a copy throws, p_end points at the slot whose construction failed and the source is untouched.
/// Trivially copyable T is copied with a single memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& p_end, T const* first, T const* last)
{
    static_assert(std::is_copy_constructible_v<T>, "element type is not copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
        impl::bitwise_append(p_end, first, last - first);
    else
        for (; first != last; ++first)
            impl::emplace_at_end(p_end, *first);
}

/// Move-constructs the objects of [first, last) into the uninitialized slots starting at p_end.
///
/// The source range stays alive in its moved-from state, destroying it is up to the caller.
/// Same overlap rule and progress guarantee as copy_create_objects_to.
/// A throwing move may leave some sources already moved from.
template <class T>
constexpr void move_create_objects_to(T*& p_end, T* first, T* last)
{
    static_assert(std::is_move_constructible_v<T>, "element type is not move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
        impl::bitwise_append(p_end, first, last - first);
    else
        for (; first != last; ++first)
            impl::emplace_at_end(p_end, ic::move(*first));
}

/// Moves count live objects from src to dest, the two ranges may overlap
///
/// Each element is move-constructed into its new slot and its old slot destroyed right after.
/// The walk direction is chosen so that no source is overwritten before it was moved:
///   dest < src: front to back
///   dest > src: back to front
/// Afterwards [dest, dest + count) is alive, the rest of [src, src + count) is dead.
/// Elements are never move-assigned. count <= 0 and dest == src are no-ops.
///
/// Non-trivially-copyable T needs a noexcept move constructor, so a relocation cannot stop halfway.
template <class T>
constexpr void relocate_objects(T* dest, T* src, isize count)
{
    if (count <= 0 || dest == src)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        ic::memmove(dest, src, count * isize(sizeof(T)));
    }
    else
    {
        static_assert(std::is_nothrow_move_constructible_v<T>, "relocating requires a noexcept move constructor");

        auto const relocate_at = [dest, src](isize i)
        {
            new (ic::placement_new, dest + i) T(ic::move(src[i]));
            src[i].~T();
        };

        if (dest < src)
            for (isize i = 0; i < count; ++i)
                relocate_at(i);
        else
            for (isize i = count - 1; i >= 0; --i)
                relocate_at(i);
    }
}
} // namespace ic::impl
