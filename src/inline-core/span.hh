#pragma once

#include <inline-core/assert.hh>
#include <inline-core/assertf.hh>
#include <inline-core/fwd.hh>

#include <initializer_list>
#include <type_traits>

/// Borrowed (pointer, count) view of contiguous Ts
///
/// fixed_vector exposes its live prefix through it:
///   auto s = vec.as_span();            // views [0, vec.size())
///   vec.try_extend_from_span({1, 2});  // span<T const> from a braced list
///
/// Nothing is owned: the viewed storage must outlive every span over it.
/// Copying a span never copies elements, so it is trivially copyable for every T.
/// subspan/first/last are range-checked in all configurations, element access only with IC_ASSERT.
template <class T>
struct ic::span
{
public:
    constexpr span() = default;

    constexpr explicit span(T* first, isize count) : _data(first), _size(count)
    {
        IC_ASSERT(count >= 0, "negative span size");
    }
    constexpr explicit span(T* first, T* last) : _data(first), _size(last - first)
    {
        IC_ASSERT(first <= last, "span end precedes its begin");
    }

    template <std::size_t N>
    constexpr span(T (&elements)[N]) : _data(elements), _size(isize(N)) // NOLINT
    {
    }

    /// CAREFUL: the list's backing array dies at the end of the full expression,
    ///          only use this for arguments
    constexpr span(std::initializer_list<std::remove_const_t<T>> list) // NOLINT
        requires std::is_const_v<T>
      : _data(list.begin()), _size(isize(list.size()))
    {
    }

    /// anything with .data() and .size(), e.g. std::vector, fixed_array, fixed_vector
    template <class Range>
        requires(!std::is_same_v<std::remove_cvref_t<Range>, span> && requires(Range&& r) {
            { r.data() } -> std::convertible_to<T*>;
            { r.size() } -> std::convertible_to<isize>;
        })
    constexpr explicit span(Range&& range) : _data(range.data()), _size(isize(range.size()))
    {
    }

    /// span<T> -> span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<U const, T>)
    constexpr span(span<U> mutable_view) : _data(mutable_view.data()), _size(mutable_view.size()) // NOLINT
    {
    }

public:
    [[nodiscard]] constexpr T* data() const { return _data; }
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        IC_ASSERT(0 <= i && i < _size, "span index out of bounds");
        return _data[i];
    }
    [[nodiscard]] constexpr T& front() const
    {
        IC_ASSERT(_size > 0, "front() of an empty span");
        return *_data;
    }
    [[nodiscard]] constexpr T& back() const
    {
        IC_ASSERT(_size > 0, "back() of an empty span");
        return _data[_size - 1];
    }

    // slicing
public:
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        IC_ASSERTF_ALWAYS(0 <= offset && 0 <= count && offset + count <= _size,
                          "span::subspan(): range [{}, {}) is out of bounds in span of size {}", offset, offset + count, _size);
        return span(_data + offset, count);
    }
    [[nodiscard]] constexpr span subspan(isize offset) const
    {
        IC_ASSERTF_ALWAYS(0 <= offset && offset <= _size, "span::subspan(): offset {} is out of bounds in span of size {}",
                          offset, _size);
        return span(_data + offset, _size - offset);
    }

    [[nodiscard]] constexpr span first(isize count) const { return subspan(0, count); }
    [[nodiscard]] constexpr span last(isize count) const { return subspan(_size - count, count); }

    /// compares elements, not addresses
    [[nodiscard]] friend constexpr bool operator==(span lhs, span rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._size != rhs._size)
            return false;
        for (isize i = 0; i < lhs._size; ++i)
            if (!(lhs._data[i] == rhs._data[i]))
                return false;
        return true;
    }

private:
    T* _data = nullptr;
    isize _size = 0;
};
