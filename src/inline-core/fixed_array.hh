#pragma once

#include <inline-core/assertf.hh>
#include <inline-core/fwd.hh>
#include <inline-core/hash.hh>

#include <algorithm>
#include <compare>
#include <functional>
#include <utility>

/// Array of exactly N elements, the fully populated counterpart of fixed_vector<T, N>
///
/// An aggregate, so it is written like a C array:
///   ic::fixed_array<int, 3> arr = {1, 2, 3};
///   auto vec = ic::fixed_vector<int, 3>::create_from({1, 2, 3}); // full vector
///
/// Index errors are fatal in every build configuration, same as for fixed_vector.
/// Supports structured bindings, equality, lexicographical ordering and std::hash.
template <class T, ic::isize N>
struct ic::fixed_array
{
    static_assert(N >= 0, "fixed_array size must be non-negative");

    // public for aggregate initialization, not meant to be used directly
    T _data[N];

public:
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        IC_ASSERTF_ALWAYS(0 <= i && i < N, "fixed_array::operator[]: index {} is out of bounds in array of size {}", i, N);
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        IC_ASSERTF_ALWAYS(0 <= i && i < N, "fixed_array::operator[]: index {} is out of bounds in array of size {}", i, N);
        return _data[i];
    }

    /// compile-time checked access, also used by structured bindings
    template <isize I>
    [[nodiscard]] constexpr T& get()
    {
        static_assert(0 <= I && I < N, "fixed_array::get: index out of bounds");
        return _data[I];
    }
    template <isize I>
    [[nodiscard]] constexpr T const& get() const
    {
        static_assert(0 <= I && I < N, "fixed_array::get: index out of bounds");
        return _data[I];
    }

    [[nodiscard]] constexpr T& front() { return _data[0]; }
    [[nodiscard]] constexpr T& back() { return _data[N - 1]; }
    [[nodiscard]] constexpr T const& front() const { return _data[0]; }
    [[nodiscard]] constexpr T const& back() const { return _data[N - 1]; }

    [[nodiscard]] constexpr T* data() { return _data; }
    [[nodiscard]] constexpr T const* data() const { return _data; }

    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + N; }
    [[nodiscard]] constexpr T const* end() const { return _data + N; }

    [[nodiscard]] static constexpr isize size() { return N; }
    [[nodiscard]] static constexpr bool empty() { return N == 0; }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(fixed_array const& lhs, fixed_array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return std::equal(lhs._data, lhs._data + N, rhs._data);
    }

    [[nodiscard]] friend constexpr auto operator<=>(fixed_array const& lhs, fixed_array const& rhs)
        requires std::three_way_comparable<T>
    {
        return std::lexicographical_compare_three_way(lhs._data, lhs._data + N, rhs._data, rhs._data + N);
    }
};

/// T[0] is ill-formed, so the empty array has no storage at all
/// (and T does not even need to be constructible).
template <class T>
struct ic::fixed_array<T, 0>
{
    [[nodiscard]] constexpr T* data() const { return nullptr; }
    [[nodiscard]] constexpr T* begin() const { return nullptr; }
    [[nodiscard]] constexpr T* end() const { return nullptr; }

    [[nodiscard]] static constexpr isize size() { return 0; }
    [[nodiscard]] static constexpr bool empty() { return true; }

    [[nodiscard]] friend constexpr bool operator==(fixed_array, fixed_array) { return true; }
    [[nodiscard]] friend constexpr std::strong_ordering operator<=>(fixed_array, fixed_array)
    {
        return std::strong_ordering::equal;
    }
};

template <class T, ic::isize N>
struct std::tuple_size<ic::fixed_array<T, N>> : std::integral_constant<std::size_t, std::size_t(N)>
{
};

template <std::size_t I, class T, ic::isize N>
struct std::tuple_element<I, ic::fixed_array<T, N>>
{
    using type = T;
};

/// Same hash as any fixed_vector with equal contents
template <class T, ic::isize N>
struct std::hash<ic::fixed_array<T, N>>
{
    [[nodiscard]] std::size_t operator()(ic::fixed_array<T, N> const& arr) const
    {
        return ic::hash_range(arr.begin(), arr.end());
    }
};
