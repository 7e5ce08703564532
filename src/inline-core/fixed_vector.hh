#pragma once

#include <inline-core/assert.hh>
#include <inline-core/assertf.hh>
#include <inline-core/capacity_error.hh>
#include <inline-core/fixed_array.hh>
#include <inline-core/fixed_vector_drain.hh>
#include <inline-core/fwd.hh>
#include <inline-core/hash.hh>
#include <inline-core/impl/format_list.hh>
#include <inline-core/impl/object_lifetime_util.hh>
#include <inline-core/optional.hh>
#include <inline-core/result.hh>
#include <inline-core/span.hh>
#include <inline-core/utility.hh>

#include <algorithm>
#include <compare>
#include <format>
#include <functional>
#include <type_traits>

/// Fixed-capacity vector of up to N elements of type T.
/// Similar to a vector but with compile-time maximum capacity.
/// Does not perform dynamic allocation - all storage is inline.
///
/// Slots [0, size()) hold live objects, slots [size(), N) are raw bytes.
/// Every change of the size is paired with exactly the matching constructions or destructions,
/// so each live element is destroyed exactly once, on every exit path.
///
/// === Error reporting ===
///
/// Running out of capacity is an ordinary, recoverable condition:
///   - try_push_back / try_insert / try_extend_from_span return result<unit, capacity_error<P>>
///     and hand the rejected payload back, leaving the vector untouched
///   - push_back / emplace_back / insert treat it as a fatal error (IC_ASSERTF_ALWAYS)
///   - push_back_unchecked / emplace_back_unchecked only check it in debug (IC_ASSERT)
///
/// Index errors (operator[], try_insert, truncate, drain) are fatal in every build configuration
/// and report the offending index together with the current size.
///
/// === Exception guarantees ===
///
/// Element construction failures leave size and live range unchanged.
/// Shifting elements (insert, drain) relocates them, which requires a noexcept move constructor.
template <class T, ic::isize N>
struct ic::fixed_vector
{
    static_assert(N >= 0, "fixed_vector capacity must be non-negative");
    static_assert(!std::is_reference_v<T>, "fixed_vector does not support references");

    using push_result = ic::result<ic::unit, ic::capacity_error<T>>;
    using extend_result = ic::result<ic::unit, ic::capacity_error<ic::span<T const>>>;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Out-of-bounds access is fatal in every build configuration.
    [[nodiscard]] T& operator[](isize i)
    {
        IC_ASSERTF_ALWAYS(0 <= i && i < _size, "fixed_vector::operator[]: index {} is out of bounds in vector of size {}",
                          i, _size);
        return data()[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        IC_ASSERTF_ALWAYS(0 <= i && i < _size, "fixed_vector::operator[]: index {} is out of bounds in vector of size {}",
                          i, _size);
        return data()[i];
    }

    /// Returns a reference to the first element.
    /// Precondition: !empty().
    [[nodiscard]] T& front()
    {
        IC_ASSERT(_size > 0, "front() called on empty fixed_vector");
        return data()[0];
    }
    [[nodiscard]] T const& front() const
    {
        IC_ASSERT(_size > 0, "front() called on empty fixed_vector");
        return data()[0];
    }

    /// Returns a reference to the last element.
    /// Precondition: !empty().
    [[nodiscard]] T& back()
    {
        IC_ASSERT(_size > 0, "back() called on empty fixed_vector");
        return data()[_size - 1];
    }
    [[nodiscard]] T const& back() const
    {
        IC_ASSERT(_size > 0, "back() called on empty fixed_vector");
        return data()[_size - 1];
    }

    /// Returns a pointer to the inline storage.
    /// Never nullptr, but only [data(), data() + size()) may be dereferenced.
    [[nodiscard]] T* data() { return reinterpret_cast<T*>(_storage); } // NOLINT
    [[nodiscard]] T const* data() const { return reinterpret_cast<T const*>(_storage); } // NOLINT

    /// Views exactly the live elements [0, size()).
    /// Slicing: vec.as_span().subspan(offset, count).
    [[nodiscard]] span<T> as_span() { return span<T>(data(), _size); }
    [[nodiscard]] span<T const> as_span() const { return span<T const>(data(), _size); }

    // iterators
public:
    [[nodiscard]] T* begin() { return data(); }
    [[nodiscard]] T* end() { return data() + _size; }
    [[nodiscard]] T const* begin() const { return data(); }
    [[nodiscard]] T const* end() const { return data() + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    /// The compile-time capacity N, independent of the current size.
    [[nodiscard]] static constexpr isize capacity() { return N; }
    [[nodiscard]] constexpr bool is_full() const { return _size == N; }
    [[nodiscard]] constexpr isize remaining_capacity() const { return N - _size; }

    // appends
public:
    /// Constructs a new element at the back.
    /// Precondition: !is_full(), only checked by IC_ASSERT (compiled out in release builds).
    /// Low-level primitive for code that already knows there is room.
    template <class... Args>
    T& emplace_back_unchecked(Args&&... args)
    {
        static_assert(
            requires { T(ic::forward<Args>(args)...); }, "emplace_back_unchecked: T is not constructible from "
                                                         "the provided argument types");
        IC_ASSERT(_size < N, "emplace_back_unchecked on a full fixed_vector");
        auto const p = new (ic::placement_new, data() + _size) T(ic::forward<Args>(args)...);
        ++_size; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }
    T& push_back_unchecked(T const& value) { return emplace_back_unchecked(value); }
    T& push_back_unchecked(T&& value) { return emplace_back_unchecked(ic::move(value)); }

    /// Appends value if there is room.
    /// Otherwise returns it inside a capacity_error and leaves the vector unchanged.
    [[nodiscard]] push_result try_push_back(T const& value)
    {
        if (is_full())
            return ic::error(capacity_error<T>{value});

        emplace_back_unchecked(value);
        return ic::unit{};
    }
    [[nodiscard]] push_result try_push_back(T&& value)
    {
        if (is_full())
            return ic::error(capacity_error<T>{ic::move(value)});

        emplace_back_unchecked(ic::move(value));
        return ic::unit{};
    }

    /// Constructs a new element at the back.
    /// A full vector is a fatal error, use try_push_back to handle it.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        IC_ASSERTF_ALWAYS(_size < N, "fixed_vector::emplace_back(): {} (capacity {})", capacity_error<T>::message(), N);
        return emplace_back_unchecked(ic::forward<Args>(args)...);
    }
    T& push_back(T const& value)
    {
        IC_ASSERTF_ALWAYS(_size < N, "fixed_vector::push_back(): {} (capacity {})", capacity_error<T>::message(), N);
        return emplace_back_unchecked(value);
    }
    T& push_back(T&& value)
    {
        IC_ASSERTF_ALWAYS(_size < N, "fixed_vector::push_back(): {} (capacity {})", capacity_error<T>::message(), N);
        return emplace_back_unchecked(ic::move(value));
    }

    /// Appends a copy of every element of other, or nothing at all.
    /// If other does not fit, returns it inside a capacity_error and leaves the vector unchanged.
    /// other may view elements of this vector.
    [[nodiscard]] extend_result try_extend_from_span(span<T const> other)
        requires std::is_trivially_copyable_v<T>
    {
        if (remaining_capacity() < other.size())
            return ic::error(capacity_error<span<T const>>{other});

        auto p_end = end();
        impl::copy_create_objects_to(p_end, other.begin(), other.end());
        _size += other.size();
        return ic::unit{};
    }

    // inserts
public:
    /// Inserts value at index, shifting [index, size()) one slot to the right.
    /// index == size() appends. index < 0 or index > size() is fatal.
    /// If the vector is full, returns value inside a capacity_error and leaves the vector unchanged.
    /// value may alias an element of this vector.
    [[nodiscard]] push_result try_insert(isize index, T const& value)
    {
        IC_ASSERTF_ALWAYS(0 <= index && index <= _size,
                          "fixed_vector::try_insert(): index {} is out of bounds in vector of size {}", index, _size);

        if (is_full())
            return ic::error(capacity_error<T>{value});

        insert_relocating(index, T(value));
        return ic::unit{};
    }
    [[nodiscard]] push_result try_insert(isize index, T&& value)
    {
        IC_ASSERTF_ALWAYS(0 <= index && index <= _size,
                          "fixed_vector::try_insert(): index {} is out of bounds in vector of size {}", index, _size);

        if (is_full())
            return ic::error(capacity_error<T>{ic::move(value)});

        insert_relocating(index, T(ic::move(value)));
        return ic::unit{};
    }

    /// Like try_insert, but a full vector is a fatal error.
    void insert(isize index, T const& value)
    {
        auto const res = try_insert(index, value);
        IC_ASSERTF_ALWAYS(res.has_value(), "fixed_vector::insert(): {} (capacity {})", capacity_error<T>::message(), N);
    }
    void insert(isize index, T&& value)
    {
        auto const res = try_insert(index, ic::move(value));
        IC_ASSERTF_ALWAYS(res.has_value(), "fixed_vector::insert(): {} (capacity {})", capacity_error<T>::message(), N);
    }

    // removals
public:
    /// Removes and returns the last element by move, nullopt if empty.
    /// O(1) complexity.
    /// NOTE: Prefer remove_back() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_back() if you don't need the return value")]] optional<T> pop_back()
    {
        if (_size == 0)
            return ic::nullopt;

        auto const p = data() + _size - 1;
        optional<T> value(ic::move(*p));
        p->~T();
        --_size;
        return value;
    }

    /// Destroys the last element.
    /// Precondition: !empty().
    void remove_back()
    {
        IC_ASSERT(_size > 0, "cannot remove from empty fixed_vector");
        --_size;
        data()[_size].~T();
    }

    /// Shortens the vector to new_size, destroying [new_size, size()) in index order.
    /// No-op if new_size >= size(). Negative sizes are fatal.
    void truncate(isize new_size)
    {
        IC_ASSERTF_ALWAYS(new_size >= 0, "fixed_vector::truncate(): size {} is negative (vector size is {})", new_size, _size);

        if (new_size < _size)
        {
            // size first, so the vector never exposes a destroyed element
            auto const old_size = ic::exchange(_size, new_size);
            impl::destroy_objects(data() + new_size, data() + old_size);
        }
    }

    /// Destroys all elements, size becomes 0.
    void clear() { truncate(0); }

    /// Removes [start, end) through a cursor that yields the removed elements by move.
    /// From the call on, the vector reports size() == start; the cursor's destructor destroys any
    /// elements that were not taken, closes the gap, and restores the size to size() - (end - start).
    /// The vector must not be touched while the cursor is alive.
    /// A range outside [0, size()] is fatal.
    ///
    /// Usage:
    ///   for (auto&& v : vec.drain(1, 3))
    ///       use(ic::move(v));
    [[nodiscard]] fixed_vector_drain<T, N> drain(isize start, isize end)
    {
        IC_ASSERTF_ALWAYS(0 <= start && start <= end && end <= _size,
                          "fixed_vector::drain(): range [{}, {}) is out of bounds in vector of size {}", start, end, _size);
        return fixed_vector_drain<T, N>(*this, start, end);
    }

    // factories
public:
    /// Moves every element of the array into a new, full vector.
    [[nodiscard]] static fixed_vector create_from(fixed_array<T, N> array) { return fixed_vector(ic::move(array)); }

    /// Creates a vector with size default-constructed elements.
    /// size > N is fatal.
    [[nodiscard]] static fixed_vector create_defaulted(isize size)
    {
        IC_ASSERTF_ALWAYS(0 <= size && size <= N, "fixed_vector::create_defaulted(): size {} exceeds capacity {}", size, N);
        fixed_vector v;
        {
            size_sync sync{v, v.data()};
            impl::default_create_objects_to(sync.p_end, size);
        }
        return v;
    }

    /// Creates a vector with size copies of value.
    /// size > N is fatal.
    [[nodiscard]] static fixed_vector create_filled(isize size, T const& value)
    {
        IC_ASSERTF_ALWAYS(0 <= size && size <= N, "fixed_vector::create_filled(): size {} exceeds capacity {}", size, N);
        fixed_vector v;
        {
            size_sync sync{v, v.data()};
            impl::fill_create_objects_to(sync.p_end, size, value);
        }
        return v;
    }

    /// Creates a deep copy of the provided span.
    /// source.size() > N is fatal.
    [[nodiscard]] static fixed_vector create_copy_of(span<T const> source)
    {
        IC_ASSERTF_ALWAYS(source.size() <= N, "fixed_vector::create_copy_of(): size {} exceeds capacity {}", source.size(), N);
        fixed_vector v;
        {
            size_sync sync{v, v.data()};
            impl::copy_create_objects_to(sync.p_end, source.begin(), source.end());
        }
        return v;
    }

    // ctors
public:
    fixed_vector() = default;

    /// Takes over all N elements of the array; the result is full.
    explicit fixed_vector(fixed_array<T, N>&& array) : fixed_vector()
    {
        size_sync sync{*this, data()};
        impl::move_create_objects_to(sync.p_end, array.begin(), array.end());
    }
    explicit fixed_vector(fixed_array<T, N> const& array) : fixed_vector()
    {
        size_sync sync{*this, data()};
        impl::copy_create_objects_to(sync.p_end, array.begin(), array.end());
    }

    /// Copies each live element in index order.
    /// The delegating ctor makes a throwing element copy unwind through ~fixed_vector.
    fixed_vector(fixed_vector const& rhs)
        requires std::is_copy_constructible_v<T>
      : fixed_vector()
    {
        size_sync sync{*this, data()};
        impl::copy_create_objects_to(sync.p_end, rhs.begin(), rhs.end());
    }

    /// Moves each live element in index order and leaves rhs empty.
    fixed_vector(fixed_vector&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) : fixed_vector()
    {
        {
            size_sync sync{*this, data()};
            impl::move_create_objects_to(sync.p_end, rhs.begin(), rhs.end());
        }
        rhs.clear();
    }

    /// Strong guarantee: if copying an element throws, *this is unchanged.
    fixed_vector& operator=(fixed_vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            fixed_vector copy(rhs);
            *this = ic::move(copy);
        }
        return *this;
    }

    /// Destroys the current elements, then moves over rhs's elements and leaves rhs empty.
    fixed_vector& operator=(fixed_vector&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            clear();
            {
                size_sync sync{*this, data()};
                impl::move_create_objects_to(sync.p_end, rhs.begin(), rhs.end());
            }
            rhs.clear();
        }
        return *this;
    }

    ~fixed_vector()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~fixed_vector()
        requires(!std::is_trivially_destructible_v<T>)
    {
        impl::destroy_objects(data(), data() + _size);
    }

private:
    /// Constructs value at index after shifting the tail one slot right.
    /// value is a temporary owned by the caller, so it cannot alias a slot that is being relocated.
    void insert_relocating(isize index, T&& value)
    {
        IC_ASSERT(_size < N, "insert_relocating on a full fixed_vector");
        auto const p = data() + index;
        impl::relocate_objects(p + 1, p, _size - index);

        // moves out of a temporary are noexcept (required by relocate_objects), nothing to roll back
        new (ic::placement_new, p) T(ic::move(value));
        ++_size;
    }

    /// Keeps _size equal to a construction cursor, also when a constructor throws halfway.
    /// The construction helpers in impl advance p_end only after each successful construction.
    struct size_sync
    {
        fixed_vector& vec;
        T* p_end;

        ~size_sync() { vec._size = p_end - vec.data(); }
    };

    // members
private:
    alignas(T) ic::byte _storage[sizeof(T) * (N > 0 ? N : 1)];
    isize _size = 0;

    friend struct fixed_vector_drain<T, N>;
};

// comparison
// operate on the live elements only, capacities are irrelevant

namespace ic
{
template <class T, isize N, isize M>
[[nodiscard]] bool operator==(fixed_vector<T, N> const& lhs, fixed_vector<T, M> const& rhs)
    requires requires(T const& v) { bool(v == v); }
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

template <class T, isize N>
[[nodiscard]] bool operator==(fixed_vector<T, N> const& lhs, span<T const> rhs)
    requires requires(T const& v) { bool(v == v); }
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/// Lexicographical ordering
template <class T, isize N, isize M>
[[nodiscard]] auto operator<=>(fixed_vector<T, N> const& lhs, fixed_vector<T, M> const& rhs)
    requires std::three_way_comparable<T>
{
    return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}
} // namespace ic

/// Hash of the live elements, equal vectors of different capacities hash equal.
template <class T, ic::isize N>
struct std::hash<ic::fixed_vector<T, N>>
{
    [[nodiscard]] std::size_t operator()(ic::fixed_vector<T, N> const& v) const { return ic::hash_range(v.begin(), v.end()); }
};

/// Debug output of the live elements: std::format("{}", vec) gives "[1, 2, 3]"
template <class T, ic::isize N>
    requires std::formattable<T, char>
struct std::formatter<ic::fixed_vector<T, N>, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(ic::fixed_vector<T, N> const& v, std::format_context& ctx) const
    {
        return ic::impl::format_list(ctx.out(), v.begin(), v.end());
    }
};

/// Debug output of the elements the drain has not yielded yet
template <class T, ic::isize N>
    requires std::formattable<T, char>
struct std::formatter<ic::fixed_vector_drain<T, N>, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(ic::fixed_vector_drain<T, N> const& d, std::format_context& ctx) const
    {
        auto const rest = d.as_span();
        return ic::impl::format_list(ctx.out(), rest.begin(), rest.end());
    }
};
