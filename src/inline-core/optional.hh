#pragma once

#include <inline-core/assert.hh>
#include <inline-core/fwd.hh>
#include <inline-core/utility.hh>

#include <type_traits>

/// Tag type of ic::nullopt, the "no value" state of optional
/// Not default constructible, so that `opt = {}` stays unambiguous.
struct ic::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace ic
{
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace ic

/// Either a T or nothing
///
/// Returned wherever an element leaves a container by move:
///   fixed_vector::pop_back()                 -> nullopt on an empty vector
///   fixed_vector_drain::next() / next_back() -> nullopt once the drained range is exhausted
/// The element is already owned by the optional when the caller sees it, the container slot is dead.
///
///   while (auto v = drain.next(); v.has_value())
///       consume(ic::move(v).value());
///
/// Access only through value(), which checks engagement (IC_ASSERT). There is no operator* or operator->.
/// Trivially copyable if T is.
template <class T>
struct ic::optional
{
    static_assert(!std::is_reference_v<T>, "optional does not support references");

public:
    optional() = default;
    constexpr optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
    {
        construct(ic::forward<U>(value));
    }

    // special members, trivial if T is trivially copyable
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            construct(rhs._storage.value);
    }

    /// rhs is empty afterwards
    optional(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            construct(ic::move(rhs._storage.value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
            assign_from(rhs);
        return *this;
    }

    /// rhs is empty afterwards, same as for move construction
    optional& operator=(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_assignable_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            assign_from(ic::move(rhs));
            rhs.reset();
        }
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    [[nodiscard]] T& value() &
    {
        IC_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        IC_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        IC_ASSERT(_has_value, "value() called on an empty optional");
        return ic::move(_storage.value);
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _storage.value;
        return static_cast<T>(ic::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        if (_has_value)
            return ic::move(_storage.value);
        return static_cast<T>(ic::forward<U>(fallback));
    }

    // modification
public:
    /// Replaces the content with a T constructed from args
    /// If that constructor throws, the optional is empty.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        construct(ic::forward<Args>(args)...);
        return _storage.value;
    }

    void reset()
    {
        if (_has_value)
        {
            _has_value = false;
            _storage.value.~T();
        }
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (!lhs._has_value || !rhs._has_value)
            return lhs._has_value == rhs._has_value;
        return lhs._storage.value == rhs._storage.value;
    }
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }
    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

private:
    /// Precondition: empty
    template <class... Args>
    constexpr void construct(Args&&... args)
    {
        new (ic::placement_new, &_storage.value) T(ic::forward<Args>(args)...);
        _has_value = true; // _after_ so a throwing T(...) leaves us empty
    }

    /// assigns element to element if T allows it, otherwise destroys and rebuilds
    /// (types with const members can still be moved into an engaged optional)
    template <class Opt>
    void assign_from(Opt&& rhs)
    {
        if (!rhs._has_value)
        {
            reset();
        }
        else if (_has_value)
        {
            if constexpr (std::is_assignable_v<T&, decltype((ic::forward<Opt>(rhs)._storage.value))>)
            {
                _storage.value = ic::forward<Opt>(rhs)._storage.value;
            }
            else
            {
                reset();
                construct(ic::forward<Opt>(rhs)._storage.value);
            }
        }
        else
        {
            construct(ic::forward<Opt>(rhs)._storage.value);
        }
    }

    ic::storage_for<T> _storage;
    bool _has_value = false;
};
