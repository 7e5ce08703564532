#pragma once

#include <inline-core/assert.hh>
#include <inline-core/fwd.hh>
#include <inline-core/utility.hh>

#include <type_traits>

/// Tag wrapper that marks a value as the error alternative of a result
/// Created via ic::error(e), never spelled out directly.
template <class E>
struct ic::as_error_t
{
    E value;
};

namespace ic
{
namespace impl
{
template <class T>
constexpr bool is_as_error = false;
template <class E>
constexpr bool is_as_error<as_error_t<E>> = true;
} // namespace impl

/// Wraps e so that it initializes the error alternative of a result
/// Usage:
///   return ic::error(ic::capacity_error<T>{ic::move(item)});
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return {ic::forward<E>(e)};
}
} // namespace ic

/// Sum type representing either a success value T or an error value E
/// Used for operations that can fail with detailed error information.
/// In inline-core this is the return type of all try_ mutators: result<unit, capacity_error<P>>.
///
/// A default-constructed result holds a default-constructed error.
/// Trivially copyable when both T and E are.
/// Moving from a result leaves the source in its current alternative with a moved-from object.
template <class T, class E>
struct ic::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    // construction
public:
    result() : _error(), _has_value(false) {}

    /// Constructs the success alternative from anything T can be constructed from
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && !impl::is_as_error<std::remove_cvref_t<U>>
                 && std::is_constructible_v<T, U &&>)
    result(U&& value) : _value(ic::forward<U>(value)), _has_value(true) // NOLINT
    {
    }

    /// Constructs the error alternative, usually from ic::error(e)
    template <class F>
        requires std::is_constructible_v<E, F&&>
    result(as_error_t<F>&& err) : _error(ic::move(err.value)), _has_value(false) // NOLINT
    {
    }
    template <class F>
        requires std::is_constructible_v<E, F const&>
    result(as_error_t<F> const& err) : _error(err.value), _has_value(false) // NOLINT
    {
    }

    /// Converts from a result with compatible value and error types
    template <class U, class F>
        requires(!std::is_same_v<result<U, F>, result> && std::is_constructible_v<T, U &&> && std::is_constructible_v<E, F &&>)
    explicit result(result<U, F>&& rhs) : _has_value(rhs.has_value())
    {
        if (_has_value)
            new (ic::placement_new, &_value) T(ic::move(rhs).value());
        else
            new (ic::placement_new, &_error) E(ic::move(rhs).error());
    }

    // trivial copy/move/destroy
public:
    result(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;

    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    result(result const& rhs)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ic::placement_new, &_value) T(rhs._value);
        else
            new (ic::placement_new, &_error) E(rhs._error);
    }

    result(result&& rhs) noexcept
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>))
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ic::placement_new, &_value) T(ic::move(rhs._value));
        else
            new (ic::placement_new, &_error) E(ic::move(rhs._error));
    }

    result& operator=(result const& rhs)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
                emplace_value(rhs._value);
            else
                emplace_error(rhs._error);
        }
        return *this;
    }

    result& operator=(result&& rhs) noexcept
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>))
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
                emplace_value(ic::move(rhs._value));
            else
                emplace_error(ic::move(rhs._error));
        }
        return *this;
    }

    ~result()
        requires(!(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>))
    {
        destroy_active();
    }

    // observers
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Precondition: has_value()
    [[nodiscard]] T& value() &
    {
        IC_ASSERT(_has_value, "result holds an error, not a value");
        return _value;
    }
    [[nodiscard]] T const& value() const&
    {
        IC_ASSERT(_has_value, "result holds an error, not a value");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        IC_ASSERT(_has_value, "result holds an error, not a value");
        return ic::move(_value);
    }

    /// Precondition: has_error()
    [[nodiscard]] E& error() &
    {
        IC_ASSERT(!_has_value, "result holds a value, not an error");
        return _error;
    }
    [[nodiscard]] E const& error() const&
    {
        IC_ASSERT(!_has_value, "result holds a value, not an error");
        return _error;
    }
    [[nodiscard]] E&& error() &&
    {
        IC_ASSERT(!_has_value, "result holds a value, not an error");
        return ic::move(_error);
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _value : static_cast<T>(ic::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? ic::move(_value) : static_cast<T>(ic::forward<U>(fallback));
    }

    template <class F>
    [[nodiscard]] E error_or(F&& fallback) const&
    {
        return !_has_value ? _error : static_cast<E>(ic::forward<F>(fallback));
    }
    template <class F>
    [[nodiscard]] E error_or(F&& fallback) &&
    {
        return !_has_value ? ic::move(_error) : static_cast<E>(ic::forward<F>(fallback));
    }

    // modifiers
public:
    /// Destroys the active alternative and constructs a value in place
    /// The new value is built before the old alternative dies, so a throwing constructor leaves *this untouched.
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        T tmp(ic::forward<Args>(args)...);
        destroy_active();
        new (ic::placement_new, &_value) T(ic::move(tmp));
        _has_value = true;
        return _value;
    }

    /// Destroys the active alternative and constructs an error in place
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        E tmp(ic::forward<Args>(args)...);
        destroy_active();
        new (ic::placement_new, &_error) E(ic::move(tmp));
        _has_value = false;
        return _error;
    }

private:
    void destroy_active()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};
