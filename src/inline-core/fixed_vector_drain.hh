#pragma once

#include <inline-core/assert.hh>
#include <inline-core/fwd.hh>
#include <inline-core/impl/object_lifetime_util.hh>
#include <inline-core/optional.hh>
#include <inline-core/span.hh>
#include <inline-core/utility.hh>

/// Cursor that removes the range [start, end) from a fixed_vector<T, N>, created by fixed_vector::drain.
///
/// Yields the removed elements by move from either end; next() and next_back() may be interleaved.
/// The cursor borrows the vector exclusively for its whole lifetime.
///
/// Lifecycle:
///   - creation: the vector's size is cut down to start, so the vector never exposes a slot the
///     cursor is responsible for, even if the cursor is never destroyed
///   - next / next_back: move an element out and destroy its slot
///   - destruction: destroys every element that was not yielded (in index order), relocates the
///     surviving tail [end, old size) down to start and sets the size to start + tail size
///
/// Destruction is the only cleanup path, so normal exhaustion, early abandonment, and unwinding
/// out of a loop body all end in the same state.
///
/// Usage:
///   auto vec = ic::fixed_vector<std::string, 8>::create_copy_of({"a", "b", "c", "d", "e"});
///   {
///       auto d = vec.drain(1, 3);
///       auto b = d.next();      // "b"
///   }                           // "c" is destroyed, vec is now {"a", "d", "e"}
///
/// Not copyable or movable: fixed_vector::drain returns it as a prvalue.
template <class T, ic::isize N>
struct ic::fixed_vector_drain
{
    /// Single-pass iterator, each increment calls next().
    /// Holds the current element by value; dereferencing gives access to it until the next increment.
    struct iterator
    {
        explicit iterator(fixed_vector_drain* drain) : _drain(drain), _current(drain->next()) {}

        [[nodiscard]] T& operator*() { return _current.value(); }

        /// rebuilds _current instead of assigning to it, T only needs to be move constructible
        iterator& operator++()
        {
            _current.reset();
            if (auto v = _drain->next(); v.has_value())
                _current.emplace(ic::move(v).value());
            return *this;
        }

        [[nodiscard]] friend bool operator==(iterator const& it, ic::sentinel) { return !it._current.has_value(); }

    private:
        fixed_vector_drain* _drain;
        optional<T> _current;
    };

    // cursor
public:
    /// Moves out the first not-yet-yielded element, nullopt once the range is exhausted.
    [[nodiscard]] optional<T> next()
    {
        if (_head == _tail)
            return ic::nullopt;

        auto const p = _head;
        optional<T> value(ic::move(*p));
        ++_head; // _after_ so a throwing move leaves the element owned by the cursor
        p->~T();
        return value;
    }

    /// Moves out the last not-yet-yielded element, nullopt once the range is exhausted.
    [[nodiscard]] optional<T> next_back()
    {
        if (_head == _tail)
            return ic::nullopt;

        auto const p = _tail - 1;
        optional<T> value(ic::move(*p));
        --_tail;
        p->~T();
        return value;
    }

    /// Exact number of elements that next() / next_back() will still yield.
    [[nodiscard]] isize size() const { return _tail - _head; }
    [[nodiscard]] bool empty() const { return _head == _tail; }

    /// The elements next() / next_back() will still yield, in index order.
    [[nodiscard]] span<T const> as_span() const { return span<T const>(_head, _tail - _head); }

    // range-for
public:
    [[nodiscard]] iterator begin() { return iterator(this); }
    [[nodiscard]] ic::sentinel end() const { return {}; }

    // lifetime
public:
    fixed_vector_drain(fixed_vector_drain const&) = delete;
    fixed_vector_drain(fixed_vector_drain&&) = delete;
    fixed_vector_drain& operator=(fixed_vector_drain const&) = delete;
    fixed_vector_drain& operator=(fixed_vector_drain&&) = delete;

    ~fixed_vector_drain()
    {
        impl::destroy_objects(_head, _tail);
        _head = _tail;

        auto const p_data = _vec->data();
        impl::relocate_objects(p_data + _drain_start, p_data + _tail_start, _tail_size);
        _vec->_size = _drain_start + _tail_size;
    }

private:
    /// Precondition: 0 <= start <= end <= vec.size(), checked by fixed_vector::drain.
    fixed_vector_drain(fixed_vector<T, N>& vec, isize start, isize end)
      : _vec(&vec),
        _head(vec.data() + start),
        _tail(vec.data() + end),
        _drain_start(start),
        _tail_start(end),
        _tail_size(vec.size() - end)
    {
        IC_ASSERT(0 <= start && start <= end && end <= vec.size(), "invalid drain range");
        vec._size = start;
    }

    // members
private:
    fixed_vector<T, N>* _vec;

    /// [_head, _tail) are the live, not-yet-yielded elements of the drained range
    T* _head;
    T* _tail;

    isize _drain_start;
    isize _tail_start;
    /// number of live elements behind the drained range
    isize _tail_size;

    friend struct fixed_vector<T, N>;
};
