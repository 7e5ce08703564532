#pragma once

#include <inline-core/fwd.hh>

#include <format>

/// Error returned by the try_ mutators of fixed_vector when the inline storage has no room left.
/// Carries the rejected payload back to the caller, so nothing is lost when an insertion fails:
///   - try_push_back / try_insert: the element itself (P = T)
///   - try_extend_from_span: the span that did not fit (P = span<T const>)
///
/// Usage:
///   auto res = vec.try_push_back(ic::move(item));
///   if (res.has_error())
///       item = ic::move(res.error().value); // take it back
template <class P>
struct ic::capacity_error
{
    P value;

    /// Human-readable description, identical for every payload type
    [[nodiscard]] static constexpr char const* message() { return "insufficient capacity"; }

    [[nodiscard]] friend bool operator==(capacity_error const& lhs, capacity_error const& rhs)
        requires requires(P const& p) { bool(p == p); }
    {
        return lhs.value == rhs.value;
    }
};

/// std::format("{}", err) writes message(), the payload is not printed
template <class P>
struct std::formatter<ic::capacity_error<P>, char>
{
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(ic::capacity_error<P> const&, std::format_context& ctx) const
    {
        return std::format_to(ctx.out(), "{}", ic::capacity_error<P>::message());
    }
};
