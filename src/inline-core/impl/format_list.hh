#pragma once

#include <inline-core/fwd.hh>

#include <format>
#include <string_view>
#include <type_traits>

namespace ic::impl
{
/// Writes [first, last) as "[e0, e1, ...]" for debug output
/// String-likes are wrapped in "..." and chars in '...', so empty elements stay visible.
/// Everything else goes through the element's std::formatter.
template <class T, class Out>
Out format_list(Out out, T const* first, T const* last)
{
    *out++ = '[';
    for (auto it = first; it != last; ++it)
    {
        if (it != first)
            out = std::format_to(out, ", ");

        if constexpr (std::is_same_v<T, char>)
            out = std::format_to(out, "'{}'", *it);
        else if constexpr (std::is_convertible_v<T const&, std::string_view>)
            out = std::format_to(out, "\"{}\"", std::string_view(*it));
        else
            out = std::format_to(out, "{}", *it);
    }
    *out++ = ']';
    return out;
}
} // namespace ic::impl
