#pragma once

#include <inline-core/assert.hh>
#include <inline-core/utility.hh>

#include <format>

// Fatal error checks with std::format messages
//
// Used wherever the runtime values are the diagnostic, e.g. index errors:
//   IC_ASSERTF_ALWAYS(0 <= i && i < _size, "fixed_vector::operator[]: index {} is out of bounds in vector of size {}", i, _size);
//
// The format string is checked at compile time.
// Arguments are only evaluated and formatted once the condition has failed.

#define IC_ASSERTF(cond, msg, ...) IC_IMPL_ASSERTF(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#define IC_ASSERTF_ALWAYS(cond, msg, ...) IC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)

namespace ic::impl
{
// formats the message and forwards to handle_assert_failure
template <class... Args>
IC_COLD_FUNC void handle_assertf_failure(char const* expression,
                                         ic::source_location location,
                                         std::format_string<Args...> fmt,
                                         Args&&... args)
{
    auto const message = std::format(fmt, ic::forward<Args>(args)...);
    handle_assert_failure(expression, message.c_str(), location);
}
} // namespace ic::impl

// =========================================================================================================
// Implementation details
// =========================================================================================================

#define IC_IMPL_ASSERTF_ALWAYS(cond, ...)                                                                \
    do                                                                                                   \
    {                                                                                                    \
        if (!(cond)) [[unlikely]]                                                                        \
        {                                                                                                \
            ::ic::impl::handle_assertf_failure(#cond, ::ic::source_location::current(), __VA_ARGS__);    \
            IC_BREAK_AND_ABORT();                                                                        \
        }                                                                                                \
    } while (false)

#if IC_ASSERT_ENABLED
#define IC_IMPL_ASSERTF(cond, ...) IC_IMPL_ASSERTF_ALWAYS(cond, __VA_ARGS__)
#else
// compiled, never evaluated
#define IC_IMPL_ASSERTF(cond, ...)           \
    do                                       \
    {                                        \
        IC_UNUSED(cond);                     \
        IC_UNUSED(std::format(__VA_ARGS__)); \
    } while (false)
#endif
