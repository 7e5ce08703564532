#pragma once

#include <inline-core/macros.hh>
#include <inline-core/source_location.hh>

// Fatal error checks
//
// inline-core reports two kinds of errors:
//   - recoverable: running out of capacity in a try_ mutator -> result<unit, capacity_error<P>>
//   - fatal:       programmer errors, reported through the macros below and followed by an abort
//
//   IC_ASSERT(cond, "literal")            debug check, stripped when IC_ASSERT_ENABLED == 0
//                                         (unchecked primitives like push_back_unchecked, internal bookkeeping)
//   IC_ASSERT_ALWAYS(cond, "literal")     checked in every configuration
//   IC_ASSERTF / IC_ASSERTF_ALWAYS        same with std::format messages, see <inline-core/assertf.hh>
//                                         (index errors and exhausted capacity in the non-try_ mutators)
//
// A failed check reports expression, message and source location to the installed assertion handler
// (see <inline-core/assert-handler.hh>, default: stderr), breaks into an attached debugger, and aborts.
//
// Usage:
//   IC_ASSERT(_size < N, "emplace_back_unchecked on a full fixed_vector");
//   IC_ASSERT_ALWAYS(count >= 0, "negative element count");

#define IC_ASSERT(cond, msg) IC_IMPL_ASSERT(cond, msg)
#define IC_ASSERT_ALWAYS(cond, msg) IC_IMPL_ASSERT_ALWAYS(cond, msg)

// breaks into the debugger if one is attached, no-op otherwise
#define IC_DEBUG_BREAK() IC_IMPL_DEBUG_BREAK()

// final step of every failed check
#define IC_BREAK_AND_ABORT() (IC_DEBUG_BREAK(), ::ic::impl::perform_abort())

namespace ic::impl
{
// reports a failed check to the innermost assertion handler (or stderr)
// returns normally unless the handler throws, the caller aborts afterwards
IC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ic::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace ic::impl

// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(IC_COMPILER_MSVC)

// __debugbreak() without a debugger would terminate right away
#define IC_IMPL_DEBUG_BREAK() (::ic::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(IC_COMPILER_POSIX)

// raise(SIGTRAP), declared by hand to keep <csignal> out of every container header
extern "C" int raise(int) noexcept;
#define IC_IMPL_DEBUG_BREAK() (::ic::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define IC_IMPL_DEBUG_BREAK() void(0)

#endif

#define IC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ic::impl::handle_assert_failure(#cond, msg, ::ic::source_location::current()); \
            IC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if IC_ASSERT_ENABLED
#define IC_IMPL_ASSERT(cond, msg) IC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
// compiled, never evaluated
#define IC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        IC_UNUSED(cond);          \
        IC_UNUSED(msg);           \
    } while (false)
#endif
