#pragma once

#include <inline-core/fwd.hh>
#include <inline-core/source_location.hh>

#include <functional>
#include <string>

// Pluggable reporting of fatal errors
//
// Every failed IC_ASSERT* ends up in ic::impl::handle_assert_failure, which passes an assertion_info to the
// innermost installed handler. Without any handler the report is printed to stderr.
// Once the handler returns, the assertion macro breaks into an attached debugger and aborts,
// so a handler that wants execution to go on has to throw.
//
// This is how fatal container errors become observable in tests:
//   {
//       auto handler = ic::impl::scoped_assertion_handler([](ic::impl::assertion_info const& info) {
//           throw index_error{info.message};
//       });
//       (void)vec[vec.size()]; // throws index_error instead of aborting
//   }
//
// NOTE: the handler stack is process-global and not synchronized

namespace ic::impl
{
/// Everything that is known about a failed assertion
struct assertion_info
{
    std::string expression; ///< the stringified condition
    std::string message;    ///< already formatted
    ic::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// Removes the innermost handler, no-op if none is installed
void pop_assertion_handler();

/// Number of installed handlers, 0 means failures go to stderr
[[nodiscard]] isize assertion_handler_count();

/// Installs a handler for the lifetime of this object
/// Also pops correctly when the handler throws through the owning scope.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ic::impl
