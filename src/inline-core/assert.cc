#include "assert.hh"

#include <inline-core/assert-handler.hh>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef IC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<ic::impl::assertion_handler>& handler_stack()
{
    static std::vector<ic::impl::assertion_handler> handlers;
    return handlers;
}

// true while a handler runs, a failure inside a handler is reported to stderr instead
bool g_inside_handler = false;

struct inside_handler_scope
{
    inside_handler_scope() { g_inside_handler = true; }
    ~inside_handler_scope() { g_inside_handler = false; }
};

void report_to_stderr(ic::impl::assertion_info const& info)
{
    std::cerr << std::format("{}:{}:{}: assertion failed in {}\n", info.location.file_name(), info.location.line(),
                             info.location.column(), info.location.function_name());
    std::cerr << std::format("  condition: {}\n", info.expression);
    std::cerr << std::format("  message:   {}\n", info.message);
    std::cerr.flush();
}
} // namespace

void ic::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void ic::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

ic::isize ic::impl::assertion_handler_count()
{
    return isize(handler_stack().size());
}

ic::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ic::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

IC_COLD_FUNC void ic::impl::handle_assert_failure(char const* expression, char const* message, ic::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty() || g_inside_handler)
    {
        report_to_stderr(info);
        return; // the caller aborts
    }

    inside_handler_scope const scope;
    handlers.back()(info);
}

bool ic::impl::is_debugger_connected() noexcept
{
#if defined(IC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(IC_OS_LINUX)
    // an attached tracer shows up as a non-zero TracerPid
    std::ifstream status("/proc/self/status");
    for (std::string line; std::getline(status, line);)
        if (line.starts_with("TracerPid:"))
            return std::atoi(line.c_str() + 10) != 0;
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ic::impl::perform_abort() noexcept
{
    std::abort();
}
