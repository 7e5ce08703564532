#pragma once

#include <source_location>

namespace ic
{
/// Type alias for std::source_location
/// Used by the assertion system to report where a fatal error was detected
/// Usage:
///   void check(ic::source_location loc = ic::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace ic
