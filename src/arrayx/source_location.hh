#pragma once

#include <source_location>

namespace ax
{
/// Type alias for std::source_location
/// Captured by every argument check and assertion so reports point at the failing call site.
/// Usage:
///   void check(ax::source_location site = ax::source_location::current()) {
///       std::cerr << site.file_name() << ":" << site.line();
///   }
using source_location = std::source_location;
} // namespace ax
