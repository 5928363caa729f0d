#pragma once

#include <source_location>

namespace kc
{
/// Type alias for std::source_location
/// Captured by assertions and by every thrown kc::map_error
/// Usage:
///   void fail(kc::source_location site = kc::source_location::current());
using source_location = std::source_location;
} // namespace kc
