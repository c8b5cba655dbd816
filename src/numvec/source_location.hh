#pragma once

#include <source_location>

namespace nv
{
/// Type alias for std::source_location
/// Captured by every assertion to report file, line and function of the failing precondition
using source_location = std::source_location;
} // namespace nv
