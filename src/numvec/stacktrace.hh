#pragma once

#include <stacktrace>

namespace nv
{
/// Type alias for std::stacktrace
/// Printed by the default assertion handler below the failure report
using stacktrace = std::stacktrace;
} // namespace nv
