#pragma once

#include <source_location>

namespace bc
{
/// Type alias for std::source_location
/// Captured by every contract check so violation reports point at the offending call site
using source_location = std::source_location;
} // namespace bc
