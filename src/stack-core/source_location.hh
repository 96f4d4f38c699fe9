#pragma once

#include <source_location>

namespace sc
{
// call site of a failed assertion, captured by the SC_ASSERT* macros
using source_location = std::source_location;
} // namespace sc
