#pragma once

#include <stacktrace>

namespace sc
{
// printed by the default assertion handler below the failure report
using stacktrace = std::stacktrace;
} // namespace sc
