#pragma once
/*
===========================================================
Fragment 1.3: Core Advisories
FILE: cpp/uncert/core/advisory.hpp
===========================================================
Purpose:
  - Caller-visible warnings for operations that are mathematically dubious
    but valid. The operation still returns its result.
  - Emitted through the logging layer at WARN, tagged "advisory:<kind>".
  - They pass the log level filter like any WARN record: set_log_level(ERROR)
    is the way to silence them.
===========================================================
*/

#include <string>

namespace uncert {

enum class Advisory : int {
  kFloorDivision    = 1,  // floor-division of an uncertainty magnitude
  kCenterComparison = 2,  // Measurement vs Measurement compares centers only
};

const char* to_string(Advisory a) noexcept;

// Emit one advisory record.
void advise(Advisory kind, const std::string& msg);

} // namespace uncert
