#pragma once
/*
================================================================================
Fragment 3.4: String Formatting
FILE: cpp/uncert/measure/format.hpp

Purpose:
  - Render (center, uncertainty) as "<center> ± <uncert>" with both rounded at
    the digit the uncertainty selects (rounding::significant_digit).
  - n >= 0: fixed-point with exactly n digits for both numbers.
    n <  0: integer text, low-order digits zeroed.
  - Array-form: "[a ± da, b ± db, ...]"; a scalar-form uncertainty is
    broadcast across all centers.

Notes:
  - Works on numeric::Values so Uncertainty and Measurement share one path.
================================================================================
*/

#include <string>

#include "uncert/core/settings.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert::format {

std::string pair(double center, double uncert, const Settings& s);

std::string uncertainty(const numeric::Values& magnitudes, const Settings& s);

// ShapeMismatch if both are arrays of different lengths.
std::string measurement(const numeric::Values& center,
                        const numeric::Values& uncert,
                        const Settings& s);

// Shortest decimal text that round-trips to x.
std::string shortest(double x);

// shortest() of a scalar, or "[a, b, ...]" of an array.
std::string shortest_list(const numeric::Values& v, const FormatSettings& fs);

std::string measurement_repr(const numeric::Values& center,
                             const numeric::Values& uncert,
                             const Settings& s);

} // namespace uncert::format
