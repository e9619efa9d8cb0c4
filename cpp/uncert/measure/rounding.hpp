#pragma once
/*
================================================================================
Fragment 3.1: Significant-Digit Selector + Decimal Rounding
FILE: cpp/uncert/measure/rounding.hpp

Purpose:
  - significant_digit(m): the fractional-digit count n such that rounding m
    to n digits keeps exactly one significant digit, or two when that digit
    is a 1 ("1.x" carries less information than "9.x").
  - round_to(x, n): round to n fractional digits; n < 0 rounds to the nearest
    multiple of 10^-n.
  - format_fixed(x, n): fixed-point text with n digits, integer text if n < 0.

Examples (default RoundingSettings):
    9123   -> n = -3  -> "9000"
    1.1243 -> n =  1  -> "1.1"
    0.104  -> n =  2  -> "0.10"
    0.198  -> n =  1  -> "0.2"    (carry correction; "0.20" without it)
    1.96   -> n =  0  -> "2"      (carry correction; "2.0" without it)

Notes:
  - Ties round half-to-even (current FP rounding mode, default nearest).
  - Non-finite magnitudes fail with ErrorCode::kDomain.
================================================================================
*/

#include <string>
#include <vector>

#include "uncert/core/settings.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert::rounding {

int significant_digit(double magnitude, const RoundingSettings& rs = {});

// Elementwise; a scalar-form input yields one entry.
std::vector<int> significant_digits(const numeric::Values& magnitudes,
                                    const RoundingSettings& rs = {});

double round_to(double x, int n) noexcept;

// x rounded to its own significant digit.
double round_uncert(double magnitude, const RoundingSettings& rs = {});

// Negative zero prints as zero.
std::string format_fixed(double x, int n);

} // namespace uncert::rounding
