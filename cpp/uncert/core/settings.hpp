#pragma once
/*
================================================================================
Fragment 1.4: Core Rounding + Format Settings
FILE: cpp/uncert/core/settings.hpp

Purpose:
  - Centralize every display assumption (significant-digit rules, separators)
    into one validated object.
  - Settings are passed explicitly; there is no global configuration.

Notes:
  - A leading "1.x" uncertainty that rounds up to "2.0" has two accepted
    renderings ("0.2" or "0.20"). RoundingSettings::carry_correction selects one.

Hardening:
  - validate_or_throw() rejects settings that would produce unreadable output.
================================================================================
*/

#include <string>

#include "uncert/core/error.hpp"

namespace uncert {

// ----------------------------- Rounding --------------------------------------
struct RoundingSettings {
  // Keep one more digit when the most significant digit is 1 ("1.x" rule).
  bool extra_digit_for_leading_one = true;

  // When the extra digit of a leading 1 rounds the value up to "2.0", drop the
  // extra digit again (0.198 -> "0.2" instead of "0.20").
  // Only consulted when extra_digit_for_leading_one is set.
  bool carry_correction = true;
};

// ----------------------------- Format ----------------------------------------
struct FormatSettings {
  // Between center and uncertainty.
  std::string plus_minus = " \xC2\xB1 ";  // " ± "

  // Array-form rendering: open + elem + sep + elem ... + close
  std::string list_open = "[";
  std::string list_close = "]";
  std::string element_separator = ", ";

  void validate_or_throw() const {
    UNCERT_ENSURE(!plus_minus.empty(), ErrorCode::kInvalidArgument,
                  "FormatSettings: plus_minus must not be empty");
    UNCERT_ENSURE(!element_separator.empty(), ErrorCode::kInvalidArgument,
                  "FormatSettings: element_separator must not be empty");
  }
};

// ----------------------------- Settings --------------------------------------
struct Settings {
  RoundingSettings rounding;
  FormatSettings format;

  void validate_or_throw() const {
    format.validate_or_throw();
  }

  static Settings defaults() {
    Settings s;
    return s;
  }
};

}  // namespace uncert
