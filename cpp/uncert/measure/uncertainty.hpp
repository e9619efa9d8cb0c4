#pragma once
/*
================================================================================
Fragment 3.2: Uncertainty (Non-Negative Magnitude, Scalar or Array)
FILE: cpp/uncert/measure/uncertainty.hpp

Purpose:
  - Wrap a non-negative uncertainty magnitude and keep full floating-point
    precision until string conversion.
  - combine(a, b, r) = sqrt(a^2 + b^2 + 2*a*b*r) is the only rule for adding
    uncertainties; r is the correlation coefficient in [-1, 1].
  - Linear scaling by exact factors.

Invariants:
  - Every element of magnitude() is finite and >= 0. Negative inputs (and
    negative scale factors) yield their absolute value.
  - Arithmetic returns a new Uncertainty. The compound operators mutate the
    left operand only.

Examples:
    Uncertainty(1.14923) + Uncertainty(0.84213)           -> "1.4"
    Uncertainty(1.14923).add_correlated(Uncertainty(0.84213), 1.0) -> "2"
    2.0 * Uncertainty(13)                                 -> "30"
    Uncertainty(36) / 7.0                                 -> "5"
    Uncertainty(Array{10, 10}) + Uncertainty(5)           -> [sqrt(125), sqrt(125)]
================================================================================
*/

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "uncert/core/settings.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert {

// Quadrature sum with correlation r. The radicand is clamped at 0.
double combine(double a, double b, double r = 0.0) noexcept;

class Uncertainty {
 public:
  Uncertainty() = default;
  explicit Uncertainty(double magnitude);
  explicit Uncertainty(numeric::Array magnitudes);
  explicit Uncertainty(numeric::Values magnitudes);

  // Items must be scalar-form (ShapeMismatch otherwise).
  static Uncertainty from_simple_list(const std::vector<Uncertainty>& items);
  // Scalar-form yields a one-element list holding *this.
  std::vector<Uncertainty> as_simple_list() const;

  const numeric::Values& magnitude() const noexcept { return m_; }
  bool is_array() const noexcept { return m_.is_array(); }
  std::size_t size() const noexcept { return m_.size(); }

  // Array-form element (ShapeMismatch on scalar-form, OutOfRange past the end).
  Uncertainty at(std::size_t i) const;
  // Scalar-form returns itself for any i.
  Uncertainty broadcast_at(std::size_t i) const;

  // Scalar-form or length-1 array only (ConversionMismatch otherwise).
  int significant_digit(const RoundingSettings& rs = {}) const;
  std::vector<int> significant_digits(const RoundingSettings& rs = {}) const;
  numeric::Values rounded(const RoundingSettings& rs = {}) const;

  // Broadcasts scalar against array; InvalidArgument if r is outside [-1, 1].
  Uncertainty add_correlated(const Uncertainty& other, double r = 0.0) const;

  // |m * k| and |m / k|; k may be scalar or array. Zero divisor -> kDomain.
  Uncertainty scaled(const numeric::Values& k) const;
  Uncertainty divided(const numeric::Values& k) const;

  // |floor(m / k)|. Succeeds, but always emits the floor-division advisory.
  Uncertainty floor_div(const numeric::Values& k) const;

  Uncertainty& operator+=(const Uncertainty& other);
  Uncertainty& operator*=(const numeric::Values& k);
  Uncertainty& operator/=(const numeric::Values& k);
  Uncertainty& floor_div_assign(const numeric::Values& k);

  double to_double() const;
  long long to_integer() const;

  // Magnitude comparison, elementwise.
  numeric::Mask compare(const Uncertainty& other, numeric::CompareOp op) const;
  numeric::Mask compare(double other, numeric::CompareOp op) const;

  std::string to_string(const Settings& s = Settings::defaults()) const;
  std::string repr(const Settings& s = Settings::defaults()) const;

 private:
  numeric::Values m_;
};

Uncertainty operator+(const Uncertainty& a, const Uncertainty& b);
Uncertainty operator*(const Uncertainty& u, const numeric::Values& k);
Uncertainty operator*(const numeric::Values& k, const Uncertainty& u);
Uncertainty operator/(const Uncertainty& u, const numeric::Values& k);

// Single-element comparisons (ConversionMismatch for longer arrays).
bool operator<(const Uncertainty& a, const Uncertainty& b);
bool operator<=(const Uncertainty& a, const Uncertainty& b);
bool operator>(const Uncertainty& a, const Uncertainty& b);
bool operator>=(const Uncertainty& a, const Uncertainty& b);
bool operator==(const Uncertainty& a, const Uncertainty& b);
bool operator!=(const Uncertainty& a, const Uncertainty& b);
bool operator<(const Uncertainty& a, double b);
bool operator<=(const Uncertainty& a, double b);
bool operator>(const Uncertainty& a, double b);
bool operator>=(const Uncertainty& a, double b);
bool operator==(const Uncertainty& a, double b);
bool operator!=(const Uncertainty& a, double b);

std::ostream& operator<<(std::ostream& out, const Uncertainty& u);

} // namespace uncert
