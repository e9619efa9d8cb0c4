#pragma once
/*
================================================================================
Fragment 3.3: Measurement (Center + Uncertainty) + Operand Boundary
FILE: cpp/uncert/measure/measurement.hpp

Purpose:
  - A quantity with uncertainty. Arithmetic propagates the uncertainty; no
    rounding happens before string conversion.
  - All propagation math is delegated to Uncertainty::add_correlated.

Propagation (r = correlation coefficient, default 0):
    m + n        center a+b   uncert combine(ua, ub, r)
    m - n        center a-b   uncert combine(ua, ub, r)   (same cross-term sign)
    m * n        center a*b   uncert |a*b| * combine(ua/a, ub/b, r)
    m / n        center a/b   uncert |a/b| * combine(ua/a, ub/b, r)
    m (+,-) k    center a(+,-)k, uncert unchanged
    m (*,/) k    center a(*,/)k, uncert ua(*,/)k
    k - m        center k-a   uncert unchanged
    k / m        center k/a   uncert |k/a| * ua/a
    abs(m)       center |a|   uncert unchanged
    floor_div    plain numbers; the uncertainty is dropped

Shape:
  - Scalar-form vs array-form is the shape of center(). An array-form
    uncertainty requires an array-form center of the same length
    (ShapeMismatch otherwise); an array-form center with a scalar-form
    uncertainty broadcasts it.
  - Mutation (append/extend/set/erase) lives in MeasurementBuilder.

Operands:
  - Every public operation takes an Operand, a closed variant of
    {scalar, array, Uncertainty, Measurement}, and dispatches on its kind
    once. A Measurement mixed with an Uncertainty operand, or a
    *_with_correlation call with a non-Measurement, is a TypeMismatch.

Examples:
    Measurement(10.12, 1.999) + Measurement(20, 3.1)   -> "30 ± 4"
    Measurement(10.12, 1.999) * Measurement(20, 1.1)   -> "200 ± 40"
    1.0 / Measurement(10, 1)                           -> "0.100 ± 0.010"
    Measurement(10, 1).tscore(Measurement(11, 1))      -> 0.7071...
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "uncert/core/settings.hpp"
#include "uncert/measure/uncertainty.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert {

class Operand;

class Measurement {
 public:
  Measurement(double center, double uncert);
  Measurement(numeric::Array center, numeric::Array uncert);
  Measurement(numeric::Array center, double uncert);
  Measurement(numeric::Values center, Uncertainty uncert);

  // Items must be scalar-form (ShapeMismatch otherwise).
  static Measurement from_simple_list(const std::vector<Measurement>& items);
  // Scalar-form yields a one-element list holding *this.
  std::vector<Measurement> as_simple_list() const;

  // mean ± stddev of repeated readings; ddof=0 is the population deviation.
  static Measurement from_samples(const numeric::Array& samples, unsigned ddof = 0);

  const numeric::Values& center() const noexcept { return center_; }
  const Uncertainty& uncert() const noexcept { return uncert_; }
  bool is_array() const noexcept { return center_.is_array(); }
  std::size_t size() const noexcept { return center_.size(); }

  // Array-form element (ShapeMismatch on scalar-form, OutOfRange past the end).
  Measurement at(std::size_t i) const;

  numeric::Values rounded_center(const RoundingSettings& rs = {}) const;
  numeric::Values rounded_uncert(const RoundingSettings& rs = {}) const;

  Measurement add_with_correlation(const Operand& other, double r = 0.0) const;
  Measurement sub_with_correlation(const Operand& other, double r = 0.0) const;
  Measurement mul_with_correlation(const Operand& other, double r = 0.0) const;
  Measurement div_with_correlation(const Operand& other, double r = 0.0) const;

  // Independent errors for Measurement operands, exact values otherwise.
  Measurement add(const Operand& other) const;
  Measurement sub(const Operand& other) const;
  Measurement mul(const Operand& other) const;
  Measurement div(const Operand& other) const;

  // Number on the left: k - m, k / m, k // m.
  Measurement reflected_sub(const numeric::Values& k) const;
  Measurement reflected_div(const numeric::Values& k) const;
  numeric::Values reflected_floor_div(const numeric::Values& k) const;

  numeric::Values floor_div(const Operand& other) const;
  Measurement abs() const;

  // |center difference| / combined uncertainty. A number operand is exact.
  double tscore(const Operand& other, double r = 0.0) const;
  numeric::Values tscores(const Operand& other, double r = 0.0) const;

  // Compares centers only; against a Measurement this emits the
  // center-comparison advisory (use tscore for statistical comparison).
  numeric::Mask compare(const Operand& other, numeric::CompareOp op) const;

  // Center of a scalar-form or length-1 array (ConversionMismatch otherwise).
  double to_double() const;

  std::string to_string(const Settings& s = Settings::defaults()) const;
  std::string repr(const Settings& s = Settings::defaults()) const;

 private:
  numeric::Values center_;
  Uncertainty uncert_;
};

class Operand {
 public:
  enum class Kind : std::uint8_t { kScalar = 0, kArray, kUncertainty, kMeasurement };

  Operand(double x) : v_(numeric::Values(x)) {}
  Operand(numeric::Array xs) : v_(numeric::Values(std::move(xs))) {}
  Operand(numeric::Values v) : v_(std::move(v)) {}
  Operand(Uncertainty u) : v_(std::move(u)) {}
  Operand(Measurement m) : v_(std::move(m)) {}

  Kind kind() const noexcept;
  bool is_exact() const noexcept { return std::holds_alternative<numeric::Values>(v_); }

  // TypeMismatch if the operand holds another kind.
  const numeric::Values& exact() const;
  const Uncertainty& uncertainty() const;
  const Measurement& measurement() const;

 private:
  std::variant<numeric::Values, Uncertainty, Measurement> v_;
};

const char* to_string(Operand::Kind k) noexcept;

Measurement operator+(const Measurement& a, const Operand& b);
Measurement operator-(const Measurement& a, const Operand& b);
Measurement operator*(const Measurement& a, const Operand& b);
Measurement operator/(const Measurement& a, const Operand& b);

Measurement operator+(double k, const Measurement& m);
Measurement operator-(double k, const Measurement& m);
Measurement operator*(double k, const Measurement& m);
Measurement operator/(double k, const Measurement& m);
Measurement operator+(const numeric::Array& k, const Measurement& m);
Measurement operator-(const numeric::Array& k, const Measurement& m);
Measurement operator*(const numeric::Array& k, const Measurement& m);
Measurement operator/(const numeric::Array& k, const Measurement& m);

Measurement abs(const Measurement& m);
numeric::Values floor_div(double k, const Measurement& m);

double tscore(const Measurement& a, const Operand& b, double r = 0.0);

// Single-element center comparisons (ConversionMismatch for longer arrays).
bool operator<(const Measurement& a, const Measurement& b);
bool operator<=(const Measurement& a, const Measurement& b);
bool operator>(const Measurement& a, const Measurement& b);
bool operator>=(const Measurement& a, const Measurement& b);
bool operator==(const Measurement& a, const Measurement& b);
bool operator!=(const Measurement& a, const Measurement& b);
bool operator<(const Measurement& a, double b);
bool operator<=(const Measurement& a, double b);
bool operator>(const Measurement& a, double b);
bool operator>=(const Measurement& a, double b);
bool operator==(const Measurement& a, double b);
bool operator!=(const Measurement& a, double b);

std::ostream& operator<<(std::ostream& out, const Measurement& m);

} // namespace uncert
