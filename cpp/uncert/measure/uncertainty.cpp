#include "uncert/measure/uncertainty.hpp"

#include <cmath>
#include <ostream>
#include <utility>

#include "uncert/core/advisory.hpp"
#include "uncert/core/error.hpp"
#include "uncert/measure/format.hpp"
#include "uncert/measure/rounding.hpp"
#include "uncert/numeric/safe_math.hpp"

namespace uncert {

namespace {

numeric::Values normalized(numeric::Values v) {
  numeric::require_finite(v, "Uncertainty: magnitude");
  return numeric::abs(v);
}

void require_correlation(double r) {
  UNCERT_ENSURE(numeric::is_finite(r) && r >= -1.0 && r <= 1.0, ErrorCode::kInvalidArgument,
                "correlation coefficient must be in [-1, 1]");
}

}  // namespace

double combine(double a, double b, double r) noexcept {
  return numeric::safe_sqrt(a * a + b * b + 2.0 * a * b * r);
}

Uncertainty::Uncertainty(double magnitude) : m_(normalized(numeric::Values(magnitude))) {}

Uncertainty::Uncertainty(numeric::Array magnitudes)
    : m_(normalized(numeric::Values(std::move(magnitudes)))) {}

Uncertainty::Uncertainty(numeric::Values magnitudes) : m_(normalized(std::move(magnitudes))) {}

Uncertainty Uncertainty::from_simple_list(const std::vector<Uncertainty>& items) {
  numeric::Array out;
  out.reserve(items.size());
  for (const auto& u : items) {
    UNCERT_ENSURE(!u.is_array(), ErrorCode::kShapeMismatch,
                  "from_simple_list: items must be scalar-form uncertainties");
    out.push_back(u.m_[0]);
  }
  return Uncertainty(std::move(out));
}

std::vector<Uncertainty> Uncertainty::as_simple_list() const {
  if (!is_array()) return {*this};
  std::vector<Uncertainty> out;
  out.reserve(size());
  for (double x : m_.array()) out.emplace_back(x);
  return out;
}

Uncertainty Uncertainty::at(std::size_t i) const {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "scalar-form uncertainty is not indexable");
  return Uncertainty(m_.element(i));
}

Uncertainty Uncertainty::broadcast_at(std::size_t i) const {
  if (!is_array()) return *this;
  return Uncertainty(m_.element(i));
}

int Uncertainty::significant_digit(const RoundingSettings& rs) const {
  return rounding::significant_digit(m_.scalar(), rs);
}

std::vector<int> Uncertainty::significant_digits(const RoundingSettings& rs) const {
  return rounding::significant_digits(m_, rs);
}

numeric::Values Uncertainty::rounded(const RoundingSettings& rs) const {
  return numeric::map(m_, [&rs](double x) { return rounding::round_uncert(x, rs); });
}

Uncertainty Uncertainty::add_correlated(const Uncertainty& other, double r) const {
  require_correlation(r);
  return Uncertainty(numeric::zip_with(m_, other.m_, [r](double a, double b) {
    return combine(a, b, r);
  }));
}

Uncertainty Uncertainty::scaled(const numeric::Values& k) const {
  return Uncertainty(numeric::mul(m_, k));
}

Uncertainty Uncertainty::divided(const numeric::Values& k) const {
  numeric::require_nonzero(k, "Uncertainty division");
  return Uncertainty(numeric::div(m_, k));
}

Uncertainty Uncertainty::floor_div(const numeric::Values& k) const {
  advise(Advisory::kFloorDivision,
         "floor-dividing an uncertainty; the result is rarely a meaningful uncertainty");
  numeric::require_nonzero(k, "Uncertainty floor division");
  return Uncertainty(numeric::floor_div(m_, k));
}

Uncertainty& Uncertainty::operator+=(const Uncertainty& other) {
  m_ = add_correlated(other).m_;
  return *this;
}

Uncertainty& Uncertainty::operator*=(const numeric::Values& k) {
  m_ = scaled(k).m_;
  return *this;
}

Uncertainty& Uncertainty::operator/=(const numeric::Values& k) {
  m_ = divided(k).m_;
  return *this;
}

Uncertainty& Uncertainty::floor_div_assign(const numeric::Values& k) {
  m_ = floor_div(k).m_;
  return *this;
}

double Uncertainty::to_double() const {
  return m_.scalar();
}

long long Uncertainty::to_integer() const {
  const double v = std::trunc(m_.scalar());
  UNCERT_ENSURE(v < 9223372036854775808.0, ErrorCode::kConversionMismatch,
                "to_integer: magnitude exceeds the integer range");
  return static_cast<long long>(v);
}

numeric::Mask Uncertainty::compare(const Uncertainty& other, numeric::CompareOp op) const {
  return numeric::compare(m_, other.m_, op);
}

numeric::Mask Uncertainty::compare(double other, numeric::CompareOp op) const {
  return numeric::compare(m_, numeric::Values(other), op);
}

std::string Uncertainty::to_string(const Settings& s) const {
  s.validate_or_throw();
  return format::uncertainty(m_, s);
}

std::string Uncertainty::repr(const Settings& s) const {
  return "Uncertainty(" + to_string(s) + ")";
}

Uncertainty operator+(const Uncertainty& a, const Uncertainty& b) {
  return a.add_correlated(b);
}

Uncertainty operator*(const Uncertainty& u, const numeric::Values& k) {
  return u.scaled(k);
}

Uncertainty operator*(const numeric::Values& k, const Uncertainty& u) {
  return u.scaled(k);
}

Uncertainty operator/(const Uncertainty& u, const numeric::Values& k) {
  return u.divided(k);
}

using numeric::CompareOp;

bool operator<(const Uncertainty& a, const Uncertainty& b)  { return numeric::single(a.compare(b, CompareOp::kLess)); }
bool operator<=(const Uncertainty& a, const Uncertainty& b) { return numeric::single(a.compare(b, CompareOp::kLessEqual)); }
bool operator>(const Uncertainty& a, const Uncertainty& b)  { return numeric::single(a.compare(b, CompareOp::kGreater)); }
bool operator>=(const Uncertainty& a, const Uncertainty& b) { return numeric::single(a.compare(b, CompareOp::kGreaterEqual)); }
bool operator==(const Uncertainty& a, const Uncertainty& b) { return numeric::single(a.compare(b, CompareOp::kEqual)); }
bool operator!=(const Uncertainty& a, const Uncertainty& b) { return numeric::single(a.compare(b, CompareOp::kNotEqual)); }
bool operator<(const Uncertainty& a, double b)  { return numeric::single(a.compare(b, CompareOp::kLess)); }
bool operator<=(const Uncertainty& a, double b) { return numeric::single(a.compare(b, CompareOp::kLessEqual)); }
bool operator>(const Uncertainty& a, double b)  { return numeric::single(a.compare(b, CompareOp::kGreater)); }
bool operator>=(const Uncertainty& a, double b) { return numeric::single(a.compare(b, CompareOp::kGreaterEqual)); }
bool operator==(const Uncertainty& a, double b) { return numeric::single(a.compare(b, CompareOp::kEqual)); }
bool operator!=(const Uncertainty& a, double b) { return numeric::single(a.compare(b, CompareOp::kNotEqual)); }

std::ostream& operator<<(std::ostream& out, const Uncertainty& u) {
  return out << u.to_string();
}

} // namespace uncert
