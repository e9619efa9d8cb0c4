#include "uncert/measure/measurement.hpp"

#include <cmath>
#include <ostream>
#include <sstream>
#include <utility>

#include "uncert/core/advisory.hpp"
#include "uncert/core/error.hpp"
#include "uncert/measure/format.hpp"
#include "uncert/measure/rounding.hpp"
#include "uncert/numeric/reduce.hpp"

namespace uncert {

namespace {

void require_consistent_shape(const numeric::Values& center, const Uncertainty& uncert) {
  if (!uncert.is_array()) return;
  if (!center.is_array()) {
    UNCERT_THROW(ErrorCode::kShapeMismatch,
                 "an array-form uncertainty requires an array-form center");
  }
  if (center.size() != uncert.size()) {
    std::ostringstream oss;
    oss << "the lengths of center (" << center.size() << ") and uncert ("
        << uncert.size() << ") must match";
    UNCERT_THROW(ErrorCode::kShapeMismatch, oss.str());
  }
}

[[noreturn]] void throw_uncertainty_operand(const char* op) {
  UNCERT_THROW(ErrorCode::kTypeMismatch,
               std::string("cannot ") + op +
                   " a Measurement and an Uncertainty; wrap the uncertainty in a "
                   "Measurement or use the *_with_correlation form");
}

}  // namespace

// ----------------------------- Operand ---------------------------------------

Operand::Kind Operand::kind() const noexcept {
  if (const auto* v = std::get_if<numeric::Values>(&v_)) {
    return v->is_array() ? Kind::kArray : Kind::kScalar;
  }
  if (std::holds_alternative<Uncertainty>(v_)) return Kind::kUncertainty;
  return Kind::kMeasurement;
}

const numeric::Values& Operand::exact() const {
  const auto* v = std::get_if<numeric::Values>(&v_);
  if (!v) {
    UNCERT_THROW(ErrorCode::kTypeMismatch,
                 std::string("expected a number or array operand, got ") + to_string(kind()));
  }
  return *v;
}

const Uncertainty& Operand::uncertainty() const {
  const auto* u = std::get_if<Uncertainty>(&v_);
  if (!u) {
    UNCERT_THROW(ErrorCode::kTypeMismatch,
                 std::string("expected an Uncertainty operand, got ") + to_string(kind()));
  }
  return *u;
}

const Measurement& Operand::measurement() const {
  const auto* m = std::get_if<Measurement>(&v_);
  if (!m) {
    UNCERT_THROW(ErrorCode::kTypeMismatch,
                 std::string("expected a Measurement operand, got ") + to_string(kind()) +
                     "; use the plain operators instead");
  }
  return *m;
}

const char* to_string(Operand::Kind k) noexcept {
  switch (k) {
    case Operand::Kind::kScalar:      return "scalar";
    case Operand::Kind::kArray:       return "array";
    case Operand::Kind::kUncertainty: return "Uncertainty";
    case Operand::Kind::kMeasurement: return "Measurement";
    default:                          return "unknown";
  }
}

// ----------------------------- Construction ----------------------------------

Measurement::Measurement(double center, double uncert)
    : Measurement(numeric::Values(center), Uncertainty(uncert)) {}

Measurement::Measurement(numeric::Array center, numeric::Array uncert)
    : Measurement(numeric::Values(std::move(center)), Uncertainty(std::move(uncert))) {}

Measurement::Measurement(numeric::Array center, double uncert)
    : Measurement(numeric::Values(std::move(center)), Uncertainty(uncert)) {}

Measurement::Measurement(numeric::Values center, Uncertainty uncert)
    : center_(std::move(center)), uncert_(std::move(uncert)) {
  numeric::require_finite(center_, "Measurement: center");
  require_consistent_shape(center_, uncert_);
}

Measurement Measurement::from_simple_list(const std::vector<Measurement>& items) {
  numeric::Array centers;
  std::vector<Uncertainty> uncerts;
  centers.reserve(items.size());
  uncerts.reserve(items.size());
  for (const auto& m : items) {
    UNCERT_ENSURE(!m.is_array(), ErrorCode::kShapeMismatch,
                  "from_simple_list: items must be scalar-form measurements");
    centers.push_back(m.center_[0]);
    uncerts.push_back(m.uncert_);
  }
  return Measurement(numeric::Values(std::move(centers)), Uncertainty::from_simple_list(uncerts));
}

std::vector<Measurement> Measurement::as_simple_list() const {
  if (!is_array()) return {*this};
  std::vector<Measurement> out;
  out.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) out.push_back(at(i));
  return out;
}

Measurement Measurement::from_samples(const numeric::Array& samples, unsigned ddof) {
  UNCERT_ENSURE(!samples.empty(), ErrorCode::kDomain, "from_samples: no samples");
  const numeric::OnlineStats st = numeric::accumulate(samples);
  return Measurement(st.mean, st.stddev(ddof));
}

Measurement Measurement::at(std::size_t i) const {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "scalar-form measurement is not indexable");
  return Measurement(center_.element(i), uncert_.broadcast_at(i).to_double());
}

numeric::Values Measurement::rounded_center(const RoundingSettings& rs) const {
  return numeric::zip_with(center_, uncert_.magnitude(), [&rs](double c, double u) {
    return rounding::round_to(c, rounding::significant_digit(u, rs));
  });
}

numeric::Values Measurement::rounded_uncert(const RoundingSettings& rs) const {
  return uncert_.rounded(rs);
}

// ----------------------------- Arithmetic ------------------------------------

Measurement Measurement::add_with_correlation(const Operand& other, double r) const {
  const Measurement& o = other.measurement();
  Uncertainty u = uncert_.add_correlated(o.uncert_, r);
  return Measurement(numeric::add(center_, o.center_), std::move(u));
}

Measurement Measurement::sub_with_correlation(const Operand& other, double r) const {
  const Measurement& o = other.measurement();
  Uncertainty u = uncert_.add_correlated(o.uncert_, r);
  return Measurement(numeric::sub(center_, o.center_), std::move(u));
}

Measurement Measurement::mul_with_correlation(const Operand& other, double r) const {
  const Measurement& o = other.measurement();
  // |b|*ua and |a|*ub combined; a zero center is allowed.
  const Uncertainty ua = uncert_.scaled(o.center_);
  const Uncertainty ub = o.uncert_.scaled(center_);
  return Measurement(numeric::mul(center_, o.center_), ua.add_correlated(ub, r));
}

Measurement Measurement::div_with_correlation(const Operand& other, double r) const {
  const Measurement& o = other.measurement();
  numeric::require_nonzero(o.center_, "Measurement division by a zero center");
  numeric::Values c = numeric::div(center_, o.center_);
  // ua/|b| and ub*|a|/b^2 combined.
  const Uncertainty ua = uncert_.divided(o.center_);
  const Uncertainty ub = o.uncert_.scaled(c).divided(o.center_);
  return Measurement(std::move(c), ua.add_correlated(ub, r));
}

Measurement Measurement::add(const Operand& other) const {
  switch (other.kind()) {
    case Operand::Kind::kMeasurement: return add_with_correlation(other);
    case Operand::Kind::kUncertainty: throw_uncertainty_operand("add");
    default:                          return Measurement(numeric::add(center_, other.exact()), uncert_);
  }
}

Measurement Measurement::sub(const Operand& other) const {
  switch (other.kind()) {
    case Operand::Kind::kMeasurement: return sub_with_correlation(other);
    case Operand::Kind::kUncertainty: throw_uncertainty_operand("subtract");
    default:                          return Measurement(numeric::sub(center_, other.exact()), uncert_);
  }
}

Measurement Measurement::mul(const Operand& other) const {
  switch (other.kind()) {
    case Operand::Kind::kMeasurement: return mul_with_correlation(other);
    case Operand::Kind::kUncertainty: throw_uncertainty_operand("multiply");
    default: {
      const numeric::Values& k = other.exact();
      return Measurement(numeric::mul(center_, k), uncert_.scaled(k));
    }
  }
}

Measurement Measurement::div(const Operand& other) const {
  switch (other.kind()) {
    case Operand::Kind::kMeasurement: return div_with_correlation(other);
    case Operand::Kind::kUncertainty: throw_uncertainty_operand("divide");
    default: {
      const numeric::Values& k = other.exact();
      numeric::require_nonzero(k, "Measurement division by an exact zero");
      return Measurement(numeric::div(center_, k), uncert_.divided(k));
    }
  }
}

Measurement Measurement::reflected_sub(const numeric::Values& k) const {
  return Measurement(numeric::sub(k, center_), uncert_);
}

Measurement Measurement::reflected_div(const numeric::Values& k) const {
  // k is exact, so the relative uncertainty carries over unchanged.
  numeric::require_nonzero(center_, "division by a zero center");
  numeric::Values c = numeric::div(k, center_);
  Uncertainty u = uncert_.scaled(c).divided(center_);
  return Measurement(std::move(c), std::move(u));
}

numeric::Values Measurement::reflected_floor_div(const numeric::Values& k) const {
  numeric::require_nonzero(center_, "floor division by a zero center");
  return numeric::floor_div(k, center_);
}

numeric::Values Measurement::floor_div(const Operand& other) const {
  if (other.kind() == Operand::Kind::kUncertainty) throw_uncertainty_operand("floor-divide");
  const numeric::Values& k = other.exact();
  numeric::require_nonzero(k, "floor division by an exact zero");
  return numeric::floor_div(center_, k);
}

Measurement Measurement::abs() const {
  return Measurement(numeric::abs(center_), uncert_);
}

// ----------------------------- Statistics ------------------------------------

numeric::Values Measurement::tscores(const Operand& other, double r) const {
  const Measurement diff = (other.kind() == Operand::Kind::kMeasurement)
                               ? sub_with_correlation(other, r)
                               : sub(other);
  numeric::require_nonzero(diff.uncert_.magnitude(), "t-score undefined for zero combined uncertainty");
  return numeric::zip_with(diff.center_, diff.uncert_.magnitude(), [](double c, double u) {
    return std::fabs(c) / u;
  });
}

double Measurement::tscore(const Operand& other, double r) const {
  return tscores(other, r).scalar();
}

numeric::Mask Measurement::compare(const Operand& other, numeric::CompareOp op) const {
  switch (other.kind()) {
    case Operand::Kind::kMeasurement:
      advise(Advisory::kCenterComparison,
             std::string("Measurement ") + numeric::to_string(op) +
                 " Measurement compares the center value only; "
                 "for statistical comparison use Measurement::tscore");
      return numeric::compare(center_, other.measurement().center_, op);
    case Operand::Kind::kUncertainty:
      throw_uncertainty_operand("compare");
    default:
      return numeric::compare(center_, other.exact(), op);
  }
}

double Measurement::to_double() const {
  return center_.scalar();
}

std::string Measurement::to_string(const Settings& s) const {
  s.validate_or_throw();
  return format::measurement(center_, uncert_.magnitude(), s);
}

std::string Measurement::repr(const Settings& s) const {
  s.validate_or_throw();
  return format::measurement_repr(center_, uncert_.magnitude(), s);
}

// ----------------------------- Free operators --------------------------------

Measurement operator+(const Measurement& a, const Operand& b) { return a.add(b); }
Measurement operator-(const Measurement& a, const Operand& b) { return a.sub(b); }
Measurement operator*(const Measurement& a, const Operand& b) { return a.mul(b); }
Measurement operator/(const Measurement& a, const Operand& b) { return a.div(b); }

Measurement operator+(double k, const Measurement& m) { return m.add(k); }
Measurement operator-(double k, const Measurement& m) { return m.reflected_sub(k); }
Measurement operator*(double k, const Measurement& m) { return m.mul(k); }
Measurement operator/(double k, const Measurement& m) { return m.reflected_div(k); }
Measurement operator+(const numeric::Array& k, const Measurement& m) { return m.add(k); }
Measurement operator-(const numeric::Array& k, const Measurement& m) { return m.reflected_sub(k); }
Measurement operator*(const numeric::Array& k, const Measurement& m) { return m.mul(k); }
Measurement operator/(const numeric::Array& k, const Measurement& m) { return m.reflected_div(k); }

Measurement abs(const Measurement& m) { return m.abs(); }

numeric::Values floor_div(double k, const Measurement& m) { return m.reflected_floor_div(k); }

double tscore(const Measurement& a, const Operand& b, double r) { return a.tscore(b, r); }

using numeric::CompareOp;

bool operator<(const Measurement& a, const Measurement& b)  { return numeric::single(a.compare(b, CompareOp::kLess)); }
bool operator<=(const Measurement& a, const Measurement& b) { return numeric::single(a.compare(b, CompareOp::kLessEqual)); }
bool operator>(const Measurement& a, const Measurement& b)  { return numeric::single(a.compare(b, CompareOp::kGreater)); }
bool operator>=(const Measurement& a, const Measurement& b) { return numeric::single(a.compare(b, CompareOp::kGreaterEqual)); }
bool operator==(const Measurement& a, const Measurement& b) { return numeric::single(a.compare(b, CompareOp::kEqual)); }
bool operator!=(const Measurement& a, const Measurement& b) { return numeric::single(a.compare(b, CompareOp::kNotEqual)); }
bool operator<(const Measurement& a, double b)  { return numeric::single(a.compare(b, CompareOp::kLess)); }
bool operator<=(const Measurement& a, double b) { return numeric::single(a.compare(b, CompareOp::kLessEqual)); }
bool operator>(const Measurement& a, double b)  { return numeric::single(a.compare(b, CompareOp::kGreater)); }
bool operator>=(const Measurement& a, double b) { return numeric::single(a.compare(b, CompareOp::kGreaterEqual)); }
bool operator==(const Measurement& a, double b) { return numeric::single(a.compare(b, CompareOp::kEqual)); }
bool operator!=(const Measurement& a, double b) { return numeric::single(a.compare(b, CompareOp::kNotEqual)); }

std::ostream& operator<<(std::ostream& out, const Measurement& m) {
  return out << m.to_string();
}

} // namespace uncert
