#include "uncert/numeric/values.hpp"

#include <cmath>
#include <sstream>

#include "uncert/numeric/safe_math.hpp"

namespace uncert::numeric {

const char* to_string(CompareOp op) noexcept {
  switch (op) {
    case CompareOp::kLess:         return "<";
    case CompareOp::kLessEqual:    return "<=";
    case CompareOp::kEqual:        return "==";
    case CompareOp::kNotEqual:     return "!=";
    case CompareOp::kGreater:      return ">";
    case CompareOp::kGreaterEqual: return ">=";
    default:                       return "?";
  }
}

bool compare(double a, double b, CompareOp op) noexcept {
  switch (op) {
    case CompareOp::kLess:         return a < b;
    case CompareOp::kLessEqual:    return a <= b;
    case CompareOp::kEqual:        return a == b;
    case CompareOp::kNotEqual:     return a != b;
    case CompareOp::kGreater:      return a > b;
    case CompareOp::kGreaterEqual: return a >= b;
    default:                       return false;
  }
}

double Values::element(std::size_t i) const {
  if (!is_array()) return std::get<double>(data_);
  const Array& a = std::get<Array>(data_);
  if (i >= a.size()) {
    std::ostringstream oss;
    oss << "index " << i << " out of range for array of length " << a.size();
    UNCERT_THROW(ErrorCode::kOutOfRange, oss.str());
  }
  return a[i];
}

double Values::scalar() const {
  if (!is_array()) return std::get<double>(data_);
  const Array& a = std::get<Array>(data_);
  if (a.size() != 1) {
    std::ostringstream oss;
    oss << "cannot convert an array of length " << a.size() << " to a scalar";
    UNCERT_THROW(ErrorCode::kConversionMismatch, oss.str());
  }
  return a.front();
}

const Array& Values::array() const {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "scalar-form value has no array storage");
  return std::get<Array>(data_);
}

Array Values::to_array(std::size_t n) const {
  if (!is_array()) return Array(n, std::get<double>(data_));
  const Array& a = std::get<Array>(data_);
  if (a.size() != n) {
    std::ostringstream oss;
    oss << "cannot broadcast array of length " << a.size() << " to length " << n;
    UNCERT_THROW(ErrorCode::kShapeMismatch, oss.str());
  }
  return a;
}

void Values::set(std::size_t i, double x) {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "cannot index-assign a scalar-form value");
  Array& a = std::get<Array>(data_);
  UNCERT_ENSURE(i < a.size(), ErrorCode::kOutOfRange, "set: index out of range");
  a[i] = x;
}

void Values::erase(std::size_t i) {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "cannot delete from a scalar-form value");
  Array& a = std::get<Array>(data_);
  UNCERT_ENSURE(i < a.size(), ErrorCode::kOutOfRange, "erase: index out of range");
  a.erase(a.begin() + static_cast<std::ptrdiff_t>(i));
}

void Values::push_back(double x) {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "cannot append to a scalar-form value");
  std::get<Array>(data_).push_back(x);
}

void Values::append(const Values& other) {
  UNCERT_ENSURE(is_array(), ErrorCode::kShapeMismatch, "cannot concatenate onto a scalar-form value");
  Array& a = std::get<Array>(data_);
  if (!other.is_array()) {
    a.push_back(other[0]);
    return;
  }
  const Array& b = other.array();
  a.insert(a.end(), b.begin(), b.end());
}

std::size_t broadcast_size(const Values& a, const Values& b) {
  if (!a.is_array()) return b.size();
  if (!b.is_array()) return a.size();
  if (a.size() != b.size()) {
    std::ostringstream oss;
    oss << "operands could not be broadcast together: lengths "
        << a.size() << " and " << b.size();
    UNCERT_THROW(ErrorCode::kShapeMismatch, oss.str());
  }
  return a.size();
}

Values add(const Values& a, const Values& b) {
  return zip_with(a, b, [](double x, double y) { return x + y; });
}

Values sub(const Values& a, const Values& b) {
  return zip_with(a, b, [](double x, double y) { return x - y; });
}

Values mul(const Values& a, const Values& b) {
  return zip_with(a, b, [](double x, double y) { return x * y; });
}

Values div(const Values& a, const Values& b) {
  return zip_with(a, b, [](double x, double y) { return x / y; });
}

Values floor_div(const Values& a, const Values& b) {
  return zip_with(a, b, [](double x, double y) { return numeric::floor_div(x, y); });
}

Values pow(const Values& a, const Values& b) {
  return zip_with(a, b, [](double x, double y) { return std::pow(x, y); });
}

Values abs(const Values& a) {
  return map(a, [](double x) { return std::fabs(x); });
}

Values floor(const Values& a) {
  return map(a, [](double x) { return std::floor(x); });
}

Mask compare(const Values& a, const Values& b, CompareOp op) {
  const std::size_t n = broadcast_size(a, b);
  Mask out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = compare(a[i], b[i], op);
  return out;
}

bool single(const Mask& m) {
  if (m.size() != 1) {
    std::ostringstream oss;
    oss << "truth value of a " << m.size() << "-element comparison is ambiguous";
    UNCERT_THROW(ErrorCode::kConversionMismatch, oss.str());
  }
  return m.front();
}

bool all_finite(const Values& a) noexcept {
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!is_finite(a[i])) return false;
  }
  return true;
}

bool any_zero(const Values& a) noexcept {
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i] == 0.0) return true;
  }
  return false;
}

void require_nonzero(const Values& a, const char* what) {
  if (any_zero(a)) {
    UNCERT_THROW(ErrorCode::kDomain, std::string(what) + ": zero value");
  }
}

void require_finite(const Values& a, const char* what) {
  if (!all_finite(a)) {
    UNCERT_THROW(ErrorCode::kDomain, std::string(what) + ": non-finite value");
  }
}

} // namespace uncert::numeric
