#include "uncert/measure/builder.hpp"

#include <cstddef>
#include <sstream>
#include <string>

#include "uncert/core/error.hpp"

namespace uncert {

namespace {

void require_scalar_item(bool is_array, const char* what) {
  if (is_array) {
    UNCERT_THROW(ErrorCode::kShapeMismatch,
                 std::string(what) + ": cannot append an array-form value; use extend");
  }
}

void require_array_item(bool is_array, const char* what) {
  if (!is_array) {
    UNCERT_THROW(ErrorCode::kShapeMismatch,
                 std::string(what) + ": cannot extend with a scalar-form value; use append");
  }
}

void require_index(std::size_t i, std::size_t n) {
  if (i >= n) {
    std::ostringstream oss;
    oss << "index " << i << " out of range for length " << n;
    UNCERT_THROW(ErrorCode::kOutOfRange, oss.str());
  }
}

}  // namespace

UncertaintyBuilder::UncertaintyBuilder(const Uncertainty& u) {
  UNCERT_ENSURE(u.is_array(), ErrorCode::kShapeMismatch, "Cannot extend a scalar Uncertainty");
  m_ = u.magnitude().array();
}

UncertaintyBuilder& UncertaintyBuilder::append(const Uncertainty& item) {
  require_scalar_item(item.is_array(), "UncertaintyBuilder::append");
  m_.push_back(item.to_double());
  return *this;
}

UncertaintyBuilder& UncertaintyBuilder::extend(const Uncertainty& items) {
  require_array_item(items.is_array(), "UncertaintyBuilder::extend");
  const numeric::Array& xs = items.magnitude().array();
  m_.insert(m_.end(), xs.begin(), xs.end());
  return *this;
}

void UncertaintyBuilder::set(std::size_t i, const Uncertainty& item) {
  require_index(i, m_.size());
  require_scalar_item(item.is_array(), "UncertaintyBuilder::set");
  m_[i] = item.to_double();
}

void UncertaintyBuilder::erase(std::size_t i) {
  require_index(i, m_.size());
  m_.erase(m_.begin() + static_cast<std::ptrdiff_t>(i));
}

Uncertainty UncertaintyBuilder::at(std::size_t i) const {
  require_index(i, m_.size());
  return Uncertainty(m_[i]);
}

Uncertainty UncertaintyBuilder::build() const {
  return Uncertainty(m_);
}

MeasurementBuilder::MeasurementBuilder(const Measurement& m) {
  UNCERT_ENSURE(m.is_array(), ErrorCode::kShapeMismatch, "Cannot extend a scalar Measurement");
  center_ = m.center().array();
  uncert_ = m.uncert().magnitude().to_array(center_.size());
}

MeasurementBuilder& MeasurementBuilder::append(const Measurement& item) {
  require_scalar_item(item.is_array(), "MeasurementBuilder::append");
  center_.push_back(item.center().scalar());
  uncert_.push_back(item.uncert().to_double());
  return *this;
}

MeasurementBuilder& MeasurementBuilder::extend(const Measurement& items) {
  require_array_item(items.is_array(), "MeasurementBuilder::extend");
  const numeric::Array& c = items.center().array();
  const numeric::Array u = items.uncert().magnitude().to_array(c.size());
  center_.insert(center_.end(), c.begin(), c.end());
  uncert_.insert(uncert_.end(), u.begin(), u.end());
  return *this;
}

void MeasurementBuilder::set(std::size_t i, const Measurement& item) {
  check_index(i);
  require_scalar_item(item.is_array(), "MeasurementBuilder::set");
  center_[i] = item.center().scalar();
  uncert_[i] = item.uncert().to_double();
}

void MeasurementBuilder::set(std::size_t i, double center, double uncert) {
  set(i, Measurement(center, uncert));
}

void MeasurementBuilder::erase(std::size_t i) {
  check_index(i);
  const auto off = static_cast<std::ptrdiff_t>(i);
  center_.erase(center_.begin() + off);
  uncert_.erase(uncert_.begin() + off);
}

Measurement MeasurementBuilder::at(std::size_t i) const {
  check_index(i);
  return Measurement(center_[i], uncert_[i]);
}

Measurement MeasurementBuilder::build() const {
  return Measurement(center_, uncert_);
}

void MeasurementBuilder::check_index(std::size_t i) const {
  require_index(i, center_.size());
}

} // namespace uncert
