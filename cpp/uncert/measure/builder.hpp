#pragma once
/*
================================================================================
Fragment 3.4: Array-Form Builders (Append / Extend / Set / Erase)
FILE: cpp/uncert/measure/builder.hpp

Purpose:
  - Grow and edit array-form values in place, then build() an immutable
    Uncertainty or Measurement. The arithmetic types stay value-like.

Shape rules:
  - append() takes one scalar-form item; extend() takes an array-form item.
    The other shape is a ShapeMismatch.
  - A MeasurementBuilder seeded from a Measurement requires array-form.
  - Centers and uncertainties always have the same length.

Thread-safety:
  - Not internally synchronized; caller must serialize concurrent mutable
    access to a shared builder.
================================================================================
*/

#include <cstddef>

#include "uncert/measure/measurement.hpp"
#include "uncert/measure/uncertainty.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert {

class UncertaintyBuilder {
 public:
  UncertaintyBuilder() = default;
  // ShapeMismatch unless u is array-form.
  explicit UncertaintyBuilder(const Uncertainty& u);

  UncertaintyBuilder& append(const Uncertainty& item);
  UncertaintyBuilder& extend(const Uncertainty& items);
  void set(std::size_t i, const Uncertainty& item);
  void erase(std::size_t i);

  Uncertainty at(std::size_t i) const;
  std::size_t size() const noexcept { return m_.size(); }
  bool empty() const noexcept { return m_.empty(); }

  Uncertainty build() const;

 private:
  numeric::Array m_;
};

class MeasurementBuilder {
 public:
  MeasurementBuilder() = default;
  // ShapeMismatch ("Cannot extend a scalar Measurement") unless m is array-form.
  explicit MeasurementBuilder(const Measurement& m);

  MeasurementBuilder& append(const Measurement& item);
  MeasurementBuilder& extend(const Measurement& items);

  void set(std::size_t i, const Measurement& item);
  void set(std::size_t i, double center, double uncert);
  void erase(std::size_t i);

  Measurement at(std::size_t i) const;
  std::size_t size() const noexcept { return center_.size(); }
  bool empty() const noexcept { return center_.empty(); }

  Measurement build() const;

 private:
  void check_index(std::size_t i) const;

  numeric::Array center_;
  numeric::Array uncert_;
};

} // namespace uncert
