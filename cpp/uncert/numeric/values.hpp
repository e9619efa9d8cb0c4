#pragma once
/*
================================================================================
Fragment 2.2: Numeric Values (Scalar-or-Array) + Broadcasting
FILE: cpp/uncert/numeric/values.hpp

Purpose:
  - The numeric array capability used by Uncertainty and Measurement:
    a value is either scalar-form (one double) or array-form (a sequence of
    doubles). An array of length 1 is still array-form.
  - Elementwise arithmetic, comparison, abs, floor, concatenation, deletion by
    index, length and iteration.

Broadcasting:
  - scalar (op) scalar -> scalar
  - scalar (op) array  -> array (the scalar applies to every element)
  - array  (op) array  -> array; lengths must match, else ShapeMismatch

Notes:
  - Every binary operation goes through zip_with(); there is no second
    broadcasting rule anywhere in the tree.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "uncert/core/error.hpp"

namespace uncert::numeric {

using Array = std::vector<double>;
using Mask = std::vector<bool>;

enum class CompareOp : std::uint8_t {
  kLess = 0,
  kLessEqual,
  kEqual,
  kNotEqual,
  kGreater,
  kGreaterEqual
};

const char* to_string(CompareOp op) noexcept;
bool compare(double a, double b, CompareOp op) noexcept;

class Values {
 public:
  Values() = default;
  Values(double x) : data_(x) {}
  Values(Array xs) : data_(std::move(xs)) {}

  bool is_array() const noexcept { return std::holds_alternative<Array>(data_); }

  // Scalar-form reports 1.
  std::size_t size() const noexcept {
    return is_array() ? std::get<Array>(data_).size() : 1;
  }

  // Broadcast-aware, unchecked: scalar-form returns its value for any i.
  double operator[](std::size_t i) const noexcept {
    return is_array() ? std::get<Array>(data_)[i] : std::get<double>(data_);
  }

  // Broadcast-aware, checked: OutOfRange past the end of an array.
  double element(std::size_t i) const;

  // The single value of a scalar-form or length-1 array, else ConversionMismatch.
  double scalar() const;

  // Array-form storage, else ShapeMismatch.
  const Array& array() const;

  // Copy as an array of length n (scalar-form replicates). ShapeMismatch if an
  // array-form value does not have length n.
  Array to_array(std::size_t n) const;

  // ---- in-place mutation (array-form only, ShapeMismatch otherwise) ----
  void set(std::size_t i, double x);
  void erase(std::size_t i);
  void push_back(double x);
  // Concatenate: array-form `other` appends all its elements, scalar-form one.
  void append(const Values& other);

 private:
  std::variant<double, Array> data_{0.0};
};

// Length of the broadcast result of a and b. ShapeMismatch on unequal arrays.
std::size_t broadcast_size(const Values& a, const Values& b);

template <typename F>
Values map(const Values& a, F&& f) {
  if (!a.is_array()) return Values(f(a[0]));
  const Array& in = a.array();
  Array out;
  out.reserve(in.size());
  for (double x : in) out.push_back(f(x));
  return Values(std::move(out));
}

template <typename F>
Values zip_with(const Values& a, const Values& b, F&& f) {
  if (!a.is_array() && !b.is_array()) return Values(f(a[0], b[0]));
  const std::size_t n = broadcast_size(a, b);
  Array out(n);
  for (std::size_t i = 0; i < n; ++i) out[i] = f(a[i], b[i]);
  return Values(std::move(out));
}

// Elementwise arithmetic
Values add(const Values& a, const Values& b);
Values sub(const Values& a, const Values& b);
Values mul(const Values& a, const Values& b);
Values div(const Values& a, const Values& b);
Values floor_div(const Values& a, const Values& b);
Values pow(const Values& a, const Values& b);
Values abs(const Values& a);
Values floor(const Values& a);

// Elementwise comparison. A scalar-by-scalar comparison yields one entry.
Mask compare(const Values& a, const Values& b, CompareOp op);

// The single entry of a mask, else ConversionMismatch.
bool single(const Mask& m);

bool all_finite(const Values& a) noexcept;
bool any_zero(const Values& a) noexcept;

// Throw DomainError naming `what` if any element is exactly zero.
void require_nonzero(const Values& a, const char* what);

// Throw DomainError naming `what` if any element is NaN/Inf.
void require_finite(const Values& a, const char* what);

} // namespace uncert::numeric
