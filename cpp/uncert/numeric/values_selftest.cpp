/*
  Fragment 2.4 - Numeric Values Selftest

  Checks:
    1) Scalar-form vs array-form shape and element access.
    2) Broadcasting: scalar against array only; unequal lengths fail.
    3) Mutators require array-form and valid indices.
    4) Reductions (mean / stddev) and safe math helpers.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>

#include "uncert/core/selftest.hpp"
#include "uncert/numeric/reduce.hpp"
#include "uncert/numeric/safe_math.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert {
namespace {

using numeric::Array;
using numeric::CompareOp;
using numeric::Values;
using selftest::Harness;

void test_shape(Harness& t) {
  const Values s(2.5);
  const Values a(Array{1.0, 2.0, 3.0});
  const Values one(Array{7.0});

  t.expect_true(!s.is_array(), "double is scalar-form");
  t.expect_eq_int(static_cast<long long>(s.size()), 1, "scalar size is 1");
  t.expect_true(a.is_array(), "Array is array-form");
  t.expect_eq_int(static_cast<long long>(a.size()), 3, "array size");
  t.expect_true(one.is_array(), "length-1 array stays array-form");

  t.expect_near(a.element(1), 2.0, "element(1)");
  t.expect_near(s.element(9), 2.5, "scalar element broadcasts");
  t.expect_throws_code([&a] { (void)a.element(3); }, ErrorCode::kOutOfRange,
                       "element past the end");

  t.expect_near(one.scalar(), 7.0, "length-1 array converts to scalar");
  t.expect_throws_code([&a] { (void)a.scalar(); }, ErrorCode::kConversionMismatch,
                       "length-3 array does not convert to scalar");
  t.expect_throws_code([&s] { (void)s.array(); }, ErrorCode::kShapeMismatch,
                       "scalar has no array storage");

  const Array b = s.to_array(3);
  t.expect_true(b.size() == 3 && b[2] == 2.5, "to_array broadcasts a scalar");
  t.expect_throws_code([&a] { (void)a.to_array(2); }, ErrorCode::kShapeMismatch,
                       "to_array refuses a different length");
}

void test_broadcasting(Harness& t) {
  const Values sum = numeric::add(Values(1.0), Values(Array{1.0, 2.0}));
  t.expect_true(sum.is_array() && sum.size() == 2, "scalar + array is array-form");
  t.expect_near(sum[1], 3.0, "scalar + array values");

  const Values prod = numeric::mul(Values(Array{1.0, 2.0}), Values(Array{3.0, 4.0}));
  t.expect_near(prod[1], 8.0, "elementwise product");

  t.expect_throws_code(
      [] { (void)numeric::add(Values(Array{1.0, 2.0}), Values(Array{1.0, 2.0, 3.0})); },
      ErrorCode::kShapeMismatch, "unequal lengths fail");
  t.expect_throws_code(
      [] { (void)numeric::add(Values(Array{1.0}), Values(Array{1.0, 2.0, 3.0})); },
      ErrorCode::kShapeMismatch, "length-1 array does not broadcast");

  const Values fd = numeric::floor_div(Values(Array{7.0, -7.0}), Values(2.0));
  t.expect_near(fd[0], 3.0, "7 // 2");
  t.expect_near(fd[1], -4.0, "-7 // 2 floors toward -inf");

  const Values p = numeric::pow(Values(2.0), Values(Array{2.0, 3.0}));
  t.expect_near(p[1], 8.0, "pow broadcasts");
  t.expect_near(numeric::abs(Values(-2.0))[0], 2.0, "abs");
  t.expect_near(numeric::floor(Values(-1.5))[0], -2.0, "floor");

  const numeric::Mask m = numeric::compare(Values(Array{1.0, 3.0}), Values(2.0), CompareOp::kLess);
  t.expect_true(m.size() == 2 && m[0] && !m[1], "elementwise compare");
  t.expect_throws_code([&m] { (void)numeric::single(m); }, ErrorCode::kConversionMismatch,
                       "two-element mask is not a single truth value");
  t.expect_true(numeric::single(numeric::compare(Values(1.0), Values(1.0), CompareOp::kEqual)),
                "single-element mask");
}

void test_mutators(Harness& t) {
  Values v(Array{1.0, 2.0});
  v.push_back(3.0);
  v.set(0, 9.0);
  v.erase(1);
  t.expect_true(v.size() == 2 && v[0] == 9.0 && v[1] == 3.0, "push_back / set / erase");

  v.append(Values(Array{4.0, 5.0}));
  v.append(Values(6.0));
  t.expect_eq_int(static_cast<long long>(v.size()), 5, "append concatenates");

  t.expect_throws_code([&v] { v.erase(5); }, ErrorCode::kOutOfRange, "erase past the end");
  t.expect_throws_code([&v] { v.set(9, 1.0); }, ErrorCode::kOutOfRange, "set past the end");

  Values s(1.0);
  t.expect_throws_code([&s] { s.push_back(2.0); }, ErrorCode::kShapeMismatch,
                       "scalar-form does not grow");
  t.expect_throws_code([&s] { s.erase(0); }, ErrorCode::kShapeMismatch,
                       "scalar-form has nothing to delete");
}

void test_checks(Harness& t) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  t.expect_true(!numeric::all_finite(Values(Array{1.0, nan})), "all_finite sees NaN");
  t.expect_true(numeric::any_zero(Values(Array{1.0, 0.0})), "any_zero");
  t.expect_throws_code([] { numeric::require_nonzero(Values(Array{1.0, 0.0}), "divisor"); },
                       ErrorCode::kDomain, "require_nonzero");
  t.expect_throws_code([nan] { numeric::require_finite(Values(nan), "center"); },
                       ErrorCode::kDomain, "require_finite");
}

void test_reduce(Harness& t) {
  const Array xs{1.0, 2.0, 3.0};
  t.expect_near(numeric::mean(xs), 2.0, "mean");
  t.expect_near(numeric::sum(xs), 6.0, "sum");
  t.expect_near(numeric::stddev(xs), std::sqrt(2.0 / 3.0), "population stddev");
  t.expect_near(numeric::stddev(xs, 1), 1.0, "sample stddev (ddof=1)");

  t.expect_throws_code([] { (void)numeric::mean(Array{}); }, ErrorCode::kDomain, "mean of empty");

  numeric::OnlineStats st;
  st.push(4.0);
  t.expect_throws_code([&st] { (void)st.variance(1); }, ErrorCode::kDomain,
                       "ddof=1 needs two samples");
  const double inf = std::numeric_limits<double>::infinity();
  t.expect_throws_code([&st, inf] { st.push(inf); }, ErrorCode::kDomain, "non-finite sample");
}

void test_safe_math(Harness& t) {
  t.expect_eq_int(numeric::floor_log10(999.0), 2, "floor_log10(999)");
  t.expect_eq_int(numeric::floor_log10(0.05), -2, "floor_log10(0.05)");
  t.expect_true(!std::signbit(numeric::canonical_zero(-0.0)), "canonical_zero clears the sign");
  t.expect_near(numeric::safe_sqrt(-1e-18), 0.0, "safe_sqrt clamps tiny negatives");
  t.expect_near(numeric::pow10(-2), 0.01, "pow10(-2)");

  // 0.1 is slightly above one tenth, so ten of them do not fit in 1.0.
  t.expect_near(numeric::floor_div(1.0, 0.1), 9.0, "1 // 0.1 == 9");
  t.expect_near(numeric::floor_div(-1.0, 0.1), -10.0, "-1 // 0.1 == -10");
  t.expect_near(numeric::floor_div(7.0, -2.0), -4.0, "7 // -2 == -4");
  t.expect_near(numeric::floor_div(-0.5, 2.0), -1.0, "-0.5 // 2 floors to -1");
  t.expect_true(std::signbit(numeric::floor_div(-0.0, 2.0)), "-0 // 2 keeps the sign");
}

}  // namespace
}  // namespace uncert

int main() {
  using namespace uncert;
  selftest::Harness t("numeric");

  test_shape(t);
  test_broadcasting(t);
  test_mutators(t);
  test_checks(t);
  test_reduce(t);
  test_safe_math(t);

  return t.finish();
}
