/*
  Fragment 3.6 - Uncertainty Selftest

  Checks:
    1) Construction normalizes to non-negative, finite magnitudes.
    2) Quadrature addition with and without correlation.
    3) Scaling, division and floor division (with its advisory).
    4) Conversions, comparisons, element access and rendering.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

#include "uncert/core/selftest.hpp"
#include "uncert/measure/uncertainty.hpp"

namespace uncert {
namespace {

using numeric::Array;
using numeric::CompareOp;
using selftest::Harness;
using selftest::LogCapture;

void test_construction(Harness& t) {
  t.expect_near(Uncertainty(-2.0).to_double(), 2.0, "negative magnitude stored as absolute");
  const Uncertainty a(Array{1.0, -2.0});
  t.expect_true(a.is_array() && a.size() == 2, "array-form uncertainty");
  t.expect_near(a.magnitude()[1], 2.0, "array elements stored as absolute");
  t.expect_near(Uncertainty().to_double(), 0.0, "default is zero");

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  t.expect_throws_code([nan] { Uncertainty u(nan); }, ErrorCode::kDomain, "NaN rejected");
  t.expect_throws_code([inf] { Uncertainty u(Array{1.0, inf}); }, ErrorCode::kDomain,
                       "infinite element rejected");
}

void test_combination(Harness& t) {
  const Uncertainty a(1.14923);
  const Uncertainty b(0.84213);
  t.expect_eq_str((a + b).to_string(), "1.4", "independent sum");
  t.expect_eq_str(a.add_correlated(b, 1.0).to_string(), "2", "fully correlated sum");
  t.expect_near(combine(3.0, 4.0), 5.0, "combine(3, 4)");
  t.expect_near(combine(3.0, 4.0, -1.0), 1.0, "anti-correlated combine");

  const Uncertainty arr = Uncertainty(Array{10.0, 10.0}) + Uncertainty(5.0);
  t.expect_true(arr.is_array() && arr.size() == 2, "scalar broadcasts over array");
  t.expect_near(arr.magnitude()[1], std::sqrt(125.0), "broadcast quadrature value");

  t.expect_throws_code([] { (void)(Uncertainty(Array{1.0, 2.0}) + Uncertainty(Array{1.0, 2.0, 3.0})); },
                       ErrorCode::kShapeMismatch, "unequal lengths");
  t.expect_throws_code([&a, &b] { (void)a.add_correlated(b, 1.5); }, ErrorCode::kInvalidArgument,
                       "correlation above 1");

  Uncertainty acc(3.0);
  acc += Uncertainty(4.0);
  t.expect_near(acc.to_double(), 5.0, "operator+=");
}

void test_scaling(Harness& t) {
  t.expect_eq_str((2.0 * Uncertainty(13.0)).to_string(), "30", "2 * 13");
  t.expect_eq_str((Uncertainty(36.0) / 7.0).to_string(), "5", "36 / 7");
  t.expect_near((Uncertainty(2.0) * -3.0).to_double(), 6.0, "negative factor gives magnitude");

  const Uncertainty s = Uncertainty(2.0) * numeric::Values(Array{1.0, 2.0});
  t.expect_true(s.is_array() && s.magnitude()[1] == 4.0, "array factor");

  t.expect_throws_code([] { (void)(Uncertainty(1.0) / 0.0); }, ErrorCode::kDomain,
                       "division by zero");

  Uncertainty u(10.0);
  u *= 2.0;
  u /= 4.0;
  t.expect_near(u.to_double(), 5.0, "compound scale");

  LogCapture cap;
  t.expect_near(Uncertainty(7.0).floor_div(2.0).to_double(), 3.0, "floor division result");
  t.expect_eq_int(static_cast<long long>(cap.count_containing("advisory:floor-division")), 1,
                  "floor division advises");
  u.floor_div_assign(2.0);
  t.expect_near(u.to_double(), 2.0, "floor_div_assign");
  t.expect_eq_int(static_cast<long long>(cap.count_containing("advisory:floor-division")), 2,
                  "floor_div_assign advises every time");
  t.expect_throws_code([] { (void)Uncertainty(1.0).floor_div(0.0); }, ErrorCode::kDomain,
                       "floor division by zero");
}

void test_conversion(Harness& t) {
  t.expect_eq_int(Uncertainty(3.7).to_integer(), 3, "to_integer truncates");
  t.expect_eq_int(Uncertainty(9007199254740992.0).to_integer(), 9007199254740992LL,
                  "to_integer at 2^53");
  t.expect_throws_code([] { (void)Uncertainty(1e30).to_integer(); },
                       ErrorCode::kConversionMismatch, "to_integer beyond the integer range");
  t.expect_throws_code([] { (void)Uncertainty(9223372036854775808.0).to_integer(); },
                       ErrorCode::kConversionMismatch, "to_integer at 2^63");
  t.expect_near(Uncertainty(Array{2.0}).to_double(), 2.0, "length-1 array converts");
  t.expect_throws_code([] { (void)Uncertainty(Array{1.0, 2.0}).to_double(); },
                       ErrorCode::kConversionMismatch, "length-2 array does not convert");

  t.expect_true(Uncertainty(1.0) < Uncertainty(2.0), "magnitude comparison");
  t.expect_true(Uncertainty(1.0) == 1.0, "comparison with a number");
  t.expect_true(Uncertainty(3.0) >= 2.0, "comparison with a number (>=)");
  const numeric::Mask m = Uncertainty(Array{1.0, 3.0}).compare(2.0, CompareOp::kLess);
  t.expect_true(m.size() == 2 && m[0] && !m[1], "elementwise comparison mask");
  t.expect_throws_code([] { (void)(Uncertainty(Array{1.0, 3.0}) < 2.0); },
                       ErrorCode::kConversionMismatch, "array comparison has no single truth value");
}

void test_access(Harness& t) {
  const Uncertainty a(Array{0.104, 9123.0});
  t.expect_near(a.at(1).to_double(), 9123.0, "at(1)");
  t.expect_throws_code([&a] { (void)a.at(2); }, ErrorCode::kOutOfRange, "at past the end");
  t.expect_throws_code([] { (void)Uncertainty(1.0).at(0); }, ErrorCode::kShapeMismatch,
                       "scalar-form is not indexable");
  t.expect_near(Uncertainty(1.5).broadcast_at(4).to_double(), 1.5, "broadcast_at on scalar");

  const std::vector<Uncertainty> parts = a.as_simple_list();
  t.expect_eq_int(static_cast<long long>(parts.size()), 2, "as_simple_list length");
  t.expect_eq_int(static_cast<long long>(Uncertainty(1.0).as_simple_list().size()), 1,
                  "scalar as_simple_list has one element");
  t.expect_eq_str(Uncertainty::from_simple_list(parts).to_string(), a.to_string(),
                  "from_simple_list restores the array");
  t.expect_throws_code([&a] { (void)Uncertainty::from_simple_list({a}); },
                       ErrorCode::kShapeMismatch, "from_simple_list needs scalar items");

  t.expect_eq_int(Uncertainty(1.1243).significant_digit(), 1, "significant_digit");
  t.expect_throws_code([&a] { (void)a.significant_digit(); }, ErrorCode::kConversionMismatch,
                       "significant_digit needs a scalar");
  const std::vector<int> ds = a.significant_digits();
  t.expect_true(ds.size() == 2 && ds[0] == 2 && ds[1] == -3, "significant_digits");
  t.expect_near(Uncertainty(9123.0).rounded().scalar(), 9000.0, "rounded magnitude");
}

void test_render(Harness& t) {
  t.expect_eq_str(Uncertainty(Array{0.104, 9123.0}).to_string(), "[0.10, 9000]", "array rendering");
  t.expect_eq_str((Uncertainty(36.0) / 7.0).repr(), "Uncertainty(5)", "repr");

  Settings s = Settings::defaults();
  s.format.element_separator = "; ";
  t.expect_eq_str(Uncertainty(Array{0.3, 0.3}).to_string(s), "[0.3; 0.3]", "custom separator");
  s.format.element_separator.clear();
  t.expect_throws_code([&s] { (void)Uncertainty(1.0).to_string(s); }, ErrorCode::kInvalidArgument,
                       "invalid settings rejected");

  std::ostringstream oss;
  oss << Uncertainty(0.198);
  t.expect_eq_str(oss.str(), "0.2", "stream output");
}

}  // namespace
}  // namespace uncert

int main() {
  using namespace uncert;
  selftest::Harness t("uncertainty");

  test_construction(t);
  test_combination(t);
  test_scaling(t);
  test_conversion(t);
  test_access(t);
  test_render(t);

  return t.finish();
}
