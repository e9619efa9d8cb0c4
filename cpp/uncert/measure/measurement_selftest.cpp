/*
  Fragment 3.7 - Measurement Selftest

  Checks:
    1) Propagation literals for + - * / with measurements and plain numbers.
    2) Array-form construction, broadcasting, element access and rendering.
    3) Operand kind rules (Uncertainty operands, *_with_correlation).
    4) t-scores, center comparisons (with advisory), floor division.
    5) Domain errors: zero divisors and zero combined uncertainty; products
       with a zero center stay defined.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "uncert/core/selftest.hpp"
#include "uncert/uncert.hpp"

namespace uncert {
namespace {

using numeric::Array;
using numeric::CompareOp;
using selftest::Harness;
using selftest::LogCapture;

Measurement sample_array() {
  return Measurement(Array{0.0, 1.0, 2.0, 3.0, 4.0}, Array{0.1, 0.14, 0.18, 0.22, 0.26});
}

void test_propagation(Harness& t) {
  const Measurement a(10.12, 1.999);
  t.expect_eq_str((a + Measurement(20.0, 3.1)).to_string(), "30 ± 4", "sum");
  t.expect_eq_str((a * Measurement(20.0, 1.1)).to_string(), "200 ± 40", "product");
  t.expect_eq_str((10.0 * Measurement(20.0, 1.1)).to_string(), "200 ± 11", "number times measurement");
  t.expect_eq_str((a / Measurement(20.0, 1.1)).to_string(), "0.51 ± 0.10", "quotient");
  t.expect_eq_str((1.0 / Measurement(10.0, 1.0)).to_string(), "0.100 ± 0.010", "reciprocal");

  const Measurement d = Measurement(30.0, 3.0) - Measurement(10.0, 4.0);
  t.expect_near(d.center().scalar(), 20.0, "difference center");
  t.expect_near(d.uncert().to_double(), 5.0, "difference uncertainty adds in quadrature");

  const Measurement shifted = Measurement(10.0, 1.0) + 5.0;
  t.expect_near(shifted.uncert().to_double(), 1.0, "adding an exact number keeps the uncertainty");
  t.expect_eq_str((10.0 - Measurement(3.0, 1.0)).to_string(), "7.0 ± 1.0", "reflected subtraction");
  t.expect_near((Measurement(10.0, 1.0) / 4.0).uncert().to_double(), 0.25, "exact division scales");
  t.expect_near((Measurement(10.0, 1.0) * -2.0).uncert().to_double(), 2.0,
                "negative factor keeps a non-negative uncertainty");

  const Measurement corr = Measurement(10.0, 1.0).add_with_correlation(Measurement(5.0, 1.0), 1.0);
  t.expect_near(corr.uncert().to_double(), 2.0, "fully correlated sum");
  const Measurement same = Measurement(10.0, 1.0).sub_with_correlation(Measurement(10.0, 1.0), -1.0);
  t.expect_near(same.uncert().to_double(), 0.0, "r = -1 cancels equal uncertainties");

  const Measurement p = Measurement(2.0, 0.2).mul_with_correlation(Measurement(4.0, 0.4), 1.0);
  t.expect_near(p.uncert().to_double(), 1.6, "correlated product");
  const Measurement q = Measurement(2.0, 0.2).div_with_correlation(Measurement(4.0, 0.4));
  t.expect_near(q.uncert().to_double(), 0.5 * std::sqrt(0.02), "independent quotient");

  t.expect_eq_str(abs(Measurement(-3.0, 0.5)).to_string(), "3.0 ± 0.5", "abs");
  t.expect_eq_str(Measurement(-0.001, 0.1).to_string(), "0.00 ± 0.10", "no negative zero");
}

void test_samples(Harness& t) {
  const Measurement m = Measurement::from_samples(Array{1.623, 2.123, 2.623});
  t.expect_eq_str(m.to_string(), "2.1 ± 0.4", "mean ± population stddev");
  t.expect_near(Measurement::from_samples(Array{1.0, 2.0, 3.0}, 1).uncert().to_double(), 1.0,
                "sample stddev with ddof=1");
  t.expect_throws_code([] { (void)Measurement::from_samples(Array{}); }, ErrorCode::kDomain,
                       "no samples");
}

void test_array_form(Harness& t) {
  const Measurement mar = sample_array();
  t.expect_true(mar.is_array() && mar.size() == 5, "array-form measurement");
  t.expect_eq_str(mar.to_string(), "[0.00 ± 0.10, 1.00 ± 0.14, 2.00 ± 0.18, 3.0 ± 0.2, 4.0 ± 0.3]",
                  "array rendering");
  t.expect_eq_str(mar.at(2).repr(), "Measurement(2.00, 0.18, full_center=2, full_uncert=0.18)",
                  "element repr");
  t.expect_eq_str(mar.at(4).to_string(), "4.0 ± 0.3", "element rendering");
  t.expect_throws_code([&mar] { (void)mar.at(5); }, ErrorCode::kOutOfRange, "element past the end");
  t.expect_throws_code([] { (void)Measurement(1.0, 0.1).at(0); }, ErrorCode::kShapeMismatch,
                       "scalar-form is not indexable");

  t.expect_eq_str((3.0 * mar).to_string(),
                  "[0.0 ± 0.3, 3.0 ± 0.4, 6.0 ± 0.5, 9.0 ± 0.7, 12.0 ± 0.8]", "scaled array");

  const Measurement shared(Array{1.0, 2.0}, 0.5);
  t.expect_true(!shared.uncert().is_array(), "scalar uncertainty broadcasts");
  t.expect_eq_str(shared.to_string(), "[1.0 ± 0.5, 2.0 ± 0.5]", "broadcast rendering");

  const Measurement sum = mar + Array{1.0, 1.0, 1.0, 1.0, 1.0};
  t.expect_near(sum.center()[4], 5.0, "array operand adds elementwise");
  t.expect_throws_code([&mar] { (void)(mar + Array{1.0, 2.0}); }, ErrorCode::kShapeMismatch,
                       "array operand of another length");
  t.expect_throws_code([] { Measurement m(Array{1.0, 2.0}, Array{0.1, 0.2, 0.3}); },
                       ErrorCode::kShapeMismatch, "center/uncert length mismatch");
  t.expect_throws_code([] { Measurement m(numeric::Values(1.0), Uncertainty(Array{0.1, 0.2})); },
                       ErrorCode::kShapeMismatch, "array uncertainty needs an array center");

  const std::vector<Measurement> parts = mar.as_simple_list();
  t.expect_eq_int(static_cast<long long>(parts.size()), 5, "as_simple_list length");
  t.expect_eq_str(Measurement::from_simple_list(parts).to_string(), mar.to_string(),
                  "from_simple_list restores the array");
  t.expect_throws_code([&mar] { (void)Measurement::from_simple_list({mar}); },
                       ErrorCode::kShapeMismatch, "from_simple_list needs scalar items");
  t.expect_eq_int(static_cast<long long>(Measurement(1.0, 0.1).as_simple_list().size()), 1,
                  "scalar as_simple_list has one element");

  const numeric::Values rc = mar.rounded_center();
  const numeric::Values ru = mar.rounded_uncert();
  t.expect_near(rc[4], 4.0, "rounded centers");
  t.expect_near(ru[4], 0.3, "rounded uncertainties");

  t.expect_near(Measurement(Array{5.0}, Array{1.0}).to_double(), 5.0, "length-1 array converts");
  t.expect_throws_code([&mar] { (void)mar.to_double(); }, ErrorCode::kConversionMismatch,
                       "array does not convert to a number");
}

void test_repr(Harness& t) {
  const Measurement m = Measurement(10.12, 1.999) + Measurement(20.0, 3.1);
  const std::string r = m.repr();
  t.expect_true(r.rfind("Measurement(30, 4, full_center=30.119999999999997, full_uncert=", 0) == 0,
                "repr keeps the full center");

  const Measurement two(Array{1.0, 2.0}, Array{0.5, 0.25});
  t.expect_eq_str(two.repr(),
                  "Measurement([1.0, 2.0], [0.5, 0.2], full_center=[1, 2], full_uncert=[0.5, 0.25])",
                  "array repr (0.25 rounds half to even)");

  std::ostringstream oss;
  oss << Measurement(10.0, 1.0);
  t.expect_eq_str(oss.str(), "10.0 ± 1.0", "stream output");

  Settings s = Settings::defaults();
  s.format.plus_minus = " +/- ";
  t.expect_eq_str(Measurement(10.0, 1.0).to_string(s), "10.0 +/- 1.0", "custom separator");
}

void test_operand_rules(Harness& t) {
  const Measurement m(10.0, 1.0);
  t.expect_throws_code([&m] { (void)(m + Uncertainty(1.0)); }, ErrorCode::kTypeMismatch,
                       "Measurement + Uncertainty");
  t.expect_throws_code([&m] { (void)(m * Uncertainty(1.0)); }, ErrorCode::kTypeMismatch,
                       "Measurement * Uncertainty");
  t.expect_throws_code([&m] { (void)m.add_with_correlation(2.0, 0.5); }, ErrorCode::kTypeMismatch,
                       "*_with_correlation needs a Measurement");
  t.expect_throws_code([&m] { (void)m.mul_with_correlation(Uncertainty(1.0)); },
                       ErrorCode::kTypeMismatch, "*_with_correlation rejects an Uncertainty");
  t.expect_throws_code([&m] { (void)m.add_with_correlation(m, 2.0); },
                       ErrorCode::kInvalidArgument, "correlation out of range");

  const Operand num(2.0);
  const Operand arr(Array{1.0, 2.0});
  const Operand unc(Uncertainty(1.0));
  const Operand mea(m);
  t.expect_true(num.kind() == Operand::Kind::kScalar && num.is_exact(), "scalar operand");
  t.expect_true(arr.kind() == Operand::Kind::kArray, "array operand");
  t.expect_true(unc.kind() == Operand::Kind::kUncertainty && !unc.is_exact(), "uncertainty operand");
  t.expect_true(mea.kind() == Operand::Kind::kMeasurement, "measurement operand");
  t.expect_eq_str(to_string(unc.kind()), "Uncertainty", "kind name");
  t.expect_throws_code([&num] { (void)num.measurement(); }, ErrorCode::kTypeMismatch,
                       "wrong-kind access");
}

void test_domain(Harness& t) {
  t.expect_throws_code([] { (void)(Measurement(10.0, 1.0) / 0.0); }, ErrorCode::kDomain,
                       "division by an exact zero");
  const Measurement zp = Measurement(0.0, 1.0) * Measurement(2.0, 1.0);
  t.expect_near(zp.center()[0], 0.0, "product with a zero center");
  t.expect_near(zp.uncert().to_double(), 2.0, "zero center contributes |b|*ua");
  const Measurement zarr = Measurement(Array{0.0, 3.0}, Array{1.0, 1.0}) * Measurement(2.0, 1.0);
  t.expect_near(zarr.uncert().magnitude()[0], 2.0, "array product, zero element");
  t.expect_near(zarr.uncert().magnitude()[1], std::sqrt(13.0), "array product, other element");
  t.expect_throws_code([] { (void)(Measurement(1.0, 1.0) / Measurement(0.0, 1.0)); },
                       ErrorCode::kDomain, "division by a zero-center measurement");
  t.expect_throws_code([] { (void)(1.0 / Measurement(0.0, 1.0)); }, ErrorCode::kDomain,
                       "reciprocal of a zero center");
  const double nan = std::numeric_limits<double>::quiet_NaN();
  t.expect_throws_code([nan] { Measurement m(nan, 1.0); }, ErrorCode::kDomain,
                       "non-finite center");
}

void test_statistics(Harness& t) {
  const Measurement a(10.0, 1.0);
  t.expect_near(a.tscore(Measurement(11.0, 1.0)), 1.0 / std::sqrt(2.0), "independent t-score");
  t.expect_near(tscore(a, Measurement(11.0, 1.0), 1.0), 0.5, "correlated t-score");
  t.expect_near(a.tscore(11.0), 1.0, "t-score against an exact number");
  t.expect_throws_code([] { (void)Measurement(10.0, 0.0).tscore(11.0); }, ErrorCode::kDomain,
                       "zero combined uncertainty");
  t.expect_throws_code([&a] { (void)a.tscore(Uncertainty(1.0)); }, ErrorCode::kTypeMismatch,
                       "t-score against an Uncertainty");

  const numeric::Values ts = sample_array().tscores(Array{0.0, 0.0, 0.0, 0.0, 0.0});
  t.expect_near(ts[1], 1.0 / 0.14, "elementwise t-scores");
  t.expect_throws_code([] { (void)sample_array().tscore(0.0); }, ErrorCode::kConversionMismatch,
                       "scalar t-score of an array");
}

void test_comparison(Harness& t) {
  LogCapture cap;
  const Measurement a(10.0, 1.0);
  const Measurement b(11.0, 1.0);

  t.expect_true(a < b, "center comparison");
  t.expect_true(!(a == b), "center equality");
  t.expect_eq_int(static_cast<long long>(cap.count_containing("advisory:center-comparison")), 2,
                  "each Measurement comparison advises");

  cap.clear();
  t.expect_true(a < 11.0, "comparison with a number");
  t.expect_true(a >= 10.0, "comparison with a number (>=)");
  t.expect_true(cap.records().empty(), "comparison with a number does not advise");

  const numeric::Mask m = sample_array().compare(2.0, CompareOp::kLess);
  t.expect_true(m.size() == 5 && m[1] && !m[2], "elementwise center mask");
  t.expect_throws_code([] { (void)(sample_array() < 2.0); }, ErrorCode::kConversionMismatch,
                       "array comparison has no single truth value");
}

void test_floor_division(Harness& t) {
  const numeric::Values q = Measurement(7.0, 1.0).floor_div(2.0);
  t.expect_true(!q.is_array() && q[0] == 3.0, "floor division drops the uncertainty");
  t.expect_near(floor_div(7.0, Measurement(2.0, 0.1))[0], 3.0, "reflected floor division");
  t.expect_near(Measurement(1.0, 0.01).floor_div(0.1)[0], 9.0,
                "floor division agrees with the remainder");
  t.expect_near(Measurement(-7.0, 1.0).floor_div(2.0)[0], -4.0, "floor division rounds down");
  t.expect_throws_code([] { (void)Measurement(7.0, 1.0).floor_div(0.0); }, ErrorCode::kDomain,
                       "floor division by zero");
  t.expect_throws_code([] { (void)Measurement(7.0, 1.0).floor_div(Measurement(2.0, 0.1)); },
                       ErrorCode::kTypeMismatch, "floor division by a Measurement");
  t.expect_throws_code([] { (void)Measurement(7.0, 1.0).floor_div(Uncertainty(2.0)); },
                       ErrorCode::kTypeMismatch, "floor division by an Uncertainty");
}

}  // namespace
}  // namespace uncert

int main() {
  using namespace uncert;
  selftest::Harness t("measurement");

  test_propagation(t);
  test_samples(t);
  test_array_form(t);
  test_repr(t);
  test_operand_rules(t);
  test_domain(t);
  test_statistics(t);
  test_comparison(t);
  test_floor_division(t);

  return t.finish();
}
