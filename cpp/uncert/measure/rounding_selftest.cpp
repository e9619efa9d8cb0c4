/*
  Fragment 3.5 - Rounding Selftest

  Checks:
    1) Significant-digit selection, including the leading-1 rule and the
       "1.9x rounds up to 2.0" carry.
    2) Half-to-even decimal rounding at positive and negative digit counts.
    3) Fixed-point rendering never shows a negative zero.
    4) Subnormal magnitudes down to the smallest double.
    5) The rounding switches in RoundingSettings.

  Non-zero return code indicates failure.
*/

#include <limits>
#include <string>

#include "uncert/core/selftest.hpp"
#include "uncert/measure/rounding.hpp"
#include "uncert/numeric/values.hpp"

namespace uncert {
namespace {

using selftest::Harness;

std::string render(double u, const RoundingSettings& rs = {}) {
  const int n = rounding::significant_digit(u, rs);
  return rounding::format_fixed(rounding::round_to(u, n), n);
}

void test_significant_digit(Harness& t) {
  t.expect_eq_int(rounding::significant_digit(9123.0), -3, "9123 -> thousands");
  t.expect_eq_int(rounding::significant_digit(1.1243), 1, "leading 1 keeps a second digit");
  t.expect_eq_int(rounding::significant_digit(0.104), 2, "0.104 keeps two decimals");
  t.expect_eq_int(rounding::significant_digit(0.198), 1, "0.198 carries to 0.2");
  t.expect_eq_int(rounding::significant_digit(1.96), 0, "1.96 carries to 2");
  t.expect_eq_int(rounding::significant_digit(0.36), 1, "0.36 -> tenths");
  t.expect_eq_int(rounding::significant_digit(0.0), 0, "zero magnitude");

  const double nan = std::numeric_limits<double>::quiet_NaN();
  t.expect_throws_code([nan] { (void)rounding::significant_digit(nan); }, ErrorCode::kDomain,
                       "NaN magnitude rejected");

  const std::vector<int> ds = rounding::significant_digits(numeric::Values(numeric::Array{9123.0, 0.104}));
  t.expect_true(ds.size() == 2 && ds[0] == -3 && ds[1] == 2, "elementwise significant digits");
}

void test_round_to(Harness& t) {
  t.expect_near(rounding::round_to(2.5, 0), 2.0, "2.5 rounds half to even");
  t.expect_near(rounding::round_to(3.5, 0), 4.0, "3.5 rounds half to even");
  t.expect_near(rounding::round_to(1234.0, -2), 1200.0, "negative digit count");
  t.expect_near(rounding::round_to(1250.0, -2), 1200.0, "negative digit count, tie to even");
  t.expect_near(rounding::round_to(0.104, 2), 0.1, "0.104 at two decimals");
  t.expect_near(rounding::round_to(1e300, 5), 1e300, "huge values are already integral");
}

void test_render(Harness& t) {
  t.expect_eq_str(render(9123.0), "9000", "9123");
  t.expect_eq_str(render(1.1243), "1.1", "1.1243");
  t.expect_eq_str(render(0.104), "0.10", "0.104");
  t.expect_eq_str(render(0.198), "0.2", "0.198");
  t.expect_eq_str(render(1.96), "2", "1.96");
  t.expect_near(rounding::round_uncert(9123.0), 9000.0, "round_uncert");

  t.expect_eq_str(rounding::format_fixed(rounding::round_to(-0.001, 2), 2), "0.00",
                  "rounded negative zero prints as 0");
  t.expect_eq_str(rounding::format_fixed(30.12, -1), "30", "negative precision prints no decimals");
}

std::size_t nonzero_digits(const std::string& s) {
  std::size_t n = 0;
  for (char c : s) {
    if (c >= '1' && c <= '9') ++n;
  }
  return n;
}

void test_subnormal(Harness& t) {
  const double denorm_min = std::numeric_limits<double>::denorm_min();  // ~4.94e-324
  t.expect_eq_int(rounding::significant_digit(denorm_min), 324, "smallest subnormal");
  const std::string s = render(denorm_min);
  t.expect_eq_int(static_cast<long long>(s.size()), 2 + 324, "smallest subnormal width");
  t.expect_eq_int(static_cast<long long>(nonzero_digits(s)), 1, "smallest subnormal: one digit");
  t.expect_true(s.back() == '5', "smallest subnormal rounds to 5e-324");

  // 1e-320 is stored as 9.99989e-321.
  t.expect_eq_int(rounding::significant_digit(1e-320), 321, "1e-320 is below 10^-320");
  t.expect_eq_int(static_cast<long long>(nonzero_digits(render(1e-320))), 1,
                  "1e-320 renders one significant digit");
  t.expect_true(rounding::round_to(1e-320, 321) == 1e-320, "round_to past 10^308 scale");
  t.expect_true(rounding::round_to(denorm_min, 325) == denorm_min,
                "round_to keeps the smallest subnormal");
}

void test_settings(Harness& t) {
  RoundingSettings no_carry;
  no_carry.carry_correction = false;
  t.expect_eq_str(render(1.96, no_carry), "2.0", "1.96 without carry correction");
  t.expect_eq_str(render(0.198, no_carry), "0.20", "0.198 without carry correction");
  t.expect_eq_str(render(1.1243, no_carry), "1.1", "no carry: plain leading 1 unchanged");

  RoundingSettings one_digit;
  one_digit.extra_digit_for_leading_one = false;
  t.expect_eq_str(render(1.1243, one_digit), "1", "single digit for a leading 1");
  t.expect_eq_str(render(0.198, one_digit), "0.2", "single digit, 0.198");
}

}  // namespace
}  // namespace uncert

int main() {
  using namespace uncert;
  selftest::Harness t("rounding");

  test_significant_digit(t);
  test_round_to(t);
  test_render(t);
  test_subnormal(t);
  test_settings(t);

  return t.finish();
}
