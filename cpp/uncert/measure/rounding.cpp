#include "uncert/measure/rounding.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "uncert/core/error.hpp"
#include "uncert/numeric/safe_math.hpp"

namespace uncert::rounding {

namespace {

// x / 10^p. Below 1e-300 the divisor is split so 10^p never underflows
// (subnormal magnitudes reach p = -324).
double in_units(double x, int p) noexcept {
  if (p >= -300) return x / numeric::pow10(p);
  return (x * numeric::pow10(300)) / numeric::pow10(p + 300);
}

// Leading decimal digit of x (> 0) at exponent p, clamped to [0, 10].
long long leading_digit(double x, int p) noexcept {
  const double q = numeric::clamp(in_units(x, p), 0.0, 10.0);
  return static_cast<long long>(q);
}

}  // namespace

int significant_digit(double magnitude, const RoundingSettings& rs) {
  UNCERT_ENSURE(numeric::is_finite(magnitude), ErrorCode::kDomain,
                "significant_digit: magnitude must be finite");
  if (magnitude == 0.0) return 0;

  const double absm = std::fabs(magnitude);
  int p = numeric::floor_log10(absm);
  long long msd = leading_digit(absm, p);

  // log10 noise can put the quotient just outside [1, 10).
  if (msd >= 10) {
    ++p;
    msd = leading_digit(absm, p);
  } else if (msd < 1) {
    --p;
    msd = leading_digit(absm, p);
  }

  if (rs.extra_digit_for_leading_one && msd == 1) {
    --p;
    if (rs.carry_correction) {
      // "1.9x" may round up to "2.0"; then the extra digit carries nothing.
      const double trial = std::fabs(round_to(absm, -p));
      const long long lead2 = std::llround(numeric::clamp(in_units(trial, p), 0.0, 100.0));
      if (lead2 == 20) ++p;
    }
  }
  return -p;
}

std::vector<int> significant_digits(const numeric::Values& magnitudes, const RoundingSettings& rs) {
  std::vector<int> out;
  out.reserve(magnitudes.size());
  for (std::size_t i = 0; i < magnitudes.size(); ++i) {
    out.push_back(significant_digit(magnitudes[i], rs));
  }
  return out;
}

double round_to(double x, int n) noexcept {
  if (!numeric::is_finite(x)) return x;
  if (n > 300) {
    // 10^n overflows past 308; scale in two steps for subnormal inputs.
    const double s1 = numeric::pow10(300);
    const double s2 = numeric::pow10(n - 300);
    if (!numeric::is_finite(s2)) return x;
    const double y = x * s1 * s2;
    if (std::fabs(y) >= 9007199254740992.0) return x;
    return std::nearbyint(y) / s1 / s2;
  }
  const double scale = numeric::pow10(n >= 0 ? n : -n);
  if (!numeric::is_finite(scale)) return 0.0;
  if (n >= 0) {
    // Past 2^53 every double is already an integer at this scale.
    if (std::fabs(x) * scale >= 9007199254740992.0) return x;
    return std::nearbyint(x * scale) / scale;
  }
  return std::nearbyint(x / scale) * scale;
}

double round_uncert(double magnitude, const RoundingSettings& rs) {
  return round_to(magnitude, significant_digit(magnitude, rs));
}

std::string format_fixed(double x, int n) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(n >= 0 ? n : 0) << numeric::canonical_zero(x);
  return oss.str();
}

} // namespace uncert::rounding
