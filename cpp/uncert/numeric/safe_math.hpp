#pragma once
/*
===============================================================================
Fragment 2.1: Hardened Math Utilities
File: safe_math.hpp
===============================================================================
*/

#include <cmath>
#include <type_traits>

namespace uncert::numeric {

inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
    static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
    return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// If eps>0, clamp x to >=eps before the root.
inline double safe_sqrt(double x, double eps = 0.0) noexcept {
    const double y = (x < eps) ? eps : x;
    return std::sqrt(y);
}

// -0.0 -> +0.0, everything else unchanged.
inline double canonical_zero(double x) noexcept {
    return (x == 0.0) ? 0.0 : x;
}

// Decimal exponent of the most significant digit of |x| (x != 0).
inline int floor_log10(double x) noexcept {
    return static_cast<int>(std::floor(std::log10(std::fabs(x))));
}

inline double pow10(int n) noexcept {
    return std::pow(10.0, static_cast<double>(n));
}

// Floor division, rounding toward -inf. Derived from fmod so that the
// quotient is consistent with the remainder: 1.0 // 0.1 == 9.
inline double floor_div(double a, double b) noexcept {
    if (b == 0.0 || !is_finite(a) || !is_finite(b)) return std::floor(a / b);
    const double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0.0 && ((b < 0.0) != (mod < 0.0))) div -= 1.0;
    if (div == 0.0) return std::copysign(0.0, a / b);
    double fl = std::floor(div);
    if (div - fl > 0.5) fl += 1.0;
    return fl;
}

} // namespace uncert::numeric
