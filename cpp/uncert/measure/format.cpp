#include "uncert/measure/format.hpp"

#include <charconv>
#include <system_error>

#include "uncert/core/error.hpp"
#include "uncert/measure/rounding.hpp"
#include "uncert/numeric/safe_math.hpp"

namespace uncert::format {

namespace {

struct RoundedPair {
  std::string center;
  std::string uncert;
};

RoundedPair round_pair(double center, double uncert, const RoundingSettings& rs) {
  const int n = rounding::significant_digit(uncert, rs);
  return {rounding::format_fixed(rounding::round_to(center, n), n),
          rounding::format_fixed(rounding::round_to(uncert, n), n)};
}

template <typename Fn>
std::string join(std::size_t n, const FormatSettings& fs, Fn&& item) {
  std::string out = fs.list_open;
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out += fs.element_separator;
    out += item(i);
  }
  out += fs.list_close;
  return out;
}

}  // namespace

std::string pair(double center, double uncert, const Settings& s) {
  const RoundedPair p = round_pair(center, uncert, s.rounding);
  return p.center + s.format.plus_minus + p.uncert;
}

std::string uncertainty(const numeric::Values& magnitudes, const Settings& s) {
  auto one = [&s](double m) {
    const int n = rounding::significant_digit(m, s.rounding);
    return rounding::format_fixed(rounding::round_to(m, n), n);
  };
  if (!magnitudes.is_array()) return one(magnitudes[0]);
  return join(magnitudes.size(), s.format, [&](std::size_t i) { return one(magnitudes[i]); });
}

std::string measurement(const numeric::Values& center,
                        const numeric::Values& uncert,
                        const Settings& s) {
  if (!center.is_array() && !uncert.is_array()) return pair(center[0], uncert[0], s);
  const std::size_t n = numeric::broadcast_size(center, uncert);
  return join(n, s.format, [&](std::size_t i) { return pair(center[i], uncert[i], s); });
}

std::string shortest(double x) {
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), numeric::canonical_zero(x));
  UNCERT_ENSURE(res.ec == std::errc(), ErrorCode::kDomain, "shortest: conversion failed");
  return std::string(buf, res.ptr);
}

std::string shortest_list(const numeric::Values& v, const FormatSettings& fs) {
  if (!v.is_array()) return shortest(v[0]);
  return join(v.size(), fs, [&v](std::size_t i) { return shortest(v[i]); });
}

std::string measurement_repr(const numeric::Values& center,
                             const numeric::Values& uncert,
                             const Settings& s) {
  std::string centers;
  std::string uncerts;
  if (!center.is_array() && !uncert.is_array()) {
    const RoundedPair p = round_pair(center[0], uncert[0], s.rounding);
    centers = p.center;
    uncerts = p.uncert;
  } else {
    const std::size_t n = numeric::broadcast_size(center, uncert);
    centers = join(n, s.format, [&](std::size_t i) {
      return round_pair(center[i], uncert[i], s.rounding).center;
    });
    uncerts = join(n, s.format, [&](std::size_t i) {
      return round_pair(center[i], uncert[i], s.rounding).uncert;
    });
  }
  return "Measurement(" + centers + ", " + uncerts +
         ", full_center=" + shortest_list(center, s.format) +
         ", full_uncert=" + shortest_list(uncert, s.format) + ")";
}

} // namespace uncert::format
