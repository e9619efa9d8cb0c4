// ============================================================================
// Fragment 2.3: Reductions (Online Mean/Var, Welford)
// File: reduce.hpp
// ============================================================================
//
// Purpose:
// - Mean and standard deviation of a sample, for the common lab idiom of
//   reporting a repeated measurement as mean ± std.
// - Single pass (Welford); numerically stable for large offsets.
//
// Policy:
// - Non-finite samples are rejected (DomainError), not skipped.
//
// ============================================================================

#pragma once
#include "uncert/core/error.hpp"
#include "uncert/numeric/safe_math.hpp"
#include "uncert/numeric/values.hpp"

#include <cstddef>
#include <cstdint>

namespace uncert::numeric {

struct OnlineStats final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double M2 = 0.0; // sum of squares of differences from the current mean
    double sum = 0.0;

    void reset() noexcept {
        n = 0;
        mean = 0.0;
        M2 = 0.0;
        sum = 0.0;
    }

    void push(double x) {
        UNCERT_ENSURE(is_finite(x), ErrorCode::kDomain, "OnlineStats: non-finite sample");

        ++n;
        sum += x;

        const double delta = x - mean;
        mean += delta / static_cast<double>(n);
        const double delta2 = x - mean;
        M2 += delta * delta2;

        if (M2 < 0.0) M2 = 0.0;
    }

    std::uint64_t count() const noexcept { return n; }

    // Divisor n - ddof; ddof=0 is the population variance, ddof=1 the sample.
    double variance(unsigned ddof = 0) const {
        UNCERT_ENSURE(n > ddof, ErrorCode::kDomain, "OnlineStats: not enough samples for ddof");
        return M2 / static_cast<double>(n - ddof);
    }

    double stddev(unsigned ddof = 0) const {
        return safe_sqrt(variance(ddof), 0.0);
    }
};

inline OnlineStats accumulate(const Array& xs) {
    OnlineStats s;
    for (double x : xs) s.push(x);
    return s;
}

inline double sum(const Array& xs) {
    return accumulate(xs).sum;
}

inline double mean(const Array& xs) {
    UNCERT_ENSURE(!xs.empty(), ErrorCode::kDomain, "mean of an empty array");
    return accumulate(xs).mean;
}

inline double stddev(const Array& xs, unsigned ddof = 0) {
    UNCERT_ENSURE(!xs.empty(), ErrorCode::kDomain, "stddev of an empty array");
    return accumulate(xs).stddev(ddof);
}

} // namespace uncert::numeric
