#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include "vigil/config.hpp"
#include "vigil/core.hpp"
#include "vigil/errors.hpp"

#if VIGIL_HAS_SSE2
#include <emmintrin.h>
#endif

namespace vigil {

enum class NormType { L2, L1, Inf };

inline const char* to_string(NormType t) {
    switch (t) {
    case NormType::L2:
        return "l2";
    case NormType::L1:
        return "l1";
    case NormType::Inf:
        return "inf";
    }
    return "l2";
}

inline NormType parse_norm_type(const std::string& s) {
    if (s == "l2")
        return NormType::L2;
    if (s == "l1")
        return NormType::L1;
    if (s == "inf")
        return NormType::Inf;
    throw ConfigError("unknown gradient norm type: " + s);
}

/**
 * Sum of squares of a contiguous range, each element first divided by
 * `divisor`. Passing the largest magnitude as divisor keeps every term in
 * [0, 1] so the sum cannot overflow.
 */
inline double sum_of_squares(const double* d, std::size_t n, double divisor = 1.0) {
#if VIGIL_HAS_SSE2
    __m128d acc = _mm_setzero_pd();
    __m128d div = _mm_set1_pd(divisor);
    std::size_t i = 0;
    // Two products per iteration.
    for (; i + 2 <= n; i += 2) {
        __m128d v = _mm_div_pd(_mm_loadu_pd(&d[i]), div);
        acc = _mm_add_pd(acc, _mm_mul_pd(v, v));
    }
    alignas(16) double tmp[2];
    _mm_store_pd(tmp, acc);
    double sum = tmp[0] + tmp[1];
    for (; i < n; ++i) {
        double v = d[i] / divisor;
        sum += v * v;
    }
#else
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double v = d[i] / divisor;
        sum += v * v;
    }
#endif
    return sum;
}

namespace detail {

/**
 * Norm of every element across `count` matrices starting at `first`.
 *
 * With `finite_only` set, NaN and Inf elements are skipped. Otherwise a NaN
 * element yields NaN and an infinite one yields infinity. Finite inputs are
 * accumulated relative to the largest magnitude, so the result overflows only
 * when the true norm exceeds the double range.
 */
inline double norm(const Matrix* first, std::size_t count, NormType type, bool finite_only) {
    const Matrix* last = first + count;
    double largest = 0.0;
    bool saw_inf = false;
    for (const Matrix* g = first; g != last; ++g)
        for (double v : g->data()) {
            if (std::isnan(v)) {
                if (!finite_only)
                    return std::numeric_limits<double>::quiet_NaN();
                continue;
            }
            if (std::isinf(v)) {
                saw_inf = true;
                continue;
            }
            largest = std::max(largest, std::abs(v));
        }
    if (saw_inf && !finite_only)
        return std::numeric_limits<double>::infinity();
    if (largest == 0.0 || type == NormType::Inf)
        return largest;

    double sum = 0.0;
    for (const Matrix* g = first; g != last; ++g) {
        const auto& d = g->data();
        if (!finite_only && type == NormType::L2) {
            sum += sum_of_squares(d.data(), d.size(), largest);
            continue;
        }
        for (double v : d) {
            if (!std::isfinite(v))
                continue;
            double r = std::abs(v) / largest;
            sum += type == NormType::L2 ? r * r : r;
        }
    }
    return type == NormType::L2 ? largest * std::sqrt(sum) : largest * sum;
}

} // namespace detail

/** Compute the L2 norm of a matrix. */
inline double matrix_l2_norm(const Matrix& m) {
    return detail::norm(&m, 1, NormType::L2, false);
}

/** Combined norm of a collection of gradients; NaN or Inf when any element is. */
inline double gradients_norm(const ParameterSet& grads, NormType type = NormType::L2) {
    return detail::norm(grads.data(), grads.size(), type, false);
}

/** Compute the combined L2 norm of a collection of gradients. */
inline double gradients_l2_norm(const ParameterSet& grads) {
    return detail::norm(grads.data(), grads.size(), NormType::L2, false);
}

/** Combined L2 norm counting only finite elements. */
inline double finite_l2_norm(const ParameterSet& grads) {
    return detail::norm(grads.data(), grads.size(), NormType::L2, true);
}

/** Multiply every element of every matrix by `factor`. */
inline void scale_in_place(ParameterSet& grads, double factor) {
    for (auto& g : grads) {
        auto& d = g.data();
        std::size_t n = d.size();
#if VIGIL_HAS_SSE2
        __m128d f = _mm_set1_pd(factor);
        std::size_t i = 0;
        for (; i + 2 <= n; i += 2)
            _mm_storeu_pd(&d[i], _mm_mul_pd(_mm_loadu_pd(&d[i]), f));
        for (; i < n; ++i)
            d[i] *= factor;
#else
        for (std::size_t i = 0; i < n; ++i)
            d[i] *= factor;
#endif
    }
}

struct ClipperConfig {
    double max_norm{1.0};
    NormType norm_type{NormType::L2};
};

struct ClipResult {
    double pre_clip_norm{0.0};
    double post_clip_norm{0.0};
    double scale{1.0};
    bool was_clipped{false};
    /** False when a gradient element was NaN or infinite. */
    bool finite{true};
};

/**
 * Rescale `grads` so their global norm does not exceed `max_norm`.
 *
 * Direction is preserved. A NaN or infinite element leaves the gradients
 * untouched and is reported through `ClipResult::finite`.
 */
inline ClipResult clip_by_global_norm(ParameterSet& grads, double max_norm,
                                      NormType type = NormType::L2) {
    if (!(max_norm > 0.0))
        throw ConfigError("max gradient norm must be positive");
    ClipResult r;
    r.pre_clip_norm = gradients_norm(grads, type);
    if (!std::isfinite(r.pre_clip_norm)) {
        r.finite = false;
        r.post_clip_norm = r.pre_clip_norm;
        return r;
    }
    r.post_clip_norm = r.pre_clip_norm;
    if (r.pre_clip_norm > max_norm) {
        r.scale = max_norm / r.pre_clip_norm;
        scale_in_place(grads, r.scale);
        r.was_clipped = true;
        r.post_clip_norm = gradients_norm(grads, type);
    }
    return r;
}

struct ClipCase {
    std::string name{};
    double pre_clip_norm{0.0};
    double post_clip_norm{0.0};
    bool passed{false};
};

struct ClipReport {
    bool passed{true};
    std::vector<ClipCase> cases{};
};

/** Clipper bound to a fixed configuration. */
class GradientClipper {
  public:
    GradientClipper() = default;
    explicit GradientClipper(ClipperConfig config) : config_{config} {
        if (!(config_.max_norm > 0.0))
            throw ConfigError("max gradient norm must be positive");
    }

    ClipResult clip(ParameterSet& grads) const {
        return clip_by_global_norm(grads, config_.max_norm, config_.norm_type);
    }

    double max_norm() const { return config_.max_norm; }
    NormType norm_type() const { return config_.norm_type; }

    /**
     * Clip four fixed gradient sets (normal, large, extreme and mixed
     * magnitudes) and check each lands within `max_norm`.
     */
    ClipReport run_exploding_gradients_self_test() const {
        auto set = [](std::vector<double> a, std::vector<double> b) {
            return ParameterSet{Matrix{2, 2, std::move(a)}, Matrix{1, 2, std::move(b)}};
        };
        struct Case {
            const char* name;
            ParameterSet grads;
        };
        std::vector<Case> cases{
            {"normal", set({0.1, 0.2, 0.3, 0.4}, {0.5, 0.6})},
            {"large", set({10, 20, 30, 40}, {50, 60})},
            {"extreme", set({1000, 2000, 3000, 4000}, {5000, 6000})},
            {"mixed", set({0.01, 1000, 0.02, 2000}, {0.03, 3000})},
        };
        ClipReport report;
        for (auto& c : cases) {
            ClipResult r = clip(c.grads);
            ClipCase cc;
            cc.name = c.name;
            cc.pre_clip_norm = r.pre_clip_norm;
            cc.post_clip_norm = r.post_clip_norm;
            cc.passed = r.finite && r.post_clip_norm <= config_.max_norm + 1e-6;
            report.passed = report.passed && cc.passed;
            report.cases.push_back(std::move(cc));
        }
        return report;
    }

  private:
    ClipperConfig config_{};
};

} // namespace vigil
