#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "vigil/errors.hpp"

namespace vigil {

/** Activation functions available to dense layers. */
enum class Activation { LeakyRelu, Sigmoid, Tanh, Linear };

inline const char* to_string(Activation a) {
    switch (a) {
    case Activation::LeakyRelu:
        return "leaky_relu";
    case Activation::Sigmoid:
        return "sigmoid";
    case Activation::Tanh:
        return "tanh";
    case Activation::Linear:
        return "linear";
    }
    return "linear";
}

inline Activation parse_activation(const std::string& name) {
    if (name == "leaky_relu" || name == "leakyReLU")
        return Activation::LeakyRelu;
    if (name == "sigmoid")
        return Activation::Sigmoid;
    if (name == "tanh")
        return Activation::Tanh;
    if (name == "linear")
        return Activation::Linear;
    throw ConfigError("unknown activation: " + name);
}

/** Slope applied to negative inputs by leaky ReLU. */
constexpr double kLeakySlope = 0.01;
/** Every activation output is clamped to +/- this bound. */
constexpr double kActivationOutputLimit = 1e6;
/** Sigmoid outputs stay inside `(eps, 1 - eps)` so its derivative never vanishes. */
constexpr double kSigmoidEpsilon = 1e-12;

/** Input range applied before an activation is evaluated. */
struct ActivationLimits {
    double input_min{-1e4};
    double input_max{1e4};
};

/**
 * Clamp a value to `[lo, hi]`, letting NaN through untouched.
 *
 * NaN must survive so the watchdog can see it; `std::clamp` would return an
 * arbitrary bound instead.
 */
inline double clamp_finite(double x, double lo, double hi) {
    if (std::isnan(x))
        return x;
    if (x < lo)
        return lo;
    if (x > hi)
        return hi;
    return x;
}

inline double clip_output(double y) {
    return clamp_finite(y, -kActivationOutputLimit, kActivationOutputLimit);
}

inline double leaky_relu(double x, const ActivationLimits& lim = {}) {
    x = clamp_finite(x, lim.input_min, lim.input_max);
    return clip_output(x > 0.0 ? x : kLeakySlope * x);
}

inline double sigmoid(double x, const ActivationLimits& lim = {}) {
    x = clamp_finite(x, lim.input_min, lim.input_max);
    // Split on the sign so exp never overflows.
    double y;
    if (x >= 0.0) {
        y = 1.0 / (1.0 + std::exp(-x));
    } else {
        double e = std::exp(x);
        y = e / (1.0 + e);
    }
    return clamp_finite(y, kSigmoidEpsilon, 1.0 - kSigmoidEpsilon);
}

inline double tanh_act(double x, const ActivationLimits& lim = {}) {
    x = clamp_finite(x, lim.input_min, lim.input_max);
    return clip_output(std::tanh(x));
}

inline double linear(double x, const ActivationLimits& lim = {}) {
    return clip_output(clamp_finite(x, lim.input_min, lim.input_max));
}

/** Evaluate `a` at `x`. */
inline double activate(Activation a, double x, const ActivationLimits& lim = {}) {
    switch (a) {
    case Activation::LeakyRelu:
        return leaky_relu(x, lim);
    case Activation::Sigmoid:
        return sigmoid(x, lim);
    case Activation::Tanh:
        return tanh_act(x, lim);
    case Activation::Linear:
        return linear(x, lim);
    }
    return x;
}

/**
 * Derivative of `a` with respect to its pre-activation input `x`.
 */
inline double activation_derivative(Activation a, double x, const ActivationLimits& lim = {}) {
    switch (a) {
    case Activation::LeakyRelu:
        return x > 0.0 ? 1.0 : kLeakySlope;
    case Activation::Sigmoid: {
        double s = sigmoid(x, lim);
        return s * (1.0 - s);
    }
    case Activation::Tanh: {
        double t = tanh_act(x, lim);
        return 1.0 - t * t;
    }
    case Activation::Linear:
        return 1.0;
    }
    return 1.0;
}

/** Apply an activation to every element of a vector. */
inline std::vector<double> activate(Activation a, const std::vector<double>& xs,
                                    const ActivationLimits& lim = {}) {
    std::vector<double> out(xs.size());
    for (std::size_t i = 0; i < xs.size(); ++i)
        out[i] = activate(a, xs[i], lim);
    return out;
}

/** Numerically stable softmax. An empty input yields an empty output. */
inline std::vector<double> softmax(const std::vector<double>& logits, double temperature = 1.0) {
    std::vector<double> out(logits.size());
    if (logits.empty())
        return out;
    if (!(temperature > 0.0))
        temperature = 1.0;
    double max_logit = -std::numeric_limits<double>::infinity();
    for (double v : logits)
        max_logit = std::max(max_logit, v / temperature);
    double sum = 0.0;
    for (std::size_t i = 0; i < logits.size(); ++i) {
        out[i] = std::exp(logits[i] / temperature - max_logit);
        sum += out[i];
    }
    if (!(sum > 0.0) || !std::isfinite(sum)) {
        std::fill(out.begin(), out.end(), 1.0 / static_cast<double>(out.size()));
        return out;
    }
    for (auto& v : out)
        v /= sum;
    return out;
}

struct StabilityCase {
    std::string inputs{};
    std::string function{};
    bool passed{false};
};

struct StabilityReport {
    bool passed{true};
    std::vector<StabilityCase> cases{};
};

/**
 * Evaluate every activation and softmax on three extreme input sets and
 * check that no output is NaN or infinite. Non-finite inputs are dropped
 * first since NaN is meant to pass through.
 */
inline StabilityReport run_activation_stability_self_test(const ActivationLimits& lim = {}) {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<std::pair<const char*, std::vector<double>>> sets{
        {"extreme_values", {-1000, -100, -10, -1, 0, 1, 10, 100, 1000}},
        {"infinity_bounds", {-inf, -1e10, 1e10, inf}},
        {"nan_and_zero", {nan, -nan, 0.0, -0.0}},
    };
    auto finite = [](const std::vector<double>& v) {
        return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
    };
    StabilityReport report;
    for (const auto& set : sets) {
        std::vector<double> xs;
        std::copy_if(set.second.begin(), set.second.end(), std::back_inserter(xs),
                     [](double x) { return std::isfinite(x); });
        for (Activation a : {Activation::LeakyRelu, Activation::Sigmoid, Activation::Tanh,
                             Activation::Linear}) {
            StabilityCase c{set.first, to_string(a), finite(activate(a, xs, lim))};
            report.passed = report.passed && c.passed;
            report.cases.push_back(std::move(c));
        }
        StabilityCase c{set.first, "softmax", finite(softmax(xs))};
        report.passed = report.passed && c.passed;
        report.cases.push_back(std::move(c));
    }
    return report;
}

} // namespace vigil
