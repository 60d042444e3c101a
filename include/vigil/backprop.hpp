#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "vigil/activations.hpp"
#include "vigil/core.hpp"
#include "vigil/errors.hpp"

namespace vigil {

/** Loss used to train the scalar prediction. */
enum class LossKind { Mse, BinaryCrossEntropy };

inline const char* to_string(LossKind k) {
    return k == LossKind::Mse ? "mse" : "binary_cross_entropy";
}

inline LossKind parse_loss(const std::string& name) {
    if (name == "mse")
        return LossKind::Mse;
    if (name == "binary_cross_entropy" || name == "bce")
        return LossKind::BinaryCrossEntropy;
    throw ConfigError("unknown loss: " + name);
}

struct ForwardOptions {
    Activation hidden{Activation::LeakyRelu};
    Activation output{Activation::Sigmoid};
    ActivationLimits limits{};
};

/** Values retained for one sample during the forward pass. */
struct SampleCache {
    /** `pre[l]` is the input of layer `l`'s activation. */
    std::vector<std::vector<double>> pre{};
    /** `post[0]` is the sample itself, `post[l + 1]` the output of layer `l`. */
    std::vector<std::vector<double>> post{};
};

struct ForwardResult {
    std::vector<SampleCache> cache{};
    /** Final layer outputs after the output activation. */
    std::vector<std::vector<double>> outputs{};
    /** Softmax over each final output. */
    std::vector<std::vector<double>> probabilities{};
    /** First component of each final output. */
    std::vector<double> predictions{};
};

struct BackwardResult {
    ParameterSet gradients{};
    double loss{0.0};
};

/**
 * Check that `params` forms a chain of non-empty layers fed by `input_width`
 * features.
 *
 * @throws ShapeError describing the first problem found
 */
inline void validate_parameters(const ParameterSet& params, std::size_t input_width) {
    if (params.empty())
        throw ShapeError("parameter set has no layers");
    std::size_t expected = input_width;
    for (std::size_t l = 0; l < params.size(); ++l) {
        const auto& w = params[l];
        if (w.empty() || w.rows() == 0 || w.cols() == 0)
            throw ShapeError("layer " + std::to_string(l) + " is empty");
        if (w.data().size() != w.rows() * w.cols())
            throw ShapeError("layer " + std::to_string(l) + " storage is malformed");
        if (w.rows() != expected)
            throw ShapeError("layer " + std::to_string(l) + " expects " +
                             std::to_string(w.rows()) + " inputs, got " +
                             std::to_string(expected));
        expected = w.cols();
    }
}

/** `input · W` followed by the activation; fills `pre` with the linear term. */
inline std::vector<double> dense_forward(const Matrix& w, const std::vector<double>& input,
                                         Activation act, const ActivationLimits& lim,
                                         std::vector<double>& pre) {
    pre.assign(w.cols(), 0.0);
    for (std::size_t r = 0; r < w.rows(); ++r) {
        double x = input[r];
        // Skipping zero inputs also hides 0 * NaN in row r; the watchdog's
        // parameter scan still counts those weights.
        if (x == 0.0)
            continue;
        for (std::size_t c = 0; c < w.cols(); ++c)
            pre[c] += x * w(r, c);
    }
    std::vector<double> out(pre.size());
    for (std::size_t c = 0; c < pre.size(); ++c)
        out[c] = activate(act, pre[c], lim);
    return out;
}

/**
 * Run every sample through the network, keeping the per-layer values needed
 * by `backward`.
 *
 * @throws ShapeError when the parameters are malformed or a sample has the
 *         wrong width
 */
inline ForwardResult forward(const ParameterSet& params,
                             const std::vector<std::vector<double>>& samples,
                             const ForwardOptions& opts = {}) {
    if (params.empty())
        throw ShapeError("parameter set has no layers");
    validate_parameters(params, params.front().rows());

    ForwardResult res;
    res.cache.resize(samples.size());
    res.outputs.reserve(samples.size());
    res.probabilities.reserve(samples.size());
    res.predictions.reserve(samples.size());

    const std::size_t width = params.front().rows();
    for (std::size_t s = 0; s < samples.size(); ++s) {
        if (samples[s].size() != width)
            throw ShapeError("sample " + std::to_string(s) + " has " +
                             std::to_string(samples[s].size()) + " features, expected " +
                             std::to_string(width));
        auto& c = res.cache[s];
        c.pre.resize(params.size());
        c.post.reserve(params.size() + 1);
        c.post.push_back(samples[s]);
        for (std::size_t l = 0; l < params.size(); ++l) {
            Activation act = l + 1 == params.size() ? opts.output : opts.hidden;
            c.post.push_back(dense_forward(params[l], c.post.back(), act, opts.limits, c.pre[l]));
        }
        res.outputs.push_back(c.post.back());
        res.probabilities.push_back(softmax(c.post.back()));
        res.predictions.push_back(c.post.back().front());
    }
    return res;
}

/** Mean loss of `predictions` against `targets`. */
inline double compute_loss(LossKind kind, const std::vector<double>& predictions,
                           const std::vector<double>& targets) {
    if (predictions.size() != targets.size())
        throw ShapeError("got " + std::to_string(predictions.size()) + " predictions for " +
                         std::to_string(targets.size()) + " targets");
    if (predictions.empty())
        return 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < predictions.size(); ++i) {
        double p = predictions[i];
        double t = targets[i];
        if (kind == LossKind::Mse) {
            sum += (p - t) * (p - t);
        } else {
            double q = clamp_finite(p, kSigmoidEpsilon, 1.0 - kSigmoidEpsilon);
            sum -= t * std::log(q) + (1.0 - t) * std::log(1.0 - q);
        }
    }
    return sum / static_cast<double>(predictions.size());
}

/** Derivative of the mean loss with respect to one prediction. */
inline double loss_derivative(LossKind kind, double prediction, double target, std::size_t n) {
    double scale = 1.0 / static_cast<double>(n);
    if (kind == LossKind::Mse)
        return 2.0 * (prediction - target) * scale;
    double q = clamp_finite(prediction, kSigmoidEpsilon, 1.0 - kSigmoidEpsilon);
    return (q - target) / (q * (1.0 - q)) * scale;
}

/**
 * Back-propagate the loss of the scalar predictions through every layer.
 *
 * Gradients are summed over samples with the `1/n` of the mean loss folded
 * in, so they are the batch average.
 */
inline BackwardResult backward(const ParameterSet& params, const ForwardResult& fwd,
                               const std::vector<double>& targets,
                               const ForwardOptions& opts = {}, LossKind loss = LossKind::Mse) {
    validate_parameters(params, params.empty() ? 0 : params.front().rows());
    if (fwd.cache.size() != targets.size())
        throw ShapeError("forward pass holds " + std::to_string(fwd.cache.size()) +
                         " samples but " + std::to_string(targets.size()) +
                         " targets were given");

    BackwardResult res;
    res.gradients = zeros_like(params);
    res.loss = compute_loss(loss, fwd.predictions, targets);
    const std::size_t n = targets.size();
    if (n == 0)
        return res;

    const std::size_t last = params.size() - 1;
    std::vector<double> delta;
    std::vector<double> prev_delta;
    for (std::size_t s = 0; s < n; ++s) {
        const auto& c = fwd.cache[s];
        delta.assign(params[last].cols(), 0.0);
        double dpred = loss_derivative(loss, fwd.predictions[s], targets[s], n);
        delta[0] = dpred * activation_derivative(opts.output, c.pre[last][0], opts.limits);

        for (std::size_t l = params.size(); l-- > 0;) {
            const auto& w = params[l];
            const auto& in = c.post[l];
            auto& g = res.gradients[l];
            for (std::size_t r = 0; r < w.rows(); ++r) {
                double x = in[r];
                for (std::size_t col = 0; col < w.cols(); ++col)
                    g(r, col) += x * delta[col];
            }
            if (l == 0)
                break;
            prev_delta.assign(w.rows(), 0.0);
            for (std::size_t r = 0; r < w.rows(); ++r) {
                double acc = 0.0;
                for (std::size_t col = 0; col < w.cols(); ++col)
                    acc += w(r, col) * delta[col];
                prev_delta[r] =
                    acc * activation_derivative(opts.hidden, c.pre[l - 1][r], opts.limits);
            }
            delta.swap(prev_delta);
        }
    }
    return res;
}

/** Binary target for an experience: 1 when the reward was positive. */
inline double target_from_reward(double reward) { return reward > 0.0 ? 1.0 : 0.0; }

inline std::vector<double> targets_from(const std::vector<Experience>& batch) {
    std::vector<double> t;
    t.reserve(batch.size());
    for (const auto& e : batch)
        t.push_back(target_from_reward(e.reward));
    return t;
}

inline std::vector<std::vector<double>> states_from(const std::vector<Experience>& batch) {
    std::vector<std::vector<double>> s;
    s.reserve(batch.size());
    for (const auto& e : batch)
        s.push_back(e.state);
    return s;
}

/** Add `(lambda/2)·Σθ²` to the loss and `lambda·θ` to every gradient. */
inline double apply_l2_regularization(const ParameterSet& params, ParameterSet& grads,
                                      double lambda) {
    double sum = 0.0;
    for (std::size_t l = 0; l < params.size(); ++l) {
        const auto& p = params[l].data();
        auto& g = grads[l].data();
        for (std::size_t i = 0; i < p.size(); ++i) {
            sum += p[i] * p[i];
            g[i] += lambda * p[i];
        }
    }
    return 0.5 * lambda * sum;
}

/** Map a prediction onto the three action buckets. */
inline int prediction_bucket(double prediction) {
    if (prediction < 0.33)
        return static_cast<int>(Action::Hold);
    if (prediction < 0.66)
        return static_cast<int>(Action::Buy);
    return static_cast<int>(Action::Sell);
}

/** Fraction of samples whose prediction side of 0.5 matches the reward sign. */
inline double directional_accuracy(const std::vector<double>& predictions,
                                   const std::vector<Experience>& batch) {
    if (batch.empty())
        return 0.0;
    std::size_t hits = 0;
    for (std::size_t i = 0; i < batch.size(); ++i)
        if ((predictions[i] - 0.5 > 0.0) == (batch[i].reward > 0.0))
            ++hits;
    return static_cast<double>(hits) / static_cast<double>(batch.size());
}

inline double classification_accuracy(const std::vector<double>& predictions,
                                      const std::vector<Experience>& batch) {
    if (batch.empty())
        return 0.0;
    std::size_t hits = 0;
    for (std::size_t i = 0; i < batch.size(); ++i)
        if (prediction_bucket(predictions[i]) == batch[i].action)
            ++hits;
    return static_cast<double>(hits) / static_cast<double>(batch.size());
}

inline double mean_absolute_error(const std::vector<double>& predictions,
                                  const std::vector<double>& targets) {
    if (targets.empty())
        return 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < targets.size(); ++i)
        sum += std::abs(predictions[i] - targets[i]);
    return sum / static_cast<double>(targets.size());
}

/** Coefficient of determination; 0 when the targets have no variance. */
inline double r_squared(const std::vector<double>& predictions,
                        const std::vector<double>& targets) {
    if (targets.empty())
        return 0.0;
    double mean = 0.0;
    for (double t : targets)
        mean += t;
    mean /= static_cast<double>(targets.size());
    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        ss_res += (targets[i] - predictions[i]) * (targets[i] - predictions[i]);
        ss_tot += (targets[i] - mean) * (targets[i] - mean);
    }
    if (ss_tot <= 0.0)
        return 0.0;
    return 1.0 - ss_res / ss_tot;
}

} // namespace vigil
