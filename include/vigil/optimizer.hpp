#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vigil/core.hpp"
#include "vigil/errors.hpp"

namespace vigil {

struct OptimizerConfig {
    double learning_rate{0.001};
    double beta1{0.9};
    double beta2{0.999};
    double weight_decay{0.01};
    double epsilon{1e-8};
};

/** First and second moments for every parameter plus the step counter. */
struct OptimizerState {
    ParameterSet m{};
    ParameterSet v{};
    std::uint64_t step{0};
};

inline OptimizerState clone_optimizer_state(const OptimizerState& s) {
    return {clone_parameters(s.m), clone_parameters(s.v), s.step};
}

inline bool operator==(const OptimizerState& a, const OptimizerState& b) {
    return a.step == b.step && a.m == b.m && a.v == b.v;
}

inline void validate(const OptimizerConfig& c) {
    if (!(c.learning_rate > 0.0))
        throw ConfigError("learningRate must be positive");
    if (!(c.beta1 >= 0.0 && c.beta1 < 1.0))
        throw ConfigError("beta1 must lie in [0, 1)");
    if (!(c.beta2 >= 0.0 && c.beta2 < 1.0))
        throw ConfigError("beta2 must lie in [0, 1)");
    if (!(c.weight_decay >= 0.0))
        throw ConfigError("weightDecay must be non-negative");
    if (!(c.epsilon > 0.0))
        throw ConfigError("epsilon must be positive");
}

/**
 * Update one parameter matrix using the AdamW optimisation algorithm.
 *
 * Weight decay is applied to the parameter directly rather than folded into
 * the gradient.
 */
inline void apply_adamw_update(Matrix& param, const Matrix& grad, Matrix& m, Matrix& v,
                               std::uint64_t t, double lr, double beta1, double beta2,
                               double eps, double weight_decay) {
    auto& p = param.data();
    const auto& g = grad.data();
    auto& mdat = m.data();
    auto& vdat = v.data();
    std::size_t n = p.size();
    double bias1 = 1.0 - std::pow(beta1, static_cast<double>(t));
    double bias2 = 1.0 - std::pow(beta2, static_cast<double>(t));
    for (std::size_t i = 0; i < n; ++i) {
        mdat[i] = beta1 * mdat[i] + (1.0 - beta1) * g[i];
        vdat[i] = beta2 * vdat[i] + (1.0 - beta2) * g[i] * g[i];
        double m_hat = mdat[i] / bias1;
        double v_hat = vdat[i] / bias2;
        double upd = m_hat / (std::sqrt(v_hat) + eps) + weight_decay * p[i];
        p[i] -= lr * upd;
    }
}

/** Outcome of `AdamWOptimizer::verify_decoupled_weight_decay`. */
struct WeightDecayCheck {
    double expected_difference{0.0};
    double actual_difference{0.0};
    bool passed{false};
};

/**
 * @brief AdamW over a whole parameter set.
 *
 * The optimizer holds only its hyperparameters; moments live in an
 * `OptimizerState` owned by the caller so they can be checkpointed and
 * restored alongside the parameters.
 */
class AdamWOptimizer {
  public:
    AdamWOptimizer() = default;
    explicit AdamWOptimizer(OptimizerConfig config) : config_{config} { validate(config_); }

    const OptimizerConfig& config() const { return config_; }

    /** Zero moments shaped like `params`. */
    OptimizerState initialize_state(const ParameterSet& params) const {
        return {zeros_like(params), zeros_like(params), 0};
    }

    /**
     * Apply one update at learning rate `lr`.
     *
     * @throws ShapeError when parameters, gradients and moments disagree
     */
    void step(ParameterSet& params, const ParameterSet& grads, OptimizerState& state,
              double lr) const {
        auto shapes = shapes_of(params);
        require_shapes(grads, shapes, "gradients");
        require_shapes(state.m, shapes, "first moment");
        require_shapes(state.v, shapes, "second moment");
        ++state.step;
        for (std::size_t i = 0; i < params.size(); ++i)
            apply_adamw_update(params[i], grads[i], state.m[i], state.v[i], state.step, lr,
                               config_.beta1, config_.beta2, config_.epsilon,
                               config_.weight_decay);
    }

    void step(ParameterSet& params, const ParameterSet& grads, OptimizerState& state) const {
        step(params, grads, state, config_.learning_rate);
    }

    /**
     * Take one step with and without a weight decay of 0.01 from the same
     * start and check that the first parameter differs by exactly
     * `lr * 0.01 * p`, i.e. decay bypasses the adaptive moments.
     */
    WeightDecayCheck verify_decoupled_weight_decay() const {
        const ParameterSet start{Matrix{2, 2, std::vector<double>{1.0, 2.0, 3.0, 4.0}}};
        const ParameterSet grads{Matrix{2, 2, std::vector<double>{0.1, 0.2, 0.3, 0.4}}};
        const double decay = 0.01;

        OptimizerConfig plain_cfg = config_;
        plain_cfg.weight_decay = 0.0;
        OptimizerConfig decayed_cfg = config_;
        decayed_cfg.weight_decay = decay;

        ParameterSet plain = clone_parameters(start);
        OptimizerState plain_state = initialize_state(plain);
        AdamWOptimizer(plain_cfg).step(plain, grads, plain_state);
        ParameterSet decayed = clone_parameters(start);
        OptimizerState decayed_state = initialize_state(decayed);
        AdamWOptimizer(decayed_cfg).step(decayed, grads, decayed_state);

        WeightDecayCheck c;
        c.expected_difference = config_.learning_rate * decay * start[0](0, 0);
        c.actual_difference = plain[0](0, 0) - decayed[0](0, 0);
        c.passed = std::abs(c.actual_difference - c.expected_difference) < 1e-6;
        return c;
    }

  private:
    OptimizerConfig config_{};
};

} // namespace vigil
