#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "vigil/activations.hpp"
#include "vigil/errors.hpp"

namespace vigil {

enum class ExplorationMode { EpsilonGreedy, SoftmaxTemperature, EntropyGuided };
enum class DecaySchedule { Linear, Exponential };

inline const char* to_string(ExplorationMode m) {
    switch (m) {
    case ExplorationMode::EpsilonGreedy:
        return "epsilon_greedy";
    case ExplorationMode::SoftmaxTemperature:
        return "softmax_temperature";
    case ExplorationMode::EntropyGuided:
        return "entropy_guided";
    }
    return "epsilon_greedy";
}

inline ExplorationMode parse_exploration_mode(const std::string& s) {
    if (s == "epsilon_greedy")
        return ExplorationMode::EpsilonGreedy;
    if (s == "softmax_temperature" || s == "temperature")
        return ExplorationMode::SoftmaxTemperature;
    if (s == "entropy_guided")
        return ExplorationMode::EntropyGuided;
    throw ConfigError("unknown exploration mode: " + s);
}

inline const char* to_string(DecaySchedule s) {
    return s == DecaySchedule::Linear ? "linear" : "exponential";
}

inline DecaySchedule parse_decay_schedule(const std::string& s) {
    if (s == "linear")
        return DecaySchedule::Linear;
    if (s == "exponential")
        return DecaySchedule::Exponential;
    throw ConfigError("unknown decay schedule: " + s);
}

struct ExplorationConfig {
    double start{0.2};                ///< Epsilon or temperature at step zero
    double end{0.02};                 ///< Value reached after `decay_steps`
    std::size_t decay_steps{50000};
    ExplorationMode mode{ExplorationMode::EpsilonGreedy};
    DecaySchedule schedule{DecaySchedule::Linear};
    std::optional<std::uint64_t> seed{};
    double entropy_threshold{0.5};    ///< Policy entropy above which entropy_guided explores
    double uncertainty_weight{0.3};   ///< Uncertainty above which entropy_guided explores
};

inline void validate(const ExplorationConfig& c) {
    if (!(c.start > 0.0) || !(c.end > 0.0))
        throw ConfigError("exploration start and end must be positive");
    if (c.end > c.start)
        throw ConfigError("exploration end must not exceed start");
    if (c.mode == ExplorationMode::EpsilonGreedy && c.start > 1.0)
        throw ConfigError("epsilon must not exceed 1");
    if (c.decay_steps == 0)
        throw ConfigError("exploration decaySteps must be positive");
    if (!(c.entropy_threshold >= 0.0) || !(c.uncertainty_weight >= 0.0))
        throw ConfigError("exploration entropyThreshold and uncertaintyWeight must be non-negative");
}

/** Shannon entropy of softmax(`q_values`) in nats. */
inline double policy_entropy(const std::vector<double>& q_values) {
    double h = 0.0;
    for (double p : softmax(q_values))
        h -= p * std::log(p + 1e-8);
    return h;
}

struct ExplorationState {
    double current{0.2};
    std::uint64_t step{0};
    std::uint64_t exploration_count{0};
    std::uint64_t exploitation_count{0};
};

struct ExplorationStatistics {
    double current_epsilon{0.0};
    double exploration_ratio{0.0};
    double exploitation_ratio{0.0};
    std::uint64_t total_actions{0};
    double decay_progress{0.0};
};

struct ActionChoice {
    int action{0};
    bool explored{false};
};

struct ExplorationCase {
    ExplorationMode mode{ExplorationMode::EpsilonGreedy};
    double exploration_ratio{0.0};
    bool valid_actions{true};
    bool passed{false};
};

struct ExplorationReport {
    bool passed{true};
    std::vector<ExplorationCase> cases{};
};

/**
 * @brief Decaying exploration policy.
 *
 * Holds its own state and generator. Nothing here takes part in gradient
 * computation, and watchdog rollbacks never touch it.
 */
class ExplorationStrategy {
  public:
    ExplorationStrategy() : ExplorationStrategy(ExplorationConfig{}) {}
    explicit ExplorationStrategy(ExplorationConfig config)
        : config_{config}, rng_{config.seed ? *config.seed : std::random_device{}()} {
        validate(config_);
        state_.current = config_.start;
    }

    const ExplorationConfig& config() const { return config_; }
    const ExplorationState& state() const { return state_; }
    void set_state(const ExplorationState& s) { state_ = s; }

    double current_epsilon() const { return state_.current; }

    /** Value of the schedule after `step` decay steps. */
    double value_at(std::uint64_t step) const {
        double progress = std::min(1.0, static_cast<double>(step) /
                                            static_cast<double>(config_.decay_steps));
        if (config_.schedule == DecaySchedule::Linear)
            return config_.start - (config_.start - config_.end) * progress;
        return config_.start * std::pow(config_.end / config_.start, progress);
    }

    /** Advance the decay by one step. */
    double step() {
        ++state_.step;
        state_.current = value_at(state_.step);
        return state_.current;
    }

    /**
     * Pick an action from `q_values`.
     *
     * @throws ShapeError when `q_values` is empty
     */
    ActionChoice select_action(const std::vector<double>& q_values) {
        return choose(q_values, nullptr);
    }

    /**
     * Pick an action with per-action `uncertainties`.
     *
     * Only `EntropyGuided` reads them: it explores when the largest exceeds
     * `uncertainty_weight` and then takes the most uncertain action.
     *
     * @throws ShapeError when `q_values` is empty or the sizes differ
     */
    ActionChoice select_action(const std::vector<double>& q_values,
                               const std::vector<double>& uncertainties) {
        if (uncertainties.size() != q_values.size())
            throw ShapeError("got " + std::to_string(uncertainties.size()) +
                             " uncertainties for " + std::to_string(q_values.size()) +
                             " actions");
        return choose(q_values, &uncertainties);
    }

    /** Share of exploratory decisions; the current epsilon before any decision. */
    double exploration_ratio() const {
        auto total = state_.exploration_count + state_.exploitation_count;
        if (total == 0)
            return std::min(1.0, state_.current);
        return static_cast<double>(state_.exploration_count) / static_cast<double>(total);
    }

    double exploitation_ratio() const { return 1.0 - exploration_ratio(); }

    ExplorationStatistics statistics() const {
        ExplorationStatistics s;
        s.current_epsilon = state_.current;
        s.exploration_ratio = exploration_ratio();
        s.exploitation_ratio = exploitation_ratio();
        s.total_actions = state_.exploration_count + state_.exploitation_count;
        s.decay_progress = std::min(1.0, static_cast<double>(state_.step) /
                                             static_cast<double>(config_.decay_steps));
        return s;
    }

    /**
     * Run 1000 decisions per mode on fixed values and uncertainties.
     *
     * Every action must be in range. The decaying modes must mix exploration
     * and exploitation; entropy_guided must explore at least once.
     */
    static ExplorationReport run_exploration_self_test(std::uint64_t seed = 42) {
        const std::vector<double> q{0.1, 0.8, 0.3, 0.6};
        const std::vector<double> uncertainty{0.2, 0.9, 0.1, 0.4};
        ExplorationReport report;
        for (auto mode : {ExplorationMode::EpsilonGreedy, ExplorationMode::SoftmaxTemperature,
                          ExplorationMode::EntropyGuided}) {
            ExplorationConfig cfg;
            cfg.mode = mode;
            cfg.seed = seed;
            ExplorationStrategy strategy(cfg);
            ExplorationCase ec;
            ec.mode = mode;
            for (int i = 0; i < 1000; ++i) {
                ActionChoice c = strategy.select_action(q, uncertainty);
                ec.valid_actions = ec.valid_actions && c.action >= 0 &&
                                   c.action < static_cast<int>(q.size());
                strategy.step();
            }
            ec.exploration_ratio = strategy.exploration_ratio();
            bool mixed = mode == ExplorationMode::EntropyGuided
                             ? ec.exploration_ratio > 0.0
                             : ec.exploration_ratio > 0.0 && ec.exploration_ratio < 1.0;
            ec.passed = ec.valid_actions && mixed;
            report.passed = report.passed && ec.passed;
            report.cases.push_back(ec);
        }
        return report;
    }

  private:
    ActionChoice choose(const std::vector<double>& q_values,
                        const std::vector<double>* uncertainties) {
        if (q_values.empty())
            throw ShapeError("cannot select an action from an empty value vector");
        int greedy = static_cast<int>(std::distance(
            q_values.begin(), std::max_element(q_values.begin(), q_values.end())));
        ActionChoice c;
        if (config_.mode == ExplorationMode::EpsilonGreedy) {
            std::uniform_real_distribution<double> u(0.0, 1.0);
            c.explored = u(rng_) < state_.current;
            if (c.explored) {
                std::uniform_int_distribution<int> pick(0, static_cast<int>(q_values.size()) - 1);
                c.action = pick(rng_);
            } else {
                c.action = greedy;
            }
        } else if (config_.mode == ExplorationMode::SoftmaxTemperature) {
            auto probs = softmax(q_values, state_.current);
            std::discrete_distribution<int> pick(probs.begin(), probs.end());
            c.action = pick(rng_);
            c.explored = c.action != greedy;
        } else {
            // Without uncertainties the entropy stands in for them.
            double entropy = policy_entropy(q_values);
            double uncertainty =
                uncertainties ? *std::max_element(uncertainties->begin(), uncertainties->end())
                              : entropy;
            c.explored =
                entropy > config_.entropy_threshold || uncertainty > config_.uncertainty_weight;
            if (!c.explored) {
                c.action = greedy;
            } else if (uncertainties) {
                c.action = static_cast<int>(std::distance(
                    uncertainties->begin(),
                    std::max_element(uncertainties->begin(), uncertainties->end())));
            } else {
                std::uniform_int_distribution<int> pick(0, static_cast<int>(q_values.size()) - 1);
                c.action = pick(rng_);
            }
        }
        if (c.explored)
            ++state_.exploration_count;
        else
            ++state_.exploitation_count;
        return c;
    }

    ExplorationConfig config_{};
    ExplorationState state_{};
    std::mt19937_64 rng_;
};

} // namespace vigil
