#pragma once

#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "vigil/activations.hpp"
#include "vigil/backprop.hpp"
#include "vigil/errors.hpp"
#include "vigil/experience_buffer.hpp"
#include "vigil/exploration.hpp"
#include "vigil/gradient_clipper.hpp"
#include "vigil/initializer.hpp"
#include "vigil/lr_scheduler.hpp"
#include "vigil/optimizer.hpp"
#include "vigil/serialization.hpp"
#include "vigil/watchdog.hpp"

namespace vigil {

struct RegularizationConfig {
    double lambda{1e-4};
    bool enabled{true};
};

/** Options controlling the epoch loop. */
struct TrainingConfig {
    std::size_t batch_size{32};
    std::size_t epochs{1000};
    double validation_split{0.2};           ///< Newest fraction held out for validation
    std::size_t early_stopping_patience{50}; ///< Epochs without improvement before stopping
    std::size_t checkpoint_interval{100};    ///< Steps between automatic checkpoints
    std::size_t log_interval{10};            ///< Steps between progress log lines
    RegularizationConfig regularization{};
    double max_grad_norm{1.0};               ///< Global gradient norm bound
    NormType grad_norm_type{NormType::L2};   ///< Norm the bound applies to
    std::string checkpoint_path{};           ///< Automatic checkpoints are off when empty
    LossKind loss{LossKind::Mse};
};

inline void validate(const TrainingConfig& c) {
    if (c.batch_size == 0)
        throw ConfigError("batchSize must be positive");
    if (!(c.validation_split >= 0.0 && c.validation_split < 1.0))
        throw ConfigError("validationSplit must lie in [0, 1)");
    if (!(c.max_grad_norm > 0.0))
        throw ConfigError("maxGradNorm must be positive");
    if (!(c.regularization.lambda >= 0.0))
        throw ConfigError("regularization lambda must be non-negative");
}

/** Every tunable of the training engine. */
struct EngineConfig {
    TrainingConfig training{};
    OptimizerConfig optimizer{};
    SchedulerConfig scheduler{};
    WatchdogConfig watchdog{};
    ExplorationConfig exploration{};
    BufferConfig buffer{};
    InitializerConfig initializer{};
    ActivationLimits activation_limits{};
};

/**
 * Set the optimizer rate and the scheduler's starting rate together.
 *
 * The two must agree; `validate` rejects a configuration where they differ.
 */
inline void set_learning_rate(EngineConfig& c, double lr) {
    c.optimizer.learning_rate = lr;
    c.scheduler.initial_lr = lr;
}

inline void validate(const EngineConfig& c) {
    if (c.optimizer.learning_rate != c.scheduler.initial_lr)
        throw ConfigError("optimizer learningRate (" + std::to_string(c.optimizer.learning_rate) +
                          ") and scheduler initialLR (" + std::to_string(c.scheduler.initial_lr) +
                          ") disagree; set both or use set_learning_rate");
    validate(c.training);
    validate(c.optimizer);
    validate(c.scheduler);
    validate(c.watchdog);
    validate(c.exploration);
    validate(c.buffer);
    if (!(c.initializer.gain > 0.0))
        throw ConfigError("initializer gain must be positive");
    if (!(c.activation_limits.input_min < c.activation_limits.input_max))
        throw ConfigError("activation inputMin must be below inputMax");
}

// JSON uses camelCase keys. Every `from_json` below only overrides the keys
// that are present, so partial documents layer on top of the defaults.

inline void to_json(json& j, const RegularizationConfig& c) {
    j = json{{"lambda", c.lambda}, {"enabled", c.enabled}};
}

inline void from_json(const json& j, RegularizationConfig& c) {
    read_optional(j, "lambda", c.lambda);
    read_optional(j, "enabled", c.enabled);
}

inline void to_json(json& j, const TrainingConfig& c) {
    j = json{{"batchSize", c.batch_size},
             {"epochs", c.epochs},
             {"validationSplit", c.validation_split},
             {"earlyStoppingPatience", c.early_stopping_patience},
             {"checkpointInterval", c.checkpoint_interval},
             {"logInterval", c.log_interval},
             {"regularization", c.regularization},
             {"maxGradNorm", c.max_grad_norm},
             {"gradNormType", to_string(c.grad_norm_type)},
             {"checkpointPath", c.checkpoint_path},
             {"loss", to_string(c.loss)}};
}

inline void from_json(const json& j, TrainingConfig& c) {
    read_optional(j, "batchSize", c.batch_size);
    read_optional(j, "epochs", c.epochs);
    read_optional(j, "validationSplit", c.validation_split);
    read_optional(j, "earlyStoppingPatience", c.early_stopping_patience);
    read_optional(j, "checkpointInterval", c.checkpoint_interval);
    read_optional(j, "logInterval", c.log_interval);
    if (j.contains("regularization"))
        from_json(j.at("regularization"), c.regularization);
    read_optional(j, "maxGradNorm", c.max_grad_norm);
    if (j.contains("gradNormType"))
        c.grad_norm_type = parse_norm_type(j.at("gradNormType").get<std::string>());
    read_optional(j, "checkpointPath", c.checkpoint_path);
    if (j.contains("loss"))
        c.loss = parse_loss(j.at("loss").get<std::string>());
}

inline void to_json(json& j, const OptimizerConfig& c) {
    j = json{{"learningRate", c.learning_rate},
             {"beta1", c.beta1},
             {"beta2", c.beta2},
             {"weightDecay", c.weight_decay},
             {"epsilon", c.epsilon}};
}

inline void from_json(const json& j, OptimizerConfig& c) {
    read_optional(j, "learningRate", c.learning_rate);
    read_optional(j, "beta1", c.beta1);
    read_optional(j, "beta2", c.beta2);
    read_optional(j, "weightDecay", c.weight_decay);
    read_optional(j, "epsilon", c.epsilon);
}

inline void to_json(json& j, const SchedulerConfig& c) {
    j = json{{"initialLR", c.initial_lr},         {"decayFactor", c.decay_factor},
             {"patience", c.patience},            {"minLR", c.min_lr},
             {"windowSize", c.window_size},       {"minDelta", c.min_delta},
             {"schedule", to_string(c.schedule)}, {"warmupSteps", c.warmup_steps},
             {"totalSteps", c.total_steps},       {"restartPeriod", c.restart_period},
             {"restartMult", c.restart_mult}};
}

inline void from_json(const json& j, SchedulerConfig& c) {
    read_optional(j, "initialLR", c.initial_lr);
    read_optional(j, "decayFactor", c.decay_factor);
    read_optional(j, "patience", c.patience);
    read_optional(j, "minLR", c.min_lr);
    read_optional(j, "windowSize", c.window_size);
    read_optional(j, "minDelta", c.min_delta);
    if (j.contains("schedule"))
        c.schedule = parse_schedule_kind(j.at("schedule").get<std::string>());
    read_optional(j, "warmupSteps", c.warmup_steps);
    read_optional(j, "totalSteps", c.total_steps);
    read_optional(j, "restartPeriod", c.restart_period);
    read_optional(j, "restartMult", c.restart_mult);
}

inline void to_json(json& j, const WatchdogConfig& c) {
    j = json{{"checkInterval", c.check_interval},
             {"nanThreshold", c.nan_threshold},
             {"infThreshold", c.inf_threshold},
             {"lossThreshold", c.loss_threshold},
             {"gradientThreshold", c.gradient_threshold},
             {"resetLRFactor", c.reset_lr_factor},
             {"maxResets", c.max_resets}};
}

inline void from_json(const json& j, WatchdogConfig& c) {
    read_optional(j, "checkInterval", c.check_interval);
    read_optional(j, "nanThreshold", c.nan_threshold);
    read_optional(j, "infThreshold", c.inf_threshold);
    read_optional(j, "lossThreshold", c.loss_threshold);
    read_optional(j, "gradientThreshold", c.gradient_threshold);
    read_optional(j, "resetLRFactor", c.reset_lr_factor);
    read_optional(j, "maxResets", c.max_resets);
}

inline void to_json(json& j, const ExplorationConfig& c) {
    j = json{{"start", c.start},
             {"end", c.end},
             {"decaySteps", c.decay_steps},
             {"mode", to_string(c.mode)},
             {"schedule", to_string(c.schedule)},
             {"entropyThreshold", c.entropy_threshold},
             {"uncertaintyWeight", c.uncertainty_weight},
             {"seed", optional_to_json(c.seed)}};
}

inline void from_json(const json& j, ExplorationConfig& c) {
    read_optional(j, "start", c.start);
    read_optional(j, "end", c.end);
    read_optional(j, "decaySteps", c.decay_steps);
    if (j.contains("mode"))
        c.mode = parse_exploration_mode(j.at("mode").get<std::string>());
    if (j.contains("schedule"))
        c.schedule = parse_decay_schedule(j.at("schedule").get<std::string>());
    read_optional(j, "entropyThreshold", c.entropy_threshold);
    read_optional(j, "uncertaintyWeight", c.uncertainty_weight);
    read_optional(j, "seed", c.seed);
}

inline void to_json(json& j, const BufferConfig& c) {
    j = json{{"capacity", c.capacity},
             {"alpha", c.alpha},
             {"beta", c.beta},
             {"betaIncrement", c.beta_increment},
             {"epsilon", c.epsilon},
             {"maxPriority", c.max_priority},
             {"prioritized", c.prioritized},
             {"allowReplacement", c.allow_replacement},
             {"seed", optional_to_json(c.seed)}};
}

inline void from_json(const json& j, BufferConfig& c) {
    read_optional(j, "capacity", c.capacity);
    read_optional(j, "alpha", c.alpha);
    read_optional(j, "beta", c.beta);
    read_optional(j, "betaIncrement", c.beta_increment);
    read_optional(j, "epsilon", c.epsilon);
    read_optional(j, "maxPriority", c.max_priority);
    read_optional(j, "prioritized", c.prioritized);
    read_optional(j, "allowReplacement", c.allow_replacement);
    read_optional(j, "seed", c.seed);
}

inline const char* to_string(InitMode m) {
    switch (m) {
    case InitMode::Uniform:
        return "uniform";
    case InitMode::Normal:
        return "normal";
    case InitMode::HeNormal:
        return "he_normal";
    }
    return "normal";
}

inline InitMode parse_init_mode(const std::string& s) {
    if (s == "uniform")
        return InitMode::Uniform;
    if (s == "normal")
        return InitMode::Normal;
    if (s == "he_normal")
        return InitMode::HeNormal;
    throw ConfigError("unknown initializer mode: " + s);
}

inline void to_json(json& j, const InitializerConfig& c) {
    j = json{{"mode", to_string(c.mode)}, {"gain", c.gain}, {"seed", optional_to_json(c.seed)}};
}

inline void from_json(const json& j, InitializerConfig& c) {
    if (j.contains("mode"))
        c.mode = parse_init_mode(j.at("mode").get<std::string>());
    read_optional(j, "gain", c.gain);
    read_optional(j, "seed", c.seed);
}

inline void to_json(json& j, const ActivationLimits& c) {
    j = json{{"inputMin", c.input_min}, {"inputMax", c.input_max}};
}

inline void from_json(const json& j, ActivationLimits& c) {
    read_optional(j, "inputMin", c.input_min);
    read_optional(j, "inputMax", c.input_max);
}

inline void to_json(json& j, const EngineConfig& c) {
    j = json{{"training", c.training},       {"optimizer", c.optimizer},
             {"scheduler", c.scheduler},     {"watchdog", c.watchdog},
             {"exploration", c.exploration}, {"buffer", c.buffer},
             {"initializer", c.initializer}, {"activationLimits", c.activation_limits}};
}

/**
 * Layer the sections present in `j` over `c`.
 *
 * When the document sets only one of `optimizer.learningRate` and
 * `scheduler.initialLR`, the other takes the same value.
 */
inline void from_json(const json& j, EngineConfig& c) {
    if (j.contains("training"))
        from_json(j.at("training"), c.training);
    if (j.contains("optimizer"))
        from_json(j.at("optimizer"), c.optimizer);
    if (j.contains("scheduler"))
        from_json(j.at("scheduler"), c.scheduler);
    if (j.contains("watchdog"))
        from_json(j.at("watchdog"), c.watchdog);
    if (j.contains("exploration"))
        from_json(j.at("exploration"), c.exploration);
    if (j.contains("buffer"))
        from_json(j.at("buffer"), c.buffer);
    if (j.contains("initializer"))
        from_json(j.at("initializer"), c.initializer);
    if (j.contains("activationLimits"))
        from_json(j.at("activationLimits"), c.activation_limits);

    bool optimizer_lr = j.contains("optimizer") && j.at("optimizer").contains("learningRate");
    bool scheduler_lr = j.contains("scheduler") && j.at("scheduler").contains("initialLR");
    if (optimizer_lr && !scheduler_lr)
        c.scheduler.initial_lr = c.optimizer.learning_rate;
    else if (scheduler_lr && !optimizer_lr)
        c.optimizer.learning_rate = c.scheduler.initial_lr;
}

/**
 * Parse a configuration document on top of the defaults and validate it.
 *
 * @throws ConfigError when the text is not valid JSON, a value has the wrong
 *         type or a value is out of range
 */
inline EngineConfig parse_engine_config(const std::string& text) {
    EngineConfig cfg;
    try {
        from_json(json::parse(text), cfg);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    validate(cfg);
    return cfg;
}

/** Read and parse a configuration file. */
inline EngineConfig load_engine_config(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigError("failed to open config " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_engine_config(ss.str());
}

} // namespace vigil
