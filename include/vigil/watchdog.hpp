#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "vigil/core.hpp"
#include "vigil/errors.hpp"
#include "vigil/gradient_clipper.hpp"
#include "vigil/logging.hpp"
#include "vigil/optimizer.hpp"

namespace vigil {

/** Phase of the instability watchdog. */
enum class WatchdogPhase { Stable, CheckDue, Resetting, Halted };

inline const char* to_string(WatchdogPhase p) {
    switch (p) {
    case WatchdogPhase::Stable:
        return "stable";
    case WatchdogPhase::CheckDue:
        return "check_due";
    case WatchdogPhase::Resetting:
        return "resetting";
    case WatchdogPhase::Halted:
        return "halted";
    }
    return "stable";
}

inline WatchdogPhase parse_watchdog_phase(const std::string& s) {
    if (s == "stable")
        return WatchdogPhase::Stable;
    if (s == "check_due")
        return WatchdogPhase::CheckDue;
    if (s == "resetting")
        return WatchdogPhase::Resetting;
    if (s == "halted")
        return WatchdogPhase::Halted;
    throw ConfigError("unknown watchdog phase: " + s);
}

struct WatchdogConfig {
    std::size_t check_interval{10};  ///< Steps between checks
    std::size_t nan_threshold{5};    ///< NaN count tolerated before a reset
    std::size_t inf_threshold{5};    ///< Inf count tolerated before a reset
    double loss_threshold{1e6};      ///< Largest acceptable loss
    double gradient_threshold{100.0}; ///< Largest acceptable gradient norm
    double reset_lr_factor{0.25};    ///< LR multiplier per reset
    std::size_t max_resets{5};       ///< Resets allowed before halting
};

inline void validate(const WatchdogConfig& c) {
    if (c.check_interval == 0)
        throw ConfigError("watchdog checkInterval must be positive");
    if (!(c.loss_threshold > 0.0))
        throw ConfigError("watchdog lossThreshold must be positive");
    if (!(c.gradient_threshold > 0.0))
        throw ConfigError("watchdog gradientThreshold must be positive");
    if (!(c.reset_lr_factor > 0.0 && c.reset_lr_factor <= 1.0))
        throw ConfigError("watchdog resetLRFactor must lie in (0, 1]");
}

/** Deep copy of the training state at a verified-stable step. */
struct StableCheckpoint {
    std::uint64_t step{0};
    ParameterSet parameters{};
    OptimizerState optimizer_state{};
    double loss{0.0};
};

/** One entry of the append-only reset log. */
struct ResetEvent {
    std::uint64_t step{0};
    std::string cause{};
    double loss{0.0};
    double gradient_norm{0.0};
    std::size_t nan_count{0};
    std::size_t inf_count{0};
};

struct WatchdogState {
    std::uint64_t last_check_step{0};
    std::size_t reset_count{0};
    std::size_t total_nan_detected{0};
    std::size_t total_inf_detected{0};
    std::optional<StableCheckpoint> last_stable_checkpoint{};
    std::vector<ResetEvent> reset_log{};
    WatchdogPhase phase{WatchdogPhase::Stable};
};

/** Outcome of `InstabilityWatchdog::check`. */
struct CheckResult {
    bool checked{false};      ///< False when no check was due
    bool is_stable{true};
    bool should_reset{false};
    bool halted{false};
    std::string cause{};
    double new_lr_factor{1.0};
    std::optional<ParameterSet> restored_parameters{};
    std::optional<OptimizerState> restored_optimizer_state{};
    std::size_t nan_count{0};
    std::size_t inf_count{0};
    double gradient_norm{0.0};
};

struct WatchdogStatistics {
    std::size_t reset_count{0};
    std::size_t total_nan_detected{0};
    std::size_t total_inf_detected{0};
    std::vector<ResetEvent> reset_history{};
    bool has_stable_checkpoint{false};
    WatchdogPhase phase{WatchdogPhase::Stable};
};

struct DetectionCase {
    std::string name{};
    bool should_detect{false};
    bool was_detected{false};
    std::string cause{};
    bool passed{false};
};

struct DetectionReport {
    bool passed{true};
    std::vector<DetectionCase> cases{};
};

constexpr const char* kMaxResetsExceeded = "Max resets exceeded";

/**
 * @brief Detects numerical collapse and rolls training back.
 *
 * Every `check_interval` steps the watchdog scans parameters and gradients.
 * A clean scan stores deep copies of the parameters and optimizer state as
 * the last stable checkpoint. A scan that crosses a threshold moves to
 * Resetting and hands back copies of that checkpoint together with the
 * learning rate factor to apply; the caller confirms with
 * `acknowledge_reset`. Once `max_resets` resets have been spent the next
 * qualifying check moves to Halted, which is terminal.
 *
 * Snapshots are always deep copies; the caller may freely mutate what it
 * receives without affecting the stored checkpoint.
 */
class InstabilityWatchdog {
  public:
    InstabilityWatchdog() : InstabilityWatchdog(WatchdogConfig{}) {}
    explicit InstabilityWatchdog(WatchdogConfig config,
                                 std::shared_ptr<Logger> logger = make_null_logger())
        : config_{config}, logger_{std::move(logger)} {
        validate(config_);
    }

    const WatchdogConfig& config() const { return config_; }
    const WatchdogState& state() const { return state_; }
    void set_state(WatchdogState s) { state_ = std::move(s); }
    WatchdogPhase phase() const { return state_.phase; }
    bool halted() const { return state_.phase == WatchdogPhase::Halted; }

    /** Forget all history, returning to Stable with no checkpoint. */
    void reset() { state_ = WatchdogState{}; }

    bool check_due(std::uint64_t step) const {
        return step >= state_.last_check_step + config_.check_interval;
    }

    /**
     * Inspect the current training state at `step`.
     *
     * Nothing happens when no check is due. `gradients` must be the raw,
     * unclipped gradients of the step.
     */
    CheckResult check(std::uint64_t step, const ParameterSet& parameters,
                      const ParameterSet& gradients, double loss,
                      const OptimizerState& optimizer_state) {
        CheckResult r;
        if (state_.phase == WatchdogPhase::Halted) {
            r.is_stable = false;
            r.halted = true;
            r.cause = kMaxResetsExceeded;
            return r;
        }
        if (!check_due(step))
            return r;

        state_.phase = WatchdogPhase::CheckDue;
        state_.last_check_step = step;
        r.checked = true;

        NonFiniteCounts counts = count_non_finite(parameters);
        counts += count_non_finite(gradients);
        r.nan_count = counts.nan;
        r.inf_count = counts.inf;
        r.gradient_norm = finite_l2_norm(gradients);
        state_.total_nan_detected += counts.nan;
        state_.total_inf_detected += counts.inf;

        std::string cause = detect(counts, loss, r.gradient_norm);
        if (cause.empty()) {
            state_.phase = WatchdogPhase::Stable;
            if (counts.nan == 0 && counts.inf == 0 && std::isfinite(loss)) {
                state_.last_stable_checkpoint = StableCheckpoint{
                    step, clone_parameters(parameters), clone_optimizer_state(optimizer_state),
                    loss};
                logger_->debug("stable checkpoint captured",
                               {field("step", step), field("loss", loss),
                                field("gradient_norm", r.gradient_norm)});
            }
            return r;
        }

        r.is_stable = false;
        if (state_.reset_count >= config_.max_resets) {
            state_.phase = WatchdogPhase::Halted;
            r.halted = true;
            r.cause = kMaxResetsExceeded;
            logger_->error("maximum resets exceeded, halting training",
                           {field("step", step), field("trigger", cause),
                            field("reset_count", state_.reset_count),
                            field("max_resets", config_.max_resets), field("loss", loss),
                            field("gradient_norm", r.gradient_norm),
                            field("nan_count", counts.nan), field("inf_count", counts.inf)});
            return r;
        }

        state_.phase = WatchdogPhase::Resetting;
        ++state_.reset_count;
        r.should_reset = true;
        r.cause = cause;
        r.new_lr_factor =
            std::pow(config_.reset_lr_factor, static_cast<double>(state_.reset_count));
        state_.reset_log.push_back(
            ResetEvent{step, cause, loss, r.gradient_norm, counts.nan, counts.inf});

        logger_->warn("numerical instability detected, resetting",
                      {field("step", step), field("cause", cause),
                       field("reset_count", state_.reset_count),
                       field("new_lr_factor", r.new_lr_factor, 4), field("loss", loss),
                       field("gradient_norm", r.gradient_norm),
                       field("nan_count", counts.nan), field("inf_count", counts.inf)});

        if (state_.last_stable_checkpoint) {
            const auto& cp = *state_.last_stable_checkpoint;
            r.restored_parameters = clone_parameters(cp.parameters);
            r.restored_optimizer_state = clone_optimizer_state(cp.optimizer_state);
            logger_->info("restored from checkpoint",
                          {field("checkpoint_step", cp.step), field("checkpoint_loss", cp.loss)});
        } else {
            logger_->warn("no stable checkpoint yet, continuing from current state",
                          {field("step", step)});
        }
        return r;
    }

    /** Confirm that the restored state and reduced rate were applied. */
    void acknowledge_reset() {
        if (state_.phase == WatchdogPhase::Resetting)
            state_.phase = WatchdogPhase::Stable;
    }

    WatchdogStatistics statistics() const {
        return {state_.reset_count,     state_.total_nan_detected,
                state_.total_inf_detected, state_.reset_log,
                state_.last_stable_checkpoint.has_value(), state_.phase};
    }

    /**
     * Run the watchdog against five fixed cases: a stable state, a NaN
     * parameter, an infinite gradient, a loss of 1e7 and exploding gradients.
     *
     * Each case uses a fresh watchdog with `config` whose NaN and Inf
     * thresholds are lowered to zero so a single bad value is detected.
     */
    static DetectionReport run_detection_self_test(WatchdogConfig config = {},
                                                   std::shared_ptr<Logger> logger =
                                                       make_null_logger()) {
        config.nan_threshold = 0;
        config.inf_threshold = 0;
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        auto m = [](double a, double b, double c, double d) {
            return ParameterSet{Matrix{2, 2, std::vector<double>{a, b, c, d}}};
        };
        struct Case {
            const char* name;
            ParameterSet params;
            ParameterSet grads;
            double loss;
            bool should_detect;
        };
        const std::vector<Case> cases{
            {"stable_case", m(1, 2, 3, 4), m(0.1, 0.2, 0.3, 0.4), 0.5, false},
            {"nan_parameters", m(nan, 2, 3, 4), m(0.1, 0.2, 0.3, 0.4), 0.5, true},
            {"inf_gradients", m(1, 2, 3, 4), m(inf, 0.2, 0.3, 0.4), 0.5, true},
            {"high_loss", m(1, 2, 3, 4), m(0.1, 0.2, 0.3, 0.4), 1e7, true},
            {"exploding_gradients", m(1, 2, 3, 4), m(1000, 2000, 3000, 4000), 0.5, true},
        };

        DetectionReport report;
        for (const auto& c : cases) {
            InstabilityWatchdog wd(config, logger);
            OptimizerState opt{zeros_like(c.params), zeros_like(c.params), 0};
            auto res = wd.check(100, c.params, c.grads, c.loss, opt);
            DetectionCase dc;
            dc.name = c.name;
            dc.should_detect = c.should_detect;
            dc.was_detected = res.should_reset;
            dc.cause = res.cause;
            dc.passed = dc.was_detected == dc.should_detect;
            report.passed = report.passed && dc.passed;
            report.cases.push_back(std::move(dc));
        }
        logger->info("instability detection self-test completed",
                     {field("passed", report.passed), field("cases", report.cases.size())});
        return report;
    }

  private:
    std::string detect(const NonFiniteCounts& counts, double loss, double grad_norm) const {
        if (counts.nan > config_.nan_threshold)
            return "NaN values detected: " + std::to_string(counts.nan);
        if (counts.inf > config_.inf_threshold)
            return "Inf values detected: " + std::to_string(counts.inf);
        if (!std::isfinite(loss) || loss > config_.loss_threshold) {
            std::ostringstream oss;
            oss << "Loss instability: " << loss;
            return oss.str();
        }
        if (grad_norm > config_.gradient_threshold) {
            std::ostringstream oss;
            oss << "Gradient explosion: " << std::fixed << std::setprecision(2) << grad_norm;
            return oss.str();
        }
        return {};
    }

    WatchdogConfig config_{};
    WatchdogState state_{};
    std::shared_ptr<Logger> logger_;
};

} // namespace vigil
