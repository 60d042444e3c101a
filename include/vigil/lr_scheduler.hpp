#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <limits>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "vigil/errors.hpp"
#include "vigil/logging.hpp"

namespace vigil {

/** Shape of the learning rate over time. */
enum class ScheduleKind { Plateau, Cosine, WarmupCosine, WarmRestarts };

inline const char* to_string(ScheduleKind k) {
    switch (k) {
    case ScheduleKind::Plateau:
        return "plateau";
    case ScheduleKind::Cosine:
        return "cosine";
    case ScheduleKind::WarmupCosine:
        return "warmup_cosine";
    case ScheduleKind::WarmRestarts:
        return "warm_restarts";
    }
    return "plateau";
}

inline ScheduleKind parse_schedule_kind(const std::string& s) {
    if (s == "plateau")
        return ScheduleKind::Plateau;
    if (s == "cosine")
        return ScheduleKind::Cosine;
    if (s == "warmup_cosine")
        return ScheduleKind::WarmupCosine;
    if (s == "warm_restarts")
        return ScheduleKind::WarmRestarts;
    throw ConfigError("unknown learning rate schedule: " + s);
}

/** Options for the learning rate scheduler. */
struct SchedulerConfig {
    double initial_lr{0.001};    ///< Starting learning rate
    double decay_factor{0.5};    ///< Multiplier applied on a plateau
    std::size_t patience{10};    ///< Non-improving steps tolerated before decaying
    double min_lr{1e-6};         ///< Lower bound for the learning rate
    std::size_t window_size{20}; ///< Number of recent losses used for the trend
    double min_delta{1e-4};      ///< Improvement required to count as a new best
    ScheduleKind schedule{ScheduleKind::Plateau};
    std::size_t warmup_steps{1000};     ///< Linear ramp length for warmup_cosine
    std::size_t total_steps{100000};    ///< Steps until cosine decay reaches min_lr
    std::size_t restart_period{10000};  ///< First cycle length for warm_restarts
    double restart_mult{2.0};           ///< Cycle length growth per restart
};

struct SchedulerState {
    double current_lr{0.001};
    double base_lr{0.001};
    std::deque<double> window{};
    double best_loss{std::numeric_limits<double>::infinity()};
    std::size_t plateau_counter{0};
    std::size_t decay_count{0};
    std::size_t steps{0};
    double peak_lr{0.001};              ///< Top of the cosine curve; lowered by resets
    std::size_t last_restart_step{0};
    std::size_t restart_count{0};
};

/** One recorded point of a simulated schedule. */
struct LrPoint {
    std::size_t step{0};
    double lr{0.0};
    std::string phase{};
};

struct SchedulerProgression {
    ScheduleKind schedule{ScheduleKind::Plateau};
    std::vector<LrPoint> points{};
    double final_lr{0.0};
};

inline void validate(const SchedulerConfig& c) {
    if (!(c.initial_lr > 0.0))
        throw ConfigError("scheduler initialLR must be positive");
    if (!(c.decay_factor > 0.0 && c.decay_factor <= 1.0))
        throw ConfigError("scheduler decayFactor must lie in (0, 1]");
    if (!(c.min_lr >= 0.0) || c.min_lr > c.initial_lr)
        throw ConfigError("scheduler minLR must lie in [0, initialLR]");
    if (c.window_size < 2)
        throw ConfigError("scheduler windowSize must be at least 2");
    if (c.patience == 0)
        throw ConfigError("scheduler patience must be positive");
    if (c.total_steps == 0 || c.warmup_steps >= c.total_steps)
        throw ConfigError("scheduler totalSteps must be positive and exceed warmupSteps");
    if (c.restart_period == 0)
        throw ConfigError("scheduler restartPeriod must be positive");
    if (!(c.restart_mult >= 1.0))
        throw ConfigError("scheduler restartMult must be at least 1");
}

/**
 * Least-squares slope of `values` against their index.
 *
 * Zero when fewer than two values are available.
 */
inline double loss_trend(const std::deque<double>& values) {
    const std::size_t n = values.size();
    if (n < 2)
        return 0.0;
    double mean_x = static_cast<double>(n - 1) / 2.0;
    double mean_y = 0.0;
    for (double v : values)
        mean_y += v;
    mean_y /= static_cast<double>(n);
    double num = 0.0;
    double den = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - mean_x;
        num += dx * (values[i] - mean_y);
        den += dx * dx;
    }
    return num / den;
}

/**
 * @brief Learning rate schedule driven by loss plateaus or by step count.
 *
 * Each step records the loss in a bounded window. Under `Plateau` a loss
 * beating the best seen by more than `min_delta` resets the plateau counter;
 * otherwise the counter grows unless the window still trends downward.
 * Reaching `patience` multiplies the rate by `decay_factor`, never below
 * `min_lr`.
 *
 * The cosine kinds ignore the loss and follow a curve from `peak_lr` down to
 * `min_lr`. `WarmupCosine` ramps up linearly over `warmup_steps` first and
 * `WarmRestarts` restarts the curve after cycles that grow by `restart_mult`.
 */
class LearningRateScheduler {
  public:
    LearningRateScheduler() : LearningRateScheduler(SchedulerConfig{}) {}
    explicit LearningRateScheduler(SchedulerConfig config,
                                   std::shared_ptr<Logger> logger = make_null_logger())
        : config_{config}, logger_{std::move(logger)} {
        validate(config_);
        reset();
    }

    const SchedulerConfig& config() const { return config_; }
    const SchedulerState& state() const { return state_; }
    void set_state(SchedulerState s) { state_ = std::move(s); }

    void reset() {
        state_ = SchedulerState{};
        state_.base_lr = config_.initial_lr;
        state_.peak_lr = config_.initial_lr;
        state_.current_lr =
            config_.schedule == ScheduleKind::Plateau ? config_.initial_lr : rate_at(0);
    }

    double current_lr() const { return state_.current_lr; }
    double trend() const { return loss_trend(state_.window); }

    /**
     * Rate of the step-count schedules after `completed` steps, ignoring
     * plateau decay. Uses the current restart bookkeeping.
     */
    double rate_at(std::size_t completed) const {
        const double pi = std::acos(-1.0);
        const double lo = std::min(config_.min_lr, state_.peak_lr);
        auto cosine = [&](double progress) {
            return lo + (state_.peak_lr - lo) * 0.5 * (1.0 + std::cos(pi * progress));
        };
        double lr = state_.peak_lr;
        switch (config_.schedule) {
        case ScheduleKind::Plateau:
            return state_.current_lr;
        case ScheduleKind::Cosine:
            lr = cosine(std::min(1.0, static_cast<double>(completed) /
                                          static_cast<double>(config_.total_steps)));
            break;
        case ScheduleKind::WarmupCosine:
            if (completed < config_.warmup_steps) {
                lr = state_.peak_lr * static_cast<double>(completed + 1) /
                     static_cast<double>(config_.warmup_steps);
            } else {
                double span = static_cast<double>(config_.total_steps - config_.warmup_steps);
                lr = cosine(std::min(1.0, static_cast<double>(completed - config_.warmup_steps) /
                                              span));
            }
            break;
        case ScheduleKind::WarmRestarts:
            lr = cosine(static_cast<double>(completed - state_.last_restart_step) /
                        cycle_length());
            break;
        }
        return std::max(config_.min_lr, lr);
    }

    /** Length of the current warm restart cycle. */
    double cycle_length() const {
        return static_cast<double>(config_.restart_period) *
               std::pow(config_.restart_mult, static_cast<double>(state_.restart_count));
    }

    /** Name of the schedule segment the next step falls in. */
    std::string phase() const {
        if (config_.schedule == ScheduleKind::WarmupCosine)
            return state_.steps < config_.warmup_steps ? "warmup" : "cosine";
        if (config_.schedule == ScheduleKind::WarmRestarts)
            return "cycle_" + std::to_string(state_.restart_count);
        return to_string(config_.schedule);
    }

    /** Record `loss` and return the learning rate for the next step. */
    double step(double loss) {
        if (!std::isfinite(loss))
            return state_.current_lr;
        ++state_.steps;
        state_.window.push_back(loss);
        while (state_.window.size() > config_.window_size)
            state_.window.pop_front();
        if (config_.schedule != ScheduleKind::Plateau) {
            if (loss < state_.best_loss)
                state_.best_loss = loss;
            return advance_schedule();
        }

        if (loss < state_.best_loss - config_.min_delta) {
            state_.best_loss = loss;
            state_.plateau_counter = 0;
        } else if (!(state_.window.size() >= 2 && trend() < -config_.min_delta)) {
            ++state_.plateau_counter;
        }

        if (state_.plateau_counter >= config_.patience) {
            double old_lr = state_.current_lr;
            state_.current_lr = std::max(config_.min_lr, old_lr * config_.decay_factor);
            state_.plateau_counter = 0;
            ++state_.decay_count;
            logger_->info("learning rate reduced on plateau",
                          {field("old_lr", old_lr), field("new_lr", state_.current_lr),
                           field("best_loss", state_.best_loss), field("loss", loss)});
        }
        return state_.current_lr;
    }

    /**
     * Cut the rate to `base_lr * factor` after a watchdog reset.
     *
     * The rate never rises and never drops below `min_lr`.
     */
    double demote(double factor) {
        double old_lr = state_.current_lr;
        state_.current_lr =
            std::max(config_.min_lr, std::min(state_.current_lr, state_.base_lr * factor));
        state_.peak_lr =
            std::max(config_.min_lr, std::min(state_.peak_lr, state_.base_lr * factor));
        state_.plateau_counter = 0;
        logger_->warn("learning rate demoted after reset",
                      {field("old_lr", old_lr), field("new_lr", state_.current_lr),
                       field("factor", factor)});
        return state_.current_lr;
    }

    /**
     * Run a fresh copy of this schedule for `steps` steps on uniform random
     * losses. Records every tenth step plus every decay and restart.
     */
    SchedulerProgression test_progression(std::size_t steps = 1000,
                                          std::uint64_t seed = 42) const {
        LearningRateScheduler sim(config_);
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<double> loss(0.0, 1.0);
        SchedulerProgression out;
        out.schedule = config_.schedule;
        out.points.push_back({0, sim.current_lr(), sim.phase()});
        for (std::size_t i = 0; i < steps; ++i) {
            auto decays = sim.state().decay_count;
            auto restarts = sim.state().restart_count;
            double lr = sim.step(loss(rng));
            if (i % 10 == 0 || sim.state().decay_count != decays ||
                sim.state().restart_count != restarts)
                out.points.push_back({sim.state().steps, lr, sim.phase()});
        }
        out.final_lr = sim.current_lr();
        logger_->info("scheduler progression test completed",
                      {field("schedule", to_string(config_.schedule)), field("steps", steps),
                       field("final_lr", out.final_lr)});
        return out;
    }

  private:
    double advance_schedule() {
        if (config_.schedule == ScheduleKind::WarmRestarts &&
            static_cast<double>(state_.steps - state_.last_restart_step) >= cycle_length()) {
            state_.last_restart_step = state_.steps;
            ++state_.restart_count;
            logger_->info("learning rate warm restart",
                          {field("step", state_.steps), field("restarts", state_.restart_count),
                           field("cycle_length", cycle_length())});
        }
        state_.current_lr = rate_at(state_.steps);
        return state_.current_lr;
    }

    SchedulerConfig config_{};
    SchedulerState state_{};
    std::shared_ptr<Logger> logger_;
};

} // namespace vigil
