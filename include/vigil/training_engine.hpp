#pragma once

#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "vigil/activations.hpp"
#include "vigil/architecture.hpp"
#include "vigil/backprop.hpp"
#include "vigil/checkpoint.hpp"
#include "vigil/core.hpp"
#include "vigil/engine_config.hpp"
#include "vigil/errors.hpp"
#include "vigil/experience_buffer.hpp"
#include "vigil/exploration.hpp"
#include "vigil/gradient_clipper.hpp"
#include "vigil/initializer.hpp"
#include "vigil/logging.hpp"
#include "vigil/lr_scheduler.hpp"
#include "vigil/optimizer.hpp"
#include "vigil/watchdog.hpp"

namespace vigil {

/** Record emitted after every training step. */
struct TrainingMetrics {
    std::uint64_t step{0};
    std::uint64_t epoch{0};
    std::size_t batch_size{0};
    double loss{0.0};
    double mae{0.0};
    double r_squared{0.0};
    double directional_accuracy{0.0};
    double classification_accuracy{0.0};
    double gradient_norm{0.0};     ///< Norm of the gradients actually applied
    double raw_gradient_norm{0.0}; ///< Norm before clipping
    bool was_clipped{false};
    double learning_rate{0.0};     ///< Rate used for this step's update
    bool update_applied{false};
    bool watchdog_checked{false};
    bool reset_performed{false};
    std::string reset_cause{};
    std::size_t reset_count{0};
    std::size_t nan_count{0};
    std::size_t inf_count{0};
    double exploration_rate{0.0};
    double exploration_ratio{0.0};
    double exploitation_ratio{0.0};
};

/** Per-step metrics of one epoch plus its validation outcome. */
struct EpochResult {
    std::uint64_t epoch{0};
    std::vector<TrainingMetrics> steps{};
    double train_loss{0.0};
    std::optional<double> validation_loss{};
    double validation_directional_accuracy{0.0};
    bool improved{false};
    bool cancelled{false};
};

struct FitSummary {
    std::size_t epochs_run{0};
    bool early_stopped{false};
    bool cancelled{false};
    double best_loss{std::numeric_limits<double>::infinity()};
};

/** Result of running inference on one feature vector. */
struct Prediction {
    double value{0.0};
    std::vector<double> outputs{};
    std::vector<double> probabilities{};
};

using ProgressCallback = std::function<void(const TrainingMetrics&)>;

/**
 * @brief Online trainer for a small dense network.
 *
 * Owns the parameters and every service acting on them: initializer,
 * replay buffer, AdamW optimizer, learning rate scheduler, instability
 * watchdog, gradient clipper and exploration policy. Steps run
 * synchronously on the caller's thread.
 *
 * A training step holds an internal mutex from its forward pass through the
 * parameter update, and `get_parameters`, `set_parameters` and `predict`
 * take the same mutex. Inference and parameter swaps may therefore run on
 * another thread while training proceeds; they wait for the step in flight.
 * `request_stop` may likewise be called from any thread and is honoured
 * between steps.
 */
class TrainingEngine {
  public:
    explicit TrainingEngine(EngineConfig config = {},
                            std::shared_ptr<Logger> logger = make_default_logger())
        : config_{std::move(config)}, logger_{logger ? std::move(logger) : make_null_logger()} {
        validate(config_);
        build_services();
    }

    TrainingEngine(const TrainingEngine&) = delete;
    TrainingEngine& operator=(const TrainingEngine&) = delete;

    const EngineConfig& config() const { return config_; }
    Logger& logger() const { return *logger_; }

    bool is_initialized() const { return network_.has_value(); }
    bool halted() const { return training_state_.halted; }

    const NetworkConfig& network_config() const {
        require_initialized("network_config");
        return *network_;
    }

    const TrainingState& training_state() const { return training_state_; }
    const OptimizerState& optimizer_state() const { return opt_state_; }
    const LearningRateScheduler& scheduler() const { return scheduler_; }
    const InstabilityWatchdog& watchdog() const { return watchdog_; }
    const ExplorationStrategy& exploration() const { return exploration_; }
    ExperienceBuffer& buffer() { return buffer_; }
    const ExperienceBuffer& buffer() const { return buffer_; }

    void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }

    /** Build the network from an architecture tag such as `"hybrid"`. */
    void initialize_network(const std::string& architecture, long long input_features,
                            long long output_size) {
        initialize_network(parse_architecture(architecture), input_features, output_size);
    }

    /**
     * Build the network and reset every piece of training state.
     *
     * The replay buffer is kept.
     *
     * @throws ConfigError when a size is not positive
     */
    void initialize_network(const ArchitectureSpec& spec, long long input_features,
                            long long output_size) {
        NetworkConfig net = build_network_config(spec, input_features, output_size);
        XavierInitializer init(config_.initializer);
        ParameterSet params = initialize_parameters(net, init);
        {
            std::lock_guard<std::mutex> lock(params_mutex_);
            params_ = std::move(params);
            opt_state_ = optimizer_.initialize_state(params_);
        }
        network_ = std::move(net);
        scheduler_.reset();
        watchdog_.reset();
        exploration_ = ExplorationStrategy(config_.exploration);
        training_state_ = TrainingState{};
        training_state_.start_time = now_millis();

        logger_->info("network initialized",
                      {field("architecture", network_->architecture),
                       field("input_size", network_->input_size),
                       field("output_size", network_->output_size),
                       field("layers", network_->layers.size()),
                       field("parameters", parameter_count(params_))});
    }

    std::size_t add_experience(Experience e, std::optional<double> priority = std::nullopt) {
        return buffer_.add(std::move(e), priority);
    }

    std::size_t add_market_data_experiences(const std::vector<MarketBar>& bars,
                                            const std::vector<int>& actions,
                                            const std::vector<double>& rewards) {
        return buffer_.add_market_data_experiences(bars, actions, rewards);
    }

    /**
     * Run one optimizer update on `batch`.
     *
     * @throws NotInitializedError before `initialize_network`
     * @throws InsufficientDataError for an empty batch
     * @throws ShapeError when a state does not match the input width
     * @throws ResetBudgetExceeded once the watchdog has halted training
     */
    TrainingMetrics train_step(const std::vector<Experience>& batch) {
        return run_step(batch, nullptr);
    }

    /**
     * One pass over the buffered experiences.
     *
     * The newest `validation_split` share of the buffer is held out. The
     * rest yields `floor(train_size / batch_size)` steps, each sampled from
     * the training share and followed by a priority update with the step's
     * TD errors. Early stopping tracks the validation loss, or the mean
     * training loss when nothing is held out.
     *
     * @throws InsufficientDataError when the training share is smaller than
     *         one batch
     */
    EpochResult train_epoch() {
        require_initialized("train_epoch");
        require_not_halted();
        const auto& tc = config_.training;
        if (buffer_.size() < tc.batch_size)
            throw InsufficientDataError("buffer holds " + std::to_string(buffer_.size()) +
                                        " experiences, batch size is " +
                                        std::to_string(tc.batch_size));

        auto order = buffer_.chronological_indices();
        std::size_t val_count = static_cast<std::size_t>(
            std::floor(static_cast<double>(order.size()) * tc.validation_split));
        std::size_t train_count = order.size() - val_count;
        if (train_count < tc.batch_size)
            throw InsufficientDataError("training split holds " + std::to_string(train_count) +
                                        " experiences, batch size is " +
                                        std::to_string(tc.batch_size));
        std::vector<std::size_t> val_idx(order.begin() + train_count, order.end());

        TrainingFlag flag(training_state_);
        HeldOutSlots held_out(buffer_, val_idx);
        EpochResult res;
        res.epoch = ++training_state_.epoch;
        const std::size_t steps = train_count / tc.batch_size;

        double loss_sum = 0.0;
        std::size_t loss_n = 0;
        std::vector<double> predictions;
        for (std::size_t s = 0; s < steps; ++s) {
            if (stop_requested_.load()) {
                res.cancelled = true;
                logger_->info("stop requested, ending epoch early",
                              {field("epoch", res.epoch), field("completed_steps", s)});
                break;
            }
            SampledBatch batch = buffer_.sample_batch(tc.batch_size);
            TrainingMetrics m = run_step(batch.experiences, &predictions);
            std::vector<double> td(predictions.size());
            for (std::size_t i = 0; i < predictions.size(); ++i)
                td[i] = predictions[i] - target_from_reward(batch.experiences[i].reward);
            buffer_.update_priorities(batch.indices, td);
            if (std::isfinite(m.loss)) {
                loss_sum += m.loss;
                ++loss_n;
            }
            res.steps.push_back(std::move(m));
        }
        res.train_loss = loss_n > 0 ? loss_sum / static_cast<double>(loss_n)
                                    : std::numeric_limits<double>::quiet_NaN();

        double tracked = res.train_loss;
        if (!val_idx.empty()) {
            std::vector<Experience> val;
            val.reserve(val_idx.size());
            for (auto i : val_idx)
                val.push_back(buffer_.at(i));
            auto snapshot = get_parameters();
            auto fwd = forward(snapshot, states_from(val), forward_options());
            res.validation_loss = compute_loss(tc.loss, fwd.predictions, targets_from(val));
            res.validation_directional_accuracy = directional_accuracy(fwd.predictions, val);
            tracked = *res.validation_loss;
        }

        // An epoch stopped before its first step leaves early stopping alone.
        const bool ran = !(res.cancelled && res.steps.empty());
        if (ran && std::isfinite(tracked) && tracked < training_state_.best_validation_loss) {
            training_state_.best_validation_loss = tracked;
            training_state_.patience_counter = 0;
            res.improved = true;
        } else if (ran) {
            ++training_state_.patience_counter;
        }

        logger_->info("epoch complete",
                      {field("epoch", res.epoch), field("steps", res.steps.size()),
                       field("train_loss", res.train_loss),
                       field("validation_loss",
                             res.validation_loss ? *res.validation_loss
                                                 : std::numeric_limits<double>::quiet_NaN()),
                       field("best_loss", training_state_.best_validation_loss),
                       field("patience", training_state_.patience_counter)});
        return res;
    }

    /**
     * Repeat `train_epoch` until early stopping, a stop request or
     * `max_epochs` (the configured `epochs` by default).
     */
    FitSummary fit(std::optional<std::size_t> max_epochs = std::nullopt) {
        std::size_t limit = max_epochs ? *max_epochs : config_.training.epochs;
        FitSummary summary;
        for (std::size_t e = 0; e < limit; ++e) {
            if (stop_requested_.load()) {
                summary.cancelled = true;
                break;
            }
            EpochResult r = train_epoch();
            ++summary.epochs_run;
            if (r.cancelled) {
                summary.cancelled = true;
                break;
            }
            if (should_stop_early()) {
                summary.early_stopped = true;
                logger_->info("early stopping",
                              {field("epoch", r.epoch),
                               field("patience", training_state_.patience_counter),
                               field("best_loss", training_state_.best_validation_loss)});
                break;
            }
        }
        summary.best_loss = training_state_.best_validation_loss;
        return summary;
    }

    bool should_stop_early() const {
        return training_state_.patience_counter >= config_.training.early_stopping_patience;
    }

    void request_stop() { stop_requested_.store(true); }
    void clear_stop_request() { stop_requested_.store(false); }
    bool stop_requested() const { return stop_requested_.load(); }

    /** Deep copy of the current parameters. */
    ParameterSet get_parameters() const {
        std::lock_guard<std::mutex> lock(params_mutex_);
        return clone_parameters(params_);
    }

    /**
     * Replace the parameters with a copy of `params`.
     *
     * Safe to call while another thread trains; the swap lands between steps.
     * The optimizer moments are kept.
     *
     * @throws ShapeError when the shapes differ from the network layout
     */
    void set_parameters(const ParameterSet& params) {
        require_initialized("set_parameters");
        require_shapes(params, network_->layers, "parameters");
        ParameterSet copy = clone_parameters(params);
        std::lock_guard<std::mutex> lock(params_mutex_);
        params_ = std::move(copy);
    }

    /** Forward pass on a parameter snapshot. */
    Prediction predict(const std::vector<double>& features) const {
        require_initialized("predict");
        auto snapshot = get_parameters();
        auto fwd = forward(snapshot, std::vector<std::vector<double>>{features}, forward_options());
        return {fwd.predictions.front(), fwd.outputs.front(), fwd.probabilities.front()};
    }

    /**
     * Choose an action for `state` through the exploration policy.
     *
     * Multi-output networks use their outputs as action values. A single
     * output is scored against the centres of the hold, buy and sell
     * buckets.
     */
    ActionChoice select_action(const std::vector<double>& state) {
        Prediction p = predict(state);
        std::vector<double> q = p.outputs;
        if (q.size() == 1) {
            static const double centres[3] = {0.165, 0.495, 0.83};
            q.assign(3, 0.0);
            for (std::size_t i = 0; i < 3; ++i)
                q[i] = -std::abs(p.value - centres[i]);
        }
        return exploration_.select_action(q);
    }

    /** Snapshot the full training state. */
    Checkpoint make_checkpoint() const {
        require_initialized("make_checkpoint");
        Checkpoint cp;
        {
            std::lock_guard<std::mutex> lock(params_mutex_);
            cp.parameters = clone_parameters(params_);
            cp.optimizer_state = clone_optimizer_state(opt_state_);
        }
        cp.scheduler_state = scheduler_.state();
        cp.watchdog_state = watchdog_.state();
        cp.training_state = training_state_;
        cp.exploration_state = exploration_.state();
        cp.config = config_;
        cp.network_config = *network_;
        cp.timestamp = now_millis();
        return cp;
    }

    /**
     * Write the full training state to `path`.
     *
     * @throws CheckpointIOError when the file cannot be written
     */
    void save_model_checkpoint(const std::string& path) const {
        Checkpoint cp = make_checkpoint();
        save_checkpoint(cp, path);
        logger_->info("checkpoint saved", {field("path", path),
                                           field("step", cp.training_state.step),
                                           field("epoch", cp.training_state.epoch)});
    }

    /**
     * Restore the state written by `save_model_checkpoint`.
     *
     * The configuration stored in the file replaces the current one; the
     * replay buffer is left as is.
     *
     * @throws CheckpointIOError when the file is unreadable or inconsistent
     */
    void load_model_checkpoint(const std::string& path) {
        Checkpoint cp = load_checkpoint(path);
        try {
            validate(cp.config);
            require_shapes(cp.parameters, cp.network_config.layers, "checkpoint parameters");
            require_shapes(cp.optimizer_state.m, cp.network_config.layers, "checkpoint moments");
            require_shapes(cp.optimizer_state.v, cp.network_config.layers, "checkpoint moments");
        } catch (const VigilError& e) {
            throw CheckpointIOError(path + ": " + e.what());
        }

        BufferConfig keep_buffer = config_.buffer;
        config_ = cp.config;
        config_.buffer = keep_buffer;
        rebuild_training_services();
        {
            std::lock_guard<std::mutex> lock(params_mutex_);
            params_ = std::move(cp.parameters);
            opt_state_ = std::move(cp.optimizer_state);
        }
        network_ = std::move(cp.network_config);
        scheduler_.set_state(std::move(cp.scheduler_state));
        watchdog_.set_state(std::move(cp.watchdog_state));
        exploration_.set_state(cp.exploration_state);
        training_state_ = cp.training_state;
        training_state_.is_training = false;
        logger_->info("checkpoint loaded", {field("path", path), field("version", cp.version),
                                            field("step", training_state_.step),
                                            field("epoch", training_state_.epoch)});
    }

  private:
    /** Sets `is_training` for the lifetime of an epoch. */
    struct TrainingFlag {
        explicit TrainingFlag(TrainingState& s) : state{s} { state.is_training = true; }
        ~TrainingFlag() { state.is_training = false; }
        TrainingState& state;
    };

    /** Masks the validation share out of buffer sampling for one epoch. */
    struct HeldOutSlots {
        HeldOutSlots(ExperienceBuffer& b, const std::vector<std::size_t>& slots) : buffer{b} {
            buffer.mask_slots(slots);
        }
        ~HeldOutSlots() { buffer.unmask_slots(); }
        ExperienceBuffer& buffer;
    };

    void build_services() {
        buffer_ = ExperienceBuffer(config_.buffer, logger_);
        rebuild_training_services();
    }

    void rebuild_training_services() {
        optimizer_ = AdamWOptimizer(config_.optimizer);
        scheduler_ = LearningRateScheduler(config_.scheduler, logger_);
        watchdog_ = InstabilityWatchdog(config_.watchdog, logger_);
        exploration_ = ExplorationStrategy(config_.exploration);
        clipper_ = GradientClipper(
            ClipperConfig{config_.training.max_grad_norm, config_.training.grad_norm_type});
    }

    ForwardOptions forward_options() const {
        ForwardOptions o;
        o.hidden = network_->hidden_activation;
        o.output = network_->output_activation;
        o.limits = config_.activation_limits;
        return o;
    }

    void require_initialized(const char* what) const {
        if (!network_)
            throw NotInitializedError(std::string(what) +
                                      " called before initialize_network");
    }

    void require_not_halted() const {
        if (training_state_.halted)
            throw ResetBudgetExceeded("training halted after " +
                                      std::to_string(watchdog_.state().reset_count) +
                                      " resets");
    }

    TrainingMetrics run_step(const std::vector<Experience>& batch,
                             std::vector<double>* predictions_out) {
        require_initialized("train_step");
        require_not_halted();
        if (batch.empty())
            throw InsufficientDataError("train_step needs at least one experience");

        const auto& tc = config_.training;
        const ForwardOptions opts = forward_options();
        const std::uint64_t step = training_state_.step + 1;

        // Held until the update is applied; released before callbacks run.
        std::unique_lock<std::mutex> lock(params_mutex_);
        auto fwd = forward(params_, states_from(batch), opts);
        auto targets = targets_from(batch);
        auto bwd = backward(params_, fwd, targets, opts, tc.loss);
        training_state_.step = step;
        double loss = bwd.loss;
        if (tc.regularization.enabled && tc.regularization.lambda > 0.0)
            loss += apply_l2_regularization(params_, bwd.gradients, tc.regularization.lambda);

        TrainingMetrics m;
        m.step = step;
        m.epoch = training_state_.epoch;
        m.batch_size = batch.size();
        m.loss = loss;
        m.mae = mean_absolute_error(fwd.predictions, targets);
        m.r_squared = r_squared(fwd.predictions, targets);
        m.directional_accuracy = directional_accuracy(fwd.predictions, batch);
        m.classification_accuracy = classification_accuracy(fwd.predictions, batch);
        m.learning_rate = scheduler_.current_lr();

        CheckResult check = watchdog_.check(step, params_, bwd.gradients, loss, opt_state_);
        m.watchdog_checked = check.checked;
        m.nan_count = check.nan_count;
        m.inf_count = check.inf_count;

        if (check.halted) {
            training_state_.halted = true;
            training_state_.is_training = false;
            logger_->error("training halted", {field("step", step),
                                               field("reset_count", watchdog_.state().reset_count),
                                               field("loss", loss)});
            throw ResetBudgetExceeded(std::string(kMaxResetsExceeded) + " at step " +
                                      std::to_string(step) + " after " +
                                      std::to_string(watchdog_.state().reset_count) + " resets");
        }

        if (check.should_reset) {
            if (check.restored_parameters)
                params_ = std::move(*check.restored_parameters);
            if (check.restored_optimizer_state)
                opt_state_ = std::move(*check.restored_optimizer_state);
            m.learning_rate = scheduler_.demote(check.new_lr_factor);
            watchdog_.acknowledge_reset();
            m.reset_performed = true;
            m.reset_cause = check.cause;
            m.raw_gradient_norm = check.gradient_norm;
        } else {
            ClipResult clip = clipper_.clip(bwd.gradients);
            m.raw_gradient_norm = clip.pre_clip_norm;
            m.was_clipped = clip.was_clipped;
            if (!clip.finite) {
                logger_->warn("non-finite gradient norm, update skipped",
                              {field("step", step), field("loss", loss),
                               field("gradient_norm", clip.pre_clip_norm)});
            } else {
                optimizer_.step(params_, bwd.gradients, opt_state_, m.learning_rate);
                m.gradient_norm = clip.post_clip_norm;
                m.update_applied = true;
                scheduler_.step(loss);
            }
        }

        lock.unlock();

        exploration_.step();
        auto ex = exploration_.statistics();
        m.exploration_rate = ex.current_epsilon;
        m.exploration_ratio = ex.exploration_ratio;
        m.exploitation_ratio = ex.exploitation_ratio;
        m.reset_count = watchdog_.state().reset_count;

        if (predictions_out)
            *predictions_out = std::move(fwd.predictions);

        if (tc.log_interval > 0 && step % tc.log_interval == 0)
            logger_->info("training progress",
                          {field("step", step), field("epoch", m.epoch), field("loss", loss),
                           field("directional_accuracy", m.directional_accuracy),
                           field("gradient_norm", m.gradient_norm),
                           field("learning_rate", m.learning_rate),
                           field("resets", m.reset_count)});
        if (!tc.checkpoint_path.empty() && tc.checkpoint_interval > 0 &&
            step % tc.checkpoint_interval == 0)
            save_model_checkpoint(tc.checkpoint_path);
        if (progress_)
            progress_(m);
        return m;
    }

    EngineConfig config_{};
    std::shared_ptr<Logger> logger_;
    ExperienceBuffer buffer_{};
    AdamWOptimizer optimizer_{};
    LearningRateScheduler scheduler_{};
    InstabilityWatchdog watchdog_{};
    ExplorationStrategy exploration_{};
    GradientClipper clipper_{};

    std::optional<NetworkConfig> network_{};
    ParameterSet params_{};
    OptimizerState opt_state_{};
    TrainingState training_state_{};
    mutable std::mutex params_mutex_{};
    std::atomic<bool> stop_requested_{false};
    ProgressCallback progress_{};
};

} // namespace vigil
