#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "vigil/core.hpp"
#include "vigil/errors.hpp"
#include "vigil/logging.hpp"

namespace vigil {

struct BufferConfig {
    std::size_t capacity{200000};   ///< Maximum number of stored experiences
    double alpha{0.6};              ///< Prioritization exponent
    double beta{0.4};               ///< Initial importance sampling exponent
    double beta_increment{0.001};   ///< Beta annealing per sampled batch
    double epsilon{1e-6};           ///< Keeps updated priorities above zero
    double max_priority{1.0};       ///< Priority given to new experiences
    bool prioritized{true};         ///< Sample uniformly when false
    bool allow_replacement{false};  ///< Permit duplicate draws within a batch
    std::optional<std::uint64_t> seed{};
};

inline void validate(const BufferConfig& c) {
    if (c.capacity == 0)
        throw ConfigError("buffer capacity must be positive");
    if (!(c.alpha >= 0.0))
        throw ConfigError("buffer alpha must be non-negative");
    if (!(c.beta >= 0.0 && c.beta <= 1.0))
        throw ConfigError("buffer beta must lie in [0, 1]");
    if (!(c.beta_increment >= 0.0))
        throw ConfigError("buffer betaIncrement must be non-negative");
    if (!(c.epsilon > 0.0))
        throw ConfigError("buffer epsilon must be positive");
    if (!(c.max_priority > 0.0))
        throw ConfigError("buffer maxPriority must be positive");
}

/**
 * @brief Binary tree of partial priority sums.
 *
 * Leaves hold per-slot priorities; every inner node holds the sum of its
 * children so proportional lookups and updates are logarithmic.
 */
class SumTree {
  public:
    SumTree() = default;
    explicit SumTree(std::size_t capacity) { resize(capacity); }

    void resize(std::size_t capacity) {
        leaves_ = 1;
        while (leaves_ < capacity)
            leaves_ *= 2;
        nodes_.assign(2 * leaves_, 0.0);
    }

    std::size_t leaves() const { return leaves_; }
    double total() const { return nodes_.empty() ? 0.0 : nodes_[1]; }
    double get(std::size_t index) const { return nodes_[leaves_ + index]; }

    /** Replace every leaf at once, rebuilding inner sums bottom-up. */
    void assign(const std::vector<double>& priorities) {
        resize(priorities.size());
        std::copy(priorities.begin(), priorities.end(), nodes_.begin() + leaves_);
        for (std::size_t i = leaves_ - 1; i >= 1; --i)
            nodes_[i] = nodes_[2 * i] + nodes_[2 * i + 1];
    }

    void set(std::size_t index, double priority) {
        std::size_t i = leaves_ + index;
        nodes_[i] = priority;
        for (i /= 2; i >= 1; i /= 2)
            nodes_[i] = nodes_[2 * i] + nodes_[2 * i + 1];
    }

    /** Leaf whose cumulative range contains `value`. */
    std::size_t find(double value) const {
        std::size_t i = 1;
        while (i < leaves_) {
            std::size_t left = 2 * i;
            if (value < nodes_[left] || nodes_[left + 1] <= 0.0) {
                i = left;
            } else {
                value -= nodes_[left];
                i = left + 1;
            }
        }
        return i - leaves_;
    }

  private:
    std::size_t leaves_{0};
    std::vector<double> nodes_{};
};

/** Experiences drawn by `sample_batch` plus their slots and IS weights. */
struct SampledBatch {
    std::vector<Experience> experiences{};
    std::vector<std::size_t> indices{};
    std::vector<double> weights{};
};

struct BufferStatistics {
    std::size_t size{0};
    std::size_t capacity{0};
    double utilization{0.0};
    std::size_t critical_event_count{0};
    double average_priority{0.0};
    double min_priority{0.0};
    double max_priority{0.0};
    double median_priority{0.0};
};

/** Feature vector extracted from one market bar. */
inline std::vector<double> market_features(const MarketBar& bar) {
    double range = bar.close != 0.0 ? (bar.high - bar.low) / bar.close : 0.0;
    double ret = bar.open != 0.0 ? (bar.close - bar.open) / bar.open : 0.0;
    return {bar.open, bar.high, bar.low, bar.close, bar.volume, range, ret, bar.volume / 1e6};
}

/**
 * @brief Fixed-capacity prioritized replay buffer.
 *
 * Slots are filled in ring order; once full the oldest slot is overwritten.
 * Sampling is proportional to `priority` through a sum tree, or uniform when
 * prioritization is disabled. Masked slots keep their experience but are
 * skipped by `sample_batch` until `unmask_slots`.
 */
class ExperienceBuffer {
  public:
    static constexpr double kVolatilityThreshold = 0.05;
    static constexpr double kVolumeSpikeThreshold = 1e6;
    static constexpr double kPriceMoveThreshold = 0.03;

    ExperienceBuffer() : ExperienceBuffer(BufferConfig{}) {}
    explicit ExperienceBuffer(BufferConfig config,
                              std::shared_ptr<Logger> logger = make_null_logger())
        : config_{config}, beta_{config.beta}, logger_{std::move(logger)},
          rng_{config.seed ? *config.seed : std::random_device{}()} {
        validate(config_);
        tree_.resize(config_.capacity);
    }

    const BufferConfig& config() const { return config_; }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return config_.capacity; }
    bool empty() const { return size_ == 0; }
    double beta() const { return beta_; }
    /** Sum of priorities over unmasked slots. */
    double total_priority() const { return tree_.total(); }
    std::size_t masked_count() const { return masked_count_; }

    void seed(std::uint64_t s) { rng_.seed(s); }

    const Experience& at(std::size_t index) const {
        if (index >= size_)
            throw ShapeError("buffer index " + std::to_string(index) + " out of range");
        return slots_[index];
    }

    /**
     * Store an experience, overwriting the oldest slot when full.
     *
     * New entries receive `priority` (default `max_priority`) scaled up for
     * high volatility, volume spikes and large rewards.
     *
     * @return slot the experience was written to
     */
    std::size_t add(Experience experience, std::optional<double> priority = std::nullopt) {
        double p = priority ? *priority : config_.max_priority;
        if (!(p > 0.0) || !std::isfinite(p))
            p = config_.max_priority;
        std::uint8_t flags = critical_flags(experience);
        p *= critical_multiplier(flags);
        experience.priority = p;

        std::size_t slot = position_;
        if (slots_.size() < config_.capacity && slot == slots_.size()) {
            slots_.push_back(std::move(experience));
            flags_.push_back(0);
            masked_.push_back(0);
        } else {
            slots_[slot] = std::move(experience);
        }
        critical_count_ -= flag_count(flags_[slot]);
        critical_count_ += flag_count(flags);
        flags_[slot] = flags;
        if (masked_[slot]) {
            masked_[slot] = 0;
            --masked_count_;
        }
        tree_.set(slot, p);
        position_ = (position_ + 1) % config_.capacity;
        size_ = std::min(size_ + 1, config_.capacity);
        return slot;
    }

    /**
     * Build transitions from consecutive bars and store them.
     *
     * Bar `i` and `i + 1` form one experience with `actions[i]` and
     * `rewards[i]`; the final transition is terminal.
     *
     * @throws ConfigError when the three inputs differ in length
     */
    std::size_t add_market_data_experiences(const std::vector<MarketBar>& bars,
                                            const std::vector<int>& actions,
                                            const std::vector<double>& rewards) {
        if (bars.size() != actions.size() || actions.size() != rewards.size())
            throw ConfigError("market data, actions and rewards must have the same length (" +
                              std::to_string(bars.size()) + ", " +
                              std::to_string(actions.size()) + ", " +
                              std::to_string(rewards.size()) + ")");
        if (bars.size() < 2) {
            logger_->warn("need at least two bars to form a transition",
                          {field("bars", bars.size())});
            return 0;
        }
        std::size_t added = 0;
        for (std::size_t i = 0; i + 1 < bars.size(); ++i) {
            const auto& cur = bars[i];
            Experience e;
            e.state = market_features(cur);
            e.action = actions[i];
            e.reward = rewards[i];
            e.next_state = market_features(bars[i + 1]);
            e.terminal = i + 2 == bars.size();
            e.timestamp = cur.timestamp;
            e.symbol = cur.symbol;
            double vol = cur.close != 0.0 ? std::abs(cur.high - cur.low) / cur.close : 0.0;
            e.metadata = ExperienceMetadata{cur.close, cur.volume, vol, 0.8};
            add(std::move(e));
            ++added;
        }
        logger_->info("market data experiences added",
                      {field("symbol", bars.front().symbol), field("count", added),
                       field("from", bars.front().timestamp), field("to", bars.back().timestamp),
                       field("buffer_size", size_)});
        return added;
    }

    /**
     * Draw `n` experiences from the unmasked slots.
     *
     * @throws InsufficientDataError when no slot is available, or when `n`
     *         exceeds the available count and replacement is not allowed
     */
    SampledBatch sample_batch(std::size_t n) {
        const std::size_t live = size_ - masked_count_;
        require_available(live, n);
        if (!config_.prioritized)
            return sample_uniform_live(n);
        anneal_beta();
        SampledBatch b;
        if (n == 0)
            return b;
        const double total = tree_.total();
        if (config_.allow_replacement) {
            // Stratified draws: one per equal slice of the total priority.
            const double segment = total / static_cast<double>(n);
            for (std::size_t i = 0; i < n; ++i) {
                std::uniform_real_distribution<double> dist(segment * i, segment * (i + 1));
                std::size_t slot = clamp_slot(tree_.find(dist(rng_)));
                if (tree_.get(slot) <= 0.0)
                    slot = first_live_slot();
                b.indices.push_back(slot);
            }
        } else {
            std::vector<std::pair<std::size_t, double>> taken;
            taken.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                std::uniform_real_distribution<double> dist(0.0, tree_.total());
                std::size_t slot = clamp_slot(tree_.find(dist(rng_)));
                if (tree_.get(slot) <= 0.0)
                    slot = first_live_slot();
                taken.emplace_back(slot, tree_.get(slot));
                tree_.set(slot, 0.0);
                b.indices.push_back(slot);
            }
            for (const auto& t : taken)
                tree_.set(t.first, t.second);
        }
        finish_batch(b, total, live);
        return b;
    }

    /**
     * Draw `n` experiences restricted to the slots in `candidates`.
     *
     * Masking is ignored here. A sum tree over the candidates is built once
     * per call, so each draw is logarithmic.
     *
     * @throws InsufficientDataError as for `sample_batch`
     */
    SampledBatch sample_batch_from(const std::vector<std::size_t>& candidates, std::size_t n) {
        for (auto c : candidates)
            if (c >= size_)
                throw ShapeError("candidate slot " + std::to_string(c) + " out of range");
        if (!config_.prioritized)
            return sample_uniform(candidates, n);
        require_available(candidates.size(), n);
        anneal_beta();
        SampledBatch b;
        if (n == 0)
            return b;
        std::vector<double> priorities(candidates.size());
        for (std::size_t i = 0; i < candidates.size(); ++i)
            priorities[i] = slots_[candidates[i]].priority;
        SumTree local;
        local.assign(priorities);
        const double total = local.total();
        for (std::size_t k = 0; k < n; ++k) {
            std::uniform_real_distribution<double> dist(0.0, local.total());
            std::size_t pick = std::min(local.find(dist(rng_)), candidates.size() - 1);
            while (local.get(pick) <= 0.0 && pick > 0)
                --pick;
            while (local.get(pick) <= 0.0 && pick + 1 < candidates.size())
                ++pick;
            b.indices.push_back(candidates[pick]);
            if (!config_.allow_replacement)
                local.set(pick, 0.0);
        }
        finish_batch(b, total, candidates.size());
        return b;
    }

    /** Set `priority = (|td| + epsilon)^alpha` for each sampled slot. */
    void update_priorities(const std::vector<std::size_t>& indices,
                           const std::vector<double>& td_errors) {
        if (indices.size() != td_errors.size())
            throw ShapeError("got " + std::to_string(td_errors.size()) + " td errors for " +
                             std::to_string(indices.size()) + " indices");
        double sum = 0.0;
        for (std::size_t i = 0; i < indices.size(); ++i) {
            std::size_t slot = indices[i];
            if (slot >= size_)
                throw ShapeError("buffer index " + std::to_string(slot) + " out of range");
            double td = std::abs(td_errors[i]);
            if (!std::isfinite(td))
                td = config_.max_priority;
            double p = std::pow(td + config_.epsilon, config_.alpha);
            slots_[slot].td_error = td;
            slots_[slot].priority = p;
            if (!masked_[slot])
                tree_.set(slot, p);
            sum += td;
        }
        if (!indices.empty())
            logger_->debug("priorities updated",
                           {field("count", indices.size()),
                            field("mean_td_error", sum / static_cast<double>(indices.size()))});
    }

    /**
     * Exclude `slots` from `sample_batch` by zeroing their tree leaves.
     *
     * A masked slot that is overwritten by `add` becomes sampleable again.
     *
     * @throws ShapeError when a slot is out of range
     */
    void mask_slots(const std::vector<std::size_t>& slots) {
        for (auto slot : slots)
            if (slot >= size_)
                throw ShapeError("buffer index " + std::to_string(slot) + " out of range");
        for (auto slot : slots) {
            if (masked_[slot])
                continue;
            masked_[slot] = 1;
            ++masked_count_;
            masked_list_.push_back(slot);
            tree_.set(slot, 0.0);
        }
    }

    /** Restore every masked slot at its current priority. */
    void unmask_slots() {
        for (auto slot : masked_list_) {
            if (!masked_[slot])
                continue;
            masked_[slot] = 0;
            tree_.set(slot, slots_[slot].priority);
        }
        masked_list_.clear();
        masked_count_ = 0;
    }

    /** Occupied slots ordered from oldest to newest. */
    std::vector<std::size_t> chronological_indices() const {
        std::vector<std::size_t> out;
        out.reserve(size_);
        std::size_t start = size_ < config_.capacity ? 0 : position_;
        for (std::size_t i = 0; i < size_; ++i)
            out.push_back((start + i) % config_.capacity);
        return out;
    }

    /** Copies of the stored experiences, oldest first. */
    std::vector<Experience> all_experiences() const {
        std::vector<Experience> out;
        out.reserve(size_);
        for (auto i : chronological_indices())
            out.push_back(slots_[i]);
        return out;
    }

    BufferStatistics statistics() const {
        BufferStatistics s;
        s.capacity = config_.capacity;
        s.size = size_;
        s.critical_event_count = critical_count_;
        if (size_ == 0)
            return s;
        s.utilization = static_cast<double>(size_) / static_cast<double>(config_.capacity);
        std::vector<double> p;
        p.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i)
            p.push_back(slots_[i].priority);
        std::sort(p.begin(), p.end());
        s.average_priority = std::accumulate(p.begin(), p.end(), 0.0) / static_cast<double>(size_);
        s.min_priority = p.front();
        s.max_priority = p.back();
        s.median_priority = p[p.size() / 2];
        return s;
    }

    void clear() {
        slots_.clear();
        position_ = 0;
        size_ = 0;
        flags_.clear();
        critical_count_ = 0;
        masked_.clear();
        masked_list_.clear();
        masked_count_ = 0;
        tree_.resize(config_.capacity);
        beta_ = config_.beta;
        logger_->info("experience buffer cleared");
    }

  private:
    static constexpr std::uint8_t kHighVolatility = 1;
    static constexpr std::uint8_t kVolumeSpike = 2;
    static constexpr std::uint8_t kPriceMovement = 4;

    static std::uint8_t critical_flags(const Experience& e) {
        std::uint8_t f = 0;
        if (e.metadata.volatility > kVolatilityThreshold)
            f |= kHighVolatility;
        if (e.metadata.volume > kVolumeSpikeThreshold)
            f |= kVolumeSpike;
        if (std::abs(e.reward) > kPriceMoveThreshold)
            f |= kPriceMovement;
        return f;
    }

    static double critical_multiplier(std::uint8_t f) {
        double m = 1.0;
        if (f & kHighVolatility)
            m *= 2.0;
        if (f & kVolumeSpike)
            m *= 1.5;
        if (f & kPriceMovement)
            m *= 1.8;
        return m;
    }

    static std::size_t flag_count(std::uint8_t f) {
        return static_cast<std::size_t>((f & kHighVolatility) != 0) +
               static_cast<std::size_t>((f & kVolumeSpike) != 0) +
               static_cast<std::size_t>((f & kPriceMovement) != 0);
    }

    void require_available(std::size_t available, std::size_t n) const {
        if (available == 0 && n > 0)
            throw InsufficientDataError("cannot sample " + std::to_string(n) +
                                        " experiences from an empty set");
        if (n > available && !config_.allow_replacement)
            throw InsufficientDataError("requested " + std::to_string(n) +
                                        " experiences without replacement, only " +
                                        std::to_string(available) + " available");
    }

    void anneal_beta() { beta_ = std::min(1.0, beta_ + config_.beta_increment); }

    std::size_t clamp_slot(std::size_t slot) const { return slot < size_ ? slot : size_ - 1; }

    std::size_t first_live_slot() const {
        for (std::size_t i = 0; i < size_; ++i)
            if (tree_.get(i) > 0.0)
                return i;
        return 0;
    }

    /** Uniform draws over unmasked slots by rejection; no full index list is built. */
    SampledBatch sample_uniform_live(std::size_t n) {
        SampledBatch b;
        if (n == 0)
            return b;
        std::uniform_int_distribution<std::size_t> dist(0, size_ - 1);
        std::unordered_set<std::size_t> taken;
        while (b.indices.size() < n) {
            std::size_t slot = dist(rng_);
            if (masked_[slot])
                continue;
            if (!config_.allow_replacement && !taken.insert(slot).second)
                continue;
            b.indices.push_back(slot);
        }
        for (auto i : b.indices)
            b.experiences.push_back(slots_[i]);
        b.weights.assign(b.indices.size(), 1.0);
        return b;
    }

    SampledBatch sample_uniform(const std::vector<std::size_t>& candidates, std::size_t n) {
        require_available(candidates.size(), n);
        SampledBatch b;
        if (config_.allow_replacement) {
            std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
            for (std::size_t i = 0; i < n; ++i)
                b.indices.push_back(candidates[dist(rng_)]);
        } else {
            std::vector<std::size_t> pool = candidates;
            for (std::size_t i = 0; i < n; ++i) {
                std::uniform_int_distribution<std::size_t> dist(i, pool.size() - 1);
                std::swap(pool[i], pool[dist(rng_)]);
                b.indices.push_back(pool[i]);
            }
        }
        for (auto i : b.indices)
            b.experiences.push_back(slots_[i]);
        b.weights.assign(b.indices.size(), 1.0);
        return b;
    }

    /**
     * Fill experiences and max-normalized importance sampling weights.
     *
     * `total` is the priority mass of the `population` slots drawn from.
     */
    void finish_batch(SampledBatch& b, double total, std::size_t population) {
        double max_w = 0.0;
        for (auto i : b.indices) {
            b.experiences.push_back(slots_[i]);
            double prob = total > 0.0 ? slots_[i].priority / total : 1.0 / population;
            double w = prob > 0.0 ? std::pow(static_cast<double>(population) * prob, -beta_) : 0.0;
            b.weights.push_back(w);
            max_w = std::max(max_w, w);
        }
        if (max_w > 0.0)
            for (auto& w : b.weights)
                w /= max_w;
        logger_->debug("batch sampled", {field("batch_size", b.indices.size()),
                                         field("total_priority", total), field("beta", beta_)});
    }

    BufferConfig config_{};
    double beta_{0.4};
    std::shared_ptr<Logger> logger_;
    std::mt19937_64 rng_;
    SumTree tree_{};
    std::vector<Experience> slots_{};
    std::size_t position_{0};
    std::size_t size_{0};
    std::vector<std::uint8_t> flags_{};         ///< Critical event bits per slot
    std::size_t critical_count_{0};
    std::vector<std::uint8_t> masked_{};
    std::vector<std::size_t> masked_list_{};
    std::size_t masked_count_{0};
};

} // namespace vigil
