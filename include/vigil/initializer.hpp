#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "vigil/core.hpp"
#include "vigil/errors.hpp"

namespace vigil {

/** Distribution used when drawing initial weights. */
enum class InitMode {
    Uniform,  ///< U(-limit, limit) with limit = gain * sqrt(6 / (fan_in + fan_out))
    Normal,   ///< N(0, std) with std = gain * sqrt(2 / (fan_in + fan_out))
    HeNormal  ///< N(0, std) with std = gain * sqrt(2 / fan_in)
};

/** Layer families recognised by `XavierInitializer::initialize_layer`. */
enum class LayerKind { Dense, Lstm, Conv, Attention };

struct InitializerConfig {
    InitMode mode{InitMode::Normal};
    double gain{1.0};
    /** Explicit seed. When unset the generator is seeded from `std::random_device`. */
    std::optional<std::uint64_t> seed{};
};

/**
 * @brief Variance-scaled weight initializer.
 *
 * The generator is owned by the instance so tests can inject a seed and get
 * bit-identical parameter sets across runs.
 */
class XavierInitializer {
  public:
    XavierInitializer() : XavierInitializer(InitializerConfig{}) {}
    explicit XavierInitializer(InitializerConfig config)
        : config_{config}, rng_{config.seed ? *config.seed : std::random_device{}()} {}

    const InitializerConfig& config() const { return config_; }

    /** Reseed the generator. */
    void seed(std::uint64_t s) {
        config_.seed = s;
        rng_.seed(s);
    }

    /** Draw a `fan_in x fan_out` matrix using the configured mode and gain. */
    Matrix initialize(std::size_t fan_in, std::size_t fan_out) {
        return initialize(fan_in, fan_out, config_.mode, config_.gain);
    }

    Matrix initialize(std::size_t fan_in, std::size_t fan_out, InitMode mode, double gain) {
        if (fan_in == 0 || fan_out == 0)
            throw ConfigError("initializer fan sizes must be positive, got " +
                              std::to_string(fan_in) + "x" + std::to_string(fan_out));
        if (!(gain > 0.0) || !std::isfinite(gain))
            throw ConfigError("initializer gain must be a positive finite value");
        Matrix m(fan_in, fan_out);
        auto& d = m.data();
        switch (mode) {
        case InitMode::Uniform: {
            double limit = uniform_limit(fan_in, fan_out, gain);
            std::uniform_real_distribution<double> dist(-limit, limit);
            for (auto& v : d)
                v = dist(rng_);
            break;
        }
        case InitMode::Normal: {
            std::normal_distribution<double> dist(0.0, normal_stddev(fan_in, fan_out, gain));
            for (auto& v : d)
                v = dist(rng_);
            break;
        }
        case InitMode::HeNormal: {
            std::normal_distribution<double> dist(0.0, he_stddev(fan_in, gain));
            for (auto& v : d)
                v = dist(rng_);
            break;
        }
        }
        return m;
    }

    /**
     * Initialize a layer using the gain conventional for its family.
     *
     * Convolutional layers use He scaling; the remaining families use the
     * configured Xavier mode and gain.
     */
    Matrix initialize_layer(LayerKind kind, std::size_t fan_in, std::size_t fan_out) {
        switch (kind) {
        case LayerKind::Conv:
            return initialize(fan_in, fan_out, InitMode::HeNormal, 1.0);
        case LayerKind::Dense:
        case LayerKind::Lstm:
        case LayerKind::Attention:
            break;
        }
        return initialize(fan_in, fan_out);
    }

    static double uniform_limit(std::size_t fan_in, std::size_t fan_out, double gain) {
        return gain * std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    }

    static double normal_stddev(std::size_t fan_in, std::size_t fan_out, double gain) {
        return gain * std::sqrt(2.0 / static_cast<double>(fan_in + fan_out));
    }

    static double he_stddev(std::size_t fan_in, double gain) {
        return gain * std::sqrt(2.0 / static_cast<double>(fan_in));
    }

  private:
    InitializerConfig config_{};
    std::mt19937_64 rng_;
};

} // namespace vigil
