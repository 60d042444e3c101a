#pragma once

#include <cstddef>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "vigil/activations.hpp"
#include "vigil/core.hpp"
#include "vigil/errors.hpp"
#include "vigil/initializer.hpp"

namespace vigil {

/** Plain stack of dense hidden layers. */
struct DenseSpec {
    std::vector<std::size_t> hidden{64, 32};
};

/** Recurrent-style network lowered to two wide dense layers. */
struct LstmSpec {
    std::size_t units{128};
    std::size_t projection{64};
};

/** Convolution-style network lowered to a dense pyramid. */
struct CnnSpec {
    std::size_t filters{64};
    std::size_t pooled{32};
};

/** Attention-style network lowered to a wide embedding and a projection. */
struct AttentionSpec {
    std::size_t embedding{256};
    std::size_t projection{64};
};

/** Small mixed network; the default used by the trading pipeline. */
struct HybridSpec {
    std::size_t first{32};
    std::size_t second{16};
};

using ArchitectureSpec = std::variant<DenseSpec, LstmSpec, CnnSpec, AttentionSpec, HybridSpec>;

/**
 * Map an architecture tag to its default spec.
 *
 * @throws ConfigError for unknown tags
 */
inline ArchitectureSpec parse_architecture(const std::string& tag) {
    if (tag == "dense")
        return DenseSpec{};
    if (tag == "lstm")
        return LstmSpec{};
    if (tag == "cnn")
        return CnnSpec{};
    if (tag == "attention")
        return AttentionSpec{};
    if (tag == "hybrid")
        return HybridSpec{};
    throw ConfigError("unknown architecture: " + tag);
}

inline std::string architecture_name(const ArchitectureSpec& spec) {
    return std::visit(
        [](const auto& s) -> std::string {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, DenseSpec>)
                return "dense";
            else if constexpr (std::is_same_v<T, LstmSpec>)
                return "lstm";
            else if constexpr (std::is_same_v<T, CnnSpec>)
                return "cnn";
            else if constexpr (std::is_same_v<T, AttentionSpec>)
                return "attention";
            else
                return "hybrid";
        },
        spec);
}

/** Layer family used to pick the initializer scaling. */
inline LayerKind layer_kind(const ArchitectureSpec& spec) {
    return std::visit(
        [](const auto& s) -> LayerKind {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, LstmSpec>)
                return LayerKind::Lstm;
            else if constexpr (std::is_same_v<T, CnnSpec>)
                return LayerKind::Conv;
            else if constexpr (std::is_same_v<T, AttentionSpec>)
                return LayerKind::Attention;
            else
                return LayerKind::Dense;
        },
        spec);
}

/** Hidden layer widths a spec lowers to. */
inline std::vector<std::size_t> hidden_widths(const ArchitectureSpec& spec) {
    return std::visit(
        [](const auto& s) -> std::vector<std::size_t> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, DenseSpec>)
                return s.hidden;
            else if constexpr (std::is_same_v<T, LstmSpec>)
                return {s.units, s.projection};
            else if constexpr (std::is_same_v<T, CnnSpec>)
                return {s.filters, s.pooled};
            else if constexpr (std::is_same_v<T, AttentionSpec>)
                return {s.embedding, s.projection};
            else
                return {s.first, s.second};
        },
        spec);
}

/**
 * @brief Resolved network layout.
 *
 * Immutable once the engine has been initialized; changing any field requires
 * a fresh `initialize_network`.
 */
struct NetworkConfig {
    std::string architecture{"hybrid"};
    std::size_t input_size{0};
    std::size_t output_size{0};
    std::vector<LayerShape> layers{};
    Activation hidden_activation{Activation::LeakyRelu};
    Activation output_activation{Activation::Sigmoid};
    LayerKind kind{LayerKind::Dense};
};

/**
 * Lower an architecture to concrete layer shapes.
 *
 * @throws ConfigError when a size is not positive
 */
inline NetworkConfig build_network_config(const ArchitectureSpec& spec, long long input_size,
                                          long long output_size,
                                          Activation output_activation = Activation::Sigmoid) {
    if (input_size <= 0)
        throw ConfigError("input size must be positive, got " + std::to_string(input_size));
    if (output_size <= 0)
        throw ConfigError("output size must be positive, got " + std::to_string(output_size));

    NetworkConfig cfg;
    cfg.architecture = architecture_name(spec);
    cfg.input_size = static_cast<std::size_t>(input_size);
    cfg.output_size = static_cast<std::size_t>(output_size);
    cfg.output_activation = output_activation;
    cfg.kind = layer_kind(spec);

    std::size_t prev = cfg.input_size;
    for (std::size_t width : hidden_widths(spec)) {
        if (width == 0)
            throw ConfigError("hidden layer width must be positive in " + cfg.architecture);
        cfg.layers.push_back({prev, width});
        prev = width;
    }
    cfg.layers.push_back({prev, cfg.output_size});
    return cfg;
}

/** Draw one weight matrix per layer of `cfg`. */
inline ParameterSet initialize_parameters(const NetworkConfig& cfg, XavierInitializer& init) {
    if (cfg.layers.empty())
        throw ConfigError("network has no layers");
    ParameterSet params;
    params.reserve(cfg.layers.size());
    for (const auto& shape : cfg.layers)
        params.push_back(init.initialize_layer(cfg.kind, shape.rows, shape.cols));
    return params;
}

} // namespace vigil
