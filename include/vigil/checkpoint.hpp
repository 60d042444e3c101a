#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "vigil/architecture.hpp"
#include "vigil/config.hpp"
#include "vigil/engine_config.hpp"
#include "vigil/errors.hpp"
#include "vigil/exploration.hpp"
#include "vigil/lr_scheduler.hpp"
#include "vigil/optimizer.hpp"
#include "vigil/serialization.hpp"
#include "vigil/watchdog.hpp"

namespace vigil {

/** Progress of the epoch loop. */
struct TrainingState {
    std::uint64_t epoch{0};
    std::uint64_t step{0};
    double best_validation_loss{std::numeric_limits<double>::infinity()};
    std::size_t patience_counter{0};
    bool is_training{false};
    bool halted{false};
    std::int64_t start_time{0}; ///< Milliseconds since the epoch
};

inline bool operator==(const TrainingState& a, const TrainingState& b) {
    bool same_best = a.best_validation_loss == b.best_validation_loss ||
                     (std::isnan(a.best_validation_loss) && std::isnan(b.best_validation_loss));
    return a.epoch == b.epoch && a.step == b.step && same_best &&
           a.patience_counter == b.patience_counter && a.is_training == b.is_training &&
           a.halted == b.halted && a.start_time == b.start_time;
}

/** Everything written to and read from a checkpoint file. */
struct Checkpoint {
    ParameterSet parameters{};
    OptimizerState optimizer_state{};
    SchedulerState scheduler_state{};
    WatchdogState watchdog_state{};
    TrainingState training_state{};
    ExplorationState exploration_state{};
    EngineConfig config{};
    NetworkConfig network_config{};
    std::int64_t timestamp{0};
    std::string version{version_string()};
};

inline std::int64_t now_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline void to_json(json& j, const OptimizerState& s) {
    j = json{{"m", s.m}, {"v", s.v}, {"step", s.step}};
}

inline void from_json(const json& j, OptimizerState& s) {
    j.at("m").get_to(s.m);
    j.at("v").get_to(s.v);
    j.at("step").get_to(s.step);
}

inline void to_json(json& j, const SchedulerState& s) {
    json window = json::array();
    for (double v : s.window)
        window.push_back(encode_number(v));
    j = json{{"currentLR", encode_number(s.current_lr)},
             {"baseLR", encode_number(s.base_lr)},
             {"window", window},
             {"bestLoss", encode_number(s.best_loss)},
             {"plateauCounter", s.plateau_counter},
             {"decayCount", s.decay_count},
             {"steps", s.steps},
             {"peakLR", encode_number(s.peak_lr)},
             {"lastRestartStep", s.last_restart_step},
             {"restartCount", s.restart_count}};
}

inline void from_json(const json& j, SchedulerState& s) {
    s.current_lr = decode_number(j.at("currentLR"));
    s.base_lr = decode_number(j.at("baseLR"));
    auto w = decode_numbers(j.at("window"));
    s.window.assign(w.begin(), w.end());
    s.best_loss = decode_number(j.at("bestLoss"));
    j.at("plateauCounter").get_to(s.plateau_counter);
    j.at("decayCount").get_to(s.decay_count);
    j.at("steps").get_to(s.steps);
    // Cosine schedule fields; absent in plateau-only checkpoints.
    s.peak_lr = j.contains("peakLR") ? decode_number(j.at("peakLR")) : s.base_lr;
    read_optional(j, "lastRestartStep", s.last_restart_step);
    read_optional(j, "restartCount", s.restart_count);
}

inline void to_json(json& j, const StableCheckpoint& c) {
    j = json{{"step", c.step},
             {"parameters", c.parameters},
             {"optimizerState", c.optimizer_state},
             {"loss", encode_number(c.loss)}};
}

inline void from_json(const json& j, StableCheckpoint& c) {
    j.at("step").get_to(c.step);
    j.at("parameters").get_to(c.parameters);
    j.at("optimizerState").get_to(c.optimizer_state);
    c.loss = decode_number(j.at("loss"));
}

inline void to_json(json& j, const ResetEvent& e) {
    j = json{{"step", e.step},
             {"cause", e.cause},
             {"lossValue", encode_number(e.loss)},
             {"gradientNorm", encode_number(e.gradient_norm)},
             {"nanCount", e.nan_count},
             {"infCount", e.inf_count}};
}

inline void from_json(const json& j, ResetEvent& e) {
    j.at("step").get_to(e.step);
    j.at("cause").get_to(e.cause);
    e.loss = decode_number(j.at("lossValue"));
    e.gradient_norm = decode_number(j.at("gradientNorm"));
    j.at("nanCount").get_to(e.nan_count);
    j.at("infCount").get_to(e.inf_count);
}

inline void to_json(json& j, const WatchdogState& s) {
    j = json{{"lastCheckStep", s.last_check_step},
             {"resetCount", s.reset_count},
             {"totalNaNDetected", s.total_nan_detected},
             {"totalInfDetected", s.total_inf_detected},
             {"lastStableCheckpoint",
              s.last_stable_checkpoint ? json(*s.last_stable_checkpoint) : json(nullptr)},
             {"resetHistory", s.reset_log},
             {"phase", to_string(s.phase)}};
}

inline void from_json(const json& j, WatchdogState& s) {
    j.at("lastCheckStep").get_to(s.last_check_step);
    j.at("resetCount").get_to(s.reset_count);
    j.at("totalNaNDetected").get_to(s.total_nan_detected);
    j.at("totalInfDetected").get_to(s.total_inf_detected);
    const auto& cp = j.at("lastStableCheckpoint");
    if (cp.is_null())
        s.last_stable_checkpoint.reset();
    else
        s.last_stable_checkpoint = cp.get<StableCheckpoint>();
    j.at("resetHistory").get_to(s.reset_log);
    s.phase = parse_watchdog_phase(j.at("phase").get<std::string>());
}

inline void to_json(json& j, const ExplorationState& s) {
    j = json{{"current", encode_number(s.current)},
             {"step", s.step},
             {"explorationCount", s.exploration_count},
             {"exploitationCount", s.exploitation_count}};
}

inline void from_json(const json& j, ExplorationState& s) {
    s.current = decode_number(j.at("current"));
    j.at("step").get_to(s.step);
    j.at("explorationCount").get_to(s.exploration_count);
    j.at("exploitationCount").get_to(s.exploitation_count);
}

inline void to_json(json& j, const TrainingState& s) {
    j = json{{"epoch", s.epoch},
             {"step", s.step},
             {"bestValidationLoss", encode_number(s.best_validation_loss)},
             {"patienceCounter", s.patience_counter},
             {"isTraining", s.is_training},
             {"halted", s.halted},
             {"startTime", s.start_time}};
}

inline void from_json(const json& j, TrainingState& s) {
    j.at("epoch").get_to(s.epoch);
    j.at("step").get_to(s.step);
    s.best_validation_loss = decode_number(j.at("bestValidationLoss"));
    j.at("patienceCounter").get_to(s.patience_counter);
    j.at("isTraining").get_to(s.is_training);
    j.at("halted").get_to(s.halted);
    j.at("startTime").get_to(s.start_time);
}

inline const char* to_string(LayerKind k) {
    switch (k) {
    case LayerKind::Dense:
        return "dense";
    case LayerKind::Lstm:
        return "lstm";
    case LayerKind::Conv:
        return "conv";
    case LayerKind::Attention:
        return "attention";
    }
    return "dense";
}

inline LayerKind parse_layer_kind(const std::string& s) {
    if (s == "dense")
        return LayerKind::Dense;
    if (s == "lstm")
        return LayerKind::Lstm;
    if (s == "conv")
        return LayerKind::Conv;
    if (s == "attention")
        return LayerKind::Attention;
    throw ConfigError("unknown layer kind: " + s);
}

inline void to_json(json& j, const NetworkConfig& c) {
    j = json{{"architecture", c.architecture},
             {"inputSize", c.input_size},
             {"outputSize", c.output_size},
             {"layers", c.layers},
             {"hiddenActivation", to_string(c.hidden_activation)},
             {"outputActivation", to_string(c.output_activation)},
             {"layerKind", to_string(c.kind)}};
}

inline void from_json(const json& j, NetworkConfig& c) {
    j.at("architecture").get_to(c.architecture);
    j.at("inputSize").get_to(c.input_size);
    j.at("outputSize").get_to(c.output_size);
    j.at("layers").get_to(c.layers);
    c.hidden_activation = parse_activation(j.at("hiddenActivation").get<std::string>());
    c.output_activation = parse_activation(j.at("outputActivation").get<std::string>());
    c.kind = parse_layer_kind(j.at("layerKind").get<std::string>());
}

inline json checkpoint_to_json(const Checkpoint& cp) {
    return json{{"parameters", cp.parameters},
                {"optimizerState", cp.optimizer_state},
                {"schedulerState", cp.scheduler_state},
                {"watchdogState", cp.watchdog_state},
                {"trainingState", cp.training_state},
                {"explorationState", cp.exploration_state},
                {"config", cp.config},
                {"networkConfig", cp.network_config},
                {"timestamp", cp.timestamp},
                {"version", cp.version}};
}

/** Leading integer of a `major.minor.patch` string. */
inline int parse_major_version(const std::string& version) {
    std::size_t end = version.find('.');
    std::string major = version.substr(0, end);
    if (major.empty() || major.find_first_not_of("0123456789") != std::string::npos)
        throw CheckpointIOError("malformed checkpoint version '" + version + "'");
    return std::stoi(major);
}

/**
 * Decode a checkpoint document.
 *
 * @throws CheckpointIOError on a missing field, a wrong type or an
 *         incompatible major version
 */
inline Checkpoint checkpoint_from_json(const json& j) {
    Checkpoint cp;
    try {
        j.at("version").get_to(cp.version);
        if (parse_major_version(cp.version) != version_major())
            throw CheckpointIOError("unsupported checkpoint version " + cp.version +
                                    ", expected " + version_string());
        j.at("parameters").get_to(cp.parameters);
        j.at("optimizerState").get_to(cp.optimizer_state);
        j.at("schedulerState").get_to(cp.scheduler_state);
        j.at("watchdogState").get_to(cp.watchdog_state);
        j.at("trainingState").get_to(cp.training_state);
        if (j.contains("explorationState"))
            j.at("explorationState").get_to(cp.exploration_state);
        from_json(j.at("config"), cp.config);
        j.at("networkConfig").get_to(cp.network_config);
        j.at("timestamp").get_to(cp.timestamp);
    } catch (const json::exception& e) {
        throw CheckpointIOError(std::string("malformed checkpoint: ") + e.what());
    } catch (const ConfigError& e) {
        throw CheckpointIOError(std::string("malformed checkpoint: ") + e.what());
    }
    return cp;
}

/**
 * Write `cp` to `path`.
 *
 * The document goes to `<path>.tmp` first and is renamed over the target, so
 * a reader never observes a partially written file.
 */
inline void save_checkpoint(const Checkpoint& cp, const std::string& path) {
    namespace fs = std::filesystem;
    const fs::path target{path};
    const fs::path tmp{path + ".tmp"};
    std::error_code ec;
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw CheckpointIOError("failed to open " + tmp.string() + " for writing");
        out << checkpoint_to_json(cp).dump(2);
        out.flush();
        if (!out)
            throw CheckpointIOError("failed to write " + tmp.string());
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw CheckpointIOError("failed to move checkpoint into place at " + path);
    }
}

inline Checkpoint load_checkpoint(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw CheckpointIOError("failed to open " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    json j;
    try {
        j = json::parse(ss.str());
    } catch (const json::exception& e) {
        throw CheckpointIOError("failed to parse " + path + ": " + e.what());
    }
    return checkpoint_from_json(j);
}

} // namespace vigil
