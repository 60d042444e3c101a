#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <vigil/vigil.hpp>

// ---------------------------------------------------------------------------
// vigil command line tool
// ---------------------------------------------------------------------------
// train    fit a network on experiences read from CSV and optionally write a
//          checkpoint
// inspect  print a summary of a checkpoint file
// selftest run the built-in numerical checks: instability detection, gradient
//          clipping, weight decay, activation stability, schedules and
//          exploration
// ---------------------------------------------------------------------------

using namespace vigil;

static void usage() {
    std::cerr << "Usage:\n"
              << "  vigil_cli train <experiences.csv> [--config cfg.json] [--arch hybrid]\n"
              << "                  [--epochs n] [-o checkpoint.json] [--quiet]\n"
              << "  vigil_cli inspect <checkpoint.json>\n"
              << "  vigil_cli selftest\n";
}

static int run_train(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }
    std::string data = argv[2];
    std::string config_path;
    std::string arch = "hybrid";
    std::string out;
    std::optional<std::size_t> epochs;
    bool quiet = false;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
            config_path = argv[++i];
        else if (arg == "--arch" && i + 1 < argc)
            arch = argv[++i];
        else if (arg == "--epochs" && i + 1 < argc)
            epochs = static_cast<std::size_t>(std::stoul(argv[++i]));
        else if ((arg == "-o" || arg == "--out") && i + 1 < argc)
            out = argv[++i];
        else if (arg == "--quiet")
            quiet = true;
        else {
            std::cerr << "Unknown option " << arg << '\n';
            return 1;
        }
    }

    EngineConfig cfg = config_path.empty() ? EngineConfig{} : load_engine_config(config_path);
    auto logger = make_default_logger();
    if (quiet)
        logger->set_level(LogLevel::Warn);

    auto experiences = read_experiences_csv(data);
    if (experiences.empty())
        throw InsufficientDataError("no experiences in " + data);

    TrainingEngine engine{cfg, logger};
    engine.initialize_network(arch, static_cast<long long>(experiences.front().state.size()), 1);
    for (auto& e : experiences)
        engine.add_experience(std::move(e));

    FitSummary summary = engine.fit(epochs);
    std::cout << "epochs: " << summary.epochs_run << '\n';
    std::cout << "steps: " << engine.training_state().step << '\n';
    std::cout << "best loss: " << summary.best_loss << '\n';
    std::cout << "resets: " << engine.watchdog().state().reset_count << '\n';
    std::cout << "learning rate: " << engine.scheduler().current_lr() << '\n';
    if (summary.early_stopped)
        std::cout << "stopped early\n";
    if (!out.empty()) {
        engine.save_model_checkpoint(out);
        std::cout << "checkpoint: " << out << '\n';
    }
    return 0;
}

static int run_inspect(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }
    Checkpoint cp = load_checkpoint(argv[2]);
    const auto& net = cp.network_config;
    std::cout << "version: " << cp.version << '\n';
    std::cout << "architecture: " << net.architecture << '\n';
    std::cout << "layers:";
    for (const auto& l : net.layers)
        std::cout << ' ' << to_string(l);
    std::cout << '\n';
    std::cout << "parameters: " << parameter_count(cp.parameters) << '\n';
    std::cout << "epoch: " << cp.training_state.epoch << '\n';
    std::cout << "step: " << cp.training_state.step << '\n';
    std::cout << "best loss: " << cp.training_state.best_validation_loss << '\n';
    std::cout << "learning rate: " << cp.scheduler_state.current_lr << '\n';
    std::cout << "resets: " << cp.watchdog_state.reset_count << '\n';
    std::cout << "watchdog: " << to_string(cp.watchdog_state.phase) << '\n';
    std::cout << "halted: " << (cp.training_state.halted ? "yes" : "no") << '\n';
    return 0;
}

static void print_result(bool passed, const std::string& name, const std::string& detail = {}) {
    std::cout << (passed ? "PASS " : "FAIL ") << name;
    if (!detail.empty())
        std::cout << " (" << detail << ')';
    std::cout << '\n';
}

static int run_selftest() {
    bool ok = true;
    auto detection = InstabilityWatchdog::run_detection_self_test({}, make_null_logger());
    for (const auto& c : detection.cases)
        print_result(c.passed, c.name, c.cause);
    ok = ok && detection.passed;

    for (NormType t : {NormType::L2, NormType::L1, NormType::Inf}) {
        auto clip = GradientClipper(ClipperConfig{1.0, t}).run_exploding_gradients_self_test();
        for (const auto& c : clip.cases)
            print_result(c.passed, std::string("clip_") + to_string(t) + "_" + c.name,
                         "norm " + std::to_string(c.pre_clip_norm) + " -> " +
                             std::to_string(c.post_clip_norm));
        ok = ok && clip.passed;
    }

    auto decay = AdamWOptimizer(OptimizerConfig{}).verify_decoupled_weight_decay();
    print_result(decay.passed, "decoupled_weight_decay",
                 "difference " + std::to_string(decay.actual_difference));
    ok = ok && decay.passed;

    auto stability = run_activation_stability_self_test();
    for (const auto& c : stability.cases)
        print_result(c.passed, c.inputs + "_" + c.function);
    ok = ok && stability.passed;

    for (ScheduleKind k : {ScheduleKind::Plateau, ScheduleKind::Cosine,
                           ScheduleKind::WarmupCosine, ScheduleKind::WarmRestarts}) {
        SchedulerConfig sc;
        sc.schedule = k;
        sc.warmup_steps = 100;
        sc.total_steps = 1000;
        sc.restart_period = 100;
        auto prog = LearningRateScheduler(sc).test_progression(1000);
        bool passed = std::isfinite(prog.final_lr) && prog.final_lr >= sc.min_lr &&
                      prog.final_lr <= sc.initial_lr;
        print_result(passed, std::string("schedule_") + to_string(k),
                     "final lr " + std::to_string(prog.final_lr));
        ok = ok && passed;
    }

    auto exploration = ExplorationStrategy::run_exploration_self_test();
    for (const auto& c : exploration.cases)
        print_result(c.passed, std::string("exploration_") + to_string(c.mode),
                     "ratio " + std::to_string(c.exploration_ratio));
    ok = ok && exploration.passed;
    return ok ? 0 : 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }
    std::string cmd = argv[1];
    try {
        if (cmd == "train")
            return run_train(argc, argv);
        if (cmd == "inspect")
            return run_inspect(argc, argv);
        if (cmd == "selftest")
            return run_selftest();
        if (cmd == "--version") {
            std::cout << "vigil " << version_string() << '\n';
            return 0;
        }
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
}
