#include <iostream>
#include <limits>
#include <vector>

#include <vigil/vigil.hpp>

// Shows the watchdog rolling the network back after parameters are poisoned
// with NaN, and the learning rate cut that comes with it.

int main() {
    vigil::EngineConfig cfg;
    cfg.watchdog.check_interval = 2;
    cfg.watchdog.nan_threshold = 0;
    cfg.initializer.seed = 1;
    cfg.exploration.seed = 1;

    vigil::TrainingEngine engine{cfg};
    engine.initialize_network("dense", 4, 1);

    std::vector<vigil::Experience> batch;
    for (int i = 0; i < 8; ++i) {
        vigil::Experience e;
        e.state = {0.1 * i, 0.2, -0.1, 0.05};
        e.reward = i % 2 == 0 ? 0.01 : -0.01;
        e.action = i % 2 == 0 ? 1 : 2;
        batch.push_back(e);
    }

    for (int i = 0; i < 4; ++i)
        engine.train_step(batch);
    std::cout << "learning rate before: " << engine.scheduler().current_lr() << '\n';

    auto params = engine.get_parameters();
    params[0](0, 0) = std::numeric_limits<double>::quiet_NaN();
    engine.set_parameters(params);

    for (int i = 0; i < 2; ++i) {
        auto m = engine.train_step(batch);
        if (m.reset_performed)
            std::cout << "reset at step " << m.step << ": " << m.reset_cause << '\n';
    }
    std::cout << "learning rate after: " << engine.scheduler().current_lr() << '\n';
    std::cout << "parameters finite: " << (vigil::all_finite(engine.get_parameters()) ? "yes" : "no")
              << '\n';

    auto stats = engine.watchdog().statistics();
    std::cout << "resets: " << stats.reset_count << ", NaN seen: " << stats.total_nan_detected
              << '\n';
}
