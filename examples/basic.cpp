#include <algorithm>
#include <iostream>
#include <random>
#include <vector>

#include <vigil/vigil.hpp>

// Feeds a synthetic bar series through the engine, trains a few epochs and
// prints a prediction for the latest bar.

int main() {
    vigil::EngineConfig cfg;
    cfg.training.batch_size = 16;
    cfg.training.log_interval = 0;
    cfg.initializer.seed = 7;
    cfg.buffer.seed = 7;
    cfg.exploration.seed = 7;

    vigil::TrainingEngine engine{cfg, vigil::make_null_logger()};
    engine.initialize_network("hybrid", 8, 1);

    std::mt19937 rng{42};
    std::normal_distribution<double> move(0.0, 0.01);
    std::vector<vigil::MarketBar> bars;
    std::vector<int> actions;
    std::vector<double> rewards;
    double price = 100.0;
    for (int i = 0; i < 200; ++i) {
        double next = price * (1.0 + move(rng));
        vigil::MarketBar bar;
        bar.symbol = "DEMO";
        bar.timestamp = 1700000000000LL + i * 60000LL;
        bar.open = price;
        bar.close = next;
        bar.high = std::max(price, next) * 1.002;
        bar.low = std::min(price, next) * 0.998;
        bar.volume = 1000.0 + 10.0 * i;
        bars.push_back(bar);
        double r = (next - price) / price;
        rewards.push_back(r);
        actions.push_back(r > 0.0 ? 1 : 2);
        price = next;
    }
    // Bars are normalised to the first price so features stay small.
    for (auto& b : bars) {
        b.open /= 100.0;
        b.high /= 100.0;
        b.low /= 100.0;
        b.close /= 100.0;
        b.volume /= 1e4;
    }
    engine.add_market_data_experiences(bars, actions, rewards);

    auto summary = engine.fit(5);
    std::cout << "epochs run: " << summary.epochs_run << '\n';
    std::cout << "best loss: " << summary.best_loss << '\n';

    auto p = engine.predict(vigil::market_features(bars.back()));
    std::cout << "prediction: " << p.value << '\n';
    auto choice = engine.select_action(vigil::market_features(bars.back()));
    std::cout << "action: " << choice.action << (choice.explored ? " (explored)" : "") << '\n';
}
