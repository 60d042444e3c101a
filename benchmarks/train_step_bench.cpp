#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <vigil/vigil.hpp>

using namespace vigil;

static std::vector<Experience> make_batch(std::size_t n, std::size_t width, std::mt19937& rng) {
    std::normal_distribution<double> d(0.0, 1.0);
    std::vector<Experience> out(n);
    for (auto& e : out) {
        e.state.resize(width);
        for (auto& v : e.state)
            v = d(rng);
        e.reward = d(rng);
        e.action = e.reward > 0.0 ? 1 : 2;
    }
    return out;
}

static double benchmark(const std::string& arch, std::size_t width, std::size_t batch,
                        std::size_t runs) {
    EngineConfig cfg;
    cfg.initializer.seed = 3;
    cfg.exploration.seed = 3;
    cfg.training.log_interval = 0;
    TrainingEngine engine{cfg, make_null_logger()};
    engine.initialize_network(arch, static_cast<long long>(width), 1);
    std::mt19937 rng{5};
    auto data = make_batch(batch, width, rng);

    double total = 0.0;
    for (std::size_t i = 0; i < runs; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        engine.train_step(data);
        auto end = std::chrono::high_resolution_clock::now();
        total += std::chrono::duration<double, std::milli>(end - start).count();
    }
    return total / static_cast<double>(runs);
}

int main() {
    const std::size_t runs = 50;
    for (const char* arch : {"hybrid", "dense", "lstm", "cnn", "attention"}) {
        for (std::size_t batch : {16u, 64u}) {
            double ms = benchmark(arch, 16, batch, runs);
            std::cout << arch << " batch=" << batch << " avg_step_ms=" << ms << '\n';
        }
    }
    return 0;
}
