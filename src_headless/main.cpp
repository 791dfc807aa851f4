#include <omp.h>

#include <chrono>
#include <cstdlib>
#include <iostream>

#include "colony.hpp"

#define MAX_STEPS 200000
#define FOOD_AMOUNT 25  // Units per default food source
#define PROGRESS_INTERVAL 1000

// Default food sources, in plane coordinates
constexpr double FOOD_X[4] = {400.0, 150.0, 300.0, 500.0};
constexpr double FOOD_Y[4] = {300.0, 250.0, 100.0, 200.0};

class HeadlessRunner {
   public:
    HeadlessRunner(const SimConfig& config, size_t max_steps) : sim(config), max_steps(max_steps) {
        for (int i = 0; i < 4; i++) {
            PlaceFoodResult placed = sim.place_food(Vec2(FOOD_X[i], FOOD_Y[i]), FOOD_AMOUNT);
            if (!placed.ok()) {
                std::cerr << "Warning: food at (" << FOOD_X[i] << ", " << FOOD_Y[i]
                          << ") not placed: " << place_status_name(placed.status) << std::endl;
            }
        }
    }

    void run() {
        auto start_time = std::chrono::high_resolution_clock::now();

        while (!sim.is_complete() && sim.stats().steps < max_steps) {
            sim.step();

            const SimStats& stats = sim.stats();
            if (stats.steps % PROGRESS_INTERVAL == 0) {
                std::cout << "Step " << stats.steps << ": Delivered " << stats.food_delivered << "/"
                          << stats.food_placed << " food, t=" << stats.sim_time << std::endl;
            }
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        const SimStats& stats = sim.stats();

        std::cout << "\n=== Simulation " << (sim.is_complete() ? "Complete" : "Stopped") << " ===" << std::endl;
        std::cout << "Total steps: " << stats.steps << std::endl;
        std::cout << "Food delivered: " << stats.food_delivered << "/" << stats.food_placed << std::endl;
        std::cout << "Simulated time: " << stats.sim_time << std::endl;
        std::cout << "Collisions resolved: " << stats.collisions_resolved << std::endl;

        int mode_counts[2] = {0, 0};
        for (const AntView& ant : sim.snapshot().ants) {
            mode_counts[static_cast<int>(ant.mode)]++;
        }
        for (AntMode mode : {AntMode::SEARCHING, AntMode::RETURNING}) {
            std::cout << "Ants " << mode_name(mode) << ": " << mode_counts[static_cast<int>(mode)] << std::endl;
        }
        std::cout << "Execution time: " << duration.count() << " ms" << std::endl;
        if (stats.steps > 0) {
            std::cout << "Time per step: " << (double)duration.count() / stats.steps << " ms" << std::endl;
        }
    }

   private:
    ColonySimulation sim;
    size_t max_steps;
};

int main(int argc, char* argv[]) {
    SimConfig config;
    size_t max_steps = MAX_STEPS;

    if (argc > 1) {
        config.seed = static_cast<uint32_t>(std::strtoul(argv[1], nullptr, 10));
    }
    if (argc > 2) {
        config.num_threads = std::atoi(argv[2]);
    }
    if (argc > 3) {
        max_steps = std::strtoul(argv[3], nullptr, 10);
    }
    int num_threads = config.num_threads > 0 ? config.num_threads : omp_get_max_threads();

    std::cout << "=== Ant Colony Simulation (Headless) ===" << std::endl;
    std::cout << "Plane size: " << config.width << " x " << config.height << std::endl;
    std::cout << "Number of ants: " << config.population << std::endl;
    std::cout << "Food per source: " << FOOD_AMOUNT << std::endl;
    std::cout << "Number of threads: " << num_threads << std::endl;
    std::cout << "Random seed: " << config.seed << std::endl;
    std::cout << "=========================================\n" << std::endl;

    try {
        HeadlessRunner runner(config, max_steps);
        runner.run();
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
