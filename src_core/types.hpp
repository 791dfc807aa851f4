#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "config.hpp"
#include "vec2.hpp"

// Ant structure
struct Ant {
    int id = -1;
    Vec2 position;
    double heading = 0.0;  // Radians, [0, 2*pi)
    AntMode mode = AntMode::SEARCHING;
    bool has_food = false;
    int target_food = -1;  // Weak reference into the food registry, -1 if none
    double trail_strength = 1.0;
    int bored = 0;  // Steps left ignoring pheromones

    Ant() = default;
    Ant(int id, const Vec2& position, double heading) : id(id), position(position), heading(heading) {}
};

// Food source placed by the user
struct FoodSource {
    int id = -1;
    Vec2 position;
    int quantity = 0;
    int initial_quantity = 0;
};

// Simulation statistics
struct SimStats {
    size_t steps = 0;
    double sim_time = 0.0;
    int64_t food_delivered = 0;
    int64_t food_picked_up = 0;
    int64_t food_placed = 0;  // Sum of placed quantities, may exceed INT_MAX
    int64_t food_removed = 0;  // Units withdrawn with remove_food
    size_t collisions_resolved = 0;
    size_t depleted_targets = 0;
    size_t rejected_placements = 0;

    bool operator==(const SimStats& o) const {
        return steps == o.steps && sim_time == o.sim_time && food_delivered == o.food_delivered &&
               food_picked_up == o.food_picked_up && food_placed == o.food_placed &&
               food_removed == o.food_removed &&
               collisions_resolved == o.collisions_resolved && depleted_targets == o.depleted_targets &&
               rejected_placements == o.rejected_placements;
    }
};

// Random number generator wrapper
class RNG {
   public:
    RNG(uint32_t seed = DEFAULT_SEED) : gen(seed), dist(0.0, 1.0) {}

    double random_double() { return dist(gen); }
    double random_double(double min, double max) { return min + (max - min) * dist(gen); }
    int random_int(int min, int max) {
        std::uniform_int_distribution<int> d(min, max);
        return d(gen);
    }
    double normal(double mean, double stddev) {
        if (stddev <= 0.0)
            return mean;
        std::normal_distribution<double> d(mean, stddev);
        return d(gen);
    }
    // Seed for a derived per-agent generator
    uint32_t next_seed() { return static_cast<uint32_t>(gen()); }

   private:
    std::mt19937 gen;
    std::uniform_real_distribution<double> dist;
};
