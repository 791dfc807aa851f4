#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "vec2.hpp"

// Plane configuration - 600x400 plane, 4 units per pheromone cell
#define PLANE_WIDTH 600.0
#define PLANE_HEIGHT 400.0
#define CELL_SIZE 4.0

// Colony configuration
#define NUM_ANTS 100
#define HOME_X (PLANE_WIDTH / 2)
#define HOME_Y (PLANE_HEIGHT / 2)
#define HOME_RADIUS 20.0
#define DEFAULT_SEED 42u

// Pheromone configuration
#define PHEROMONE_DECAY 0.995   // Decay factor per step
#define PHEROMONE_EPSILON 0.01  // Intensities below this are cleared
#define PHEROMONE_MAX 100.0
#define DEPOSIT_AMOUNT 10.0
#define TRAIL_FADE 0.995  // Trail strength multiplier per deposit

// Motion configuration
#define ANT_SPEED 2.0
#define TIME_STEP 0.45
#define HEADING_NOISE 0.3  // Stddev of the heading perturbation (radians)
#define SENSE_RADIUS 8.0
#define FOOD_SENSE_RADIUS 20.0
#define PICKUP_RADIUS 6.0
#define BOREDOM_CHANCE 0.01
#define BOREDOM_MAX 15

// Steering weights
#define INERTIA_WEIGHT 1.0
#define PHEROMONE_WEIGHT 1.5
#define GOAL_WEIGHT 2.0
#define HOME_WEIGHT 1.0
#define SEPARATION_WEIGHT 2.0

// Collision configuration
#define MIN_SEPARATION 4.0
#define COLLISION_DAMPING 0.5  // Fraction of displacement kept per damping
#define RESOLUTION_PASSES 4

// Ant modes
enum class AntMode : int {
    SEARCHING = 0,  // Looking for food
    RETURNING = 1   // Returning to home with food
};

// Pheromone channels
enum class PheromoneChannel : int {
    TO_HOME = 0,    // Laid by searching ants, followed home
    FOOD_TRAIL = 1  // Laid by returning ants, followed to food
};

constexpr int NUM_CHANNELS = 2;

// Channel each mode follows and lays
struct ModeParams {
    PheromoneChannel follows;
    PheromoneChannel deposits;
};

inline ModeParams mode_params(AntMode mode) {
    if (mode == AntMode::RETURNING) {
        return {PheromoneChannel::TO_HOME, PheromoneChannel::FOOD_TRAIL};
    }
    return {PheromoneChannel::FOOD_TRAIL, PheromoneChannel::TO_HOME};
}

inline const char* mode_name(AntMode mode) {
    return mode == AntMode::RETURNING ? "returning" : "searching";
}

// Raised for invalid simulation parameters; never clamped silently
class ConfigurationError : public std::invalid_argument {
   public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

struct SimConfig {
    int population = NUM_ANTS;
    double width = PLANE_WIDTH;
    double height = PLANE_HEIGHT;
    double cell_size = CELL_SIZE;

    double decay_factor = PHEROMONE_DECAY;
    double intensity_epsilon = PHEROMONE_EPSILON;
    double max_intensity = PHEROMONE_MAX;
    double deposit_amount = DEPOSIT_AMOUNT;
    double trail_fade = TRAIL_FADE;

    double min_separation = MIN_SEPARATION;
    double collision_damping = COLLISION_DAMPING;
    int resolution_passes = RESOLUTION_PASSES;

    uint32_t seed = DEFAULT_SEED;
    Vec2 home{HOME_X, HOME_Y};
    double home_radius = HOME_RADIUS;

    double speed = ANT_SPEED;
    double time_step = TIME_STEP;
    double heading_noise = HEADING_NOISE;
    double sense_radius = SENSE_RADIUS;
    double food_sense_radius = FOOD_SENSE_RADIUS;
    double pickup_radius = PICKUP_RADIUS;
    double boredom_chance = BOREDOM_CHANCE;
    int boredom_max = BOREDOM_MAX;

    double inertia_weight = INERTIA_WEIGHT;
    double pheromone_weight = PHEROMONE_WEIGHT;
    double goal_weight = GOAL_WEIGHT;
    double home_weight = HOME_WEIGHT;
    double separation_weight = SEPARATION_WEIGHT;

    int num_threads = 0;  // 0 = OpenMP default

    // Explicit start positions; empty = ring spawn around home
    std::vector<Vec2> spawn_positions;

    bool contains(const Vec2& p) const {
        return p.x >= 0.0 && p.x <= width && p.y >= 0.0 && p.y <= height;
    }
};

// Throws ConfigurationError naming the first invalid field
void validate_config(const SimConfig& config);
