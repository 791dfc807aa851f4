#include "config.hpp"

#include <cmath>
#include <sstream>

namespace {

void require(bool ok, const char* field, const char* rule) {
    if (!ok) {
        std::ostringstream msg;
        msg << "invalid configuration: " << field << " must be " << rule;
        throw ConfigurationError(msg.str());
    }
}

bool positive(double v) {
    return std::isfinite(v) && v > 0.0;
}

bool non_negative(double v) {
    return std::isfinite(v) && v >= 0.0;
}

}  // namespace

void validate_config(const SimConfig& config) {
    require(config.population > 0, "population", "> 0");
    require(positive(config.width), "width", "> 0");
    require(positive(config.height), "height", "> 0");
    require(positive(config.cell_size), "cell_size", "> 0");

    require(config.decay_factor > 0.0 && config.decay_factor < 1.0, "decay_factor", "in (0, 1)");
    require(non_negative(config.intensity_epsilon), "intensity_epsilon", ">= 0");
    require(positive(config.max_intensity), "max_intensity", "> 0");
    require(non_negative(config.deposit_amount), "deposit_amount", ">= 0");
    require(config.trail_fade > 0.0 && config.trail_fade <= 1.0, "trail_fade", "in (0, 1]");

    require(non_negative(config.min_separation), "min_separation", ">= 0");
    require(config.collision_damping >= 0.0 && config.collision_damping < 1.0,
            "collision_damping", "in [0, 1)");
    require(config.resolution_passes >= 0, "resolution_passes", ">= 0");

    require(std::isfinite(config.home.x) && std::isfinite(config.home.y) && config.contains(config.home),
            "home", "inside the plane");
    require(positive(config.home_radius), "home_radius", "> 0");

    require(positive(config.speed), "speed", "> 0");
    require(positive(config.time_step), "time_step", "> 0");
    require(non_negative(config.heading_noise), "heading_noise", ">= 0");
    require(positive(config.sense_radius), "sense_radius", "> 0");
    require(non_negative(config.food_sense_radius), "food_sense_radius", ">= 0");
    require(positive(config.pickup_radius), "pickup_radius", "> 0");
    require(config.boredom_chance >= 0.0 && config.boredom_chance <= 1.0, "boredom_chance", "in [0, 1]");
    require(config.boredom_max >= 0, "boredom_max", ">= 0");

    require(non_negative(config.inertia_weight), "inertia_weight", ">= 0");
    require(non_negative(config.pheromone_weight), "pheromone_weight", ">= 0");
    require(non_negative(config.goal_weight), "goal_weight", ">= 0");
    require(non_negative(config.home_weight), "home_weight", ">= 0");
    require(non_negative(config.separation_weight), "separation_weight", ">= 0");

    require(config.num_threads >= 0, "num_threads", ">= 0");

    if (!config.spawn_positions.empty()) {
        require(static_cast<int>(config.spawn_positions.size()) == config.population,
                "spawn_positions", "empty or one entry per ant");
        for (const Vec2& p : config.spawn_positions) {
            require(std::isfinite(p.x) && std::isfinite(p.y) && config.contains(p),
                    "spawn_positions", "inside the plane");
        }
    }
}
