#include "ant.hpp"

#include <algorithm>
#include <cmath>

ProposedMove propose_move(const Ant& ant, const AntContext& ctx, double dt, RNG& rng) {
    const SimConfig& cfg = ctx.config;
    const ModeParams params = mode_params(ant.mode);

    ProposedMove move;
    move.target_food = ant.target_food;
    move.bored = ant.bored;

    // Occasionally lose interest in trails for a while
    if (cfg.boredom_max > 0 && rng.random_double() < cfg.boredom_chance) {
        move.bored += rng.random_int(0, cfg.boredom_max);
    }
    bool ignore_trails = move.bored > 0;
    if (move.bored > 0)
        move.bored--;

    double perturbed = ant.heading + rng.normal(0.0, cfg.heading_noise);
    Vec2 desired = heading_vector(perturbed) * cfg.inertia_weight;

    if (!ignore_trails) {
        desired += ctx.field.sample_gradient(ant.position, params.follows, cfg.sense_radius) * cfg.pheromone_weight;
    }

    if (ant.mode == AntMode::SEARCHING) {
        // A vanished target is left in place; the commit phase reports it
        const FoodSource* target = nullptr;
        if (move.target_food == -1) {
            move.target_food = ctx.food.nearest_within(ant.position, cfg.food_sense_radius);
        }
        if (move.target_food != -1)
            target = ctx.food.find(move.target_food);
        if (target) {
            desired += (target->position - ant.position).normalized() * cfg.goal_weight;
        }
    } else {
        desired += (cfg.home - ant.position).normalized() * cfg.home_weight;
    }

    desired += separation_vector(ant, ctx.index, cfg.min_separation) * cfg.separation_weight;

    double heading = perturbed;
    if (desired.length_squared() > 1e-24) {
        heading = std::atan2(desired.y, desired.x);
    }

    Vec2 velocity = heading_vector(heading) * (cfg.speed * dt);
    Vec2 next = ant.position + velocity;
    reflect_into_plane(next, velocity, cfg.width, cfg.height);

    move.position = next;
    move.heading = wrap_angle(std::atan2(velocity.y, velocity.x));
    return move;
}

Vec2 separation_vector(const Ant& ant, const SpatialIndex& index, double min_separation) {
    Vec2 push(0.0, 0.0);
    if (min_separation <= 0.0)
        return push;

    for (int other : index.neighbors_within(ant.position, min_separation, ant.id)) {
        Vec2 away = ant.position - index.position(other);
        double d = away.length();
        if (d >= min_separation)
            continue;
        // Coincident ants back away along their own reversed heading
        Vec2 dir = d > 0.0 ? away * (1.0 / d) : heading_vector(ant.heading + M_PI);
        push += dir * (1.0 - d / min_separation);
    }
    return push;
}

void reflect_into_plane(Vec2& position, Vec2& velocity, double width, double height) {
    if (position.x < 0.0) {
        position.x = -position.x;
        velocity.x = -velocity.x;
    } else if (position.x > width) {
        position.x = 2.0 * width - position.x;
        velocity.x = -velocity.x;
    }
    if (position.y < 0.0) {
        position.y = -position.y;
        velocity.y = -velocity.y;
    } else if (position.y > height) {
        position.y = 2.0 * height - position.y;
        velocity.y = -velocity.y;
    }

    // A step longer than the plane can still overshoot after one mirror
    position.x = std::max(0.0, std::min(width, position.x));
    position.y = std::max(0.0, std::min(height, position.y));
}

void start_returning(Ant& ant, const Vec2& home) {
    ant.mode = AntMode::RETURNING;
    ant.has_food = true;
    ant.target_food = -1;
    ant.trail_strength = 1.0;
    Vec2 to_home = home - ant.position;
    if (to_home.length_squared() > 0.0) {
        ant.heading = wrap_angle(std::atan2(to_home.y, to_home.x));
    } else {
        ant.heading = wrap_angle(ant.heading + M_PI);
    }
}

void start_searching(Ant& ant) {
    ant.mode = AntMode::SEARCHING;
    ant.has_food = false;
    ant.target_food = -1;
    ant.trail_strength = 1.0;
    ant.heading = wrap_angle(ant.heading + M_PI);
}

bool deposit_trail(Ant& ant, PheromoneField& field, const SimConfig& config) {
    const ModeParams params = mode_params(ant.mode);
    bool placed = field.deposit(ant.position, params.deposits, config.deposit_amount * ant.trail_strength);
    ant.trail_strength *= config.trail_fade;
    return placed;
}
