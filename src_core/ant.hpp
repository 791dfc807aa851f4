#pragma once

#include <vector>

#include "config.hpp"
#include "food_registry.hpp"
#include "pheromone_field.hpp"
#include "spatial_index.hpp"
#include "types.hpp"

// Move an ant wants to make this step, not yet committed
struct ProposedMove {
    Vec2 position;
    double heading = 0.0;
    int target_food = -1;
    int bored = 0;
};

// Everything an ant senses while proposing a move. Read-only for the whole
// proposal phase; the index holds the committed positions of this step.
struct AntContext {
    const SimConfig& config;
    const PheromoneField& field;
    const SpatialIndex& index;
    const FoodRegistry& food;
};

// Heading = inertia + Gaussian noise + pheromone gradient + goal attraction +
// neighbor repulsion; position advanced by speed * dt and reflected at walls.
ProposedMove propose_move(const Ant& ant, const AntContext& ctx, double dt, RNG& rng);

// Push away from neighbors closer than min_separation, stronger when closer
Vec2 separation_vector(const Ant& ant, const SpatialIndex& index, double min_separation);

// Mirror a position that left [0,width]x[0,height] back inside, inverting the
// velocity component that crossed the wall
void reflect_into_plane(Vec2& position, Vec2& velocity, double width, double height);

// Mode transitions
void start_returning(Ant& ant, const Vec2& home);
void start_searching(Ant& ant);

// Lay pheromone at the ant's position on its mode's channel and fade the trail
bool deposit_trail(Ant& ant, PheromoneField& field, const SimConfig& config);
