#include "colony.hpp"

#include <omp.h>

#include <algorithm>
#include <cmath>

ColonySimulation::ColonySimulation(const SimConfig& config) : config_(config) {
    validate_config(config_);
    threads_ = config_.num_threads > 0 ? config_.num_threads : omp_get_max_threads();
    initialize();
}

void ColonySimulation::initialize() {
    rng_ = RNG(config_.seed);
    dt_ = config_.time_step;
    stats_ = SimStats();

    field_ = PheromoneField(config_.width, config_.height, config_.cell_size, config_.decay_factor,
                            config_.intensity_epsilon, config_.max_intensity);

    double bucket = std::max(config_.min_separation, config_.cell_size);
    index_ = SpatialIndex(config_.width, config_.height, bucket);
    proposal_index_ = SpatialIndex(config_.width, config_.height, bucket);

    food_ = FoodRegistry(config_.width, config_.height);

    spawn_ants();
    proposals_.assign(ants_.size(), ProposedMove());
    ant_seeds_.assign(ants_.size(), 0);
}

void ColonySimulation::reset() {
    initialize();
}

// Spawn ants on square rings around home, one lattice point per ant
void ColonySimulation::spawn_ants() {
    ants_.clear();
    ants_.reserve(config_.population);

    if (!config_.spawn_positions.empty()) {
        for (int i = 0; i < config_.population; i++) {
            ants_.emplace_back(i, config_.spawn_positions[i], rng_.random_double(0, TWO_PI));
        }
        return;
    }

    const double spacing = std::max(config_.min_separation, 1.0);
    const int max_ring = static_cast<int>(std::ceil(std::max(config_.width, config_.height) / spacing)) + 1;

    int ant_idx = 0;
    for (int ring = 1; ant_idx < config_.population && ring <= max_ring; ring++) {
        for (int dx = -ring; dx <= ring && ant_idx < config_.population; dx++) {
            for (int dy = -ring; dy <= ring && ant_idx < config_.population; dy++) {
                if (std::abs(dx) != ring && std::abs(dy) != ring)
                    continue;

                Vec2 p(config_.home.x + dx * spacing, config_.home.y + dy * spacing);
                if (!config_.contains(p))
                    continue;

                ants_.emplace_back(ant_idx, p, rng_.random_double(0, TWO_PI));
                ant_idx++;
            }
        }
    }

    if (ant_idx < config_.population) {
        throw ConfigurationError("invalid configuration: population does not fit on the plane at min_separation");
    }
}

bool ColonySimulation::set_time_step(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0)
        return false;
    dt_ = dt;
    return true;
}

PlaceFoodResult ColonySimulation::place_food(const Vec2& position, int quantity) {
    PlaceFoodResult result = food_.place(position, quantity);
    if (result.status == PlaceStatus::OUT_OF_BOUNDS) {
        stats_.rejected_placements++;
    } else if (result.ok()) {
        stats_.food_placed += quantity;
    }
    return result;
}

bool ColonySimulation::remove_food(int food_id) {
    const FoodSource* source = food_.find(food_id);
    if (!source)
        return false;
    stats_.food_removed += source->quantity;
    return food_.remove(food_id);
}

void ColonySimulation::advance(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0)
        return;

    field_.decay_step(threads_);

    std::vector<Vec2> previous(ants_.size());
    for (size_t i = 0; i < ants_.size(); i++) {
        previous[i] = ants_[i].position;
    }
    index_.rebuild(previous);

    propose_moves(dt);

    std::vector<Vec2> targets(ants_.size());
    for (size_t i = 0; i < ants_.size(); i++) {
        targets[i] = proposals_[i].position;
    }
    resolve_collisions(previous, targets);

    commit(targets);

    stats_.steps++;
    stats_.sim_time += dt;
}

void ColonySimulation::propose_moves(double dt) {
    const int n = static_cast<int>(ants_.size());

    // Seeds are drawn in id order so results do not depend on scheduling
    for (int i = 0; i < n; i++) {
        ant_seeds_[i] = rng_.next_seed();
    }

    const AntContext ctx{config_, field_, index_, food_};

#pragma omp parallel for schedule(static) num_threads(threads_)
    for (int i = 0; i < n; i++) {
        RNG ant_rng(ant_seeds_[i]);
        proposals_[i] = propose_move(ants_[i], ctx, dt, ant_rng);
    }
}

std::vector<std::pair<int, int>> ColonySimulation::colliding_pairs(const std::vector<Vec2>& previous,
                                                                   const std::vector<Vec2>& targets,
                                                                   bool approaching_only) {
    const double min_sep = config_.min_separation;
    const double min_sep2 = min_sep * min_sep;
    std::vector<std::pair<int, int>> pairs;

    proposal_index_.rebuild(targets);
    for (int i = 0; i < static_cast<int>(targets.size()); i++) {
        for (int j : proposal_index_.neighbors_within(targets[i], min_sep, i)) {
            if (j <= i)
                continue;
            double d2 = distance_squared(targets[i], targets[j]);
            if (d2 >= min_sep2)
                continue;
            if (approaching_only && d2 >= distance_squared(previous[i], previous[j]))
                continue;
            pairs.emplace_back(i, j);
        }
    }
    return pairs;
}

// Cheap steering correction, not rigid-body physics. Colliding pairs have
// both displacements scaled by collision_damping; pairs still closing in
// after the settling passes are sent back to their pre-step positions. After
// this no pair is closer than min(min_separation, its pre-step distance).
void ColonySimulation::resolve_collisions(const std::vector<Vec2>& previous, std::vector<Vec2>& targets) {
    if (config_.min_separation <= 0.0 || targets.size() < 2)
        return;

    const double keep = config_.collision_damping;
    auto damp = [&](int i) { targets[i] = previous[i] + (targets[i] - previous[i]) * keep; };

    std::vector<std::pair<int, int>> pairs = colliding_pairs(previous, targets, false);
    stats_.collisions_resolved += pairs.size();
    for (const auto& pair : pairs) {
        damp(pair.first);
        damp(pair.second);
    }

    for (int pass = 0; pass < config_.resolution_passes; pass++) {
        pairs = colliding_pairs(previous, targets, true);
        if (pairs.empty())
            break;
        for (const auto& pair : pairs) {
            damp(pair.first);
            damp(pair.second);
        }
    }

    // Every round reverts at least one more ant, so this terminates
    while (true) {
        pairs = colliding_pairs(previous, targets, true);
        if (pairs.empty())
            break;
        for (const auto& pair : pairs) {
            targets[pair.first] = previous[pair.first];
            targets[pair.second] = previous[pair.second];
        }
    }
}

void ColonySimulation::commit(const std::vector<Vec2>& targets) {
    for (size_t i = 0; i < ants_.size(); i++) {
        Ant& ant = ants_[i];
        const ProposedMove& move = proposals_[i];
        ant.position = targets[i];
        ant.heading = move.heading;
        ant.target_food = move.target_food;
        ant.bored = move.bored;
    }

    for (Ant& ant : ants_) {
        deposit_trail(ant, field_, config_);

        // Target consumed by someone else since it was chosen
        if (ant.target_food != -1 && !food_.contains(ant.target_food)) {
            ant.target_food = -1;
            stats_.depleted_targets++;
        }

        if (ant.mode == AntMode::SEARCHING) {
            int food_id = food_.nearest_within(ant.position, config_.pickup_radius);
            if (food_id != -1 && food_.consume(food_id, 1) == 1) {
                start_returning(ant, config_.home);
                stats_.food_picked_up++;
            }
        } else if (distance(ant.position, config_.home) <= config_.home_radius) {
            start_searching(ant);
            stats_.food_delivered++;
        }
    }
}

bool ColonySimulation::is_complete() const {
    if (stats_.food_placed == 0 || !food_.empty())
        return false;
    for (const Ant& ant : ants_) {
        if (ant.has_food)
            return false;
    }
    return true;
}

ColonySnapshot ColonySimulation::snapshot() const {
    ColonySnapshot snap;
    snap.width = config_.width;
    snap.height = config_.height;
    snap.home = config_.home;
    snap.home_radius = config_.home_radius;
    snap.dt = dt_;
    snap.stats = stats_;

    snap.ants.reserve(ants_.size());
    for (const Ant& ant : ants_) {
        AntView view;
        view.id = ant.id;
        view.position = ant.position;
        view.heading = ant.heading;
        view.mode = ant.mode;
        view.carrying_food = ant.has_food;
        view.target_food = ant.target_food;
        snap.ants.push_back(view);
    }

    for (const auto& entry : food_.all()) {
        const FoodSource& source = entry.second;
        FoodView view;
        view.id = source.id;
        view.position = source.position;
        view.quantity = source.quantity;
        view.initial_quantity = source.initial_quantity;
        snap.food.push_back(view);
    }

    snap.field.cols = field_.cols();
    snap.field.rows = field_.rows();
    snap.field.cell_size = field_.cell_size();
    snap.field.to_home = field_.channel_data(PheromoneChannel::TO_HOME);
    snap.field.food_trail = field_.channel_data(PheromoneChannel::FOOD_TRAIL);
    return snap;
}
