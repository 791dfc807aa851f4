#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "ant.hpp"
#include "config.hpp"
#include "food_registry.hpp"
#include "pheromone_field.hpp"
#include "spatial_index.hpp"
#include "types.hpp"

// ============================================================================
// Snapshot - the only state a front end reads
// ============================================================================

struct AntView {
    int id = -1;
    Vec2 position;
    double heading = 0.0;
    AntMode mode = AntMode::SEARCHING;
    bool carrying_food = false;
    int target_food = -1;

    bool operator==(const AntView& o) const {
        return id == o.id && position == o.position && heading == o.heading && mode == o.mode &&
               carrying_food == o.carrying_food && target_food == o.target_food;
    }
};

struct FoodView {
    int id = -1;
    Vec2 position;
    int quantity = 0;
    int initial_quantity = 0;

    bool operator==(const FoodView& o) const {
        return id == o.id && position == o.position && quantity == o.quantity &&
               initial_quantity == o.initial_quantity;
    }
};

struct FieldView {
    int cols = 0;
    int rows = 0;
    double cell_size = 0.0;
    std::vector<double> to_home;
    std::vector<double> food_trail;

    double at(int col, int row, PheromoneChannel channel) const {
        const std::vector<double>& data = channel == PheromoneChannel::TO_HOME ? to_home : food_trail;
        return data[static_cast<size_t>(row) * cols + col];
    }

    bool operator==(const FieldView& o) const {
        return cols == o.cols && rows == o.rows && cell_size == o.cell_size && to_home == o.to_home &&
               food_trail == o.food_trail;
    }
};

struct ColonySnapshot {
    double width = 0.0;
    double height = 0.0;
    Vec2 home;
    double home_radius = 0.0;
    double dt = 0.0;
    SimStats stats;
    std::vector<AntView> ants;
    std::vector<FoodView> food;
    FieldView field;

    bool operator==(const ColonySnapshot& o) const {
        return width == o.width && height == o.height && home == o.home && home_radius == o.home_radius &&
               dt == o.dt && stats == o.stats && ants == o.ants && food == o.food && field == o.field;
    }
    bool operator!=(const ColonySnapshot& o) const { return !(*this == o); }
};

// ============================================================================
// Colony Simulation Controller
// ============================================================================

// Owns every entity and is their only mutator. One call to advance() runs
// one step:
//   1. decay the pheromone field
//   2. index committed positions, draw one seed per ant from the master RNG
//   3. propose moves for all ants in parallel (read-only phase)
//   4. resolve collisions between proposals in ant id order
//   5. commit, then deposit / pick up / drop off in ant id order
// Identical config and call sequence give identical snapshots regardless of
// the thread count.
class ColonySimulation {
   public:
    explicit ColonySimulation(const SimConfig& config = SimConfig());

    // One step of length dt; ignored unless dt is positive and finite
    void advance(double dt);
    void step() { advance(dt_); }

    bool set_time_step(double dt);
    double time_step() const { return dt_; }

    PlaceFoodResult place_food(const Vec2& position, int quantity);

    // Withdraw a source with whatever it still holds; ants aiming at it
    // drop the target on their next commit. False if the id is unknown.
    bool remove_food(int food_id);

    ColonySnapshot snapshot() const;

    // All placed food delivered and no ant still carrying
    bool is_complete() const;

    // Back to the freshly initialized state with the same seed
    void reset();

    const SimStats& stats() const { return stats_; }
    const SimConfig& config() const { return config_; }
    int num_threads() const { return threads_; }

   private:
    void initialize();
    void spawn_ants();
    void propose_moves(double dt);
    void resolve_collisions(const std::vector<Vec2>& previous, std::vector<Vec2>& targets);
    std::vector<std::pair<int, int>> colliding_pairs(const std::vector<Vec2>& previous,
                                                     const std::vector<Vec2>& targets, bool approaching_only);
    void commit(const std::vector<Vec2>& targets);

    SimConfig config_;
    int threads_ = 1;
    double dt_ = TIME_STEP;

    RNG rng_;
    PheromoneField field_;
    SpatialIndex index_;
    SpatialIndex proposal_index_;
    FoodRegistry food_;
    std::vector<Ant> ants_;
    std::vector<ProposedMove> proposals_;  // One slot per ant, written once per step
    std::vector<uint32_t> ant_seeds_;
    SimStats stats_;
};
