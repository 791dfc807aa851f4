// Colony simulation: configuration checks, step semantics, determinism,
// collisions and the food pickup / delivery cycle.

#include <algorithm>
#include <climits>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "colony.hpp"
#include "test_helpers.hpp"

void expect_config_error(const SimConfig& config, const std::string& field) {
    bool thrown = false;
    try {
        ColonySimulation sim(config);
    } catch (const ConfigurationError& e) {
        thrown = std::string(e.what()).find(field) != std::string::npos;
    }
    check(thrown, "ConfigurationError naming " + field);
}

void test_invalid_config_rejected() {
    SimConfig c;
    c.population = 0;
    expect_config_error(c, "population");

    c = SimConfig();
    c.decay_factor = 1.0;
    expect_config_error(c, "decay_factor");
    c.decay_factor = 0.0;
    expect_config_error(c, "decay_factor");

    c = SimConfig();
    c.cell_size = 0.0;
    expect_config_error(c, "cell_size");

    c = SimConfig();
    c.min_separation = -1.0;
    expect_config_error(c, "min_separation");

    c = SimConfig();
    c.collision_damping = 1.0;
    expect_config_error(c, "collision_damping");

    c = SimConfig();
    c.home = Vec2(700.0, 10.0);
    expect_config_error(c, "home");

    c = SimConfig();
    c.population = 2;
    c.spawn_positions = {Vec2(10, 10)};
    expect_config_error(c, "spawn_positions");

    c = SimConfig();
    c.width = 20.0;
    c.height = 20.0;
    c.home = Vec2(10.0, 10.0);
    c.population = 100;
    expect_config_error(c, "population");

    ColonySimulation ok{SimConfig()};
    check(static_cast<int>(ok.snapshot().ants.size()) == NUM_ANTS, "default config spawns every ant");
    passed("invalid configuration rejected");
}

void test_spawn_around_home() {
    SimConfig config;
    ColonySimulation sim(config);
    ColonySnapshot snap = sim.snapshot();
    for (size_t i = 0; i < snap.ants.size(); i++) {
        const AntView& a = snap.ants[i];
        check(a.id == static_cast<int>(i), "ids follow spawn order");
        check(a.mode == AntMode::SEARCHING && !a.carrying_food, "ants start searching");
        check(distance(a.position, config.home) <= 30.0 * config.min_separation, "ants start near home");
        for (size_t j = i + 1; j < snap.ants.size(); j++) {
            check(distance(a.position, snap.ants[j].position) >= config.min_separation,
                  "spawn positions respect min separation");
        }
    }
    passed("spawn around home");
}

void test_same_seed_same_run() {
    SimConfig config;
    config.num_threads = 1;
    ColonySimulation single(config);
    config.num_threads = 4;
    ColonySimulation multi(config);
    ColonySimulation again(config);

    for (ColonySimulation* sim : {&single, &multi, &again}) {
        sim->place_food(Vec2(400, 300), 20);
        sim->place_food(Vec2(320, 200), 20);
    }

    for (int step = 0; step < 200; step++) {
        single.step();
        multi.step();
        again.step();
    }
    check(multi.snapshot() == again.snapshot(), "same seed, same snapshots");
    check(single.snapshot() == multi.snapshot(), "thread count does not change the result");
    passed("deterministic with respect to seed and thread count");
}

void test_different_seeds_differ() {
    SimConfig a;
    SimConfig b;
    b.seed = a.seed + 1;
    ColonySimulation sa(a);
    ColonySimulation sb(b);
    for (int step = 0; step < 10; step++) {
        sa.step();
        sb.step();
    }
    check(sa.snapshot() != sb.snapshot(), "different seeds diverge");
    passed("different seeds");
}

void test_bounds_and_separation() {
    SimConfig config;
    ColonySimulation sim(config);
    sim.place_food(Vec2(320, 215), 50);
    sim.set_time_step(2.0);

    for (int step = 0; step < 300; step++) {
        sim.step();
        ColonySnapshot snap = sim.snapshot();
        for (size_t i = 0; i < snap.ants.size(); i++) {
            const AntView& a = snap.ants[i];
            check(a.position.x >= 0.0 && a.position.x <= config.width && a.position.y >= 0.0 &&
                      a.position.y <= config.height,
                  "ants stay inside the plane");
            check(a.heading >= 0.0 && a.heading < TWO_PI, "heading in [0, 2pi)");
            for (size_t j = i + 1; j < snap.ants.size(); j++) {
                check(distance(a.position, snap.ants[j].position) >= config.min_separation - 1e-9,
                      "committed ants keep min separation");
            }
        }
    }
    passed("bounds and separation");
}

void test_single_ant_lays_fading_trail() {
    SimConfig config;
    config.population = 1;
    config.decay_factor = 0.99;
    ColonySimulation sim(config);

    for (int step = 0; step < 100; step++) {
        sim.step();
    }
    ColonySnapshot before = sim.snapshot();
    const AntView& ant = before.ants[0];
    check(ant.mode == AntMode::SEARCHING, "no food means the ant keeps searching");
    check(config.contains(ant.position), "ant inside the plane");

    int marked = 0;
    for (double v : before.field.to_home) {
        if (v > 0.0)
            marked++;
    }
    check(marked > 0, "searching ant marks its path");

    sim.step();
    ColonySnapshot after = sim.snapshot();
    const Vec2 p = after.ants[0].position;
    int col = std::min(static_cast<int>(p.x / after.field.cell_size), after.field.cols - 1);
    int row = std::min(static_cast<int>(p.y / after.field.cell_size), after.field.rows - 1);
    size_t current = static_cast<size_t>(row) * after.field.cols + col;

    for (size_t i = 0; i < before.field.to_home.size(); i++) {
        if (i == current || before.field.to_home[i] <= 0.0)
            continue;
        check(after.field.to_home[i] < before.field.to_home[i], "old path cells fade");
    }
    passed("single ant lays a fading trail");
}

void test_close_pair_is_damped() {
    SimConfig config;
    config.population = 2;
    config.spawn_positions = {Vec2(100, 100), Vec2(101, 100)};
    config.speed = 1.0;
    ColonySimulation sim(config);

    sim.advance(1.0);
    ColonySnapshot snap = sim.snapshot();
    check(distance(snap.ants[0].position, Vec2(100, 100)) < 1.0, "first ant's displacement damped");
    check(distance(snap.ants[1].position, Vec2(101, 100)) < 1.0, "second ant's displacement damped");
    check(snap.stats.collisions_resolved >= 1, "collision counted");
    passed("close pair is damped");
}

void test_pickup_and_delivery() {
    SimConfig config;
    config.population = 8;
    ColonySimulation sim(config);

    PlaceFoodResult placed = sim.place_food(config.home + Vec2(8.0, 0.0), 1);
    check(placed.ok(), "food near home placed");
    check(!sim.is_complete(), "not complete while food remains");

    sim.step();
    ColonySnapshot snap = sim.snapshot();
    check(snap.food.empty(), "single unit consumed and source removed");
    check(snap.stats.food_picked_up == 1, "pickup counted");
    int returning = 0;
    for (const AntView& a : snap.ants) {
        if (a.mode == AntMode::RETURNING) {
            returning++;
            check(a.carrying_food && a.target_food == -1, "carrier holds food and no target");
        }
    }
    check(returning == 1, "exactly one ant carries the unit");
    check(!sim.is_complete(), "not complete while an ant carries food");

    sim.step();
    snap = sim.snapshot();
    check(snap.stats.food_delivered == 1, "carrier inside the nest delivers");
    for (const AntView& a : snap.ants) {
        check(a.mode == AntMode::SEARCHING && !a.carrying_food, "carrier back to searching");
    }
    check(sim.is_complete(), "complete once everything is delivered");
    passed("pickup and delivery");
}

void test_depleted_target_reported() {
    SimConfig config;
    config.population = 2;
    config.spawn_positions = {Vec2(100, 100), Vec2(130, 100)};
    config.heading_noise = 0.0;
    config.boredom_chance = 0.0;
    ColonySimulation sim(config);
    sim.place_food(Vec2(115, 100), 1);

    sim.step();
    ColonySnapshot snap = sim.snapshot();
    check(snap.ants[0].target_food == 0 && snap.ants[1].target_food == 0, "both ants target the food");

    for (int step = 0; step < 500 && sim.stats().food_picked_up == 0; step++) {
        sim.step();
    }
    check(sim.stats().food_picked_up == 1, "one ant picks the unit up");
    sim.step();
    check(sim.stats().depleted_targets == 1, "the other ant's target is reported gone");
    snap = sim.snapshot();
    for (const AntView& a : snap.ants) {
        check(a.target_food == -1, "no ant keeps a dangling target");
    }
    passed("depleted target reported");
}

void test_remove_food() {
    SimConfig config;
    config.population = 2;
    config.spawn_positions = {Vec2(100, 100), Vec2(130, 100)};
    ColonySimulation sim(config);
    int id = sim.place_food(Vec2(115, 100), 5).food_id;

    sim.step();
    ColonySnapshot snap = sim.snapshot();
    check(snap.ants[0].target_food == id && snap.ants[1].target_food == id, "both ants target the food");

    check(sim.remove_food(id), "existing source removed");
    check(!sim.remove_food(id), "second removal reports missing");
    check(!sim.remove_food(99), "unknown id reports missing");
    check(sim.stats().food_removed == 5, "remaining units counted as removed");
    check(sim.snapshot().food.empty(), "source gone from the snapshot");

    sim.step();
    check(sim.stats().depleted_targets == 2, "both ants report the vanished target");
    for (const AntView& a : sim.snapshot().ants) {
        check(a.target_food == -1 && a.mode == AntMode::SEARCHING, "ants keep searching without a target");
    }
    check(sim.is_complete(), "nothing left to deliver");
    passed("remove food");
}

void test_large_food_totals() {
    SimConfig config;
    config.population = 20;
    ColonySimulation sim(config);
    check(sim.place_food(Vec2(10, 10), INT_MAX).ok(), "first large source placed");
    check(sim.place_food(Vec2(20, 10), INT_MAX).ok(), "second large source placed");

    const int64_t expected = 2 * static_cast<int64_t>(INT_MAX);
    check(sim.stats().food_placed == expected, "placed total does not wrap");
    check(!sim.is_complete(), "large sources are not complete");

    for (int step = 0; step < 20; step++) {
        sim.step();
    }
    int64_t remaining = 0;
    for (const FoodView& f : sim.snapshot().food) {
        remaining += f.quantity;
    }
    const SimStats& s = sim.stats();
    check(remaining + s.food_picked_up + s.food_removed == s.food_placed, "large totals still balance");
    passed("large food totals");
}

void test_out_of_bounds_food() {
    ColonySimulation sim{SimConfig()};
    sim.place_food(Vec2(10, 10), 3);
    ColonySnapshot before = sim.snapshot();

    PlaceFoodResult r = sim.place_food(Vec2(-5, 10), 3);
    check(r.status == PlaceStatus::OUT_OF_BOUNDS, "outside placement rejected");
    ColonySnapshot after = sim.snapshot();
    check(after.food == before.food, "registry unchanged");
    check(after.stats.rejected_placements == 1, "rejection counted");
    check(after.stats.food_placed == 3, "placed total unchanged");

    check(sim.place_food(Vec2(10, 10), 0).status == PlaceStatus::INVALID_QUANTITY, "zero quantity rejected");
    passed("out-of-bounds food");
}

void test_invalid_time_step() {
    ColonySimulation sim{SimConfig()};
    ColonySnapshot before = sim.snapshot();
    sim.advance(0.0);
    sim.advance(-1.0);
    check(sim.snapshot() == before, "non-positive dt is a no-op");

    check(!sim.set_time_step(0.0) && !sim.set_time_step(-0.5), "non-positive step rejected");
    check(sim.time_step() == TIME_STEP, "rejected step keeps the old one");
    check(sim.set_time_step(TIME_STEP * 1.1), "positive step accepted");

    sim.step();
    check(sim.stats().steps == 1, "step counted");
    check_near(sim.stats().sim_time, TIME_STEP * 1.1, 1e-12, "time advanced by dt");
    passed("time step");
}

void test_reset() {
    ColonySimulation sim{SimConfig()};
    ColonySnapshot initial = sim.snapshot();

    sim.place_food(Vec2(400, 300), 10);
    sim.set_time_step(1.0);
    for (int step = 0; step < 50; step++) {
        sim.step();
    }
    check(sim.snapshot() != initial, "simulation moved on");

    sim.reset();
    check(sim.snapshot() == initial, "reset restores the initial state");
    passed("reset");
}

void test_food_conservation() {
    SimConfig config;
    config.population = 60;
    ColonySimulation sim(config);
    sim.place_food(config.home + Vec2(25, 0), 15);
    sim.place_food(config.home + Vec2(0, -30), 15);

    std::map<int, int> last;
    for (const FoodView& f : sim.snapshot().food) {
        last[f.id] = f.quantity;
    }

    for (int step = 0; step < 1500; step++) {
        sim.step();
        ColonySnapshot snap = sim.snapshot();
        int64_t remaining = 0;
        for (const FoodView& f : snap.food) {
            check(f.quantity > 0, "present sources have food left");
            check(last.count(f.id) && f.quantity <= last[f.id], "food never grows");
            last[f.id] = f.quantity;
            remaining += f.quantity;
        }
        int carrying = 0;
        for (const AntView& a : snap.ants) {
            if (a.carrying_food)
                carrying++;
        }
        const SimStats& s = snap.stats;
        check(remaining + s.food_picked_up + s.food_removed == s.food_placed,
              "every unit is in a source, picked up or removed");
        check(s.food_picked_up == s.food_delivered + carrying, "picked-up units are carried or delivered");
    }
    passed("food conservation");
}

int main() {
    test_invalid_config_rejected();
    test_spawn_around_home();
    test_same_seed_same_run();
    test_different_seeds_differ();
    test_bounds_and_separation();
    test_single_ant_lays_fading_trail();
    test_close_pair_is_damped();
    test_pickup_and_delivery();
    test_depleted_target_reported();
    test_remove_food();
    test_large_food_totals();
    test_out_of_bounds_food();
    test_invalid_time_step();
    test_reset();
    test_food_conservation();
    std::cout << "All colony tests passed!" << std::endl;
    return 0;
}
