#include "food_registry.hpp"

#include <algorithm>
#include <cmath>

const char* place_status_name(PlaceStatus status) {
    switch (status) {
        case PlaceStatus::OK:
            return "ok";
        case PlaceStatus::OUT_OF_BOUNDS:
            return "out of bounds";
        case PlaceStatus::INVALID_QUANTITY:
            return "invalid quantity";
    }
    return "unknown";
}

PlaceFoodResult FoodRegistry::place(const Vec2& position, int quantity) {
    PlaceFoodResult result;
    if (!std::isfinite(position.x) || !std::isfinite(position.y) || position.x < 0.0 || position.x > width_ ||
        position.y < 0.0 || position.y > height_) {
        result.status = PlaceStatus::OUT_OF_BOUNDS;
        return result;
    }
    if (quantity <= 0) {
        result.status = PlaceStatus::INVALID_QUANTITY;
        return result;
    }

    FoodSource food;
    food.id = next_id_++;
    food.position = position;
    food.quantity = quantity;
    food.initial_quantity = quantity;
    sources_[food.id] = food;

    result.food_id = food.id;
    return result;
}

int FoodRegistry::consume(int food_id, int amount) {
    auto it = sources_.find(food_id);
    if (it == sources_.end() || amount <= 0)
        return 0;

    int taken = std::min(amount, it->second.quantity);
    it->second.quantity -= taken;
    if (it->second.quantity <= 0) {
        sources_.erase(it);
    }
    return taken;
}

bool FoodRegistry::remove(int food_id) {
    return sources_.erase(food_id) != 0;
}

int FoodRegistry::nearest_within(const Vec2& position, double radius) const {
    int best = -1;
    if (radius < 0.0)
        return best;
    double best_d2 = radius * radius;
    for (const auto& entry : sources_) {
        const FoodSource& food = entry.second;
        if (food.quantity <= 0)
            continue;
        double d2 = distance_squared(food.position, position);
        // Map order is ascending id, strict comparison keeps the lower id on ties
        if (d2 < best_d2 || (best == -1 && d2 <= best_d2)) {
            best = food.id;
            best_d2 = d2;
        }
    }
    return best;
}

const FoodSource* FoodRegistry::find(int food_id) const {
    auto it = sources_.find(food_id);
    if (it == sources_.end())
        return nullptr;
    return &it->second;
}

int64_t FoodRegistry::total_quantity() const {
    int64_t total = 0;
    for (const auto& entry : sources_) {
        total += entry.second.quantity;
    }
    return total;
}

void FoodRegistry::clear() {
    sources_.clear();
    next_id_ = 0;
}
