#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "types.hpp"

enum class PlaceStatus : int {
    OK = 0,
    OUT_OF_BOUNDS = 1,    // Position outside the plane, nothing placed
    INVALID_QUANTITY = 2  // Quantity <= 0, nothing placed
};

struct PlaceFoodResult {
    PlaceStatus status = PlaceStatus::OK;
    int food_id = -1;

    bool ok() const { return status == PlaceStatus::OK; }
};

const char* place_status_name(PlaceStatus status);

// Active food sources keyed by id. Ids are never reused; a source is
// removed as soon as its quantity reaches zero.
class FoodRegistry {
   public:
    FoodRegistry() = default;
    FoodRegistry(double width, double height) : width_(width), height_(height) {}

    PlaceFoodResult place(const Vec2& position, int quantity);

    // Returns the units actually taken; 0 if the source is gone
    int consume(int food_id, int amount);

    bool remove(int food_id);

    // Closest source with quantity > 0 within radius, lower id on ties; -1 if none
    int nearest_within(const Vec2& position, double radius) const;

    bool contains(int food_id) const { return sources_.count(food_id) != 0; }
    const FoodSource* find(int food_id) const;
    size_t size() const { return sources_.size(); }
    bool empty() const { return sources_.empty(); }
    int64_t total_quantity() const;
    void clear();

    const std::map<int, FoodSource>& all() const { return sources_; }

   private:
    double width_ = 0.0;
    double height_ = 0.0;
    int next_id_ = 0;
    std::map<int, FoodSource> sources_;
};
