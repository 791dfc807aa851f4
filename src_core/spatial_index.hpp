#pragma once

#include <vector>

#include "vec2.hpp"

// Uniform grid of buckets over the plane, rebuilt from scratch each step.
// Agent ids are the indices of the positions passed to rebuild().
class SpatialIndex {
   public:
    SpatialIndex() = default;
    SpatialIndex(double width, double height, double bucket_size);

    void rebuild(const std::vector<Vec2>& positions);

    // Ids within radius (inclusive) in ascending order, skipping exclude_id
    std::vector<int> neighbors_within(const Vec2& position, double radius, int exclude_id = -1) const;

    // Closest id within radius, lower id on ties; -1 if none
    int nearest_within(const Vec2& position, double radius, int exclude_id = -1) const;

    size_t size() const { return positions_.size(); }
    const Vec2& position(int id) const { return positions_[id]; }

   private:
    int bucket_col(double x) const;
    int bucket_row(double y) const;

    double bucket_size_ = 1.0;
    int cols_ = 1;
    int rows_ = 1;

    std::vector<Vec2> positions_;
    std::vector<int> bucket_start_;  // cols*rows + 1 offsets into entries_
    std::vector<int> entries_;       // Ids sorted by bucket, ascending within a bucket
};
