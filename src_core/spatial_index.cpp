#include "spatial_index.hpp"

#include <algorithm>
#include <cmath>

SpatialIndex::SpatialIndex(double width, double height, double bucket_size)
    : bucket_size_(bucket_size > 0.0 ? bucket_size : 1.0) {
    cols_ = std::max(1, static_cast<int>(std::ceil(width / bucket_size_)));
    rows_ = std::max(1, static_cast<int>(std::ceil(height / bucket_size_)));
    bucket_start_.assign(static_cast<size_t>(cols_) * rows_ + 1, 0);
}

int SpatialIndex::bucket_col(double x) const {
    double c = std::floor(x / bucket_size_);
    return static_cast<int>(std::max(0.0, std::min(static_cast<double>(cols_ - 1), c)));
}

int SpatialIndex::bucket_row(double y) const {
    double r = std::floor(y / bucket_size_);
    return static_cast<int>(std::max(0.0, std::min(static_cast<double>(rows_ - 1), r)));
}

void SpatialIndex::rebuild(const std::vector<Vec2>& positions) {
    positions_ = positions;
    const int n = static_cast<int>(positions_.size());
    const size_t buckets = static_cast<size_t>(cols_) * rows_;

    // Counting sort by bucket; ids stay ascending within each bucket
    std::vector<int> bucket_of(n);
    bucket_start_.assign(buckets + 1, 0);
    for (int i = 0; i < n; i++) {
        int b = bucket_row(positions_[i].y) * cols_ + bucket_col(positions_[i].x);
        bucket_of[i] = b;
        bucket_start_[b + 1]++;
    }
    for (size_t b = 0; b < buckets; b++) {
        bucket_start_[b + 1] += bucket_start_[b];
    }

    entries_.assign(n, -1);
    std::vector<int> fill(bucket_start_.begin(), bucket_start_.end() - 1);
    for (int i = 0; i < n; i++) {
        entries_[fill[bucket_of[i]]++] = i;
    }
}

std::vector<int> SpatialIndex::neighbors_within(const Vec2& position, double radius, int exclude_id) const {
    std::vector<int> result;
    if (radius < 0.0 || positions_.empty())
        return result;

    const double r2 = radius * radius;
    const int c0 = bucket_col(position.x - radius);
    const int c1 = bucket_col(position.x + radius);
    const int r0 = bucket_row(position.y - radius);
    const int r1 = bucket_row(position.y + radius);

    for (int r = r0; r <= r1; r++) {
        for (int c = c0; c <= c1; c++) {
            int b = r * cols_ + c;
            for (int k = bucket_start_[b]; k < bucket_start_[b + 1]; k++) {
                int id = entries_[k];
                if (id == exclude_id)
                    continue;
                if (distance_squared(positions_[id], position) <= r2) {
                    result.push_back(id);
                }
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

int SpatialIndex::nearest_within(const Vec2& position, double radius, int exclude_id) const {
    int best = -1;
    double best_d2 = 0.0;
    for (int id : neighbors_within(position, radius, exclude_id)) {
        double d2 = distance_squared(positions_[id], position);
        // Ascending ids, so strict comparison keeps the lower id on ties
        if (best == -1 || d2 < best_d2) {
            best = id;
            best_d2 = d2;
        }
    }
    return best;
}
