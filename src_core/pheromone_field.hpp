#pragma once

#include <vector>

#include "config.hpp"
#include "vec2.hpp"

// Discretized pheromone intensities covering the plane.
//
// Deposits go to the single cell containing the position (nearest-cell
// splat). Every channel of every cell decays geometrically per step and is
// cleared once it falls below epsilon, so intensities are never negative.
class PheromoneField {
   public:
    PheromoneField() = default;
    PheromoneField(double width, double height, double cell_size, double decay_factor, double epsilon,
                   double max_intensity);

    void decay_step(int num_threads = 0);

    // Returns false (no-op) when position is outside the plane
    bool deposit(const Vec2& position, PheromoneChannel channel, double amount);

    double sample(const Vec2& position, PheromoneChannel channel) const;

    // Direction toward higher intensity from a ring of 8 points at radius.
    // Zero vector when every sample is below epsilon.
    Vec2 sample_gradient(const Vec2& position, PheromoneChannel channel, double radius) const;

    double total(PheromoneChannel channel) const;
    double max_value(PheromoneChannel channel) const;
    void clear();

    int cols() const { return cols_; }
    int rows() const { return rows_; }
    double cell_size() const { return cell_size_; }

    bool in_bounds(const Vec2& p) const { return p.x >= 0.0 && p.x <= width_ && p.y >= 0.0 && p.y <= height_; }

    // Cell index for a position; -1 outside the plane
    int cell_index(const Vec2& p) const;
    double at(int col, int row, PheromoneChannel channel) const;
    const std::vector<double>& channel_data(PheromoneChannel channel) const;

   private:
    double width_ = 0.0;
    double height_ = 0.0;
    double cell_size_ = 1.0;
    double decay_factor_ = 0.0;
    double epsilon_ = 0.0;
    double max_intensity_ = 0.0;
    int cols_ = 0;
    int rows_ = 0;
    std::vector<double> channels_[NUM_CHANNELS];
};
