#include "pheromone_field.hpp"

#include <omp.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

// Direction offsets for the 8 ring samples
constexpr int DX[8] = {-1, 0, 1, -1, 1, -1, 0, 1};
constexpr int DY[8] = {-1, -1, -1, 0, 0, 1, 1, 1};

PheromoneField::PheromoneField(double width, double height, double cell_size, double decay_factor,
                               double epsilon, double max_intensity)
    : width_(width),
      height_(height),
      cell_size_(cell_size),
      decay_factor_(decay_factor),
      epsilon_(epsilon),
      max_intensity_(max_intensity) {
    cols_ = std::max(1, static_cast<int>(std::ceil(width / cell_size)));
    rows_ = std::max(1, static_cast<int>(std::ceil(height / cell_size)));
    for (auto& channel : channels_) {
        channel.assign(static_cast<size_t>(cols_) * rows_, 0.0);
    }
}

void PheromoneField::decay_step(int num_threads) {
    const int cells = cols_ * rows_;
    if (num_threads <= 0)
        num_threads = omp_get_max_threads();

    for (auto& channel : channels_) {
        double* data = channel.data();
#pragma omp parallel for schedule(static) num_threads(num_threads)
        for (int i = 0; i < cells; i++) {
            data[i] *= decay_factor_;
            if (data[i] < epsilon_) {
                data[i] = 0;
            }
        }
    }
}

bool PheromoneField::deposit(const Vec2& position, PheromoneChannel channel, double amount) {
    if (amount < 0.0 || std::isnan(amount)) {
        throw std::invalid_argument("pheromone deposit amount must be non-negative");
    }
    int idx = cell_index(position);
    if (idx < 0)
        return false;

    double& cell = channels_[static_cast<int>(channel)][idx];
    cell = std::min(max_intensity_, cell + amount);
    return true;
}

int PheromoneField::cell_index(const Vec2& p) const {
    if (!in_bounds(p))
        return -1;
    // The far edges belong to the last row/column
    int col = std::min(cols_ - 1, static_cast<int>(p.x / cell_size_));
    int row = std::min(rows_ - 1, static_cast<int>(p.y / cell_size_));
    return row * cols_ + col;
}

double PheromoneField::at(int col, int row, PheromoneChannel channel) const {
    if (col < 0 || row < 0 || col >= cols_ || row >= rows_)
        return 0.0;
    return channels_[static_cast<int>(channel)][static_cast<size_t>(row) * cols_ + col];
}

double PheromoneField::sample(const Vec2& position, PheromoneChannel channel) const {
    int idx = cell_index(position);
    if (idx < 0)
        return 0.0;
    return channels_[static_cast<int>(channel)][idx];
}

Vec2 PheromoneField::sample_gradient(const Vec2& position, PheromoneChannel channel, double radius) const {
    double sum_dx = 0.0;
    double sum_dy = 0.0;
    double total = 0.0;

    for (int d = 0; d < 8; d++) {
        Vec2 dir = Vec2(DX[d], DY[d]).normalized();
        double value = sample(position + dir * radius, channel);
        if (value < epsilon_ || value <= 0.0)
            continue;
        sum_dx += dir.x * value;
        sum_dy += dir.y * value;
        total += value;
    }

    if (total <= 0.0)
        return {0.0, 0.0};
    return {sum_dx / total, sum_dy / total};
}

double PheromoneField::total(PheromoneChannel channel) const {
    const auto& data = channels_[static_cast<int>(channel)];
    return std::accumulate(data.begin(), data.end(), 0.0);
}

double PheromoneField::max_value(PheromoneChannel channel) const {
    const auto& data = channels_[static_cast<int>(channel)];
    if (data.empty())
        return 0.0;
    return *std::max_element(data.begin(), data.end());
}

void PheromoneField::clear() {
    for (auto& channel : channels_) {
        std::fill(channel.begin(), channel.end(), 0.0);
    }
}

const std::vector<double>& PheromoneField::channel_data(PheromoneChannel channel) const {
    return channels_[static_cast<int>(channel)];
}
