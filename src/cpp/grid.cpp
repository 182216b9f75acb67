/*
    Implementation of the unit-square grid partition
*/

#include "grid.h"
#include "config.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mnsig {

GridPartition::GridPartition(int k) : k_(k), step_(0.0) {
    if (k < 1) {
        throw std::invalid_argument("grid resolution must be >= 1, got " + std::to_string(k));
    }

    const double lo = 0.0 + MACHINE_EPS;
    const double hi = 1.0 - MACHINE_EPS;
    step_ = (hi - lo) / k;

    breaks_.resize(k + 1);
    for (int i = 0; i < k; ++i) {
        breaks_[i] = lo + i * step_;
    }
    breaks_[k] = hi;

    // Outer loop over u (columns), inner loop over v (rows)
    cells_.reserve(static_cast<std::size_t>(k) * k);
    for (int i = 0; i < k; ++i) {
        for (int j = 0; j < k; ++j) {
            const double u1 = breaks_[i];
            const double u2 = breaks_[i + 1];
            const double v1 = breaks_[j];
            const double v2 = breaks_[j + 1];

            GridCell cell;
            cell.u1v1 = Eigen::Vector2d(u1, v1);
            cell.u1v2 = Eigen::Vector2d(u1, v2);
            cell.u2v1 = Eigen::Vector2d(u2, v1);
            cell.u2v2 = Eigen::Vector2d(u2, v2);
            cells_.push_back(cell);
        }
    }
}

int GridPartition::axis_bucket(double x) const {
    // Also rejects NaN
    if (!(x >= breaks_.front() && x < breaks_.back())) {
        return -1;
    }

    int i = static_cast<int>(std::floor((x - breaks_.front()) / step_));
    i = std::max(0, std::min(k_ - 1, i));

    // Correct for rounding in the division so that breaks_[i] <= x < breaks_[i+1]
    while (i > 0 && x < breaks_[i]) {
        --i;
    }
    while (i < k_ - 1 && x >= breaks_[i + 1]) {
        ++i;
    }
    return i;
}

int GridPartition::locate(double u, double v) const {
    const int i = axis_bucket(u);
    const int j = axis_bucket(v);
    if (i < 0 || j < 0) {
        return -1;
    }
    return i * k_ + j;
}

std::shared_ptr<const GridPartition> GridPartition::shared(int k) {
    if (k > MAX_CACHED_RESOLUTION) {
        return std::make_shared<const GridPartition>(k);
    }

    static std::mutex mutex;
    static std::map<int, std::shared_ptr<const GridPartition>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(k);
    if (it != cache.end()) {
        return it->second;
    }
    auto grid = std::make_shared<const GridPartition>(k);
    cache.emplace(k, grid);
    return grid;
}

std::vector<GridCell> partition(int k) {
    return GridPartition::shared(k)->cells();
}

} // namespace mnsig
