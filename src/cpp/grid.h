/*
    Grid partition of the unit square.

    The square is split into K x K cells numbered column by column, bottom
    to top (shown for K = 4, 1-based):

      ___________________
      | 4 | 8 | 12 | 16 |
      |---|---|----|----|
      | 3 | 7 | 11 | 15 |
      |-----------------|
      | 2 | 6 | 10 | 14 |
      |-----------------|
      | 1 | 5 |  9 | 13 |
      |___|___|____|____|

    Break points run from MACHINE_EPS to 1 - MACHINE_EPS so that every
    corner is strictly inside (0, 1).
*/

#ifndef MNSIG_GRID_H
#define MNSIG_GRID_H

#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <vector>

namespace mnsig {

/**
 * @brief One rectangle [u1, u2) x [v1, v2) of the partition
 */
struct GridCell {
    Eigen::Vector2d u1v1;  // lower-left
    Eigen::Vector2d u1v2;  // upper-left
    Eigen::Vector2d u2v1;  // lower-right
    Eigen::Vector2d u2v2;  // upper-right

    double u1() const { return u1v1.x(); }
    double u2() const { return u2v2.x(); }
    double v1() const { return u1v1.y(); }
    double v2() const { return u2v2.y(); }

    /**
     * @brief Half-open membership test used by the empirical estimator
     */
    bool contains(double u, double v) const {
        return u >= u1() && u < u2() && v >= v1() && v < v2();
    }
};

/**
 * @brief Immutable K x K tiling of the unit square
 */
class GridPartition {
public:
    /**
     * @brief Build the partition
     * @param k Cells per axis, must be >= 1
     * @throws std::invalid_argument if k < 1
     */
    explicit GridPartition(int k);

    int resolution() const { return k_; }
    std::size_t size() const { return cells_.size(); }

    /**
     * @brief Cell by 0-based index (cell number - 1)
     */
    const GridCell& cell(std::size_t index) const { return cells_.at(index); }
    const std::vector<GridCell>& cells() const { return cells_; }

    /**
     * @brief The K + 1 break points shared by both axes
     */
    const std::vector<double>& breaks() const { return breaks_; }

    /**
     * @brief Find the cell containing (u, v)
     *
     * Equivalent to scanning the cells in index order and taking the first
     * one whose half-open rectangle contains the point, computed directly
     * from the break points.
     *
     * @param u Horizontal coordinate
     * @param v Vertical coordinate
     * @return 0-based cell index, or -1 if the point lies outside every cell
     */
    int locate(double u, double v) const;

    /**
     * @brief Partition for resolution k, cached process-wide
     *
     * Resolutions up to MAX_CACHED_RESOLUTION are built once and kept for
     * the life of the process, so the cache holds at most that many
     * entries. Larger k gets a fresh, uncached partition.
     *
     * @throws std::invalid_argument if k < 1
     */
    static std::shared_ptr<const GridPartition> shared(int k);

    static constexpr int MAX_CACHED_RESOLUTION = 64;

private:
    int axis_bucket(double x) const;

    int k_;
    double step_;
    std::vector<double> breaks_;
    std::vector<GridCell> cells_;
};

/**
 * @brief Convenience wrapper returning the ordered cells for resolution k
 */
std::vector<GridCell> partition(int k);

} // namespace mnsig

#endif // MNSIG_GRID_H
