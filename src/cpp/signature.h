/*
    Copula multinomial signatures.

    Implements:
    1. Theoretical signature: C-volume of every grid cell for a copula family
    2. Empirical signature: fraction of pseudo-observations in every grid
       cell, for each pair of variables
    3. Zero-mass flooring and Kullback-Leibler divergence between signatures

    Both signatures follow the cell order of GridPartition, so entry i of a
    theoretical vector and entry i of an empirical vector describe the same
    cell.

    Reference: Elidan (2012) - "Lightning-speed Structure Learning of
    Nonlinear Continuous Networks", AISTATS
*/

#ifndef MNSIG_SIGNATURE_H
#define MNSIG_SIGNATURE_H

#include "config.h"
#include "copula.h"
#include <Eigen/Dense>
#include <functional>
#include <vector>

namespace mnsig {

/**
 * @brief Empirical signature of one pair of variables
 */
struct EmpiricalSignature {
    int rv1 = 0;           // 1-based index of the first variable
    int rv2 = 0;           // 1-based index of the second variable, rv1 < rv2
    Eigen::VectorXd esig;  // K^2 cell masses
};

/**
 * @brief Probability mass of the rectangle given by (u1v1, u1v2, u2v1, u2v2)
 */
using VolumeFunction = std::function<double(
    const Eigen::Vector2d&,
    const Eigen::Vector2d&,
    const Eigen::Vector2d&,
    const Eigen::Vector2d&
)>;

/**
 * @brief Evaluate a volume function over every cell of the K x K grid
 * @param volume Rectangle mass function
 * @param k Cells per axis
 * @return Vector of K^2 masses in cell order
 */
Eigen::VectorXd signature_from_volume(const VolumeFunction& volume, int k);

/**
 * @brief Theoretical multinomial signature of a copula family
 * @param family Copula family
 * @param dependency Kendall, Spearman or native dependency; converted to the
 *        native parameter once before the cells are evaluated
 * @param k Cells per axis
 * @return Vector of K^2 masses summing to ~1
 */
Eigen::VectorXd copula_signature(CopulaFamily family, const DependencySpec& dependency, int k);

/**
 * @brief Empirical signature of a single pair of columns
 * @param X M x N sample matrix (raw data, any margins)
 * @param dim1 0-based first column
 * @param dim2 0-based second column, dim1 < dim2 < N
 * @param k Cells per axis
 * @throws std::invalid_argument on bad dimensions or column indices
 */
EmpiricalSignature empirical_signature_for_pair(const Eigen::MatrixXd& X, int dim1, int dim2, int k);

/**
 * @brief Cell fractions of points already on the unit square
 *
 * Bins the first two columns of U directly, without the uniform-margin
 * transform. Rows outside the grid are counted in no cell and logged.
 *
 * @param U M x 2 (or wider) matrix of pseudo-observations
 * @param k Cells per axis
 * @throws std::invalid_argument if U has fewer than 2 columns or no rows
 */
Eigen::VectorXd pseudo_observation_signature(const Eigen::MatrixXd& U, int k);

/**
 * @brief Empirical signatures of every pair (dim1, dim2), dim1 < dim2
 *
 * X is transformed to pseudo-observations once; records are ordered by
 * dim1, then dim2.
 *
 * @throws std::invalid_argument if X has fewer than 2 columns or no rows
 */
std::vector<EmpiricalSignature> empirical_signature(const Eigen::MatrixXd& X, int k);

/**
 * @brief Replace exact-zero entries with a positive floor
 */
Eigen::VectorXd floor_zero_mass(const Eigen::VectorXd& p, double floor = MACHINE_EPS);

/**
 * @brief Discrete Kullback-Leibler divergence sum p_i log(p_i / q_i)
 * @throws std::invalid_argument if the lengths differ
 */
double kl_divergence(const Eigen::VectorXd& p, const Eigen::VectorXd& q);

} // namespace mnsig

#endif // MNSIG_SIGNATURE_H
