/*
    Rank statistics on sample matrices.

    Implements:
    1. Probability integral transform to pseudo-observations
    2. Kendall's tau-b, for one pair or every pair of columns
*/

#ifndef MNSIG_RANK_STATS_H
#define MNSIG_RANK_STATS_H

#include <Eigen/Dense>

namespace mnsig {

/**
 * @brief Transform each column to uniform margins with its empirical CDF
 *
 * U(i, j) = #{k : X(k, j) <= X(i, j)} / (M + 1), so every value lies
 * strictly inside (0, 1) and ties share a value.
 *
 * @param X M x N sample matrix (M >= 1)
 * @return M x N matrix of pseudo-observations
 * @throws std::invalid_argument if X has no rows or no columns
 */
Eigen::MatrixXd probability_integral_transform(const Eigen::MatrixXd& X);

/**
 * @brief Kendall's tau-b between two samples
 * @throws std::invalid_argument if the lengths differ or are below 2
 * @throws std::domain_error if either sample is constant
 */
double kendalls_tau(const Eigen::VectorXd& x, const Eigen::VectorXd& y);

/**
 * @brief Kendall's tau-b between the first two columns of X
 * @throws std::invalid_argument if X has fewer than 2 columns or rows
 */
double kendalls_tau(const Eigen::MatrixXd& X);

/**
 * @brief N x N matrix of pairwise Kendall's tau-b (unit diagonal)
 */
Eigen::MatrixXd kendalls_tau_matrix(const Eigen::MatrixXd& X);

} // namespace mnsig

#endif // MNSIG_RANK_STATS_H
