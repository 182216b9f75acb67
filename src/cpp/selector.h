/*
    Copula family selection by multinomial signature matching.

    For a pair of variables the empirical signature and Kendall's tau are
    computed from the data; every candidate family's theoretical signature
    at that tau is compared with the empirical one by Kullback-Leibler
    divergence, and the closest family wins.

    Reference: Elidan (2012) - "Lightning-speed Structure Learning of
    Nonlinear Continuous Networks", AISTATS
*/

#ifndef MNSIG_SELECTOR_H
#define MNSIG_SELECTOR_H

#include "config.h"
#include "copula.h"
#include <Eigen/Dense>
#include <map>
#include <optional>
#include <vector>

namespace mnsig {

/**
 * @brief Outcome of one family selection
 */
struct SelectionResult {
    // Empty when every candidate was excluded by the boundary policy
    std::optional<CopulaFamily> family;

    // Native parameter of the selected family at the unclamped tau_hat
    DependencySpec parameter;

    double tau_hat = 0.0;

    // KL divergence per candidate, +inf for excluded families
    std::map<CopulaFamily, double> divergences;

    int rv1 = 1;
    int rv2 = 2;

    bool admissible() const { return family.has_value(); }
};

/**
 * @brief Boundary policy for families restricted to concordance
 *
 * For Clayton and Gumbel: tau below `tolerance` excludes the family,
 * tau in [tolerance, 0) is evaluated at 0, tau >= 1 at 1 - MACHINE_EPS.
 * Other families use tau unchanged.
 *
 * @return Tau to evaluate the family at, or empty if it is excluded
 */
std::optional<double> admissible_tau(CopulaFamily family, double tau_hat, double tolerance);

class FamilySelector {
public:
    FamilySelector() = default;

    /**
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit FamilySelector(SelectorConfig config);

    const SelectorConfig& config() const { return config_; }

    /**
     * @brief Select the family for the first two columns of X
     * @param X M x N sample matrix, N >= 2, M >= 2
     * @return Selection result (check admissible())
     */
    SelectionResult select(const Eigen::MatrixXd& X) const;

    /**
     * @brief Select the family for columns dim1 < dim2 of X
     */
    SelectionResult select_pair(const Eigen::MatrixXd& X, int dim1, int dim2) const;

    /**
     * @brief One selection per pair (dim1, dim2), dim1 < dim2
     */
    std::vector<SelectionResult> select_all_pairs(const Eigen::MatrixXd& X) const;

    /**
     * @brief Score the candidates against a precomputed empirical signature
     * @param empirical K^2 empirical signature (zero cells are floored here)
     * @param tau_hat Empirical Kendall's tau of the pair
     */
    SelectionResult select_from_signature(const Eigen::VectorXd& empirical, double tau_hat) const;

private:
    SelectorConfig config_;
};

/**
 * @brief Select the best family for the first two columns of X
 * @param X M x N sample matrix
 * @param k Grid resolution
 * @param families Candidate families, ties go to the earliest
 * @throws std::invalid_argument if k < 1 or families is empty
 */
SelectionResult select_family(
    const Eigen::MatrixXd& X,
    int k = DEFAULT_GRID_SIZE,
    const std::vector<CopulaFamily>& families = SelectorConfig().candidate_families
);

} // namespace mnsig

#endif // MNSIG_SELECTOR_H
