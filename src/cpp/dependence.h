/*
    Conversion between rank correlations and native copula parameters.

    Implements:
    1. Kendall's tau and Spearman's rho of a parametrised copula
    2. Inversion of either measure back to the native parameter
*/

#ifndef MNSIG_DEPENDENCE_H
#define MNSIG_DEPENDENCE_H

#include "copula.h"

namespace mnsig {

// Frank parameters are capped at this magnitude when |tau| or |rho| -> 1
constexpr double FRANK_THETA_MAX = 1.0e4;

/**
 * @brief Kendall's tau implied by a native parameter
 */
double kendalls_tau_of(CopulaFamily family, const DependencySpec& native);

/**
 * @brief Spearman's rho implied by a native parameter
 */
double spearmans_rho_of(CopulaFamily family, const DependencySpec& native);

/**
 * @brief Map a rank correlation to the family's native parameter
 * @param family Copula family
 * @param kind Kendall or Spearman (Native is returned unchanged)
 * @param value Rank correlation in [-1, 1]
 * @param dof Degrees of freedom carried into the result for the T family
 * @return Native DependencySpec (correlation matrix for Gaussian and T)
 * @throws std::domain_error if |value| > 1
 */
DependencySpec invert_dependency(
    CopulaFamily family,
    DependencyKind kind,
    double value,
    int dof = DEFAULT_T_DOF
);

} // namespace mnsig

#endif // MNSIG_DEPENDENCE_H
