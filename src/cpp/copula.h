/*
    Bivariate copula families.

    Implements:
    1. Family identifiers and name parsing
    2. Dependency specification (Kendall's tau, Spearman's rho or the
       family's native parameter)
    3. Copula CDFs for the Gaussian, Student-t, Clayton, Frank and Gumbel
       families
    4. C-volume: probability mass of a rectangle via inclusion-exclusion
*/

#ifndef MNSIG_COPULA_H
#define MNSIG_COPULA_H

#include "config.h"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace mnsig {

/**
 * @brief Canonical family name ("Gaussian", "T", "Clayton", "Frank", "Gumbel")
 */
std::string family_name(CopulaFamily family);

/**
 * @brief Case-insensitive family lookup
 * @throws std::invalid_argument for an unknown name
 */
CopulaFamily parse_family(const std::string& name);

/**
 * @brief All supported families in enum order
 */
const std::vector<CopulaFamily>& all_families();

/**
 * @brief False for families whose parameter only models concordance
 *        (Clayton, Gumbel)
 */
bool supports_negative_dependence(CopulaFamily family);

enum class DependencyKind {
    Kendall,
    Spearman,
    Native
};

/**
 * @brief How the dependency of a copula is specified
 *
 * Kendall / Spearman: `value` holds the rank correlation.
 * Native: `value` holds theta for Clayton, Frank and Gumbel, and the
 * off-diagonal correlation for Gaussian and T (mirrored in `correlation`;
 * both factories fill the two fields, and validation rejects a spec where
 * they disagree). `dof` is the T family's degrees of freedom and is
 * ignored otherwise.
 */
struct DependencySpec {
    DependencyKind kind = DependencyKind::Native;
    double value = 0.0;
    Eigen::Matrix2d correlation = Eigen::Matrix2d::Identity();
    int dof = 0;

    static DependencySpec kendall(double tau, int dof = DEFAULT_T_DOF);
    static DependencySpec spearman(double rho, int dof = DEFAULT_T_DOF);
    static DependencySpec native(double theta);
    static DependencySpec native(const Eigen::Matrix2d& correlation);
    static DependencySpec native(const Eigen::Matrix2d& correlation, int dof);
};

/**
 * @brief Check that a native parameter lies in the family's domain
 * @throws std::invalid_argument if the spec is not native, lacks dof (T) or
 *         its correlation matrix disagrees with `value` (Gaussian, T)
 * @throws std::domain_error if the parameter is out of range or the
 *         correlation matrix is not symmetric with unit diagonal
 */
void validate_native(CopulaFamily family, const DependencySpec& native);

/**
 * @brief Copula CDF C(u, v)
 * @param family Copula family
 * @param u First coordinate (clamped to [0, 1])
 * @param v Second coordinate (clamped to [0, 1])
 * @param native Native dependency parameter (kind must be Native)
 * @return C(u, v) in [0, 1]
 * @throws std::domain_error if the parameter is outside the family's range
 */
double copula_cdf(CopulaFamily family, double u, double v, const DependencySpec& native);

/**
 * @brief Probability mass of the rectangle spanned by four corner points
 * @param family Copula family
 * @param u1v1 Lower-left corner
 * @param u1v2 Upper-left corner
 * @param u2v1 Lower-right corner
 * @param u2v2 Upper-right corner
 * @param dependency Any dependency specification; non-native kinds are
 *        converted to the family's native parameter first
 * @return C(u2v2) - C(u1v2) - C(u2v1) + C(u1v1), clipped below at 0
 */
double cvolume(
    CopulaFamily family,
    const Eigen::Vector2d& u1v1,
    const Eigen::Vector2d& u1v2,
    const Eigen::Vector2d& u2v1,
    const Eigen::Vector2d& u2v2,
    const DependencySpec& dependency
);

} // namespace mnsig

#endif // MNSIG_COPULA_H
