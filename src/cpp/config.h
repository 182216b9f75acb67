/*
    Configuration for the multinomial signature engine.

    Numeric constants shared by every module, plus the selector
    configuration (grid resolution, boundary-policy threshold and
    candidate families).
*/

#ifndef MNSIG_CONFIG_H
#define MNSIG_CONFIG_H

#include <limits>
#include <vector>

namespace mnsig {

// Constants
constexpr double MACHINE_EPS = std::numeric_limits<double>::epsilon();
constexpr int DEFAULT_GRID_SIZE = 4;
constexpr double DEFAULT_NEGATIVE_TAU_TOLERANCE = -0.05;
constexpr int DEFAULT_T_DOF = 4;

enum class CopulaFamily {
    Gaussian,
    T,
    Clayton,
    Frank,
    Gumbel
};

/**
 * @brief Tunable parameters of the family selector
 */
struct SelectorConfig {
    int grid_size = DEFAULT_GRID_SIZE;

    // Clayton and Gumbel are excluded when tau_hat falls below this value,
    // and evaluated at tau = 0 when tau_hat lies in [tolerance, 0).
    double negative_tau_tolerance = DEFAULT_NEGATIVE_TAU_TOLERANCE;

    std::vector<CopulaFamily> candidate_families = {
        CopulaFamily::Gaussian,
        CopulaFamily::Clayton,
        CopulaFamily::Gumbel,
        CopulaFamily::Frank
    };

    int t_degrees_of_freedom = DEFAULT_T_DOF;

    // Substituted for exact-zero cells before any log/ratio computation
    double zero_mass_floor = MACHINE_EPS;

    /**
     * @brief Throw std::invalid_argument if any field is unusable
     */
    void validate() const;
};

} // namespace mnsig

#endif // MNSIG_CONFIG_H
