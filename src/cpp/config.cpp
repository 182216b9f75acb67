/*
    Selector configuration validation
*/

#include "config.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace mnsig {

void SelectorConfig::validate() const {
    if (grid_size < 1) {
        throw std::invalid_argument("grid_size must be >= 1, got " + std::to_string(grid_size));
    }
    if (candidate_families.empty()) {
        throw std::invalid_argument("candidate_families must not be empty");
    }
    if (!std::isfinite(negative_tau_tolerance) || negative_tau_tolerance > 0.0) {
        throw std::invalid_argument("negative_tau_tolerance must be a finite value <= 0");
    }
    if (t_degrees_of_freedom < 1) {
        throw std::invalid_argument("t_degrees_of_freedom must be >= 1");
    }
    if (!(zero_mass_floor > 0.0) || !std::isfinite(zero_mass_floor)) {
        throw std::invalid_argument("zero_mass_floor must be a finite positive value");
    }
}

} // namespace mnsig
