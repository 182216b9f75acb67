/*
    Implementation of the rank-correlation conversions
*/

#include "dependence.h"
#include "bivariate.h"
#include "logging.h"
#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <boost/math/tools/toms748_solve.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace mnsig {

namespace {

// Upper end of the Clayton / Gumbel search interval for Spearman's rho
constexpr double ARCHIMEDEAN_THETA_MAX = 1.0e3;

// Debye function D_n(theta) = n / theta^n * int_0^theta t^n / (e^t - 1) dt, theta > 0
double debye(int n, double theta) {
    // The integrand is below 1e-20 past t = 60
    const double upper = std::min(theta, 60.0);
    auto integrand = [n](double t) { return std::pow(t, n) / std::expm1(t); };
    const double integral =
        boost::math::quadrature::gauss_kronrod<double, 31>::integrate(integrand, 0.0, upper, 15, 1e-12);
    return n / std::pow(theta, n) * integral;
}

double frank_tau(double theta) {
    const double a = std::abs(theta);
    if (a == 0.0) {
        return 0.0;
    }
    const double tau = a < 1e-4 ? a / 9.0 : 1.0 - 4.0 / a * (1.0 - debye(1, a));
    return theta < 0.0 ? -tau : tau;
}

double frank_rho(double theta) {
    const double a = std::abs(theta);
    if (a == 0.0) {
        return 0.0;
    }
    const double rho = a < 1e-4 ? a / 6.0 : 1.0 - 12.0 / a * (debye(1, a) - debye(2, a));
    return theta < 0.0 ? -rho : rho;
}

// rho_S = 12 * int int C(u, v) du dv - 3 on a tensor Gauss-Legendre rule
double spearman_by_quadrature(CopulaFamily family, const DependencySpec& native) {
    struct UnitRule {
        std::vector<double> nodes;
        std::vector<double> weights;

        UnitRule() {
            gauss_legendre(48, nodes, weights);
            for (std::size_t i = 0; i < nodes.size(); ++i) {
                nodes[i] = 0.5 * (nodes[i] + 1.0);
                weights[i] *= 0.5;
            }
        }
    };
    static const UnitRule rule;

    double integral = 0.0;
    for (std::size_t i = 0; i < rule.nodes.size(); ++i) {
        for (std::size_t j = 0; j < rule.nodes.size(); ++j) {
            integral += rule.weights[i] * rule.weights[j]
                      * copula_cdf(family, rule.nodes[i], rule.nodes[j], native);
        }
    }
    return 12.0 * integral - 3.0;
}

// Solve g(x) = target for increasing g, saturating at the ends of [lo, hi]
double invert_increasing(const std::function<double(double)>& g, double target, double lo, double hi) {
    if (g(lo) - target >= 0.0) {
        return lo;
    }
    if (g(hi) - target <= 0.0) {
        return hi;
    }

    auto f = [&g, target](double x) { return g(x) - target; };
    std::uintmax_t max_iter = 200;
    boost::math::tools::eps_tolerance<double> tol(std::numeric_limits<double>::digits - 4);
    const std::pair<double, double> root = boost::math::tools::toms748_solve(f, lo, hi, tol, max_iter);
    return 0.5 * (root.first + root.second);
}

DependencySpec elliptical(CopulaFamily family, double r, int dof) {
    Eigen::Matrix2d correlation;
    correlation << 1.0, r,
                   r, 1.0;
    return family == CopulaFamily::T
        ? DependencySpec::native(correlation, dof)
        : DependencySpec::native(correlation);
}

double frank_parameter(const std::function<double(double)>& measure, double value) {
    if (value == 0.0) {
        return 0.0;
    }
    const double theta = invert_increasing(measure, std::abs(value), 0.0, FRANK_THETA_MAX);
    if (theta >= FRANK_THETA_MAX) {
        logger()->warn("Frank parameter saturated at {} for dependency {}", FRANK_THETA_MAX, value);
    }
    return value < 0.0 ? -theta : theta;
}

DependencySpec invert_kendall(CopulaFamily family, double tau, int dof) {
    switch (family) {
        case CopulaFamily::Gaussian:
        case CopulaFamily::T:
            return elliptical(family, std::sin(PI * tau / 2.0), dof);
        case CopulaFamily::Clayton: {
            const double t = std::min(tau, 1.0 - MACHINE_EPS);
            return DependencySpec::native(2.0 * t / (1.0 - t));
        }
        case CopulaFamily::Gumbel: {
            if (tau < 0.0) {
                logger()->warn("Gumbel copula cannot model tau = {}, using independence", tau);
                return DependencySpec::native(1.0);
            }
            const double t = std::min(tau, 1.0 - MACHINE_EPS);
            return DependencySpec::native(1.0 / (1.0 - t));
        }
        case CopulaFamily::Frank:
            return DependencySpec::native(frank_parameter(frank_tau, tau));
    }
    throw std::invalid_argument("unsupported copula family");
}

DependencySpec invert_spearman(CopulaFamily family, double rho, int dof) {
    switch (family) {
        case CopulaFamily::Gaussian:
            return elliptical(family, 2.0 * std::sin(PI * rho / 6.0), dof);
        case CopulaFamily::T: {
            if (std::abs(rho) == 1.0) {
                return elliptical(family, rho, dof);
            }
            auto measure = [dof](double r) {
                return spearman_by_quadrature(CopulaFamily::T, elliptical(CopulaFamily::T, r, dof));
            };
            return elliptical(family, invert_increasing(measure, rho, -1.0 + 1e-9, 1.0 - 1e-9), dof);
        }
        case CopulaFamily::Clayton: {
            auto measure = [](double theta) {
                return spearman_by_quadrature(CopulaFamily::Clayton, DependencySpec::native(theta));
            };
            const double theta = rho < 0.0
                ? invert_increasing(measure, rho, -1.0, 0.0)
                : invert_increasing(measure, rho, 0.0, ARCHIMEDEAN_THETA_MAX);
            return DependencySpec::native(theta);
        }
        case CopulaFamily::Gumbel: {
            if (rho < 0.0) {
                logger()->warn("Gumbel copula cannot model rho = {}, using independence", rho);
                return DependencySpec::native(1.0);
            }
            auto measure = [](double theta) {
                return spearman_by_quadrature(CopulaFamily::Gumbel, DependencySpec::native(theta));
            };
            return DependencySpec::native(invert_increasing(measure, rho, 1.0, ARCHIMEDEAN_THETA_MAX));
        }
        case CopulaFamily::Frank:
            return DependencySpec::native(frank_parameter(frank_rho, rho));
    }
    throw std::invalid_argument("unsupported copula family");
}

} // namespace

double kendalls_tau_of(CopulaFamily family, const DependencySpec& native) {
    validate_native(family, native);
    const double theta = native.value;
    switch (family) {
        case CopulaFamily::Gaussian:
        case CopulaFamily::T:
            return 2.0 / PI * std::asin(theta);
        case CopulaFamily::Clayton:
            return theta / (theta + 2.0);
        case CopulaFamily::Gumbel:
            return 1.0 - 1.0 / theta;
        case CopulaFamily::Frank:
            return frank_tau(theta);
    }
    throw std::invalid_argument("unsupported copula family");
}

double spearmans_rho_of(CopulaFamily family, const DependencySpec& native) {
    validate_native(family, native);
    switch (family) {
        case CopulaFamily::Gaussian:
            return 6.0 / PI * std::asin(native.value / 2.0);
        case CopulaFamily::Frank:
            return frank_rho(native.value);
        case CopulaFamily::T:
        case CopulaFamily::Clayton:
        case CopulaFamily::Gumbel:
            return spearman_by_quadrature(family, native);
    }
    throw std::invalid_argument("unsupported copula family");
}

DependencySpec invert_dependency(CopulaFamily family, DependencyKind kind, double value, int dof) {
    if (kind == DependencyKind::Native) {
        if (family == CopulaFamily::Gaussian || family == CopulaFamily::T) {
            return elliptical(family, value, dof);
        }
        return DependencySpec::native(value);
    }
    if (!(value >= -1.0 && value <= 1.0)) {
        throw std::domain_error("rank correlation must be in [-1, 1], got " + std::to_string(value));
    }
    if (family == CopulaFamily::T && dof < 1) {
        throw std::invalid_argument("T copula degrees of freedom must be >= 1");
    }

    return kind == DependencyKind::Kendall
        ? invert_kendall(family, value, dof)
        : invert_spearman(family, value, dof);
}

} // namespace mnsig
