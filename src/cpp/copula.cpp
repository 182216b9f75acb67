/*
    Implementation of the bivariate copula families
*/

#include "copula.h"
#include "bivariate.h"
#include "dependence.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace mnsig {

namespace {

// Unit diagonal, symmetric, |r| <= 1, and in step with the scalar value
void check_correlation(const std::string& name, const DependencySpec& native) {
    const Eigen::Matrix2d& m = native.correlation;
    const double r = m(0, 1);
    if (m(0, 0) != 1.0 || m(1, 1) != 1.0 || m(1, 0) != r) {
        throw std::domain_error(name + " copula correlation matrix must be symmetric with unit diagonal");
    }
    if (!(r >= -1.0 && r <= 1.0)) {
        throw std::domain_error(name + " copula correlation must be in [-1, 1]");
    }
    if (native.value != r) {
        throw std::invalid_argument(name + " copula value " + std::to_string(native.value) +
                                    " disagrees with correlation " + std::to_string(r));
    }
}

} // namespace

void validate_native(CopulaFamily family, const DependencySpec& native) {
    if (native.kind != DependencyKind::Native) {
        throw std::invalid_argument("copula_cdf expects a native dependency parameter");
    }
    const double theta = native.value;
    switch (family) {
        case CopulaFamily::Gaussian:
            check_correlation("Gaussian", native);
            break;
        case CopulaFamily::T:
            check_correlation("T", native);
            if (native.dof < 1) {
                throw std::invalid_argument("T copula degrees of freedom must be >= 1");
            }
            break;
        case CopulaFamily::Clayton:
            if (!(theta >= -1.0) || std::isinf(theta)) {
                throw std::domain_error("Clayton copula parameter must be finite and >= -1");
            }
            break;
        case CopulaFamily::Frank:
            if (!std::isfinite(theta)) {
                throw std::domain_error("Frank copula parameter must be finite");
            }
            break;
        case CopulaFamily::Gumbel:
            if (!(theta >= 1.0) || std::isinf(theta)) {
                throw std::domain_error("Gumbel copula parameter must be finite and >= 1");
            }
            break;
    }
}

namespace {

double clayton_cdf(double u, double v, double theta) {
    if (theta == 0.0) {
        return u * v;
    }
    if (theta < 0.0) {
        const double base = std::pow(u, -theta) + std::pow(v, -theta) - 1.0;
        return base <= 0.0 ? 0.0 : std::pow(base, -1.0 / theta);
    }
    // (u^-t + v^-t - 1)^(-1/t) evaluated in log space
    const double a = -theta * std::log(u);
    const double b = -theta * std::log(v);
    const double m = std::max(a, b);
    double log_s = 0.0;
    if (m < 1.0) {
        log_s = std::log1p(std::expm1(a) + std::expm1(b));
    } else {
        log_s = m + std::log(std::exp(a - m) + std::exp(b - m) - std::exp(-m));
    }
    return std::exp(-log_s / theta);
}

// Frank copula for theta >= 1, factored around min(u, v) to avoid cancellation
double frank_cdf_positive(double u, double v, double theta) {
    const double lo = std::min(u, v);
    const double hi = std::max(u, v);
    const double inner = -std::expm1(-theta * hi)
                       + std::exp(-theta * (hi - lo)) * -std::expm1(-theta * (1.0 - hi));
    return lo - (std::log(inner) - std::log1p(-std::exp(-theta))) / theta;
}

double frank_cdf(double u, double v, double theta) {
    if (theta == 0.0) {
        return u * v;
    }
    if (std::abs(theta) < 1.0) {
        return -std::log1p(std::expm1(-theta * u) * std::expm1(-theta * v) / std::expm1(-theta)) / theta;
    }
    if (theta > 0.0) {
        return frank_cdf_positive(u, v, theta);
    }
    // (U, 1 - V) follows the Frank copula with parameter -theta
    return u - frank_cdf_positive(u, 1.0 - v, -theta);
}

double gumbel_cdf(double u, double v, double theta) {
    const double a = -std::log(u);
    const double b = -std::log(v);
    const double hi = std::max(a, b);
    const double lo = std::min(a, b);
    if (hi == 0.0) {
        return 1.0;
    }
    // (a^t + b^t)^(1/t) = hi * (1 + (lo/hi)^t)^(1/t)
    const double s = hi * std::exp(std::log1p(std::pow(lo / hi, theta)) / theta);
    return std::exp(-s);
}

} // namespace

std::string family_name(CopulaFamily family) {
    switch (family) {
        case CopulaFamily::Gaussian: return "Gaussian";
        case CopulaFamily::T:        return "T";
        case CopulaFamily::Clayton:  return "Clayton";
        case CopulaFamily::Frank:    return "Frank";
        case CopulaFamily::Gumbel:   return "Gumbel";
    }
    throw std::invalid_argument("unknown copula family");
}

CopulaFamily parse_family(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (CopulaFamily family : all_families()) {
        std::string candidate = family_name(family);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lower) {
            return family;
        }
    }
    throw std::invalid_argument("unsupported copula family: " + name);
}

const std::vector<CopulaFamily>& all_families() {
    static const std::vector<CopulaFamily> families = {
        CopulaFamily::Gaussian,
        CopulaFamily::T,
        CopulaFamily::Clayton,
        CopulaFamily::Frank,
        CopulaFamily::Gumbel
    };
    return families;
}

bool supports_negative_dependence(CopulaFamily family) {
    return family != CopulaFamily::Clayton && family != CopulaFamily::Gumbel;
}

DependencySpec DependencySpec::kendall(double tau, int dof) {
    DependencySpec spec;
    spec.kind = DependencyKind::Kendall;
    spec.value = tau;
    spec.dof = dof;
    return spec;
}

DependencySpec DependencySpec::spearman(double rho, int dof) {
    DependencySpec spec;
    spec.kind = DependencyKind::Spearman;
    spec.value = rho;
    spec.dof = dof;
    return spec;
}

DependencySpec DependencySpec::native(double theta) {
    DependencySpec spec;
    spec.kind = DependencyKind::Native;
    spec.value = theta;
    spec.correlation(0, 1) = theta;
    spec.correlation(1, 0) = theta;
    return spec;
}

DependencySpec DependencySpec::native(const Eigen::Matrix2d& correlation) {
    DependencySpec spec;
    spec.kind = DependencyKind::Native;
    spec.value = correlation(0, 1);
    spec.correlation = correlation;
    return spec;
}

DependencySpec DependencySpec::native(const Eigen::Matrix2d& correlation, int dof) {
    DependencySpec spec = native(correlation);
    spec.dof = dof;
    return spec;
}

double copula_cdf(CopulaFamily family, double u, double v, const DependencySpec& native) {
    validate_native(family, native);

    u = std::max(0.0, std::min(1.0, u));
    v = std::max(0.0, std::min(1.0, v));

    // Boundary conditions shared by every copula
    if (u == 0.0 || v == 0.0) {
        return 0.0;
    }
    if (u == 1.0) {
        return v;
    }
    if (v == 1.0) {
        return u;
    }

    double c = 0.0;
    switch (family) {
        case CopulaFamily::Gaussian:
            c = bivariate_normal_cdf(normal_quantile(u), normal_quantile(v), native.value);
            break;
        case CopulaFamily::T:
            c = bivariate_t_cdf(students_t_quantile(u, native.dof),
                                students_t_quantile(v, native.dof),
                                native.value, native.dof);
            break;
        case CopulaFamily::Clayton:
            c = clayton_cdf(u, v, native.value);
            break;
        case CopulaFamily::Frank:
            c = frank_cdf(u, v, native.value);
            break;
        case CopulaFamily::Gumbel:
            c = gumbel_cdf(u, v, native.value);
            break;
    }

    // Frechet-Hoeffding bounds
    return std::max(std::max(0.0, u + v - 1.0), std::min(c, std::min(u, v)));
}

double cvolume(
    CopulaFamily family,
    const Eigen::Vector2d& u1v1,
    const Eigen::Vector2d& u1v2,
    const Eigen::Vector2d& u2v1,
    const Eigen::Vector2d& u2v2,
    const DependencySpec& dependency
) {
    const DependencySpec native = dependency.kind == DependencyKind::Native
        ? dependency
        : invert_dependency(family, dependency.kind, dependency.value, dependency.dof);

    const double c22 = copula_cdf(family, u2v2.x(), u2v2.y(), native);
    const double c12 = copula_cdf(family, u1v2.x(), u1v2.y(), native);
    const double c21 = copula_cdf(family, u2v1.x(), u2v1.y(), native);
    const double c11 = copula_cdf(family, u1v1.x(), u1v1.y(), native);

    return std::max(0.0, c22 - c12 - c21 + c11);
}

} // namespace mnsig
