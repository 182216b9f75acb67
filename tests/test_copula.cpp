/*
    Copula family tests

    Bivariate normal / Student-t CDFs, copula boundary conditions,
    C-volume and the rank-correlation conversions.
*/

#include <catch2/catch.hpp>
#include "../src/cpp/bivariate.h"
#include "../src/cpp/copula.h"
#include "../src/cpp/dependence.h"
#include "../src/cpp/signature.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace mnsig;
using namespace Catch::Matchers;

namespace {

struct FamilyCase {
    CopulaFamily family;
    DependencySpec native;
};

std::vector<FamilyCase> representative_natives() {
    Eigen::Matrix2d corr;
    corr << 1.0, 0.6,
            0.6, 1.0;
    return {
        {CopulaFamily::Gaussian, DependencySpec::native(corr)},
        {CopulaFamily::T, DependencySpec::native(corr, 4)},
        {CopulaFamily::Clayton, DependencySpec::native(2.5)},
        {CopulaFamily::Frank, DependencySpec::native(-6.0)},
        {CopulaFamily::Gumbel, DependencySpec::native(1.8)}
    };
}

} // namespace

TEST_CASE("Bivariate normal: orthant probabilities match the closed form", "[copula][bivariate]") {
    for (double r : {-0.99, -0.9, -0.5, -0.1, 0.0, 0.2, 0.6, 0.93, 0.999}) {
        INFO("r = " << r);
        const double expected = 0.25 + std::asin(r) / TWO_PI;
        REQUIRE_THAT(bivariate_normal_cdf(0.0, 0.0, r), WithinAbs(expected, 1e-10));
    }
}

TEST_CASE("Bivariate normal: independence and limits", "[copula][bivariate]") {
    REQUIRE_THAT(bivariate_normal_cdf(0.5, -1.2, 0.0),
                 WithinAbs(normal_cdf(0.5) * normal_cdf(-1.2), 1e-12));
    REQUIRE_THAT(bivariate_normal_cdf(40.0, 0.3, 0.7), WithinAbs(normal_cdf(0.3), 1e-12));
    REQUIRE_THAT(bivariate_normal_cdf(-40.0, 0.3, 0.7), WithinAbs(0.0, 1e-12));

    // Comonotone and countermonotone limits
    REQUIRE_THAT(bivariate_normal_cdf(0.4, -0.2, 1.0), WithinAbs(normal_cdf(-0.2), 1e-12));
    REQUIRE_THAT(bivariate_normal_cdf(0.4, 0.2, -1.0),
                 WithinAbs(normal_cdf(0.4) + normal_cdf(0.2) - 1.0, 1e-12));

    REQUIRE_THROWS_AS(bivariate_normal_cdf(0.0, 0.0, 1.5), std::domain_error);
}

TEST_CASE("Bivariate t: orthant probabilities match the closed form", "[copula][bivariate]") {
    for (int nu : {1, 2, 3, 4, 7}) {
        for (double r : {-0.8, 0.0, 0.5, 0.95}) {
            INFO("nu = " << nu << ", r = " << r);
            const double expected = 0.25 + std::asin(r) / TWO_PI;
            REQUIRE_THAT(bivariate_t_cdf(0.0, 0.0, r, nu), WithinAbs(expected, 1e-10));
        }
    }
}

TEST_CASE("Bivariate t: margins and convergence to the normal", "[copula][bivariate]") {
    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE_THAT(bivariate_t_cdf(inf, 0.5, 0.3, 2), WithinAbs(students_t_cdf(0.5, 2), 1e-15));
    REQUIRE_THAT(bivariate_t_cdf(inf, inf, 0.3, 5), WithinAbs(1.0, 1e-15));
    REQUIRE(bivariate_t_cdf(-inf, 0.5, 0.3, 5) == 0.0);
    REQUIRE_THAT(bivariate_t_cdf(30.0, 0.5, 0.3, 3), WithinAbs(students_t_cdf(0.5, 3), 1e-3));
    REQUIRE_THAT(bivariate_t_cdf(0.7, -0.3, 0.5, 400),
                 WithinAbs(bivariate_normal_cdf(0.7, -0.3, 0.5), 2e-3));
    REQUIRE_THROWS_AS(bivariate_t_cdf(0.0, 0.0, 0.5, 0), std::invalid_argument);
}

TEST_CASE("Gauss-Legendre: integrates polynomials exactly", "[copula][quadrature]") {
    std::vector<double> x, w;
    gauss_legendre(6, x, w);

    double sum_w = 0.0, sum_x4 = 0.0, sum_x11 = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        sum_w += w[i];
        sum_x4 += w[i] * std::pow(x[i], 4);
        sum_x11 += w[i] * std::pow(x[i], 11);
    }
    REQUIRE_THAT(sum_w, WithinAbs(2.0, 1e-14));
    REQUIRE_THAT(sum_x4, WithinAbs(2.0 / 5.0, 1e-14));
    REQUIRE_THAT(sum_x11, WithinAbs(0.0, 1e-14));
}

TEST_CASE("Copula CDF: boundary conditions and Frechet bounds", "[copula][cdf]") {
    for (const FamilyCase& fc : representative_natives()) {
        INFO(family_name(fc.family));
        for (double u : {0.05, 0.3, 0.5, 0.81, 0.97}) {
            REQUIRE(copula_cdf(fc.family, u, 0.0, fc.native) == 0.0);
            REQUIRE(copula_cdf(fc.family, 0.0, u, fc.native) == 0.0);
            REQUIRE_THAT(copula_cdf(fc.family, u, 1.0, fc.native), WithinAbs(u, 1e-15));
            REQUIRE_THAT(copula_cdf(fc.family, 1.0, u, fc.native), WithinAbs(u, 1e-15));

            for (double v : {0.1, 0.45, 0.9}) {
                const double c = copula_cdf(fc.family, u, v, fc.native);
                REQUIRE(c >= std::max(0.0, u + v - 1.0));
                REQUIRE(c <= std::min(u, v));
            }
        }
    }
}

TEST_CASE("Copula CDF: zero dependence is the independence copula", "[copula][cdf]") {
    const double u = 0.37;
    const double v = 0.62;
    REQUIRE_THAT(copula_cdf(CopulaFamily::Clayton, u, v, DependencySpec::native(0.0)), WithinAbs(u * v, 1e-15));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Frank, u, v, DependencySpec::native(0.0)), WithinAbs(u * v, 1e-15));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Frank, u, v, DependencySpec::native(1e-6)), WithinAbs(u * v, 1e-6));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Gumbel, u, v, DependencySpec::native(1.0)), WithinAbs(u * v, 1e-14));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Gaussian, u, v, DependencySpec::native(Eigen::Matrix2d::Identity())),
                 WithinAbs(u * v, 1e-12));
}

TEST_CASE("Copula CDF: huge parameters reach the comonotone limit", "[copula][cdf]") {
    const double u = 0.3;
    const double v = 0.7;
    REQUIRE_THAT(copula_cdf(CopulaFamily::Clayton, u, v, DependencySpec::native(1e15)), WithinAbs(u, 1e-9));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Gumbel, u, v, DependencySpec::native(1e15)), WithinAbs(u, 1e-9));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Frank, u, v, DependencySpec::native(5000.0)), WithinAbs(u, 1e-3));
    REQUIRE_THAT(copula_cdf(CopulaFamily::Frank, u, v, DependencySpec::native(-5000.0)),
                 WithinAbs(u + v - 1.0, 1e-3));
}

TEST_CASE("Copula CDF: out-of-range parameters are rejected", "[copula][errors]") {
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::Clayton, 0.5, 0.5, DependencySpec::native(-2.0)), std::domain_error);
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::Gumbel, 0.5, 0.5, DependencySpec::native(0.5)), std::domain_error);
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::Gaussian, 0.5, 0.5, DependencySpec::native(1.5)), std::domain_error);
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::T, 0.5, 0.5, DependencySpec::native(Eigen::Matrix2d::Identity())),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::Frank, 0.5, 0.5, DependencySpec::kendall(0.3)),
                      std::invalid_argument);
}

TEST_CASE("Copula CDF: malformed correlation matrices are rejected", "[copula][errors]") {
    Eigen::Matrix2d scaled;
    scaled << 5.0, 0.5,
              -0.9, 3.0;
    REQUIRE_THROWS_AS(copula_signature(CopulaFamily::Gaussian, DependencySpec::native(scaled), 4),
                      std::domain_error);

    Eigen::Matrix2d asymmetric;
    asymmetric << 1.0, 0.5,
                  0.2, 1.0;
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::T, 0.5, 0.5, DependencySpec::native(asymmetric, 4)),
                      std::domain_error);

    Eigen::Matrix2d too_strong;
    too_strong << 1.0, 1.2,
                  1.2, 1.0;
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::Gaussian, 0.5, 0.5, DependencySpec::native(too_strong)),
                      std::domain_error);

    // Scalar and matrix forms must agree
    DependencySpec edited = DependencySpec::native(0.7);
    REQUIRE(edited.correlation(0, 1) == 0.7);
    REQUIRE(edited.correlation(1, 0) == 0.7);
    REQUIRE_NOTHROW(validate_native(CopulaFamily::Gaussian, edited));

    edited.correlation = Eigen::Matrix2d::Identity();
    REQUIRE_THROWS_AS(copula_cdf(CopulaFamily::Gaussian, 0.5, 0.5, edited), std::invalid_argument);
    edited.dof = 4;
    REQUIRE_THROWS_AS(cvolume(CopulaFamily::T, Eigen::Vector2d(0.1, 0.1), Eigen::Vector2d(0.1, 0.4),
                              Eigen::Vector2d(0.4, 0.1), Eigen::Vector2d(0.4, 0.4), edited),
                      std::invalid_argument);
}

TEST_CASE("C-volume: rectangle masses are non-negative and additive", "[copula][cvolume]") {
    for (const FamilyCase& fc : representative_natives()) {
        INFO(family_name(fc.family));
        const Eigen::Vector2d a(0.2, 0.3), b(0.2, 0.8), c(0.6, 0.3), d(0.6, 0.8);
        const double whole = cvolume(fc.family, a, b, c, d, fc.native);
        REQUIRE(whole >= 0.0);

        // Split [0.2, 0.6] x [0.3, 0.8] at u = 0.45
        const Eigen::Vector2d m1(0.45, 0.3), m2(0.45, 0.8);
        const double left = cvolume(fc.family, a, b, m1, m2, fc.native);
        const double right = cvolume(fc.family, m1, m2, c, d, fc.native);
        REQUIRE_THAT(left + right, WithinAbs(whole, 1e-12));
    }
}

TEST_CASE("C-volume: Kendall and native specifications agree", "[copula][cvolume]") {
    const Eigen::Vector2d a(0.1, 0.1), b(0.1, 0.4), c(0.4, 0.1), d(0.4, 0.4);
    for (CopulaFamily family : all_families()) {
        INFO(family_name(family));
        const DependencySpec native = invert_dependency(family, DependencyKind::Kendall, 0.4);
        REQUIRE_THAT(cvolume(family, a, b, c, d, DependencySpec::kendall(0.4)),
                     WithinAbs(cvolume(family, a, b, c, d, native), 1e-15));
    }
}

TEST_CASE("Dependence: closed-form Kendall inversions", "[dependence][kendall]") {
    REQUIRE_THAT(invert_dependency(CopulaFamily::Gaussian, DependencyKind::Kendall, 0.5).value,
                 WithinAbs(std::sin(PI / 4.0), 1e-15));
    REQUIRE_THAT(invert_dependency(CopulaFamily::Clayton, DependencyKind::Kendall, 0.5).value,
                 WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(invert_dependency(CopulaFamily::Gumbel, DependencyKind::Kendall, 0.5).value,
                 WithinAbs(2.0, 1e-12));

    const DependencySpec t = invert_dependency(CopulaFamily::T, DependencyKind::Kendall, -0.3, 6);
    REQUIRE(t.dof == 6);
    REQUIRE_THAT(t.correlation(0, 1), WithinAbs(std::sin(-0.3 * PI / 2.0), 1e-15));
    REQUIRE(t.correlation(1, 0) == t.correlation(0, 1));
    REQUIRE(t.correlation(0, 0) == 1.0);
}

TEST_CASE("Dependence: Frank inversion round-trips through tau", "[dependence][kendall]") {
    // Genest (1987): theta = 5.736 gives tau = 0.5
    const DependencySpec frank = invert_dependency(CopulaFamily::Frank, DependencyKind::Kendall, 0.5);
    REQUIRE_THAT(frank.value, WithinAbs(5.736, 1e-3));

    for (double tau : {-0.85, -0.3, 0.1, 0.7}) {
        INFO("tau = " << tau);
        const DependencySpec native = invert_dependency(CopulaFamily::Frank, DependencyKind::Kendall, tau);
        REQUIRE_THAT(kendalls_tau_of(CopulaFamily::Frank, native), WithinAbs(tau, 1e-9));
    }
    REQUIRE(invert_dependency(CopulaFamily::Frank, DependencyKind::Kendall, 0.0).value == 0.0);
}

TEST_CASE("Dependence: Spearman inversions", "[dependence][spearman]") {
    const DependencySpec gauss = invert_dependency(CopulaFamily::Gaussian, DependencyKind::Spearman, 0.4);
    REQUIRE_THAT(spearmans_rho_of(CopulaFamily::Gaussian, gauss), WithinAbs(0.4, 1e-12));

    for (CopulaFamily family : {CopulaFamily::Clayton, CopulaFamily::Frank, CopulaFamily::Gumbel}) {
        INFO(family_name(family));
        const DependencySpec native = invert_dependency(family, DependencyKind::Spearman, 0.45);
        REQUIRE_THAT(spearmans_rho_of(family, native), WithinAbs(0.45, 1e-6));
    }

    // Independence has rho = 0 for every family
    REQUIRE_THAT(spearmans_rho_of(CopulaFamily::Clayton, DependencySpec::native(0.0)), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(spearmans_rho_of(CopulaFamily::Gumbel, DependencySpec::native(1.0)), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Dependence: out-of-range measures are rejected", "[dependence][errors]") {
    REQUIRE_THROWS_AS(invert_dependency(CopulaFamily::Gaussian, DependencyKind::Kendall, 1.2), std::domain_error);
    REQUIRE_THROWS_AS(invert_dependency(CopulaFamily::Frank, DependencyKind::Spearman, -1.01), std::domain_error);
    REQUIRE_THROWS_AS(invert_dependency(CopulaFamily::T, DependencyKind::Kendall, 0.3, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_family("Joe"), std::invalid_argument);
}

TEST_CASE("Families: names parse case-insensitively", "[copula][names]") {
    for (CopulaFamily family : all_families()) {
        REQUIRE(parse_family(family_name(family)) == family);
    }
    REQUIRE(parse_family("gumbel") == CopulaFamily::Gumbel);
    REQUIRE(parse_family("GAUSSIAN") == CopulaFamily::Gaussian);
    REQUIRE_FALSE(supports_negative_dependence(CopulaFamily::Clayton));
    REQUIRE_FALSE(supports_negative_dependence(CopulaFamily::Gumbel));
    REQUIRE(supports_negative_dependence(CopulaFamily::Frank));
}
