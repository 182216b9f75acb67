/*
    Shared sample generators for the test suite
*/

#ifndef MNSIG_TEST_HELPERS_H
#define MNSIG_TEST_HELPERS_H

#include <Eigen/Dense>
#include <cmath>
#include <random>

namespace mnsig_test {

constexpr double PI = 3.141592653589793238462643383279502884;

// Bivariate Gaussian copula sample with Kendall's tau `tau`, pushed through
// a normal margin (column 0) and a log-normal margin (column 1)
inline Eigen::MatrixXd generate_gaussian_copula(int n, double tau, std::mt19937& rng) {
    std::normal_distribution<double> normal(0.0, 1.0);

    const double r = std::sin(PI * tau / 2.0);
    Eigen::Matrix2d sigma;
    sigma << 1.0, r,
             r, 1.0;
    const Eigen::Matrix2d L = sigma.llt().matrixL();

    Eigen::MatrixXd X(n, 2);
    for (int i = 0; i < n; ++i) {
        const Eigen::Vector2d z(normal(rng), normal(rng));
        const Eigen::Vector2d x = L * z;
        X(i, 0) = x(0);
        X(i, 1) = std::exp(x(1));
    }
    return X;
}

// Clayton copula sample by conditional inversion
inline Eigen::MatrixXd generate_clayton(int n, double theta, std::mt19937& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    Eigen::MatrixXd U(n, 2);
    for (int i = 0; i < n; ++i) {
        const double u = uniform(rng);
        const double t = uniform(rng);
        const double v = std::pow(
            std::pow(u, -theta) * (std::pow(t, -theta / (1.0 + theta)) - 1.0) + 1.0,
            -1.0 / theta
        );
        U(i, 0) = u;
        U(i, 1) = v;
    }
    return U;
}

// Independent standard normal columns
inline Eigen::MatrixXd generate_independent(int n, int dims, std::mt19937& rng) {
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd X(n, dims);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < dims; ++j) {
            X(i, j) = normal(rng);
        }
    }
    return X;
}

} // namespace mnsig_test

#endif // MNSIG_TEST_HELPERS_H
