/*
    Implementation of the rank statistics
*/

#include "rank_stats.h"
#include <omp.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace mnsig {

namespace {

int sign_of(double d) {
    return (d > 0.0) - (d < 0.0);
}

} // namespace

Eigen::MatrixXd probability_integral_transform(const Eigen::MatrixXd& X) {
    const int m = static_cast<int>(X.rows());
    const int n = static_cast<int>(X.cols());
    if (m < 1 || n < 1) {
        throw std::invalid_argument("probability_integral_transform requires a non-empty matrix");
    }

    Eigen::MatrixXd U(m, n);
    const double scale = 1.0 / (m + 1.0);

    #pragma omp parallel for
    for (int j = 0; j < n; ++j) {
        std::vector<double> sorted(X.col(j).data(), X.col(j).data() + m);
        std::sort(sorted.begin(), sorted.end());

        for (int i = 0; i < m; ++i) {
            const auto rank = std::upper_bound(sorted.begin(), sorted.end(), X(i, j)) - sorted.begin();
            U(i, j) = rank * scale;
        }
    }

    return U;
}

double kendalls_tau(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    const int n = static_cast<int>(x.size());
    if (y.size() != x.size()) {
        throw std::invalid_argument("kendalls_tau requires samples of equal length");
    }
    if (n < 2) {
        throw std::invalid_argument("kendalls_tau requires at least 2 observations");
    }

    long long score = 0;    // concordant - discordant
    long long ties_x = 0;
    long long ties_y = 0;

    #pragma omp parallel for reduction(+:score, ties_x, ties_y) schedule(dynamic, 64)
    for (int i = 0; i < n - 1; ++i) {
        for (int j = i + 1; j < n; ++j) {
            const int dx = sign_of(x(i) - x(j));
            const int dy = sign_of(y(i) - y(j));
            score += dx * dy;
            ties_x += (dx == 0);
            ties_y += (dy == 0);
        }
    }

    const double pairs = 0.5 * n * (n - 1.0);
    const double denom = std::sqrt((pairs - ties_x) * (pairs - ties_y));
    if (denom == 0.0) {
        throw std::domain_error("Kendall's tau is undefined for a constant sample");
    }
    return score / denom;
}

double kendalls_tau(const Eigen::MatrixXd& X) {
    if (X.cols() < 2) {
        throw std::invalid_argument("kendalls_tau requires at least 2 columns");
    }
    return kendalls_tau(Eigen::VectorXd(X.col(0)), Eigen::VectorXd(X.col(1)));
}

Eigen::MatrixXd kendalls_tau_matrix(const Eigen::MatrixXd& X) {
    const int n = static_cast<int>(X.cols());
    if (n < 2) {
        throw std::invalid_argument("kendalls_tau_matrix requires at least 2 columns");
    }

    Eigen::MatrixXd tau = Eigen::MatrixXd::Identity(n, n);
    for (int a = 0; a < n - 1; ++a) {
        for (int b = a + 1; b < n; ++b) {
            tau(a, b) = kendalls_tau(Eigen::VectorXd(X.col(a)), Eigen::VectorXd(X.col(b)));
            tau(b, a) = tau(a, b);
        }
    }
    return tau;
}

} // namespace mnsig
