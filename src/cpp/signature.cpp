/*
    Implementation of the multinomial signatures
*/

#include "signature.h"
#include "dependence.h"
#include "grid.h"
#include "logging.h"
#include "rank_stats.h"
#include <omp.h>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace mnsig {

namespace {

void check_sample(const Eigen::MatrixXd& X) {
    if (X.rows() < 1) {
        throw std::invalid_argument("sample matrix must have at least 1 row");
    }
    if (X.cols() < 2) {
        throw std::invalid_argument("sample matrix must have at least 2 columns, got " +
                                    std::to_string(X.cols()));
    }
}

// Bin one pair of pseudo-observation columns into the grid
EmpiricalSignature bin_pair(const Eigen::MatrixXd& U, int dim1, int dim2, const GridPartition& grid, long long& missed) {
    const int m = static_cast<int>(U.rows());
    std::vector<long long> counts(grid.size(), 0);

    for (int i = 0; i < m; ++i) {
        const int cell = grid.locate(U(i, dim1), U(i, dim2));
        if (cell < 0) {
            ++missed;
            continue;
        }
        ++counts[cell];
    }

    EmpiricalSignature record;
    record.rv1 = dim1 + 1;
    record.rv2 = dim2 + 1;
    record.esig.resize(static_cast<Eigen::Index>(grid.size()));
    for (std::size_t c = 0; c < counts.size(); ++c) {
        record.esig(c) = static_cast<double>(counts[c]) / m;
    }
    return record;
}

} // namespace

Eigen::VectorXd signature_from_volume(const VolumeFunction& volume, int k) {
    const std::shared_ptr<const GridPartition> grid = GridPartition::shared(k);
    const std::vector<GridCell>& cells = grid->cells();

    Eigen::VectorXd sig(static_cast<Eigen::Index>(cells.size()));
    for (std::size_t c = 0; c < cells.size(); ++c) {
        const GridCell& cell = cells[c];
        sig(c) = volume(cell.u1v1, cell.u1v2, cell.u2v1, cell.u2v2);
    }
    return sig;
}

Eigen::VectorXd copula_signature(CopulaFamily family, const DependencySpec& dependency, int k) {
    const DependencySpec native = dependency.kind == DependencyKind::Native
        ? dependency
        : invert_dependency(family, dependency.kind, dependency.value, dependency.dof);
    validate_native(family, native);

    Eigen::VectorXd sig = signature_from_volume(
        [family, &native](const Eigen::Vector2d& u1v1,
                          const Eigen::Vector2d& u1v2,
                          const Eigen::Vector2d& u2v1,
                          const Eigen::Vector2d& u2v2) {
            return cvolume(family, u1v1, u1v2, u2v1, u2v2, native);
        },
        k);

    logger()->trace("{} signature (K={}, theta={}) total mass {}", family_name(family), k, native.value, sig.sum());
    return sig;
}

EmpiricalSignature empirical_signature_for_pair(const Eigen::MatrixXd& X, int dim1, int dim2, int k) {
    check_sample(X);
    if (dim1 < 0 || dim2 <= dim1 || dim2 >= X.cols()) {
        throw std::invalid_argument("column pair (" + std::to_string(dim1) + ", " + std::to_string(dim2) +
                                    ") is not valid for " + std::to_string(X.cols()) + " columns");
    }
    const std::shared_ptr<const GridPartition> grid = GridPartition::shared(k);

    Eigen::MatrixXd pair(X.rows(), 2);
    pair.col(0) = X.col(dim1);
    pair.col(1) = X.col(dim2);
    const Eigen::MatrixXd U = probability_integral_transform(pair);

    long long missed = 0;
    EmpiricalSignature record = bin_pair(U, 0, 1, *grid, missed);
    record.rv1 = dim1 + 1;
    record.rv2 = dim2 + 1;
    if (missed > 0) {
        logger()->warn("{} of {} observations of pair ({}, {}) fell outside the grid",
                       missed, X.rows(), record.rv1, record.rv2);
    }
    return record;
}

Eigen::VectorXd pseudo_observation_signature(const Eigen::MatrixXd& U, int k) {
    check_sample(U);
    const std::shared_ptr<const GridPartition> grid = GridPartition::shared(k);

    long long missed = 0;
    const EmpiricalSignature record = bin_pair(U, 0, 1, *grid, missed);
    if (missed > 0) {
        logger()->warn("{} of {} pseudo-observations fell outside the grid", missed, U.rows());
    }
    return record.esig;
}

std::vector<EmpiricalSignature> empirical_signature(const Eigen::MatrixXd& X, int k) {
    check_sample(X);
    const std::shared_ptr<const GridPartition> grid = GridPartition::shared(k);
    const Eigen::MatrixXd U = probability_integral_transform(X);

    const int n = static_cast<int>(X.cols());
    std::vector<std::pair<int, int>> pairs;
    for (int dim1 = 0; dim1 < n - 1; ++dim1) {
        for (int dim2 = dim1 + 1; dim2 < n; ++dim2) {
            pairs.emplace_back(dim1, dim2);
        }
    }

    std::vector<EmpiricalSignature> esig(pairs.size());
    long long missed = 0;

    #pragma omp parallel for reduction(+:missed)
    for (int p = 0; p < static_cast<int>(pairs.size()); ++p) {
        long long pair_missed = 0;
        esig[p] = bin_pair(U, pairs[p].first, pairs[p].second, *grid, pair_missed);
        missed += pair_missed;
    }

    if (missed > 0) {
        logger()->warn("{} observations fell outside the grid across {} pairs", missed, pairs.size());
    }
    return esig;
}

Eigen::VectorXd floor_zero_mass(const Eigen::VectorXd& p, double floor) {
    Eigen::VectorXd floored = p;
    for (Eigen::Index i = 0; i < floored.size(); ++i) {
        if (floored(i) == 0.0) {
            floored(i) = floor;
        }
    }
    return floored;
}

double kl_divergence(const Eigen::VectorXd& p, const Eigen::VectorXd& q) {
    if (p.size() != q.size()) {
        throw std::invalid_argument("kl_divergence requires vectors of equal length");
    }

    double divergence = 0.0;
    for (Eigen::Index i = 0; i < p.size(); ++i) {
        if (p(i) == 0.0) {
            continue;
        }
        if (q(i) == 0.0) {
            return std::numeric_limits<double>::infinity();
        }
        divergence += p(i) * std::log(p(i) / q(i));
    }
    return divergence;
}

} // namespace mnsig
