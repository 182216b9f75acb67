/*
    Implementation of the copula family selector
*/

#include "selector.h"
#include "dependence.h"
#include "logging.h"
#include "rank_stats.h"
#include "signature.h"
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace mnsig {

std::optional<double> admissible_tau(CopulaFamily family, double tau_hat, double tolerance) {
    if (supports_negative_dependence(family)) {
        return tau_hat;
    }
    if (tau_hat < tolerance) {
        return std::nullopt;
    }
    if (tau_hat < 0.0) {
        return 0.0;
    }
    if (tau_hat >= 1.0) {
        return 1.0 - MACHINE_EPS;
    }
    return tau_hat;
}

FamilySelector::FamilySelector(SelectorConfig config) : config_(std::move(config)) {
    config_.validate();
}

SelectionResult FamilySelector::select(const Eigen::MatrixXd& X) const {
    return select_pair(X, 0, 1);
}

SelectionResult FamilySelector::select_pair(const Eigen::MatrixXd& X, int dim1, int dim2) const {
    config_.validate();

    const EmpiricalSignature record = empirical_signature_for_pair(X, dim1, dim2, config_.grid_size);
    const double tau_hat = kendalls_tau(Eigen::VectorXd(X.col(dim1)), Eigen::VectorXd(X.col(dim2)));

    SelectionResult result = select_from_signature(record.esig, tau_hat);
    result.rv1 = record.rv1;
    result.rv2 = record.rv2;
    return result;
}

std::vector<SelectionResult> FamilySelector::select_all_pairs(const Eigen::MatrixXd& X) const {
    if (X.cols() < 2) {
        throw std::invalid_argument("select_all_pairs requires at least 2 columns");
    }

    std::vector<SelectionResult> results;
    const int n = static_cast<int>(X.cols());
    for (int dim1 = 0; dim1 < n - 1; ++dim1) {
        for (int dim2 = dim1 + 1; dim2 < n; ++dim2) {
            results.push_back(select_pair(X, dim1, dim2));
        }
    }
    return results;
}

SelectionResult FamilySelector::select_from_signature(const Eigen::VectorXd& empirical, double tau_hat) const {
    config_.validate();
    const int k = config_.grid_size;
    if (empirical.size() != static_cast<Eigen::Index>(k) * k) {
        throw std::invalid_argument("empirical signature has " + std::to_string(empirical.size()) +
                                    " cells, expected " + std::to_string(k * k));
    }

    const Eigen::VectorXd q = floor_zero_mass(empirical, config_.zero_mass_floor);

    SelectionResult result;
    result.tau_hat = tau_hat;

    double best = std::numeric_limits<double>::infinity();
    for (CopulaFamily family : config_.candidate_families) {
        const std::optional<double> tau = admissible_tau(family, tau_hat, config_.negative_tau_tolerance);
        if (!tau) {
            logger()->debug("{} excluded: tau_hat = {} is below {}",
                           family_name(family), tau_hat, config_.negative_tau_tolerance);
            result.divergences[family] = std::numeric_limits<double>::infinity();
            continue;
        }

        const Eigen::VectorXd p = floor_zero_mass(
            copula_signature(family, DependencySpec::kendall(*tau, config_.t_degrees_of_freedom), k),
            config_.zero_mass_floor);
        const double divergence = kl_divergence(p, q);
        result.divergences[family] = divergence;
        logger()->debug("{}: tau = {}, KL divergence = {}", family_name(family), *tau, divergence);

        // Strict comparison keeps the earliest candidate on ties
        if (divergence < best) {
            best = divergence;
            result.family = family;
        }
    }

    if (!result.family) {
        logger()->warn("no admissible copula family for tau_hat = {}", tau_hat);
        return result;
    }

    result.parameter = invert_dependency(*result.family, DependencyKind::Kendall, tau_hat,
                                         config_.t_degrees_of_freedom);
    logger()->info("selected {} (theta = {}, tau_hat = {}, KL = {})",
                   family_name(*result.family), result.parameter.value, tau_hat, best);
    return result;
}

SelectionResult select_family(const Eigen::MatrixXd& X, int k, const std::vector<CopulaFamily>& families) {
    SelectorConfig config;
    config.grid_size = k;
    config.candidate_families = families;
    return FamilySelector(config).select(X);
}

} // namespace mnsig
