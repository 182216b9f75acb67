/*
    Implementation of the bivariate normal and Student-t CDFs
*/

#include "bivariate.h"
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mnsig {

namespace {

struct QuadratureRule {
    std::vector<double> nodes;
    std::vector<double> weights;

    explicit QuadratureRule(int n) { gauss_legendre(n, nodes, weights); }
};

// Rule size grows with |r| as in Genz's BVNU
const QuadratureRule& rule_for_correlation(double r) {
    static const QuadratureRule rule6(6);
    static const QuadratureRule rule12(12);
    static const QuadratureRule rule20(20);

    const double ar = std::abs(r);
    if (ar < 0.3) {
        return rule6;
    }
    if (ar < 0.75) {
        return rule12;
    }
    return rule20;
}

// P(X > dh, Y > dk)
double bivariate_normal_upper(double dh, double dk, double r) {
    const QuadratureRule& rule = rule_for_correlation(r);
    const std::vector<double>& x = rule.nodes;
    const std::vector<double>& w = rule.weights;
    const std::size_t n = x.size();

    double h = dh;
    double k = dk;
    double hk = h * k;
    double bvn = 0.0;

    if (std::abs(r) < 0.925) {
        const double hs = (h * h + k * k) / 2.0;
        const double asr = std::asin(r);
        for (std::size_t i = 0; i < n; ++i) {
            const double sn = std::sin(asr * (x[i] + 1.0) / 2.0);
            bvn += w[i] * std::exp((sn * hk - hs) / (1.0 - sn * sn));
        }
        return bvn * asr / (2.0 * TWO_PI) + normal_cdf(-h) * normal_cdf(-k);
    }

    if (r < 0.0) {
        k = -k;
        hk = -hk;
    }

    if (std::abs(r) < 1.0) {
        const double as = (1.0 - r) * (1.0 + r);
        double a = std::sqrt(as);
        const double bs = (h - k) * (h - k);
        const double c = (4.0 - hk) / 8.0;
        const double d = (12.0 - hk) / 16.0;

        bvn = a * std::exp(-(bs / as + hk) / 2.0)
            * (1.0 - c * (bs - as) * (1.0 - d * bs / 5.0) / 3.0 + c * d * as * as / 5.0);
        if (hk > -160.0) {
            const double b = std::sqrt(bs);
            bvn -= std::exp(-hk / 2.0) * std::sqrt(TWO_PI) * normal_cdf(-b / a) * b
                 * (1.0 - c * bs * (1.0 - d * bs / 5.0) / 3.0);
        }

        a = a / 2.0;
        for (std::size_t i = 0; i < n; ++i) {
            const double xs = std::pow(a * (x[i] + 1.0), 2);
            const double rs = std::sqrt(1.0 - xs);
            bvn += a * w[i] * (std::exp(-bs / (2.0 * xs) - hk / (1.0 + rs)) / rs
                             - std::exp(-(bs / xs + hk) / 2.0) * (1.0 + c * xs * (1.0 + d * xs)));
        }
        bvn = -bvn / TWO_PI;
    }

    if (r > 0.0) {
        return bvn + normal_cdf(-std::max(h, k));
    }
    bvn = -bvn;
    if (k > h) {
        bvn += normal_cdf(k) - normal_cdf(h);
    }
    return bvn;
}

double sign_of(double x) {
    return x >= 0.0 ? 1.0 : -1.0;
}

} // namespace

void gauss_legendre(int n, std::vector<double>& nodes, std::vector<double>& weights) {
    if (n < 1) {
        throw std::invalid_argument("gauss_legendre requires n >= 1");
    }
    nodes.assign(n, 0.0);
    weights.assign(n, 0.0);

    const int m = (n + 1) / 2;
    for (int i = 1; i <= m; ++i) {
        double z = std::cos(PI * (i - 0.25) / (n + 0.5));
        double z1 = 0.0;
        double pp = 0.0;
        do {
            double p1 = 1.0;
            double p2 = 0.0;
            for (int j = 1; j <= n; ++j) {
                const double p3 = p2;
                p2 = p1;
                p1 = ((2.0 * j - 1.0) * z * p2 - (j - 1.0) * p3) / j;
            }
            pp = n * (z * p1 - p2) / (z * z - 1.0);
            z1 = z;
            z = z1 - p1 / pp;
        } while (std::abs(z - z1) > 3.0e-15);

        nodes[i - 1] = -z;
        nodes[n - i] = z;
        weights[i - 1] = 2.0 / ((1.0 - z * z) * pp * pp);
        weights[n - i] = weights[i - 1];
    }
}

double normal_cdf(double x) {
    if (std::isinf(x)) {
        return x < 0.0 ? 0.0 : 1.0;
    }
    return boost::math::cdf(boost::math::normal_distribution<double>(), x);
}

double normal_quantile(double p) {
    return boost::math::quantile(boost::math::normal_distribution<double>(), p);
}

double students_t_cdf(double x, int nu) {
    if (std::isinf(x)) {
        return x < 0.0 ? 0.0 : 1.0;
    }
    return boost::math::cdf(boost::math::students_t_distribution<double>(nu), x);
}

double students_t_quantile(double p, int nu) {
    return boost::math::quantile(boost::math::students_t_distribution<double>(nu), p);
}

double bivariate_normal_cdf(double h, double k, double r) {
    if (r < -1.0 || r > 1.0 || std::isnan(r)) {
        throw std::domain_error("bivariate_normal_cdf: correlation must be in [-1, 1]");
    }
    if (h == -INFINITY || k == -INFINITY) {
        return 0.0;
    }
    if (h == INFINITY) {
        return normal_cdf(k);
    }
    if (k == INFINITY) {
        return normal_cdf(h);
    }

    const double p = bivariate_normal_upper(-h, -k, r);
    return std::max(0.0, std::min(1.0, p));
}

double bivariate_t_cdf(double h, double k, double r, int nu) {
    if (nu < 1) {
        throw std::invalid_argument("bivariate_t_cdf: degrees of freedom must be >= 1");
    }
    if (r < -1.0 || r > 1.0 || std::isnan(r)) {
        throw std::domain_error("bivariate_t_cdf: correlation must be in [-1, 1]");
    }
    if (h == -INFINITY || k == -INFINITY) {
        return 0.0;
    }
    if (h == INFINITY) {
        return students_t_cdf(k, nu);
    }
    if (k == INFINITY) {
        return students_t_cdf(h, nu);
    }

    const double snu = std::sqrt(static_cast<double>(nu));
    const double ors = 1.0 - r * r;
    const double hrk = h - r * k;
    const double krh = k - r * h;

    double xnhk = 0.0;
    double xnkh = 0.0;
    if (std::abs(hrk) + ors > 0.0) {
        xnhk = hrk * hrk / (hrk * hrk + ors * (nu + k * k));
        xnkh = krh * krh / (krh * krh + ors * (nu + h * h));
    }
    const double hs = sign_of(h - r * k);
    const double ks = sign_of(k - r * h);

    double bvt = 0.0;
    if (nu % 2 == 0) {
        bvt = std::atan2(std::sqrt(ors), -r) / TWO_PI;
        double gmph = h / std::sqrt(16.0 * (nu + h * h));
        double gmpk = k / std::sqrt(16.0 * (nu + k * k));
        double btnckh = 2.0 * std::atan2(std::sqrt(xnkh), std::sqrt(1.0 - xnkh)) / PI;
        double btpdkh = 2.0 * std::sqrt(xnkh * (1.0 - xnkh)) / PI;
        double btnchk = 2.0 * std::atan2(std::sqrt(xnhk), std::sqrt(1.0 - xnhk)) / PI;
        double btpdhk = 2.0 * std::sqrt(xnhk * (1.0 - xnhk)) / PI;

        for (int j = 1; j <= nu / 2; ++j) {
            bvt += gmph * (1.0 + ks * btnckh) + gmpk * (1.0 + hs * btnchk);
            btnckh += btpdkh;
            btpdkh = 2.0 * j * btpdkh * (1.0 - xnkh) / (2.0 * j + 1.0);
            btnchk += btpdhk;
            btpdhk = 2.0 * j * btpdhk * (1.0 - xnhk) / (2.0 * j + 1.0);
            gmph = gmph * (2.0 * j - 1.0) / (2.0 * j * (1.0 + h * h / nu));
            gmpk = gmpk * (2.0 * j - 1.0) / (2.0 * j * (1.0 + k * k / nu));
        }
    } else {
        const double qhrk = std::sqrt(h * h + k * k - 2.0 * r * h * k + nu * ors);
        const double hkrn = h * k + r * nu;
        const double hkn = h * k - nu;
        const double hpk = h + k;

        bvt = std::atan2(-snu * (hkn * qhrk + hpk * hkrn), hkn * hkrn - nu * hpk * qhrk) / TWO_PI;
        if (bvt < -1e-15) {
            bvt += 1.0;
        }

        double gmph = h / (TWO_PI * snu * (1.0 + h * h / nu));
        double gmpk = k / (TWO_PI * snu * (1.0 + k * k / nu));
        double btnckh = std::sqrt(xnkh);
        double btpdkh = btnckh;
        double btnchk = std::sqrt(xnhk);
        double btpdhk = btnchk;

        for (int j = 1; j <= (nu - 1) / 2; ++j) {
            bvt += gmph * (1.0 + ks * btnckh) + gmpk * (1.0 + hs * btnchk);
            btpdkh = (2.0 * j - 1.0) * btpdkh * (1.0 - xnkh) / (2.0 * j);
            btnckh += btpdkh;
            btpdhk = (2.0 * j - 1.0) * btpdhk * (1.0 - xnhk) / (2.0 * j);
            btnchk += btpdhk;
            gmph = 2.0 * j * gmph / ((2.0 * j + 1.0) * (1.0 + h * h / nu));
            gmpk = 2.0 * j * gmpk / ((2.0 * j + 1.0) * (1.0 + k * k / nu));
        }
    }

    return std::max(0.0, std::min(1.0, bvt));
}

} // namespace mnsig
