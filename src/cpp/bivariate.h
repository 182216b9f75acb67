/*
    Bivariate normal and Student-t distribution functions.

    Implements:
    1. Gauss-Legendre quadrature nodes and weights on [-1, 1]
    2. Bivariate standard normal CDF (Genz 2004, Drezner-Wesolowsky
       integral with Gauss-Legendre quadrature)
    3. Bivariate standard Student-t CDF for integer degrees of freedom
       (Dunnett-Sobel recursion, as in Genz's BVTL)

    Reference: Genz (2004) - "Numerical computation of rectangular
    bivariate and trivariate normal and t probabilities", Statistics and
    Computing 14, pp. 251-260
*/

#ifndef MNSIG_BIVARIATE_H
#define MNSIG_BIVARIATE_H

#include <vector>

namespace mnsig {

constexpr double PI = 3.141592653589793238462643383279502884;
constexpr double TWO_PI = 2.0 * PI;

/**
 * @brief Gauss-Legendre rule on [-1, 1]
 * @param n Number of nodes
 * @param nodes Output abscissae (resized to n)
 * @param weights Output weights (resized to n)
 */
void gauss_legendre(int n, std::vector<double>& nodes, std::vector<double>& weights);

/**
 * @brief Standard normal CDF
 */
double normal_cdf(double x);

/**
 * @brief Standard normal quantile
 */
double normal_quantile(double p);

/**
 * @brief Student-t CDF with nu degrees of freedom
 */
double students_t_cdf(double x, int nu);

/**
 * @brief Student-t quantile with nu degrees of freedom
 */
double students_t_quantile(double p, int nu);

/**
 * @brief P(X < h, Y < k) for a standard bivariate normal with correlation r
 * @param h Upper limit for X
 * @param k Upper limit for Y
 * @param r Correlation in [-1, 1]
 * @return Probability in [0, 1]
 */
double bivariate_normal_cdf(double h, double k, double r);

/**
 * @brief P(X < h, Y < k) for a standard bivariate Student-t
 * @param h Upper limit for X
 * @param k Upper limit for Y
 * @param r Correlation in [-1, 1]
 * @param nu Degrees of freedom (>= 1)
 * @return Probability in [0, 1]
 */
double bivariate_t_cdf(double h, double k, double r, int nu);

} // namespace mnsig

#endif // MNSIG_BIVARIATE_H
