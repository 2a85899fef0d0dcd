#pragma once

#include <cstddef>
#include <vector>

namespace postmatch {

// Small dense row-major matrix used for covariance algebra and the imputed
// value blocks of an imputation set.
struct Mat {
  int r = 0, c = 0;
  std::vector<double> d;

  Mat() = default;
  Mat(int rows, int cols, double val = 0.0)
      : r(rows), c(cols), d(static_cast<size_t>(rows) * cols, val) {}

  double &operator()(int i, int j) { return d[static_cast<size_t>(i) * c + j]; }
  const double &operator()(int i, int j) const {
    return d[static_cast<size_t>(i) * c + j];
  }

  static Mat eye(int n) {
    Mat I(n, n);
    for (int i = 0; i < n; ++i)
      I(i, i) = 1.0;
    return I;
  }
};

Mat mul(const Mat &A, const Mat &B);
Mat transpose(const Mat &A);
std::vector<double> mul(const Mat &A, const std::vector<double> &x);

/**
 * @brief Lower Cholesky factor L with L * L^T = A.
 *
 * Pivots below 1e-12 are clamped, so the factor always exists for symmetric
 * positive semi-definite input.
 */
Mat cholesky(const Mat &A);

/**
 * @brief Inverse of a symmetric positive (semi-)definite matrix through its
 *        Cholesky factor.
 * @post Returns the identity when the result is not finite.
 */
Mat inv_spd(const Mat &A);

/**
 * @brief Sample covariance of the columns of X (rows are observations).
 * @post Uses divisor max(rows - 1, 1).
 */
Mat covariance(const Mat &X);

} // namespace postmatch
