#include "matrix.hpp"

#include <cmath>
#include <stdexcept>

namespace postmatch {

Mat mul(const Mat &A, const Mat &B) {
  if (A.c != B.r)
    throw std::invalid_argument("Shape mismatch in mul");
  Mat C(A.r, B.c);
  for (int i = 0; i < A.r; ++i) {
    for (int k = 0; k < A.c; ++k) {
      double val = A(i, k);
      if (val == 0)
        continue;
      for (int j = 0; j < B.c; ++j) {
        C(i, j) += val * B(k, j);
      }
    }
  }
  return C;
}

std::vector<double> mul(const Mat &A, const std::vector<double> &x) {
  if (A.c != static_cast<int>(x.size()))
    throw std::invalid_argument("Shape mismatch in mul");
  std::vector<double> y(A.r, 0.0);
  for (int i = 0; i < A.r; ++i) {
    double sum = 0.0;
    for (int j = 0; j < A.c; ++j)
      sum += A(i, j) * x[j];
    y[i] = sum;
  }
  return y;
}

Mat transpose(const Mat &A) {
  Mat T(A.c, A.r);
  for (int i = 0; i < A.r; ++i)
    for (int j = 0; j < A.c; ++j)
      T(j, i) = A(i, j);
  return T;
}

Mat cholesky(const Mat &A) {
  if (A.r != A.c)
    throw std::invalid_argument("cholesky requires a square matrix");
  int n = A.r;
  Mat L(n, n);

  for (int i = 0; i < n; i++) {
    for (int j = 0; j <= i; j++) {
      double sum = 0;
      for (int k = 0; k < j; k++)
        sum += L(i, k) * L(j, k);

      if (i == j) {
        double val = A(i, i) - sum;
        if (val < 1e-12)
          val = 1e-12;
        L(i, j) = std::sqrt(val);
      } else {
        L(i, j) = (A(i, j) - sum) / L(j, j);
      }
    }
  }
  return L;
}

Mat inv_spd(const Mat &A) {
  int n = A.r;
  Mat L = cholesky(A);

  // Invert L
  Mat Linv(n, n);
  for (int i = 0; i < n; i++) {
    Linv(i, i) = 1.0 / L(i, i);
    for (int j = 0; j < i; j++) {
      double sum = 0;
      for (int k = j; k < i; k++) {
        sum += L(i, k) * Linv(k, j);
      }
      Linv(i, j) = -Linv(i, i) * sum;
    }
  }

  // Inv = Linv^T * Linv
  Mat res = mul(transpose(Linv), Linv);

  for (double val : res.d) {
    if (!std::isfinite(val))
      return Mat::eye(n);
  }
  return res;
}

Mat covariance(const Mat &X) {
  Mat S(X.c, X.c);
  if (X.r == 0)
    return S;

  std::vector<double> means(X.c, 0.0);
  for (int i = 0; i < X.r; ++i)
    for (int j = 0; j < X.c; ++j)
      means[j] += X(i, j);
  for (int j = 0; j < X.c; ++j)
    means[j] /= X.r;

  double denom = X.r > 1 ? static_cast<double>(X.r - 1) : 1.0;
  for (int a = 0; a < X.c; ++a) {
    for (int b = a; b < X.c; ++b) {
      double dot = 0.0;
      for (int i = 0; i < X.r; ++i)
        dot += (X(i, a) - means[a]) * (X(i, b) - means[b]);
      S(a, b) = dot / denom;
      S(b, a) = S(a, b);
    }
  }
  return S;
}

} // namespace postmatch
