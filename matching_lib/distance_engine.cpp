#include "distance_engine.hpp"
#include "../common/errors.hpp"
#include "../common/matrix.hpp"

#include <algorithm>
#include <cmath>

namespace postmatch {

namespace {

class ManhattanMetric : public IDistanceMetric {
public:
  explicit ManhattanMetric(std::vector<double> w) : w_(std::move(w)) {}

  double distance(const double *a, const double *b) const override {
    double sum = 0.0;
    for (size_t k = 0; k < w_.size(); ++k)
      sum += w_[k] * std::abs(a[k] - b[k]);
    return sum;
  }
  std::string name() const override { return "manhattan"; }

private:
  std::vector<double> w_;
};

class EuclidianMetric : public IDistanceMetric {
public:
  explicit EuclidianMetric(std::vector<double> w) : w_(std::move(w)) {}

  double distance(const double *a, const double *b) const override {
    double sum = 0.0;
    for (size_t k = 0; k < w_.size(); ++k) {
      double diff = a[k] - b[k];
      sum += w_[k] * diff * diff;
    }
    return std::sqrt(sum);
  }
  std::string name() const override { return "euclidian"; }

private:
  std::vector<double> w_;
};

// Quadratic form d^T M d with d_k = scale_k * (a_k - b_k).
class QuadraticMetric : public IDistanceMetric {
public:
  QuadraticMetric(std::string name, std::vector<double> scale, Mat inverse)
      : name_(std::move(name)), scale_(std::move(scale)),
        inverse_(std::move(inverse)) {}

  double distance(const double *a, const double *b) const override {
    const int dims = static_cast<int>(scale_.size());
    std::vector<double> d(dims);
    for (int k = 0; k < dims; ++k)
      d[k] = scale_[k] * (a[k] - b[k]);
    double sum = 0.0;
    for (int i = 0; i < dims; ++i) {
      double row = 0.0;
      for (int j = 0; j < dims; ++j)
        row += inverse_(i, j) * d[j];
      sum += d[i] * row;
    }
    return std::max(sum, 0.0);
  }
  std::string name() const override { return name_; }

private:
  std::string name_;
  std::vector<double> scale_;
  Mat inverse_;
};

Mat pool_matrix(const std::vector<double> &values, int rows, int dims) {
  Mat X(rows, dims);
  X.d = values;
  return X;
}

std::unique_ptr<IDistanceMetric> mahalanobis(const MatchOptions &options,
                                             const std::vector<double> &w,
                                             const DonorPool &pool) {
  const int dims = pool.dims;
  Mat S = covariance(pool_matrix(pool.fitted, pool.size(), dims));
  for (int k = 0; k < dims; ++k) {
    double diag = S(k, k) > 0.0 ? S(k, k) : 1.0;
    S(k, k) += options.ridge * diag;
  }
  std::vector<double> scale(dims);
  for (int k = 0; k < dims; ++k)
    scale[k] = std::sqrt(w[k]);
  return std::make_unique<QuadraticMetric>("mahalanobis", std::move(scale),
                                           inv_spd(S));
}

std::unique_ptr<IDistanceMetric> residual(const MatchOptions &options,
                                          const std::vector<double> &w,
                                          const DonorPool &pool) {
  const int dims = pool.dims;
  const int rows = pool.size();
  std::vector<double> e(pool.observed.size());
  for (size_t i = 0; i < e.size(); ++i)
    e[i] = pool.observed[i] - pool.fitted[i];
  Mat C = covariance(pool_matrix(e, rows, dims));

  std::vector<double> sd(dims);
  for (int k = 0; k < dims; ++k)
    sd[k] = std::sqrt(std::max(C(k, k), 0.0));

  Mat R = Mat::eye(dims);
  for (int a = 0; a < dims; ++a) {
    for (int b = 0; b < dims; ++b) {
      if (a == b)
        continue;
      double cor = (sd[a] > 0.0 && sd[b] > 0.0) ? C(a, b) / (sd[a] * sd[b])
                                                : 0.0;
      R(a, b) = std::max(-options.maxcor, std::min(options.maxcor, cor));
    }
    R(a, a) += options.ridge;
  }

  std::vector<double> scale(dims);
  for (int k = 0; k < dims; ++k)
    scale[k] = std::sqrt(w[k]) / std::max(sd[k], options.eps);
  return std::make_unique<QuadraticMetric>("residual", std::move(scale),
                                           inv_spd(R));
}

} // namespace

std::unique_ptr<IDistanceMetric>
make_distance_metric(const MatchOptions &options,
                     const std::optional<std::vector<double>> &weights,
                     const DonorPool &pool) {
  std::vector<double> w =
      weights ? *weights : std::vector<double>(pool.dims, 1.0);
  if (static_cast<int>(w.size()) != pool.dims)
    throw ConsistencyError("Weight vector has " + std::to_string(w.size()) +
                           " entries for " + std::to_string(pool.dims) +
                           " dimensions.");

  switch (options.metric) {
  case DistanceMetric::MANHATTAN:
    return std::make_unique<ManhattanMetric>(std::move(w));
  case DistanceMetric::EUCLIDIAN:
    return std::make_unique<EuclidianMetric>(std::move(w));
  case DistanceMetric::MAHALANOBIS:
    return mahalanobis(options, w, pool);
  case DistanceMetric::RESIDUAL:
    return residual(options, w, pool);
  }
  throw DomainError("Unknown distance metric.");
}

} // namespace postmatch
