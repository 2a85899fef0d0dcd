#pragma once
#include "match_options.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace postmatch {

// Model values of the eligible donors of a group, row-major (donors x dims).
struct DonorPool {
  int dims = 0;
  std::vector<double> fitted;
  std::vector<double> observed;

  int size() const { return dims > 0 ? static_cast<int>(fitted.size()) / dims : 0; }
};

class IDistanceMetric {
public:
  virtual ~IDistanceMetric() = default;
  // a and b point to `dims` consecutive values.
  virtual double distance(const double *a, const double *b) const = 0;
  virtual std::string name() const = 0;
};

/**
 * @brief Fits the selected metric to a donor pool.
 *
 * Missing weights mean uniform weighting. The mahalanobis metric uses the
 * covariance of the fitted donor values, the residual metric the scaled
 * correlation of the donor residuals.
 */
std::unique_ptr<IDistanceMetric>
make_distance_metric(const MatchOptions &options,
                     const std::optional<std::vector<double>> &weights,
                     const DonorPool &pool);

} // namespace postmatch
