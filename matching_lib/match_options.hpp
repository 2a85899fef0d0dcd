#pragma once
#include <string>

namespace postmatch {

enum class DistanceMetric { MANHATTAN, EUCLIDIAN, MAHALANOBIS, RESIDUAL };

enum class SelectionPolicy { NEAREST = 0, UNIFORM = 1, WEIGHTED = 2 };

// Matching options as supplied by the caller, before validation.
struct MatchOptionsInput {
  std::string distance_metric = "residual";
  int donors = 5;
  int selection_policy = 1;
  double ridge = 1e-5;
  double eps = 1e-4;
  double maxcor = 0.99;
};

// Validated matching options.
struct MatchOptions {
  DistanceMetric metric = DistanceMetric::RESIDUAL;
  int donors = 5;
  SelectionPolicy policy = SelectionPolicy::UNIFORM;
  double ridge = 1e-5;
  double eps = 1e-4;
  double maxcor = 0.99;
};

inline const char *metric_name(DistanceMetric metric) {
  switch (metric) {
  case DistanceMetric::MANHATTAN:
    return "manhattan";
  case DistanceMetric::EUCLIDIAN:
    return "euclidian";
  case DistanceMetric::MAHALANOBIS:
    return "mahalanobis";
  case DistanceMetric::RESIDUAL:
    return "residual";
  }
  return "unknown";
}

inline bool parse_metric(const std::string &name, DistanceMetric &out) {
  if (name == "manhattan")
    out = DistanceMetric::MANHATTAN;
  else if (name == "euclidian")
    out = DistanceMetric::EUCLIDIAN;
  else if (name == "mahalanobis")
    out = DistanceMetric::MAHALANOBIS;
  else if (name == "residual")
    out = DistanceMetric::RESIDUAL;
  else
    return false;
  return true;
}

} // namespace postmatch
