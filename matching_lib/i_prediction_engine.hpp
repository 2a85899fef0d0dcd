#pragma once

#include "../dataset_lib/imputation_set.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace postmatch {

struct PredictionContext {
  const ImputationSet &set;
  const DataFrame &working; // completed frame of `imputation`
  int column;
  int imputation;
  const std::vector<uint8_t> &donors;
  const std::vector<uint8_t> &recipients;
};

// Per-row model values of one column. Rows outside the donor and recipient
// masks may be NaN.
struct ColumnPrediction {
  std::vector<double> fitted;    // donor side
  std::vector<double> predicted; // recipient side
};

class IPredictionEngine {
public:
  virtual ~IPredictionEngine() = default;
  virtual ColumnPrediction predict(const PredictionContext &ctx,
                                   std::mt19937_64 &rng) const = 0;
  virtual std::string name() const = 0;
};

} // namespace postmatch
