#pragma once
#include "i_prediction_engine.hpp"
#include "match_options.hpp"

namespace postmatch {

/**
 * @brief Bayesian linear regression with a ridge penalty, drawn the way the
 *        normal model of chained equations draws its parameters.
 *
 * Donors get values from the least-squares coefficients, recipients from a
 * posterior draw of the coefficients (unless drawing is disabled).
 */
class RidgePredictionEngine : public IPredictionEngine {
public:
  RidgePredictionEngine(double ridge = 1e-5, double eps = 1e-4,
                        double maxcor = 0.99, bool draw = true)
      : ridge_(ridge), eps_(eps), maxcor_(maxcor), draw_(draw) {}

  static RidgePredictionEngine from_options(const MatchOptions &options,
                                            bool draw = true) {
    return RidgePredictionEngine(options.ridge, options.eps, options.maxcor,
                                 draw);
  }

  ColumnPrediction predict(const PredictionContext &ctx,
                           std::mt19937_64 &rng) const override;

  std::string name() const override {
    return "RidgeRegression (ridge=" + std::to_string(ridge_) +
           (draw_ ? ", draw)" : ")");
  }

private:
  double ridge_;
  double eps_;
  double maxcor_;
  bool draw_;
};

} // namespace postmatch
