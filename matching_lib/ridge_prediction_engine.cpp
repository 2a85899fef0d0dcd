#include "ridge_prediction_engine.hpp"
#include "../common/matrix.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace postmatch {

namespace {

double mean_over(const std::vector<double> &v, const std::vector<int> &rows) {
  double sum = 0.0;
  for (int i : rows)
    sum += v[i];
  return sum / rows.size();
}

} // namespace

ColumnPrediction RidgePredictionEngine::predict(const PredictionContext &ctx,
                                                std::mt19937_64 &rng) const {
  const int n = ctx.working.rows();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  DesignMatrix design =
      expand_factors(ctx.working, ctx.set.predictors_of(ctx.column));
  const std::vector<double> &y = ctx.working.column(ctx.column).values;

  std::vector<int> train;
  for (int i = 0; i < n; ++i) {
    if (ctx.donors[i])
      train.push_back(i);
  }

  // Drop near-constant predictors and predictors collinear with the target.
  std::vector<const std::vector<double> *> keep;
  if (!train.empty()) {
    double y_mean = mean_over(y, train);
    double y_ss = 0.0;
    for (int i : train)
      y_ss += (y[i] - y_mean) * (y[i] - y_mean);

    for (const auto &x : design.columns) {
      double x_mean = mean_over(x, train);
      double x_ss = 0.0, xy = 0.0;
      for (int i : train) {
        x_ss += (x[i] - x_mean) * (x[i] - x_mean);
        xy += (x[i] - x_mean) * (y[i] - y_mean);
      }
      double var = train.size() > 1 ? x_ss / (train.size() - 1) : 0.0;
      if (var < eps_)
        continue;
      if (y_ss > 0.0 && std::abs(xy / std::sqrt(x_ss * y_ss)) > maxcor_)
        continue;
      keep.push_back(&x);
    }
  }

  const int P = static_cast<int>(keep.size()) + 1; // intercept term
  auto row_of = [&](int i, std::vector<double> &row) {
    row[0] = 1.0;
    for (int k = 1; k < P; ++k)
      row[k] = (*keep[k - 1])[i];
  };

  Mat XtX(P, P);
  std::vector<double> Xty(P, 0.0);
  std::vector<double> row(P);
  for (int i : train) {
    row_of(i, row);
    for (int a = 0; a < P; ++a) {
      Xty[a] += row[a] * y[i];
      for (int b = 0; b < P; ++b)
        XtX(a, b) += row[a] * row[b];
    }
  }

  Mat A = XtX;
  for (int a = 0; a < P; ++a)
    A(a, a) += ridge_ * XtX(a, a);
  Mat V = inv_spd(A);
  std::vector<double> beta = mul(V, Xty);

  std::vector<double> beta_star = beta;
  if (draw_ && !train.empty()) {
    double rss = 0.0;
    for (int i : train) {
      row_of(i, row);
      double fit = 0.0;
      for (int a = 0; a < P; ++a)
        fit += beta[a] * row[a];
      rss += (y[i] - fit) * (y[i] - fit);
    }
    int df = std::max(static_cast<int>(train.size()) - P, 1);
    std::chi_squared_distribution<double> chisq(df);
    double sigma = std::sqrt(rss / chisq(rng));

    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> z(P);
    for (auto &v : z)
      v = normal(rng);
    Mat L = cholesky(V);
    std::vector<double> shift = mul(L, z);
    for (int a = 0; a < P; ++a)
      beta_star[a] += sigma * shift[a];
  }

  ColumnPrediction out;
  out.fitted.assign(n, nan);
  out.predicted.assign(n, nan);
  for (int i = 0; i < n; ++i) {
    if (!ctx.donors[i] && !ctx.recipients[i])
      continue;
    row_of(i, row);
    double fit = 0.0, pred = 0.0;
    for (int a = 0; a < P; ++a) {
      fit += beta[a] * row[a];
      pred += beta_star[a] * row[a];
    }
    out.fitted[i] = fit;
    out.predicted[i] = pred;
  }
  return out;
}

} // namespace postmatch
