#include "donor_selector.hpp"
#include "../common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace postmatch {

std::vector<Candidate>
DonorSelector::nearest(const double *recipient,
                       const std::vector<int> &donor_rows,
                       const std::vector<double> &fitted, int dims,
                       const IDistanceMetric &metric) const {
  std::vector<Candidate> candidates;
  candidates.reserve(donor_rows.size());
  for (int row : donor_rows) {
    double d = metric.distance(recipient,
                               fitted.data() + static_cast<size_t>(row) * dims);
    // Undefined distances rank after every real one.
    if (std::isnan(d))
      d = std::numeric_limits<double>::infinity();
    candidates.push_back({row, d});
  }

  auto closer = [](const Candidate &a, const Candidate &b) {
    if (a.distance != b.distance)
      return a.distance < b.distance;
    return a.row < b.row;
  };
  size_t limit = std::min(static_cast<size_t>(options_.donors),
                          candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + limit,
                    candidates.end(), closer);
  candidates.resize(limit);
  return candidates;
}

int DonorSelector::select(const std::vector<Candidate> &ranked,
                          std::mt19937_64 &rng) const {
  if (ranked.empty())
    throw DataCoverageError("No donor candidates to select from.");

  switch (options_.policy) {
  case SelectionPolicy::NEAREST:
    return ranked.front().row;
  case SelectionPolicy::UNIFORM: {
    std::uniform_int_distribution<size_t> pick(0, ranked.size() - 1);
    return ranked[pick(rng)].row;
  }
  case SelectionPolicy::WEIGHTED: {
    std::vector<double> weights;
    weights.reserve(ranked.size());
    double total = 0.0;
    for (const auto &c : ranked) {
      weights.push_back(std::isfinite(c.distance)
                            ? 1.0 / (c.distance + options_.eps)
                            : 0.0);
      total += weights.back();
    }
    if (total <= 0.0)
      return ranked.front().row;
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return ranked[pick(rng)].row;
  }
  }
  return ranked.front().row;
}

} // namespace postmatch
