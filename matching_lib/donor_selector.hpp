#pragma once
#include "distance_engine.hpp"
#include "match_options.hpp"

#include <random>
#include <vector>

namespace postmatch {

struct Candidate {
  int row;
  double distance;
};

class DonorSelector {
public:
  explicit DonorSelector(const MatchOptions &options) : options_(options) {}

  /**
   * @brief Ranks donors by distance to a recipient and keeps the closest.
   *
   * `fitted` is row-major (rows x dims) and indexed by data row. Ties in
   * distance are broken by the lower row index.
   * @post At most `donors` candidates, ascending.
   */
  std::vector<Candidate> nearest(const double *recipient,
                                 const std::vector<int> &donor_rows,
                                 const std::vector<double> &fitted, int dims,
                                 const IDistanceMetric &metric) const;

  // Picks one candidate according to the selection policy.
  int select(const std::vector<Candidate> &ranked,
             std::mt19937_64 &rng) const;

private:
  MatchOptions options_;
};

} // namespace postmatch
