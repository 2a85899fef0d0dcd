#pragma once
#include "../dataset_lib/imputation_set.hpp"
#include "schema_validator.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace postmatch {

// Rows of one match-variable value. Without a match variable a group has a
// single partition holding all eligible rows.
struct Partition {
  long long value = 0;
  std::vector<int> recipients;
  std::vector<int> donors;
};

struct GroupEligibility {
  Group group;
  std::optional<int> match_var;
  std::vector<uint8_t> complete_R; // eligible donors
  std::vector<uint8_t> complete_W; // eligible recipients
  std::vector<Partition> partitions;
  int donor_count = 0;
  int recipient_count = 0;
};

/**
 * @brief Determines, per column group, which rows may donate and which rows
 *        receive a new joint pattern.
 *
 * Predictor completeness is judged on a working frame whose target cells are
 * filled from completed imputation 0.
 */
class CompletenessAnalyzer {
public:
  explicit CompletenessAnalyzer(const ImputationSet &set);

  /**
   * @throws DataCoverageError when the group has no common donor or recipient
   *         pool, or when a match-variable value of a recipient is not held by
   *         any donor.
   * @throws StateError for a lone pmm column without a match variable.
   */
  GroupEligibility analyze(const Group &group,
                           const std::optional<int> &match_var) const;

  // Rows whose declared predictors of `col` are all observed.
  std::vector<uint8_t> predictor_complete(int col) const;

  const DataFrame &working() const noexcept { return working_; }

private:
  std::vector<Partition> build_partitions(const GroupEligibility &elig) const;

  const ImputationSet &set_;
  DataFrame working_;
};

} // namespace postmatch
