#pragma once
#include "../common/column_ref.hpp"
#include "../dataset_lib/imputation_set.hpp"
#include "i_prediction_engine.hpp"
#include "match_options.hpp"
#include "schema_validator.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace postmatch {

struct MatchRequest {
  std::optional<std::vector<GroupSpec>> groups;
  std::optional<std::vector<WeightSpec>> weights;
  std::optional<std::vector<ColumnRef>> match_vars;
  MatchOptionsInput options;
  uint64_t seed = 1;
};

struct GroupSummary {
  Group group;
  std::optional<int> match_var;
  int donors = 0;
  int recipients = 0;
  int partitions = 0;
};

struct MatchReport {
  MatchOptions options;
  std::vector<GroupSummary> groups;
};

/**
 * @brief Re-imputes every column group jointly by multivariate predictive
 *        mean matching and overwrites the group's imputed values.
 *
 * All arguments are validated and every group is analyzed before the first
 * match is computed; the set is only written once every match is known, so a
 * failing call leaves it unchanged.
 * @throws SchemaError, DomainError, ConsistencyError, DataCoverageError,
 *         StateError
 */
MatchReport post_match(ImputationSet &set, const IPredictionEngine &engine,
                       const MatchRequest &request);

} // namespace postmatch
