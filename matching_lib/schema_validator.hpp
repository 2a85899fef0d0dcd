#pragma once
#include "../common/column_ref.hpp"
#include "../dataset_lib/imputation_set.hpp"
#include "match_options.hpp"

#include <optional>
#include <string>
#include <vector>

namespace postmatch {

// A group as given by the caller: column names or column indices.
using GroupSpec = std::vector<ColumnRef>;

// Weights of one group; std::nullopt, {0} and {1} request uniform weights.
using WeightSpec = std::optional<std::vector<double>>;

using Group = std::vector<int>;

// Promotes a bare group, weight vector or match variable to a one-element
// collection.
template <typename T> std::vector<T> promote(T value) {
  std::vector<T> out;
  out.push_back(std::move(value));
  return out;
}

// Imputation methods whose results may be re-matched.
bool is_supported_method(const std::string &method);

/**
 * @brief Proposes groups of visited columns that share a supported method
 *        and an identical, non-empty target pattern.
 * @post Groups hold at least two columns and are ordered by their first column.
 */
std::vector<Group> find_groups(const ImputationSet &set);

/**
 * @brief Resolves and checks the column groups.
 *
 * Without `groups` the candidates of find_groups() are returned.
 * @throws DataCoverageError when no groups are given and none are found.
 * @throws SchemaError on empty or mixed groups, unknown columns and
 *         unsupported imputation methods.
 * @throws ConsistencyError on duplicate columns, columns outside the visit
 *         sequence and groups that are not blockwise missing.
 */
std::vector<Group>
validate_groups(const ImputationSet &set,
                const std::optional<std::vector<GroupSpec>> &groups);

/**
 * @brief Normalizes per-group weights; std::nullopt entries mean uniform.
 * @throws ConsistencyError on length mismatches, DomainError on non-finite or
 *         non-positive weights.
 */
std::vector<std::optional<std::vector<double>>>
validate_weights(const std::optional<std::vector<WeightSpec>> &weights,
                 const std::vector<Group> &groups);

/**
 * @brief Resolves per-group match variables; std::nullopt means no
 *        restriction.
 * @throws SchemaError on unknown columns, ConsistencyError on a length mismatch
 *         or a match variable inside its own group, DomainError on
 *         non-discrete or incomplete columns.
 */
std::vector<std::optional<int>>
validate_match_vars(const ImputationSet &set, const std::vector<Group> &groups,
                    const std::optional<std::vector<ColumnRef>> &match_vars);

/**
 * @throws DomainError on any option outside of its domain.
 */
MatchOptions validate_options(const MatchOptionsInput &options);

} // namespace postmatch
