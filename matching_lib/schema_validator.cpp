#include "schema_validator.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

#include <cmath>
#include <set>

namespace postmatch {

bool is_supported_method(const std::string &method) {
  return method == "pmm" || method == "norm" || method == "custom";
}

std::vector<Group> find_groups(const ImputationSet &set) {
  const int n = set.rows();
  std::vector<Group> candidates;
  std::vector<std::vector<uint8_t>> patterns;

  for (int j = 0; j < set.cols(); ++j) {
    if (!set.is_visited(j) || !is_supported_method(set.method[j]))
      continue;

    std::vector<uint8_t> pattern(n);
    bool any_target = false;
    for (int i = 0; i < n; ++i) {
      pattern[i] = set.is_target(i, j) ? 1 : 0;
      any_target = any_target || pattern[i];
    }
    if (!any_target)
      continue;

    bool placed = false;
    for (size_t g = 0; g < patterns.size(); ++g) {
      if (patterns[g] == pattern) {
        candidates[g].push_back(j);
        placed = true;
        break;
      }
    }
    if (!placed) {
      patterns.push_back(std::move(pattern));
      candidates.push_back({j});
    }
  }

  std::vector<Group> groups;
  for (auto &group : candidates) {
    if (group.size() > 1)
      groups.push_back(std::move(group));
  }
  return groups;
}

namespace {

Group check_group(const ImputationSet &set, const GroupSpec &spec,
                  size_t position) {
  if (spec.empty())
    throw SchemaError("Argument 'groups' contains an empty group at position " +
                      std::to_string(position) + ".");

  const auto kind = spec.front().kind();
  for (const auto &ref : spec) {
    if (ref.is_none())
      throw SchemaError("Argument 'groups' contains an empty column reference "
                        "in the group at position " +
                        std::to_string(position) + ".");
    if (ref.kind() != kind)
      throw SchemaError("Argument 'groups' contains a group mixing column "
                        "names and column indices at position " +
                        std::to_string(position) + ".");
  }

  const auto names = set.data.names();
  Group group;
  std::set<int> seen;
  for (const auto &ref : spec) {
    int j = resolve_column(ref, names, "groups");
    if (!seen.insert(j).second)
      throw ConsistencyError("Argument 'groups' contains a group with "
                             "duplicate column " +
                             ref.to_string() + ".");
    group.push_back(j);
  }

  for (int j : group) {
    if (!set.is_visited(j))
      throw ConsistencyError("Group " + format_group(group) +
                             " contains column '" + set.data.column(j).name +
                             "' that is not in the visit sequence.");
    if (!is_supported_method(set.method[j]))
      throw SchemaError("Group " + format_group(group) + " contains column '" +
                        set.data.column(j).name +
                        "' with unsupported imputation method '" +
                        set.method[j] +
                        "'; it has to be one of 'pmm', 'norm', 'custom'.");
  }

  if (group.size() > 1) {
    for (int i = 0; i < set.rows(); ++i) {
      bool first = set.is_target(i, group.front());
      for (int j : group) {
        if (set.is_target(i, j) != first)
          throw ConsistencyError(
              "Group " + format_group(group) +
              " is not blockwise missing: in row " + std::to_string(i) +
              " column '" +
              set.data.column(first ? group.front() : j).name +
              "' is missing while column '" +
              set.data.column(first ? j : group.front()).name +
              "' is observed.");
      }
    }
  }
  return group;
}

} // namespace

std::vector<Group>
validate_groups(const ImputationSet &set,
                const std::optional<std::vector<GroupSpec>> &groups) {
  if (!groups) {
    std::vector<Group> found = find_groups(set);
    if (found.empty())
      throw DataCoverageError("There are no column groups with identical "
                              "missing data patterns and valid imputation "
                              "methods.");
    for (const auto &group : found)
      Logger::debug("Discovered column group " + format_group(group));
    return found;
  }

  if (groups->empty())
    throw SchemaError("Argument 'groups' is empty.");

  std::vector<Group> out;
  std::set<int> used;
  for (size_t g = 0; g < groups->size(); ++g) {
    Group group = check_group(set, (*groups)[g], g);
    for (int j : group) {
      if (!used.insert(j).second)
        throw ConsistencyError("Argument 'groups' contains column '" +
                               set.data.column(j).name +
                               "' in more than one group.");
    }
    out.push_back(std::move(group));
  }
  return out;
}

std::vector<std::optional<std::vector<double>>>
validate_weights(const std::optional<std::vector<WeightSpec>> &weights,
                 const std::vector<Group> &groups) {
  std::vector<std::optional<std::vector<double>>> out(groups.size());
  if (!weights)
    return out;

  if (weights->size() != groups.size())
    throw ConsistencyError("The arguments 'weights' and 'groups' have "
                           "different lengths (" +
                           std::to_string(weights->size()) + " vs " +
                           std::to_string(groups.size()) + ").");

  for (size_t g = 0; g < groups.size(); ++g) {
    const WeightSpec &spec = (*weights)[g];
    if (!spec)
      continue;
    const std::vector<double> &w = *spec;
    if (w.size() == 1 && (w[0] == 0.0 || w[0] == 1.0))
      continue;

    if (w.size() != groups[g].size())
      throw ConsistencyError("Weights of group " + format_group(groups[g]) +
                             " have length " + std::to_string(w.size()) +
                             ", expected " + std::to_string(groups[g].size()) +
                             ".");
    for (double v : w) {
      if (!std::isfinite(v))
        throw DomainError("Weights of group " + format_group(groups[g]) +
                          " contain an element that is either NaN or "
                          "infinite.");
      if (v <= 0.0)
        throw DomainError("Weights of group " + format_group(groups[g]) +
                          " contain a non-positive element " +
                          std::to_string(v) + ".");
    }
    out[g] = w;
  }
  return out;
}

std::vector<std::optional<int>>
validate_match_vars(const ImputationSet &set, const std::vector<Group> &groups,
                    const std::optional<std::vector<ColumnRef>> &match_vars) {
  std::vector<std::optional<int>> out(groups.size());
  if (!match_vars)
    return out;

  if (match_vars->size() != groups.size())
    throw ConsistencyError("Argument 'match_vars' has to be of the same length "
                           "as argument 'groups' (" +
                           std::to_string(match_vars->size()) + " vs " +
                           std::to_string(groups.size()) + ").");

  const auto names = set.data.names();
  for (size_t g = 0; g < groups.size(); ++g) {
    const ColumnRef &ref = (*match_vars)[g];
    if (ref.is_none())
      continue;

    int j = resolve_column(ref, names, "match_vars");
    const Column &col = set.data.column(j);
    for (int member : groups[g]) {
      if (member == j)
        throw ConsistencyError("Match variable '" + col.name +
                               "' is a member of its own group " +
                               format_group(groups[g]) + ".");
    }
    if (!col.is_discrete())
      throw DomainError("Match variable '" + col.name + "' of group " +
                        format_group(groups[g]) +
                        " has to be a factor or an integer column.");
    if (col.has_missing())
      throw DomainError("Match variable '" + col.name + "' of group " +
                        format_group(groups[g]) +
                        " must not contain missing values.");
    out[g] = j;
  }
  return out;
}

MatchOptions validate_options(const MatchOptionsInput &options) {
  MatchOptions out;

  if (options.donors < 1)
    throw DomainError("Argument 'donors' is smaller than 1.");
  out.donors = options.donors;

  if (!parse_metric(options.distance_metric, out.metric))
    throw DomainError("Argument 'distance_metric' is invalid ('" +
                      options.distance_metric +
                      "'). It has to be one of the following: 'manhattan', "
                      "'euclidian', 'mahalanobis', 'residual'.");

  if (options.selection_policy < 0 || options.selection_policy > 2)
    throw DomainError("Argument 'selection_policy' is not an integer between "
                      "0 and 2.");
  out.policy = static_cast<SelectionPolicy>(options.selection_policy);

  auto check_delta = [](double delta, const char *argname) {
    if (!std::isfinite(delta))
      throw DomainError(std::string("Argument '") + argname +
                        "' is either NaN or infinite.");
    if (delta <= 0.0)
      throw DomainError(std::string("Argument '") + argname +
                        "' is not bigger than 0.");
  };

  check_delta(options.ridge, "ridge");
  if (options.ridge > 1.0)
    throw DomainError("Argument 'ridge' is bigger than 1.");
  check_delta(options.eps, "eps");
  check_delta(options.maxcor, "maxcor");

  out.ridge = options.ridge;
  out.eps = options.eps;
  out.maxcor = options.maxcor;
  return out;
}

} // namespace postmatch
