#include "completeness_analyzer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

#include <cmath>
#include <map>

namespace postmatch {

CompletenessAnalyzer::CompletenessAnalyzer(const ImputationSet &set)
    : set_(set), working_(set.completed_frame(0)) {}

std::vector<uint8_t> CompletenessAnalyzer::predictor_complete(int col) const {
  DesignMatrix design = expand_factors(working_, set_.predictors_of(col));
  return complete_cases(design);
}

GroupEligibility
CompletenessAnalyzer::analyze(const Group &group,
                              const std::optional<int> &match_var) const {
  const int n = set_.rows();
  GroupEligibility elig;
  elig.group = group;
  elig.match_var = match_var;

  elig.complete_R.assign(n, 1);
  elig.complete_W.assign(n, 1);
  for (int j : group) {
    std::vector<uint8_t> complete = predictor_complete(j);
    for (int i = 0; i < n; ++i) {
      // A target cell with an observed value still serves as a donor.
      bool observed = !set_.data.is_missing(i, j);
      elig.complete_R[i] = elig.complete_R[i] && complete[i] && observed;
      elig.complete_W[i] =
          elig.complete_W[i] && complete[i] && set_.is_target(i, j);
    }
  }

  for (int i = 0; i < n; ++i) {
    elig.donor_count += elig.complete_R[i];
    elig.recipient_count += elig.complete_W[i];
  }
  if (elig.donor_count == 0)
    throw DataCoverageError("Group " + format_group(group) +
                            " has no rows with observed values and complete "
                            "predictors that could act as donors.");
  if (elig.recipient_count == 0)
    throw DataCoverageError("Group " + format_group(group) +
                            " has no imputation targets with complete "
                            "predictors.");

  elig.partitions = build_partitions(elig);
  if (!match_var && group.size() == 1 && set_.method[group.front()] == "pmm")
    throw StateError("Group " + format_group(group) +
                     " holds a single pmm column and no match variable; "
                     "there is nothing to match on jointly.");
  Logger::debug("Group " + format_group(group) + ": " +
                std::to_string(elig.donor_count) + " donors, " +
                std::to_string(elig.recipient_count) + " recipients, " +
                std::to_string(elig.partitions.size()) + " partitions");
  return elig;
}

std::vector<Partition>
CompletenessAnalyzer::build_partitions(const GroupEligibility &elig) const {
  const int n = set_.rows();
  if (!elig.match_var) {
    Partition all;
    for (int i = 0; i < n; ++i) {
      if (elig.complete_R[i])
        all.donors.push_back(i);
      if (elig.complete_W[i])
        all.recipients.push_back(i);
    }
    return {all};
  }

  const int mv = *elig.match_var;
  std::map<long long, Partition> by_value;
  for (int i = 0; i < n; ++i) {
    if (!elig.complete_R[i] && !elig.complete_W[i])
      continue;
    long long value = std::llround(working_.at(i, mv));
    Partition &part = by_value[value];
    part.value = value;
    if (elig.complete_R[i])
      part.donors.push_back(i);
    if (elig.complete_W[i])
      part.recipients.push_back(i);
  }

  std::vector<Partition> partitions;
  for (auto &entry : by_value) {
    Partition &part = entry.second;
    if (part.recipients.empty())
      continue;
    if (part.donors.empty()) {
      const Column &col = working_.column(mv);
      std::string label = std::to_string(entry.first);
      if (col.type == ColumnType::FACTOR && entry.first >= 0 &&
          entry.first < static_cast<long long>(col.levels.size()))
        label = "'" + col.levels[entry.first] + "'";
      throw DataCoverageError("Group " + format_group(elig.group) +
                              ": value " + label + " of match variable '" +
                              col.name +
                              "' occurs among recipients but not among "
                              "donors.");
    }
    partitions.push_back(std::move(part));
  }
  return partitions;
}

} // namespace postmatch
