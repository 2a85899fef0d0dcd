#include "post_matcher.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "completeness_analyzer.hpp"
#include "distance_engine.hpp"
#include "donor_selector.hpp"
#include "result_assembler.hpp"

#include <exception>
#include <random>

namespace postmatch {

namespace {

std::mt19937_64 make_rng(uint64_t seed, size_t group, int imputation) {
  std::seed_seq seq{static_cast<uint32_t>(seed),
                    static_cast<uint32_t>(seed >> 32),
                    static_cast<uint32_t>(group),
                    static_cast<uint32_t>(imputation)};
  return std::mt19937_64(seq);
}

// Chooses one donor per recipient of a group for one completed imputation.
std::vector<int> match_group(const ImputationSet &set, const DataFrame &working,
                             int imputation, const GroupEligibility &elig,
                             const std::optional<std::vector<double>> &weights,
                             const IPredictionEngine &engine,
                             const DonorSelector &selector,
                             const MatchOptions &options,
                             std::mt19937_64 &rng) {
  const int n = set.rows();
  const int dims = static_cast<int>(elig.group.size());

  std::vector<double> fitted(static_cast<size_t>(n) * dims);
  std::vector<double> predicted(static_cast<size_t>(n) * dims);
  for (int k = 0; k < dims; ++k) {
    PredictionContext ctx{set,          working,         elig.group[k],
                          imputation,   elig.complete_R, elig.complete_W};
    ColumnPrediction pred = engine.predict(ctx, rng);
    for (int i = 0; i < n; ++i) {
      fitted[static_cast<size_t>(i) * dims + k] = pred.fitted[i];
      predicted[static_cast<size_t>(i) * dims + k] = pred.predicted[i];
    }
  }

  DonorPool pool;
  pool.dims = dims;
  for (int i = 0; i < n; ++i) {
    if (!elig.complete_R[i])
      continue;
    for (int k = 0; k < dims; ++k) {
      pool.fitted.push_back(fitted[static_cast<size_t>(i) * dims + k]);
      pool.observed.push_back(set.data.at(i, elig.group[k]));
    }
  }
  auto metric = make_distance_metric(options, weights, pool);

  std::vector<int> chosen;
  chosen.reserve(elig.recipient_count);
  for (const auto &part : elig.partitions) {
    for (int r : part.recipients) {
      auto ranked =
          selector.nearest(predicted.data() + static_cast<size_t>(r) * dims,
                           part.donors, fitted, dims, *metric);
      chosen.push_back(selector.select(ranked, rng));
    }
  }
  return chosen;
}

} // namespace

MatchReport post_match(ImputationSet &set, const IPredictionEngine &engine,
                       const MatchRequest &request) {
  set.check_shape();
  std::vector<Group> groups = validate_groups(set, request.groups);
  auto weights = validate_weights(request.weights, groups);
  auto match_vars = validate_match_vars(set, groups, request.match_vars);
  MatchReport report;
  report.options = validate_options(request.options);

  CompletenessAnalyzer analyzer(set);
  std::vector<GroupEligibility> eligibility;
  for (size_t g = 0; g < groups.size(); ++g)
    eligibility.push_back(analyzer.analyze(groups[g], match_vars[g]));

  Logger::info("Post-matching " + std::to_string(groups.size()) +
               " groups over " + std::to_string(set.m) +
               " imputations (metric=" + metric_name(report.options.metric) +
               ", donors=" + std::to_string(report.options.donors) +
               ", engine=" + engine.name() + ")");

  std::vector<GroupMatch> matches(groups.size());
  for (size_t g = 0; g < groups.size(); ++g) {
    matches[g].group = groups[g];
    for (const auto &part : eligibility[g].partitions)
      matches[g].recipients.insert(matches[g].recipients.end(),
                                   part.recipients.begin(),
                                   part.recipients.end());
    matches[g].donors.resize(set.m);
  }

  DonorSelector selector(report.options);
  std::vector<std::exception_ptr> failures(set.m);

#ifdef USE_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
  for (int i = 0; i < set.m; ++i) {
    try {
      DataFrame working = set.completed_frame(i);
      for (size_t g = 0; g < groups.size(); ++g) {
        std::mt19937_64 rng = make_rng(request.seed, g, i);
        matches[g].donors[i] =
            match_group(set, working, i, eligibility[g], weights[g], engine,
                        selector, report.options, rng);
      }
    } catch (...) {
      failures[i] = std::current_exception();
    }
  }
  for (const auto &failure : failures) {
    if (failure)
      std::rethrow_exception(failure);
  }

  ResultAssembler::assemble(set, matches);

  for (size_t g = 0; g < groups.size(); ++g) {
    GroupSummary summary;
    summary.group = groups[g];
    summary.match_var = match_vars[g];
    summary.donors = eligibility[g].donor_count;
    summary.recipients = eligibility[g].recipient_count;
    summary.partitions = static_cast<int>(eligibility[g].partitions.size());
    Logger::info("Group " + format_group(summary.group) + ": matched " +
                 std::to_string(summary.recipients) + " recipients from " +
                 std::to_string(summary.donors) + " donors");
    report.groups.push_back(std::move(summary));
  }
  return report;
}

} // namespace postmatch
