#include "common/errors.hpp"
#include "common/logger.hpp"
#include "matching_lib/post_matcher.hpp"
#include "matching_lib/ridge_prediction_engine.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <iostream>

using namespace postmatch;
using namespace postmatch::testing;

static MatchRequest dummy_request() {
  MatchRequest request;
  request.groups = promote(GroupSpec{ColumnRef::by_name("col.a"),
                                     ColumnRef::by_name("col.b"),
                                     ColumnRef::by_name("col.c")});
  request.seed = 20240611;
  return request;
}

// Imputed pattern of the dummy group for a target position and imputation.
static std::vector<double> pattern(const ImputationSet &set, int pos, int k) {
  return {set.imp[2](pos, k), set.imp[3](pos, k), set.imp[4](pos, k)};
}

static void assert_one_hot(const ImputationSet &set) {
  for (int pos = 0; pos < 3; ++pos) {
    for (int k = 0; k < set.m; ++k) {
      double sum = 0.0;
      for (double v : pattern(set, pos, k)) {
        assert(v == 0.0 || v == 1.0);
        sum += v;
      }
      assert(sum == 1.0);
    }
  }
}

static void test_one_hot_with_ridge_engine() {
  for (const char *metric : {"manhattan", "euclidian", "mahalanobis",
                             "residual"}) {
    for (int policy = 0; policy <= 2; ++policy) {
      ImputationSet set = binarized_set(4);
      MatchRequest request = dummy_request();
      request.options.distance_metric = metric;
      request.options.selection_policy = policy;
      RidgePredictionEngine engine;
      MatchReport report = post_match(set, engine, request);
      assert(report.groups.size() == 1);
      assert(report.groups[0].recipients == 3);
      assert(report.groups[0].donors == 9);
      assert_one_hot(set);
    }
  }
}

static void test_deterministic() {
  RidgePredictionEngine engine;
  ImputationSet first = binarized_set(5);
  ImputationSet second = binarized_set(5);
  post_match(first, engine, dummy_request());
  post_match(second, engine, dummy_request());
  for (int j = 2; j <= 4; ++j)
    assert(first.imp[j].d == second.imp[j].d);
}

static void test_nearest_donor() {
  ImputationSet set = binarized_set();
  MatchRequest request = dummy_request();
  request.options.distance_metric = "euclidian";
  request.options.selection_policy = 0;
  FixedPredictionEngine engine(0);
  post_match(set, engine, request);

  // x of recipients 2.1, 5.2, 9.3: closest donors are rows 3 (c), 6 (a)
  // and 10 (b).
  for (int k = 0; k < set.m; ++k) {
    assert((pattern(set, 0, k) == std::vector<double>{0, 0, 1}));
    assert((pattern(set, 1, k) == std::vector<double>{1, 0, 0}));
    assert((pattern(set, 2, k) == std::vector<double>{0, 1, 0}));
  }
}

static void test_observed_target_row() {
  // Row 0 (level a, x = 0) is re-imputed and is its own nearest donor.
  ImputationSet set = binarized_set();
  for (int j = 2; j <= 4; ++j) {
    set.where[0 * set.cols() + j] = 1;
    set.imp[j] = Mat(4, set.m, 1.0);
  }
  MatchRequest request = dummy_request();
  request.options.distance_metric = "euclidian";
  request.options.selection_policy = 0;
  MatchReport report = post_match(set, FixedPredictionEngine(0), request);
  assert(report.groups[0].donors == 10);
  assert(report.groups[0].recipients == 4);
  for (int k = 0; k < set.m; ++k) {
    assert((pattern(set, 0, k) == std::vector<double>{1, 0, 0}));
    assert((pattern(set, 1, k) == std::vector<double>{0, 0, 1}));
    assert((pattern(set, 3, k) == std::vector<double>{0, 1, 0}));
  }
}

static void test_match_variable() {
  ImputationSet set = binarized_set();
  MatchRequest request = dummy_request();
  request.match_vars = promote(ColumnRef::by_name("sex"));
  request.options.distance_metric = "euclidian";
  request.options.selection_policy = 0;
  FixedPredictionEngine engine(0);
  MatchReport report = post_match(set, engine, request);
  assert(report.groups[0].partitions == 2);

  // Female row 2 takes row 4 (b); male rows 5 and 9 take rows 7 (c) and
  // 11 (a).
  for (int k = 0; k < set.m; ++k) {
    assert((pattern(set, 0, k) == std::vector<double>{0, 1, 0}));
    assert((pattern(set, 1, k) == std::vector<double>{0, 0, 1}));
    assert((pattern(set, 2, k) == std::vector<double>{1, 0, 0}));
  }

  // Any policy keeps donors inside the recipient's partition. All female
  // donors carry level a, male donors carry b and c as well.
  ImputationSet uniform_set = binarized_set(6);
  for (int row : {4, 8, 10}) {
    uniform_set.data.set(row, 2, 1.0);
    uniform_set.data.set(row, 3, 0.0);
    uniform_set.data.set(row, 4, 0.0);
  }
  MatchRequest uniform = dummy_request();
  uniform.match_vars = promote(ColumnRef::by_index(1));
  uniform.options.donors = 10;
  post_match(uniform_set, engine, uniform);
  for (int k = 0; k < uniform_set.m; ++k)
    assert((pattern(uniform_set, 0, k) == std::vector<double>{1, 0, 0}));
}

static void test_untouched() {
  ImputationSet set = binarized_set();
  ImputationSet before = binarized_set();
  post_match(set, RidgePredictionEngine(), dummy_request());

  assert(set.imp[5].d == before.imp[5].d);
  assert(set.imp[0].d == before.imp[0].d);
  assert(set.where == before.where);
  assert(set.predictor_matrix == before.predictor_matrix);
  assert(set.method == before.method);
  for (int j = 0; j < set.cols(); ++j) {
    for (int i = 0; i < set.rows(); ++i) {
      if (!before.data.is_missing(i, j))
        assert(set.data.at(i, j) == before.data.at(i, j));
      else
        assert(set.data.is_missing(i, j));
    }
  }
}

static void test_failures_leave_set_unchanged() {
  RidgePredictionEngine engine;

  ImputationSet set = binarized_set();
  MatchRequest bad_metric = dummy_request();
  bad_metric.options.distance_metric = "cosine";
  assert(throws<DomainError>([&] { post_match(set, engine, bad_metric); }));
  assert(set.imp[2].d == binarized_set().imp[2].d);

  MatchRequest singleton;
  singleton.groups = promote(GroupSpec{ColumnRef::by_name("y")});
  assert(throws<StateError>([&] { post_match(set, engine, singleton); }));

  ImputationSet uncovered = binarized_set();
  for (int row : {1, 3, 7, 11})
    uncovered.data.set(row, 1, 0.0);
  MatchRequest by_sex = dummy_request();
  by_sex.match_vars = promote(ColumnRef::by_name("sex"));
  assert(throws<DataCoverageError>(
      [&] { post_match(uncovered, engine, by_sex); }));
  assert(uncovered.imp[3].d == binarized_set().imp[3].d);

  ImputationSet reshaped = binarized_set();
  reshaped.imp[3] = Mat(2, reshaped.m, 1.0);
  assert(throws<ConsistencyError>(
      [&] { post_match(reshaped, engine, dummy_request()); }));
}

static void test_discovered_groups() {
  ImputationSet set = binarized_set();
  MatchRequest request;
  request.weights = promote(WeightSpec(std::vector<double>{1.0, 2.0, 1.0}));
  MatchReport report = post_match(set, RidgePredictionEngine(), request);
  assert(report.groups.size() == 1);
  assert((report.groups[0].group == Group{2, 3, 4}));
  assert_one_hot(set);
}

int main() {
  Logger::instance().set_level(LogLevel::WARNING);
  std::cout << "Testing post-matching..." << std::endl;
  test_one_hot_with_ridge_engine();
  test_deterministic();
  test_nearest_donor();
  test_observed_target_row();
  test_match_variable();
  test_untouched();
  test_failures_leave_set_unchanged();
  test_discovered_groups();
  std::cout << "SUCCESS: matched patterns are consistent.\n";
  return 0;
}
