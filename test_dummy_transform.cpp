#include "common/errors.hpp"
#include "common/logger.hpp"
#include "dataset_lib/dummy_transform.hpp"
#include "matching_lib/post_matcher.hpp"
#include "matching_lib/ridge_prediction_engine.hpp"
#include "test_fixtures.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace postmatch;
using namespace postmatch::testing;

static void test_binarize() {
  DataFrame src = source_frame();
  BinarizedFrame bin = binarize(src);

  assert(bin.data.cols() == 6);
  assert((bin.data.names() == std::vector<std::string>{
                                  "x", "sex", "col.a", "col.b", "col.c", "y"}));
  assert(bin.data.column(3).type == ColumnType::INTEGER);
  assert(bin.data.at(1, 3) == 1.0 && bin.data.at(1, 2) == 0.0);
  for (int j = 2; j <= 4; ++j)
    assert(bin.data.is_missing(5, j));

  const DummyParams &params = bin.params;
  assert(params.n_src_cols == 4 && params.n_pad_cols == 6);
  assert((params.src_factor_cols == std::vector<int>{2}));
  assert((params.dummy_cols[0] == std::vector<int>{2, 3, 4}));
  assert(params.src_levels[0].size() == 3);

  // Indicators of one factor never predict each other.
  const int q = 6;
  for (int a = 2; a <= 4; ++a) {
    for (int b = 2; b <= 4; ++b)
      assert(bin.pred_matrix[a * q + b] == 0);
    assert(bin.pred_matrix[a * q + 0] == 1);
    assert(bin.pred_matrix[5 * q + a] == 1);
  }

  // Explicit columns and predictor matrix.
  std::vector<int> pred(16, 0);
  pred[2 * 4 + 0] = 1;
  pred[3 * 4 + 2] = 2;
  BinarizedFrame custom =
      binarize(src, promote(ColumnRef::by_name("col")), pred);
  assert(custom.pred_matrix[2 * q + 0] == 1);
  assert(custom.pred_matrix[2 * q + 5] == 0);
  assert(custom.pred_matrix[5 * q + 3] == 2);
}

static void test_binarize_errors() {
  DataFrame src = source_frame();
  assert(throws<DomainError>(
      [&] { binarize(src, promote(ColumnRef::by_name("sex"))); }));
  assert(throws<DomainError>(
      [&] { binarize(src, promote(ColumnRef::by_index(0))); }));
  assert(throws<SchemaError>(
      [&] { binarize(src, promote(ColumnRef::by_name("nope"))); }));
  assert(throws<ConsistencyError>([&] {
    binarize(src, std::vector<ColumnRef>{ColumnRef::by_index(2),
                                         ColumnRef::by_index(2)});
  }));
  assert(throws<SchemaError>([&] {
    binarize(src, std::vector<ColumnRef>{ColumnRef::by_name("col"),
                                         ColumnRef::by_index(2)});
  }));

  std::vector<int> diagonal(16, 0);
  diagonal[1 * 4 + 1] = 1;
  assert(throws<DomainError>([&] { binarize(src, std::nullopt, diagonal); }));
  std::vector<int> invalid(16, 0);
  invalid[1] = 3;
  assert(throws<DomainError>([&] { binarize(src, std::nullopt, invalid); }));
  assert(throws<SchemaError>(
      [&] { binarize(src, std::nullopt, std::vector<int>(9, 0)); }));

  DataFrame plain({make_numeric("a", {1, 2}), make_numeric("b", {3, 4})});
  assert(throws<DomainError>([&] { binarize(plain); }));
}

static void test_observed_round_trip() {
  DataFrame src(
      {make_numeric("w", {0.5, 1.5, 2.5, 3.5, 4.5}),
       make_factor_from_labels("g", {"lo", "hi", "mid", "hi", "lo"},
                               {"lo", "mid", "hi"}),
       make_integer("n", {3, 1, 4, 1, 5}),
       make_factor_from_labels("h", {"u", "v", "v", "u", "v"}, {"u", "v"})});
  BinarizedFrame bin = binarize(src);
  assert(bin.data.cols() == 6);
  assert(bin.params.dummy_cols.size() == 1);

  ImputationSet set = make_imputation_set(bin.data, 2);
  set.predictor_matrix = bin.pred_matrix;
  FactorizedSet out = factorize(set, bin.params);

  assert(out.m == 2);
  assert(out.data.names() == src.names());
  assert((out.nmis == std::vector<int>{0, 0, 0, 0}));
  assert(std::all_of(out.where.begin(), out.where.end(),
                     [](uint8_t w) { return w == 0; }));
  for (int j = 0; j < src.cols(); ++j) {
    const Column &got = out.data.column(j);
    const Column &want = src.column(j);
    assert(got.type == want.type);
    assert(got.levels == want.levels);
    assert(got.values == want.values);
    assert(out.imp[j].r == 0);
  }
}

static void test_round_trip() {
  BinarizedFrame bin = binarize(source_frame());
  ImputationSet set = binarized_set(4);
  post_match(set, RidgePredictionEngine(), MatchRequest());

  FactorizedSet out = factorize(set, bin.params);
  assert(out.m == 4);
  assert(out.data.cols() == 4);
  assert((out.data.names() == std::vector<std::string>{"x", "sex", "col", "y"}));
  assert((out.nmis == std::vector<int>{0, 0, 3, 1}));

  DataFrame src = source_frame();
  const Column &col = out.data.column(2);
  assert(col.type == ColumnType::FACTOR);
  assert(col.levels == src.column(2).levels);
  for (int i = 0; i < src.rows(); ++i) {
    if (src.is_missing(i, 2))
      assert(out.data.is_missing(i, 2) && out.where[i * 4 + 2] == 1);
    else
      assert(out.data.at(i, 2) == src.at(i, 2));
  }

  // Imputed codes follow the hot position of the matched pattern.
  for (int row = 0; row < 3; ++row) {
    for (int k = 0; k < out.m; ++k) {
      int code = static_cast<int>(out.imp[2](row, k));
      assert(code >= 0 && code < 3);
      assert(set.imp[2 + code](row, k) == 1.0);
    }
  }
  assert(out.imp[3](0, 0) == 8.0);
  assert(out.where[7 * 4 + 3] == 1);
}

static void test_params_checks() {
  BinarizedFrame bin = binarize(source_frame());
  ImputationSet set = binarized_set();
  validate_params(set, bin.params);

  DummyParams few = bin.params;
  few.n_src_cols = 1;
  assert(throws<DomainError>([&] { validate_params(set, few); }));

  DummyParams bad_dummy = bin.params;
  bad_dummy.dummy_cols[0] = {2, 3, 9};
  assert(throws<DomainError>([&] { validate_params(set, bad_dummy); }));

  DummyParams levels = bin.params;
  levels.src_levels[0].pop_back();
  assert(throws<ConsistencyError>([&] { validate_params(set, levels); }));

  DummyParams renamed = bin.params;
  renamed.pad_names[5] = "z";
  assert(throws<ConsistencyError>([&] { validate_params(set, renamed); }));

  DummyParams count = bin.params;
  count.n_pad_cols = 7;
  assert(throws<ConsistencyError>([&] { validate_params(set, count); }));

  // Two hot entries in an observed row.
  ImputationSet double_hot = binarized_set();
  double_hot.data.set(0, 3, 1.0);
  assert(throws_with<ConsistencyError>(
      [&] { validate_params(double_hot, bin.params); }, "row 0"));

  ImputationSet non_binary = binarized_set();
  non_binary.data.set(0, 2, 0.5);
  assert(throws<ConsistencyError>(
      [&] { validate_params(non_binary, bin.params); }));
}

static void test_factorize_blockwise() {
  // Row 5 of col.b is no longer a target while col.a and col.c still are.
  BinarizedFrame bin = binarize(source_frame());
  ImputationSet set = binarized_set();
  set.where[5 * set.cols() + 3] = 0;
  set.imp[3] = Mat(2, set.m, 1.0);
  assert(throws_with<ConsistencyError>([&] { factorize(set, bin.params); },
                                       "blockwise missing in row 5"));
}

int main() {
  Logger::instance().set_level(LogLevel::WARNING);
  std::cout << "Testing dummy transform..." << std::endl;
  test_binarize();
  test_binarize_errors();
  test_observed_round_trip();
  test_round_trip();
  test_params_checks();
  test_factorize_blockwise();
  std::cout << "SUCCESS: binarize and factorize are consistent.\n";
  return 0;
}
