#include "common/errors.hpp"
#include "matching_lib/schema_validator.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace postmatch;
using namespace postmatch::testing;

static GroupSpec names(std::initializer_list<const char *> cols) {
  GroupSpec g;
  for (const char *c : cols)
    g.push_back(ColumnRef::by_name(c));
  return g;
}

static GroupSpec indices(std::initializer_list<int> cols) {
  GroupSpec g;
  for (int c : cols)
    g.push_back(ColumnRef::by_index(c));
  return g;
}

static void test_groups() {
  ImputationSet set = binarized_set();

  auto found = find_groups(set);
  assert(found.size() == 1);
  assert((found[0] == Group{2, 3, 4}));

  auto discovered = validate_groups(set, std::nullopt);
  assert(discovered == found);

  auto by_name = validate_groups(
      set, std::vector<GroupSpec>{names({"col.a", "col.b", "col.c"})});
  assert((by_name[0] == Group{2, 3, 4}));
  auto by_index = validate_groups(set, promote(indices({4, 2, 3})));
  assert((by_index[0] == Group{4, 2, 3}));

  // Mixed names and indices.
  GroupSpec mixed = {ColumnRef::by_name("col.a"), ColumnRef::by_index(3)};
  assert(throws<SchemaError>([&] { validate_groups(set, promote(mixed)); }));
  assert(throws<SchemaError>(
      [&] { validate_groups(set, promote(GroupSpec{})); }));
  assert(throws<SchemaError>(
      [&] { validate_groups(set, promote(names({"col.a", "nope"}))); }));
  assert(throws<SchemaError>(
      [&] { validate_groups(set, promote(indices({2, 6}))); }));
  assert(throws<SchemaError>(
      [&] { validate_groups(set, promote(indices({-1, 2}))); }));

  assert(throws<ConsistencyError>(
      [&] { validate_groups(set, promote(indices({2, 3, 2}))); }));
  assert(throws<ConsistencyError>([&] {
    validate_groups(set, std::vector<GroupSpec>{indices({2, 3}),
                                                indices({3, 4})});
  }));

  ImputationSet unvisited = binarized_set();
  unvisited.visit_sequence = {0, 1, 2, 3, 5};
  assert(throws_with<ConsistencyError>(
      [&] { validate_groups(unvisited, promote(indices({2, 3, 4}))); },
      "visit sequence"));

  ImputationSet unsupported = binarized_set();
  unsupported.method[3] = "polyreg";
  assert(throws<SchemaError>(
      [&] { validate_groups(unsupported, promote(indices({2, 3, 4}))); }));

  // Row 2 of col.b no longer a target.
  ImputationSet broken = binarized_set();
  broken.where[2 * broken.cols() + 3] = 0;
  assert(throws_with<ConsistencyError>(
      [&] { validate_groups(broken, promote(indices({2, 3, 4}))); },
      "blockwise"));
  assert(throws_with<ConsistencyError>(
      [&] { validate_groups(broken, promote(indices({2, 3, 4}))); },
      "(2, 3, 4)"));
  // Only col.b and col.c disagree in row 2 now; a group without col.b is fine.
  assert(validate_groups(broken, promote(indices({2, 4}))).size() == 1);

  ImputationSet complete = make_imputation_set(
      DataFrame({make_numeric("a", {1, 2}), make_numeric("b", {3, 4})}), 1);
  assert(throws<DataCoverageError>(
      [&] { validate_groups(complete, std::nullopt); }));
}

static void test_weights() {
  std::vector<Group> groups = {{2, 3, 4}, {5, 6}};

  auto uniform = validate_weights(std::nullopt, groups);
  assert(uniform.size() == 2 && !uniform[0] && !uniform[1]);

  auto sentinels = validate_weights(
      std::vector<WeightSpec>{std::vector<double>{0.0},
                              std::vector<double>{1.0}},
      groups);
  assert(!sentinels[0] && !sentinels[1]);

  auto explicit_w = validate_weights(
      std::vector<WeightSpec>{std::vector<double>{1.0, 2.0, 0.5},
                              std::nullopt},
      groups);
  assert(explicit_w[0] && (*explicit_w[0])[1] == 2.0);
  assert(!explicit_w[1]);

  assert(throws<ConsistencyError>([&] {
    validate_weights(promote(WeightSpec(std::vector<double>{1.0, 2.0, 3.0})),
                     groups);
  }));
  assert(throws<ConsistencyError>([&] {
    validate_weights(std::vector<WeightSpec>{std::vector<double>{1.0, 2.0},
                                             std::nullopt},
                     groups);
  }));
  assert(throws<DomainError>([&] {
    validate_weights(std::vector<WeightSpec>{std::vector<double>{1.0, NA, 1.0},
                                             std::nullopt},
                     groups);
  }));
  assert(throws<DomainError>([&] {
    validate_weights(
        std::vector<WeightSpec>{std::vector<double>{1.0, INFINITY, 1.0},
                                std::nullopt},
        groups);
  }));
  assert(throws<DomainError>([&] {
    validate_weights(std::vector<WeightSpec>{std::vector<double>{1.0, 0.0, 1.0},
                                             std::nullopt},
                     groups);
  }));
  assert(throws<DomainError>([&] {
    validate_weights(
        std::vector<WeightSpec>{std::vector<double>{1.0, 1.0, -2.0},
                                std::nullopt},
        groups);
  }));
}

static void test_match_vars() {
  ImputationSet set = binarized_set();
  std::vector<Group> groups = {{2, 3, 4}};

  auto none = validate_match_vars(set, groups, std::nullopt);
  assert(none.size() == 1 && !none[0]);

  auto sentinel = validate_match_vars(set, groups, promote(ColumnRef::none()));
  assert(!sentinel[0]);
  auto empty_name =
      validate_match_vars(set, groups, promote(ColumnRef::by_name("")));
  assert(!empty_name[0]);

  auto sex = validate_match_vars(set, groups, promote(ColumnRef::by_name("sex")));
  assert(sex[0] && *sex[0] == 1);
  auto sex_idx = validate_match_vars(set, groups, promote(ColumnRef::by_index(1)));
  assert(sex_idx[0] && *sex_idx[0] == 1);

  assert(throws<SchemaError>([&] {
    validate_match_vars(set, groups, promote(ColumnRef::by_name("nope")));
  }));
  assert(throws<SchemaError>([&] {
    validate_match_vars(set, groups, promote(ColumnRef::by_index(17)));
  }));
  assert(throws<ConsistencyError>([&] {
    validate_match_vars(
        set, groups,
        std::vector<ColumnRef>{ColumnRef::by_name("sex"), ColumnRef::none()});
  }));
  assert(throws<ConsistencyError>([&] {
    validate_match_vars(set, groups, promote(ColumnRef::by_name("col.b")));
  }));
  // x is numeric, y has a missing value.
  assert(throws<DomainError>([&] {
    validate_match_vars(set, groups, promote(ColumnRef::by_name("x")));
  }));
  ImputationSet integer_y = binarized_set();
  integer_y.data.column(5).type = ColumnType::INTEGER;
  assert(throws_with<DomainError>(
      [&] {
        validate_match_vars(integer_y, groups,
                            promote(ColumnRef::by_name("y")));
      },
      "missing"));
}

static void test_options() {
  MatchOptions defaults = validate_options(MatchOptionsInput{});
  assert(defaults.metric == DistanceMetric::RESIDUAL);
  assert(defaults.donors == 5);
  assert(defaults.policy == SelectionPolicy::UNIFORM);

  MatchOptionsInput in;
  in.distance_metric = "mahalanobis";
  in.selection_policy = 2;
  in.donors = 1;
  in.ridge = 1.0;
  MatchOptions out = validate_options(in);
  assert(out.metric == DistanceMetric::MAHALANOBIS);
  assert(out.policy == SelectionPolicy::WEIGHTED);

  auto invalid = [](auto mutate) {
    MatchOptionsInput o;
    mutate(o);
    return throws<DomainError>([&] { validate_options(o); });
  };
  assert(invalid([](MatchOptionsInput &o) { o.donors = 0; }));
  assert(invalid([](MatchOptionsInput &o) { o.distance_metric = "cosine"; }));
  assert(invalid([](MatchOptionsInput &o) { o.selection_policy = 3; }));
  assert(invalid([](MatchOptionsInput &o) { o.selection_policy = -1; }));
  assert(invalid([](MatchOptionsInput &o) { o.ridge = 0.0; }));
  assert(invalid([](MatchOptionsInput &o) { o.ridge = 1.5; }));
  assert(invalid([](MatchOptionsInput &o) { o.eps = -1e-4; }));
  assert(invalid([](MatchOptionsInput &o) { o.eps = NA; }));
  assert(invalid([](MatchOptionsInput &o) { o.maxcor = 0.0; }));
  assert(invalid([](MatchOptionsInput &o) { o.maxcor = INFINITY; }));
}

int main() {
  std::cout << "Testing argument validation..." << std::endl;
  test_groups();
  test_weights();
  test_match_vars();
  test_options();
  std::cout << "SUCCESS: validation checks passed.\n";
  return 0;
}
