#include "imputation_set.hpp"
#include "../common/errors.hpp"

#include <algorithm>
#include <limits>

namespace postmatch {

bool ImputationSet::is_visited(int col) const {
  return std::find(visit_sequence.begin(), visit_sequence.end(), col) !=
         visit_sequence.end();
}

std::vector<int> ImputationSet::target_rows(int col) const {
  std::vector<int> rows_out;
  for (int i = 0; i < rows(); ++i) {
    if (is_target(i, col))
      rows_out.push_back(i);
  }
  return rows_out;
}

std::vector<int> ImputationSet::target_positions(int col) const {
  std::vector<int> pos(rows(), -1);
  int next = 0;
  for (int i = 0; i < rows(); ++i) {
    if (is_target(i, col))
      pos[i] = next++;
  }
  return pos;
}

std::vector<int> ImputationSet::predictors_of(int col) const {
  std::vector<int> preds;
  for (int j = 0; j < cols(); ++j) {
    if (predictor(col, j) == 1)
      preds.push_back(j);
  }
  return preds;
}

DataFrame ImputationSet::completed_frame(int imputation) const {
  DataFrame frame = data;
  for (int j : visit_sequence) {
    const Mat &values = imp[j];
    int pos = 0;
    for (int i = 0; i < rows(); ++i) {
      if (!is_target(i, j))
        continue;
      // Observed target cells keep their data value.
      if (data.is_missing(i, j))
        frame.set(i, j, values(pos, imputation));
      ++pos;
    }
  }
  return frame;
}

void ImputationSet::check_shape() const {
  const size_t n = static_cast<size_t>(rows());
  const size_t p = static_cast<size_t>(cols());

  if (m < 1)
    throw ConsistencyError("Imputation set has " + std::to_string(m) +
                           " completed imputations, expected at least 1.");
  if (where.size() != n * p)
    throw ConsistencyError("Target matrix 'where' has " +
                           std::to_string(where.size()) + " cells, expected " +
                           std::to_string(n * p) + ".");
  if (imp.size() != p)
    throw ConsistencyError("Imputed values exist for " +
                           std::to_string(imp.size()) + " columns, expected " +
                           std::to_string(p) + ".");
  if (method.size() != p)
    throw ConsistencyError("Imputation methods exist for " +
                           std::to_string(method.size()) +
                           " columns, expected " + std::to_string(p) + ".");
  if (predictor_matrix.size() != p * p)
    throw ConsistencyError("Predictor matrix has " +
                           std::to_string(predictor_matrix.size()) +
                           " entries, expected " + std::to_string(p * p) + ".");

  for (int v : predictor_matrix) {
    if (v != 0 && v != 1 && v != 2)
      throw SchemaError("Predictor matrix contains invalid value " +
                        std::to_string(v) + ".");
  }
  for (int j : visit_sequence) {
    if (j < 0 || j >= static_cast<int>(p))
      throw SchemaError("Visit sequence contains invalid column index " +
                        std::to_string(j) + ".");
  }

  for (size_t j = 0; j < p; ++j) {
    int targets = 0;
    for (size_t i = 0; i < n; ++i)
      targets += where[i * p + j] != 0 ? 1 : 0;
    if (imp[j].r != targets || (targets > 0 && imp[j].c != m))
      throw ConsistencyError("Imputed values of column '" +
                             data.column(static_cast<int>(j)).name + "' are " +
                             std::to_string(imp[j].r) + "x" +
                             std::to_string(imp[j].c) + ", expected " +
                             std::to_string(targets) + "x" +
                             std::to_string(m) + ".");
  }
}

ImputationSet make_imputation_set(DataFrame data, int m,
                                  const std::string &method) {
  ImputationSet set;
  const int n = data.rows();
  const int p = data.cols();
  set.data = std::move(data);
  set.m = m;
  set.where.assign(static_cast<size_t>(n) * p, 0);
  set.predictor_matrix.assign(static_cast<size_t>(p) * p, 1);
  set.imp.resize(p);
  set.method.resize(p);

  for (int j = 0; j < p; ++j) {
    set.predictor_matrix[static_cast<size_t>(j) * p + j] = 0;
    set.visit_sequence.push_back(j);
    int targets = 0;
    for (int i = 0; i < n; ++i) {
      if (set.data.is_missing(i, j)) {
        set.where[static_cast<size_t>(i) * p + j] = 1;
        ++targets;
      }
    }
    set.imp[j] = Mat(targets, m, std::numeric_limits<double>::quiet_NaN());
    set.method[j] = targets > 0 ? method : "";
  }
  return set;
}

} // namespace postmatch
