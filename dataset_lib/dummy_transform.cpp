#include "dummy_transform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace postmatch {

std::vector<int> validate_binarize_cols(const DataFrame &data,
                                        const std::vector<ColumnRef> &cols) {
  if (cols.empty())
    throw SchemaError("Argument 'cols' is empty.");

  const auto kind = cols.front().kind();
  for (const auto &ref : cols) {
    if (ref.is_none() || ref.kind() != kind)
      throw SchemaError("Argument 'cols' has to contain either column names or "
                        "column indices exclusively.");
  }

  const auto names = data.names();
  std::vector<int> resolved;
  std::set<int> seen;
  for (const auto &ref : cols) {
    int j = resolve_column(ref, names, "cols");
    if (!seen.insert(j).second)
      throw ConsistencyError("Argument 'cols' contains duplicate column " +
                             ref.to_string() + ".");
    const Column &col = data.column(j);
    if (col.type != ColumnType::FACTOR || col.levels.size() <= 2)
      throw DomainError("Column '" + col.name +
                        "' in argument 'cols' is not a factor with more than "
                        "two levels.");
    resolved.push_back(j);
  }
  return resolved;
}

void validate_pred_matrix(const std::vector<int> &pred_matrix, int n) {
  if (pred_matrix.size() != static_cast<size_t>(n) * n)
    throw SchemaError("Input predictor matrix does not have the correct size "
                      "(expected " +
                      std::to_string(n) + "x" + std::to_string(n) + ").");
  for (int v : pred_matrix) {
    if (v != 0 && v != 1 && v != 2)
      throw DomainError("Input predictor matrix contains invalid value " +
                        std::to_string(v) + ".");
  }
  for (int j = 0; j < n; ++j) {
    if (pred_matrix[static_cast<size_t>(j) * n + j] != 0)
      throw DomainError(
          "Diagonal elements of input predictor matrix have to be zero.");
  }
}

BinarizedFrame binarize(const DataFrame &data,
                        const std::optional<std::vector<ColumnRef>> &cols,
                        const std::optional<std::vector<int>> &pred_matrix) {
  const int p = data.cols();
  const int n = data.rows();

  std::vector<int> factor_cols;
  if (cols) {
    factor_cols = validate_binarize_cols(data, *cols);
  } else {
    for (int j = 0; j < p; ++j) {
      const Column &col = data.column(j);
      if (col.type == ColumnType::FACTOR && col.levels.size() > 2)
        factor_cols.push_back(j);
    }
  }
  if (factor_cols.empty())
    throw DomainError(
        "There are no factor columns with more than two levels to binarize.");
  std::sort(factor_cols.begin(), factor_cols.end());

  std::vector<int> src_pred;
  if (pred_matrix) {
    validate_pred_matrix(*pred_matrix, p);
    src_pred = *pred_matrix;
  } else {
    src_pred.assign(static_cast<size_t>(p) * p, 1);
    for (int j = 0; j < p; ++j)
      src_pred[static_cast<size_t>(j) * p + j] = 0;
  }

  BinarizedFrame out;
  DummyParams &params = out.params;
  params.src_data = data;
  params.n_src_cols = p;
  params.src_factor_cols = factor_cols;
  params.src_names = data.names();

  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<Column> padded;
  std::vector<int> src_of_pad;
  for (int s = 0; s < p; ++s) {
    const Column &col = data.column(s);
    if (!std::binary_search(factor_cols.begin(), factor_cols.end(), s)) {
      padded.push_back(col);
      src_of_pad.push_back(s);
      continue;
    }

    std::vector<int> group;
    for (size_t level = 0; level < col.levels.size(); ++level) {
      std::vector<double> indicator(n);
      for (int i = 0; i < n; ++i) {
        double code = col.values[i];
        indicator[i] = std::isnan(code)
                           ? nan
                           : (static_cast<size_t>(code) == level ? 1.0 : 0.0);
      }
      group.push_back(static_cast<int>(padded.size()));
      padded.push_back(
          make_integer(col.name + "." + col.levels[level], std::move(indicator)));
      src_of_pad.push_back(s);
    }
    params.dummy_cols.push_back(std::move(group));
    params.src_levels.push_back(col.levels);
  }

  out.data = DataFrame(std::move(padded));
  const int q = out.data.cols();
  params.n_pad_cols = q;
  params.pad_names = out.data.names();

  out.pred_matrix.assign(static_cast<size_t>(q) * q, 0);
  for (int a = 0; a < q; ++a) {
    for (int b = 0; b < q; ++b) {
      if (src_of_pad[a] == src_of_pad[b])
        continue;
      out.pred_matrix[static_cast<size_t>(a) * q + b] =
          src_pred[static_cast<size_t>(src_of_pad[a]) * p + src_of_pad[b]];
    }
  }

  Logger::debug("Binarized " + std::to_string(factor_cols.size()) +
                " factor columns into " + std::to_string(q) + " columns.");
  return out;
}

void validate_params(const ImputationSet &set, const DummyParams &params) {
  const int n_src = params.n_src_cols;
  const int n_pad = params.n_pad_cols;

  if (n_src < 2)
    throw DomainError("Element 'n_src_cols' of the parameter record is not an "
                      "integral number bigger than one.");

  for (int f : params.src_factor_cols) {
    if (f < 0 || f >= n_src)
      throw DomainError("Element 'src_factor_cols' of the parameter record "
                        "contains an out-of-bounds value " +
                        std::to_string(f) + ".");
  }
  for (const auto &group : params.dummy_cols) {
    if (group.empty())
      throw DomainError(
          "Element 'dummy_cols' of the parameter record contains an empty "
          "group.");
    for (int j : group) {
      if (j < 0 || j >= n_pad)
        throw DomainError("Element 'dummy_cols' of the parameter record "
                          "contains an invalid value " +
                          std::to_string(j) + ".");
    }
  }

  if (params.src_factor_cols.size() != params.dummy_cols.size())
    throw ConsistencyError("Elements 'src_factor_cols' and 'dummy_cols' of the "
                           "parameter record are not of the same length.");
  if (params.dummy_cols.size() != params.src_levels.size())
    throw ConsistencyError("Elements 'dummy_cols' and 'src_levels' of the "
                           "parameter record are not consistent with each "
                           "other.");
  for (size_t f = 0; f < params.dummy_cols.size(); ++f) {
    if (params.dummy_cols[f].size() != params.src_levels[f].size())
      throw ConsistencyError("Elements 'dummy_cols' and 'src_levels' of the "
                             "parameter record are not consistent with each "
                             "other.");
  }
  if (static_cast<int>(params.src_names.size()) != n_src)
    throw ConsistencyError("Element 'src_names' of the parameter record does "
                           "not have 'n_src_cols' entries.");
  if (params.src_data.cols() != n_src)
    throw ConsistencyError("Element 'src_data' of the parameter record does "
                           "not have 'n_src_cols' columns.");
  if (params.src_data.names() != params.src_names)
    throw ConsistencyError("Column names of 'src_data' do not match "
                           "'src_names' in the parameter record.");
  for (size_t f = 0; f < params.src_factor_cols.size(); ++f) {
    const Column &col = params.src_data.column(params.src_factor_cols[f]);
    if (col.type != ColumnType::FACTOR || col.levels != params.src_levels[f])
      throw ConsistencyError("Elements 'src_factor_cols', 'src_levels' and "
                             "'src_data' of the parameter record are not "
                             "consistent with each other (column '" +
                             col.name + "').");
  }

  size_t n_dummies = 0;
  for (const auto &group : params.dummy_cols)
    n_dummies += group.size();
  if (static_cast<size_t>(n_pad) !=
      static_cast<size_t>(n_src) - params.src_factor_cols.size() + n_dummies)
    throw ConsistencyError("Element 'n_pad_cols' of the parameter record does "
                           "not match its dummy columns.");

  // Against the imputation set.
  if (n_pad != set.cols() || params.pad_names != set.data.names())
    throw ConsistencyError(
        "Parameter record is not consistent with the columns of the "
        "imputation set.");
  if (params.src_data.rows() != set.rows())
    throw ConsistencyError(
        "Parameter record is not consistent with the rows of the imputation "
        "set.");

  for (const auto &group : params.dummy_cols) {
    for (int i = 0; i < set.rows(); ++i) {
      int observed = 0;
      double sum = 0.0;
      for (int j : group) {
        double v = set.data.at(i, j);
        if (std::isnan(v))
          continue;
        if (v != 0.0 && v != 1.0)
          throw ConsistencyError("Dummy column '" + set.data.column(j).name +
                                 "' contains non-binary value " +
                                 std::to_string(v) + " in row " +
                                 std::to_string(i) + ".");
        ++observed;
        sum += v;
      }
      if (observed > 0 && sum != 1.0)
        throw ConsistencyError(
            "Dummy group " + format_group(group) +
            " is not in proper binarized format in row " + std::to_string(i) +
            ".");
    }
  }
}

namespace {

// Index of the largest entry (first on ties), -1 when every entry is NaN.
int hot_position(const std::vector<double> &pattern) {
  int best = -1;
  for (size_t k = 0; k < pattern.size(); ++k) {
    if (std::isnan(pattern[k]))
      continue;
    if (best < 0 || pattern[k] > pattern[best])
      best = static_cast<int>(k);
  }
  return best;
}

} // namespace

FactorizedSet factorize(const ImputationSet &set, const DummyParams &params) {
  set.check_shape();
  validate_params(set, params);

  const int n = set.rows();
  const int q = set.cols();
  const int n_src = params.n_src_cols;
  const double nan = std::numeric_limits<double>::quiet_NaN();

  std::vector<int> factor_of_src(n_src, -1);
  for (size_t f = 0; f < params.src_factor_cols.size(); ++f)
    factor_of_src[params.src_factor_cols[f]] = static_cast<int>(f);

  std::vector<uint8_t> is_dummy(q, 0);
  for (const auto &group : params.dummy_cols)
    for (int j : group)
      is_dummy[j] = 1;
  std::vector<int> plain_pads;
  for (int j = 0; j < q; ++j) {
    if (!is_dummy[j])
      plain_pads.push_back(j);
  }

  FactorizedSet out;
  out.m = set.m;
  out.where.assign(static_cast<size_t>(n) * n_src, 0);
  out.imp.resize(n_src);

  std::vector<Column> columns;
  size_t next_plain = 0;
  for (int s = 0; s < n_src; ++s) {
    int f = factor_of_src[s];
    int pad = -1;
    Column col;

    if (f < 0) {
      pad = plain_pads.at(next_plain++);
      col = set.data.column(pad);
      col.name = params.src_names[s];
      out.imp[s] = set.imp[pad];
    } else {
      const auto &group = params.dummy_cols[f];
      pad = group.front();
      for (int j : group) {
        for (int i = 0; i < n; ++i) {
          if (set.is_target(i, j) != set.is_target(i, pad))
            throw ConsistencyError("Dummy group " + format_group(group) +
                                   " is not blockwise missing in row " +
                                   std::to_string(i) + ".");
        }
      }

      std::vector<double> codes(n, nan);
      std::vector<double> pattern(group.size());
      for (int i = 0; i < n; ++i) {
        for (size_t k = 0; k < group.size(); ++k)
          pattern[k] = set.data.at(i, group[k]);
        int hot = hot_position(pattern);
        if (hot >= 0)
          codes[i] = hot;
      }
      col = make_factor(params.src_names[s], std::move(codes),
                        params.src_levels[f]);

      const int targets = set.imp[pad].r;
      Mat imputed(targets, set.m, nan);
      for (int row = 0; row < targets; ++row) {
        for (int k = 0; k < set.m; ++k) {
          for (size_t d = 0; d < group.size(); ++d)
            pattern[d] = set.imp[group[d]](row, k);
          int hot = hot_position(pattern);
          if (hot >= 0)
            imputed(row, k) = hot;
        }
      }
      out.imp[s] = std::move(imputed);
    }

    for (int i = 0; i < n; ++i)
      out.where[static_cast<size_t>(i) * n_src + s] =
          set.is_target(i, pad) ? 1 : 0;
    columns.push_back(std::move(col));
  }

  out.data = DataFrame(std::move(columns));
  out.nmis.resize(n_src, 0);
  for (int s = 0; s < n_src; ++s) {
    for (int i = 0; i < n; ++i)
      out.nmis[s] += out.data.is_missing(i, s) ? 1 : 0;
  }
  return out;
}

} // namespace postmatch
