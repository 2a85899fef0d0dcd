#include "json_io.hpp"
#include "../common/errors.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

namespace postmatch {

namespace {

nlohmann::json number_or_null(double v) {
  if (std::isnan(v))
    return nullptr;
  return v;
}

double value_or_nan(const nlohmann::json &v) {
  if (v.is_null())
    return std::numeric_limits<double>::quiet_NaN();
  if (!v.is_number())
    throw SchemaError("Expected a number or null, got " + v.dump() + ".");
  return v.get<double>();
}

const nlohmann::json &require(const nlohmann::json &j, const char *key,
                              const std::string &where) {
  if (!j.contains(key))
    throw SchemaError("Missing element '" + std::string(key) + "' in " + where +
                      ".");
  return j.at(key);
}

} // namespace

nlohmann::json load_json_file(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    throw IOError("Cannot open json: " + path);
  try {
    nlohmann::json j;
    f >> j;
    return j;
  } catch (const nlohmann::json::parse_error &e) {
    throw SchemaError("Cannot parse json " + path + ": " + e.what());
  }
}

void save_json_file(const nlohmann::json &j, const std::string &path) {
  std::ofstream f(path);
  if (!f)
    throw IOError("Cannot write json: " + path);
  f << j.dump(2) << "\n";
  if (!f)
    throw IOError("Failed writing json: " + path);
}

nlohmann::json imputation_set_to_json(const ImputationSet &set) {
  nlohmann::json j;
  j["m"] = set.m;

  nlohmann::json columns = nlohmann::json::array();
  for (int c = 0; c < set.cols(); ++c) {
    const Column &col = set.data.column(c);
    nlohmann::json jc;
    jc["name"] = col.name;
    jc["type"] = column_type_name(col.type);
    if (col.type == ColumnType::FACTOR)
      jc["levels"] = col.levels;

    nlohmann::json values = nlohmann::json::array();
    for (double v : col.values)
      values.push_back(number_or_null(v));
    jc["values"] = std::move(values);
    jc["method"] = set.method[c];

    std::vector<int> targets = set.target_rows(c);
    jc["where"] = targets;
    nlohmann::json imp = nlohmann::json::array();
    for (size_t row = 0; row < targets.size(); ++row) {
      nlohmann::json draws = nlohmann::json::array();
      for (int k = 0; k < set.m; ++k)
        draws.push_back(number_or_null(set.imp[c](static_cast<int>(row), k)));
      imp.push_back(std::move(draws));
    }
    jc["imp"] = std::move(imp);
    columns.push_back(std::move(jc));
  }
  j["columns"] = std::move(columns);

  const int p = set.cols();
  nlohmann::json pred = nlohmann::json::array();
  for (int a = 0; a < p; ++a) {
    std::vector<int> row(set.predictor_matrix.begin() + static_cast<size_t>(a) * p,
                         set.predictor_matrix.begin() +
                             static_cast<size_t>(a + 1) * p);
    pred.push_back(row);
  }
  j["predictor_matrix"] = std::move(pred);
  j["visit_sequence"] = set.visit_sequence;
  return j;
}

ImputationSet imputation_set_from_json(const nlohmann::json &j) {
  try {
    ImputationSet set;
    set.m = require(j, "m", "imputation set").get<int>();

    const auto &jcolumns = require(j, "columns", "imputation set");
    if (!jcolumns.is_array() || jcolumns.empty())
      throw SchemaError("Element 'columns' has to be a non-empty array.");

    std::vector<Column> columns;
    std::vector<std::vector<int>> targets;
    std::vector<nlohmann::json> imps;
    for (const auto &jc : jcolumns) {
      Column col;
      col.name = require(jc, "name", "column").get<std::string>();
      const std::string where_col = "column '" + col.name + "'";
      std::string type = require(jc, "type", where_col).get<std::string>();
      if (!parse_column_type(type, col.type))
        throw SchemaError("Column '" + col.name + "' has unknown type '" +
                          type + "'.");
      if (col.type == ColumnType::FACTOR)
        col.levels =
            require(jc, "levels", where_col).get<std::vector<std::string>>();
      for (const auto &v : require(jc, "values", where_col))
        col.values.push_back(value_or_nan(v));

      set.method.push_back(jc.value("method", std::string()));
      targets.push_back(jc.value("where", std::vector<int>()));
      imps.push_back(jc.value("imp", nlohmann::json::array()));
      columns.push_back(std::move(col));
    }
    set.data = DataFrame(std::move(columns));

    const int n = set.rows();
    const int p = set.cols();
    set.where.assign(static_cast<size_t>(n) * p, 0);
    set.imp.resize(p);
    for (int c = 0; c < p; ++c) {
      const auto &rows = targets[c];
      for (size_t t = 0; t < rows.size(); ++t) {
        if (rows[t] < 0 || rows[t] >= n || (t > 0 && rows[t] <= rows[t - 1]))
          throw SchemaError("Target rows of column '" +
                            set.data.column(c).name +
                            "' have to be ascending row indices.");
        set.where[static_cast<size_t>(rows[t]) * p + c] = 1;
      }
      if (imps[c].size() != rows.size())
        throw ConsistencyError("Column '" + set.data.column(c).name + "' has " +
                               std::to_string(imps[c].size()) +
                               " imputed rows for " +
                               std::to_string(rows.size()) + " target rows.");
      Mat values(static_cast<int>(rows.size()), set.m);
      for (size_t t = 0; t < rows.size(); ++t) {
        const auto &draws = imps[c][t];
        if (!draws.is_array() || static_cast<int>(draws.size()) != set.m)
          throw ConsistencyError("Imputed row " + std::to_string(t) +
                                 " of column '" + set.data.column(c).name +
                                 "' does not hold m values.");
        for (int k = 0; k < set.m; ++k)
          values(static_cast<int>(t), k) = value_or_nan(draws[k]);
      }
      set.imp[c] = std::move(values);
    }

    if (j.contains("predictor_matrix")) {
      auto pred =
          j.at("predictor_matrix").get<std::vector<std::vector<int>>>();
      if (static_cast<int>(pred.size()) != p)
        throw ConsistencyError("Predictor matrix has " +
                               std::to_string(pred.size()) + " rows, expected " +
                               std::to_string(p) + ".");
      for (const auto &row : pred) {
        if (static_cast<int>(row.size()) != p)
          throw ConsistencyError("Predictor matrix is not square.");
        set.predictor_matrix.insert(set.predictor_matrix.end(), row.begin(),
                                    row.end());
      }
    } else {
      set.predictor_matrix.assign(static_cast<size_t>(p) * p, 1);
      for (int c = 0; c < p; ++c)
        set.predictor_matrix[static_cast<size_t>(c) * p + c] = 0;
    }

    if (j.contains("visit_sequence")) {
      set.visit_sequence = j.at("visit_sequence").get<std::vector<int>>();
    } else {
      for (int c = 0; c < p; ++c) {
        if (!set.method[c].empty())
          set.visit_sequence.push_back(c);
      }
    }

    set.check_shape();
    return set;
  } catch (const nlohmann::json::exception &e) {
    throw SchemaError(std::string("Malformed imputation set: ") + e.what());
  }
}

ImputationSet read_imputation_set(const std::string &path) {
  return imputation_set_from_json(load_json_file(path));
}

void write_imputation_set(const ImputationSet &set, const std::string &path) {
  save_json_file(imputation_set_to_json(set), path);
}

} // namespace postmatch
