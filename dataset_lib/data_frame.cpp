#include "data_frame.hpp"
#include "../common/errors.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>

namespace postmatch {

const char *column_type_name(ColumnType type) {
  switch (type) {
  case ColumnType::NUMERIC:
    return "numeric";
  case ColumnType::INTEGER:
    return "integer";
  case ColumnType::FACTOR:
    return "factor";
  }
  return "unknown";
}

bool parse_column_type(const std::string &name, ColumnType &out) {
  if (name == "numeric")
    out = ColumnType::NUMERIC;
  else if (name == "integer")
    out = ColumnType::INTEGER;
  else if (name == "factor")
    out = ColumnType::FACTOR;
  else
    return false;
  return true;
}

bool Column::has_missing() const {
  return std::any_of(values.begin(), values.end(),
                     [](double v) { return std::isnan(v); });
}

Column make_numeric(std::string name, std::vector<double> values) {
  Column col;
  col.name = std::move(name);
  col.type = ColumnType::NUMERIC;
  col.values = std::move(values);
  return col;
}

Column make_integer(std::string name, std::vector<double> values) {
  Column col = make_numeric(std::move(name), std::move(values));
  col.type = ColumnType::INTEGER;
  return col;
}

Column make_factor(std::string name, std::vector<double> codes,
                   std::vector<std::string> levels) {
  Column col = make_numeric(std::move(name), std::move(codes));
  col.type = ColumnType::FACTOR;
  col.levels = std::move(levels);
  return col;
}

Column make_factor_from_labels(std::string name,
                               const std::vector<std::string> &labels,
                               std::vector<std::string> levels) {
  std::vector<double> codes;
  codes.reserve(labels.size());
  for (const auto &label : labels) {
    if (label.empty()) {
      codes.push_back(std::numeric_limits<double>::quiet_NaN());
      continue;
    }
    auto it = std::find(levels.begin(), levels.end(), label);
    if (it == levels.end())
      throw SchemaError("Label '" + label + "' of factor '" + name +
                        "' is not one of its levels.");
    codes.push_back(static_cast<double>(it - levels.begin()));
  }
  return make_factor(std::move(name), std::move(codes), std::move(levels));
}

DataFrame::DataFrame(std::vector<Column> columns)
    : columns_(std::move(columns)) {
  rows_ = columns_.empty() ? 0 : static_cast<int>(columns_[0].values.size());

  std::unordered_set<std::string> seen;
  for (const auto &col : columns_) {
    if (static_cast<int>(col.values.size()) != rows_)
      throw SchemaError("Column '" + col.name + "' has " +
                        std::to_string(col.values.size()) +
                        " rows, expected " + std::to_string(rows_) + ".");
    if (!seen.insert(col.name).second)
      throw SchemaError("Duplicate column name '" + col.name + "'.");
    if (col.type == ColumnType::INTEGER) {
      for (double v : col.values) {
        if (!std::isnan(v) && (std::isinf(v) || v != std::floor(v)))
          throw SchemaError("Integer column '" + col.name +
                            "' contains a non-integral value " +
                            std::to_string(v) + ".");
      }
      continue;
    }
    if (col.type != ColumnType::FACTOR)
      continue;
    for (double v : col.values) {
      if (std::isnan(v))
        continue;
      if (v < 0 || v >= static_cast<double>(col.levels.size()) ||
          v != std::floor(v))
        throw SchemaError("Factor '" + col.name +
                          "' contains an invalid level code " +
                          std::to_string(v) + ".");
    }
  }
}

std::vector<std::string> DataFrame::names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto &col : columns_)
    out.push_back(col.name);
  return out;
}

DesignMatrix expand_factors(const DataFrame &frame,
                            const std::vector<int> &cols) {
  DesignMatrix design;
  design.rows = frame.rows();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  for (int j : cols) {
    const Column &col = frame.column(j);
    if (col.type != ColumnType::FACTOR) {
      design.columns.push_back(col.values);
      design.names.push_back(col.name);
      continue;
    }

    for (size_t level = 1; level < col.levels.size(); ++level) {
      std::vector<double> indicator(design.rows);
      for (int i = 0; i < design.rows; ++i) {
        double code = col.values[i];
        indicator[i] = std::isnan(code)
                           ? nan
                           : (static_cast<size_t>(code) == level ? 1.0 : 0.0);
      }
      design.columns.push_back(std::move(indicator));
      design.names.push_back(col.name + col.levels[level]);
    }

    // A factor with a single level still carries its missingness.
    if (col.levels.size() < 2) {
      std::vector<double> constant(design.rows);
      for (int i = 0; i < design.rows; ++i)
        constant[i] = std::isnan(col.values[i]) ? nan : 0.0;
      design.columns.push_back(std::move(constant));
      design.names.push_back(col.name);
    }
  }
  return design;
}

std::vector<uint8_t> complete_cases(const DesignMatrix &design) {
  std::vector<uint8_t> complete(design.rows, 1);
  for (const auto &col : design.columns) {
    for (int i = 0; i < design.rows; ++i) {
      if (std::isnan(col[i]))
        complete[i] = 0;
    }
  }
  return complete;
}

} // namespace postmatch
