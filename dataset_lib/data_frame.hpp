#pragma once
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace postmatch {

enum class ColumnType { NUMERIC, INTEGER, FACTOR };

const char *column_type_name(ColumnType type);
bool parse_column_type(const std::string &name, ColumnType &out);

// One column of a data frame. Missing cells are NaN; factor cells hold the
// 0-based code of their level.
struct Column {
  std::string name;
  ColumnType type = ColumnType::NUMERIC;
  std::vector<double> values;
  std::vector<std::string> levels;

  bool is_missing(int row) const { return std::isnan(values[row]); }
  bool is_discrete() const { return type != ColumnType::NUMERIC; }
  bool has_missing() const;
};

Column make_numeric(std::string name, std::vector<double> values);
Column make_integer(std::string name, std::vector<double> values);
Column make_factor(std::string name, std::vector<double> codes,
                   std::vector<std::string> levels);

/**
 * @brief Builds a factor from labels; an empty label is a missing cell.
 * @throws SchemaError when a label is not one of the levels.
 */
Column make_factor_from_labels(std::string name,
                               const std::vector<std::string> &labels,
                               std::vector<std::string> levels);

class DataFrame {
public:
  DataFrame() = default;

  /**
   * @throws SchemaError when columns differ in length, a factor code is out of
   *         range or column names are duplicated.
   */
  explicit DataFrame(std::vector<Column> columns);

  int rows() const noexcept { return rows_; }
  int cols() const noexcept { return static_cast<int>(columns_.size()); }

  const std::vector<Column> &columns() const noexcept { return columns_; }
  const Column &column(int j) const { return columns_.at(j); }
  Column &column(int j) { return columns_.at(j); }

  double at(int row, int col) const { return columns_[col].values[row]; }
  void set(int row, int col, double value) {
    columns_[col].values[row] = value;
  }
  bool is_missing(int row, int col) const {
    return std::isnan(columns_[col].values[row]);
  }

  std::vector<std::string> names() const;

private:
  int rows_ = 0;
  std::vector<Column> columns_;
};

// Numeric design columns derived from a set of data frame columns.
struct DesignMatrix {
  int rows = 0;
  std::vector<std::vector<double>> columns;
  std::vector<std::string> names;

  int cols() const { return static_cast<int>(columns.size()); }
};

/**
 * @brief Expands factor columns into treatment-coded indicator columns (one per
 *        level except the first); numeric and integer columns are copied.
 * @post A missing factor cell is missing in every one of its indicators.
 */
DesignMatrix expand_factors(const DataFrame &frame,
                            const std::vector<int> &cols);

/**
 * @brief Marks rows in which every design column is observed.
 */
std::vector<uint8_t> complete_cases(const DesignMatrix &design);

} // namespace postmatch
