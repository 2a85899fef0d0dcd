#pragma once
#include "../common/matrix.hpp"
#include "data_frame.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace postmatch {

/**
 * @brief Multiply imputed data set as produced by a chained-equations run.
 *
 * `where` is row-major (rows x cols), 1 marks a cell that is an imputation
 * target. `imp[j]` holds one row per target cell of column j, in ascending row
 * order, and one column per completed imputation.
 */
struct ImputationSet {
  DataFrame data;
  std::vector<uint8_t> where;
  std::vector<Mat> imp;
  std::vector<int> predictor_matrix;
  std::vector<std::string> method;
  std::vector<int> visit_sequence;
  int m = 0;

  int rows() const noexcept { return data.rows(); }
  int cols() const noexcept { return data.cols(); }

  bool is_target(int row, int col) const {
    return where[static_cast<size_t>(row) * data.cols() + col] != 0;
  }
  int predictor(int target, int pred) const {
    return predictor_matrix[static_cast<size_t>(target) * data.cols() + pred];
  }
  bool is_visited(int col) const;

  // Rows flagged as imputation targets of a column, ascending.
  std::vector<int> target_rows(int col) const;

  // Maps every row to its position in imp[col], or -1 for non-target rows.
  std::vector<int> target_positions(int col) const;

  // Columns with predictor-matrix entry 1 in the row of `col`.
  std::vector<int> predictors_of(int col) const;

  /**
   * @brief Data with missing target cells of visited columns filled in from
   *        the given completed imputation.
   * @pre 0 <= imputation < m.
   */
  DataFrame completed_frame(int imputation) const;

  /**
   * @brief Verifies that all members agree in shape.
   * @throws ConsistencyError on mismatched dimensions, SchemaError on invalid
   *         predictor-matrix values or visit-sequence entries.
   */
  void check_shape() const;
};

/**
 * @brief Wraps a data frame as an imputation set. Every missing cell becomes a
 *        target whose m imputed values are initialised with NaN; all columns
 *        are visited, predicted by every other column and get `method`
 *        (columns without missing values get an empty method).
 */
ImputationSet make_imputation_set(DataFrame data, int m,
                                  const std::string &method = "pmm");

} // namespace postmatch
