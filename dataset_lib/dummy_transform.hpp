#pragma once
#include "../common/column_ref.hpp"
#include "../common/matrix.hpp"
#include "data_frame.hpp"
#include "imputation_set.hpp"

#include <optional>
#include <string>
#include <vector>

namespace postmatch {

// Parameters of a binarize() call, needed to undo it with factorize().
struct DummyParams {
  DataFrame src_data;
  int n_src_cols = 0;
  int n_pad_cols = 0;
  std::vector<int> src_factor_cols;
  std::vector<std::vector<int>> dummy_cols;
  std::vector<std::string> src_names;
  std::vector<std::string> pad_names;
  std::vector<std::vector<std::string>> src_levels;
};

struct BinarizedFrame {
  DataFrame data;
  std::vector<int> pred_matrix; // row-major, n_pad_cols x n_pad_cols
  DummyParams params;
};

// Result of factorize(): data, targets and imputations over the source columns.
struct FactorizedSet {
  DataFrame data;
  std::vector<int> nmis;
  std::vector<uint8_t> where;
  std::vector<Mat> imp;
  int m = 0;
};

/**
 * @brief Resolves the factor columns to binarize.
 * @throws SchemaError on unknown columns, ConsistencyError on duplicates,
 *         DomainError when a column is not a factor with more than two levels.
 */
std::vector<int> validate_binarize_cols(const DataFrame &data,
                                        const std::vector<ColumnRef> &cols);

/**
 * @brief Checks a predictor matrix usable for n columns.
 * @throws SchemaError on wrong size, DomainError on values outside {0,1,2} or a
 *         non-zero diagonal.
 */
void validate_pred_matrix(const std::vector<int> &pred_matrix, int n);

/**
 * @brief Replaces factor columns by one indicator column per level.
 *
 * Indicator columns are named "<column>.<level>" and inherit the predictor
 * relations of their factor; indicators of the same factor do not predict each
 * other. Without `cols` every factor with more than two levels is expanded.
 * @throws DomainError when there is nothing to binarize.
 */
BinarizedFrame
binarize(const DataFrame &data,
         const std::optional<std::vector<ColumnRef>> &cols = std::nullopt,
         const std::optional<std::vector<int>> &pred_matrix = std::nullopt);

/**
 * @brief Cross-checks a parameter record against itself and the imputation
 *        set it is applied to.
 * @throws DomainError on out-of-range record values, ConsistencyError when
 *         fields disagree with each other or with the imputation set.
 */
void validate_params(const ImputationSet &set, const DummyParams &params);

/**
 * @brief Rebuilds the source factors of a binarized imputation set.
 *
 * Observed factor cells are recovered from the position of the 1 in their
 * indicator row and imputed cells from the imputed indicator pattern.
 */
FactorizedSet factorize(const ImputationSet &set, const DummyParams &params);

} // namespace postmatch
