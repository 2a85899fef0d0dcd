#pragma once
#include "imputation_set.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace postmatch {

/*
 * JSON layout of an imputation set:
 *
 * {
 *   "m": 5,
 *   "columns": [
 *     {"name": "age", "type": "numeric", "values": [41.0, null, ...],
 *      "method": "pmm", "where": [1], "imp": [[40.0, 38.5, ...]]},
 *     {"name": "region", "type": "factor", "levels": ["north", "south"],
 *      "values": [0, 1, ...]}
 *   ],
 *   "predictor_matrix": [[0, 1], [1, 0]],
 *   "visit_sequence": [0]
 * }
 *
 * Missing values are null. "where" lists the target rows of a column and
 * "imp" holds one array of m values per target row. Factor values are 0-based
 * level codes. "method", "where" and "imp" may be omitted for columns without
 * targets.
 */

nlohmann::json load_json_file(const std::string &path);
void save_json_file(const nlohmann::json &j, const std::string &path);

nlohmann::json imputation_set_to_json(const ImputationSet &set);

/**
 * @throws SchemaError on malformed documents, ConsistencyError when the parts
 *         disagree in shape.
 */
ImputationSet imputation_set_from_json(const nlohmann::json &j);

ImputationSet read_imputation_set(const std::string &path);
void write_imputation_set(const ImputationSet &set, const std::string &path);

} // namespace postmatch
