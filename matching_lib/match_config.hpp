#pragma once
#include "post_matcher.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace postmatch {

/*
 * JSON layout of a match request (every element is optional):
 *
 * {
 *   "groups": [["region.north", "region.south", "region.west"], [5, 6, 7]],
 *   "weights": [null, [1.0, 2.0, 1.0]],
 *   "match_vars": ["sex", null],
 *   "options": {"distance_metric": "residual", "donors": 5,
 *               "selection_policy": 1, "ridge": 1e-5, "eps": 1e-4,
 *               "maxcor": 0.99},
 *   "seed": 42
 * }
 *
 * A bare group (["a", "b"]), a bare weight vector ([1.0, 2.0]) and a bare
 * match variable ("sex") stand for a single group. Column references are names
 * or 0-based indices; a null or empty match variable means no restriction.
 * "donor_pool_size" is accepted in place of "donors".
 */

/**
 * @throws SchemaError on elements of the wrong type.
 */
MatchRequest match_request_from_json(const nlohmann::json &j);

MatchRequest read_match_request(const std::string &path);

} // namespace postmatch
