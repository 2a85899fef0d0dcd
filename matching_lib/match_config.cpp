#include "match_config.hpp"
#include "../common/errors.hpp"
#include "../dataset_lib/json_io.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

namespace postmatch {

namespace {

// Integral JSON number narrowed to int; false when it does not fit.
bool as_int(const nlohmann::json &v, int &out) {
  constexpr int64_t lo = std::numeric_limits<int>::min();
  constexpr int64_t hi = std::numeric_limits<int>::max();
  if (v.is_number_unsigned()) {
    uint64_t u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(hi))
      return false;
    out = static_cast<int>(u);
    return true;
  }
  if (v.is_number_integer()) {
    int64_t i = v.get<int64_t>();
    if (i < lo || i > hi)
      return false;
    out = static_cast<int>(i);
    return true;
  }
  double d = v.get<double>();
  if (d < static_cast<double>(lo) || d > static_cast<double>(hi))
    return false;
  out = static_cast<int>(d);
  return true;
}

ColumnRef column_ref(const nlohmann::json &v, const std::string &argname) {
  if (v.is_null())
    return ColumnRef::none();
  if (v.is_string())
    return ColumnRef::by_name(v.get<std::string>());
  if (v.is_number_integer()) {
    int index = 0;
    if (!as_int(v, index))
      throw SchemaError("Argument '" + argname + "' holds column index " +
                        v.dump() + ", which is out of bounds.");
    return ColumnRef::by_index(index);
  }
  throw SchemaError("Argument '" + argname +
                    "' has to hold column names or integer column indices, "
                    "got " +
                    v.dump() + ".");
}

GroupSpec group_spec(const nlohmann::json &v) {
  if (!v.is_array())
    throw SchemaError("Argument 'groups' has to be a list of column lists, got " +
                      v.dump() + ".");
  GroupSpec group;
  for (const auto &ref : v) {
    if (ref.is_null())
      throw SchemaError("Argument 'groups' must not contain null.");
    group.push_back(column_ref(ref, "groups"));
  }
  return group;
}

std::vector<GroupSpec> parse_groups(const nlohmann::json &v) {
  if (!v.is_array())
    throw SchemaError("Argument 'groups' has to be a list, got " + v.dump() +
                      ".");
  if (!v.empty() && !v.front().is_array())
    return promote(group_spec(v));

  std::vector<GroupSpec> groups;
  for (const auto &g : v)
    groups.push_back(group_spec(g));
  return groups;
}

bool is_number_list(const nlohmann::json &v) {
  if (!v.is_array() || v.empty())
    return false;
  for (const auto &e : v) {
    if (!e.is_number())
      return false;
  }
  return true;
}

WeightSpec weight_spec(const nlohmann::json &v) {
  if (v.is_null())
    return std::nullopt;
  if (v.is_number())
    return std::vector<double>{v.get<double>()};
  if (!v.is_array())
    throw SchemaError("Weights have to be numeric vectors, got " + v.dump() +
                      ".");
  std::vector<double> w;
  for (const auto &e : v) {
    if (e.is_null()) {
      w.push_back(std::nan(""));
    } else if (e.is_number()) {
      w.push_back(e.get<double>());
    } else {
      throw SchemaError("Weights have to be numeric vectors, got " + v.dump() +
                        ".");
    }
  }
  return w;
}

std::vector<WeightSpec> parse_weights(const nlohmann::json &v) {
  if (v.is_number() || is_number_list(v))
    return promote(weight_spec(v));
  if (!v.is_array())
    throw SchemaError("Argument 'weights' has to be a list, got " + v.dump() +
                      ".");
  std::vector<WeightSpec> weights;
  for (const auto &w : v)
    weights.push_back(weight_spec(w));
  return weights;
}

std::vector<ColumnRef> parse_match_vars(const nlohmann::json &v) {
  if (!v.is_array())
    return promote(column_ref(v, "match_vars"));
  std::vector<ColumnRef> refs;
  for (const auto &ref : v)
    refs.push_back(column_ref(ref, "match_vars"));
  return refs;
}

int integral(const nlohmann::json &v, const char *argname) {
  bool whole = v.is_number_integer();
  if (v.is_number_float()) {
    double d = v.get<double>();
    whole = std::isfinite(d) && d == std::floor(d);
  }
  if (whole) {
    int out = 0;
    if (!as_int(v, out))
      throw DomainError(std::string("Argument '") + argname + "' is out of " +
                        "range, got " + v.dump() + ".");
    return out;
  }
  throw SchemaError(std::string("Argument '") + argname +
                    "' has to be an integer, got " + v.dump() + ".");
}

double real(const nlohmann::json &v, const char *argname) {
  if (!v.is_number())
    throw SchemaError(std::string("Argument '") + argname +
                      "' has to be a number, got " + v.dump() + ".");
  return v.get<double>();
}

MatchOptionsInput parse_options(const nlohmann::json &v) {
  if (!v.is_object())
    throw SchemaError("Element 'options' has to be an object.");
  MatchOptionsInput options;
  if (v.contains("distance_metric")) {
    if (!v["distance_metric"].is_string())
      throw SchemaError("Argument 'distance_metric' has to be a string.");
    options.distance_metric = v["distance_metric"].get<std::string>();
  }
  if (v.contains("donors"))
    options.donors = integral(v["donors"], "donors");
  else if (v.contains("donor_pool_size"))
    options.donors = integral(v["donor_pool_size"], "donor_pool_size");
  if (v.contains("selection_policy"))
    options.selection_policy =
        integral(v["selection_policy"], "selection_policy");
  if (v.contains("ridge"))
    options.ridge = real(v["ridge"], "ridge");
  if (v.contains("eps"))
    options.eps = real(v["eps"], "eps");
  if (v.contains("maxcor"))
    options.maxcor = real(v["maxcor"], "maxcor");
  return options;
}

} // namespace

MatchRequest match_request_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw SchemaError("A match request has to be a JSON object.");

  MatchRequest request;
  if (j.contains("groups") && !j["groups"].is_null())
    request.groups = parse_groups(j["groups"]);
  if (j.contains("weights") && !j["weights"].is_null())
    request.weights = parse_weights(j["weights"]);
  if (j.contains("match_vars") && !j["match_vars"].is_null())
    request.match_vars = parse_match_vars(j["match_vars"]);
  if (j.contains("options"))
    request.options = parse_options(j["options"]);
  if (j.contains("seed")) {
    if (!j["seed"].is_number_unsigned())
      throw SchemaError("Argument 'seed' has to be a non-negative integer.");
    request.seed = j["seed"].get<uint64_t>();
  }
  return request;
}

MatchRequest read_match_request(const std::string &path) {
  return match_request_from_json(load_json_file(path));
}

} // namespace postmatch
