#include "column_ref.hpp"
#include "errors.hpp"

#include <algorithm>

namespace postmatch {

int resolve_column(const ColumnRef &ref, const std::vector<std::string> &names,
                   const std::string &argname) {
  switch (ref.kind()) {
  case ColumnRef::Kind::NAME: {
    auto it = std::find(names.begin(), names.end(), ref.name());
    if (it == names.end())
      throw SchemaError("Argument '" + argname +
                        "' contains an invalid column name " + ref.to_string() +
                        ".");
    return static_cast<int>(it - names.begin());
  }
  case ColumnRef::Kind::INDEX:
    if (ref.index() < 0 || ref.index() >= static_cast<int>(names.size()))
      throw SchemaError("Argument '" + argname +
                        "' contains an out-of-bounds column index " +
                        ref.to_string() + " (data has " +
                        std::to_string(names.size()) + " columns).");
    return ref.index();
  default:
    throw SchemaError("Argument '" + argname +
                      "' contains an empty column reference.");
  }
}

} // namespace postmatch
