#pragma once

#include <string>
#include <vector>

namespace postmatch {

/**
 * @brief Reference to a column either by name or by 0-based index.
 *
 * A default constructed reference (or a reference to the empty name) is the
 * "none" sentinel used by optional per-group arguments.
 */
class ColumnRef {
public:
  enum class Kind { NONE, NAME, INDEX };

  ColumnRef() = default;

  static ColumnRef by_name(std::string name) {
    ColumnRef ref;
    if (!name.empty()) {
      ref.kind_ = Kind::NAME;
      ref.name_ = std::move(name);
    }
    return ref;
  }

  static ColumnRef by_index(int index) {
    ColumnRef ref;
    ref.kind_ = Kind::INDEX;
    ref.index_ = index;
    return ref;
  }

  static ColumnRef none() { return ColumnRef(); }

  Kind kind() const noexcept { return kind_; }
  bool is_none() const noexcept { return kind_ == Kind::NONE; }
  const std::string &name() const noexcept { return name_; }
  int index() const noexcept { return index_; }

  std::string to_string() const {
    switch (kind_) {
    case Kind::NAME:
      return "'" + name_ + "'";
    case Kind::INDEX:
      return std::to_string(index_);
    default:
      return "<none>";
    }
  }

private:
  Kind kind_ = Kind::NONE;
  std::string name_;
  int index_ = -1;
};

/**
 * @brief Resolves a reference against the given column names.
 * @throws SchemaError for unknown names, out-of-range indices and the none
 *         sentinel.
 */
int resolve_column(const ColumnRef &ref, const std::vector<std::string> &names,
                   const std::string &argname);

} // namespace postmatch
