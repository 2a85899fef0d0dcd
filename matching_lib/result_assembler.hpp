#pragma once
#include "../dataset_lib/imputation_set.hpp"
#include "schema_validator.hpp"

#include <vector>

namespace postmatch {

// Donor rows chosen for one group: donors[imputation][k] belongs to
// recipients[k].
struct GroupMatch {
  Group group;
  std::vector<int> recipients;
  std::vector<std::vector<int>> donors;
};

class ResultAssembler {
public:
  /**
   * @brief Copies each chosen donor's observed group values into the imputed
   *        values of its recipient. Nothing else in the set is touched.
   */
  static void assemble(ImputationSet &set,
                       const std::vector<GroupMatch> &matches);
};

} // namespace postmatch
