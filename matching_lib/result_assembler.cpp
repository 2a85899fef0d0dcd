#include "result_assembler.hpp"
#include "../common/errors.hpp"

namespace postmatch {

void ResultAssembler::assemble(ImputationSet &set,
                               const std::vector<GroupMatch> &matches) {
  for (const auto &match : matches) {
    for (int col : match.group) {
      std::vector<int> positions = set.target_positions(col);
      Mat &values = set.imp[col];
      for (size_t imputation = 0; imputation < match.donors.size();
           ++imputation) {
        const auto &donors = match.donors[imputation];
        for (size_t k = 0; k < match.recipients.size(); ++k) {
          int pos = positions[match.recipients[k]];
          if (pos < 0)
            throw StateError("Row " + std::to_string(match.recipients[k]) +
                             " of group " + format_group(match.group) +
                             " is not an imputation target.");
          values(pos, static_cast<int>(imputation)) =
              set.data.at(donors[k], col);
        }
      }
    }
  }
}

} // namespace postmatch
