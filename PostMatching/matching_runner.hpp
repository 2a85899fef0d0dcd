#pragma once
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../dataset_lib/json_io.hpp"
#include "../matching_lib/post_matcher.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace postmatch {

class MatchingRunner {
public:
  explicit MatchingRunner(const std::string &input_path)
      : set_(read_imputation_set(input_path)) {
    Logger::info("Loaded imputation set: " + std::to_string(set_.rows()) +
                 "x" + std::to_string(set_.cols()) + ", m=" +
                 std::to_string(set_.m));
  }

  const ImputationSet &set() const { return set_; }

  MatchReport run(const IPredictionEngine &engine,
                  const MatchRequest &request) {
    auto start = std::chrono::high_resolution_clock::now();
    MatchReport report = post_match(set_, engine, request);
    auto end = std::chrono::high_resolution_clock::now();

    double elapsed_ms =
        std::chrono::duration<double, std::milli>(end - start).count();
    std::ostringstream msg;
    msg << "Done in " << std::fixed << std::setprecision(2) << elapsed_ms
        << " ms.";
    Logger::info(msg.str());
    elapsed_ms_ = elapsed_ms;
    return report;
  }

  void save(const std::string &output_path) const {
    write_imputation_set(set_, output_path);
    Logger::info("Matched set written to " + output_path);
  }

  void write_report(const MatchReport &report,
                    const std::string &output_csv) const {
    std::ofstream csv(output_csv);
    if (!csv)
      throw IOError("Cannot write report: " + output_csv);
    csv << "Group,MatchVar,Donors,Recipients,Partitions,Metric,TimeMs\n";
    for (const auto &g : report.groups) {
      std::string columns;
      for (size_t k = 0; k < g.group.size(); ++k)
        columns += (k > 0 ? " " : "") + set_.data.column(g.group[k]).name;
      csv << columns << ","
          << (g.match_var ? set_.data.column(*g.match_var).name : "") << ","
          << g.donors << "," << g.recipients << "," << g.partitions << ","
          << metric_name(report.options.metric) << "," << elapsed_ms_ << "\n";
    }
  }

private:
  ImputationSet set_;
  double elapsed_ms_ = 0.0;
};

} // namespace postmatch
