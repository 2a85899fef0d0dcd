#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../matching_lib/match_config.hpp"
#include "../matching_lib/ridge_prediction_engine.hpp"
#include "cli_parser.hpp"
#include "matching_runner.hpp"

#include <iostream>

using namespace postmatch;

int main(int argc, char **argv) {
  CLIParser cli(argc, argv);
  if (cli.has("help") || !cli.has("input") || !cli.has("output")) {
    cli.print_help();
    return cli.has("help") ? 0 : 1;
  }

  if (cli.has("no-color"))
    Logger::instance().set_color(false);
  if (cli.has("log-level")) {
    LogLevel level;
    if (!Logger::parse_level(cli.get("log-level"), level)) {
      std::cerr << "Unknown log level: " << cli.get("log-level") << "\n";
      return 1;
    }
    Logger::instance().set_level(level);
  }

  try {
    MatchRequest request;
    if (cli.has("config"))
      request = read_match_request(cli.get("config"));

    // Command-line flags override the request file.
    if (cli.has("metric"))
      request.options.distance_metric = cli.get("metric");
    request.options.donors = cli.get_int("donors", request.options.donors);
    request.options.selection_policy =
        cli.get_int("policy", request.options.selection_policy);
    request.options.ridge = cli.get_double("ridge", request.options.ridge);
    request.seed = cli.get_uint64("seed", request.seed);

    MatchingRunner runner(cli.get("input"));
    RidgePredictionEngine engine(request.options.ridge, request.options.eps,
                                 request.options.maxcor, !cli.has("no-draw"));
    MatchReport report = runner.run(engine, request);
    runner.save(cli.get("output"));
    if (cli.has("report"))
      runner.write_report(report, cli.get("report"));
  } catch (const MatchingError &e) {
    Logger::error(e.what());
    return 2;
  } catch (const std::exception &e) {
    Logger::error(std::string("Unexpected failure: ") + e.what());
    return 3;
  }
  return 0;
}
