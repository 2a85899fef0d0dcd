#pragma once
#include <iostream>
#include <map>
#include <string>

namespace postmatch {

class CLIParser {
public:
  CLIParser(int argc, char **argv) {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.substr(0, 2) == "--") {
        std::string key = arg.substr(2);
        if (i + 1 < argc && argv[i + 1][0] != '-') {
          args[key] = argv[++i];
        } else {
          args[key] = "true";
        }
      }
    }
  }

  bool has(const std::string &key) const {
    return args.find(key) != args.end();
  }

  std::string get(const std::string &key,
                  const std::string &default_val = "") const {
    auto it = args.find(key);
    return (it != args.end()) ? it->second : default_val;
  }

  int get_int(const std::string &key, int default_val = 0) const {
    if (!has(key))
      return default_val;
    return std::stoi(args.at(key));
  }

  unsigned long long get_uint64(const std::string &key,
                                unsigned long long default_val = 0) const {
    if (!has(key))
      return default_val;
    return std::stoull(args.at(key));
  }

  double get_double(const std::string &key, double default_val = 0.0) const {
    if (!has(key))
      return default_val;
    return std::stod(args.at(key));
  }

  void print_help() const {
    std::cout << "Usage: postmatch --input <set.json> --output <out.json> "
                 "[options]\n"
              << "Options:\n"
              << "  --input <path>      Imputation set (JSON)\n"
              << "  --output <path>     Where to write the matched set\n"
              << "  --config <path>     Match request (JSON): groups, "
                 "weights, match_vars, options, seed\n"
              << "  --metric <name>     Distance metric (manhattan, "
                 "euclidian, mahalanobis, residual)\n"
              << "  --donors <int>      Donor pool size\n"
              << "  --policy <int>      Selection policy (0 nearest, 1 "
                 "uniform, 2 inverse distance)\n"
              << "  --ridge <float>     Ridge regularization factor\n"
              << "  --seed <int>        Random seed\n"
              << "  --no-draw           Use least-squares coefficients for "
                 "recipients\n"
              << "  --report <path>     Write per-group summary as CSV\n"
              << "  --log-level <name>  debug, info, warn, error or off\n"
              << "  --no-color          Plain log output\n"
              << "  --help              Show this help message\n";
  }

private:
  std::map<std::string, std::string> args;
};

} // namespace postmatch
