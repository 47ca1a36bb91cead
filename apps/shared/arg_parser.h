#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace adtjson::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns an empty string on success, or a message describing why the
// value was rejected.
template <typename Config>
struct Option {
  std::string name;
  bool requires_value{false};
  std::string description;
  std::function<std::string(Config&, const std::string& value)> handler;
};

template <typename Config>
struct ParsedOptions {
  Config config;
  std::vector<std::string> positionals;  // non-flag tokens, in order
  std::vector<std::string> errors;       // unknown flags, missing values, rejected values

  [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Every problem is collected in errors; parsing continues past
// it so all of them can be reported at once.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.positionals.push_back(std::move(arg));
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    std::string problem = opt->handler(parsed.config, value);
    if (!problem.empty()) {
      parsed.errors.push_back(std::move(problem));
    }
  }

  return parsed;
}

// usage_lines renders "  --flag <value>  description" for each option.
template <typename Config>
std::string usage_lines(const std::vector<Option<Config>>& options) {
  std::string text;
  for (const auto& opt : options) {
    text += "  " + opt.name + (opt.requires_value ? " <value>" : "") + "  " + opt.description +
            "\n";
  }
  return text;
}

}  // namespace adtjson::apps
