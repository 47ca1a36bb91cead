#include "adtjson/core/json.h"
#include "adtjson/core/version.h"
#include "adtjson/derivation/derivation_settings.h"
#include "adtjson/naming/naming_strategy.h"

#include "commands/convert_logic.h"
#include "commands/settings_logic.h"
#include "shared/arg_parser.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

// Settings overrides collected from flags, applied on top of a --settings file.
struct SettingsFlags {
  std::optional<std::string> settings_path;
  adtjson::core::Json overrides = adtjson::core::Json::object();
};

struct CliConfig {
  SettingsFlags from;
  SettingsFlags to;
  std::optional<std::string> input_path;
};

std::string set_naming(SettingsFlags& flags, const std::string& value) {
  if (!adtjson::naming::parse_naming_kind(value).has_value()) {
    return "Invalid naming: " + value + " (valid: short, full, user-defined)";
  }
  flags.overrides["naming"] = value;
  return "";
}

std::string set_style(SettingsFlags& flags, const std::string& value) {
  if (value != "nested" && value != "flat") {
    return "Invalid discriminator: " + value + " (valid: nested, flat)";
  }
  flags.overrides["discriminator"]["style"] = value;
  return "";
}

// A tag location implies the flat style and replaces any location from the file.
std::string set_tag_location(SettingsFlags& flags, const std::string& key,
                             const std::string& value) {
  auto& discriminator = flags.overrides["discriminator"];
  discriminator["style"] = "flat";
  discriminator[key] = value;
  return "";
}

std::vector<adtjson::apps::Option<CliConfig>> build_options() {
  using Opt = adtjson::apps::Option<CliConfig>;
  return {
      Opt{"--input", true, "Read the JSON document from this file instead of stdin",
          [](CliConfig& c, const std::string& v) {
            c.input_path = v;
            return std::string();
          }},
      Opt{"--settings", true, "Derivation settings file (JSON)",
          [](CliConfig& c, const std::string& v) {
            c.from.settings_path = v;
            return std::string();
          }},
      Opt{"--naming", true, "Naming strategy (short|full|user-defined)",
          [](CliConfig& c, const std::string& v) { return set_naming(c.from, v); }},
      Opt{"--discriminator", true, "Discriminator style (nested|flat)",
          [](CliConfig& c, const std::string& v) { return set_style(c.from, v); }},
      Opt{"--tag-field", true, "Flat tag field name",
          [](CliConfig& c, const std::string& v) {
            return set_tag_location(c.from, "tag_field", v);
          }},
      Opt{"--tag-pointer", true, "Flat tag JSON Pointer (e.g. /meta/kind)",
          [](CliConfig& c, const std::string& v) {
            return set_tag_location(c.from, "tag_pointer", v);
          }},
      Opt{"--reject-duplicate-tags", false, "Fail when two variants share a tag",
          [](CliConfig& c, const std::string&) {
            c.from.overrides["reject_duplicate_tags"] = true;
            return std::string();
          }},
      Opt{"--to-settings", true, "convert: target settings file (JSON)",
          [](CliConfig& c, const std::string& v) {
            c.to.settings_path = v;
            return std::string();
          }},
      Opt{"--to-naming", true, "convert: target naming strategy",
          [](CliConfig& c, const std::string& v) { return set_naming(c.to, v); }},
      Opt{"--to-discriminator", true, "convert: target discriminator style",
          [](CliConfig& c, const std::string& v) { return set_style(c.to, v); }},
      Opt{"--to-tag-field", true, "convert: target flat tag field name",
          [](CliConfig& c, const std::string& v) {
            return set_tag_location(c.to, "tag_field", v);
          }},
      Opt{"--to-tag-pointer", true, "convert: target flat tag JSON Pointer",
          [](CliConfig& c, const std::string& v) {
            return set_tag_location(c.to, "tag_pointer", v);
          }},
  };
}

void print_usage(const std::vector<adtjson::apps::Option<CliConfig>>& options) {
  std::cerr << "Usage: adtjson_cli <check|convert|settings|version> [options]\n"
            << adtjson::apps::usage_lines(options);
}

std::optional<std::string> read_text(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(path.value());
  if (!file) {
    std::cerr << "Failed to open " << path.value() << "\n";
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// Loads the settings file (if any), applies flag overrides, and validates.
std::optional<adtjson::derivation::DerivationSettings> resolve_settings(
    const SettingsFlags& flags) {
  adtjson::core::Json j = adtjson::core::Json::object();
  if (flags.settings_path.has_value()) {
    auto text = read_text(flags.settings_path);
    if (!text.has_value()) {
      return std::nullopt;
    }
    j = adtjson::core::Json::parse(text.value(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
      std::cerr << "Settings file " << flags.settings_path.value()
                << " is not a JSON object\n";
      return std::nullopt;
    }
  }

  j = apply_settings_overrides(std::move(j), flags.overrides);

  auto settings = adtjson::derivation::settings_from_json(j);
  if (!settings.has_value()) {
    std::cerr << "Invalid settings: " << settings.error() << "\n";
    return std::nullopt;
  }
  return settings.value();
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_options();
  if (argc < 2) {
    print_usage(options);
    return kExitUsage;
  }

  const std::string command = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (command == "version") {
    std::cout << "adtjson " << adtjson::core::kBuildVersion << "\n";
    return kExitOk;
  }

  auto parsed = adtjson::apps::parse_options(argc, argv, options, 2);
  for (const auto& problem : parsed.errors) {
    std::cerr << problem << "\n";
  }
  for (const auto& extra : parsed.positionals) {
    std::cerr << "Unexpected argument: " << extra << "\n";
  }
  if (!parsed.ok() || !parsed.positionals.empty()) {
    print_usage(options);
    return kExitUsage;
  }
  const CliConfig& config = parsed.config;

  auto from = resolve_settings(config.from);
  if (!from.has_value()) {
    return kExitUsage;
  }

  if (command == "settings") {
    std::cout << adtjson::derivation::settings_to_json(from.value()).dump(2) << "\n";
    return kExitOk;
  }

  if (command != "check" && command != "convert") {
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(options);
    return kExitUsage;
  }

  auto input = read_text(config.input_path);
  if (!input.has_value()) {
    return kExitUsage;
  }

  if (command == "check") {
    return execute_check(input.value(), from.value(), std::cout, std::cerr);
  }

  auto to = resolve_settings(config.to);
  if (!to.has_value()) {
    return kExitUsage;
  }
  return execute_convert(input.value(), from.value(), to.value(), std::cout, std::cerr);
}
