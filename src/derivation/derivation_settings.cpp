#include "adtjson/derivation/derivation_settings.h"

#include "adtjson/core/configuration_error.h"
#include "adtjson/discriminator/tag_codec.h"

#include <map>
#include <utility>

namespace adtjson::derivation {

namespace {

using SettingsResult = core::Result<DerivationSettings, std::string>;
using FormatResult = core::Result<discriminator::TypeTagFormat, std::string>;

// A pointer with a single token ("/type") is a plain tag field.
discriminator::TagCodec tag_codec_for_pointer(const std::string& pointer) {
  const core::Json::json_pointer parsed(pointer);
  if (!parsed.empty() && parsed.parent_pointer().empty()) {
    return discriminator::field_tag_codec(parsed.back());
  }
  return discriminator::pointer_tag_codec(pointer);
}

FormatResult parse_style(const core::Json& j) {
  if (!j.is_object()) {
    return FormatResult::err("discriminator must be an object");
  }
  if (j.contains("style") && !j["style"].is_string()) {
    return FormatResult::err("style must be a string");
  }
  const std::string style = j.value("style", "nested");
  if (style == "nested") {
    return FormatResult::ok(discriminator::TypeTagFormat::nested());
  }
  if (style != "flat") {
    return FormatResult::err("unknown discriminator style: " + style + " (valid: nested, flat)");
  }

  if (j.contains("tag_field") && j.contains("tag_pointer")) {
    return FormatResult::err("flat discriminator takes tag_field or tag_pointer, not both");
  }
  if (j.contains("tag_pointer")) {
    if (!j["tag_pointer"].is_string()) {
      return FormatResult::err("tag_pointer must be a string");
    }
    return FormatResult::ok(discriminator::TypeTagFormat::flat(
        tag_codec_for_pointer(j["tag_pointer"].get<std::string>())));
  }
  if (j.contains("tag_field") && !j["tag_field"].is_string()) {
    return FormatResult::err("tag_field must be a string");
  }
  return FormatResult::ok(discriminator::TypeTagFormat::flat(
      discriminator::field_tag_codec(j.value("tag_field", "type"))));
}

FormatResult parse_discriminator(const core::Json& j) {
  if (j.is_object() && (j.contains("reader") || j.contains("writer"))) {
    if (!j.contains("reader") || !j.contains("writer")) {
      return FormatResult::err("discriminator needs both reader and writer");
    }
    auto reader = parse_style(j["reader"]);
    if (!reader.has_value()) {
      return reader;
    }
    auto writer = parse_style(j["writer"]);
    if (!writer.has_value()) {
      return writer;
    }
    return FormatResult::ok(
        discriminator::TypeTagFormat::combine(reader.value().reader(), writer.value().writer()));
  }
  return parse_style(j);
}

core::Result<naming::NamingStrategy, std::string> parse_naming(const core::Json& j) {
  using NamingResult = core::Result<naming::NamingStrategy, std::string>;

  if (!j.contains("naming")) {
    return NamingResult::ok(naming::NamingStrategy::short_name());
  }
  if (!j["naming"].is_string()) {
    return NamingResult::err("naming must be a string");
  }
  const auto kind = naming::parse_naming_kind(j["naming"].get<std::string>());
  if (!kind.has_value()) {
    return NamingResult::err("unknown naming: " + j["naming"].get<std::string>() +
                             " (valid: short, full, user-defined)");
  }

  switch (kind.value()) {
    case naming::NamingKind::kShortName:
      return NamingResult::ok(naming::NamingStrategy::short_name());
    case naming::NamingKind::kFullName:
      return NamingResult::ok(naming::NamingStrategy::full_name());
    case naming::NamingKind::kUserDefined:
      break;
  }

  if (!j.contains("tags") || !j["tags"].is_object()) {
    return NamingResult::err("user-defined naming requires a \"tags\" object");
  }
  std::map<std::string, std::string> tags;
  for (auto it = j["tags"].begin(); it != j["tags"].end(); ++it) {
    if (!it.value().is_string()) {
      return NamingResult::err("tag for " + it.key() + " must be a string");
    }
    tags.emplace(it.key(), it.value().get<std::string>());
  }
  return NamingResult::ok(naming::NamingStrategy::user_defined(std::move(tags)));
}

}  // namespace

core::Result<DerivationSettings, std::string> settings_from_json(const core::Json& j) {
  if (!j.is_object()) {
    return SettingsResult::err("settings must be a JSON object");
  }

  try {
    auto naming = parse_naming(j);
    if (!naming.has_value()) {
      return SettingsResult::err(naming.error());
    }

    DerivationSettings settings;
    settings.naming = std::move(naming).value();

    if (j.contains("discriminator")) {
      auto format = parse_discriminator(j["discriminator"]);
      if (!format.has_value()) {
        return SettingsResult::err(format.error());
      }
      settings.format = std::move(format).value();
    }

    if (j.contains("reject_duplicate_tags")) {
      if (!j["reject_duplicate_tags"].is_boolean()) {
        return SettingsResult::err("reject_duplicate_tags must be a boolean");
      }
      settings.reject_duplicate_tags = j["reject_duplicate_tags"].get<bool>();
    }

    return SettingsResult::ok(std::move(settings));
  } catch (const core::ConfigurationError& e) {
    return SettingsResult::err(e.what());
  } catch (const nlohmann::json::parse_error& e) {
    return SettingsResult::err(std::string("invalid tag pointer: ") + e.what());
  }
}

core::Json settings_to_json(const DerivationSettings& settings) {
  core::Json j = core::Json::object();
  j["naming"] = naming::naming_kind_to_string(settings.naming.kind());
  if (const auto* table = settings.naming.tag_table()) {
    core::Json tags = core::Json::object();
    for (const auto& [qualified_name, tag] : *table) {
      tags[qualified_name] = tag;
    }
    j["tags"] = std::move(tags);
  }
  j["discriminator"] = settings.format.describe();
  j["reject_duplicate_tags"] = settings.reject_duplicate_tags;
  return j;
}

}  // namespace adtjson::derivation
