#include "adtjson/naming/naming_strategy.h"

#include "adtjson/core/configuration_error.h"

#include <utility>

namespace adtjson::naming {

NamingStrategy::NamingStrategy(NamingKind kind, TagMapping mapping,
                               std::shared_ptr<const std::map<std::string, std::string>> tag_table)
    : kind_(kind), mapping_(std::move(mapping)), tag_table_(std::move(tag_table)) {}

NamingStrategy NamingStrategy::short_name() {
  return NamingStrategy(NamingKind::kShortName, nullptr, nullptr);
}

NamingStrategy NamingStrategy::full_name() {
  return NamingStrategy(NamingKind::kFullName, nullptr, nullptr);
}

NamingStrategy NamingStrategy::user_defined(TagMapping mapping) {
  if (!mapping) {
    throw core::ConfigurationError("user-defined naming requires a tag mapping");
  }
  return NamingStrategy(NamingKind::kUserDefined, std::move(mapping), nullptr);
}

NamingStrategy NamingStrategy::user_defined(
    std::map<std::string, std::string> tags_by_qualified_name) {
  auto table =
      std::make_shared<const std::map<std::string, std::string>>(std::move(tags_by_qualified_name));
  TagMapping mapping = [table](const TypeIdentity& identity) -> std::optional<std::string> {
    auto it = table->find(identity.qualified_name());
    if (it == table->end()) {
      return std::nullopt;
    }
    return it->second;
  };
  return NamingStrategy(NamingKind::kUserDefined, std::move(mapping), std::move(table));
}

std::string NamingStrategy::name(const TypeIdentity& identity) const {
  switch (kind_) {
    case NamingKind::kShortName:
      return identity.name;
    case NamingKind::kFullName:
      return identity.qualified_name();
    case NamingKind::kUserDefined: {
      auto tag = mapping_(identity);
      if (!tag.has_value()) {
        throw core::ConfigurationError("no user-defined tag for " + identity.qualified_name());
      }
      return std::move(tag).value();
    }
  }
  return identity.name;
}

std::string naming_kind_to_string(const NamingKind kind) {
  switch (kind) {
    case NamingKind::kShortName:
      return "short";
    case NamingKind::kFullName:
      return "full";
    case NamingKind::kUserDefined:
      return "user-defined";
  }
  return "short";
}

std::optional<NamingKind> parse_naming_kind(const std::string_view text) {
  if (text == "short") {
    return NamingKind::kShortName;
  }
  if (text == "full") {
    return NamingKind::kFullName;
  }
  if (text == "user-defined") {
    return NamingKind::kUserDefined;
  }
  return std::nullopt;
}

}  // namespace adtjson::naming
