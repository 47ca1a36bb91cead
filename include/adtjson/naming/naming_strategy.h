#pragma once

#include "adtjson/naming/type_identity.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace adtjson::naming {

enum class NamingKind {
  kShortName,    // unqualified declared name: "Bar"
  kFullName,     // qualified name: "foo::model::Bar"
  kUserDefined,  // caller-supplied tag per variant
};

using TagMapping = std::function<std::optional<std::string>(const TypeIdentity&)>;

// NamingStrategy maps a variant's identity to the string written as its discriminator.
//
// name() is pure. For kUserDefined it throws ConfigurationError when the mapping
// has no entry; derivation resolves every tag up front, so that happens while the
// codec is being built rather than while decoding.
class NamingStrategy {
 public:
  static NamingStrategy short_name();
  static NamingStrategy full_name();
  static NamingStrategy user_defined(TagMapping mapping);
  // Tags keyed by qualified name ("foo::model::Bar").
  static NamingStrategy user_defined(std::map<std::string, std::string> tags_by_qualified_name);

  [[nodiscard]] NamingKind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string name(const TypeIdentity& identity) const;

  // The tag table passed to user_defined(map), or nullptr for the other factories.
  [[nodiscard]] const std::map<std::string, std::string>* tag_table() const noexcept {
    return tag_table_.get();
  }

 private:
  NamingStrategy(NamingKind kind, TagMapping mapping,
                 std::shared_ptr<const std::map<std::string, std::string>> tag_table);

  NamingKind kind_;
  TagMapping mapping_;
  std::shared_ptr<const std::map<std::string, std::string>> tag_table_;
};

// "short", "full", "user-defined"
[[nodiscard]] std::string naming_kind_to_string(NamingKind kind);
[[nodiscard]] std::optional<NamingKind> parse_naming_kind(std::string_view text);

}  // namespace adtjson::naming
