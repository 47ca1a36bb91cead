#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace adtjson::naming {

// TypeIdentity is the static identity of a record or union: its unqualified
// declared name and the namespaces that enclose it (outermost first).
struct TypeIdentity {
  std::vector<std::string> scopes;
  std::string name;

  // scopes and name joined with "::", e.g. "geo::shapes::Circle".
  [[nodiscard]] std::string qualified_name() const;

  auto operator<=>(const TypeIdentity&) const = default;
};

// type_identity splits a qualified name on "::". Leading "::" is ignored.
[[nodiscard]] TypeIdentity type_identity(std::string_view qualified_name);

[[nodiscard]] TypeIdentity type_identity(std::vector<std::string> scopes, std::string name);

}  // namespace adtjson::naming
