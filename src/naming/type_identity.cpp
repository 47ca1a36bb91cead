#include "adtjson/naming/type_identity.h"

#include "adtjson/core/configuration_error.h"

#include <utility>

namespace adtjson::naming {

namespace {

constexpr std::string_view kScopeSeparator = "::";

}  // namespace

std::string TypeIdentity::qualified_name() const {
  std::string result;
  for (const auto& scope : scopes) {
    result += scope;
    result += kScopeSeparator;
  }
  result += name;
  return result;
}

TypeIdentity type_identity(std::string_view qualified_name) {
  if (qualified_name.substr(0, kScopeSeparator.size()) == kScopeSeparator) {
    qualified_name.remove_prefix(kScopeSeparator.size());
  }

  TypeIdentity identity;
  std::size_t start = 0;
  while (true) {
    const std::size_t end = qualified_name.find(kScopeSeparator, start);
    const std::string_view part = qualified_name.substr(start, end - start);
    if (part.empty()) {
      throw core::ConfigurationError("malformed type name: \"" + std::string(qualified_name) +
                                     "\"");
    }
    if (end == std::string_view::npos) {
      identity.name = std::string(part);
      break;
    }
    identity.scopes.emplace_back(part);
    start = end + kScopeSeparator.size();
  }
  return identity;
}

TypeIdentity type_identity(std::vector<std::string> scopes, std::string name) {
  if (name.empty()) {
    throw core::ConfigurationError("type name must not be empty");
  }
  return TypeIdentity{std::move(scopes), std::move(name)};
}

}  // namespace adtjson::naming
