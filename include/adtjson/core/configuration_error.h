#pragma once

#include <stdexcept>
#include <string>

namespace adtjson::core {

// ConfigurationError reports a mistake in how a codec was described or derived:
// an unmapped user-defined tag, a union alternative described twice or not at all,
// duplicate tags under strict settings, or a registry lookup for an unregistered type.
// It is raised while building descriptors, never while decoding input.
class ConfigurationError : public std::logic_error {
 public:
  explicit ConfigurationError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace adtjson::core
