#pragma once

namespace adtjson::core {

// kBuildVersion is the current library version string.
constexpr const char* kBuildVersion = "0.3";

}  // namespace adtjson::core
