#pragma once

#include "adtjson/core/json.h"

// apply_settings_overrides: merge command-line overrides into a settings
// document read from a file. Top-level keys are replaced, except "discriminator",
// which is merged key by key:
//   - a "style" override replaces a reader/writer pair from the file,
//   - a tag_field or tag_pointer override replaces both tag locations.
[[nodiscard]] adtjson::core::Json apply_settings_overrides(adtjson::core::Json settings,
                                                           const adtjson::core::Json& overrides);
