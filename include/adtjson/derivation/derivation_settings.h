#pragma once

#include "adtjson/core/json.h"
#include "adtjson/core/result.h"
#include "adtjson/discriminator/type_tag_format.h"
#include "adtjson/naming/naming_strategy.h"

#include <string>

namespace adtjson::derivation {

// DerivationSettings selects how derived unions are tagged.
// Defaults: short names, nested discriminator, duplicate tags tolerated
// (first-declared variant wins on decode).
struct DerivationSettings {
  naming::NamingStrategy naming{naming::NamingStrategy::short_name()};
  discriminator::TypeTagFormat format{discriminator::TypeTagFormat::nested()};
  bool reject_duplicate_tags{false};
};

// settings_from_json reads
//   {
//     "naming": "short" | "full" | "user-defined",
//     "tags": {"pkg::Bar": "bar", ...},            // required for "user-defined"
//     "discriminator": {"style": "nested"} |
//                      {"style": "flat", "tag_field": "type"} |
//                      {"style": "flat", "tag_pointer": "/meta/kind"},
//     "reject_duplicate_tags": false
//   }
// Every key is optional; absent keys keep the defaults above. Unknown keys are ignored.
[[nodiscard]] core::Result<DerivationSettings, std::string> settings_from_json(const core::Json& j);

// settings_to_json writes the form read by settings_from_json. A user-defined
// strategy built from a mapping function has no tag table to write, so its "tags"
// key is omitted.
[[nodiscard]] core::Json settings_to_json(const DerivationSettings& settings);

}  // namespace adtjson::derivation
