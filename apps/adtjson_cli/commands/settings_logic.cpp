#include "settings_logic.h"

#include <utility>

namespace {

void merge_discriminator(adtjson::core::Json& discriminator,
                         const adtjson::core::Json& override_value) {
  if (!override_value.is_object()) {
    discriminator = override_value;
    return;
  }
  if (override_value.contains("style")) {
    discriminator.erase("reader");
    discriminator.erase("writer");
  }
  if (override_value.contains("tag_field") || override_value.contains("tag_pointer")) {
    discriminator.erase("tag_field");
    discriminator.erase("tag_pointer");
  }
  discriminator.update(override_value);
}

}  // namespace

adtjson::core::Json apply_settings_overrides(adtjson::core::Json settings,
                                             const adtjson::core::Json& overrides) {
  for (auto it = overrides.begin(); it != overrides.end(); ++it) {
    if (it.key() == "discriminator" && settings.contains("discriminator") &&
        settings["discriminator"].is_object()) {
      merge_discriminator(settings["discriminator"], it.value());
    } else {
      settings[it.key()] = it.value();
    }
  }
  return settings;
}
