#pragma once

#include "adtjson/core/json.h"
#include "adtjson/discriminator/tag_codec.h"

#include <string>

namespace adtjson::discriminator {

// TypeTagWriter is the encode half of a discriminator strategy: it combines a
// variant's tag with the variant's base JSON object.
class TypeTagWriter {
 public:
  virtual ~TypeTagWriter() = default;

  [[nodiscard]] virtual core::Json write(const std::string& type_name, core::Json base) const = 0;

  // Settings-style description, e.g. {"style": "nested"}.
  [[nodiscard]] virtual core::Json describe() const = 0;

 protected:
  TypeTagWriter() = default;
  TypeTagWriter(const TypeTagWriter&) = default;
  TypeTagWriter& operator=(const TypeTagWriter&) = default;
  TypeTagWriter(TypeTagWriter&&) = default;
  TypeTagWriter& operator=(TypeTagWriter&&) = default;
};

// {"Bar": {"s": "quux", "i": 42}}
class NestedTypeTagWriter final : public TypeTagWriter {
 public:
  [[nodiscard]] core::Json write(const std::string& type_name, core::Json base) const override;
  [[nodiscard]] core::Json describe() const override;
};

// {"type": "Bar", "s": "quux", "i": 42}
// The tag object comes first and the base object is merged over it, so a base
// field with the same key as the tag field replaces the tag.
class FlatTypeTagWriter final : public TypeTagWriter {
 public:
  explicit FlatTypeTagWriter(TagCodec tag_codec);

  [[nodiscard]] core::Json write(const std::string& type_name, core::Json base) const override;
  [[nodiscard]] core::Json describe() const override;

 private:
  TagCodec tag_codec_;
};

}  // namespace adtjson::discriminator
