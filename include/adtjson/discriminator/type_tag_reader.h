#pragma once

#include "adtjson/codec/codec.h"
#include "adtjson/discriminator/tag_codec.h"

#include <memory>
#include <string>
#include <utility>

namespace adtjson::discriminator {

// TaggedPayload is the part of a tagged value the variant's own decoder reads,
// and the JSON Pointer at which it was found.
struct TaggedPayload {
  const core::Json* value{nullptr};
  std::string path;
};

// TypeTagReader is the decode half of a discriminator strategy. locate() checks
// that `input` carries `type_name` and hands back the payload to decode.
class TypeTagReader {
 public:
  virtual ~TypeTagReader() = default;

  [[nodiscard]] virtual codec::DecodeResult<TaggedPayload> locate(
      const std::string& type_name, const core::Json& input) const = 0;

  [[nodiscard]] virtual core::Json describe() const = 0;

 protected:
  TypeTagReader() = default;
  TypeTagReader(const TypeTagReader&) = default;
  TypeTagReader& operator=(const TypeTagReader&) = default;
  TypeTagReader(TypeTagReader&&) = default;
  TypeTagReader& operator=(TypeTagReader&&) = default;
};

// Reads {"Bar": {...}}: the payload is the value under the key `type_name`.
class NestedTypeTagReader final : public TypeTagReader {
 public:
  [[nodiscard]] codec::DecodeResult<TaggedPayload> locate(const std::string& type_name,
                                                          const core::Json& input) const override;
  [[nodiscard]] core::Json describe() const override;
};

// Reads {"type": "Bar", ...}: the tag must decode to `type_name`; the payload is
// the whole input object, tag field included.
class FlatTypeTagReader final : public TypeTagReader {
 public:
  explicit FlatTypeTagReader(TagCodec tag_codec);

  [[nodiscard]] codec::DecodeResult<TaggedPayload> locate(const std::string& type_name,
                                                          const core::Json& input) const override;
  [[nodiscard]] core::Json describe() const override;

 private:
  TagCodec tag_codec_;
};

// read_tagged wraps `base` so it only runs on inputs tagged `type_name`.
// Errors from `base` are reported relative to the tagged input.
template <typename A>
codec::Decoder<A> read_tagged(std::shared_ptr<const TypeTagReader> reader,
                              std::string type_name, codec::Decoder<A> base) {
  return [reader = std::move(reader), type_name = std::move(type_name),
          base = std::move(base)](const core::Json& input) -> codec::DecodeResult<A> {
    auto located = reader->locate(type_name, input);
    if (!located.has_value()) {
      return codec::DecodeResult<A>::err(std::move(located).error());
    }
    const TaggedPayload& payload = located.value();
    auto decoded = base(*payload.value);
    if (!decoded.has_value() && !payload.path.empty()) {
      return codec::DecodeResult<A>::err(decoded.error().prefixed(payload.path));
    }
    return decoded;
  };
}

}  // namespace adtjson::discriminator
