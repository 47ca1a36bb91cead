#include "adtjson/discriminator/type_tag_reader.h"

#include <utility>

namespace adtjson::discriminator {

codec::DecodeResult<TaggedPayload> NestedTypeTagReader::locate(const std::string& type_name,
                                                               const core::Json& input) const {
  if (!input.is_object()) {
    return codec::DecodeResult<TaggedPayload>::err(core::discriminator_not_found(
        type_name, std::string("expected object, got ") + input.type_name()));
  }
  auto it = input.find(type_name);
  if (it == input.end()) {
    return codec::DecodeResult<TaggedPayload>::err(core::discriminator_not_found(type_name, ""));
  }
  return codec::DecodeResult<TaggedPayload>::ok(
      TaggedPayload{&(*it), core::pointer_for_key(type_name)});
}

core::Json NestedTypeTagReader::describe() const {
  return core::Json{{"style", "nested"}};
}

FlatTypeTagReader::FlatTypeTagReader(TagCodec tag_codec) : tag_codec_(std::move(tag_codec)) {}

codec::DecodeResult<TaggedPayload> FlatTypeTagReader::locate(const std::string& type_name,
                                                             const core::Json& input) const {
  auto tag = tag_codec_.decode(input);
  if (!tag.has_value()) {
    return codec::DecodeResult<TaggedPayload>::err(
        core::discriminator_not_found(type_name, "no tag at " + tag_codec_.pointer(), tag.error()));
  }
  if (tag.value() != type_name) {
    core::DecodeError error = core::discriminator_mismatch(type_name, tag.value());
    error.path = tag_codec_.pointer();
    return codec::DecodeResult<TaggedPayload>::err(std::move(error));
  }
  return codec::DecodeResult<TaggedPayload>::ok(TaggedPayload{&input, ""});
}

core::Json FlatTypeTagReader::describe() const {
  return core::Json{{"style", "flat"}, {"tag_pointer", tag_codec_.pointer()}};
}

}  // namespace adtjson::discriminator
