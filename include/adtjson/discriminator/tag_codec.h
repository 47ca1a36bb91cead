#pragma once

#include "adtjson/codec/codec.h"

#include <string>

namespace adtjson::discriminator {

// TagCodec reads and writes the discriminator string of a flat-tagged object.
// encode() yields an object holding only the tag; decode() pulls the tag out of
// a full object. pointer() is the JSON Pointer where the tag lives, used for
// diagnostics and when settings are written back out.
class TagCodec {
 public:
  TagCodec(std::string pointer, codec::Codec<std::string> codec);

  [[nodiscard]] core::Json encode(const std::string& tag) const { return codec_.encode(tag); }
  [[nodiscard]] codec::DecodeResult<std::string> decode(const core::Json& json) const {
    return codec_.decode(json);
  }
  [[nodiscard]] const std::string& pointer() const noexcept { return pointer_; }

 private:
  std::string pointer_;
  codec::Codec<std::string> codec_;
};

// Tag stored in a top-level field: {"type": "Bar", ...}.
[[nodiscard]] TagCodec field_tag_codec(const std::string& field_name = "type");

// Tag stored at an arbitrary JSON Pointer, e.g. "/meta/kind" for
// {"meta": {"kind": "Bar"}, ...}. Every token is an object key, so "/meta/0"
// writes {"meta": {"0": "Bar"}}. Throws ConfigurationError for a malformed or
// root pointer.
[[nodiscard]] TagCodec pointer_tag_codec(const std::string& pointer);

}  // namespace adtjson::discriminator
