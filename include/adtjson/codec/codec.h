#pragma once

#include "adtjson/core/decode_error.h"
#include "adtjson/core/json.h"
#include "adtjson/core/result.h"

#include <functional>
#include <utility>

namespace adtjson::codec {

template <typename T>
using Encoder = std::function<core::Json(const T&)>;

// Outcome of decoding a T: the value, or why the JSON did not describe one.
template <typename T>
using DecodeResult = core::Result<T, core::DecodeError>;

template <typename T>
using Decoder = std::function<DecodeResult<T>(const core::Json&)>;

// Codec<T> pairs an encoder and a decoder for T.
// Codecs are immutable after construction; copies share the underlying callables'
// captured state, and encode/decode may be called concurrently from any thread.
template <typename T>
class Codec {
 public:
  Codec(Encoder<T> encoder, Decoder<T> decoder)
      : encoder_(std::move(encoder)), decoder_(std::move(decoder)) {}

  [[nodiscard]] core::Json encode(const T& value) const { return encoder_(value); }
  [[nodiscard]] DecodeResult<T> decode(const core::Json& json) const { return decoder_(json); }

  [[nodiscard]] const Encoder<T>& encoder() const noexcept { return encoder_; }
  [[nodiscard]] const Decoder<T>& decoder() const noexcept { return decoder_; }

 private:
  Encoder<T> encoder_;
  Decoder<T> decoder_;
};

}  // namespace adtjson::codec
