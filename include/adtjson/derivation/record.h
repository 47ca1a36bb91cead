#pragma once

#include "adtjson/codec/codec.h"
#include "adtjson/codec/primitive_codecs.h"
#include "adtjson/core/configuration_error.h"
#include "adtjson/naming/type_identity.h"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace adtjson::derivation {

// FieldDescriptor<R> binds one named JSON key to one member of record R.
template <typename R>
class FieldDescriptor {
 public:
  using FieldEncoder = std::function<core::Json(const R&)>;
  using FieldDecoder = std::function<std::optional<core::DecodeError>(const core::Json&, R&)>;

  FieldDescriptor(std::string name, FieldEncoder encode, FieldDecoder decode)
      : name_(std::move(name)), encode_(std::move(encode)), decode_(std::move(decode)) {}

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] core::Json encode(const R& record) const { return encode_(record); }

  // Decodes `json` into the bound member of `record`; returns the codec's error on failure.
  [[nodiscard]] std::optional<core::DecodeError> decode_into(const core::Json& json,
                                                             R& record) const {
    return decode_(json, record);
  }

 private:
  std::string name_;
  FieldEncoder encode_;
  FieldDecoder decode_;
};

template <typename R, typename F>
FieldDescriptor<R> field(std::string name, F R::*member, codec::Codec<F> codec) {
  auto encode = [member, codec](const R& record) { return codec.encode(record.*member); };
  auto decode = [member, codec](const core::Json& json,
                                R& record) -> std::optional<core::DecodeError> {
    auto decoded = codec.decode(json);
    if (!decoded.has_value()) {
      return decoded.error();
    }
    record.*member = std::move(decoded).value();
    return std::nullopt;
  };
  return FieldDescriptor<R>(std::move(name), std::move(encode), std::move(decode));
}

template <typename R, typename F>
FieldDescriptor<R> field(std::string name, F R::*member) {
  return field(std::move(name), member, codec::codec_for<F>());
}

// RecordDescriptor<R> is the structural description of a product type: its
// identity and its fields in declaration order. R must be default-constructible;
// decoding builds an R{} and assigns each decoded field.
template <typename R>
struct RecordDescriptor {
  naming::TypeIdentity identity;
  std::vector<FieldDescriptor<R>> fields;
};

// record<R>("foo::Bar", {field("s", &Bar::s), field("i", &Bar::i)})
// Throws ConfigurationError if two fields share a name.
template <typename R>
RecordDescriptor<R> record(std::string_view qualified_name,
                           std::vector<FieldDescriptor<R>> fields = {}) {
  std::set<std::string> seen;
  for (const auto& f : fields) {
    if (!seen.insert(f.name()).second) {
      throw core::ConfigurationError("duplicate field \"" + f.name() + "\" in record " +
                               std::string(qualified_name));
    }
  }
  return RecordDescriptor<R>{naming::type_identity(qualified_name), std::move(fields)};
}

// Encodes every field, in declaration order, into one object.
template <typename R>
codec::Encoder<R> record_encoder(std::shared_ptr<const RecordDescriptor<R>> descriptor) {
  return [descriptor = std::move(descriptor)](const R& value) {
    core::Json object = core::Json::object();
    for (const auto& f : descriptor->fields) {
      object[f.name()] = f.encode(value);
    }
    return object;
  };
}

// Requires an object. Fields are looked up by name, so key order does not matter
// and unknown keys are ignored. The first absent or undecodable field fails the
// whole record with kMissingField or kInvalidFieldValue at that field's path.
template <typename R>
codec::Decoder<R> record_decoder(std::shared_ptr<const RecordDescriptor<R>> descriptor) {
  return [descriptor = std::move(descriptor)](const core::Json& json) -> codec::DecodeResult<R> {
    if (!json.is_object()) {
      return codec::DecodeResult<R>::err(core::type_mismatch("object", json));
    }
    R value{};
    for (const auto& f : descriptor->fields) {
      auto it = json.find(f.name());
      if (it == json.end()) {
        return codec::DecodeResult<R>::err(core::missing_field(f.name()));
      }
      if (auto failure = f.decode_into(*it, value)) {
        return codec::DecodeResult<R>::err(
            core::invalid_field_value(f.name(), std::move(*failure)));
      }
    }
    return codec::DecodeResult<R>::ok(std::move(value));
  };
}

// derive_record builds the untagged codec of a product type.
template <typename R>
codec::Codec<R> derive_record(RecordDescriptor<R> descriptor) {
  auto shared = std::make_shared<const RecordDescriptor<R>>(std::move(descriptor));
  return codec::Codec<R>(record_encoder<R>(shared), record_decoder<R>(shared));
}

}  // namespace adtjson::derivation
