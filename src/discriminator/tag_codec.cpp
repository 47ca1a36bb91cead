#include "adtjson/discriminator/tag_codec.h"

#include "adtjson/core/configuration_error.h"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace adtjson::discriminator {

TagCodec::TagCodec(std::string pointer, codec::Codec<std::string> codec)
    : pointer_(std::move(pointer)), codec_(std::move(codec)) {}

TagCodec field_tag_codec(const std::string& field_name) {
  if (field_name.empty()) {
    throw core::ConfigurationError("tag field name must not be empty");
  }

  auto encode = [field_name](const std::string& tag) { return core::with_key(field_name, tag); };
  auto decode = [field_name](const core::Json& json) -> codec::DecodeResult<std::string> {
    if (!json.is_object()) {
      return codec::DecodeResult<std::string>::err(core::type_mismatch("object", json));
    }
    auto it = json.find(field_name);
    if (it == json.end()) {
      return codec::DecodeResult<std::string>::err(core::missing_field(field_name));
    }
    if (!it->is_string()) {
      return codec::DecodeResult<std::string>::err(
          core::invalid_field_value(field_name, core::type_mismatch("string", *it)));
    }
    return codec::DecodeResult<std::string>::ok(it->get<std::string>());
  };

  return TagCodec(core::pointer_for_key(field_name),
                  codec::Codec<std::string>(std::move(encode), std::move(decode)));
}

TagCodec pointer_tag_codec(const std::string& pointer) {
  core::Json::json_pointer parsed;
  try {
    parsed = core::Json::json_pointer(pointer);
  } catch (const nlohmann::json::parse_error& e) {
    throw core::ConfigurationError("invalid tag pointer \"" + pointer + "\": " + e.what());
  }
  if (parsed.empty()) {
    throw core::ConfigurationError("tag pointer must not refer to the document root");
  }

  std::vector<std::string> tokens;
  for (auto remaining = parsed; !remaining.empty(); remaining.pop_back()) {
    tokens.push_back(remaining.back());
  }
  std::reverse(tokens.begin(), tokens.end());

  // Every token is an object key, numeric ones included, so decode walks back
  // down the same keys.
  auto encode = [tokens](const std::string& tag) {
    core::Json j = core::Json::object();
    core::Json* current = &j;
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
      current = &(*current)[tokens[i]];
      *current = core::Json::object();
    }
    (*current)[tokens.back()] = tag;
    return j;
  };
  auto decode = [tokens, pointer](const core::Json& json) -> codec::DecodeResult<std::string> {
    if (!json.is_object()) {
      return codec::DecodeResult<std::string>::err(core::type_mismatch("object", json));
    }

    // Absent parents and non-object intermediates count as a missing tag.
    const core::Json* current = &json;
    for (const auto& token : tokens) {
      if (!current->is_object()) {
        current = nullptr;
        break;
      }
      auto it = current->find(token);
      if (it == current->end()) {
        current = nullptr;
        break;
      }
      current = &(*it);
    }

    if (current == nullptr) {
      core::DecodeError error;
      error.kind = core::DecodeErrorKind::kMissingField;
      error.path = pointer;
      error.field = pointer;
      error.message = "missing required field \"" + pointer + "\"";
      return codec::DecodeResult<std::string>::err(std::move(error));
    }
    if (!current->is_string()) {
      core::DecodeError cause = core::type_mismatch("string", *current);
      cause.path = pointer;

      core::DecodeError error;
      error.kind = core::DecodeErrorKind::kInvalidFieldValue;
      error.path = pointer;
      error.field = pointer;
      error.message = "invalid value for field \"" + pointer + "\"";
      error.causes.push_back(std::move(cause));
      return codec::DecodeResult<std::string>::err(std::move(error));
    }
    return codec::DecodeResult<std::string>::ok(current->get<std::string>());
  };

  return TagCodec(pointer, codec::Codec<std::string>(std::move(encode), std::move(decode)));
}

}  // namespace adtjson::discriminator
