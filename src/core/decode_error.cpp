#include "adtjson/core/decode_error.h"

#include <sstream>
#include <utility>

namespace adtjson::core {

namespace {

void render(const DecodeError& error, int depth, std::ostringstream& out) {
  out << std::string(static_cast<std::size_t>(depth) * 2, ' ');
  if (!error.variant_tag.empty()) {
    out << "[" << error.variant_tag << "] ";
  }
  out << error.describe() << "\n";
  for (const auto& cause : error.causes) {
    render(cause, depth + 1, out);
  }
}

}  // namespace

DecodeError DecodeError::prefixed(const std::string_view pointer) const {
  DecodeError copy = *this;
  copy.path = std::string(pointer) + path;
  for (auto& cause : copy.causes) {
    cause = cause.prefixed(pointer);
  }
  return copy;
}

std::string DecodeError::describe() const {
  if (path.empty()) {
    return message;
  }
  return path + ": " + message;
}

std::string DecodeError::to_string() const {
  std::ostringstream out;
  render(*this, 0, out);
  std::string text = out.str();
  if (!text.empty() && text.back() == '\n') {
    text.pop_back();
  }
  return text;
}

Json DecodeError::to_json() const {
  Json j = Json::object();
  j["kind"] = decode_error_kind_to_string(kind);
  j["path"] = path;
  j["message"] = message;
  if (!field.empty()) {
    j["field"] = field;
  }
  if (!expected_tag.empty()) {
    j["expected_tag"] = expected_tag;
  }
  if (actual_tag.has_value()) {
    j["actual_tag"] = actual_tag.value();
  }
  if (!variant_tag.empty()) {
    j["variant"] = variant_tag;
  }
  if (!causes.empty()) {
    Json causes_json = Json::array();
    for (const auto& cause : causes) {
      causes_json.push_back(cause.to_json());
    }
    j["causes"] = std::move(causes_json);
  }
  return j;
}

std::string decode_error_kind_to_string(const DecodeErrorKind kind) {
  switch (kind) {
    case DecodeErrorKind::kTypeMismatch:
      return "type_mismatch";
    case DecodeErrorKind::kMissingField:
      return "missing_field";
    case DecodeErrorKind::kInvalidFieldValue:
      return "invalid_field_value";
    case DecodeErrorKind::kDiscriminatorNotFound:
      return "discriminator_not_found";
    case DecodeErrorKind::kDiscriminatorMismatch:
      return "discriminator_mismatch";
    case DecodeErrorKind::kNoVariantMatched:
      return "no_variant_matched";
  }
  return "unknown";
}

DecodeError type_mismatch(const std::string_view expected, const Json& actual) {
  DecodeError error;
  error.kind = DecodeErrorKind::kTypeMismatch;
  error.message = "expected " + std::string(expected) + ", got " + actual.type_name();
  return error;
}

DecodeError missing_field(const std::string& key) {
  DecodeError error;
  error.kind = DecodeErrorKind::kMissingField;
  error.path = pointer_for_key(key);
  error.field = key;
  error.message = "missing required field \"" + key + "\"";
  return error;
}

DecodeError invalid_field_value(const std::string& key, DecodeError cause) {
  const std::string pointer = pointer_for_key(key);

  DecodeError error;
  error.kind = DecodeErrorKind::kInvalidFieldValue;
  error.path = pointer;
  error.field = key;
  error.message = "invalid value for field \"" + key + "\"";
  error.causes.push_back(cause.prefixed(pointer));
  return error;
}

DecodeError discriminator_not_found(const std::string& expected_tag, std::string detail,
                                    std::optional<DecodeError> cause) {
  DecodeError error;
  error.kind = DecodeErrorKind::kDiscriminatorNotFound;
  error.expected_tag = expected_tag;
  error.message = "discriminator \"" + expected_tag + "\" not found";
  if (!detail.empty()) {
    error.message += " (" + detail + ")";
  }
  if (cause.has_value()) {
    error.causes.push_back(std::move(cause).value());
  }
  return error;
}

DecodeError discriminator_mismatch(const std::string& expected_tag,
                                   const std::string& actual_tag) {
  DecodeError error;
  error.kind = DecodeErrorKind::kDiscriminatorMismatch;
  error.expected_tag = expected_tag;
  error.actual_tag = actual_tag;
  error.message =
      "discriminator mismatch: expected \"" + expected_tag + "\", got \"" + actual_tag + "\"";
  return error;
}

DecodeError no_variant_matched(const std::string& type_name, std::vector<DecodeError> failures) {
  DecodeError error;
  error.kind = DecodeErrorKind::kNoVariantMatched;
  error.message = "no variant of " + type_name + " matched";
  error.causes = std::move(failures);
  return error;
}

DecodeError nesting_too_deep(const std::size_t max_depth) {
  DecodeError error;
  error.kind = DecodeErrorKind::kTypeMismatch;
  error.message = "nesting exceeds maximum depth " + std::to_string(max_depth);
  return error;
}

}  // namespace adtjson::core
