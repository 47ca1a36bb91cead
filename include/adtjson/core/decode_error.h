#pragma once

#include "adtjson/core/json.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adtjson::core {

enum class DecodeErrorKind {
  kTypeMismatch,            // JSON value has the wrong shape for a primitive or record
  kMissingField,            // required record field absent
  kInvalidFieldValue,       // field present but its codec rejected it (one cause)
  kDiscriminatorNotFound,   // tag key (nested) or tag field (flat) absent or unreadable
  kDiscriminatorMismatch,   // flat tag present but names another variant
  kNoVariantMatched,        // every variant of a union failed (one cause per variant)
};

// DecodeError describes why a JSON value could not be decoded.
//
// path is a JSON Pointer relative to the value handed to the outermost decode call.
// Errors nest: kInvalidFieldValue wraps the field codec's error, kNoVariantMatched
// wraps one error per attempted variant (each carrying its variant_tag), and
// kDiscriminatorNotFound may wrap the tag codec's error.
struct DecodeError {
  DecodeErrorKind kind{DecodeErrorKind::kTypeMismatch};
  std::string path;
  std::string message;
  std::string field;                      // kMissingField, kInvalidFieldValue
  std::string expected_tag;               // discriminator kinds
  std::optional<std::string> actual_tag;  // kDiscriminatorMismatch
  std::string variant_tag;                // set on each cause of kNoVariantMatched
  std::vector<DecodeError> causes;

  // Returns a copy whose path (and the paths of all causes) starts with `pointer`.
  // `pointer` must already be an escaped JSON Pointer such as "/items/0".
  [[nodiscard]] DecodeError prefixed(std::string_view pointer) const;

  // One line: "<path>: <message>", or just the message at the root.
  [[nodiscard]] std::string describe() const;

  // Multi-line rendering of this error and every nested cause.
  [[nodiscard]] std::string to_string() const;

  // Structured diagnostic, suitable for printing or logging as JSON.
  [[nodiscard]] Json to_json() const;
};

[[nodiscard]] std::string decode_error_kind_to_string(DecodeErrorKind kind);

[[nodiscard]] DecodeError type_mismatch(std::string_view expected, const Json& actual);
[[nodiscard]] DecodeError missing_field(const std::string& key);
[[nodiscard]] DecodeError invalid_field_value(const std::string& key, DecodeError cause);
[[nodiscard]] DecodeError discriminator_not_found(const std::string& expected_tag,
                                                  std::string detail,
                                                  std::optional<DecodeError> cause = std::nullopt);
[[nodiscard]] DecodeError discriminator_mismatch(const std::string& expected_tag,
                                                 const std::string& actual_tag);
[[nodiscard]] DecodeError no_variant_matched(const std::string& type_name,
                                             std::vector<DecodeError> failures);
// kTypeMismatch raised when recursive decoding goes deeper than `max_depth`.
[[nodiscard]] DecodeError nesting_too_deep(std::size_t max_depth);

}  // namespace adtjson::core
