#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace adtjson::core {

// Json is the value model every codec reads and writes.
// ordered_json keeps object keys in insertion order, so encoded records list
// their fields in declaration order.
using Json = nlohmann::ordered_json;

// merge returns the key-wise union of two objects. Keys present in both take
// the value from `right`. The union is shallow: nested objects are not merged.
[[nodiscard]] Json merge(Json left, const Json& right);

// with_key builds a single-key object {key: value}.
[[nodiscard]] Json with_key(const std::string& key, Json value);

// pointer_for_key returns the JSON Pointer token for an object key ("/a~1b" for "a/b").
[[nodiscard]] std::string pointer_for_key(const std::string& key);

}  // namespace adtjson::core
