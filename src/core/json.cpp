#include "adtjson/core/json.h"

#include <utility>

namespace adtjson::core {

Json merge(Json left, const Json& right) {
  if (left.is_null()) {
    left = Json::object();
  }
  left.update(right);
  return left;
}

Json with_key(const std::string& key, Json value) {
  Json j = Json::object();
  j[key] = std::move(value);
  return j;
}

std::string pointer_for_key(const std::string& key) {
  Json::json_pointer pointer;
  pointer.push_back(key);
  return pointer.to_string();
}

}  // namespace adtjson::core
