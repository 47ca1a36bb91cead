#pragma once

#include "adtjson/codec/codec.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace adtjson::codec {

// Leaf codecs over nlohmann::ordered_json. They check JSON types explicitly and
// report kTypeMismatch instead of letting the JSON library throw.

namespace detail {

template <typename T>
struct IsVector : std::false_type {};
template <typename U>
struct IsVector<std::vector<U>> : std::true_type {};

template <typename T>
struct IsOptional : std::false_type {};
template <typename U>
struct IsOptional<std::optional<U>> : std::true_type {};

template <typename T>
struct IsStringMap : std::false_type {};
template <typename U>
struct IsStringMap<std::map<std::string, U>> : std::true_type {};

template <typename T>
inline constexpr bool kUnsupported = false;

template <typename T>
DecodeResult<T> decode_integer(const core::Json& json) {
  using Limits = std::numeric_limits<T>;
  if (!json.is_number_integer()) {
    return DecodeResult<T>::err(core::type_mismatch("integer", json));
  }
  if (json.is_number_unsigned()) {
    const auto raw = json.get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(Limits::max())) {
      return DecodeResult<T>::err(core::type_mismatch("integer in range", json));
    }
    return DecodeResult<T>::ok(static_cast<T>(raw));
  }
  const auto raw = json.get<std::int64_t>();
  if constexpr (std::is_unsigned_v<T>) {
    if (raw < 0 || static_cast<std::uint64_t>(raw) > static_cast<std::uint64_t>(Limits::max())) {
      return DecodeResult<T>::err(core::type_mismatch("non-negative integer in range", json));
    }
  } else {
    if (raw < static_cast<std::int64_t>(Limits::min()) ||
        raw > static_cast<std::int64_t>(Limits::max())) {
      return DecodeResult<T>::err(core::type_mismatch("integer in range", json));
    }
  }
  return DecodeResult<T>::ok(static_cast<T>(raw));
}

// Finite numbers beyond T's range are rejected rather than converted.
template <typename T>
DecodeResult<T> decode_floating(const core::Json& json) {
  if (!json.is_number()) {
    return DecodeResult<T>::err(core::type_mismatch("number", json));
  }
  const auto raw = json.get<double>();
  if constexpr (sizeof(T) < sizeof(double)) {
    if (std::isfinite(raw) &&
        std::fabs(raw) > static_cast<double>(std::numeric_limits<T>::max())) {
      return DecodeResult<T>::err(core::type_mismatch("number in range", json));
    }
  }
  return DecodeResult<T>::ok(static_cast<T>(raw));
}

}  // namespace detail

template <typename T>
Codec<T> codec_for();

// vector_of encodes a JSON array; element errors are reported at "/<index>".
template <typename U>
Codec<std::vector<U>> vector_of(Codec<U> element) {
  auto encode = [element](const std::vector<U>& values) {
    core::Json array = core::Json::array();
    for (const auto& value : values) {
      array.push_back(element.encode(value));
    }
    return array;
  };
  auto decode = [element](const core::Json& json) -> DecodeResult<std::vector<U>> {
    if (!json.is_array()) {
      return DecodeResult<std::vector<U>>::err(core::type_mismatch("array", json));
    }
    std::vector<U> values;
    values.reserve(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
      auto decoded = element.decode(json[i]);
      if (!decoded.has_value()) {
        return DecodeResult<std::vector<U>>::err(
            decoded.error().prefixed("/" + std::to_string(i)));
      }
      values.push_back(std::move(decoded).value());
    }
    return DecodeResult<std::vector<U>>::ok(std::move(values));
  };
  return Codec<std::vector<U>>(std::move(encode), std::move(decode));
}

// optional_of maps std::nullopt to JSON null. The field itself stays required.
template <typename U>
Codec<std::optional<U>> optional_of(Codec<U> inner) {
  auto encode = [inner](const std::optional<U>& value) -> core::Json {
    if (!value.has_value()) {
      return nullptr;
    }
    return inner.encode(value.value());
  };
  auto decode = [inner](const core::Json& json) -> DecodeResult<std::optional<U>> {
    if (json.is_null()) {
      return DecodeResult<std::optional<U>>::ok(std::nullopt);
    }
    auto decoded = inner.decode(json);
    if (!decoded.has_value()) {
      return DecodeResult<std::optional<U>>::err(decoded.error());
    }
    return DecodeResult<std::optional<U>>::ok(std::optional<U>(std::move(decoded).value()));
  };
  return Codec<std::optional<U>>(std::move(encode), std::move(decode));
}

// map_of encodes a string-keyed map as a JSON object (keys in map order).
template <typename U>
Codec<std::map<std::string, U>> map_of(Codec<U> inner) {
  using Map = std::map<std::string, U>;
  auto encode = [inner](const Map& values) {
    core::Json object = core::Json::object();
    for (const auto& [key, value] : values) {
      object[key] = inner.encode(value);
    }
    return object;
  };
  auto decode = [inner](const core::Json& json) -> DecodeResult<Map> {
    if (!json.is_object()) {
      return DecodeResult<Map>::err(core::type_mismatch("object", json));
    }
    Map values;
    for (auto it = json.begin(); it != json.end(); ++it) {
      auto decoded = inner.decode(it.value());
      if (!decoded.has_value()) {
        return DecodeResult<Map>::err(decoded.error().prefixed(core::pointer_for_key(it.key())));
      }
      values.emplace(it.key(), std::move(decoded).value());
    }
    return DecodeResult<Map>::ok(std::move(values));
  };
  return Codec<Map>(std::move(encode), std::move(decode));
}

// codec_for<T> picks the built-in codec for a leaf type: std::string, bool,
// integral and floating-point types, and vectors/optionals/string maps of those.
template <typename T>
Codec<T> codec_for() {
  if constexpr (std::is_same_v<T, std::string>) {
    return Codec<T>([](const T& value) { return core::Json(value); },
                    [](const core::Json& json) -> DecodeResult<T> {
                      if (!json.is_string()) {
                        return DecodeResult<T>::err(core::type_mismatch("string", json));
                      }
                      return DecodeResult<T>::ok(json.get<std::string>());
                    });
  } else if constexpr (std::is_same_v<T, bool>) {
    return Codec<T>([](const T& value) { return core::Json(value); },
                    [](const core::Json& json) -> DecodeResult<T> {
                      if (!json.is_boolean()) {
                        return DecodeResult<T>::err(core::type_mismatch("boolean", json));
                      }
                      return DecodeResult<T>::ok(json.get<bool>());
                    });
  } else if constexpr (std::is_integral_v<T>) {
    return Codec<T>([](const T& value) { return core::Json(value); },
                    [](const core::Json& json) { return detail::decode_integer<T>(json); });
  } else if constexpr (std::is_floating_point_v<T>) {
    return Codec<T>([](const T& value) { return core::Json(value); },
                    [](const core::Json& json) { return detail::decode_floating<T>(json); });
  } else if constexpr (detail::IsVector<T>::value) {
    return vector_of(codec_for<typename T::value_type>());
  } else if constexpr (detail::IsOptional<T>::value) {
    return optional_of(codec_for<typename T::value_type>());
  } else if constexpr (detail::IsStringMap<T>::value) {
    return map_of(codec_for<typename T::mapped_type>());
  } else {
    static_assert(detail::kUnsupported<T>,
                  "no built-in codec for this type; pass a derived Codec explicitly");
  }
}

}  // namespace adtjson::codec
