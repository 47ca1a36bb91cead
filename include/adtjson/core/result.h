#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace adtjson::core {

// Result<T, E> carries either a decoded value (T) or the reason decoding failed (E).
// Failures are values: nothing a codec reads from untrusted JSON throws.
// Usage: return Result<Value, DecodeError>::ok(val) or Result<Value, DecodeError>::err(error).
// Alternatives are addressed by index, so T and E may be the same type.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<kValueIndex>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<kErrorIndex>, std::move(error)); }

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == kValueIndex; }
  [[nodiscard]] const T& value() const& { return std::get<kValueIndex>(data_); }
  [[nodiscard]] T&& value() && { return std::get<kValueIndex>(std::move(data_)); }
  [[nodiscard]] const E& error() const& { return std::get<kErrorIndex>(data_); }
  [[nodiscard]] E&& error() && { return std::get<kErrorIndex>(std::move(data_)); }

 private:
  static constexpr std::size_t kValueIndex = 0;
  static constexpr std::size_t kErrorIndex = 1;

  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& payload) : data_(tag, std::forward<V>(payload)) {}

  std::variant<T, E> data_;
};

}  // namespace adtjson::core
