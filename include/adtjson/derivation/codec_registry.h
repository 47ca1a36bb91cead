#pragma once

#include "adtjson/codec/codec.h"
#include "adtjson/core/configuration_error.h"
#include "adtjson/core/decode_error.h"

#include <cstddef>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace adtjson::derivation {

namespace detail {

// Nesting level of ref() decoders on the current thread.
inline std::size_t& ref_decode_depth() noexcept {
  thread_local std::size_t depth = 0;
  return depth;
}

class RefDecodeScope {
 public:
  RefDecodeScope() noexcept : depth_(++ref_decode_depth()) {}
  RefDecodeScope(const RefDecodeScope&) = delete;
  RefDecodeScope& operator=(const RefDecodeScope&) = delete;
  ~RefDecodeScope() { --ref_decode_depth(); }

  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

 private:
  std::size_t depth_;
};

}  // namespace detail

// CodecRegistry maps a C++ type to its derived codec.
//
// ref<T>() returns a codec that looks T up on every call, so a field codec can
// refer to a union that is only registered later. This is how recursive types
// are built: derive Shape with a field codec vector_of(registry.ref<Shape>()),
// then add<Shape>() the result.
//
// The registry must outlive every codec obtained from ref(). Registration is not
// synchronized; finish it before sharing codecs across threads. Lookups are
// read-only afterwards.
//
// Decoding through ref() codecs nested more than max_decode_depth levels deep
// fails with a kTypeMismatch error instead of recursing further.
class CodecRegistry {
 public:
  static constexpr std::size_t kDefaultMaxDecodeDepth = 128;

  explicit CodecRegistry(std::size_t max_decode_depth = kDefaultMaxDecodeDepth)
      : max_decode_depth_(max_decode_depth) {}
  CodecRegistry(const CodecRegistry&) = delete;
  CodecRegistry& operator=(const CodecRegistry&) = delete;
  CodecRegistry(CodecRegistry&&) = delete;
  CodecRegistry& operator=(CodecRegistry&&) = delete;
  ~CodecRegistry() = default;

  // Throws ConfigurationError if T already has a codec.
  template <typename T>
  void add(codec::Codec<T> entry) {
    auto [it, inserted] = codecs_.emplace(
        std::type_index(typeid(T)), std::make_shared<const codec::Codec<T>>(std::move(entry)));
    if (!inserted) {
      throw core::ConfigurationError(std::string("codec already registered for ") +
                                     typeid(T).name());
    }
  }

  template <typename T>
  [[nodiscard]] const codec::Codec<T>* find() const {
    auto it = codecs_.find(std::type_index(typeid(T)));
    if (it == codecs_.end()) {
      return nullptr;
    }
    return static_cast<const codec::Codec<T>*>(it->second.get());
  }

  // Throws ConfigurationError if T has no codec.
  template <typename T>
  [[nodiscard]] const codec::Codec<T>& get() const {
    const codec::Codec<T>* found = find<T>();
    if (found == nullptr) {
      throw core::ConfigurationError(std::string("no codec registered for ") + typeid(T).name());
    }
    return *found;
  }

  // Deferred reference to T's codec. Using it before add<T>() is a programming
  // error and throws ConfigurationError.
  template <typename T>
  [[nodiscard]] codec::Codec<T> ref() const {
    return codec::Codec<T>([this](const T& value) { return get<T>().encode(value); },
                           [this](const core::Json& json) {
                             detail::RefDecodeScope scope;
                             if (scope.depth() > max_decode_depth_) {
                               return codec::DecodeResult<T>::err(
                                   core::nesting_too_deep(max_decode_depth_));
                             }
                             return get<T>().decode(json);
                           });
  }

  [[nodiscard]] std::size_t size() const noexcept { return codecs_.size(); }
  [[nodiscard]] std::size_t max_decode_depth() const noexcept { return max_decode_depth_; }

 private:
  std::size_t max_decode_depth_;
  std::unordered_map<std::type_index, std::shared_ptr<const void>> codecs_;
};

}  // namespace adtjson::derivation
