#pragma once

#include "adtjson/codec/codec.h"
#include "adtjson/core/configuration_error.h"
#include "adtjson/derivation/derivation_settings.h"
#include "adtjson/derivation/record.h"
#include "adtjson/derivation/tagging.h"
#include "adtjson/naming/naming_strategy.h"
#include "adtjson/naming/type_identity.h"

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace adtjson::derivation {

// VariantDescriptor<A> describes one alternative of the union A: its identity,
// the std::variant index it occupies, and the untagged codec of its fields.
template <typename A>
struct VariantDescriptor {
  naming::TypeIdentity identity;
  std::size_t alternative_index{0};
  codec::Encoder<A> encode_fields;
  codec::Decoder<A> decode_fields;
};

namespace detail {

template <typename R, typename V>
struct AlternativeIndex;

template <typename R, typename... Ts>
struct AlternativeIndex<R, std::variant<Ts...>> {
  static_assert((static_cast<std::size_t>(std::is_same_v<R, Ts>) + ... + 0) == 1,
                "record type must occur exactly once among the variant's alternatives");
  static constexpr std::size_t value = [] {
    constexpr bool kMatches[] = {std::is_same_v<R, Ts>...};
    std::size_t index = 0;
    while (!kMatches[index]) {
      ++index;
    }
    return index;
  }();
};

}  // namespace detail

// alternative<A>(record) lifts the record codec of R into a variant codec of A:
// encoding reads std::get<R>, decoding emplaces the decoded R.
template <typename A, typename R>
VariantDescriptor<A> alternative(RecordDescriptor<R> descriptor) {
  auto shared = std::make_shared<const RecordDescriptor<R>>(std::move(descriptor));
  codec::Encoder<R> encode = record_encoder<R>(shared);
  codec::Decoder<R> decode = record_decoder<R>(shared);

  VariantDescriptor<A> variant;
  variant.identity = shared->identity;
  variant.alternative_index = detail::AlternativeIndex<R, A>::value;
  variant.encode_fields = [encode](const A& value) { return encode(std::get<R>(value)); };
  variant.decode_fields = [decode](const core::Json& json) -> codec::DecodeResult<A> {
    auto decoded = decode(json);
    if (!decoded.has_value()) {
      return codec::DecodeResult<A>::err(std::move(decoded).error());
    }
    return codec::DecodeResult<A>::ok(A(std::in_place_type<R>, std::move(decoded).value()));
  };
  return variant;
}

// SumDescriptor<A> is the structural description of the union A (a std::variant):
// its variants in declaration order. Declaration order is decode priority.
//
// The constructor checks that every alternative of A is described exactly once,
// which makes select() total; otherwise it throws ConfigurationError.
template <typename A>
class SumDescriptor {
 public:
  SumDescriptor(naming::TypeIdentity identity, std::vector<VariantDescriptor<A>> variants)
      : identity_(std::move(identity)), variants_(std::move(variants)) {
    constexpr std::size_t kUnset = std::numeric_limits<std::size_t>::max();
    slots_.assign(std::variant_size_v<A>, kUnset);
    for (std::size_t i = 0; i < variants_.size(); ++i) {
      const auto index = variants_[i].alternative_index;
      if (index >= slots_.size()) {
        throw core::ConfigurationError("variant " + variants_[i].identity.qualified_name() +
                                 " is not an alternative of " + identity_.qualified_name());
      }
      if (slots_[index] != kUnset) {
        throw core::ConfigurationError("alternative " + std::to_string(index) + " of " +
                                 identity_.qualified_name() + " is described twice");
      }
      slots_[index] = i;
    }
    for (std::size_t index = 0; index < slots_.size(); ++index) {
      if (slots_[index] == kUnset) {
        throw core::ConfigurationError("alternative " + std::to_string(index) + " of " +
                                 identity_.qualified_name() + " has no descriptor");
      }
    }
  }

  [[nodiscard]] const naming::TypeIdentity& identity() const noexcept { return identity_; }
  [[nodiscard]] const std::vector<VariantDescriptor<A>>& variants() const noexcept {
    return variants_;
  }

  // Position in variants() of the descriptor for value's active alternative.
  [[nodiscard]] std::size_t select(const A& value) const { return slots_[value.index()]; }

  [[nodiscard]] std::vector<naming::TypeIdentity> variant_identities() const {
    std::vector<naming::TypeIdentity> identities;
    identities.reserve(variants_.size());
    for (const auto& v : variants_) {
      identities.push_back(v.identity);
    }
    return identities;
  }

 private:
  naming::TypeIdentity identity_;
  std::vector<VariantDescriptor<A>> variants_;
  std::vector<std::size_t> slots_;
};

// sum<Foo>("pkg::Foo", bar_record, baz_record) describes Foo = std::variant<Bar, Baz>.
template <typename A, typename... Rs>
SumDescriptor<A> sum(std::string_view qualified_name, RecordDescriptor<Rs>... records) {
  std::vector<VariantDescriptor<A>> variants;
  variants.reserve(sizeof...(Rs));
  (variants.push_back(alternative<A>(std::move(records))), ...);
  return SumDescriptor<A>(naming::type_identity(qualified_name), std::move(variants));
}

// Reports tags shared by more than one variant under `naming`.
template <typename A>
std::vector<TagCollision> find_duplicate_tags(const SumDescriptor<A>& descriptor,
                                              const naming::NamingStrategy& naming) {
  const auto identities = descriptor.variant_identities();
  return find_tag_collisions(identities, resolve_tags(identities, naming));
}

namespace detail {

// State shared by every copy of a derived union codec. Built once, never mutated.
template <typename A>
struct DerivedSum {
  SumDescriptor<A> descriptor;
  std::vector<std::string> tags;
  discriminator::TypeTagFormat format;
  std::vector<codec::Decoder<A>> tagged_decoders;
};

template <typename A>
std::shared_ptr<const DerivedSum<A>> build_derived_sum(SumDescriptor<A> descriptor,
                                                       const DerivationSettings& settings) {
  const auto identities = descriptor.variant_identities();
  std::vector<std::string> tags = resolve_tags(identities, settings.naming);
  if (settings.reject_duplicate_tags) {
    reject_tag_collisions(descriptor.identity(), find_tag_collisions(identities, tags));
  }

  std::vector<codec::Decoder<A>> tagged;
  tagged.reserve(tags.size());
  for (std::size_t i = 0; i < tags.size(); ++i) {
    tagged.push_back(settings.format.reads<A>(tags[i], descriptor.variants()[i].decode_fields));
  }

  return std::make_shared<const DerivedSum<A>>(DerivedSum<A>{
      std::move(descriptor), std::move(tags), settings.format, std::move(tagged)});
}

template <typename A>
codec::Encoder<A> sum_encoder(std::shared_ptr<const DerivedSum<A>> derived) {
  return [derived = std::move(derived)](const A& value) {
    const std::size_t i = derived->descriptor.select(value);
    core::Json base = derived->descriptor.variants()[i].encode_fields(value);
    return derived->format.write(derived->tags[i], std::move(base));
  };
}

// Tries each variant in declaration order; the first full success wins. When
// none matches, the error carries every variant's failure, labelled with its tag.
template <typename A>
codec::Decoder<A> sum_decoder(std::shared_ptr<const DerivedSum<A>> derived) {
  return [derived = std::move(derived)](const core::Json& json) -> codec::DecodeResult<A> {
    std::vector<core::DecodeError> failures;
    failures.reserve(derived->tagged_decoders.size());
    for (std::size_t i = 0; i < derived->tagged_decoders.size(); ++i) {
      auto attempt = derived->tagged_decoders[i](json);
      if (attempt.has_value()) {
        return attempt;
      }
      core::DecodeError failure = std::move(attempt).error();
      failure.variant_tag = derived->tags[i];
      failures.push_back(std::move(failure));
    }
    return codec::DecodeResult<A>::err(
        core::no_variant_matched(derived->descriptor.identity().qualified_name(),
                                 std::move(failures)));
  };
}

}  // namespace detail

// derive builds the tagged codec of the union described by `descriptor`.
// Every tag is resolved here, so naming errors surface before the codec exists.
template <typename A>
codec::Codec<A> derive(SumDescriptor<A> descriptor, const DerivationSettings& settings = {}) {
  auto derived = detail::build_derived_sum<A>(std::move(descriptor), settings);
  return codec::Codec<A>(detail::sum_encoder<A>(derived), detail::sum_decoder<A>(derived));
}

template <typename A>
codec::Codec<A> derive(SumDescriptor<A> descriptor, naming::NamingStrategy naming,
                       discriminator::TypeTagFormat format) {
  return derive<A>(std::move(descriptor),
                   DerivationSettings{std::move(naming), std::move(format), false});
}

template <typename A>
codec::Encoder<A> derive_encoder(SumDescriptor<A> descriptor,
                                 const DerivationSettings& settings = {}) {
  return detail::sum_encoder<A>(detail::build_derived_sum<A>(std::move(descriptor), settings));
}

template <typename A>
codec::Decoder<A> derive_decoder(SumDescriptor<A> descriptor,
                                 const DerivationSettings& settings = {}) {
  return detail::sum_decoder<A>(detail::build_derived_sum<A>(std::move(descriptor), settings));
}

// derive_tagged tags a single record as if it were a one-variant union, without
// the kNoVariantMatched wrapper on failure.
template <typename R>
codec::Codec<R> derive_tagged(RecordDescriptor<R> descriptor,
                              const DerivationSettings& settings = {}) {
  std::string tag = settings.naming.name(descriptor.identity);
  auto shared = std::make_shared<const RecordDescriptor<R>>(std::move(descriptor));
  codec::Encoder<R> base_encoder = record_encoder<R>(shared);
  discriminator::TypeTagFormat format = settings.format;

  auto encode = [base_encoder, format, tag](const R& value) {
    return format.write(tag, base_encoder(value));
  };
  return codec::Codec<R>(std::move(encode), format.reads<R>(tag, record_decoder<R>(shared)));
}

}  // namespace adtjson::derivation
