#include "adtjson/core/configuration_error.h"
#include "adtjson/derivation/sum.h"

#include <catch2/catch.hpp>

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace adtjson;

namespace foo::model {

struct Bar {
  std::string s;
  int i{0};
  bool operator==(const Bar&) const = default;
};

struct Baz {
  bool operator==(const Baz&) const = default;
};

using Foo = std::variant<Bar, Baz>;

struct Left {
  std::string s;
  bool operator==(const Left&) const = default;
};

struct Right {
  std::string s;
  bool operator==(const Right&) const = default;
};

using Pair = std::variant<Left, Right>;

}  // namespace foo::model

namespace {

using derivation::derive;
using derivation::field;
using derivation::record;
using derivation::sum;
using discriminator::TypeTagFormat;
using naming::NamingStrategy;
using foo::model::Bar;
using foo::model::Baz;
using foo::model::Foo;

derivation::RecordDescriptor<Bar> bar_record() {
  return record<Bar>("foo::model::Bar", {field("s", &Bar::s), field("i", &Bar::i)});
}

derivation::SumDescriptor<Foo> foo_descriptor() {
  return sum<Foo>("foo::model::Foo", bar_record(), record<Baz>("foo::model::Baz"));
}

derivation::DerivationSettings flat_settings() {
  derivation::DerivationSettings settings;
  settings.format = TypeTagFormat::flat();
  return settings;
}

NamingStrategy renamed() {
  return NamingStrategy::user_defined(std::map<std::string, std::string>{
      {"foo::model::Bar", "bar"}, {"foo::model::Baz", "baz"}});
}

const Foo kBar = Bar{"quux", 42};

}  // namespace

TEST_CASE("nested short-name encoding", "[sum][nested]") {
  const auto codec = derive(foo_descriptor());
  REQUIRE(codec.encode(kBar).dump() == R"({"Bar":{"s":"quux","i":42})");
  REQUIRE(codec.encode(Foo{Baz{}}).dump() == R"({"Baz":{}})");
  REQUIRE(codec.decode(core::Json::parse(R"({"Baz":{}})")).value() == Foo{Baz{}});
}

TEST_CASE("flat short-name encoding", "[sum][flat]") {
  const auto codec = derive(foo_descriptor(), flat_settings());
  REQUIRE(codec.encode(kBar).dump() == R"({"type":"Bar","s":"quux","i":42})");
  REQUIRE(codec.encode(Foo{Baz{}}).dump() == R"({"type":"Baz"})");
  REQUIRE(codec.decode(core::Json::parse(R"({"i":42,"type":"Bar","s":"quux"})")).value() == kBar);
}

TEST_CASE("unknown tag fails with every variant's failure", "[sum][flat]") {
  const auto codec = derive(foo_descriptor(), flat_settings());
  const auto decoded = codec.decode(core::Json::parse(R"({"type":"Qux","s":"quux","i":42})"));

  REQUIRE_FALSE(decoded.has_value());
  const auto& error = decoded.error();
  REQUIRE(error.kind == core::DecodeErrorKind::kNoVariantMatched);
  REQUIRE(error.causes.size() == 2);
  REQUIRE(error.causes[0].variant_tag == "Bar");
  REQUIRE(error.causes[0].kind == core::DecodeErrorKind::kDiscriminatorMismatch);
  REQUIRE(error.causes[1].variant_tag == "Baz");
  REQUIRE(error.causes[1].kind == core::DecodeErrorKind::kDiscriminatorMismatch);
}

TEST_CASE("every naming and format round-trips", "[sum]") {
  const std::vector<NamingStrategy> namings{NamingStrategy::short_name(),
                                            NamingStrategy::full_name(), renamed()};
  const std::vector<TypeTagFormat> formats{TypeTagFormat::nested(), TypeTagFormat::flat()};

  for (const auto& strategy : namings) {
    for (const auto& format : formats) {
      const auto codec = derive(foo_descriptor(), strategy, format);
      for (const Foo& value : {kBar, Foo{Baz{}}}) {
        const auto decoded = codec.decode(codec.encode(value));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded.value() == value);
      }
    }
  }
}

TEST_CASE("encoded output carries the tag where the format puts it", "[sum]") {
  SECTION("nested: a single key holding the tag") {
    const auto encoded =
        derive(foo_descriptor(), NamingStrategy::full_name(), TypeTagFormat::nested()).encode(kBar);
    REQUIRE(encoded.size() == 1);
    REQUIRE(encoded.contains("foo::model::Bar"));
  }

  SECTION("flat: the tag codec reads the tag back") {
    const auto encoded = derive(foo_descriptor(), renamed(), TypeTagFormat::flat()).encode(kBar);
    REQUIRE(discriminator::field_tag_codec().decode(encoded).value() == "bar");
  }
}

TEST_CASE("variant payload errors carry the full path", "[sum]") {
  SECTION("nested") {
    const auto decoded =
        derive(foo_descriptor()).decode(core::Json::parse(R"({"Bar":{"s":"quux","i":"42"}})"));
    REQUIRE_FALSE(decoded.has_value());
    const auto& bar = decoded.error().causes.at(0);
    REQUIRE(bar.variant_tag == "Bar");
    REQUIRE(bar.kind == core::DecodeErrorKind::kInvalidFieldValue);
    REQUIRE(bar.field == "i");
    REQUIRE(bar.path == "/Bar/i");
    REQUIRE(bar.causes.at(0).kind == core::DecodeErrorKind::kTypeMismatch);

    const auto& baz = decoded.error().causes.at(1);
    REQUIRE(baz.kind == core::DecodeErrorKind::kDiscriminatorNotFound);
  }

  SECTION("flat missing field") {
    auto input = core::Json::parse(R"({"type":"Bar","s":"quux"})");
    const auto decoded = derive(foo_descriptor(), flat_settings()).decode(input);
    REQUIRE_FALSE(decoded.has_value());
    const auto& bar = decoded.error().causes.at(0);
    REQUIRE(bar.kind == core::DecodeErrorKind::kMissingField);
    REQUIRE(bar.field == "i");
    REQUIRE(bar.path == "/i");
  }
}

TEST_CASE("flat tag colliding with a field name", "[sum][flat]") {
  derivation::DerivationSettings settings;
  settings.format = TypeTagFormat::flat(discriminator::field_tag_codec("s"));
  const auto codec = derive(foo_descriptor(), settings);

  const auto encoded = codec.encode(kBar);
  REQUIRE(encoded.dump() == R"({"s":"quux","i":42})");

  const auto decoded = codec.decode(encoded);
  REQUIRE_FALSE(decoded.has_value());
  REQUIRE(decoded.error().causes.at(0).kind == core::DecodeErrorKind::kDiscriminatorMismatch);
  REQUIRE(decoded.error().causes.at(0).actual_tag == std::optional<std::string>("quux"));
}

TEST_CASE("duplicate tags resolve to the first declared variant", "[sum][duplicates]") {
  using foo::model::Left;
  using foo::model::Pair;
  using foo::model::Right;

  const auto same_tag = NamingStrategy::user_defined(std::map<std::string, std::string>{
      {"foo::model::Left", "side"}, {"foo::model::Right", "side"}});
  const auto left = [] { return record<Left>("foo::model::Left", {field("s", &Left::s)}); };
  const auto right = [] { return record<Right>("foo::model::Right", {field("s", &Right::s)}); };
  const auto input = core::Json::parse(R"({"side":{"s":"x"}})");

  SECTION("Left declared first") {
    const auto codec =
        derive(sum<Pair>("foo::model::Pair", left(), right()), same_tag, TypeTagFormat::nested());
    REQUIRE(codec.decode(input).value() == Pair{Left{"x"}});
  }

  SECTION("Right declared first") {
    const auto codec =
        derive(sum<Pair>("foo::model::Pair", right(), left()), same_tag, TypeTagFormat::nested());
    REQUIRE(codec.decode(input).value() == Pair{Right{"x"}});
  }

  SECTION("collisions can be listed") {
    const auto collisions =
        derivation::find_duplicate_tags(sum<Pair>("foo::model::Pair", left(), right()), same_tag);
    REQUIRE(collisions.size() == 1);
    REQUIRE(collisions[0].tag == "side");
    REQUIRE(collisions[0].first_index == 0u);
    REQUIRE(collisions[0].duplicate_index == 1u);
    REQUIRE(
        derivation::find_duplicate_tags(foo_descriptor(), NamingStrategy::short_name()).empty());
  }

  SECTION("collisions can be rejected") {
    derivation::DerivationSettings settings;
    settings.naming = same_tag;
    settings.reject_duplicate_tags = true;
    REQUIRE_THROWS_AS(derive(sum<Pair>("foo::model::Pair", left(), right()), settings),
                      core::ConfigurationError);
  }
}

TEST_CASE("sum descriptors must cover every alternative once", "[sum]") {
  using derivation::alternative;
  const auto identity = naming::type_identity("foo::model::Foo");

  SECTION("missing alternative") {
    REQUIRE_THROWS_AS(derivation::SumDescriptor<Foo>(identity, {alternative<Foo>(bar_record())}),
                      core::ConfigurationError);
  }

  SECTION("alternative described twice") {
    REQUIRE_THROWS_AS(derivation::SumDescriptor<Foo>(identity, {alternative<Foo>(bar_record()),
                                                                alternative<Foo>(bar_record())}),
                      core::ConfigurationError);
  }

  SECTION("declaration order need not follow the variant") {
    const derivation::SumDescriptor<Foo> reordered(
        identity,
        {alternative<Foo>(record<Baz>("foo::model::Baz")), alternative<Foo>(bar_record())});
    REQUIRE(reordered.select(kBar) == 1u);
    REQUIRE(reordered.select(Foo{Baz{}}) == 0u);
  }
}

TEST_CASE("unmapped user-defined naming fails at derive time", "[sum]") {
  const auto partial = NamingStrategy::user_defined(
      std::map<std::string, std::string>{{"foo::model::Bar", "bar"}});
  REQUIRE_THROWS_AS(derive(foo_descriptor(), partial, TypeTagFormat::nested()),
                    core::ConfigurationError);
}

TEST_CASE("encoder and decoder can be derived separately", "[sum]") {
  derivation::DerivationSettings nested;
  derivation::DerivationSettings flat = flat_settings();

  const auto encode = derivation::derive_encoder(foo_descriptor(), flat);
  const auto decode = derivation::derive_decoder(foo_descriptor(), nested);

  REQUIRE(encode(kBar).dump() == R"({"type":"Bar","s":"quux","i":42})");
  REQUIRE(decode(core::Json::parse(R"({"Bar":{"s":"quux","i":42}})")).value() == kBar);
  REQUIRE_FALSE(decode(encode(kBar)).has_value());
}

TEST_CASE("a single record can be tagged", "[sum]") {
  const auto codec = derivation::derive_tagged(bar_record());
  REQUIRE(codec.encode(Bar{"quux", 42}).dump() == R"({"Bar":{"s":"quux","i":42}})");
  REQUIRE(codec.decode(core::Json::parse(R"({"Bar":{"s":"quux","i":42}})")).value() ==
          Bar{"quux", 42});

  const auto wrong = codec.decode(core::Json::parse(R"({"Baz":{}})"));
  REQUIRE_FALSE(wrong.has_value());
  REQUIRE(wrong.error().kind == core::DecodeErrorKind::kDiscriminatorNotFound);
}

TEST_CASE("a derived codec can be shared across threads", "[sum][concurrency]") {
  const auto codec = derive(foo_descriptor(), flat_settings());
  const auto bar_json = codec.encode(kBar);
  const auto baz_json = codec.encode(Foo{Baz{}});

  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      for (int n = 0; n < 200; ++n) {
        const auto bar = codec.decode(bar_json);
        const auto baz = codec.decode(baz_json);
        if (!bar.has_value() || bar.value() != kBar || !baz.has_value() ||
            baz.value() != Foo{Baz{}} || codec.encode(kBar) != bar_json) {
          ++failures;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  REQUIRE(failures.load() == 0);
}
