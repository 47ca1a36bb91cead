#include "adtjson/core/decode_error.h"

#include <catch2/catch.hpp>

#include <string>

using namespace adtjson;

TEST_CASE("decode error factories fill kind, field and path", "[decode_error]") {
  SECTION("missing field points at the key") {
    const auto error = core::missing_field("radius");
    REQUIRE(error.kind == core::DecodeErrorKind::kMissingField);
    REQUIRE(error.field == "radius");
    REQUIRE(error.path == "/radius");
    REQUIRE(error.describe() == "/radius: missing required field \"radius\"");
  }

  SECTION("keys are escaped as JSON Pointer tokens") {
    REQUIRE(core::missing_field("a/b").path == "/a~1b");
    REQUIRE(core::missing_field("x~y").path == "/x~0y");
  }

  SECTION("invalid field value nests the cause under the field path") {
    const auto error =
        core::invalid_field_value("i", core::type_mismatch("integer", core::Json("42")));
    REQUIRE(error.kind == core::DecodeErrorKind::kInvalidFieldValue);
    REQUIRE(error.path == "/i");
    REQUIRE(error.causes.size() == 1);
    REQUIRE(error.causes[0].kind == core::DecodeErrorKind::kTypeMismatch);
    REQUIRE(error.causes[0].path == "/i");
    REQUIRE(error.causes[0].message == "expected integer, got string");
  }

  SECTION("discriminator mismatch records both tags") {
    const auto error = core::discriminator_mismatch("Bar", "Qux");
    REQUIRE(error.expected_tag == "Bar");
    REQUIRE(error.actual_tag == std::optional<std::string>("Qux"));
    REQUIRE(error.message == "discriminator mismatch: expected \"Bar\", got \"Qux\"");
  }

  SECTION("discriminator not found keeps an optional cause") {
    const auto bare = core::discriminator_not_found("Bar", "");
    REQUIRE(bare.message == "discriminator \"Bar\" not found");
    REQUIRE(bare.causes.empty());

    const auto wrapped =
        core::discriminator_not_found("Bar", "no tag at /type", core::missing_field("type"));
    REQUIRE(wrapped.message == "discriminator \"Bar\" not found (no tag at /type)");
    REQUIRE(wrapped.causes.size() == 1);
  }
}

TEST_CASE("prefixed rewrites the whole error tree", "[decode_error]") {
  auto variant_failure = core::missing_field("s");
  variant_failure.variant_tag = "Bar";
  const auto error = core::no_variant_matched("foo::Foo", {variant_failure}).prefixed("/items/0");

  REQUIRE(error.path == "/items/0");
  REQUIRE(error.causes[0].path == "/items/0/s");
  REQUIRE(error.causes[0].variant_tag == "Bar");
}

TEST_CASE("to_string renders one line per error, indented by depth", "[decode_error]") {
  auto bar = core::invalid_field_value("i", core::type_mismatch("integer", core::Json("x")));
  bar.variant_tag = "Bar";
  auto baz = core::discriminator_not_found("Baz", "");
  baz.variant_tag = "Baz";
  const auto error = core::no_variant_matched("foo::Foo", {bar, baz});

  const std::string expected =
      "no variant of foo::Foo matched\n"
      "  [Bar] /i: invalid value for field \"i\"\n"
      "    /i: expected integer, got string\n"
      "  [Baz] discriminator \"Baz\" not found";
  REQUIRE(error.to_string() == expected);
}

TEST_CASE("to_json exposes the structured diagnostic", "[decode_error]") {
  auto bar = core::discriminator_mismatch("Bar", "Qux");
  bar.variant_tag = "Bar";
  const auto j = core::no_variant_matched("foo::Foo", {bar}).to_json();

  REQUIRE(j["kind"] == "no_variant_matched");
  REQUIRE(j["path"] == "");
  REQUIRE(j["causes"].size() == 1);
  REQUIRE(j["causes"][0]["kind"] == "discriminator_mismatch");
  REQUIRE(j["causes"][0]["expected_tag"] == "Bar");
  REQUIRE(j["causes"][0]["actual_tag"] == "Qux");
  REQUIRE(j["causes"][0]["variant"] == "Bar");
  REQUIRE_FALSE(j["causes"][0].contains("causes"));
}

TEST_CASE("nesting too deep is a type mismatch naming the limit", "[decode_error]") {
  const auto error = core::nesting_too_deep(64);
  REQUIRE(error.kind == core::DecodeErrorKind::kTypeMismatch);
  REQUIRE(error.path.empty());
  REQUIRE(error.describe() == "nesting exceeds maximum depth 64");
}

TEST_CASE("every error kind has a stable name", "[decode_error]") {
  REQUIRE(core::decode_error_kind_to_string(core::DecodeErrorKind::kTypeMismatch) ==
          "type_mismatch");
  REQUIRE(core::decode_error_kind_to_string(core::DecodeErrorKind::kMissingField) ==
          "missing_field");
  REQUIRE(core::decode_error_kind_to_string(core::DecodeErrorKind::kInvalidFieldValue) ==
          "invalid_field_value");
  REQUIRE(core::decode_error_kind_to_string(core::DecodeErrorKind::kDiscriminatorNotFound) ==
          "discriminator_not_found");
  REQUIRE(core::decode_error_kind_to_string(core::DecodeErrorKind::kDiscriminatorMismatch) ==
          "discriminator_mismatch");
  REQUIRE(core::decode_error_kind_to_string(core::DecodeErrorKind::kNoVariantMatched) ==
          "no_variant_matched");
}
