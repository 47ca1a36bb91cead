#include "commands/settings_logic.h"

#include "adtjson/derivation/derivation_settings.h"

#include <catch2/catch.hpp>

using adtjson::core::Json;

namespace {

Json merged(const char* file, const char* overrides) {
  return apply_settings_overrides(Json::parse(file), Json::parse(overrides));
}

}  // namespace

TEST_CASE("overrides replace top-level settings", "[cli][settings]") {
  const auto j = merged(R"({"naming":"short","reject_duplicate_tags":false})",
                        R"({"naming":"full","reject_duplicate_tags":true})");
  REQUIRE(j["naming"] == "full");
  REQUIRE(j["reject_duplicate_tags"] == true);
}

TEST_CASE("discriminator overrides merge into the file's discriminator", "[cli][settings]") {
  SECTION("style keeps an unrelated tag location") {
    const auto j = merged(R"({"discriminator":{"style":"nested","tag_field":"kind"}})",
                          R"({"discriminator":{"style":"flat"}})");
    REQUIRE(j["discriminator"] == Json::parse(R"({"style":"flat","tag_field":"kind"})"));
  }

  SECTION("a tag location replaces the other one") {
    const auto j = merged(R"({"discriminator":{"style":"flat","tag_pointer":"/meta/kind"}})",
                          R"({"discriminator":{"style":"flat","tag_field":"kind"}})");
    REQUIRE_FALSE(j["discriminator"].contains("tag_pointer"));
    REQUIRE(j["discriminator"]["tag_field"] == "kind");
  }

  SECTION("a missing discriminator is taken as is") {
    const auto j = merged("{}", R"({"discriminator":{"style":"flat"}})");
    REQUIRE(j["discriminator"] == Json::parse(R"({"style":"flat"})"));
  }
}

TEST_CASE("a style override replaces a reader/writer pair", "[cli][settings]") {
  const char* file =
      R"({"discriminator":{"reader":{"style":"nested"},"writer":{"style":"nested"}}})";

  SECTION("--discriminator flat") {
    const auto j = merged(file, R"({"discriminator":{"style":"flat"}})");
    REQUIRE(j["discriminator"] == Json::parse(R"({"style":"flat"})"));

    auto settings = adtjson::derivation::settings_from_json(j);
    REQUIRE(settings.has_value());
    REQUIRE(settings.value().format.write("Bar", Json::object()).dump() == R"({"type":"Bar"})");
  }

  SECTION("--tag-field kind") {
    const auto j = merged(file, R"({"discriminator":{"style":"flat","tag_field":"kind"}})");
    REQUIRE_FALSE(j["discriminator"].contains("reader"));
    REQUIRE_FALSE(j["discriminator"].contains("writer"));

    auto settings = adtjson::derivation::settings_from_json(j);
    REQUIRE(settings.has_value());
    REQUIRE(settings.value().format.write("Bar", Json::object()).dump() == R"({"kind":"Bar"})");
  }
}
