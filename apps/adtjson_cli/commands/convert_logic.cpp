#include "convert_logic.h"

#include "adtjson/core/configuration_error.h"
#include "adtjson/core/json.h"

#include "../demo_shapes.h"
#include <memory>
#include <optional>
#include <string>

namespace {

std::optional<adtjson::core::Json> parse_input(const std::string& input, std::ostream& err) {
  adtjson::core::Json parsed =
      adtjson::core::Json::parse(input, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    err << "Invalid JSON input\n";
    return std::nullopt;
  }
  return parsed;
}

// Codecs are built per command; a settings mistake (e.g. an unmapped
// user-defined tag) is reported here instead of escaping main().
std::unique_ptr<adtjson::apps::ShapeCodecs> make_codecs(
    const adtjson::derivation::DerivationSettings& settings, std::ostream& err) {
  try {
    return std::make_unique<adtjson::apps::ShapeCodecs>(settings);
  } catch (const adtjson::core::ConfigurationError& e) {
    err << "Invalid settings: " << e.what() << "\n";
    return nullptr;
  }
}

}  // namespace

int execute_check(const std::string& input, const adtjson::derivation::DerivationSettings& settings,
                  std::ostream& out, std::ostream& err) {
  auto parsed = parse_input(input, err);
  if (!parsed.has_value()) {
    return kExitUsage;
  }

  auto codecs = make_codecs(settings, err);
  if (!codecs) {
    return kExitUsage;
  }

  auto decoded = codecs->shape().decode(parsed.value());
  if (!decoded.has_value()) {
    err << "Decode failed:\n" << decoded.error().to_string() << "\n";
    out << decoded.error().to_json().dump(2) << "\n";
    return kExitDecodeFailed;
  }

  out << codecs->shape().encode(decoded.value()).dump(2) << "\n";
  return kExitOk;
}

int execute_convert(const std::string& input, const adtjson::derivation::DerivationSettings& from,
                    const adtjson::derivation::DerivationSettings& to, std::ostream& out,
                    std::ostream& err) {
  auto parsed = parse_input(input, err);
  if (!parsed.has_value()) {
    return kExitUsage;
  }

  auto reader = make_codecs(from, err);
  auto writer = make_codecs(to, err);
  if (!reader || !writer) {
    return kExitUsage;
  }

  auto decoded = reader->shape().decode(parsed.value());
  if (!decoded.has_value()) {
    err << "Decode failed:\n" << decoded.error().to_string() << "\n";
    return kExitDecodeFailed;
  }

  out << writer->shape().encode(decoded.value()).dump(2) << "\n";
  return kExitOk;
}
