#pragma once

#include "adtjson/codec/codec.h"
#include "adtjson/derivation/codec_registry.h"
#include "adtjson/derivation/derivation_settings.h"
#include "adtjson/derivation/sum.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

// Demo union used by adtjson_cli. It covers a nested record field (Point), a
// zero-field variant (Origin) and a recursive variant (Group).
namespace geo {

struct Point {
  double x{0.0};
  double y{0.0};
  bool operator==(const Point&) const = default;
};

struct Circle {
  Point center;
  double radius{0.0};
  bool operator==(const Circle&) const = default;
};

struct Rectangle {
  Point corner;
  double width{0.0};
  double height{0.0};
  bool operator==(const Rectangle&) const = default;
};

struct Origin {
  bool operator==(const Origin&) const = default;
};

struct Group;

using Shape = std::variant<Circle, Rectangle, Origin, Group>;

struct Group {
  std::string label;
  std::vector<Shape> members;
  bool operator==(const Group&) const = default;
};

}  // namespace geo

namespace adtjson::apps {

// Descriptor of geo::Shape. Group members refer back to Shape through `registry`.
[[nodiscard]] derivation::SumDescriptor<geo::Shape> shape_descriptor(
    const derivation::CodecRegistry& registry);

// ShapeCodecs owns the registry that backs the recursive Shape codec.
class ShapeCodecs {
 public:
  explicit ShapeCodecs(const derivation::DerivationSettings& settings);

  [[nodiscard]] const codec::Codec<geo::Shape>& shape() const {
    return registry_.get<geo::Shape>();
  }

 private:
  derivation::CodecRegistry registry_;
};

}  // namespace adtjson::apps
