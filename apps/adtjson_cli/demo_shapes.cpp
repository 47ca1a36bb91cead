#include "demo_shapes.h"

#include "adtjson/codec/primitive_codecs.h"
#include "adtjson/derivation/record.h"

namespace adtjson::apps {

namespace {

using derivation::field;
using derivation::record;

codec::Codec<geo::Point> point_codec() {
  return derivation::derive_record(
      record<geo::Point>("geo::Point", {field("x", &geo::Point::x), field("y", &geo::Point::y)}));
}

}  // namespace

derivation::SumDescriptor<geo::Shape> shape_descriptor(const derivation::CodecRegistry& registry) {
  const auto point = point_codec();
  return derivation::sum<geo::Shape>(
      "geo::Shape",
      record<geo::Circle>("geo::Circle", {field("center", &geo::Circle::center, point),
                                          field("radius", &geo::Circle::radius)}),
      record<geo::Rectangle>("geo::Rectangle",
                             {field("corner", &geo::Rectangle::corner, point),
                              field("width", &geo::Rectangle::width),
                              field("height", &geo::Rectangle::height)}),
      record<geo::Origin>("geo::Origin"),
      record<geo::Group>("geo::Group",
                         {field("label", &geo::Group::label),
                          field("members", &geo::Group::members,
                                codec::vector_of(registry.ref<geo::Shape>()))}));
}

ShapeCodecs::ShapeCodecs(const derivation::DerivationSettings& settings) {
  registry_.add(derivation::derive(shape_descriptor(registry_), settings));
}

}  // namespace adtjson::apps
