#include "adtjson/discriminator/type_tag_format.h"

#include "adtjson/core/configuration_error.h"

namespace adtjson::discriminator {

TypeTagFormat::TypeTagFormat(std::shared_ptr<const TypeTagReader> reader,
                             std::shared_ptr<const TypeTagWriter> writer)
    : reader_(std::move(reader)), writer_(std::move(writer)) {}

TypeTagFormat TypeTagFormat::nested() {
  return TypeTagFormat(std::make_shared<NestedTypeTagReader>(),
                       std::make_shared<NestedTypeTagWriter>());
}

TypeTagFormat TypeTagFormat::flat(TagCodec tag_codec) {
  auto reader = std::make_shared<FlatTypeTagReader>(tag_codec);
  auto writer = std::make_shared<FlatTypeTagWriter>(std::move(tag_codec));
  return TypeTagFormat(std::move(reader), std::move(writer));
}

TypeTagFormat TypeTagFormat::flat() {
  return flat(field_tag_codec("type"));
}

TypeTagFormat TypeTagFormat::combine(std::shared_ptr<const TypeTagReader> reader,
                                     std::shared_ptr<const TypeTagWriter> writer) {
  if (!reader || !writer) {
    throw core::ConfigurationError("a type tag format needs both a reader and a writer");
  }
  return TypeTagFormat(std::move(reader), std::move(writer));
}

core::Json TypeTagFormat::describe() const {
  core::Json read = reader_->describe();
  core::Json write = writer_->describe();
  if (read == write) {
    return read;
  }
  return core::Json{{"reader", std::move(read)}, {"writer", std::move(write)}};
}

}  // namespace adtjson::discriminator
