#include "adtjson/discriminator/type_tag_writer.h"

#include <utility>

namespace adtjson::discriminator {

core::Json NestedTypeTagWriter::write(const std::string& type_name, core::Json base) const {
  return core::with_key(type_name, std::move(base));
}

core::Json NestedTypeTagWriter::describe() const {
  return core::Json{{"style", "nested"}};
}

FlatTypeTagWriter::FlatTypeTagWriter(TagCodec tag_codec) : tag_codec_(std::move(tag_codec)) {}

core::Json FlatTypeTagWriter::write(const std::string& type_name, core::Json base) const {
  return core::merge(tag_codec_.encode(type_name), base);
}

core::Json FlatTypeTagWriter::describe() const {
  return core::Json{{"style", "flat"}, {"tag_pointer", tag_codec_.pointer()}};
}

}  // namespace adtjson::discriminator
