#pragma once

#include "adtjson/discriminator/tag_codec.h"
#include "adtjson/discriminator/type_tag_reader.h"
#include "adtjson/discriminator/type_tag_writer.h"

#include <memory>
#include <string>
#include <utility>

namespace adtjson::discriminator {

// TypeTagFormat bundles a reader and a writer into one bidirectional
// discriminator strategy. The halves are independent: combine() may pair a
// nested reader with a flat writer, for instance to migrate stored documents.
class TypeTagFormat {
 public:
  static TypeTagFormat nested();
  static TypeTagFormat flat(TagCodec tag_codec);
  static TypeTagFormat flat();  // tag in the "type" field
  static TypeTagFormat combine(std::shared_ptr<const TypeTagReader> reader,
                               std::shared_ptr<const TypeTagWriter> writer);

  [[nodiscard]] const std::shared_ptr<const TypeTagReader>& reader() const noexcept {
    return reader_;
  }
  [[nodiscard]] const std::shared_ptr<const TypeTagWriter>& writer() const noexcept {
    return writer_;
  }

  [[nodiscard]] core::Json write(const std::string& type_name, core::Json base) const {
    return writer_->write(type_name, std::move(base));
  }

  template <typename A>
  [[nodiscard]] codec::Decoder<A> reads(std::string type_name, codec::Decoder<A> base) const {
    return read_tagged<A>(reader_, std::move(type_name), std::move(base));
  }

  // {"style": ...} when both halves agree, otherwise {"reader": ..., "writer": ...}.
  [[nodiscard]] core::Json describe() const;

 private:
  TypeTagFormat(std::shared_ptr<const TypeTagReader> reader,
                std::shared_ptr<const TypeTagWriter> writer);

  std::shared_ptr<const TypeTagReader> reader_;
  std::shared_ptr<const TypeTagWriter> writer_;
};

}  // namespace adtjson::discriminator
