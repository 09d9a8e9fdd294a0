#ifndef JSON_ARRAY_CODEC_H
#define JSON_ARRAY_CODEC_H

#include "codecs/format_codec.h"

// A single JSON array of extended-JSON documents. With prettyPrint each
// element starts on its own line and is indented by two spaces. The reader
// splits the array element by element so memory stays bounded by the
// largest document, not the file.
class JsonArrayCodec : public FormatCodec {
public:
  TransferFormat format() const override { return TransferFormat::JSON_ARRAY; }

  std::unique_ptr<DocumentWriter>
  openWriter(ByteWriter &writer, const CodecOptions &options,
             const ColumnSchema *schema) const override;
  std::unique_ptr<DocumentCursor>
  openReader(ByteReader &reader, const CodecOptions &options) const override;
};

#endif
