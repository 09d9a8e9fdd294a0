#ifndef JSON_LINES_CODEC_H
#define JSON_LINES_CODEC_H

#include "codecs/format_codec.h"

// One compact extended-JSON document per "\n"-terminated line. Pretty
// printing would break the line framing and is ignored.
class JsonLinesCodec : public FormatCodec {
public:
  TransferFormat format() const override { return TransferFormat::JSON_LINES; }

  std::unique_ptr<DocumentWriter>
  openWriter(ByteWriter &writer, const CodecOptions &options,
             const ColumnSchema *schema) const override;
  std::unique_ptr<DocumentCursor>
  openReader(ByteReader &reader, const CodecOptions &options) const override;
};

#endif
