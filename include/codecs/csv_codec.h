#ifndef CSV_CODEC_H
#define CSV_CODEC_H

#include "codecs/format_codec.h"

// CSV with a mandatory header row. Writing needs the column schema up
// front; reading takes column order from the header.
class CsvCodec : public FormatCodec {
public:
  TransferFormat format() const override { return TransferFormat::CSV; }
  bool requiresColumnSchema() const override { return true; }

  std::unique_ptr<DocumentWriter>
  openWriter(ByteWriter &writer, const CodecOptions &options,
             const ColumnSchema *schema) const override;
  std::unique_ptr<DocumentCursor>
  openReader(ByteReader &reader, const CodecOptions &options) const override;
};

#endif
