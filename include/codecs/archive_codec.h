#ifndef ARCHIVE_CODEC_H
#define ARCHIVE_CODEC_H

#include "codecs/format_codec.h"

// Binary dump archives are written and read by the external dump/restore
// tools. The engine never decodes them, so the document-level entry points
// refuse to open.
class ArchiveCodec : public FormatCodec {
public:
  TransferFormat format() const override {
    return TransferFormat::BSON_ARCHIVE;
  }
  bool isPassThrough() const override { return true; }

  std::unique_ptr<DocumentWriter>
  openWriter(ByteWriter &writer, const CodecOptions &options,
             const ColumnSchema *schema) const override;
  std::unique_ptr<DocumentCursor>
  openReader(ByteReader &reader, const CodecOptions &options) const override;
};

#endif
