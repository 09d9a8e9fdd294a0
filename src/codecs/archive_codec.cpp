#include "codecs/archive_codec.h"

std::unique_ptr<DocumentWriter>
ArchiveCodec::openWriter(ByteWriter &writer, const CodecOptions &,
                         const ColumnSchema *) const {
  throw TransferError(TransferErrorKind::CODEC_INIT,
                      "archive output to " + writer.name() +
                          " is produced by the dump tool");
}

std::unique_ptr<DocumentCursor>
ArchiveCodec::openReader(ByteReader &reader, const CodecOptions &) const {
  throw TransferError(TransferErrorKind::CODEC_INIT,
                      "archive input " + reader.name() +
                          " is consumed by the restore tool");
}
