#include "transfer/stream_endpoints.h"
#include "core/logger.h"
#include "io/file_stream.h"

namespace {

// Keeps the byte reader alive for as long as the codec cursor reading it.
class OwningCursor : public DocumentCursor {
public:
  OwningCursor(std::unique_ptr<ByteReader> reader,
               const FormatCodec &codec, const CodecOptions &options)
      : reader_(std::move(reader)),
        inner_(codec.openReader(*reader_, options)) {}

  bool next(ReadItem &item) override { return inner_->next(item); }

private:
  std::unique_ptr<ByteReader> reader_;
  std::unique_ptr<DocumentCursor> inner_;
};

} // namespace

StreamDocumentSource::StreamDocumentSource(
    ByteReaderFactory openReader, std::shared_ptr<const FormatCodec> codec,
    CodecOptions options, std::string label)
    : openReader_(std::move(openReader)), codec_(std::move(codec)),
      options_(std::move(options)), label_(std::move(label)) {}

std::unique_ptr<StreamDocumentSource>
StreamDocumentSource::fromFile(const std::string &path, TransferFormat format,
                               const CodecOptions &options) {
  return std::make_unique<StreamDocumentSource>(
      [path]() { return std::make_unique<GzipFileReader>(path); },
      std::shared_ptr<const FormatCodec>(createCodec(format)), options, path);
}

std::unique_ptr<StreamDocumentSource>
StreamDocumentSource::fromString(std::string content, TransferFormat format,
                                 const CodecOptions &options) {
  auto shared = std::make_shared<const std::string>(std::move(content));
  return std::make_unique<StreamDocumentSource>(
      [shared]() { return std::make_unique<StringByteReader>(*shared); },
      std::shared_ptr<const FormatCodec>(createCodec(format)), options,
      "memory");
}

std::unique_ptr<DocumentCursor> StreamDocumentSource::open(uint64_t offset) {
  auto cursor =
      std::make_unique<OwningCursor>(openReader_(), *codec_, options_);
  ReadItem skipped;
  for (uint64_t i = 0; i < offset; ++i) {
    if (!cursor->next(skipped))
      break;
  }
  return cursor;
}

StreamDocumentSink::StreamDocumentSink(ByteWriterFactory openWriter,
                                       std::shared_ptr<const FormatCodec> codec,
                                       CodecOptions options, std::string label)
    : openWriter_(std::move(openWriter)), codec_(std::move(codec)),
      options_(std::move(options)), label_(std::move(label)) {}

StreamDocumentSink::~StreamDocumentSink() {
  // A sink dropped without close() (fatal error mid-run) still releases its
  // file; the partial output is left as written.
  documentWriter_.reset();
  if (writer_) {
    try {
      writer_->close();
    } catch (const std::exception &e) {
      Logger::error(LogCategory::TRANSFER, "StreamDocumentSink",
                    "closing " + label_ + " failed: " + e.what());
    }
  }
}

std::unique_ptr<StreamDocumentSink>
StreamDocumentSink::toFile(const std::string &path, TransferFormat format,
                           const CodecOptions &options, bool gzip) {
  return std::make_unique<StreamDocumentSink>(
      [path, gzip]() { return openFileWriter(path, gzip); },
      std::shared_ptr<const FormatCodec>(createCodec(format)), options, path);
}

std::unique_ptr<StreamDocumentSink>
StreamDocumentSink::toString(std::shared_ptr<std::string> target,
                             TransferFormat format,
                             const CodecOptions &options) {
  return std::make_unique<StreamDocumentSink>(
      [target]() { return std::make_unique<StringByteWriter>(target); },
      std::shared_ptr<const FormatCodec>(createCodec(format)), options,
      "memory");
}

void StreamDocumentSink::open(const ColumnSchema *schema) {
  writer_ = openWriter_();
  documentWriter_ = codec_->openWriter(*writer_, options_, schema);
}

BatchWriteResult
StreamDocumentSink::writeBatch(const std::vector<Document> &documents) {
  if (!documentWriter_) {
    throw TransferError(TransferErrorKind::INTERNAL,
                        "write to " + label_ + " before open");
  }
  return documentWriter_->writeBatch(documents);
}

void StreamDocumentSink::close() {
  if (documentWriter_) {
    documentWriter_->finish();
    documentWriter_.reset();
  }
  if (writer_) {
    std::unique_ptr<ByteWriter> writer = std::move(writer_);
    writer->close();
  }
}
