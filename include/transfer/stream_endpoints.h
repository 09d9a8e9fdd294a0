#ifndef STREAM_ENDPOINTS_H
#define STREAM_ENDPOINTS_H

#include "io/byte_stream.h"
#include "transfer/document_sink.h"
#include "transfer/document_source.h"
#include <functional>
#include <memory>
#include <string>

using ByteReaderFactory = std::function<std::unique_ptr<ByteReader>()>;
using ByteWriterFactory = std::function<std::unique_ptr<ByteWriter>()>;

// Decodes documents from a byte stream with a codec. Each open() gets a
// fresh reader from the factory, which is what makes the source restartable.
class StreamDocumentSource : public IDocumentSource {
public:
  StreamDocumentSource(ByteReaderFactory openReader,
                       std::shared_ptr<const FormatCodec> codec,
                       CodecOptions options, std::string label);

  static std::unique_ptr<StreamDocumentSource>
  fromFile(const std::string &path, TransferFormat format,
           const CodecOptions &options);
  static std::unique_ptr<StreamDocumentSource>
  fromString(std::string content, TransferFormat format,
             const CodecOptions &options);

  std::unique_ptr<DocumentCursor> open(uint64_t offset) override;
  std::optional<uint64_t> estimatedCount() override { return std::nullopt; }
  std::string describe() const override { return label_; }

private:
  ByteReaderFactory openReader_;
  std::shared_ptr<const FormatCodec> codec_;
  CodecOptions options_;
  std::string label_;
};

// Encodes batches onto a byte stream. The stream is created on open(), so
// nothing is written before the pipeline is ready to produce output.
class StreamDocumentSink : public IDocumentSink {
public:
  StreamDocumentSink(ByteWriterFactory openWriter,
                     std::shared_ptr<const FormatCodec> codec,
                     CodecOptions options, std::string label);
  ~StreamDocumentSink() override;

  static std::unique_ptr<StreamDocumentSink>
  toFile(const std::string &path, TransferFormat format,
         const CodecOptions &options, bool gzip);
  static std::unique_ptr<StreamDocumentSink>
  toString(std::shared_ptr<std::string> target, TransferFormat format,
           const CodecOptions &options);

  bool requiresColumnSchema() const override {
    return codec_->requiresColumnSchema();
  }
  void open(const ColumnSchema *schema) override;
  BatchWriteResult writeBatch(const std::vector<Document> &documents) override;
  void close() override;
  std::string describe() const override { return label_; }

private:
  ByteWriterFactory openWriter_;
  std::shared_ptr<const FormatCodec> codec_;
  CodecOptions options_;
  std::string label_;
  std::unique_ptr<ByteWriter> writer_;
  std::unique_ptr<DocumentWriter> documentWriter_;
};

#endif
