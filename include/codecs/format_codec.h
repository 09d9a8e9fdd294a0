#ifndef FORMAT_CODEC_H
#define FORMAT_CODEC_H

#include "document/document.h"
#include "document/extended_json.h"
#include "flatten/column_schema.h"
#include "flatten/csv_flattener.h"
#include "io/byte_stream.h"
#include "transfer/transfer_errors.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class TransferFormat { JSON_LINES, JSON_ARRAY, CSV, BSON_ARCHIVE };

std::string formatName(TransferFormat format);
// "jsonl", "json", "csv" or "archive"; no leading dot.
std::string formatExtension(TransferFormat format);
std::optional<TransferFormat> formatFromExtension(const std::string &path);

struct CodecOptions {
  ExtendedJsonMode jsonMode = ExtendedJsonMode::RELAXED;
  bool prettyPrint = false;
  FlattenOptions flatten;
  char csvDelimiter = ',';
};

// One element of a document stream: either a document or a per-record
// error. The reader fills line and the error's kind and message; the
// pipeline assigns the offset.
struct ReadItem {
  Document document;
  std::optional<RecordError> error;
  uint64_t line = 0;

  bool ok() const { return !error.has_value(); }
};

class DocumentCursor {
public:
  virtual ~DocumentCursor() = default;

  // Advances to the next item. Returns false at the end of the stream.
  // Throws TransferError when the stream itself is unusable.
  virtual bool next(ReadItem &item) = 0;
};

struct RecordFailure {
  size_t index = 0;
  RecordErrorKind kind = RecordErrorKind::WRITE_FAILED;
  std::string message;
};

struct BatchWriteResult {
  uint64_t written = 0;
  std::vector<RecordFailure> failures;
};

class DocumentWriter {
public:
  virtual ~DocumentWriter() = default;

  virtual BatchWriteResult writeBatch(const std::vector<Document> &documents) = 0;
  // Writes any trailer. The underlying ByteWriter stays open.
  virtual void finish() = 0;
};

// Shared read/write contract of the file encodings.
class FormatCodec {
public:
  virtual ~FormatCodec() = default;

  virtual TransferFormat format() const = 0;
  virtual bool requiresColumnSchema() const { return false; }
  // Pass-through formats are produced by an external tool, not by the
  // document writer and reader below.
  virtual bool isPassThrough() const { return false; }

  virtual std::unique_ptr<DocumentWriter>
  openWriter(ByteWriter &writer, const CodecOptions &options,
             const ColumnSchema *schema) const = 0;
  virtual std::unique_ptr<DocumentCursor>
  openReader(ByteReader &reader, const CodecOptions &options) const = 0;
};

std::unique_ptr<FormatCodec> createCodec(TransferFormat format);

// Parses one extended-JSON document. Invalid JSON becomes MALFORMED_JSON,
// valid JSON that is not an object becomes NOT_A_DOCUMENT.
ReadItem decodeJsonDocument(std::string_view text, uint64_t line);

#endif
