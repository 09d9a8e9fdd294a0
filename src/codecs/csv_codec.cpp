#include "codecs/csv_codec.h"
#include "codecs/csv_format.h"
#include "core/logger.h"

namespace {

class CsvWriter : public DocumentWriter {
public:
  CsvWriter(ByteWriter &writer, const CodecOptions &options,
            const ColumnSchema &schema)
      : writer_(writer), flattener_(options.flatten), schema_(schema),
        delimiter_(options.csvDelimiter) {
    writer_.write(CsvFormat::formatRecord(schema_.columns(), delimiter_));
  }

  BatchWriteResult writeBatch(const std::vector<Document> &documents) override {
    BatchWriteResult result;
    std::string chunk;
    for (const auto &document : documents) {
      chunk += CsvFormat::formatRecord(
          flattener_.flattenCells(document, schema_), delimiter_);
      ++result.written;
    }
    writer_.write(chunk);
    return result;
  }

  void finish() override { writer_.flush(); }

private:
  ByteWriter &writer_;
  CsvFlattener flattener_;
  ColumnSchema schema_;
  char delimiter_;
};

class CsvReader : public DocumentCursor {
public:
  CsvReader(ByteReader &reader, const CodecOptions &options)
      : input_(reader), records_(input_, options.csvDelimiter),
        flattener_(options.flatten) {}

  bool next(ReadItem &item) override {
    if (!headerRead_) {
      readHeader();
    }
    if (schema_.empty())
      return false;

    if (!records_.readRecord(fields_))
      return false;

    item = ReadItem();
    item.line = records_.recordLine();

    if (fields_.size() != schema_.size()) {
      RecordError error;
      error.kind = RecordErrorKind::CSV_COLUMN_COUNT;
      error.line = item.line;
      error.message = "expected " + std::to_string(schema_.size()) +
                      " cells, found " + std::to_string(fields_.size());
      item.error = std::move(error);
      return true;
    }

    try {
      item.document = flattener_.unflatten(fields_, schema_);
    } catch (const CsvFlattenError &e) {
      RecordError error;
      error.kind = RecordErrorKind::CSV_TYPE_COLLISION;
      error.line = item.line;
      error.message = e.what();
      item.error = std::move(error);
    }
    return true;
  }

private:
  void readHeader() {
    headerRead_ = true;
    std::vector<std::string> header;
    if (!records_.readRecord(header)) {
      Logger::warning(LogCategory::CODEC, "CsvReader",
                      input_.sourceName() + " is empty, no header row");
      return;
    }
    try {
      schema_ = ColumnSchema(header);
    } catch (const std::invalid_argument &e) {
      throw TransferError(TransferErrorKind::MALFORMED_SOURCE,
                          "bad CSV header in " + input_.sourceName() + ": " +
                              e.what());
    }
  }

  TextInput input_;
  CsvRecordReader records_;
  CsvFlattener flattener_;
  ColumnSchema schema_;
  std::vector<std::string> fields_;
  bool headerRead_ = false;
};

} // namespace

std::unique_ptr<DocumentWriter>
CsvCodec::openWriter(ByteWriter &writer, const CodecOptions &options,
                     const ColumnSchema *schema) const {
  if (!schema) {
    throw TransferError(TransferErrorKind::CODEC_INIT,
                        "CSV output needs a column schema");
  }
  return std::make_unique<CsvWriter>(writer, options, *schema);
}

std::unique_ptr<DocumentCursor>
CsvCodec::openReader(ByteReader &reader, const CodecOptions &options) const {
  return std::make_unique<CsvReader>(reader, options);
}
