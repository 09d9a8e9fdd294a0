#include "codecs/json_lines_codec.h"
#include "utils/string_utils.h"

namespace {

class JsonLinesWriter : public DocumentWriter {
public:
  JsonLinesWriter(ByteWriter &writer, ExtendedJsonMode mode)
      : writer_(writer), mode_(mode) {}

  BatchWriteResult writeBatch(const std::vector<Document> &documents) override {
    BatchWriteResult result;
    std::string chunk;
    for (size_t i = 0; i < documents.size(); ++i) {
      try {
        chunk += ExtendedJson::serialize(documents[i], mode_);
        chunk.push_back('\n');
        ++result.written;
      } catch (const std::exception &e) {
        result.failures.push_back({i, RecordErrorKind::ENCODE_FAILED, e.what()});
      }
    }
    writer_.write(chunk);
    return result;
  }

  void finish() override { writer_.flush(); }

private:
  ByteWriter &writer_;
  ExtendedJsonMode mode_;
};

class JsonLinesReader : public DocumentCursor {
public:
  explicit JsonLinesReader(ByteReader &reader) : input_(reader) {}

  bool next(ReadItem &item) override {
    std::string line;
    while (true) {
      uint64_t lineNumber = input_.line();
      if (!input_.readLine(line))
        return false;
      if (StringUtils::trim(line).empty())
        continue;

      item = decodeJsonDocument(line, lineNumber);
      return true;
    }
  }

private:
  TextInput input_;
};

} // namespace

std::unique_ptr<DocumentWriter>
JsonLinesCodec::openWriter(ByteWriter &writer, const CodecOptions &options,
                           const ColumnSchema *) const {
  return std::make_unique<JsonLinesWriter>(writer, options.jsonMode);
}

std::unique_ptr<DocumentCursor>
JsonLinesCodec::openReader(ByteReader &reader, const CodecOptions &) const {
  return std::make_unique<JsonLinesReader>(reader);
}
