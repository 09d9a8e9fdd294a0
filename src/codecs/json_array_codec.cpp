#include "codecs/json_array_codec.h"
#include <cctype>

namespace {

std::string indentLines(const std::string &text, const std::string &indent) {
  std::string out = indent;
  out.reserve(text.size() + indent.size() * 8);
  for (char c : text) {
    out.push_back(c);
    if (c == '\n')
      out += indent;
  }
  return out;
}

class JsonArrayWriter : public DocumentWriter {
public:
  JsonArrayWriter(ByteWriter &writer, const CodecOptions &options)
      : writer_(writer), mode_(options.jsonMode), pretty_(options.prettyPrint) {
    writer_.write("[");
  }

  BatchWriteResult writeBatch(const std::vector<Document> &documents) override {
    BatchWriteResult result;
    std::string chunk;
    for (size_t i = 0; i < documents.size(); ++i) {
      std::string element;
      try {
        element = pretty_ ? indentLines(ExtendedJson::serialize(documents[i],
                                                                mode_, 2),
                                        "  ")
                          : ExtendedJson::serialize(documents[i], mode_);
      } catch (const std::exception &e) {
        result.failures.push_back({i, RecordErrorKind::ENCODE_FAILED, e.what()});
        continue;
      }
      if (count_ > 0)
        chunk.push_back(',');
      if (pretty_)
        chunk.push_back('\n');
      chunk += element;
      ++count_;
      ++result.written;
    }
    writer_.write(chunk);
    return result;
  }

  void finish() override {
    writer_.write(pretty_ && count_ > 0 ? "\n]\n" : "]\n");
    writer_.flush();
  }

private:
  ByteWriter &writer_;
  ExtendedJsonMode mode_;
  bool pretty_;
  uint64_t count_ = 0;
};

class JsonArrayReader : public DocumentCursor {
public:
  explicit JsonArrayReader(ByteReader &reader) : input_(reader) {}

  bool next(ReadItem &item) override {
    if (done_)
      return false;

    if (!started_) {
      skipWhitespace();
      if (input_.get() != '[') {
        throw TransferError(TransferErrorKind::MALFORMED_SOURCE,
                            input_.sourceName() +
                                " does not start with a JSON array");
      }
      started_ = true;
    }

    skipWhitespace();
    int c = input_.peek();
    if (c == -1)
      throw truncated();
    if (c == ']') {
      input_.get();
      done_ = true;
      return false;
    }

    uint64_t line = input_.line();
    std::string element;
    int terminator = readElement(element);
    if (terminator == ']')
      done_ = true;

    item = decodeJsonDocument(element, line);
    return true;
  }

private:
  TransferError truncated() const {
    return TransferError(TransferErrorKind::MALFORMED_SOURCE,
                         input_.sourceName() + " ends inside the JSON array");
  }

  void skipWhitespace() {
    while (true) {
      int c = input_.peek();
      if (c == -1 || !std::isspace(c))
        return;
      input_.get();
    }
  }

  // Collects the raw text of one element up to the ',' or ']' that closes
  // it at nesting depth zero, and returns that terminator.
  int readElement(std::string &element) {
    int depth = 0;
    bool inString = false;
    bool escaped = false;

    while (true) {
      int c = input_.get();
      if (c == -1)
        throw truncated();
      char ch = static_cast<char>(c);

      if (inString) {
        element.push_back(ch);
        if (escaped)
          escaped = false;
        else if (ch == '\\')
          escaped = true;
        else if (ch == '"')
          inString = false;
        continue;
      }

      if (depth == 0 && (ch == ',' || ch == ']'))
        return ch;

      element.push_back(ch);
      if (ch == '"')
        inString = true;
      else if (ch == '{' || ch == '[')
        ++depth;
      else if ((ch == '}' || ch == ']') && depth > 0)
        --depth;
    }
  }

  TextInput input_;
  bool started_ = false;
  bool done_ = false;
};

} // namespace

std::unique_ptr<DocumentWriter>
JsonArrayCodec::openWriter(ByteWriter &writer, const CodecOptions &options,
                           const ColumnSchema *) const {
  return std::make_unique<JsonArrayWriter>(writer, options);
}

std::unique_ptr<DocumentCursor>
JsonArrayCodec::openReader(ByteReader &reader, const CodecOptions &) const {
  return std::make_unique<JsonArrayReader>(reader);
}
