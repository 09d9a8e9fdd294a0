#include "codecs/format_codec.h"
#include "codecs/archive_codec.h"
#include "codecs/csv_codec.h"
#include "codecs/json_array_codec.h"
#include "codecs/json_lines_codec.h"
#include "utils/string_utils.h"

std::string formatName(TransferFormat format) {
  switch (format) {
  case TransferFormat::JSON_LINES:
    return "JSON_LINES";
  case TransferFormat::JSON_ARRAY:
    return "JSON_ARRAY";
  case TransferFormat::CSV:
    return "CSV";
  case TransferFormat::BSON_ARCHIVE:
    return "BSON_ARCHIVE";
  }
  return "UNKNOWN";
}

std::string formatExtension(TransferFormat format) {
  switch (format) {
  case TransferFormat::JSON_LINES:
    return "jsonl";
  case TransferFormat::JSON_ARRAY:
    return "json";
  case TransferFormat::CSV:
    return "csv";
  case TransferFormat::BSON_ARCHIVE:
    return "archive";
  }
  return "";
}

std::optional<TransferFormat> formatFromExtension(const std::string &path) {
  std::string lower = StringUtils::toLower(path);
  if (StringUtils::endsWith(lower, ".gz"))
    lower.resize(lower.size() - 3);
  if (StringUtils::endsWith(lower, ".jsonl") ||
      StringUtils::endsWith(lower, ".ndjson"))
    return TransferFormat::JSON_LINES;
  if (StringUtils::endsWith(lower, ".json"))
    return TransferFormat::JSON_ARRAY;
  if (StringUtils::endsWith(lower, ".csv"))
    return TransferFormat::CSV;
  if (StringUtils::endsWith(lower, ".archive"))
    return TransferFormat::BSON_ARCHIVE;
  return std::nullopt;
}

std::unique_ptr<FormatCodec> createCodec(TransferFormat format) {
  switch (format) {
  case TransferFormat::JSON_LINES:
    return std::make_unique<JsonLinesCodec>();
  case TransferFormat::JSON_ARRAY:
    return std::make_unique<JsonArrayCodec>();
  case TransferFormat::CSV:
    return std::make_unique<CsvCodec>();
  case TransferFormat::BSON_ARCHIVE:
    return std::make_unique<ArchiveCodec>();
  }
  throw TransferError(TransferErrorKind::CODEC_INIT,
                      "no codec for format " + formatName(format));
}

ReadItem decodeJsonDocument(std::string_view text, uint64_t line) {
  ReadItem item;
  item.line = line;

  auto fail = [&item, line](RecordErrorKind kind, const std::string &message) {
    RecordError error;
    error.kind = kind;
    error.line = line;
    error.message = message;
    item.error = std::move(error);
  };

  ExtendedJson::Json json =
      ExtendedJson::Json::parse(text.begin(), text.end(), nullptr, false);
  if (json.is_discarded()) {
    fail(RecordErrorKind::MALFORMED_JSON, "invalid JSON");
    return item;
  }
  if (!json.is_object()) {
    fail(RecordErrorKind::NOT_A_DOCUMENT,
         std::string("expected an object, got ") + json.type_name());
    return item;
  }
  try {
    item.document = ExtendedJson::documentFromJson(json);
  } catch (const ExtendedJsonError &e) {
    fail(RecordErrorKind::MALFORMED_JSON, e.what());
  }
  return item;
}
