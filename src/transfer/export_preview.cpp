#include "transfer/export_preview.h"
#include "codecs/csv_format.h"
#include "document/extended_json.h"
#include <algorithm>

ExportPreview::ExportPreview(TransferFormat format, TransferOptions options)
    : format_(format), options_(std::move(options)) {
  if (format_ == TransferFormat::BSON_ARCHIVE) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "archive exports cannot be previewed");
  }
}

ExportPreviewResult ExportPreview::render(IDocumentSource &source,
                                          size_t maxDocuments) const {
  ExportPreviewResult result;
  std::vector<Document> documents;

  std::unique_ptr<DocumentCursor> cursor = source.open(0);
  while (documents.size() < maxDocuments) {
    ReadItem item;
    if (!cursor->next(item))
      break;
    if (!item.ok()) {
      ++result.skipped;
      continue;
    }
    documents.push_back(std::move(item.document));
  }
  result.documents = documents.size();

  if (format_ != TransferFormat::CSV) {
    int indent = options_.prettyPrint ? 2 : -1;
    for (const auto &document : documents) {
      result.lines.push_back(
          ExtendedJson::serialize(document, options_.jsonMode, indent));
    }
    return result;
  }

  CsvFlattener flattener(options_.flatten);
  ColumnDiscovery discovery(flattener);
  size_t sampled = std::min(options_.sampleSize, documents.size());
  for (size_t i = 0; i < sampled; ++i) {
    discovery.observe(documents[i]);
  }
  if (options_.unseenColumns == UnseenColumnPolicy::APPEND) {
    for (size_t i = sampled; i < documents.size(); ++i) {
      discovery.observe(documents[i]);
    }
  }
  result.columns = discovery.schema();
  result.lossyFields = discovery.lossyFields();

  auto stripNewline = [](std::string line) {
    if (!line.empty() && line.back() == '\n')
      line.pop_back();
    return line;
  };

  const char delimiter = options_.codecOptions().csvDelimiter;
  result.lines.push_back(
      stripNewline(CsvFormat::formatRecord(result.columns.columns(), delimiter)));
  for (const auto &document : documents) {
    result.lines.push_back(stripNewline(CsvFormat::formatRecord(
        flattener.flattenCells(document, result.columns), delimiter)));
  }
  return result;
}
