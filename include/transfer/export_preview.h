#ifndef EXPORT_PREVIEW_H
#define EXPORT_PREVIEW_H

#include "flatten/column_discovery.h"
#include "transfer/document_source.h"
#include "transfer/transfer_job.h"
#include <string>
#include <vector>

struct ExportPreviewResult {
  // One JSON text per document, or a CSV header line followed by one line
  // per document (without the trailing newline).
  std::vector<std::string> lines;
  ColumnSchema columns;
  size_t documents = 0;
  // Records of the source that could not be decoded.
  size_t skipped = 0;
  std::vector<LossyField> lossyFields;
};

// Renders the first documents of a source the way an export would write
// them. CSV previews always discover columns from a sample; columns that
// appear after the sample are appended or dropped according to
// unseenColumns.
class ExportPreview {
public:
  ExportPreview(TransferFormat format, TransferOptions options);

  ExportPreviewResult render(IDocumentSource &source,
                             size_t maxDocuments) const;

private:
  TransferFormat format_;
  TransferOptions options_;
};

#endif
