#ifndef DOCUMENT_SINK_H
#define DOCUMENT_SINK_H

#include "codecs/format_codec.h"
#include <string>
#include <vector>

// Consumer of document batches. Failures are reported per batch position;
// a throw means the destination itself is unusable.
class IDocumentSink {
public:
  virtual ~IDocumentSink() = default;

  virtual bool requiresColumnSchema() const { return false; }
  // schema is non-null exactly when requiresColumnSchema() is true.
  virtual void open(const ColumnSchema *schema) = 0;
  virtual BatchWriteResult writeBatch(const std::vector<Document> &documents) = 0;
  // Completes the output. Called after the last batch and on cancellation.
  virtual void close() = 0;
  virtual std::string describe() const = 0;
};

#endif
