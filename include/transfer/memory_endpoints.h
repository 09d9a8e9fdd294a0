#ifndef MEMORY_ENDPOINTS_H
#define MEMORY_ENDPOINTS_H

#include "document/document_key.h"
#include "transfer/document_sink.h"
#include "transfer/document_source.h"
#include "transfer/transfer_job.h"
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

// In-process collection keyed by DocumentKey. Documents without _id are
// always appended.
class MemoryCollection {
public:
  MemoryCollection() = default;
  explicit MemoryCollection(std::vector<Document> documents);

  // Applies one document with the given mode. Returns false (and leaves the
  // collection unchanged) when INSERT meets an existing _id.
  bool apply(const Document &document, InsertMode mode);

  std::vector<Document> snapshot() const;
  size_t size() const;
  std::optional<Document> find(const DocumentKey &key) const;

private:
  mutable std::mutex mutex_;
  std::vector<Document> documents_;
  std::unordered_map<DocumentKey, size_t> index_;
};

class MemoryDocumentSource : public IDocumentSource {
public:
  explicit MemoryDocumentSource(std::shared_ptr<const MemoryCollection> collection,
                                std::string label = "memory");
  explicit MemoryDocumentSource(std::vector<Document> documents,
                                std::string label = "memory");

  std::unique_ptr<DocumentCursor> open(uint64_t offset) override;
  std::optional<uint64_t> estimatedCount() override;
  std::string describe() const override { return label_; }

private:
  std::shared_ptr<const MemoryCollection> collection_;
  std::string label_;
};

class MemoryDocumentSink : public IDocumentSink {
public:
  MemoryDocumentSink(std::shared_ptr<MemoryCollection> collection,
                     InsertMode mode, std::string label = "memory");

  void open(const ColumnSchema *) override {}
  BatchWriteResult writeBatch(const std::vector<Document> &documents) override;
  void close() override {}
  std::string describe() const override { return label_; }

private:
  std::shared_ptr<MemoryCollection> collection_;
  InsertMode mode_;
  std::string label_;
};

#endif
