#include "transfer/memory_endpoints.h"

MemoryCollection::MemoryCollection(std::vector<Document> documents) {
  for (const auto &document : documents) {
    apply(document, InsertMode::INSERT);
  }
}

bool MemoryCollection::apply(const Document &document, InsertMode mode) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!document.contains("_id")) {
    documents_.push_back(document);
    return true;
  }

  DocumentKey key = DocumentKey::fromDocument(document, documents_.size());
  auto it = index_.find(key);
  if (it == index_.end()) {
    index_.emplace(key, documents_.size());
    documents_.push_back(document);
    return true;
  }

  switch (mode) {
  case InsertMode::INSERT:
    return false;
  case InsertMode::UPSERT: {
    Document &existing = documents_[it->second];
    for (const auto &field : document.fields()) {
      existing.set(field.name, field.value);
    }
    return true;
  }
  case InsertMode::REPLACE:
    documents_[it->second] = document;
    return true;
  }
  return false;
}

std::vector<Document> MemoryCollection::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_;
}

size_t MemoryCollection::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.size();
}

std::optional<Document> MemoryCollection::find(const DocumentKey &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(key);
  if (it == index_.end())
    return std::nullopt;
  return documents_[it->second];
}

namespace {
class VectorCursor : public DocumentCursor {
public:
  VectorCursor(std::vector<Document> documents, uint64_t offset)
      : documents_(std::move(documents)), pos_(offset) {}

  bool next(ReadItem &item) override {
    if (pos_ >= documents_.size())
      return false;
    item = ReadItem();
    item.document = std::move(documents_[pos_++]);
    return true;
  }

private:
  std::vector<Document> documents_;
  uint64_t pos_;
};
} // namespace

MemoryDocumentSource::MemoryDocumentSource(
    std::shared_ptr<const MemoryCollection> collection, std::string label)
    : collection_(std::move(collection)), label_(std::move(label)) {}

MemoryDocumentSource::MemoryDocumentSource(std::vector<Document> documents,
                                           std::string label)
    : collection_(std::make_shared<MemoryCollection>(std::move(documents))),
      label_(std::move(label)) {}

std::unique_ptr<DocumentCursor> MemoryDocumentSource::open(uint64_t offset) {
  return std::make_unique<VectorCursor>(collection_->snapshot(), offset);
}

std::optional<uint64_t> MemoryDocumentSource::estimatedCount() {
  return collection_->size();
}

MemoryDocumentSink::MemoryDocumentSink(
    std::shared_ptr<MemoryCollection> collection, InsertMode mode,
    std::string label)
    : collection_(std::move(collection)), mode_(mode),
      label_(std::move(label)) {}

BatchWriteResult
MemoryDocumentSink::writeBatch(const std::vector<Document> &documents) {
  BatchWriteResult result;
  for (size_t i = 0; i < documents.size(); ++i) {
    if (collection_->apply(documents[i], mode_)) {
      ++result.written;
    } else {
      result.failures.push_back(
          {i, RecordErrorKind::INSERT_CONFLICT,
           "duplicate key " +
               DocumentKey::fromDocument(documents[i], i).str()});
    }
  }
  return result;
}
