#ifndef DOCUMENT_KEY_H
#define DOCUMENT_KEY_H

#include "document/document.h"
#include <cstdint>
#include <functional>
#include <string>

// Stable identity of a document inside a transfer: the compact relaxed
// extended JSON of its _id, or "index:<n>" when it has none.
class DocumentKey {
public:
  static DocumentKey fromId(const Value &id);
  static DocumentKey fromDocument(const Document &document,
                                  uint64_t fallbackIndex);

  const std::string &str() const { return key_; }
  bool isPositional() const { return positional_; }

  bool operator==(const DocumentKey &o) const { return key_ == o.key_; }
  bool operator!=(const DocumentKey &o) const { return key_ != o.key_; }
  bool operator<(const DocumentKey &o) const { return key_ < o.key_; }

private:
  DocumentKey(std::string key, bool positional)
      : key_(std::move(key)), positional_(positional) {}

  std::string key_;
  bool positional_ = false;
};

namespace std {
template <> struct hash<DocumentKey> {
  size_t operator()(const DocumentKey &key) const {
    return hash<string>()(key.str());
  }
};
} // namespace std

#endif
