#include "document/document_key.h"
#include "document/extended_json.h"

DocumentKey DocumentKey::fromId(const Value &id) {
  return DocumentKey(ExtendedJson::serializeValue(id, ExtendedJsonMode::RELAXED),
                     false);
}

DocumentKey DocumentKey::fromDocument(const Document &document,
                                      uint64_t fallbackIndex) {
  if (const Value *id = document.get("_id")) {
    return fromId(*id);
  }
  return DocumentKey("index:" + std::to_string(fallbackIndex), true);
}
