#ifndef DOCUMENT_SOURCE_H
#define DOCUMENT_SOURCE_H

#include "codecs/format_codec.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Producer of a lazy document sequence. open() can be called more than once
// and starts over at the given offset; CSV export uses this for its column
// discovery pass.
class IDocumentSource {
public:
  virtual ~IDocumentSource() = default;

  virtual std::unique_ptr<DocumentCursor> open(uint64_t offset) = 0;
  virtual std::optional<uint64_t> estimatedCount() = 0;
  virtual std::string describe() const = 0;
};

#endif
