#ifndef TRANSFER_ERRORS_H
#define TRANSFER_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

enum class TransferErrorKind {
  MALFORMED_JOB,
  CODEC_INIT,
  SOURCE_UNAVAILABLE,
  DESTINATION_UNAVAILABLE,
  DESTINATION_BUSY,
  MALFORMED_SOURCE,
  EXTERNAL_TOOL,
  ABORTED_ON_RECORD_ERROR,
  INTERNAL
};

enum class RecordErrorKind {
  MALFORMED_JSON,
  NOT_A_DOCUMENT,
  CSV_COLUMN_COUNT,
  CSV_TYPE_COLLISION,
  INSERT_CONFLICT,
  WRITE_FAILED,
  ENCODE_FAILED
};

std::string transferErrorKindName(TransferErrorKind kind);
std::string recordErrorKindName(RecordErrorKind kind);

// Fatal error: ends the job as FAILED.
class TransferError : public std::runtime_error {
public:
  TransferError(TransferErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  TransferErrorKind kind() const { return kind_; }

private:
  TransferErrorKind kind_;
};

// Problem confined to one document. offset is the 0-based position of the
// record in the source sequence; line is 1-based and 0 when unknown.
struct RecordError {
  RecordErrorKind kind = RecordErrorKind::WRITE_FAILED;
  uint64_t offset = 0;
  uint64_t line = 0;
  std::string documentKey;
  std::string message;

  std::string describe() const;
};

// Keeps the first `capacity` record errors and counts all of them.
class ErrorCollector {
public:
  explicit ErrorCollector(size_t capacity) : capacity_(capacity) {}

  void add(RecordError error);

  uint64_t total() const { return total_; }
  bool truncated() const { return total_ > errors_.size(); }
  const std::vector<RecordError> &errors() const { return errors_; }
  std::vector<RecordError> takeErrors() { return std::move(errors_); }

private:
  size_t capacity_;
  uint64_t total_ = 0;
  std::vector<RecordError> errors_;
};

#endif
