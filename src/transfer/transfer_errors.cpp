#include "transfer/transfer_errors.h"

std::string transferErrorKindName(TransferErrorKind kind) {
  switch (kind) {
  case TransferErrorKind::MALFORMED_JOB:
    return "MALFORMED_JOB";
  case TransferErrorKind::CODEC_INIT:
    return "CODEC_INIT";
  case TransferErrorKind::SOURCE_UNAVAILABLE:
    return "SOURCE_UNAVAILABLE";
  case TransferErrorKind::DESTINATION_UNAVAILABLE:
    return "DESTINATION_UNAVAILABLE";
  case TransferErrorKind::DESTINATION_BUSY:
    return "DESTINATION_BUSY";
  case TransferErrorKind::MALFORMED_SOURCE:
    return "MALFORMED_SOURCE";
  case TransferErrorKind::EXTERNAL_TOOL:
    return "EXTERNAL_TOOL";
  case TransferErrorKind::ABORTED_ON_RECORD_ERROR:
    return "ABORTED_ON_RECORD_ERROR";
  case TransferErrorKind::INTERNAL:
    return "INTERNAL";
  }
  return "UNKNOWN";
}

std::string recordErrorKindName(RecordErrorKind kind) {
  switch (kind) {
  case RecordErrorKind::MALFORMED_JSON:
    return "MALFORMED_JSON";
  case RecordErrorKind::NOT_A_DOCUMENT:
    return "NOT_A_DOCUMENT";
  case RecordErrorKind::CSV_COLUMN_COUNT:
    return "CSV_COLUMN_COUNT";
  case RecordErrorKind::CSV_TYPE_COLLISION:
    return "CSV_TYPE_COLLISION";
  case RecordErrorKind::INSERT_CONFLICT:
    return "INSERT_CONFLICT";
  case RecordErrorKind::WRITE_FAILED:
    return "WRITE_FAILED";
  case RecordErrorKind::ENCODE_FAILED:
    return "ENCODE_FAILED";
  }
  return "UNKNOWN";
}

std::string RecordError::describe() const {
  std::string text = recordErrorKindName(kind) + " at record " +
                     std::to_string(offset);
  if (line > 0)
    text += " (line " + std::to_string(line) + ")";
  if (!documentKey.empty())
    text += " [" + documentKey + "]";
  return text + ": " + message;
}

void ErrorCollector::add(RecordError error) {
  ++total_;
  if (errors_.size() < capacity_) {
    errors_.push_back(std::move(error));
  }
}
