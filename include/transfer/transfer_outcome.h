#ifndef TRANSFER_OUTCOME_H
#define TRANSFER_OUTCOME_H

#include "transfer/transfer_errors.h"
#include "transfer/transfer_job.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct TransferOutcome {
  TransferState state = TransferState::PENDING;
  // Source records consumed, including the ones that failed.
  uint64_t processed = 0;
  // Documents durably written to the destination.
  uint64_t committed = 0;
  // Total per-record errors; errors holds at most maxRecordedErrors of them.
  uint64_t failed = 0;
  std::vector<RecordError> errors;
  bool errorsTruncated = false;
  std::optional<TransferErrorKind> fatalKind;
  std::string fatalMessage;
  uint32_t batches = 0;
  uint32_t unitsCompleted = 0;
  double elapsedSeconds = 0.0;

  std::string summary() const;
};

#endif
