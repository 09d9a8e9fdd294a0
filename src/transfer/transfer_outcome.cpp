#include "transfer/transfer_outcome.h"
#include <iomanip>
#include <sstream>

std::string TransferOutcome::summary() const {
  std::ostringstream oss;
  oss << transferStateName(state) << ": processed=" << processed
      << " committed=" << committed << " failed=" << failed
      << " batches=" << batches << " elapsed=" << std::fixed
      << std::setprecision(2) << elapsedSeconds << "s";
  if (fatalKind) {
    oss << " error=" << transferErrorKindName(*fatalKind) << " ("
        << fatalMessage << ")";
  }
  return oss.str();
}
