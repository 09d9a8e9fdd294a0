#include "transfer/progress_channel.h"

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

void ProgressChannel::publish(ProgressSnapshot snapshot) {
  if (queue_.isShutdown())
    return;
  ++published_;
  if (queue_.pushDropOldest(std::move(snapshot), capacity_))
    ++dropped_;
}

bool ProgressChannel::waitNext(ProgressSnapshot &snapshot,
                               std::chrono::milliseconds timeout) {
  return queue_.pop(snapshot, timeout);
}
