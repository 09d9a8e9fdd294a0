#ifndef PROGRESS_CHANNEL_H
#define PROGRESS_CHANNEL_H

#include "utils/thread_safe_queue.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// processed and total count records of the whole job. The unit fields
// describe the collection or file currently moving; for archive restores
// they count bytes.
struct ProgressSnapshot {
  uint64_t processed = 0;
  std::optional<uint64_t> total;
  std::string unitLabel;
  uint64_t unitProcessed = 0;
  std::optional<uint64_t> unitTotal;
};

// Bounded single-producer/single-consumer channel from a pipeline run to
// its observer. Snapshots are cumulative, so when the consumer falls behind
// the oldest pending snapshot is discarded instead of blocking the
// producer.
class ProgressChannel {
public:
  explicit ProgressChannel(size_t capacity);

  void publish(ProgressSnapshot snapshot);
  bool poll(ProgressSnapshot &snapshot) { return queue_.tryPop(snapshot); }
  // Waits up to timeout. Returns false on timeout or once the channel is
  // closed and drained.
  bool waitNext(ProgressSnapshot &snapshot, std::chrono::milliseconds timeout);

  void close() { queue_.shutdown_queue(); }
  bool isClosed() const { return queue_.isShutdown(); }

  size_t capacity() const { return capacity_; }
  uint64_t droppedCount() const { return dropped_; }
  uint64_t publishedCount() const { return published_; }

private:
  ThreadSafeQueue<ProgressSnapshot> queue_;
  size_t capacity_;
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> published_{0};
};

#endif
