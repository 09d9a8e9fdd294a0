#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

// Shared cancel flag. Copies observe the same flag; the pipeline only reads
// it, at batch boundaries.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool isCancelled() const {
    return flag_->load(std::memory_order_acquire);
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

#endif
