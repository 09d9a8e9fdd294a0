#ifndef TRANSFER_SERVICE_H
#define TRANSFER_SERVICE_H

#include "core/transfer_config.h"
#include "transfer/endpoint_factory.h"
#include "transfer/progress_channel.h"
#include "transfer/transfer_pipeline.h"
#include "utils/thread_safe_queue.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using CompletionCallback = std::function<void(const TransferOutcome &)>;

// Caller's view of a submitted job.
class TransferHandle {
public:
  TransferHandle(std::string jobId, size_t progressCapacity);

  TransferHandle(const TransferHandle &) = delete;
  TransferHandle &operator=(const TransferHandle &) = delete;

  const std::string &jobId() const { return jobId_; }

  // Requests cancellation. The run stops at its next batch boundary; a job
  // still waiting for a worker ends as CANCELLED without touching its
  // destination.
  void cancel() const { token_.cancel(); }
  const CancellationToken &cancellationToken() const { return token_; }

  ProgressChannel &progress() { return progress_; }

  TransferState state() const;
  bool isDone() const;

  TransferOutcome wait() const;
  std::optional<TransferOutcome>
  waitFor(std::chrono::milliseconds timeout) const;

  // Runs on the worker thread that finished the job, or right away on the
  // calling thread when the job is already done.
  void onComplete(CompletionCallback callback);

private:
  friend class TransferService;

  void markRunning();
  void complete(TransferOutcome outcome);

  std::string jobId_;
  CancellationToken token_;
  ProgressChannel progress_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  TransferState state_ = TransferState::PENDING;
  std::optional<TransferOutcome> outcome_;
  std::vector<CompletionCallback> callbacks_;
};

// Runs jobs on a fixed pool of worker threads. At most one job may be
// active per destination key; a second submission for a busy destination
// throws TransferError(DESTINATION_BUSY) instead of queueing.
class TransferService {
public:
  explicit TransferService(std::shared_ptr<IEndpointFactory> factory,
                           size_t numWorkers = TransferConfig::getMaxWorkers());
  ~TransferService();

  TransferService(const TransferService &) = delete;
  TransferService &operator=(const TransferService &) = delete;

  // Endpoints are resolved by the factory on the worker thread.
  std::shared_ptr<TransferHandle> submit(const TransferJob &job);
  std::shared_ptr<TransferHandle> submit(const TransferJob &job,
                                         std::vector<TransferUnit> units);
  std::shared_ptr<TransferHandle>
  submit(const TransferJob &job, std::unique_ptr<TransferPipeline> pipeline);

  bool isDestinationActive(const EndpointDescriptor &destination) const;
  size_t activeJobs() const;
  size_t totalWorkers() const { return workers_.size(); }

  // Cancels every active job and joins the workers. Idempotent.
  void shutdown();

private:
  struct Task {
    std::shared_ptr<TransferHandle> handle;
    TransferJob job;
    std::unique_ptr<TransferPipeline> pipeline;
    std::string destinationKey;
  };

  std::shared_ptr<TransferHandle>
  enqueue(const TransferJob &job, std::unique_ptr<TransferPipeline> pipeline);
  void workerThread(size_t workerId);
  void execute(Task &task);
  void releaseDestination(const std::string &key);

  std::shared_ptr<IEndpointFactory> factory_;
  std::vector<std::thread> workers_;
  ThreadSafeQueue<Task> tasks_;
  std::atomic<bool> shutdown_{false};
  std::atomic<uint64_t> nextJobId_{1};

  mutable std::mutex activeMutex_;
  std::map<std::string, std::weak_ptr<TransferHandle>> activeDestinations_;
};

#endif
