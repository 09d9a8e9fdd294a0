#include "transfer/transfer_service.h"
#include "core/logger.h"

TransferHandle::TransferHandle(std::string jobId, size_t progressCapacity)
    : jobId_(std::move(jobId)), progress_(progressCapacity) {}

TransferState TransferHandle::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool TransferHandle::isDone() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outcome_.has_value();
}

TransferOutcome TransferHandle::wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return outcome_.has_value(); });
  return *outcome_;
}

std::optional<TransferOutcome>
TransferHandle::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return outcome_.has_value(); }))
    return std::nullopt;
  return outcome_;
}

void TransferHandle::onComplete(CompletionCallback callback) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!outcome_) {
    callbacks_.push_back(std::move(callback));
    return;
  }
  TransferOutcome outcome = *outcome_;
  lock.unlock();
  callback(outcome);
}

void TransferHandle::markRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == TransferState::PENDING)
    state_ = TransferState::RUNNING;
}

void TransferHandle::complete(TransferOutcome outcome) {
  std::vector<CompletionCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = outcome.state;
    outcome_ = outcome;
    callbacks.swap(callbacks_);
  }
  progress_.close();
  cv_.notify_all();

  for (auto &callback : callbacks) {
    try {
      callback(outcome);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::TRANSFER, "TransferHandle::complete",
                    "Completion callback for job " + jobId_ +
                        " threw: " + std::string(e.what()));
    }
  }
}

// Starts numWorkers threads that take jobs off the shared queue. A worker
// count outside the configured bounds is rejected the same way the
// configuration setter rejects it.
TransferService::TransferService(std::shared_ptr<IEndpointFactory> factory,
                                 size_t numWorkers)
    : factory_(std::move(factory)) {
  if (numWorkers < TransferConfig::MIN_MAX_WORKERS ||
      numWorkers > TransferConfig::MAX_MAX_WORKERS) {
    throw std::invalid_argument(
        "numWorkers must be between " +
        std::to_string(TransferConfig::MIN_MAX_WORKERS) + " and " +
        std::to_string(TransferConfig::MAX_MAX_WORKERS));
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&TransferService::workerThread, this, i);
  }

  Logger::info(LogCategory::TRANSFER, "TransferService",
               "Started with " + std::to_string(numWorkers) + " workers");
}

TransferService::~TransferService() { shutdown(); }

std::shared_ptr<TransferHandle>
TransferService::submit(const TransferJob &job) {
  if (!factory_) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "no endpoint factory configured for job " + job.id);
  }
  return enqueue(job, nullptr);
}

std::shared_ptr<TransferHandle>
TransferService::submit(const TransferJob &job,
                        std::vector<TransferUnit> units) {
  return enqueue(job, std::make_unique<TransferPipeline>(std::move(units)));
}

std::shared_ptr<TransferHandle>
TransferService::submit(const TransferJob &job,
                        std::unique_ptr<TransferPipeline> pipeline) {
  if (!pipeline) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "submitted pipeline is null");
  }
  return enqueue(job, std::move(pipeline));
}

std::shared_ptr<TransferHandle>
TransferService::enqueue(const TransferJob &job,
                         std::unique_ptr<TransferPipeline> pipeline) {
  Task task;
  task.job = job;
  if (task.job.id.empty())
    task.job.id = "job-" + std::to_string(nextJobId_++);
  task.destinationKey = job.destination.key();
  task.pipeline = std::move(pipeline);
  task.handle = std::make_shared<TransferHandle>(
      task.job.id, TransferConfig::getProgressCapacity());

  std::shared_ptr<TransferHandle> handle = task.handle;

  // The shutdown check, the reservation and the push share one lock with
  // shutdown(), so an accepted task is always queued before the workers
  // are told to drain and exit.
  std::lock_guard<std::mutex> lock(activeMutex_);
  if (shutdown_.load()) {
    throw TransferError(TransferErrorKind::INTERNAL,
                        "transfer service is shutting down");
  }
  {
    auto it = activeDestinations_.find(task.destinationKey);
    if (it != activeDestinations_.end()) {
      auto active = it->second.lock();
      std::string activeId = active ? active->jobId() : "unknown";
      Logger::warning(LogCategory::TRANSFER, "TransferService::submit",
                      "Rejected job " + task.job.id + ": " +
                          job.destination.describe() +
                          " is in use by job " + activeId);
      throw TransferError(TransferErrorKind::DESTINATION_BUSY,
                          job.destination.describe() +
                              " is already the destination of job " +
                              activeId);
    }
    activeDestinations_[task.destinationKey] = task.handle;
  }

  Logger::info(LogCategory::TRANSFER, "TransferService::submit",
               "Queued job " + handle->jobId() + " -> " +
                   job.destination.describe());
  tasks_.push(std::move(task));
  return handle;
}

bool TransferService::isDestinationActive(
    const EndpointDescriptor &destination) const {
  std::lock_guard<std::mutex> lock(activeMutex_);
  return activeDestinations_.count(destination.key()) > 0;
}

size_t TransferService::activeJobs() const {
  std::lock_guard<std::mutex> lock(activeMutex_);
  return activeDestinations_.size();
}

void TransferService::releaseDestination(const std::string &key) {
  std::lock_guard<std::mutex> lock(activeMutex_);
  activeDestinations_.erase(key);
}

void TransferService::workerThread(size_t workerId) {
  Logger::debug(LogCategory::TRANSFER, "TransferService",
                "Worker #" + std::to_string(workerId) + " started");

  while (true) {
    Task task;
    if (!tasks_.popBlocking(task))
      break;
    execute(task);
  }

  Logger::debug(LogCategory::TRANSFER, "TransferService",
                "Worker #" + std::to_string(workerId) + " stopped");
}

// Resolves the pipeline if the job came without one, runs it and publishes
// the outcome. The destination is released before completion callbacks run
// so a callback may resubmit to the same place.
void TransferService::execute(Task &task) {
  task.handle->markRunning();
  TransferOutcome outcome;

  try {
    if (!task.pipeline)
      task.pipeline = factory_->createPipeline(task.job);
    outcome = task.pipeline->run(task.job, task.handle->progress(),
                                 task.handle->cancellationToken());
  } catch (const TransferError &e) {
    outcome.state = TransferState::FAILED;
    outcome.fatalKind = e.kind();
    outcome.fatalMessage = e.what();
    Logger::error(LogCategory::TRANSFER, "TransferService::execute",
                  "Job " + task.job.id + " could not run (" +
                      transferErrorKindName(e.kind()) + "): " + e.what());
  } catch (const std::exception &e) {
    outcome.state = TransferState::FAILED;
    outcome.fatalKind = TransferErrorKind::INTERNAL;
    outcome.fatalMessage = e.what();
    Logger::error(LogCategory::TRANSFER, "TransferService::execute",
                  "Job " + task.job.id +
                      " failed unexpectedly: " + std::string(e.what()));
  }

  task.pipeline.reset();
  releaseDestination(task.destinationKey);
  task.handle->complete(std::move(outcome));
}

void TransferService::shutdown() {
  {
    std::lock_guard<std::mutex> lock(activeMutex_);
    if (shutdown_.exchange(true))
      return;

    Logger::info(LogCategory::TRANSFER, "TransferService",
                 "Shutting down, cancelling active jobs");
    for (auto &entry : activeDestinations_) {
      if (auto handle = entry.second.lock())
        handle->cancel();
    }
  }

  tasks_.shutdown_queue();
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
}
