#ifndef ENDPOINT_FACTORY_H
#define ENDPOINT_FACTORY_H

#include "transfer/transfer_job.h"
#include "transfer/transfer_pipeline.h"
#include <memory>

// Resolves a job's endpoint descriptors into a ready-to-run pipeline.
// Called on the worker thread, so implementations may connect to servers
// and touch the filesystem. Failures are reported as TransferError
// (SOURCE_UNAVAILABLE, DESTINATION_UNAVAILABLE, MALFORMED_JOB, ...).
class IEndpointFactory {
public:
  virtual ~IEndpointFactory() = default;

  virtual std::unique_ptr<TransferPipeline>
  createPipeline(const TransferJob &job) = 0;
};

#endif
