#ifndef MONGODB_ENDPOINT_FACTORY_H
#define MONGODB_ENDPOINT_FACTORY_H

#include "engines/mongodb_engine.h"
#include "transfer/endpoint_factory.h"
#include <memory>
#include <string>
#include <vector>

// Resolves FILE and MONGODB descriptors:
//   MONGODB -> FILE     export (one file per collection for DATABASE scope)
//   FILE -> MONGODB     import (every data file of a directory for DATABASE)
//   MONGODB -> MONGODB  copy, with optional index copy
// Archive jobs are handed to mongodump/mongorestore.
class MongoEndpointFactory : public IEndpointFactory {
public:
  std::unique_ptr<TransferPipeline>
  createPipeline(const TransferJob &job) override;

  // "<db>_<collection>.<ext>[.gz]"
  static std::string exportFileName(const std::string &database,
                                    const std::string &collection,
                                    TransferFormat format, bool gzip);
  // Target collection for an imported file: the file name without its
  // extensions and without a leading "<db>_".
  static std::string collectionForFile(const std::string &path,
                                       const std::string &database);

private:
  std::shared_ptr<MongoDBEngine> connect(const EndpointDescriptor &endpoint,
                                         TransferErrorKind failure);
  std::vector<std::string> selectCollections(MongoDBEngine &engine,
                                             const EndpointDescriptor &source);

  std::vector<TransferUnit> exportUnits(const TransferJob &job);
  std::vector<TransferUnit> importUnits(const TransferJob &job);
  std::vector<TransferUnit> copyUnits(const TransferJob &job);
  std::unique_ptr<TransferPipeline> archivePipeline(const TransferJob &job);
};

#endif
