#ifndef TRANSFER_JOB_H
#define TRANSFER_JOB_H

#include "codecs/format_codec.h"
#include "flatten/column_discovery.h"
#include "flatten/csv_flattener.h"
#include <optional>
#include <string>
#include <vector>

enum class InsertMode { INSERT, UPSERT, REPLACE };

enum class TransferScope { COLLECTION, DATABASE };

enum class TransferState { PENDING, RUNNING, COMPLETED, FAILED, CANCELLED };

std::string insertModeName(InsertMode mode);
std::string transferStateName(TransferState state);

enum class EndpointKind { FILE, MONGODB, MEMORY };

// Where documents come from or go to. FILE uses path (a directory for
// database scope); MONGODB uses connectionString, database and, for
// collection scope, collection. filter/projection/sort are extended JSON
// applied by a MongoDB source.
struct EndpointDescriptor {
  EndpointKind kind = EndpointKind::FILE;
  std::string path;
  std::string connectionString;
  std::string database;
  std::string collection;
  std::string filter;
  std::string projection;
  std::string sort;
  std::vector<std::string> excludeCollections;
  // Identifies in-memory endpoints in keys and log lines.
  std::string label;

  static EndpointDescriptor file(const std::string &path);
  static EndpointDescriptor mongo(const std::string &connectionString,
                                  const std::string &database,
                                  const std::string &collection = "");
  static EndpointDescriptor memory(const std::string &label);

  // Identity used to reject a second concurrent run into the same place.
  // Credentials are not part of the key.
  std::string key() const;
  std::string describe() const;
};

struct TransferOptions {
  ExtendedJsonMode jsonMode = ExtendedJsonMode::RELAXED;
  bool prettyPrint = false;
  bool gzip = false;
  size_t batchSize = 1000;
  InsertMode insertMode = InsertMode::INSERT;
  bool abortOnFirstError = false;
  std::optional<uint64_t> limit;
  size_t maxRecordedErrors = 100;
  FlattenOptions flatten;
  ColumnDiscoveryMode columnDiscovery = ColumnDiscoveryMode::FULL_SCAN;
  size_t sampleSize = 1000;
  UnseenColumnPolicy unseenColumns = UnseenColumnPolicy::DROP;
  bool copyIndexes = false;
  bool dropBeforeRestore = false;
  bool archiveAsFolder = false;

  // Defaults taken from TransferConfig and EngineConfig.
  static TransferOptions fromConfig();

  CodecOptions codecOptions() const;
};

struct TransferJob {
  std::string id;
  EndpointDescriptor source;
  EndpointDescriptor destination;
  TransferFormat format = TransferFormat::JSON_LINES;
  TransferOptions options;
  TransferScope scope = TransferScope::COLLECTION;
};

#endif
