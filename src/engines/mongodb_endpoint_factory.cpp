#include "engines/mongodb_endpoint_factory.h"
#include "engines/mongodb_endpoints.h"
#include "tools/external_archive_tool.h"
#include "tools/tool_locator.h"
#include "transfer/stream_endpoints.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::string MongoEndpointFactory::exportFileName(const std::string &database,
                                                 const std::string &collection,
                                                 TransferFormat format,
                                                 bool gzip) {
  return database + "_" + collection + "." + formatExtension(format) +
         (gzip ? ".gz" : "");
}

std::string MongoEndpointFactory::collectionForFile(const std::string &path,
                                                    const std::string &database) {
  std::string name = fs::path(path).filename().string();
  if (StringUtils::endsWith(StringUtils::toLower(name), ".gz"))
    name.resize(name.size() - 3);
  size_t dot = name.rfind('.');
  if (dot != std::string::npos && dot > 0)
    name.resize(dot);
  std::string prefix = database + "_";
  if (!database.empty() && StringUtils::startsWith(name, prefix) &&
      name.size() > prefix.size())
    name.erase(0, prefix.size());
  return name;
}

std::shared_ptr<MongoDBEngine>
MongoEndpointFactory::connect(const EndpointDescriptor &endpoint,
                              TransferErrorKind failure) {
  if (endpoint.database.empty()) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "MongoDB endpoint has no database");
  }
  auto engine = std::make_shared<MongoDBEngine>(endpoint.connectionString);
  if (!engine->isValid()) {
    throw TransferError(failure, "cannot connect to " + endpoint.describe() +
                                     ": " + engine->lastError());
  }
  return engine;
}

std::vector<std::string>
MongoEndpointFactory::selectCollections(MongoDBEngine &engine,
                                        const EndpointDescriptor &source) {
  std::vector<std::string> selected;
  for (auto &name : engine.listCollections(source.database)) {
    if (std::find(source.excludeCollections.begin(),
                  source.excludeCollections.end(),
                  name) != source.excludeCollections.end())
      continue;
    selected.push_back(std::move(name));
  }
  return selected;
}

std::vector<TransferUnit>
MongoEndpointFactory::exportUnits(const TransferJob &job) {
  const EndpointDescriptor &source = job.source;
  const TransferOptions &options = job.options;
  auto engine = connect(source, TransferErrorKind::SOURCE_UNAVAILABLE);
  std::vector<TransferUnit> units;

  if (job.scope == TransferScope::COLLECTION) {
    if (source.collection.empty()) {
      throw TransferError(TransferErrorKind::MALFORMED_JOB,
                          "collection export needs a source collection");
    }
    TransferUnit unit;
    unit.label = source.collection;
    unit.source = std::make_unique<MongoCollectionSource>(
        engine, source.database, source.collection, source.filter,
        source.projection, source.sort);
    unit.sink = StreamDocumentSink::toFile(job.destination.path, job.format,
                                           options.codecOptions(),
                                           options.gzip);
    units.push_back(std::move(unit));
    return units;
  }

  std::error_code ec;
  fs::create_directories(job.destination.path, ec);
  if (ec) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "cannot create directory " + job.destination.path +
                            ": " + ec.message());
  }

  for (const auto &collection : selectCollections(*engine, source)) {
    TransferUnit unit;
    unit.label = collection;
    unit.source = std::make_unique<MongoCollectionSource>(
        engine, source.database, collection, source.filter,
        source.projection, source.sort);
    std::string file = (fs::path(job.destination.path) /
                        exportFileName(source.database, collection,
                                       job.format, options.gzip))
                           .string();
    unit.sink = StreamDocumentSink::toFile(file, job.format,
                                           options.codecOptions(),
                                           options.gzip);
    units.push_back(std::move(unit));
  }
  return units;
}

std::vector<TransferUnit>
MongoEndpointFactory::importUnits(const TransferJob &job) {
  const EndpointDescriptor &destination = job.destination;
  const TransferOptions &options = job.options;
  std::vector<TransferUnit> units;

  if (job.scope == TransferScope::COLLECTION) {
    if (!fs::is_regular_file(job.source.path)) {
      throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                          "input file not found: " + job.source.path);
    }
    auto engine = connect(destination,
                          TransferErrorKind::DESTINATION_UNAVAILABLE);
    std::string collection =
        destination.collection.empty()
            ? collectionForFile(job.source.path, destination.database)
            : destination.collection;
    TransferUnit unit;
    unit.label = collection;
    unit.source = StreamDocumentSource::fromFile(job.source.path, job.format,
                                                 options.codecOptions());
    unit.sink = std::make_unique<MongoCollectionSink>(
        engine, destination.database, collection, options.insertMode);
    units.push_back(std::move(unit));
    return units;
  }

  if (!fs::is_directory(job.source.path)) {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "input directory not found: " + job.source.path);
  }

  std::vector<fs::path> files;
  for (const auto &entry : fs::directory_iterator(job.source.path)) {
    if (!entry.is_regular_file())
      continue;
    auto format = formatFromExtension(entry.path().string());
    if (!format || *format == TransferFormat::BSON_ARCHIVE)
      continue;
    files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  if (files.empty()) {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "no JSON or CSV files in " + job.source.path);
  }

  auto engine = connect(destination,
                        TransferErrorKind::DESTINATION_UNAVAILABLE);
  for (const auto &file : files) {
    std::string collection =
        collectionForFile(file.string(), destination.database);
    TransferUnit unit;
    unit.label = collection;
    unit.source = StreamDocumentSource::fromFile(
        file.string(), *formatFromExtension(file.string()),
        options.codecOptions());
    unit.sink = std::make_unique<MongoCollectionSink>(
        engine, destination.database, collection, options.insertMode);
    units.push_back(std::move(unit));
  }
  return units;
}

std::vector<TransferUnit>
MongoEndpointFactory::copyUnits(const TransferJob &job) {
  const EndpointDescriptor &source = job.source;
  const EndpointDescriptor &destination = job.destination;
  const TransferOptions &options = job.options;

  auto sourceEngine = connect(source, TransferErrorKind::SOURCE_UNAVAILABLE);
  auto targetEngine =
      connect(destination, TransferErrorKind::DESTINATION_UNAVAILABLE);

  std::vector<std::pair<std::string, std::string>> pairs;
  if (job.scope == TransferScope::COLLECTION) {
    if (source.collection.empty()) {
      throw TransferError(TransferErrorKind::MALFORMED_JOB,
                          "collection copy needs a source collection");
    }
    pairs.emplace_back(source.collection, destination.collection.empty()
                                              ? source.collection
                                              : destination.collection);
  } else {
    for (const auto &name : selectCollections(*sourceEngine, source))
      pairs.emplace_back(name, name);
  }

  std::vector<TransferUnit> units;
  for (const auto &pair : pairs) {
    TransferUnit unit;
    unit.label = pair.first;
    unit.source = std::make_unique<MongoCollectionSource>(
        sourceEngine, source.database, pair.first, source.filter,
        source.projection, source.sort);
    unit.sink = std::make_unique<MongoCollectionSink>(
        targetEngine, destination.database, pair.second, options.insertMode);
    if (options.copyIndexes) {
      std::string sourceDb = source.database;
      std::string targetDb = destination.database;
      std::string from = pair.first;
      std::string to = pair.second;
      unit.afterCompletion = [sourceEngine, targetEngine, sourceDb, targetDb,
                              from, to]() {
        sourceEngine->copyIndexes(sourceDb, from, *targetEngine, targetDb, to);
      };
    }
    units.push_back(std::move(unit));
  }
  return units;
}

std::unique_ptr<TransferPipeline>
MongoEndpointFactory::archivePipeline(const TransferJob &job) {
  ArchiveDirection direction = ArchiveCommandBuilder::directionOf(job);
  const char *tool = ArchiveCommandBuilder::toolName(direction);
  auto toolPath = ToolLocator::find(tool);
  if (!toolPath) {
    throw TransferError(TransferErrorKind::EXTERNAL_TOOL,
                        std::string(tool) + " is not installed");
  }
  return std::make_unique<TransferPipeline>(
      std::make_unique<ExternalArchiveTool>(),
      ArchiveCommandBuilder::build(job, *toolPath));
}

std::unique_ptr<TransferPipeline>
MongoEndpointFactory::createPipeline(const TransferJob &job) {
  const EndpointKind from = job.source.kind;
  const EndpointKind to = job.destination.kind;

  if (from == EndpointKind::MONGODB && to == EndpointKind::MONGODB)
    return std::make_unique<TransferPipeline>(copyUnits(job));

  if (job.format == TransferFormat::BSON_ARCHIVE)
    return archivePipeline(job);

  if (from == EndpointKind::MONGODB && to == EndpointKind::FILE)
    return std::make_unique<TransferPipeline>(exportUnits(job));
  if (from == EndpointKind::FILE && to == EndpointKind::MONGODB)
    return std::make_unique<TransferPipeline>(importUnits(job));

  throw TransferError(TransferErrorKind::MALFORMED_JOB,
                      "unsupported transfer from " + job.source.describe() +
                          " to " + job.destination.describe());
}
