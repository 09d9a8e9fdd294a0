#include "tools/archive_tool.h"
#include "transfer/transfer_errors.h"
#include "utils/string_utils.h"
#include <filesystem>

ArchiveDirection ArchiveCommandBuilder::directionOf(const TransferJob &job) {
  if (job.source.kind == EndpointKind::MONGODB &&
      job.destination.kind == EndpointKind::FILE)
    return ArchiveDirection::DUMP;
  if (job.source.kind == EndpointKind::FILE &&
      job.destination.kind == EndpointKind::MONGODB)
    return ArchiveDirection::RESTORE;
  throw TransferError(TransferErrorKind::MALFORMED_JOB,
                      "archive transfers need a MongoDB endpoint and a file "
                      "endpoint");
}

const char *ArchiveCommandBuilder::toolName(ArchiveDirection direction) {
  return direction == ArchiveDirection::DUMP ? "mongodump" : "mongorestore";
}

std::string ArchiveCommandBuilder::archivePath(const std::string &path) {
  std::filesystem::path p(path);
  if (p.extension() == ".archive")
    return path;
  return p.replace_extension(".archive").string();
}

ArchiveCommand ArchiveCommandBuilder::build(const TransferJob &job,
                                            const std::string &toolPath) {
  ArchiveCommand command;
  command.direction = directionOf(job);

  const EndpointDescriptor &mongo = command.direction == ArchiveDirection::DUMP
                                        ? job.source
                                        : job.destination;
  const EndpointDescriptor &file = command.direction == ArchiveDirection::DUMP
                                       ? job.destination
                                       : job.source;

  if (mongo.connectionString.empty() || mongo.database.empty()) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "archive transfer requires a connection string and "
                        "a database");
  }
  if (file.path.empty()) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "archive transfer requires a file path");
  }

  std::vector<std::string> &args = command.argv;
  args.push_back(toolPath);
  args.push_back("--uri");
  args.push_back(mongo.connectionString);
  args.push_back("--db");
  args.push_back(mongo.database);
  args.push_back("-v");

  command.label = mongo.database;

  if (command.direction == ArchiveDirection::DUMP) {
    if (job.scope == TransferScope::COLLECTION && !mongo.collection.empty()) {
      args.push_back("--collection");
      args.push_back(mongo.collection);
      command.label = mongo.collection;
    }
    if (job.options.gzip)
      args.push_back("--gzip");
    for (const auto &excluded : mongo.excludeCollections) {
      args.push_back("--excludeCollection");
      args.push_back(excluded);
    }
    if (job.options.archiveAsFolder) {
      args.push_back("--out");
      args.push_back(file.path);
    } else {
      args.push_back("--archive=" + archivePath(file.path));
    }
    return command;
  }

  if (job.options.dropBeforeRestore)
    args.push_back("--drop");
  if (job.options.gzip)
    args.push_back("--gzip");

  std::filesystem::path input(file.path);
  if (input.extension() == ".archive" ||
      !std::filesystem::is_directory(input)) {
    args.push_back("--archive=" + file.path);
  } else {
    // A folder dump nests the collections under the database name.
    std::filesystem::path nested = input / mongo.database;
    args.push_back("--dir");
    args.push_back(std::filesystem::is_directory(nested) ? nested.string()
                                                         : input.string());
  }
  return command;
}
