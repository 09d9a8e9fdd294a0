#include "core/engine_config.h"
#include "core/logger.h"
#include "core/transfer_config.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Defaults used when no configuration file or environment variables are
// provided: INFO level, console logging only, empty null sentinel and tool
// lookup on PATH.
std::string EngineConfig::log_level_ = "INFO";
std::string EngineConfig::log_file_ = "";
uintmax_t EngineConfig::log_max_file_size_ = 10 * 1024 * 1024;
int EngineConfig::log_max_backup_files_ = 5;
std::string EngineConfig::null_sentinel_ = "";
std::string EngineConfig::tools_directory_ = "";
bool EngineConfig::initialized_ = false;
std::mutex EngineConfig::configMutex_;

namespace {
bool parseSize(const char *text, size_t &out) {
  if (!text || !*text)
    return false;
  for (const char *p = text; *p; ++p) {
    if (!std::isdigit(static_cast<unsigned char>(*p)))
      return false;
  }
  try {
    out = static_cast<size_t>(std::stoull(text));
    return true;
  } catch (const std::exception &) {
    return false;
  }
}
} // namespace

// Forwards one numeric knob to TransferConfig. Out-of-range values are
// reported and the previous value is kept.
void EngineConfig::applyTransferSetting(const char *key, size_t value) {
  try {
    std::string name(key);
    if (name == "batch_size")
      TransferConfig::setBatchSize(value);
    else if (name == "max_recorded_errors")
      TransferConfig::setMaxRecordedErrors(value);
    else if (name == "csv_sample_size")
      TransferConfig::setCsvSampleSize(value);
    else if (name == "progress_capacity")
      TransferConfig::setProgressCapacity(value);
    else if (name == "max_workers")
      TransferConfig::setMaxWorkers(value);
    else if (name == "max_depth")
      TransferConfig::setFlattenMaxDepth(value);
    else if (name == "max_array_width")
      TransferConfig::setFlattenMaxArrayWidth(value);
  } catch (const std::invalid_argument &e) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig",
                    std::string("Ignoring ") + key + ": " + e.what());
  }
}

// Loads engine configuration from a JSON file. Recognized sections are
// "logging" (level, file, max_file_size, max_backup_files), "transfer"
// (batch_size, max_recorded_errors, csv_sample_size, progress_capacity,
// max_workers), "flatten" (max_depth, max_array_width, null_sentinel) and
// "tools" (directory). Missing keys keep their defaults. If the file cannot
// be opened or parsed the function falls back to environment variables.
void EngineConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "EngineConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
    loadFromEnv();
    return;
  }

  try {
    json config;
    configFile >> config;

    std::lock_guard<std::mutex> lock(configMutex_);
    if (config.contains("logging")) {
      const auto &logging = config["logging"];
      if (logging.contains("level"))
        log_level_ = logging["level"].get<std::string>();
      if (logging.contains("file"))
        log_file_ = logging["file"].get<std::string>();
      if (logging.contains("max_file_size"))
        log_max_file_size_ = logging["max_file_size"].get<uintmax_t>();
      if (logging.contains("max_backup_files"))
        log_max_backup_files_ = logging["max_backup_files"].get<int>();
    }

    if (config.contains("transfer")) {
      const auto &transfer = config["transfer"];
      for (const char *key : {"batch_size", "max_recorded_errors",
                              "csv_sample_size", "progress_capacity",
                              "max_workers"}) {
        if (transfer.contains(key))
          applyTransferSetting(key, transfer[key].get<size_t>());
      }
    }

    if (config.contains("flatten")) {
      const auto &flatten = config["flatten"];
      for (const char *key : {"max_depth", "max_array_width"}) {
        if (flatten.contains(key))
          applyTransferSetting(key, flatten[key].get<size_t>());
      }
      if (flatten.contains("null_sentinel"))
        null_sentinel_ = flatten["null_sentinel"].get<std::string>();
    }

    if (config.contains("tools") && config["tools"].contains("directory"))
      tools_directory_ = config["tools"]["directory"].get<std::string>();

    initialized_ = true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CONFIG, "EngineConfig",
                  "Error loading config from file: " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnv();
  }
}

// Loads configuration from DOCTRANSFER_LOG_LEVEL, DOCTRANSFER_LOG_FILE,
// DOCTRANSFER_BATCH_SIZE, DOCTRANSFER_MAX_ERRORS and DOCTRANSFER_TOOLS_DIR.
// Unset variables keep the current value.
void EngineConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

void EngineConfig::loadFromEnvUnlocked() {
  const char *level = std::getenv("DOCTRANSFER_LOG_LEVEL");
  const char *file = std::getenv("DOCTRANSFER_LOG_FILE");
  const char *batch = std::getenv("DOCTRANSFER_BATCH_SIZE");
  const char *maxErrors = std::getenv("DOCTRANSFER_MAX_ERRORS");
  const char *tools = std::getenv("DOCTRANSFER_TOOLS_DIR");

  if (level && strlen(level) > 0)
    log_level_ = level;
  if (file && strlen(file) > 0)
    log_file_ = file;
  if (tools && strlen(tools) > 0)
    tools_directory_ = tools;

  size_t value = 0;
  if (batch) {
    if (parseSize(batch, value))
      applyTransferSetting("batch_size", value);
    else
      Logger::warning(LogCategory::CONFIG, "EngineConfig",
                      "Invalid DOCTRANSFER_BATCH_SIZE: " + std::string(batch));
  }
  if (maxErrors) {
    if (parseSize(maxErrors, value))
      applyTransferSetting("max_recorded_errors", value);
    else
      Logger::warning(LogCategory::CONFIG, "EngineConfig",
                      "Invalid DOCTRANSFER_MAX_ERRORS: " +
                          std::string(maxErrors));
  }

  initialized_ = true;
}

void EngineConfig::resetDefaults() {
  std::lock_guard<std::mutex> lock(configMutex_);
  log_level_ = "INFO";
  log_file_.clear();
  log_max_file_size_ = 10 * 1024 * 1024;
  log_max_backup_files_ = 5;
  null_sentinel_.clear();
  tools_directory_.clear();
  initialized_ = false;
  TransferConfig::resetDefaults();
}
