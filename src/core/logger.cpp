#include "core/logger.h"
#include "core/console_log_writer.h"
#include "core/engine_config.h"
#include "core/file_log_writer.h"
#include <algorithm>
#include <iostream>

// Static member initialization for Logger class. writers_ holds every active
// log sink, logMutex serializes writer registration and dispatch.
std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex;

// currentLogLevel determines the minimum log level that will be written.
// consoleFallback routes messages to stderr while no writer is registered,
// so library users that never call initialize() still see warnings.
LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::consoleFallback = true;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},     {"CONFIG", LogCategory::CONFIG},
    {"TRANSFER", LogCategory::TRANSFER}, {"CODEC", LogCategory::CODEC},
    {"FLATTEN", LogCategory::FLATTEN},   {"DATABASE", LogCategory::DATABASE},
    {"TOOLS", LogCategory::TOOLS}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  bool fallback;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
    fallback = consoleFallback;
  }

  if (level < minLevel) {
    return;
  }

  std::string line =
      formatLogMessage(getCurrentTimestamp(), getLevelString(level),
                       getCategoryString(category), function, message);

  std::lock_guard<std::mutex> lock(logMutex);
  if (writers_.empty()) {
    if (fallback) {
      std::cerr << line << std::endl;
    }
    return;
  }

  for (auto &writer : writers_) {
    if (writer->isOpen() && !writer->write(line)) {
      std::cerr << "Log writer failed: " << line << std::endl;
    }
  }
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  if (!writer) {
    return;
  }
  std::lock_guard<std::mutex> lock(logMutex);
  writers_.push_back(std::move(writer));
}

void Logger::clearWriters() {
  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    writer->close();
  }
  writers_.clear();
}

// Sets the logger configuration to default values: LogLevel::INFO with the
// stderr fallback enabled.
void Logger::setDefaultConfig() {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = LogLevel::INFO;
  consoleFallback = true;
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Sets the current log level from a string representation. The function
// accepts "DEBUG", "INFO", "WARN"/"WARNING", "ERROR", "FATAL"/"CRITICAL"
// (case-insensitive). Unknown strings leave the level unchanged.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}

// Initializes the Logger from EngineConfig. The level comes from the
// logging section; a console writer is always registered and a rotating
// file writer is added when a log file is configured. If the file cannot be
// opened logging continues on the console only. Errors during initialization
// go to stderr since the logger may not be fully set up yet.
void Logger::initialize() {
  setLogLevel(EngineConfig::getLogLevel());

  clearWriters();
  addWriter(std::make_unique<ConsoleLogWriter>());

  std::string logFile = EngineConfig::getLogFile();
  if (logFile.empty()) {
    return;
  }

  try {
    auto fileWriter = std::make_unique<FileLogWriter>(
        logFile, EngineConfig::getLogMaxFileSize(),
        EngineConfig::getLogMaxBackupFiles());
    if (!fileWriter->isOpen()) {
      std::cerr << "Warning: cannot open log file " << logFile
                << ". Logging to file will be disabled." << std::endl;
      return;
    }
    addWriter(std::move(fileWriter));
  } catch (const std::exception &e) {
    std::cerr << "Error initializing file log writer: " << e.what()
              << std::endl;
  }
}
