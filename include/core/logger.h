#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <chrono>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  CONFIG = 1,
  TRANSFER = 2,
  CODEC = 3,
  FLATTEN = 4,
  DATABASE = 5,
  TOOLS = 6,
  UNKNOWN = 99
};

class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static bool consoleFallback;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message) {
    std::ostringstream oss;
    oss << "[" << timestamp << "] [" << levelStr << "] [" << categoryStr << "]";
    if (!function.empty()) {
      oss << " [" << function << "]";
    }
    oss << " " << message;
    return oss.str();
  }

  static std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    localtime_r(&time_t, &tm_buf);
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
  }

  static std::string getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string getCategoryString(LogCategory category) {
    switch (category) {
    case LogCategory::SYSTEM:
      return "SYSTEM";
    case LogCategory::CONFIG:
      return "CONFIG";
    case LogCategory::TRANSFER:
      return "TRANSFER";
    case LogCategory::CODEC:
      return "CODEC";
    case LogCategory::FLATTEN:
      return "FLATTEN";
    case LogCategory::DATABASE:
      return "DATABASE";
    case LogCategory::TOOLS:
      return "TOOLS";
    default:
      return "UNKNOWN";
    }
  }

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function, const std::string &message);

  static LogLevel stringToLogLevel(const std::string &levelStr) {
    auto it = levelMap.find(levelStr);
    return (it != levelMap.end()) ? it->second : LogLevel::INFO;
  }

public:
  static void initialize();

  static void addWriter(std::unique_ptr<ILogWriter> writer);
  static void clearWriters();

  static void shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    for (auto &writer : writers_) {
      writer->close();
    }
    writers_.clear();
  }

  static void debug(const std::string &message) {
    writeLog(LogLevel::DEBUG, LogCategory::SYSTEM, "", message);
  }

  static void info(const std::string &message) {
    writeLog(LogLevel::INFO, LogCategory::SYSTEM, "", message);
  }

  static void warning(const std::string &message) {
    writeLog(LogLevel::WARNING, LogCategory::SYSTEM, "", message);
  }

  static void error(const std::string &message) {
    writeLog(LogLevel::ERROR, LogCategory::SYSTEM, "", message);
  }

  static void critical(const std::string &message) {
    writeLog(LogLevel::CRITICAL, LogCategory::SYSTEM, "", message);
  }

  // Categorized logging methods
  static void debug(LogCategory category, const std::string &message) {
    writeLog(LogLevel::DEBUG, category, "", message);
  }

  static void info(LogCategory category, const std::string &message) {
    writeLog(LogLevel::INFO, category, "", message);
  }

  static void warning(LogCategory category, const std::string &message) {
    writeLog(LogLevel::WARNING, category, "", message);
  }

  static void error(LogCategory category, const std::string &message) {
    writeLog(LogLevel::ERROR, category, "", message);
  }

  static void critical(LogCategory category, const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, "", message);
  }

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void log(LogLevel level, LogCategory category,
                  const std::string &function, const std::string &message) {
    writeLog(level, category, function, message);
  }

  // Configuration management
  static void setDefaultConfig();
  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
  static std::string categoryName(LogCategory category) {
    return getCategoryString(category);
  }
  static LogCategory stringToCategory(const std::string &categoryStr) {
    auto it = categoryMap.find(categoryStr);
    return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
  }
};

#endif
