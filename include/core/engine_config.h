#ifndef ENGINE_CONFIG_H
#define ENGINE_CONFIG_H

#include <cstdint>
#include <mutex>
#include <string>

// Process-wide engine settings. Numeric transfer knobs are forwarded to
// TransferConfig; everything else is held here.
class EngineConfig {
private:
  static std::string log_level_;
  static std::string log_file_;
  static uintmax_t log_max_file_size_;
  static int log_max_backup_files_;
  static std::string null_sentinel_;
  static std::string tools_directory_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void loadFromEnvUnlocked();
  static void applyTransferSetting(const char *key, size_t value);

public:
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromEnv();
  static void resetDefaults();

  static std::string getLogLevel() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return log_level_;
  }
  static std::string getLogFile() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return log_file_;
  }
  static uintmax_t getLogMaxFileSize() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return log_max_file_size_;
  }
  static int getLogMaxBackupFiles() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return log_max_backup_files_;
  }
  static std::string getNullSentinel() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return null_sentinel_;
  }
  static std::string getToolsDirectory() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return tools_directory_;
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
