#ifndef TOOL_LOCATOR_H
#define TOOL_LOCATOR_H

#include <optional>
#include <string>

// Finds the external dump/restore binaries. Lookup order: the configured
// tools directory (EngineConfig), resources/bin/<platform>/ relative to the
// working directory, then every entry of PATH.
class ToolLocator {
public:
  static std::optional<std::string> find(const std::string &name);
  static bool isExecutable(const std::string &path);
  // "linux-x86_64", "linux-arm64", "macos-arm64", ... or "unknown".
  static std::string platformDirectory();
};

#endif
