#include "tools/tool_locator.h"
#include "core/engine_config.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

bool ToolLocator::isExecutable(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
    return false;
  return access(path.c_str(), X_OK) == 0;
}

std::string ToolLocator::platformDirectory() {
#if defined(__APPLE__) && defined(__aarch64__)
  return "macos-arm64";
#elif defined(__APPLE__) && defined(__x86_64__)
  return "macos-x86_64";
#elif defined(__linux__) && defined(__x86_64__)
  return "linux-x86_64";
#elif defined(__linux__) && defined(__aarch64__)
  return "linux-arm64";
#else
  return "unknown";
#endif
}

std::optional<std::string> ToolLocator::find(const std::string &name) {
  std::string configured = EngineConfig::getToolsDirectory();
  if (!configured.empty()) {
    std::string candidate =
        (std::filesystem::path(configured) / name).string();
    if (isExecutable(candidate))
      return candidate;
  }

  std::string bundled = (std::filesystem::path("resources") / "bin" /
                         platformDirectory() / name)
                            .string();
  if (isExecutable(bundled))
    return bundled;

  const char *pathEnv = std::getenv("PATH");
  if (pathEnv) {
    for (const auto &dir : StringUtils::split(pathEnv, ':')) {
      if (dir.empty())
        continue;
      std::string candidate = (std::filesystem::path(dir) / name).string();
      if (isExecutable(candidate))
        return candidate;
    }
  }

  Logger::warning(LogCategory::TOOLS, "ToolLocator::find",
                  name + " not found in tools directory or PATH");
  return std::nullopt;
}
