#include "tools/archive_progress_parser.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <sstream>
#include <vector>

namespace {

// "db.coll" -> "coll"; names without a dot are returned unchanged.
std::string collectionName(const std::string &qualified) {
  size_t dot = qualified.find('.');
  return dot == std::string::npos ? qualified : qualified.substr(dot + 1);
}

std::optional<uint64_t> parseCount(const std::string &text) {
  if (text.empty())
    return std::nullopt;
  for (char c : text) {
    if (c < '0' || c > '9')
      return std::nullopt;
  }
  return std::strtoull(text.c_str(), nullptr, 10);
}

std::vector<std::string> splitWhitespace(const std::string &text) {
  std::istringstream iss(text);
  std::vector<std::string> parts;
  std::string part;
  while (iss >> part)
    parts.push_back(part);
  return parts;
}

std::optional<ArchiveEvent> parseProgressBar(ArchiveDirection direction,
                                             const std::string &content) {
  std::vector<std::string> parts = splitWhitespace(content);
  if (parts.size() < 4)
    return std::nullopt;

  std::string counts = parts[2];
  size_t slash = counts.find('/');
  if (slash == std::string::npos)
    return std::nullopt;

  ArchiveEvent event;
  event.kind = ArchiveEventKind::PROGRESS;
  event.collection = collectionName(parts[1]);

  std::string current = counts.substr(0, slash);
  std::string total = counts.substr(slash + 1);
  std::optional<uint64_t> cur, tot;
  if (direction == ArchiveDirection::DUMP) {
    cur = parseCount(current);
    tot = parseCount(total);
  } else {
    cur = ArchiveProgressParser::parseSize(current);
    tot = ArchiveProgressParser::parseSize(total);
  }
  if (!cur || !tot)
    return std::nullopt;
  event.current = *cur;
  event.total = *tot;

  std::string percent = parts[3];
  if (StringUtils::startsWith(percent, "("))
    percent.erase(0, 1);
  if (StringUtils::endsWith(percent, "%)"))
    percent.resize(percent.size() - 2);
  event.percent = std::strtod(percent.c_str(), nullptr);
  return event;
}

} // namespace

std::optional<uint64_t> ArchiveProgressParser::parseSize(const std::string &text) {
  size_t end = 0;
  while (end < text.size() &&
         ((text[end] >= '0' && text[end] <= '9') || text[end] == '.'))
    ++end;
  if (end == 0)
    return std::nullopt;

  double value = std::strtod(text.substr(0, end).c_str(), nullptr);
  std::string unit = text.substr(end);
  double factor = 1.0;
  if (unit == "B" || unit.empty())
    factor = 1.0;
  else if (unit == "KB")
    factor = 1e3;
  else if (unit == "MB")
    factor = 1e6;
  else if (unit == "GB")
    factor = 1e9;
  else if (unit == "TB")
    factor = 1e12;
  else
    return std::nullopt;
  return static_cast<uint64_t>(value * factor + 0.5);
}

std::optional<ArchiveEvent>
ArchiveProgressParser::parse(ArchiveDirection direction,
                             const std::string &line) {
  size_t tab = line.find('\t');
  if (tab == std::string::npos)
    return std::nullopt;
  std::string content = StringUtils::trim(line.substr(tab + 1));

  const std::string startPrefix =
      direction == ArchiveDirection::DUMP ? "writing " : "restoring ";
  const std::string startSeparator =
      direction == ArchiveDirection::DUMP ? " to " : " from ";
  const std::string donePrefix = direction == ArchiveDirection::DUMP
                                     ? "done dumping "
                                     : "finished restoring ";

  if (StringUtils::startsWith(content, startPrefix)) {
    std::string rest = content.substr(startPrefix.size());
    size_t sep = rest.find(startSeparator);
    ArchiveEvent event;
    event.kind = ArchiveEventKind::STARTED;
    event.collection =
        collectionName(sep == std::string::npos ? rest : rest.substr(0, sep));
    return event;
  }

  if (StringUtils::startsWith(content, "[") &&
      content.find('/') != std::string::npos) {
    return parseProgressBar(direction, content);
  }

  if (StringUtils::startsWith(content, donePrefix)) {
    std::string rest = content.substr(donePrefix.size());
    size_t paren = rest.find(" (");
    if (paren == std::string::npos)
      return std::nullopt;

    ArchiveEvent event;
    event.kind = ArchiveEventKind::COMPLETED;
    event.collection = collectionName(rest.substr(0, paren));

    std::vector<std::string> parts = splitWhitespace(rest.substr(paren + 2));
    if (parts.empty())
      return std::nullopt;
    auto documents = parseCount(parts[0]);
    if (!documents)
      return std::nullopt;
    event.documents = *documents;
    // "500 documents, 3 failures)"
    if (parts.size() >= 3) {
      if (auto failures = parseCount(parts[2]))
        event.failures = *failures;
    }
    event.percent = 100.0;
    return event;
  }

  return std::nullopt;
}
