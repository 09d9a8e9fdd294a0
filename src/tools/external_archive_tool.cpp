#include "tools/external_archive_tool.h"
#include "core/logger.h"
#include "transfer/transfer_errors.h"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void emitLines(std::string &pending, const LineCallback &onLine) {
  size_t start = 0;
  size_t newline;
  while ((newline = pending.find('\n', start)) != std::string::npos) {
    std::string line = pending.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (onLine)
      onLine(line);
    start = newline + 1;
  }
  pending.erase(0, start);
}

} // namespace

int ExternalArchiveTool::run(const std::vector<std::string> &argv,
                             const LineCallback &onLine,
                             const CancellationToken &cancel) {
  if (argv.empty()) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "external tool command is empty");
  }

  std::vector<char *> cargs;
  cargs.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    cargs.push_back(const_cast<char *>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  // Built before fork: the child may only make async-signal-safe calls.
  const std::string execFailure = "failed to execute " + argv[0] + ": errno ";

  int fds[2];
  if (pipe(fds) != 0) {
    throw TransferError(TransferErrorKind::EXTERNAL_TOOL,
                        std::string("Failed to create pipe: ") +
                            std::strerror(errno));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    throw TransferError(TransferErrorKind::EXTERNAL_TOOL,
                        std::string("Failed to fork process: ") +
                            std::strerror(err));
  }

  if (pid == 0) {
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    close(fds[0]);
    close(fds[1]);
    execvp(cargs[0], cargs.data());
    int err = errno;
    char digits[16];
    size_t pos = sizeof(digits);
    digits[--pos] = '\n';
    do {
      digits[--pos] = static_cast<char>('0' + err % 10);
      err /= 10;
    } while (err > 0 && pos > 0);
    ssize_t ignored =
        write(STDERR_FILENO, execFailure.data(), execFailure.size());
    ignored = write(STDERR_FILENO, digits + pos, sizeof(digits) - pos);
    (void)ignored;
    _exit(127);
  }

  close(fds[1]);
  Logger::info(LogCategory::TOOLS, "ExternalArchiveTool::run",
               "Started " + argv[0] + " (pid " + std::to_string(pid) + ")");

  std::string pending;
  bool terminated = false;
  char buffer[4096];

  while (true) {
    if (!terminated && cancel.isCancelled()) {
      Logger::warning(LogCategory::TOOLS, "ExternalArchiveTool::run",
                      "Cancellation requested, terminating pid " +
                          std::to_string(pid));
      kill(pid, SIGTERM);
      terminated = true;
    }

    struct pollfd pfd;
    pfd.fd = fds[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, pollIntervalMs_);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      Logger::error(LogCategory::TOOLS, "ExternalArchiveTool::run",
                    std::string("poll failed: ") + std::strerror(errno));
      break;
    }
    if (ready == 0)
      continue;

    ssize_t n = read(fds[0], buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      Logger::error(LogCategory::TOOLS, "ExternalArchiveTool::run",
                    std::string("read failed: ") + std::strerror(errno));
      break;
    }
    if (n == 0)
      break;
    pending.append(buffer, static_cast<size_t>(n));
    emitLines(pending, onLine);
  }
  close(fds[0]);

  if (!pending.empty() && onLine)
    onLine(pending);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw TransferError(TransferErrorKind::EXTERNAL_TOOL,
                          std::string("waitpid failed: ") +
                              std::strerror(errno));
    }
  }

  int exitCode;
  if (WIFEXITED(status)) {
    exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exitCode = 128 + WTERMSIG(status);
  } else {
    exitCode = -1;
  }

  Logger::info(LogCategory::TOOLS, "ExternalArchiveTool::run",
               argv[0] + " exited with code " + std::to_string(exitCode));
  return exitCode;
}
