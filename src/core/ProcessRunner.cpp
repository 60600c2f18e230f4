#include "core/ProcessRunner.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace ferry::core {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr int kPollSliceMs = 200;

int exitCodeFromStatus(int iStatus) {
  if (WIFEXITED(iStatus)) {
    return WEXITSTATUS(iStatus);
  }
  if (WIFSIGNALED(iStatus)) {
    return 128 + WTERMSIG(iStatus);
  }
  return iStatus;
}

/// Write the whole buffer, retrying on EINTR and short writes.
bool writeAll(int iFd, const char* pData, size_t nLen) {
  while (nLen > 0) {
    ssize_t nWritten = ::write(iFd, pData, nLen);
    if (nWritten < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    pData += nWritten;
    nLen -= static_cast<size_t>(nWritten);
  }
  return true;
}

void closeFd(int& iFd) {
  if (iFd >= 0) {
    ::close(iFd);
    iFd = -1;
  }
}

int waitForChild(pid_t pid) {
  int iStatus = 0;
  while (::waitpid(pid, &iStatus, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return exitCodeFromStatus(iStatus);
}

}  // namespace

ProcessRunner::ProcessRunner() = default;
ProcessRunner::~ProcessRunner() = default;

ProcessResult ProcessRunner::run(const ProcessSpec& psSpec) {
  auto spLog = common::Logger::get();

  if (psSpec.sCommand.empty()) {
    throw common::LaunchError("launch_failed", "Empty command");
  }

  // argv must be fully built before fork(): only async-signal-safe calls in the child
  std::vector<std::string> vArgv;
  vArgv.reserve(psSpec.vArgs.size() + 1);
  vArgv.push_back(psSpec.sCommand);
  vArgv.insert(vArgv.end(), psSpec.vArgs.begin(), psSpec.vArgs.end());
  std::vector<char*> vArgvPtrs;
  for (auto& sArg : vArgv) {
    vArgvPtrs.push_back(sArg.data());
  }
  vArgvPtrs.push_back(nullptr);

  int iLogFd = ::open(psSpec.pathLog.c_str(),
                      O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0640);
  if (iLogFd < 0) {
    throw common::LaunchError("launch_failed", "Cannot open log file " +
                                                   psSpec.pathLog.string() + ": " +
                                                   std::strerror(errno));
  }

  int vOutPipe[2] = {-1, -1};
  int vErrPipe[2] = {-1, -1};  // carries errno from a failed exec
  if (::pipe2(vOutPipe, O_CLOEXEC) != 0 || ::pipe2(vErrPipe, O_CLOEXEC) != 0) {
    int iErr = errno;
    closeFd(vOutPipe[0]);
    closeFd(vOutPipe[1]);
    closeFd(iLogFd);
    throw common::LaunchError("launch_failed",
                              std::string("pipe call failed: ") + std::strerror(iErr));
  }

  int iDevNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  pid_t pid = ::fork();
  if (pid < 0) {
    int iErr = errno;
    closeFd(vOutPipe[0]);
    closeFd(vOutPipe[1]);
    closeFd(vErrPipe[0]);
    closeFd(vErrPipe[1]);
    closeFd(iDevNull);
    closeFd(iLogFd);
    throw common::LaunchError("launch_failed", std::string("fork failed: ") + std::strerror(iErr));
  }

  if (pid == 0) {
    // Child: own process group, stdin from /dev/null, stdout+stderr into the pipe
    ::setpgid(0, 0);
    if (iDevNull >= 0) {
      ::dup2(iDevNull, STDIN_FILENO);
    }
    if (::dup2(vOutPipe[1], STDOUT_FILENO) < 0 || ::dup2(vOutPipe[1], STDERR_FILENO) < 0) {
      int iErr = errno;
      (void)!::write(vErrPipe[1], &iErr, sizeof(iErr));
      ::_exit(127);
    }
    ::execvp(vArgvPtrs[0], vArgvPtrs.data());
    int iErr = errno;
    (void)!::write(vErrPipe[1], &iErr, sizeof(iErr));
    ::_exit(127);
  }

  // Parent
  closeFd(vOutPipe[1]);
  closeFd(vErrPipe[1]);
  closeFd(iDevNull);

  // Blocks until exec succeeds (pipe closed by O_CLOEXEC) or the child reports errno
  int iExecErr = 0;
  ssize_t nErrRead = 0;
  do {
    nErrRead = ::read(vErrPipe[0], &iExecErr, sizeof(iExecErr));
  } while (nErrRead < 0 && errno == EINTR);
  closeFd(vErrPipe[0]);

  if (nErrRead == static_cast<ssize_t>(sizeof(iExecErr))) {
    closeFd(vOutPipe[0]);
    closeFd(iLogFd);
    waitForChild(pid);
    throw common::LaunchError("launch_failed", "Cannot start '" + psSpec.sCommand +
                                                   "': " + std::strerror(iExecErr));
  }

  spLog->debug("Started '{}' (pid {}), logging to {}", psSpec.sCommand, pid,
               psSpec.pathLog.string());

  ProcessResult pres;
  const bool bHasDeadline = psSpec.durTimeout.count() > 0;
  const auto tpDeadline = std::chrono::steady_clock::now() + psSpec.durTimeout;
  bool bLogWriteFailed = false;
  char vBuf[kReadChunk];

  while (true) {
    if (bHasDeadline && !pres.bTimedOut && std::chrono::steady_clock::now() >= tpDeadline) {
      spLog->warn("'{}' (pid {}) exceeded {}s timeout, killing", psSpec.sCommand, pid,
                  psSpec.durTimeout.count());
      ::kill(-pid, SIGKILL);
      pres.bTimedOut = true;
    }

    pollfd pfd{vOutPipe[0], POLLIN, 0};
    int iReady = ::poll(&pfd, 1, kPollSliceMs);
    if (iReady < 0) {
      if (errno == EINTR) continue;
      spLog->error("poll failed on output of '{}': {}", psSpec.sCommand, std::strerror(errno));
      break;
    }
    if (iReady == 0) {
      continue;
    }

    ssize_t nRead = ::read(vOutPipe[0], vBuf, sizeof(vBuf));
    if (nRead < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      spLog->error("read failed on output of '{}': {}", psSpec.sCommand, std::strerror(errno));
      break;
    }
    if (nRead == 0) {
      break;  // every writer closed the pipe
    }
    if (!bLogWriteFailed && !writeAll(iLogFd, vBuf, static_cast<size_t>(nRead))) {
      // Keep draining so the child never blocks on a full pipe
      bLogWriteFailed = true;
      spLog->error("Cannot write to log {}: {}", psSpec.pathLog.string(), std::strerror(errno));
    }
  }

  closeFd(vOutPipe[0]);
  ::fsync(iLogFd);
  closeFd(iLogFd);

  pres.iExitCode = waitForChild(pid);
  spLog->debug("'{}' (pid {}) exited with code {}", psSpec.sCommand, pid, pres.iExitCode);
  return pres;
}

}  // namespace ferry::core
