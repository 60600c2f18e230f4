#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ferry::core {

/// One external command invocation.
/// Class abbreviation: ps
struct ProcessSpec {
  std::string sCommand;               // resolved through PATH when it has no '/'
  std::vector<std::string> vArgs;     // argv[1..]
  std::filesystem::path pathLog;      // truncated, then appended as output arrives
  std::chrono::seconds durTimeout{0};  // 0 = wait forever
};

/// Class abbreviation: pres
struct ProcessResult {
  int iExitCode = -1;  // 128 + signal when killed by a signal
  bool bTimedOut = false;
};

/// Pure abstract interface for running external tools.
class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  /// Blocks until the process exits. A non-zero exit code is returned, not thrown.
  /// Throws LaunchError if the command cannot be started.
  virtual ProcessResult run(const ProcessSpec& psSpec) = 0;
};

}  // namespace ferry::core
