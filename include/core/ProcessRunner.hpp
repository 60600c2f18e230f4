#pragma once

#include "core/IProcessRunner.hpp"

namespace ferry::core {

/// fork/exec runner. stdout and stderr share one pipe; every chunk read is
/// written straight to the log file so partial output is visible to readers.
/// The child runs in its own process group so a timeout kills the whole tree.
/// Class abbreviation: pr
class ProcessRunner : public IProcessRunner {
 public:
  ProcessRunner();
  ~ProcessRunner() override;

  ProcessResult run(const ProcessSpec& psSpec) override;
};

}  // namespace ferry::core
