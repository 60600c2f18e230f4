#pragma once

#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/IProcessRunner.hpp"

namespace ferry::dal {
class SessionStore;
}

namespace ferry::security {
class KeyIssuer;
}

namespace ferry::core {

class ThreadPool;

/// Service-instance settings injected at construction.
/// Class abbreviation: os
struct OrchestratorSettings {
  std::string sPlaybookDir = "./playbooks";
  std::string sAnsiblePlaybookBin = "ansible-playbook";
  std::string sDefaultDestPath = "/home/ubuntu/received_files";
  std::string sPublicUrl = "http://localhost:5000";
  std::chrono::seconds durProcessTimeout{0};
  int iLogTailLines = 200;
};

/// Ordered phases of one orchestration run. Each phase persists the session
/// before the next one starts.
enum class RunStep { Prepare, Transfer, Cleanup, Report };

/// Owns the session state machine: create → accept → prepare → transfer →
/// cleanup → report. Runs are queued on the worker pool; one session never has
/// more than one run in flight.
/// Class abbreviation: so
class SessionOrchestrator {
 public:
  static constexpr const char* kTransferPlaybook = "transfer.yml";
  static constexpr const char* kCleanupPlaybook = "cleanup.yml";
  static constexpr const char* kTransferLog = "ansible_transfer.log";
  static constexpr const char* kCleanupLog = "ansible_cleanup.log";

  SessionOrchestrator(dal::SessionStore& ssStore, security::KeyIssuer& kiIssuer,
                      IProcessRunner& prRunner, ThreadPool& tpPool,
                      OrchestratorSettings osSettings);
  ~SessionOrchestrator();

  /// Create a session and issue its keypair. Returns the new token.
  /// Throws ValidationError if no source path remains after trimming, and
  /// KeygenError if the keypair cannot be generated.
  std::string create(const std::vector<std::string>& vSrcPaths, const std::string& sDestPath);

  /// Public key, its fingerprint and the link to hand to the client.
  common::ShareInfo getShareInfo(const std::string& sToken) const;

  /// Record the client's connection details, move to starting_transfer and
  /// queue the run. Returns immediately; the future yields the final status.
  /// Throws ValidationError (nothing persisted) if host or user is empty,
  /// ConflictError if the session is not waiting for a client.
  std::future<common::SessionStatus> accept(const std::string& sToken,
                                            const std::string& sClientHost,
                                            const std::string& sClientUser,
                                            const std::string& sDestPath = "");

  /// Metadata without internal fields, log tails and the report if written.
  common::StatusView getStatus(const std::string& sToken) const;

  /// Queue the remaining steps of runs a previous process left unfinished.
  /// Returns the number of sessions queued.
  int resumeInterrupted();

  /// Execute the run synchronously from rsFirst on. Used by the worker pool.
  common::SessionStatus execute(const std::string& sToken, RunStep rsFirst = RunStep::Prepare);

  /// True if the transition table allows from → to.
  static bool canTransition(common::SessionStatus from, common::SessionStatus to);

  bool isInFlight(const std::string& sToken) const;

 private:
  /// Apply a status change; throws ConflictError if the table forbids it.
  static void transition(common::Session& sess, common::SessionStatus to);

  void runPrepare(common::Session& sess);
  void runTransfer(common::Session& sess);
  void runCleanup(common::Session& sess);
  void runReport(common::Session& sess);

  ProcessResult runPlaybook(const common::Session& sess, const char* pPlaybook,
                            const char* pLogFile);

  std::future<common::SessionStatus> enqueue(const std::string& sToken, RunStep rsFirst);

  dal::SessionStore& _ssStore;
  security::KeyIssuer& _kiIssuer;
  IProcessRunner& _prRunner;
  ThreadPool& _tpPool;
  OrchestratorSettings _osSettings;

  mutable std::mutex _mtx;
  std::set<std::string> _setInFlight;
};

}  // namespace ferry::core
