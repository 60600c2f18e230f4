#include "core/SessionOrchestrator.hpp"

#include "common/Errors.hpp"
#include "common/FileUtil.hpp"
#include "common/Logger.hpp"
#include "core/DescriptorBuilder.hpp"
#include "core/ReportGenerator.hpp"
#include "core/SizeCalculator.hpp"
#include "core/ThreadPool.hpp"
#include "dal/SessionStore.hpp"
#include "security/CryptoService.hpp"
#include "security/KeyIssuer.hpp"

#include <array>
#include <filesystem>
#include <utility>

namespace ferry::core {

namespace fs = std::filesystem;
using common::SessionStatus;

namespace {

constexpr int kMaxTokenAttempts = 3;

// Ends up in the client's authorized_keys; must not carry the token
constexpr const char* kKeyComment = "ferry-session";

// The only status changes a session may ever make.
constexpr std::array<std::pair<SessionStatus, SessionStatus>, 3> kTransitions{{
    {SessionStatus::WaitingForClient, SessionStatus::StartingTransfer},
    {SessionStatus::StartingTransfer, SessionStatus::TransferSuccess},
    {SessionStatus::StartingTransfer, SessionStatus::TransferFailed},
}};

/// Removes a token from the in-flight set when the run ends, however it ends.
class InFlightRelease {
 public:
  InFlightRelease(std::mutex& mtx, std::set<std::string>& setInFlight, std::string sToken)
      : _mtx(mtx), _setInFlight(setInFlight), _sToken(std::move(sToken)) {}
  ~InFlightRelease() {
    std::lock_guard<std::mutex> lock(_mtx);
    _setInFlight.erase(_sToken);
  }

  InFlightRelease(const InFlightRelease&) = delete;
  InFlightRelease& operator=(const InFlightRelease&) = delete;

 private:
  std::mutex& _mtx;
  std::set<std::string>& _setInFlight;
  std::string _sToken;
};

}  // namespace

SessionOrchestrator::SessionOrchestrator(dal::SessionStore& ssStore,
                                         security::KeyIssuer& kiIssuer,
                                         IProcessRunner& prRunner, ThreadPool& tpPool,
                                         OrchestratorSettings osSettings)
    : _ssStore(ssStore),
      _kiIssuer(kiIssuer),
      _prRunner(prRunner),
      _tpPool(tpPool),
      _osSettings(std::move(osSettings)) {}

SessionOrchestrator::~SessionOrchestrator() = default;

// ── State machine ──────────────────────────────────────────────────────────

bool SessionOrchestrator::canTransition(SessionStatus from, SessionStatus to) {
  for (const auto& [fromAllowed, toAllowed] : kTransitions) {
    if (fromAllowed == from && toAllowed == to) {
      return true;
    }
  }
  return false;
}

void SessionOrchestrator::transition(common::Session& sess, SessionStatus to) {
  if (!canTransition(sess.status, to)) {
    throw common::ConflictError("invalid_transition",
                                "Session " + sess.sToken + " cannot move from " +
                                    common::toString(sess.status) + " to " +
                                    common::toString(to));
  }
  sess.status = to;
}

bool SessionOrchestrator::isInFlight(const std::string& sToken) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _setInFlight.count(sToken) > 0;
}

// ── Create / share ─────────────────────────────────────────────────────────

std::string SessionOrchestrator::create(const std::vector<std::string>& vSrcPaths,
                                        const std::string& sDestPath) {
  auto spLog = common::Logger::get();

  common::Session sessInitial;
  for (const auto& sPath : vSrcPaths) {
    std::string sTrimmed = common::trim(sPath);
    if (!sTrimmed.empty()) {
      sessInitial.vSrcPaths.push_back(std::move(sTrimmed));
    }
  }
  if (sessInitial.vSrcPaths.empty()) {
    throw common::ValidationError("empty_src_paths", "Please provide source paths");
  }
  sessInitial.sDestPath = common::trim(sDestPath);
  if (sessInitial.sDestPath.empty()) {
    sessInitial.sDestPath = _osSettings.sDefaultDestPath;
  }
  sessInitial.oCreatedAt = common::epochNow();
  sessInitial.status = SessionStatus::WaitingForClient;

  std::string sToken;
  common::Session sess;
  for (int iAttempt = 1;; ++iAttempt) {
    sToken = security::CryptoService::generateToken();
    try {
      sess = _ssStore.create(sToken, sessInitial);
      break;
    } catch (const common::ConflictError&) {
      if (iAttempt >= kMaxTokenAttempts) {
        throw;
      }
      spLog->warn("Token collision on attempt {}, generating a new token", iAttempt);
    }
  }

  try {
    auto ik = _kiIssuer.issue(_ssStore.sessionPath(sToken), kKeyComment);
    sess.sPublicKey = std::move(ik.sPublicKey);
    sess.sPrivateKeyPath = std::move(ik.sPrivateKeyPath);
  } catch (const common::KeygenError& ex) {
    // Keep the directory and keygen.log for diagnosis; the session is unusable
    sess.oError = std::string("keygen failed: ") + ex.what();
    _ssStore.save(sess);
    spLog->error("Session {} unusable: {}", sToken, *sess.oError);
    throw;
  }
  _ssStore.save(sess);

  spLog->info("Session {} created: {} source path(s), dest {}", sToken, sess.vSrcPaths.size(),
              sess.sDestPath);
  return sToken;
}

common::ShareInfo SessionOrchestrator::getShareInfo(const std::string& sToken) const {
  auto sess = _ssStore.load(sToken);
  if (sess.sPublicKey.empty()) {
    throw common::ConflictError("session_unusable", "Session has no issued key");
  }

  common::ShareInfo si;
  si.sToken = sess.sToken;
  si.sPublicKey = sess.sPublicKey;
  si.sFingerprint = security::CryptoService::sshFingerprint(sess.sPublicKey);
  si.sAcceptUrl = _osSettings.sPublicUrl + "/api/v1/sessions/" + sess.sToken + "/accept";
  si.sDestPath = sess.sDestPath;
  return si;
}

// ── Accept ─────────────────────────────────────────────────────────────────

std::future<SessionStatus> SessionOrchestrator::accept(const std::string& sToken,
                                                       const std::string& sClientHost,
                                                       const std::string& sClientUser,
                                                       const std::string& sDestPath) {
  const std::string sHost = common::trim(sClientHost);
  const std::string sUser = common::trim(sClientUser);
  const std::string sDest = common::trim(sDestPath);

  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto sess = _ssStore.load(sToken);

    if (sHost.empty() || sUser.empty()) {
      throw common::ValidationError(sHost.empty() ? "missing_client_host" : "missing_client_user",
                                    "Provide client_host and client_user");
    }
    if (!DescriptorBuilder::isSafeInventoryValue(sHost)) {
      throw common::ValidationError("invalid_client_host",
                                    "client_host must be a bare host name or address");
    }
    if (!DescriptorBuilder::isSafeInventoryValue(sUser)) {
      throw common::ValidationError("invalid_client_user",
                                    "client_user must be a bare user name");
    }
    if (_setInFlight.count(sToken) > 0) {
      throw common::ConflictError("transfer_in_progress",
                                  "A transfer is already running for this session");
    }
    if (sess.sPublicKey.empty()) {
      throw common::ConflictError("session_unusable", "Session has no issued key");
    }

    transition(sess, SessionStatus::StartingTransfer);
    sess.sClientHost = sHost;
    sess.sClientUser = sUser;
    if (!sDest.empty()) {
      sess.sDestPath = sDest;
    }
    _ssStore.save(sess);
    _setInFlight.insert(sToken);
  }

  common::Logger::get()->info("Session {} accepted by {}@{}", sToken, sUser, sHost);
  return enqueue(sToken, RunStep::Prepare);
}

std::future<SessionStatus> SessionOrchestrator::enqueue(const std::string& sToken,
                                                        RunStep rsFirst) {
  try {
    return _tpPool.submit([this, sToken, rsFirst]() {
      InFlightRelease ifr(_mtx, _setInFlight, sToken);
      try {
        return execute(sToken, rsFirst);
      } catch (const std::exception& ex) {
        // Callers may drop the future; the failure must still reach the log
        common::Logger::get()->error("Session {}: run failed: {}", sToken, ex.what());
        throw;
      }
    });
  } catch (const std::exception&) {
    std::lock_guard<std::mutex> lock(_mtx);
    _setInFlight.erase(sToken);
    throw;
  }
}

// ── Run ────────────────────────────────────────────────────────────────────

SessionStatus SessionOrchestrator::execute(const std::string& sToken, RunStep rsFirst) {
  struct StepDef {
    RunStep rs;
    const char* pName;
    void (SessionOrchestrator::*pfnRun)(common::Session&);
    bool bContinueOnAbort;  // cleanup still revokes the key if this step fails
  };
  static const std::array<StepDef, 4> kSteps{{
      {RunStep::Prepare, "prepare", &SessionOrchestrator::runPrepare, false},
      {RunStep::Transfer, "transfer", &SessionOrchestrator::runTransfer, true},
      {RunStep::Cleanup, "cleanup", &SessionOrchestrator::runCleanup, false},
      {RunStep::Report, "report", &SessionOrchestrator::runReport, false},
  }};

  auto spLog = common::Logger::get();
  auto sess = _ssStore.load(sToken);

  for (const auto& sd : kSteps) {
    if (sd.rs < rsFirst) {
      continue;
    }
    spLog->debug("Session {}: step '{}'", sToken, sd.pName);
    try {
      (this->*sd.pfnRun)(sess);
      // Durable before the next step starts
      _ssStore.save(sess);
    } catch (const std::exception& ex) {
      sess.oError = std::string(sd.pName) + " aborted: " + ex.what();
      spLog->error("Session {}: {}", sToken, *sess.oError);
      try {
        _ssStore.save(sess);
      } catch (const std::exception& exSave) {
        spLog->error("Session {}: cannot persist aborted '{}' step: {}", sToken, sd.pName,
                     exSave.what());
      }
      if (!sd.bContinueOnAbort) {
        return sess.status;
      }
    }
  }

  return sess.status;
}

void SessionOrchestrator::runPrepare(common::Session& sess) {
  if (sess.status != SessionStatus::StartingTransfer) {
    throw common::ConflictError("invalid_transition",
                                "Cannot prepare a session in status " +
                                    common::toString(sess.status));
  }
  const auto pathSession = _ssStore.sessionPath(sess.sToken);
  DescriptorBuilder::buildInventory(pathSession, sess.sClientHost, sess.sClientUser,
                                    sess.sPrivateKeyPath);
  DescriptorBuilder::buildParameters(pathSession, sess.vSrcPaths, sess.sDestPath,
                                     sess.sClientUser, sess.sPublicKey);
  sess.oExpectedSizeBytes = computeTotalSize(sess.vSrcPaths);
  sess.oStartedAt = common::epochNow();

  common::Logger::get()->info("Session {}: descriptors written, {} bytes expected", sess.sToken,
                              *sess.oExpectedSizeBytes);
}

void SessionOrchestrator::runTransfer(common::Session& sess) {
  auto spLog = common::Logger::get();
  sess.oTransferLogfile = (_ssStore.sessionPath(sess.sToken) / kTransferLog).string();

  const auto pres = runPlaybook(sess, kTransferPlaybook, kTransferLog);
  if (pres.bTimedOut) {
    throw std::runtime_error("transfer killed after " +
                             std::to_string(_osSettings.durProcessTimeout.count()) +
                             "s timeout");
  }

  sess.oTransferRc = pres.iExitCode;
  sess.oFinishedAt = common::epochNow();
  transition(sess, pres.iExitCode == 0 ? SessionStatus::TransferSuccess
                                       : SessionStatus::TransferFailed);

  if (pres.iExitCode == 0) {
    spLog->info("Session {}: transfer succeeded", sess.sToken);
  } else {
    spLog->warn("Session {}: transfer failed with code {}", sess.sToken, pres.iExitCode);
  }
}

void SessionOrchestrator::runCleanup(common::Session& sess) {
  auto spLog = common::Logger::get();
  sess.oCleanupLogfile = (_ssStore.sessionPath(sess.sToken) / kCleanupLog).string();

  const auto pres = runPlaybook(sess, kCleanupPlaybook, kCleanupLog);
  sess.oCleanupRc = pres.iExitCode;
  if (pres.bTimedOut) {
    sess.oError = "cleanup killed after " +
                  std::to_string(_osSettings.durProcessTimeout.count()) +
                  "s timeout; the key may still be authorized on the client";
  }

  if (pres.iExitCode == 0) {
    spLog->info("Session {}: cleanup succeeded", sess.sToken);
  } else {
    spLog->warn("Session {}: cleanup failed with code {}; key may still be installed on {}",
                sess.sToken, pres.iExitCode, sess.sClientHost);
  }
}

void SessionOrchestrator::runReport(common::Session& sess) {
  _ssStore.saveReport(ReportGenerator::summarize(sess));
  common::Logger::get()->info("Session {}: finished with status {}", sess.sToken,
                              common::toString(sess.status));
}

ProcessResult SessionOrchestrator::runPlaybook(const common::Session& sess, const char* pPlaybook,
                                               const char* pLogFile) {
  const auto pathSession = _ssStore.sessionPath(sess.sToken);

  ProcessSpec psSpec;
  psSpec.sCommand = _osSettings.sAnsiblePlaybookBin;
  psSpec.vArgs = {
      "-i",
      (pathSession / DescriptorBuilder::kInventoryFile).string(),
      (fs::path(_osSettings.sPlaybookDir) / pPlaybook).string(),
      "--extra-vars",
      "@" + (pathSession / DescriptorBuilder::kParametersFile).string(),
  };
  psSpec.pathLog = pathSession / pLogFile;
  psSpec.durTimeout = _osSettings.durProcessTimeout;
  return _prRunner.run(psSpec);
}

// ── Status ─────────────────────────────────────────────────────────────────

common::StatusView SessionOrchestrator::getStatus(const std::string& sToken) const {
  common::StatusView sv;
  sv.session = _ssStore.load(sToken);
  sv.session.sPrivateKeyPath.clear();
  sv.sTransferLog = _ssStore.tailLog(sToken, kTransferLog, _osSettings.iLogTailLines);
  sv.sCleanupLog = _ssStore.tailLog(sToken, kCleanupLog, _osSettings.iLogTailLines);
  sv.oReport = _ssStore.loadReport(sToken);
  return sv;
}

// ── Recovery ───────────────────────────────────────────────────────────────

int SessionOrchestrator::resumeInterrupted() {
  auto spLog = common::Logger::get();
  int iQueued = 0;

  for (const auto& sToken : _ssStore.listTokens()) {
    if (isInFlight(sToken)) {
      continue;
    }
    common::Session sess;
    try {
      sess = _ssStore.load(sToken);
    } catch (const common::NotFoundError& ex) {
      spLog->warn("Skipping session {} during recovery: {}", sToken, ex.what());
      continue;
    }

    bool bNeedsCleanup = false;
    if (common::isTerminal(sess.status) && !sess.oCleanupRc) {
      bNeedsCleanup = true;
    } else if (sess.status == SessionStatus::StartingTransfer && !sess.oTransferRc &&
               !sess.oCleanupRc) {
      sess.oError = "interrupted: service restarted during transfer";
      _ssStore.save(sess);
      std::error_code ec;
      bNeedsCleanup =
          fs::exists(_ssStore.sessionPath(sToken) / DescriptorBuilder::kInventoryFile, ec);
    }
    if (!bNeedsCleanup) {
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(_mtx);
      if (!_setInFlight.insert(sToken).second) {
        continue;
      }
    }
    spLog->warn("Session {}: resuming cleanup after restart (status {})", sToken,
                common::toString(sess.status));
    // Recovery runs detached; the outcome is persisted in the session record
    [[maybe_unused]] auto fut = enqueue(sToken, RunStep::Cleanup);
    ++iQueued;
  }

  return iQueued;
}

}  // namespace ferry::core
