#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry::common {

/// Lifecycle status of a transfer session.
/// Persisted as snake_case strings (see toString / statusFromString).
enum class SessionStatus { WaitingForClient, StartingTransfer, TransferSuccess, TransferFailed };

std::string toString(SessionStatus status);

/// Throws std::invalid_argument for unknown values.
SessionStatus statusFromString(const std::string& sValue);

/// True for TransferSuccess and TransferFailed.
bool isTerminal(SessionStatus status);

/// Seconds since the Unix epoch, with sub-second precision.
double epochNow();

/// One end-to-end transfer engagement. Timestamps are epoch seconds.
/// Class abbreviation: sess
struct Session {
  std::string sToken;
  std::optional<double> oCreatedAt;
  std::optional<double> oStartedAt;
  std::optional<double> oFinishedAt;

  std::vector<std::string> vSrcPaths;
  std::string sDestPath;

  std::string sPublicKey;
  std::string sPrivateKeyPath;  // internal only, never rendered

  std::string sClientHost;
  std::string sClientUser;

  SessionStatus status = SessionStatus::WaitingForClient;
  std::optional<uint64_t> oExpectedSizeBytes;

  std::optional<int> oTransferRc;
  std::optional<int> oCleanupRc;
  std::optional<std::string> oTransferLogfile;
  std::optional<std::string> oCleanupLogfile;

  /// Set when a run was aborted by an engine-level failure.
  std::optional<std::string> oError;
};

/// Flat summary of a completed session, written once after cleanup.
/// Class abbreviation: rpt
struct Report {
  std::string sToken;
  SessionStatus status = SessionStatus::WaitingForClient;
  std::vector<std::string> vSrcPaths;
  std::string sDestPath;
  std::string sClientHost;
  std::string sClientUser;
  std::optional<uint64_t> oExpectedSizeBytes;
  std::optional<double> oStartedAt;
  std::optional<double> oFinishedAt;
  std::optional<int> oTransferRc;
  std::optional<int> oCleanupRc;
};

/// What the operator hands to the client out-of-band.
/// Class abbreviation: si
struct ShareInfo {
  std::string sToken;
  std::string sPublicKey;
  std::string sFingerprint;
  std::string sAcceptUrl;
  std::string sDestPath;
};

/// Status view: metadata, log tails and the report if one was written.
/// Class abbreviation: sv
struct StatusView {
  Session session;
  std::string sTransferLog;
  std::string sCleanupLog;
  std::optional<Report> oReport;
};

}  // namespace ferry::common
