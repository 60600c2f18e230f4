#pragma once

#include <string>

namespace ferry::common {

/// Environment variable loader for the service instance.
/// Loads all FERRY_* env vars into a typed struct with validation.
/// The loaded value is injected into each component; nothing reads the
/// environment after startup.
/// Class abbreviation: cfg
struct Config {
  // ── Storage ───────────────────────────────────────────────────────────
  std::string sSessionsDir = "./sessions";

  // ── External tools ────────────────────────────────────────────────────
  std::string sPlaybookDir = "./playbooks";
  std::string sAnsiblePlaybookBin = "ansible-playbook";
  std::string sSshKeygenBin = "ssh-keygen";
  int iProcessTimeoutSeconds = 0;  // 0 = wait forever

  // ── Sessions ──────────────────────────────────────────────────────────
  std::string sDefaultDestPath = "/home/ubuntu/received_files";
  int iLogTailLines = 200;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 5000;
  int iHttpThreads = 4;
  std::string sPublicUrl;  // empty = http://localhost:<port>

  // ── Worker pool ───────────────────────────────────────────────────────
  int iWorkerThreads = 2;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::string sLogFile;

  /// Load and validate all config from environment variables.
  /// Throws std::runtime_error on invalid values.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, return sDefault if unset or empty.
  static std::string getEnvOr(const char* pVarName, const std::string& sDefault);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace ferry::common
