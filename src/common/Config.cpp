#include "common/Config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ferry::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::getEnvOr(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nUsed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nUsed);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (nUsed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

Config Config::load() {
  Config cfg;

  // ── Storage and tools ──────────────────────────────────────────────────
  cfg.sSessionsDir = getEnvOr("FERRY_SESSIONS_DIR", cfg.sSessionsDir);
  cfg.sPlaybookDir = getEnvOr("FERRY_PLAYBOOK_DIR", cfg.sPlaybookDir);
  cfg.sAnsiblePlaybookBin = getEnvOr("FERRY_ANSIBLE_PLAYBOOK_BIN", cfg.sAnsiblePlaybookBin);
  cfg.sSshKeygenBin = getEnvOr("FERRY_SSH_KEYGEN_BIN", cfg.sSshKeygenBin);
  cfg.iProcessTimeoutSeconds = getEnvInt("FERRY_PROCESS_TIMEOUT_SECONDS", 0);

  // ── Sessions ───────────────────────────────────────────────────────────
  cfg.sDefaultDestPath = getEnvOr("FERRY_DEFAULT_DEST_PATH", cfg.sDefaultDestPath);
  cfg.iLogTailLines = getEnvInt("FERRY_LOG_TAIL_LINES", 200);

  // ── HTTP and workers ───────────────────────────────────────────────────
  cfg.iHttpPort = getEnvInt("FERRY_HTTP_PORT", 5000);
  cfg.iHttpThreads = getEnvInt("FERRY_HTTP_THREADS", 4);
  cfg.iWorkerThreads = getEnvInt("FERRY_WORKER_THREADS", 2);
  cfg.sPublicUrl = getEnv("FERRY_PUBLIC_URL");

  // ── Logging ────────────────────────────────────────────────────────────
  cfg.sLogLevel = getEnvOr("FERRY_LOG_LEVEL", cfg.sLogLevel);
  cfg.sLogFile = getEnv("FERRY_LOG_FILE");

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error(
        "FERRY_HTTP_PORT must be in 1..65535 (got " + std::to_string(cfg.iHttpPort) + ")");
  }
  if (cfg.iHttpThreads < 1) {
    throw std::runtime_error(
        "FERRY_HTTP_THREADS must be >= 1 (got " + std::to_string(cfg.iHttpThreads) + ")");
  }
  if (cfg.iWorkerThreads < 1) {
    throw std::runtime_error(
        "FERRY_WORKER_THREADS must be >= 1 (got " + std::to_string(cfg.iWorkerThreads) + ")");
  }
  if (cfg.iProcessTimeoutSeconds < 0) {
    throw std::runtime_error(
        "FERRY_PROCESS_TIMEOUT_SECONDS must be >= 0 (got " +
        std::to_string(cfg.iProcessTimeoutSeconds) + ")");
  }
  if (cfg.iLogTailLines < 1) {
    throw std::runtime_error(
        "FERRY_LOG_TAIL_LINES must be >= 1 (got " + std::to_string(cfg.iLogTailLines) + ")");
  }

  if (cfg.sPublicUrl.empty()) {
    cfg.sPublicUrl = "http://localhost:" + std::to_string(cfg.iHttpPort);
  }
  while (!cfg.sPublicUrl.empty() && cfg.sPublicUrl.back() == '/') {
    cfg.sPublicUrl.pop_back();
  }

  return cfg;
}

}  // namespace ferry::common
