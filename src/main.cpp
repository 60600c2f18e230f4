#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ProcessRunner.hpp"
#include "core/SessionOrchestrator.hpp"
#include "core/ThreadPool.hpp"
#include "dal/SessionStore.hpp"
#include "security/KeyIssuer.hpp"

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = ferry::common::Config::load();

    ferry::common::Logger::init(cfgApp.sLogLevel, cfgApp.sLogFile);
    auto spLog = ferry::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (sessions={}, playbooks={})",
                cfgApp.sSessionsDir, cfgApp.sPlaybookDir);

    // ── Step 2: Session store ────────────────────────────────────────────
    auto ssStore = std::make_unique<ferry::dal::SessionStore>(cfgApp.sSessionsDir);
    spLog->info("Step 2: SessionStore ready at {}", ssStore->root().string());

    // ── Step 3: Process runner and key issuer ────────────────────────────
    const std::chrono::seconds durTimeout(cfgApp.iProcessTimeoutSeconds);
    auto prRunner = std::make_unique<ferry::core::ProcessRunner>();
    auto kiIssuer = std::make_unique<ferry::security::KeyIssuer>(
        *prRunner, cfgApp.sSshKeygenBin, durTimeout);
    spLog->info("Step 3: KeyIssuer ready (keygen={}, timeout={}s)", cfgApp.sSshKeygenBin,
                cfgApp.iProcessTimeoutSeconds);

    // ── Step 4: Worker pool ──────────────────────────────────────────────
    auto tpPool = std::make_unique<ferry::core::ThreadPool>(cfgApp.iWorkerThreads);
    spLog->info("Step 4: ThreadPool started (size={})", tpPool->size());

    // ── Step 5: Orchestrator ─────────────────────────────────────────────
    ferry::core::OrchestratorSettings osSettings;
    osSettings.sPlaybookDir = cfgApp.sPlaybookDir;
    osSettings.sAnsiblePlaybookBin = cfgApp.sAnsiblePlaybookBin;
    osSettings.sDefaultDestPath = cfgApp.sDefaultDestPath;
    osSettings.sPublicUrl = cfgApp.sPublicUrl;
    osSettings.durProcessTimeout = durTimeout;
    osSettings.iLogTailLines = cfgApp.iLogTailLines;

    auto soOrch = std::make_unique<ferry::core::SessionOrchestrator>(
        *ssStore, *kiIssuer, *prRunner, *tpPool, osSettings);
    spLog->info("Step 5: SessionOrchestrator ready");

    try {
      // ── Step 6: Resume runs left unfinished by a previous process ──────
      int iResumed = soOrch->resumeInterrupted();
      spLog->info("Step 6: {} interrupted session(s) queued for cleanup", iResumed);

      // ── Step 7: HTTP server (blocks until SIGINT/SIGTERM) ──────────────
      ferry::api::ApiServer apiServer(*soOrch, *ssStore, cfgApp.sPublicUrl);
      apiServer.registerRoutes();
      spLog->info("Step 7: ferry ready at {}", cfgApp.sPublicUrl);
      apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);
    } catch (...) {
      // Queued runs reference the orchestrator; drain them before unwinding
      tpPool->shutdown();
      throw;
    }

    spLog->info("HTTP server stopped, waiting for running transfers");
    tpPool->shutdown();
    spLog->info("ThreadPool stopped");

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
