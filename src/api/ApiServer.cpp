#include "api/ApiServer.hpp"

#include "common/Logger.hpp"

#include <utility>

namespace ferry::api {

ApiServer::ApiServer(ferry::core::SessionOrchestrator& soOrch,
                     const ferry::dal::SessionStore& ssStore, std::string sPublicUrl)
    : _srRoutes(soOrch, std::move(sPublicUrl)), _hrRoutes(ssStore) {
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _hrRoutes.registerRoutes(_app);
  _srRoutes.registerRoutes(_app);
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} ({} threads)", iPort, iThreads);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace ferry::api
