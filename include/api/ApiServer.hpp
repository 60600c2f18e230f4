#pragma once

#include <string>

#include <crow.h>

#include "api/routes/HealthRoutes.hpp"
#include "api/routes/SessionRoutes.hpp"

namespace ferry::core {
class SessionOrchestrator;
}

namespace ferry::dal {
class SessionStore;
}

namespace ferry::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(ferry::core::SessionOrchestrator& soOrch, const ferry::dal::SessionStore& ssStore,
            std::string sPublicUrl);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or the process receives SIGINT/SIGTERM.
  void start(int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::SessionRoutes _srRoutes;
  routes::HealthRoutes _hrRoutes;
};

}  // namespace ferry::api
