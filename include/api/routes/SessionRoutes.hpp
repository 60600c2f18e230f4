#pragma once

#include <string>

#include <crow.h>

namespace ferry::core {
class SessionOrchestrator;
}

namespace ferry::api::routes {

/// Handlers for /api/v1/sessions
/// Class abbreviation: sr
class SessionRoutes {
 public:
  SessionRoutes(ferry::core::SessionOrchestrator& soOrch, std::string sPublicUrl);
  ~SessionRoutes();

  /// Register session routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

 private:
  ferry::core::SessionOrchestrator& _soOrch;
  std::string _sPublicUrl;
};

}  // namespace ferry::api::routes
