#pragma once

#include <crow.h>

namespace ferry::dal {
class SessionStore;
}

namespace ferry::api::routes {

/// Handler for /api/v1/health. Reports the sessions directory and how many
/// session records it currently holds.
/// Class abbreviation: hr
class HealthRoutes {
 public:
  explicit HealthRoutes(const dal::SessionStore& ssStore);
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  const dal::SessionStore& _ssStore;
};

}  // namespace ferry::api::routes
