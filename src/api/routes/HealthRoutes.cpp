#include "api/routes/HealthRoutes.hpp"

#include "dal/SessionStore.hpp"

#include <nlohmann/json.hpp>

namespace ferry::api::routes {

HealthRoutes::HealthRoutes(const dal::SessionStore& ssStore) : _ssStore(ssStore) {}
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/health
  CROW_ROUTE(app, "/api/v1/health").methods("GET"_method)([this]() -> crow::response {
    nlohmann::json jResp = {
        {"status", "ok"},
        {"sessions_dir", _ssStore.root().string()},
        {"sessions", _ssStore.listTokens().size()},
    };
    crow::response resp(200, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });
}

}  // namespace ferry::api::routes
