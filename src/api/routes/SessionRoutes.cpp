#include "api/routes/SessionRoutes.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Serialization.hpp"
#include "core/SessionOrchestrator.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <utility>
#include <vector>

namespace ferry::api::routes {

namespace {

crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

crow::response errorResponse(int iStatus, const std::string& sCode, const std::string& sMsg) {
  return jsonResponse(iStatus, {{"error", sCode}, {"message", sMsg}});
}

/// src_paths arrives either as a JSON array or as one comma-separated string.
std::vector<std::string> parseSrcPaths(const nlohmann::json& jBody) {
  std::vector<std::string> vPaths;
  auto it = jBody.find("src_paths");
  if (it == jBody.end() || it->is_null()) {
    return vPaths;
  }
  if (it->is_array()) {
    return it->get<std::vector<std::string>>();
  }
  std::istringstream iss(it->get<std::string>());
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    vPaths.push_back(sItem);
  }
  return vPaths;
}

/// Runs fnHandler and maps exceptions onto JSON error responses.
template <typename F>
crow::response guarded(F&& fnHandler) {
  try {
    return fnHandler();
  } catch (const common::AppError& e) {
    return errorResponse(e._iHttpStatus, e._sErrorCode, e.what());
  } catch (const nlohmann::json::exception&) {
    return errorResponse(400, "invalid_json", "Invalid JSON body");
  } catch (const std::exception& e) {
    common::Logger::get()->error("Unhandled error in session route: {}", e.what());
    return errorResponse(500, "internal_error", "Internal server error");
  }
}

}  // namespace

SessionRoutes::SessionRoutes(ferry::core::SessionOrchestrator& soOrch, std::string sPublicUrl)
    : _soOrch(soOrch), _sPublicUrl(std::move(sPublicUrl)) {}

SessionRoutes::~SessionRoutes() = default;

void SessionRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /api/v1/sessions
  CROW_ROUTE(app, "/api/v1/sessions").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        return guarded([&]() {
          auto jBody = nlohmann::json::parse(req.body);
          const std::string sToken =
              _soOrch.create(parseSrcPaths(jBody), jBody.value("dest_path", ""));

          const std::string sBase = _sPublicUrl + "/api/v1/sessions/" + sToken;
          return jsonResponse(201, {{"token", sToken},
                                    {"share_url", sBase + "/share"},
                                    {"status_url", sBase}});
        });
      });

  // GET /api/v1/sessions/<token>/share
  CROW_ROUTE(app, "/api/v1/sessions/<string>/share").methods("GET"_method)(
      [this](const crow::request& /*req*/, const std::string& sToken) -> crow::response {
        return guarded([&]() {
          auto si = _soOrch.getShareInfo(sToken);
          return jsonResponse(200, {{"token", si.sToken},
                                    {"public_key", si.sPublicKey},
                                    {"key_fingerprint", si.sFingerprint},
                                    {"accept_url", si.sAcceptUrl},
                                    {"dest_path", si.sDestPath}});
        });
      });

  // POST /api/v1/sessions/<token>/accept
  CROW_ROUTE(app, "/api/v1/sessions/<string>/accept").methods("POST"_method)(
      [this](const crow::request& req, const std::string& sToken) -> crow::response {
        return guarded([&]() {
          auto jBody = nlohmann::json::parse(req.body);
          // The run continues on the worker pool; clients poll the status route
          [[maybe_unused]] auto fut =
              _soOrch.accept(sToken, jBody.value("client_host", ""),
                             jBody.value("client_user", ""), jBody.value("dest_path", ""));

          return jsonResponse(202, {{"token", sToken},
                                    {"status", common::toString(
                                                   common::SessionStatus::StartingTransfer)},
                                    {"status_url", _sPublicUrl + "/api/v1/sessions/" + sToken}});
        });
      });

  // GET /api/v1/sessions/<token>
  CROW_ROUTE(app, "/api/v1/sessions/<string>").methods("GET"_method)(
      [this](const crow::request& /*req*/, const std::string& sToken) -> crow::response {
        return guarded([&]() {
          auto sv = _soOrch.getStatus(sToken);
          return jsonResponse(
              200, {{"session", common::sessionToJson(sv.session, false)},
                    {"transfer_log", sv.sTransferLog},
                    {"cleanup_log", sv.sCleanupLog},
                    {"report", sv.oReport ? common::reportToJson(*sv.oReport)
                                          : nlohmann::json(nullptr)}});
        });
      });
}

}  // namespace ferry::api::routes
