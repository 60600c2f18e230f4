#include "common/Serialization.hpp"

namespace ferry::common {

namespace {

template <typename T>
void putIfSet(nlohmann::json& j, const char* pKey, const std::optional<T>& oValue) {
  if (oValue) {
    j[pKey] = *oValue;
  }
}

template <typename T>
nlohmann::json orNull(const std::optional<T>& oValue) {
  return oValue ? nlohmann::json(*oValue) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* pKey) {
  auto it = j.find(pKey);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace

nlohmann::json sessionToJson(const Session& sess, bool bIncludeInternal) {
  nlohmann::json j = {
      {"token", sess.sToken},
      {"src_paths", sess.vSrcPaths},
      {"dest_path", sess.sDestPath},
      {"status", toString(sess.status)},
  };
  putIfSet(j, "created_at", sess.oCreatedAt);
  putIfSet(j, "started_at", sess.oStartedAt);
  putIfSet(j, "finished_at", sess.oFinishedAt);
  if (!sess.sPublicKey.empty()) {
    j["public_key"] = sess.sPublicKey;
  }
  if (bIncludeInternal && !sess.sPrivateKeyPath.empty()) {
    j["private_key_path"] = sess.sPrivateKeyPath;
  }
  if (!sess.sClientHost.empty()) {
    j["client_host"] = sess.sClientHost;
  }
  if (!sess.sClientUser.empty()) {
    j["client_user"] = sess.sClientUser;
  }
  putIfSet(j, "expected_size_bytes", sess.oExpectedSizeBytes);
  putIfSet(j, "transfer_rc", sess.oTransferRc);
  putIfSet(j, "cleanup_rc", sess.oCleanupRc);
  putIfSet(j, "transfer_logfile", sess.oTransferLogfile);
  putIfSet(j, "cleanup_logfile", sess.oCleanupLogfile);
  putIfSet(j, "error", sess.oError);
  return j;
}

Session sessionFromJson(const nlohmann::json& j) {
  Session sess;
  sess.sToken = j.at("token").get<std::string>();
  sess.vSrcPaths = j.at("src_paths").get<std::vector<std::string>>();
  sess.sDestPath = j.at("dest_path").get<std::string>();
  sess.status = statusFromString(j.at("status").get<std::string>());
  sess.oCreatedAt = getOptional<double>(j, "created_at");
  sess.oStartedAt = getOptional<double>(j, "started_at");
  sess.oFinishedAt = getOptional<double>(j, "finished_at");
  sess.sPublicKey = j.value("public_key", "");
  sess.sPrivateKeyPath = j.value("private_key_path", "");
  sess.sClientHost = j.value("client_host", "");
  sess.sClientUser = j.value("client_user", "");
  sess.oExpectedSizeBytes = getOptional<uint64_t>(j, "expected_size_bytes");
  sess.oTransferRc = getOptional<int>(j, "transfer_rc");
  sess.oCleanupRc = getOptional<int>(j, "cleanup_rc");
  sess.oTransferLogfile = getOptional<std::string>(j, "transfer_logfile");
  sess.oCleanupLogfile = getOptional<std::string>(j, "cleanup_logfile");
  sess.oError = getOptional<std::string>(j, "error");
  return sess;
}

nlohmann::json reportToJson(const Report& rpt) {
  return nlohmann::json{
      {"token", rpt.sToken},
      {"status", toString(rpt.status)},
      {"src_paths", rpt.vSrcPaths},
      {"dest_path", rpt.sDestPath},
      {"client_host", rpt.sClientHost},
      {"client_user", rpt.sClientUser},
      {"expected_size_bytes", orNull(rpt.oExpectedSizeBytes)},
      {"started_at", orNull(rpt.oStartedAt)},
      {"finished_at", orNull(rpt.oFinishedAt)},
      {"transfer_rc", orNull(rpt.oTransferRc)},
      {"cleanup_rc", orNull(rpt.oCleanupRc)},
  };
}

Report reportFromJson(const nlohmann::json& j) {
  Report rpt;
  rpt.sToken = j.at("token").get<std::string>();
  rpt.status = statusFromString(j.at("status").get<std::string>());
  rpt.vSrcPaths = j.at("src_paths").get<std::vector<std::string>>();
  rpt.sDestPath = j.at("dest_path").get<std::string>();
  rpt.sClientHost = j.value("client_host", "");
  rpt.sClientUser = j.value("client_user", "");
  rpt.oExpectedSizeBytes = getOptional<uint64_t>(j, "expected_size_bytes");
  rpt.oStartedAt = getOptional<double>(j, "started_at");
  rpt.oFinishedAt = getOptional<double>(j, "finished_at");
  rpt.oTransferRc = getOptional<int>(j, "transfer_rc");
  rpt.oCleanupRc = getOptional<int>(j, "cleanup_rc");
  return rpt;
}

}  // namespace ferry::common
