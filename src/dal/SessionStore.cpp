#include "dal/SessionStore.hpp"

#include "common/Errors.hpp"
#include "common/FileUtil.hpp"
#include "common/Logger.hpp"
#include "common/Serialization.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <deque>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace ferry::dal {

namespace fs = std::filesystem;

SessionStore::SessionStore(fs::path pathRoot) {
  std::error_code ec;
  // Key paths are written into inventories; keep them absolute
  _pathRoot = fs::absolute(pathRoot, ec);
  if (ec) {
    throw std::runtime_error("Cannot resolve sessions directory " + pathRoot.string() + ": " +
                             ec.message());
  }
  fs::create_directories(_pathRoot, ec);
  if (ec) {
    throw std::runtime_error("Cannot create sessions directory " + _pathRoot.string() + ": " +
                             ec.message());
  }
}

SessionStore::~SessionStore() = default;

bool SessionStore::isValidToken(const std::string& sToken) {
  if (sToken.empty() || sToken.size() > 128) {
    return false;
  }
  return std::all_of(sToken.begin(), sToken.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
  });
}

fs::path SessionStore::sessionPath(const std::string& sToken) const {
  if (!isValidToken(sToken)) {
    throw common::NotFoundError("session_not_found", "Invalid or expired token");
  }
  return _pathRoot / sToken;
}

bool SessionStore::exists(const std::string& sToken) const {
  if (!isValidToken(sToken)) {
    return false;
  }
  std::error_code ec;
  return fs::exists(_pathRoot / sToken / kMetaFile, ec);
}

common::Session SessionStore::create(const std::string& sToken, common::Session sessInitial) {
  if (!isValidToken(sToken)) {
    throw common::ValidationError("invalid_token", "Token is not a valid storage key");
  }
  const auto pathSession = _pathRoot / sToken;

  std::error_code ec;
  if (!fs::create_directory(pathSession, ec)) {
    if (ec) {
      throw std::runtime_error("Cannot create session directory " + pathSession.string() +
                               ": " + ec.message());
    }
    throw common::ConflictError("session_exists", "Session " + sToken + " already exists");
  }
  fs::permissions(pathSession, fs::perms::owner_all, ec);

  sessInitial.sToken = sToken;
  save(sessInitial);
  return sessInitial;
}

common::Session SessionStore::load(const std::string& sToken) const {
  const auto pathMeta = sessionPath(sToken) / kMetaFile;
  auto oContent = common::readFile(pathMeta);
  if (!oContent) {
    throw common::NotFoundError("session_not_found", "Invalid or expired token");
  }

  try {
    auto sess = common::sessionFromJson(nlohmann::json::parse(*oContent));
    if (sess.sToken != sToken) {
      throw std::invalid_argument("token field does not match directory");
    }
    return sess;
  } catch (const nlohmann::json::exception& ex) {
    common::Logger::get()->warn("Unreadable session record {}: {}", pathMeta.string(),
                                ex.what());
  } catch (const std::invalid_argument& ex) {
    common::Logger::get()->warn("Invalid session record {}: {}", pathMeta.string(), ex.what());
  }
  throw common::NotFoundError("session_not_found", "Session record is unreadable");
}

void SessionStore::save(const common::Session& sess) const {
  const auto pathMeta = sessionPath(sess.sToken) / kMetaFile;
  common::writeFileAtomic(pathMeta, common::sessionToJson(sess).dump(2) + "\n", 0600);
}

void SessionStore::saveReport(const common::Report& rpt) const {
  const auto pathReport = sessionPath(rpt.sToken) / kReportFile;
  common::writeFileAtomic(pathReport, common::reportToJson(rpt).dump(2) + "\n", 0600);
}

std::optional<common::Report> SessionStore::loadReport(const std::string& sToken) const {
  const auto pathReport = sessionPath(sToken) / kReportFile;
  auto oContent = common::readFile(pathReport);
  if (!oContent) {
    return std::nullopt;
  }
  try {
    return common::reportFromJson(nlohmann::json::parse(*oContent));
  } catch (const std::exception& ex) {
    common::Logger::get()->warn("Unreadable report {}: {}", pathReport.string(), ex.what());
    return std::nullopt;
  }
}

std::string SessionStore::tailLog(const std::string& sToken, const std::string& sFileName,
                                  int iLines) const {
  std::ifstream ifs(sessionPath(sToken) / sFileName, std::ios::binary);
  if (!ifs.is_open() || iLines <= 0) {
    return {};
  }

  std::deque<std::string> dqLines;
  std::string sLine;
  while (std::getline(ifs, sLine)) {
    dqLines.push_back(std::move(sLine));
    if (dqLines.size() > static_cast<size_t>(iLines)) {
      dqLines.pop_front();
    }
  }

  std::string sResult;
  for (size_t i = 0; i < dqLines.size(); ++i) {
    if (i > 0) sResult += '\n';
    sResult += dqLines[i];
  }
  return sResult;
}

std::vector<std::string> SessionStore::listTokens() const {
  std::vector<std::string> vTokens;
  std::error_code ec;
  for (fs::directory_iterator it(_pathRoot, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string sName = it->path().filename().string();
    if (isValidToken(sName) && exists(sName)) {
      vTokens.push_back(sName);
    }
  }
  if (ec) {
    common::Logger::get()->warn("Cannot list sessions in {}: {}", _pathRoot.string(),
                                ec.message());
  }
  std::sort(vTokens.begin(), vTokens.end());
  return vTokens;
}

}  // namespace ferry::dal
