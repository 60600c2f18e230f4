#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ferry::dal {

/// File-backed session records under <root>/<token>/.
/// Every save replaces meta.json atomically; no history is kept.
/// Class abbreviation: ss
class SessionStore {
 public:
  static constexpr const char* kMetaFile = "meta.json";
  static constexpr const char* kReportFile = "report.json";

  /// Creates the root directory if it does not exist.
  explicit SessionStore(std::filesystem::path pathRoot);
  ~SessionStore();

  /// Create the token's directory and write the initial record.
  /// Throws ConflictError if the token's directory already exists.
  common::Session create(const std::string& sToken, common::Session sessInitial);

  /// Throws NotFoundError if there is no record or it cannot be parsed.
  common::Session load(const std::string& sToken) const;

  /// Overwrite the full record. Callers pass the complete, merged session.
  void save(const common::Session& sess) const;

  bool exists(const std::string& sToken) const;

  /// Directory holding all of a session's files.
  /// Throws NotFoundError if sToken is not a valid storage key.
  std::filesystem::path sessionPath(const std::string& sToken) const;

  void saveReport(const common::Report& rpt) const;
  std::optional<common::Report> loadReport(const std::string& sToken) const;

  /// Last iLines lines of a session log file, or "" if it does not exist yet.
  std::string tailLog(const std::string& sToken, const std::string& sFileName,
                      int iLines) const;

  /// Tokens of all directories that hold a metadata record, sorted.
  std::vector<std::string> listTokens() const;

  /// Tokens are URL-safe base64: [A-Za-z0-9_-]+
  static bool isValidToken(const std::string& sToken);

  const std::filesystem::path& root() const { return _pathRoot; }

 private:
  std::filesystem::path _pathRoot;
};

}  // namespace ferry::dal
