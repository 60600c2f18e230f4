#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ferry::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: missing or empty required field. The session stays usable.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: unknown token, or a record that cannot be parsed.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: token already exists, or a state transition that is not allowed.
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: ephemeral keypair could not be generated.
/// Fatal to session creation.
struct KeygenError : AppError {
  explicit KeygenError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: an external tool could not be started at all.
/// A non-zero exit code is not a LaunchError.
struct LaunchError : AppError {
  explicit LaunchError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ferry::common
