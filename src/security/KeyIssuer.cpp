#include "security/KeyIssuer.hpp"

#include "common/Errors.hpp"
#include "common/FileUtil.hpp"
#include "common/Logger.hpp"
#include "core/IProcessRunner.hpp"

#include <system_error>

namespace ferry::security {

namespace fs = std::filesystem;

KeyIssuer::KeyIssuer(core::IProcessRunner& prRunner, std::string sKeygenBin,
                     std::chrono::seconds durTimeout)
    : _prRunner(prRunner), _sKeygenBin(std::move(sKeygenBin)), _durTimeout(durTimeout) {}

KeyIssuer::~KeyIssuer() = default;

IssuedKey KeyIssuer::issue(const fs::path& pathSession, const std::string& sComment) const {
  auto spLog = common::Logger::get();
  const auto pathPrivate = pathSession / kPrivateKeyFile;
  const auto pathPublic = pathSession / kPublicKeyFile;

  // ssh-keygen refuses to overwrite without a prompt; stale keys must never survive
  for (const auto& path : {pathPrivate, pathPublic}) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      throw common::KeygenError("keygen_failed",
                                "Cannot remove old key file " + path.string() + ": " +
                                    ec.message());
    }
  }

  core::ProcessSpec psSpec;
  psSpec.sCommand = _sKeygenBin;
  psSpec.vArgs = {"-q", "-t", "ed25519", "-f", pathPrivate.string(), "-N", "", "-C", sComment};
  psSpec.pathLog = pathSession / kKeygenLogFile;
  psSpec.durTimeout = _durTimeout;

  core::ProcessResult pres;
  try {
    pres = _prRunner.run(psSpec);
  } catch (const common::LaunchError& ex) {
    throw common::KeygenError("keygen_failed", ex.what());
  }

  if (pres.bTimedOut || pres.iExitCode != 0) {
    throw common::KeygenError("keygen_failed",
                              _sKeygenBin + " exited with code " +
                                  std::to_string(pres.iExitCode) +
                                  (pres.bTimedOut ? " (timed out)" : ""));
  }

  auto oPublic = common::readFile(pathPublic);
  const std::string sPublicKey = oPublic ? common::trim(*oPublic) : std::string{};
  if (sPublicKey.empty()) {
    throw common::KeygenError("keygen_failed",
                              "No readable public key at " + pathPublic.string());
  }

  spLog->info("Issued ephemeral ed25519 key in {}", pathSession.string());
  return IssuedKey{pathPrivate.string(), sPublicKey};
}

}  // namespace ferry::security
