#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace ferry::core {
class IProcessRunner;
}

namespace ferry::security {

/// Result of one key generation. The private key never leaves the session directory.
/// Class abbreviation: ik
struct IssuedKey {
  std::string sPrivateKeyPath;
  std::string sPublicKey;  // single authorized_keys line
};

/// Issues one ephemeral ed25519 keypair per session through ssh-keygen.
/// Class abbreviation: ki
class KeyIssuer {
 public:
  static constexpr const char* kPrivateKeyFile = "id_ed25519";
  static constexpr const char* kPublicKeyFile = "id_ed25519.pub";
  static constexpr const char* kKeygenLogFile = "keygen.log";

  KeyIssuer(core::IProcessRunner& prRunner, std::string sKeygenBin,
            std::chrono::seconds durTimeout = std::chrono::seconds(0));
  ~KeyIssuer();

  /// Remove any existing key files under pathSession, then generate a fresh
  /// pair with no passphrase. sComment is embedded in the public key.
  /// Throws KeygenError if the tool cannot start, exits non-zero, or leaves
  /// no readable public key.
  IssuedKey issue(const std::filesystem::path& pathSession, const std::string& sComment) const;

 private:
  core::IProcessRunner& _prRunner;
  std::string _sKeygenBin;
  std::chrono::seconds _durTimeout;
};

}  // namespace ferry::security
