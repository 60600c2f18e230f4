#pragma once

#include <string>
#include <vector>

namespace ferry::security {

/// Randomness and hashing helpers backed by OpenSSL.
/// Class abbreviation: cs
class CryptoService {
 public:
  CryptoService() = delete;

  /// Cryptographically random session token: 12 bytes → base64url (16 chars).
  static std::string generateToken();

  /// OpenSSH-style fingerprint of an authorized_keys line:
  /// "SHA256:" + unpadded base64 of SHA-256 over the decoded key blob.
  /// Throws ValidationError if the line has no decodable key blob.
  static std::string sshFingerprint(const std::string& sPublicKeyLine);

  /// SHA-256 digest of raw bytes.
  static std::vector<unsigned char> sha256(const std::vector<unsigned char>& vData);

  static std::string base64Encode(const std::vector<unsigned char>& vData);
  static std::vector<unsigned char> base64Decode(const std::string& sEncoded);
  static std::string base64UrlEncode(const std::vector<unsigned char>& vData);
};

}  // namespace ferry::security
