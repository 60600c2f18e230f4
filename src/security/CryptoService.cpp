#include "security/CryptoService.hpp"

#include "common/Errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <sstream>
#include <stdexcept>

namespace ferry::security {

namespace {
constexpr int kTokenBytes = 12;  // 12 random bytes → 16 base64url chars
}  // namespace

// ── Base64 encode/decode ───────────────────────────────────────────────────

std::string CryptoService::base64Encode(const std::vector<unsigned char>& vData) {
  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }

  EVP_EncodeInit(pCtx);

  // Output buffer: 4/3 * input + padding + newlines + null
  const int iMaxOut = static_cast<int>(vData.size()) * 2 + 64;
  std::vector<unsigned char> vOut(static_cast<size_t>(iMaxOut));
  int iOutLen = 0;
  int iTotalLen = 0;

  if (EVP_EncodeUpdate(pCtx, vOut.data(), &iOutLen, vData.data(),
                       static_cast<int>(vData.size())) != 1 && !vData.empty()) {
    EVP_ENCODE_CTX_free(pCtx);
    throw std::runtime_error("Base64 encode failed");
  }
  iTotalLen += iOutLen;

  EVP_EncodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  iTotalLen += iOutLen;

  EVP_ENCODE_CTX_free(pCtx);

  std::string sResult(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iTotalLen));
  // EVP_Encode wraps lines every 64 chars
  std::erase(sResult, '\n');
  return sResult;
}

std::vector<unsigned char> CryptoService::base64Decode(const std::string& sEncoded) {
  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }

  EVP_DecodeInit(pCtx);

  std::vector<unsigned char> vOut(sEncoded.size() + 3);
  int iOutLen = 0;
  int iTotalLen = 0;

  int iRet = EVP_DecodeUpdate(pCtx, vOut.data(), &iOutLen,
                              reinterpret_cast<const unsigned char*>(sEncoded.data()),
                              static_cast<int>(sEncoded.size()));
  if (iRet < 0) {
    EVP_ENCODE_CTX_free(pCtx);
    throw std::runtime_error("Base64 decode failed");
  }
  iTotalLen += iOutLen;

  iRet = EVP_DecodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  EVP_ENCODE_CTX_free(pCtx);
  if (iRet < 0) {
    throw std::runtime_error("Base64 decode failed");
  }
  iTotalLen += iOutLen;

  vOut.resize(static_cast<size_t>(iTotalLen));
  return vOut;
}

std::string CryptoService::base64UrlEncode(const std::vector<unsigned char>& vData) {
  std::string sB64 = base64Encode(vData);
  // Convert to base64url: + → -, / → _, remove trailing =
  for (auto& c : sB64) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!sB64.empty() && sB64.back() == '=') {
    sB64.pop_back();
  }
  return sB64;
}

// ── Tokens ─────────────────────────────────────────────────────────────────

std::string CryptoService::generateToken() {
  std::vector<unsigned char> vBytes(kTokenBytes);
  if (RAND_bytes(vBytes.data(), kTokenBytes) != 1) {
    throw std::runtime_error("Failed to generate random bytes for session token");
  }
  return base64UrlEncode(vBytes);
}

// ── Hashing ────────────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::sha256(const std::vector<unsigned char>& vData) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, vData.data(), vData.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);
  return std::vector<unsigned char>(vHash, vHash + uHashLen);
}

std::string CryptoService::sshFingerprint(const std::string& sPublicKeyLine) {
  // authorized_keys line: <type> <base64 blob> [comment]
  std::istringstream iss(sPublicKeyLine);
  std::string sType;
  std::string sBlob;
  iss >> sType >> sBlob;
  if (sType.empty() || sBlob.empty()) {
    throw common::ValidationError("invalid_public_key", "Public key line has no key blob");
  }

  std::vector<unsigned char> vBlob;
  try {
    vBlob = base64Decode(sBlob);
  } catch (const std::runtime_error&) {
    throw common::ValidationError("invalid_public_key", "Public key blob is not valid base64");
  }
  if (vBlob.empty()) {
    throw common::ValidationError("invalid_public_key", "Public key blob is empty");
  }

  std::string sDigest = base64Encode(sha256(vBlob));
  while (!sDigest.empty() && sDigest.back() == '=') {
    sDigest.pop_back();
  }
  return "SHA256:" + sDigest;
}

}  // namespace ferry::security
