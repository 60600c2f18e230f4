#include "security/CryptoService.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "common/Errors.hpp"
#include "support/TempDir.hpp"

using ferry::security::CryptoService;

TEST(CryptoServiceTest, TokenIsSixteenUrlSafeChars) {
  const std::string sToken = CryptoService::generateToken();
  ASSERT_EQ(sToken.size(), 16u);
  for (char c : sToken) {
    EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_')
        << "unexpected character '" << c << "' in " << sToken;
  }
}

TEST(CryptoServiceTest, TokensAreUnique) {
  std::set<std::string> setTokens;
  for (int i = 0; i < 1000; ++i) {
    setTokens.insert(CryptoService::generateToken());
  }
  EXPECT_EQ(setTokens.size(), 1000u);
}

TEST(CryptoServiceTest, Sha256KnownVector) {
  // SHA-256("abc")
  const std::string sInput = "abc";
  auto vHash = CryptoService::sha256(std::vector<unsigned char>(sInput.begin(), sInput.end()));
  EXPECT_EQ(CryptoService::base64Encode(vHash),
            "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");
}

TEST(CryptoServiceTest, Base64UrlEncodeStripsPaddingAndSwapsAlphabet) {
  const std::vector<unsigned char> vData = {0xfb, 0xff};
  EXPECT_EQ(CryptoService::base64Encode(vData), "+/8=");
  EXPECT_EQ(CryptoService::base64UrlEncode(vData), "-_8");
}

TEST(CryptoServiceTest, Base64DecodeReversesEncode) {
  const std::vector<unsigned char> vData = {'f', 'e', 'r', 'r', 'y', 0x00, 0x7f};
  EXPECT_EQ(CryptoService::base64Decode(CryptoService::base64Encode(vData)), vData);
}

TEST(CryptoServiceTest, FingerprintMatchesOpenSsh) {
  EXPECT_EQ(CryptoService::sshFingerprint(ferry::test::kTestPublicKey),
            ferry::test::kTestFingerprint);
}

TEST(CryptoServiceTest, FingerprintIgnoresComment) {
  const std::string sNoComment =
      "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIJ1B7beIX+IWGCxXh4p1dtfc8rZjQpv6YL/dJekgkHEx";
  EXPECT_EQ(CryptoService::sshFingerprint(sNoComment), ferry::test::kTestFingerprint);
}

TEST(CryptoServiceTest, FingerprintRejectsLineWithoutBlob) {
  EXPECT_THROW(CryptoService::sshFingerprint("ssh-ed25519"), ferry::common::ValidationError);
  EXPECT_THROW(CryptoService::sshFingerprint(""), ferry::common::ValidationError);
}

TEST(CryptoServiceTest, FingerprintRejectsInvalidBase64) {
  EXPECT_THROW(CryptoService::sshFingerprint("ssh-ed25519 !!!not-base64!!!"),
               ferry::common::ValidationError);
}
