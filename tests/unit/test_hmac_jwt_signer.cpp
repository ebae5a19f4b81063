#include "security/HmacJwtSigner.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using sso::common::AuthenticationError;
using sso::security::HmacJwtSigner;

static const std::string kTestSecret = "super-secret-jwt-key-for-testing";

namespace {

int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string errorCodeOf(const HmacJwtSigner& signer, const std::string& sToken) {
  try {
    signer.verify(sToken);
  } catch (const AuthenticationError& e) {
    return e._sErrorCode;
  }
  return {};
}

}  // namespace

TEST(HmacJwtSignerTest, SignVerifyRoundtrip) {
  HmacJwtSigner signer(kTestSecret);
  const auto iNow = nowSeconds();

  nlohmann::json jPayload = {
      {"sub", "42"}, {"sid", "abc"}, {"iat", iNow}, {"exp", iNow + 3600}};
  std::string sToken = signer.sign(jPayload);

  // Token should have 3 parts separated by dots
  int iDots = 0;
  for (char c : sToken) {
    if (c == '.') ++iDots;
  }
  EXPECT_EQ(iDots, 2);

  nlohmann::json jVerified = signer.verify(sToken);
  EXPECT_EQ(jVerified["sub"], "42");
  EXPECT_EQ(jVerified["sid"], "abc");
  EXPECT_EQ(jVerified["iat"], iNow);
  EXPECT_EQ(jVerified["exp"], iNow + 3600);
}

TEST(HmacJwtSignerTest, TokenUsesBase64UrlAlphabet) {
  HmacJwtSigner signer(kTestSecret);
  // Payload chosen so that plain base64 would contain '+' or '/'
  nlohmann::json jPayload = {{"sub", "??>>??"}, {"exp", nowSeconds() + 60}};
  std::string sToken = signer.sign(jPayload);
  EXPECT_EQ(sToken.find_first_of("+/="), std::string::npos);
  EXPECT_EQ(signer.verify(sToken)["sub"], "??>>??");
}

TEST(HmacJwtSignerTest, ExpiredTokenThrowsTokenExpired) {
  HmacJwtSigner signer(kTestSecret);
  std::string sToken = signer.sign({{"sub", "1"}, {"exp", nowSeconds() - 100}});
  EXPECT_EQ(errorCodeOf(signer, sToken), "token_expired");
}

TEST(HmacJwtSignerTest, TamperedPayloadIsMalformed) {
  HmacJwtSigner signer(kTestSecret);
  std::string sToken = signer.sign({{"sub", "1"}, {"exp", nowSeconds() + 3600}});

  auto nFirstDot = sToken.find('.');
  std::string sTampered = sToken;
  sTampered[nFirstDot + 1] = (sTampered[nFirstDot + 1] == 'A') ? 'B' : 'A';

  EXPECT_EQ(errorCodeOf(signer, sTampered), "malformed_token");
}

TEST(HmacJwtSignerTest, WrongSecretRejects) {
  HmacJwtSigner signer1(kTestSecret);
  HmacJwtSigner signer2("different-secret-key");

  std::string sToken = signer1.sign({{"sub", "1"}, {"exp", nowSeconds() + 3600}});
  EXPECT_THROW(signer2.verify(sToken), AuthenticationError);
}

TEST(HmacJwtSignerTest, MalformedTokenThrows) {
  HmacJwtSigner signer(kTestSecret);

  EXPECT_EQ(errorCodeOf(signer, "not-a-jwt"), "malformed_token");
  EXPECT_EQ(errorCodeOf(signer, "only.one-dot"), "malformed_token");
  EXPECT_EQ(errorCodeOf(signer, "too.many.dots.here"), "malformed_token");
  EXPECT_EQ(errorCodeOf(signer, ""), "malformed_token");
}

TEST(HmacJwtSignerTest, NonIntegerExpIsMalformed) {
  HmacJwtSigner signer(kTestSecret);
  std::string sToken = signer.sign({{"sub", "1"}, {"exp", "tomorrow"}});
  EXPECT_EQ(errorCodeOf(signer, sToken), "malformed_token");
}

TEST(HmacJwtSignerTest, EmptySecretIsRejected) {
  EXPECT_THROW(HmacJwtSigner(""), std::runtime_error);
}
