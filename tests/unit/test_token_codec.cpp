#include "security/TokenCodec.hpp"

#include "common/Errors.hpp"
#include "security/HmacJwtSigner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using sso::common::AuthenticationError;
using sso::security::HmacJwtSigner;
using sso::security::TokenCodec;

namespace {

int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

class TokenCodecTest : public ::testing::Test {
 protected:
  std::string decodeError(const std::string& sToken) const {
    try {
      _tcCodec.decode(sToken);
    } catch (const AuthenticationError& e) {
      return e._sErrorCode;
    }
    return {};
  }

  HmacJwtSigner _jsSigner{"token-codec-test-secret"};
  TokenCodec _tcCodec{_jsSigner};
};

TEST_F(TokenCodecTest, IssueThenDecodeYieldsClaims) {
  const auto iBefore = nowSeconds();
  std::string sToken = _tcCodec.issue(42, "session-1", std::chrono::seconds(3600));

  auto clm = _tcCodec.decode(sToken);
  EXPECT_EQ(clm.iUserId, 42);
  EXPECT_EQ(clm.sSessionId, "session-1");
  EXPECT_GE(clm.iIssuedAt, iBefore);
  EXPECT_EQ(clm.iExpiresAt, clm.iIssuedAt + 3600);
}

TEST_F(TokenCodecTest, SubjectIsDecimalString) {
  std::string sToken = _tcCodec.issue(7, "s", std::chrono::seconds(60));
  auto jPayload = _jsSigner.verify(sToken);
  EXPECT_TRUE(jPayload["sub"].is_string());
  EXPECT_EQ(jPayload["sub"], "7");
}

TEST_F(TokenCodecTest, DistinctSessionsGiveDistinctTokens) {
  auto sA = _tcCodec.issue(1, "session-a", std::chrono::seconds(60));
  auto sB = _tcCodec.issue(1, "session-b", std::chrono::seconds(60));
  EXPECT_NE(sA, sB);
}

TEST_F(TokenCodecTest, ExpiredTokenReportsExpired) {
  const auto iNow = nowSeconds();
  std::string sToken = _jsSigner.sign(
      {{"sub", "1"}, {"sid", "s"}, {"iat", iNow - 200}, {"exp", iNow - 100}});
  EXPECT_EQ(decodeError(sToken), "token_expired");
}

TEST_F(TokenCodecTest, ForeignSignatureIsMalformed) {
  HmacJwtSigner jsOther("another-secret");
  TokenCodec tcOther(jsOther);
  std::string sToken = tcOther.issue(1, "s", std::chrono::seconds(60));
  EXPECT_EQ(decodeError(sToken), "malformed_token");
}

TEST_F(TokenCodecTest, MissingSessionIdIsMalformed) {
  const auto iNow = nowSeconds();
  std::string sToken = _jsSigner.sign({{"sub", "1"}, {"iat", iNow}, {"exp", iNow + 60}});
  EXPECT_EQ(decodeError(sToken), "malformed_token");
}

TEST_F(TokenCodecTest, EmptySessionIdIsMalformed) {
  const auto iNow = nowSeconds();
  std::string sToken =
      _jsSigner.sign({{"sub", "1"}, {"sid", ""}, {"iat", iNow}, {"exp", iNow + 60}});
  EXPECT_EQ(decodeError(sToken), "malformed_token");
}

TEST_F(TokenCodecTest, NonNumericSubjectIsMalformed) {
  const auto iNow = nowSeconds();
  std::string sToken =
      _jsSigner.sign({{"sub", "alice"}, {"sid", "s"}, {"iat", iNow}, {"exp", iNow + 60}});
  EXPECT_EQ(decodeError(sToken), "malformed_token");
}

TEST_F(TokenCodecTest, IntegerSubjectIsMalformed) {
  const auto iNow = nowSeconds();
  std::string sToken =
      _jsSigner.sign({{"sub", 1}, {"sid", "s"}, {"iat", iNow}, {"exp", iNow + 60}});
  EXPECT_EQ(decodeError(sToken), "malformed_token");
}

TEST_F(TokenCodecTest, GarbageIsMalformed) {
  EXPECT_EQ(decodeError("garbage"), "malformed_token");
  EXPECT_EQ(decodeError(""), "malformed_token");
}
