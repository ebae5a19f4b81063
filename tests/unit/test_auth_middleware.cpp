#include "api/AuthMiddleware.hpp"

#include "common/Errors.hpp"
#include "core/InMemorySessionStore.hpp"
#include "security/HmacJwtSigner.hpp"
#include "security/TokenCodec.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using sso::api::AuthMiddleware;
using sso::common::AuthenticationError;
using sso::common::DeviceClass;

class AuthMiddlewareTest : public ::testing::Test {
 protected:
  /// Error code of a rejected header, or empty if admitted.
  std::string rejection(const std::string& sAuthHeader) const {
    try {
      _amMiddleware.authenticate(sAuthHeader);
    } catch (const AuthenticationError& e) {
      EXPECT_EQ(e._iHttpStatus, 401);
      return e._sErrorCode;
    }
    return {};
  }

  std::string bearerFor(int64_t iUserId, DeviceClass eClass) {
    auto sSessionId = _imsStore.create(iUserId, eClass, "device", "");
    return "Bearer " + _tcCodec.issue(iUserId, sSessionId, std::chrono::seconds(3600));
  }

  sso::core::InMemorySessionStore _imsStore;
  sso::security::HmacJwtSigner _jsSigner{"auth-middleware-test-secret"};
  sso::security::TokenCodec _tcCodec{_jsSigner};
  AuthMiddleware _amMiddleware{_tcCodec, _imsStore};
};

TEST_F(AuthMiddlewareTest, AdmitsLiveSession) {
  auto sSessionId = _imsStore.create(5, DeviceClass::Web, "device", "");
  auto sToken = _tcCodec.issue(5, sSessionId, std::chrono::seconds(3600));

  auto rcCtx = _amMiddleware.authenticate("Bearer " + sToken);
  EXPECT_EQ(rcCtx.iUserId, 5);
  EXPECT_EQ(rcCtx.sSessionId, sSessionId);
}

TEST_F(AuthMiddlewareTest, MissingOrMalformedHeaderIsMissingToken) {
  EXPECT_EQ(rejection(""), "missing_token");
  EXPECT_EQ(rejection("Bearer "), "missing_token");
  EXPECT_EQ(rejection("Bearer"), "missing_token");
  EXPECT_EQ(rejection("Basic dXNlcjpwYXNz"), "missing_token");
  EXPECT_EQ(rejection("bearer abc"), "missing_token");
}

TEST_F(AuthMiddlewareTest, BlankBearerTokenIsMissingToken) {
  EXPECT_EQ(rejection("Bearer    "), "missing_token");
  EXPECT_EQ(rejection("Bearer \t "), "missing_token");
}

TEST_F(AuthMiddlewareTest, SurroundingWhitespaceAroundTokenIsIgnored) {
  auto sHeader = bearerFor(6, DeviceClass::Mobile);
  auto rcCtx = _amMiddleware.authenticate("Bearer   " + sHeader.substr(7) + "  ");
  EXPECT_EQ(rcCtx.iUserId, 6);
}

TEST_F(AuthMiddlewareTest, GarbageTokenIsInvalidToken) {
  EXPECT_EQ(rejection("Bearer not.a.token"), "invalid_token");
  EXPECT_EQ(rejection("Bearer x"), "invalid_token");
}

TEST_F(AuthMiddlewareTest, ExpiredTokenIsInvalidToken) {
  auto sSessionId = _imsStore.create(5, DeviceClass::Web, "device", "");
  auto sToken = _tcCodec.issue(5, sSessionId, std::chrono::seconds(-10));
  EXPECT_EQ(rejection("Bearer " + sToken), "invalid_token");
}

TEST_F(AuthMiddlewareTest, ForeignSignatureIsInvalidToken) {
  sso::security::HmacJwtSigner jsOther("someone-else");
  sso::security::TokenCodec tcOther(jsOther);
  auto sSessionId = _imsStore.create(5, DeviceClass::Web, "device", "");
  EXPECT_EQ(rejection("Bearer " + tcOther.issue(5, sSessionId, std::chrono::seconds(60))),
            "invalid_token");
}

TEST_F(AuthMiddlewareTest, RevokedSessionIsSessionRevoked) {
  auto sHeader = bearerFor(5, DeviceClass::Web);
  EXPECT_EQ(rejection(sHeader), "");

  _imsStore.revokeAll(5);
  EXPECT_EQ(rejection(sHeader), "session_revoked");
}

TEST_F(AuthMiddlewareTest, UnknownSessionIsSessionRevoked) {
  auto sToken = _tcCodec.issue(5, "no-such-session", std::chrono::seconds(60));
  EXPECT_EQ(rejection("Bearer " + sToken), "session_revoked");
}

TEST_F(AuthMiddlewareTest, EvictedSessionIsRejected) {
  auto sOld = bearerFor(5, DeviceClass::Mobile);
  auto sNew = bearerFor(5, DeviceClass::Mobile);
  EXPECT_EQ(rejection(sOld), "session_revoked");
  EXPECT_EQ(rejection(sNew), "");
}

TEST_F(AuthMiddlewareTest, RejectionMessagesDoNotDistinguishCauses) {
  std::string sInvalid;
  std::string sRevoked;
  try {
    _amMiddleware.authenticate("Bearer garbage");
  } catch (const AuthenticationError& e) {
    sInvalid = e.what();
  }
  auto sHeader = bearerFor(6, DeviceClass::Web);
  _imsStore.revokeAll(6);
  try {
    _amMiddleware.authenticate(sHeader);
  } catch (const AuthenticationError& e) {
    sRevoked = e.what();
  }
  EXPECT_EQ(sInvalid, "Invalid or expired session");
  EXPECT_EQ(sInvalid, sRevoked);
}

TEST_F(AuthMiddlewareTest, DoesNotMutateStore) {
  auto sHeader = bearerFor(7, DeviceClass::Web);
  const auto nBefore = _imsStore.size();
  for (int i = 0; i < 10; ++i) {
    _amMiddleware.authenticate(sHeader);
  }
  EXPECT_EQ(_imsStore.size(), nBefore);
  EXPECT_EQ(_imsStore.listLive(7).size(), 1u);
}
