#include "api/AuthMiddleware.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ISessionStore.hpp"
#include "security/TokenCodec.hpp"

namespace sso::api {

namespace {
constexpr const char* kRejectMessage = "Invalid or expired session";
}

AuthMiddleware::AuthMiddleware(const sso::security::TokenCodec& tcCodec,
                               const sso::core::ISessionStore& ssStore)
    : _tcCodec(tcCodec), _ssStore(ssStore) {}

AuthMiddleware::~AuthMiddleware() = default;

common::RequestContext AuthMiddleware::authenticate(const std::string& sAuthHeader) const {
  const std::string kBearerPrefix = "Bearer ";
  if (sAuthHeader.size() <= kBearerPrefix.size() ||
      sAuthHeader.compare(0, kBearerPrefix.size(), kBearerPrefix) != 0) {
    throw common::AuthenticationError("missing_token", "Missing bearer token");
  }
  const auto nBegin = sAuthHeader.find_first_not_of(" \t", kBearerPrefix.size());
  if (nBegin == std::string::npos) {
    throw common::AuthenticationError("missing_token", "Missing bearer token");
  }
  const auto nEnd = sAuthHeader.find_last_not_of(" \t");
  std::string sToken = sAuthHeader.substr(nBegin, nEnd - nBegin + 1);

  sso::security::Claims clm;
  try {
    clm = _tcCodec.decode(sToken);
  } catch (const common::AuthenticationError& e) {
    // Expired and forged tokens look the same to the client
    common::Logger::get()->debug("Rejected token: {}", e._sErrorCode);
    throw common::AuthenticationError("invalid_token", kRejectMessage);
  }

  if (!_ssStore.isLive(clm.sSessionId)) {
    common::Logger::get()->debug("Rejected token for inactive session of user {}",
                                 clm.iUserId);
    throw common::AuthenticationError("session_revoked", kRejectMessage);
  }

  common::RequestContext rcCtx;
  rcCtx.iUserId = clm.iUserId;
  rcCtx.sSessionId = std::move(clm.sSessionId);
  return rcCtx;
}

}  // namespace sso::api
