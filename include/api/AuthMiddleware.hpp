#pragma once

#include <string>

#include "common/Types.hpp"

namespace sso::core {
class ISessionStore;
}

namespace sso::security {
class TokenCodec;
}

namespace sso::api {

/// Bearer token validation; injects RequestContext with identity.
/// Read-only against the session store.
/// Class abbreviation: am
class AuthMiddleware {
 public:
  AuthMiddleware(const sso::security::TokenCodec& tcCodec,
                 const sso::core::ISessionStore& ssStore);
  ~AuthMiddleware();

  /// Authenticate a request from its Authorization header value.
  /// Throws AuthenticationError "missing_token", "invalid_token" or
  /// "session_revoked".
  common::RequestContext authenticate(const std::string& sAuthHeader) const;

 private:
  const sso::security::TokenCodec& _tcCodec;
  const sso::core::ISessionStore& _ssStore;
};

}  // namespace sso::api
