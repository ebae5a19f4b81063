#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sso::security {

class IJwtSigner;

/// Claims carried by a session bearer token.
/// Class abbreviation: clm
struct Claims {
  int64_t iUserId = 0;
  std::string sSessionId;
  int64_t iIssuedAt = 0;   // seconds since epoch
  int64_t iExpiresAt = 0;  // seconds since epoch
};

/// Mints and parses bearer tokens bound to one session. Stateless; revocation
/// is checked by the caller against the session store.
/// Class abbreviation: tc
class TokenCodec {
 public:
  explicit TokenCodec(const IJwtSigner& jsSigner);
  ~TokenCodec();

  /// Sign {sub, sid, iat, exp = iat + ttl}.
  std::string issue(int64_t iUserId, const std::string& sSessionId,
                    std::chrono::seconds durTtl) const;

  /// Verify signature and expiry and extract the claims.
  /// Throws AuthenticationError "token_expired" or "malformed_token".
  Claims decode(const std::string& sToken) const;

 private:
  const IJwtSigner& _jsSigner;
};

}  // namespace sso::security
