#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace sso::security {

/// Pure abstract interface for compact JWS signing and verification.
class IJwtSigner {
 public:
  virtual ~IJwtSigner() = default;

  /// Serialize and sign the payload; returns header.payload.signature.
  virtual std::string sign(const nlohmann::json& jPayload) const = 0;

  /// Check signature, structure and "exp"; returns the decoded payload.
  /// Throws AuthenticationError ("malformed_token" or "token_expired").
  virtual nlohmann::json verify(const std::string& sToken) const = 0;
};

}  // namespace sso::security
