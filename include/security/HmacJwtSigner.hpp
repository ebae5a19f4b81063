#pragma once

#include <string>

#include "security/IJwtSigner.hpp"

namespace sso::security {

/// HS256 JWT signing implementation using OpenSSL HMAC.
/// Class abbreviation: js
class HmacJwtSigner : public IJwtSigner {
 public:
  /// Throws std::runtime_error if the secret is empty.
  explicit HmacJwtSigner(const std::string& sSecret);
  ~HmacJwtSigner() override;

  HmacJwtSigner(const HmacJwtSigner&) = delete;
  HmacJwtSigner& operator=(const HmacJwtSigner&) = delete;

  std::string sign(const nlohmann::json& jPayload) const override;
  nlohmann::json verify(const std::string& sToken) const override;

 private:
  std::string signatureFor(const std::string& sSigningInput) const;

  std::string _sSecret;
};

}  // namespace sso::security
