#pragma once

#include <string>

#include "security/IPasswordHasher.hpp"

namespace sso::security {

/// Argon2id password hashing through OpenSSL's EVP_KDF "ARGON2ID".
/// Output is a PHC string: $argon2id$v=19$m=65536,t=3,p=1$<salt>$<hash>
/// Requires an OpenSSL 3.2+ runtime; hash() throws std::runtime_error otherwise.
/// Class abbreviation: ph
class Argon2PasswordHasher : public IPasswordHasher {
 public:
  Argon2PasswordHasher();
  ~Argon2PasswordHasher() override;

  std::string hash(const std::string& sPassword) const override;
  bool verify(const std::string& sPassword, const std::string& sHash) const override;

  /// True when the linked OpenSSL provides the ARGON2ID KDF.
  static bool isAvailable();
};

}  // namespace sso::security
