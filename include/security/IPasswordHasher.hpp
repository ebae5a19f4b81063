#pragma once

#include <string>

namespace sso::security {

/// Pure abstract interface for password hashing.
class IPasswordHasher {
 public:
  virtual ~IPasswordHasher() = default;

  /// Hash a plaintext password into a self-describing string.
  virtual std::string hash(const std::string& sPassword) const = 0;

  /// True if the plaintext matches the stored hash. Never throws on a
  /// malformed hash; that is a mismatch.
  virtual bool verify(const std::string& sPassword, const std::string& sHash) const = 0;
};

}  // namespace sso::security
