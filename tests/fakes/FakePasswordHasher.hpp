#pragma once

#include <atomic>
#include <string>

#include "security/IPasswordHasher.hpp"

namespace sso::test {

/// Reversible stand-in for Argon2 so service tests run without the KDF.
class FakePasswordHasher : public security::IPasswordHasher {
 public:
  std::string hash(const std::string& sPassword) const override { return "fake$" + sPassword; }

  bool verify(const std::string& sPassword, const std::string& sHash) const override {
    ++_iVerifyCalls;
    return sHash == "fake$" + sPassword;
  }

  int verifyCalls() const { return _iVerifyCalls.load(); }

 private:
  mutable std::atomic<int> _iVerifyCalls{0};
};

}  // namespace sso::test
