#pragma once

#include <string>

namespace sso::core {

/// Random RFC 4122 version-4 UUID in canonical lower-case form, drawn from
/// OpenSSL's CSPRNG. Throws std::runtime_error if RAND_bytes fails.
std::string generateSessionId();

}  // namespace sso::core
