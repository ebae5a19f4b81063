#include "core/SessionId.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sso::core {

std::string generateSessionId() {
  unsigned char vBytes[16];
  if (RAND_bytes(vBytes, sizeof(vBytes)) != 1) {
    throw std::runtime_error("Failed to generate random bytes for session id");
  }
  vBytes[6] = static_cast<unsigned char>((vBytes[6] & 0x0F) | 0x40);  // version 4
  vBytes[8] = static_cast<unsigned char>((vBytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
    oss << std::setw(2) << static_cast<int>(vBytes[i]);
  }
  return oss.str();
}

}  // namespace sso::core
