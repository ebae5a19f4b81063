#include "security/TokenCodec.hpp"

#include "common/Errors.hpp"
#include "security/IJwtSigner.hpp"

#include <nlohmann/json.hpp>

namespace sso::security {

TokenCodec::TokenCodec(const IJwtSigner& jsSigner) : _jsSigner(jsSigner) {}

TokenCodec::~TokenCodec() = default;

std::string TokenCodec::issue(int64_t iUserId, const std::string& sSessionId,
                              std::chrono::seconds durTtl) const {
  const auto iNow = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();

  nlohmann::json jPayload = {
      {"sub", std::to_string(iUserId)},
      {"sid", sSessionId},
      {"iat", iNow},
      {"exp", iNow + durTtl.count()},
  };
  return _jsSigner.sign(jPayload);
}

Claims TokenCodec::decode(const std::string& sToken) const {
  const nlohmann::json jPayload = _jsSigner.verify(sToken);

  // Every token minted by issue() carries all four claims; anything else was
  // not produced by this service.
  if (!jPayload.contains("sub") || !jPayload["sub"].is_string() ||
      !jPayload.contains("sid") || !jPayload["sid"].is_string() ||
      !jPayload.contains("iat") || !jPayload["iat"].is_number_integer() ||
      !jPayload.contains("exp") || !jPayload["exp"].is_number_integer()) {
    throw common::AuthenticationError("malformed_token", "Token claims are incomplete");
  }

  Claims clm;
  const std::string sSub = jPayload["sub"].get<std::string>();
  size_t nParsed = 0;
  try {
    clm.iUserId = std::stoll(sSub, &nParsed);
  } catch (const std::logic_error&) {
    nParsed = 0;
  }
  if (sSub.empty() || nParsed != sSub.size()) {
    throw common::AuthenticationError("malformed_token", "Token subject is not a user id");
  }

  clm.sSessionId = jPayload["sid"].get<std::string>();
  if (clm.sSessionId.empty()) {
    throw common::AuthenticationError("malformed_token", "Token session id is empty");
  }
  clm.iIssuedAt = jPayload["iat"].get<int64_t>();
  clm.iExpiresAt = jPayload["exp"].get<int64_t>();
  return clm;
}

}  // namespace sso::security
