#include "security/HmacJwtSigner.hpp"

#include "common/Errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <stdexcept>
#include <vector>

namespace sso::security {

namespace {

const char* const kMalformed = "malformed_token";

// ── Base64url encode/decode ────────────────────────────────────────────────

std::string base64UrlEncode(const unsigned char* pData, size_t nLen) {
  // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
  std::vector<unsigned char> vOut(4 * ((nLen + 2) / 3) + 1);
  const int iOutLen = EVP_EncodeBlock(vOut.data(), pData, static_cast<int>(nLen));

  std::string sB64(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iOutLen));
  for (auto& c : sB64) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!sB64.empty() && sB64.back() == '=') {
    sB64.pop_back();
  }
  return sB64;
}

std::string base64UrlEncode(const std::string& sInput) {
  return base64UrlEncode(reinterpret_cast<const unsigned char*>(sInput.data()), sInput.size());
}

std::string base64UrlDecode(const std::string& sInput) {
  std::string sB64 = sInput;
  for (auto& c : sB64) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
    else if (c == '+' || c == '/' || c == '=') {
      throw common::AuthenticationError(kMalformed, "Token segment is not base64url");
    }
  }
  size_t nPadding = 0;
  while (sB64.size() % 4 != 0) {
    sB64 += '=';
    ++nPadding;
  }
  if (nPadding == 3) {
    throw common::AuthenticationError(kMalformed, "Token segment has invalid length");
  }

  std::vector<unsigned char> vOut(sB64.size());
  const int iOutLen = EVP_DecodeBlock(vOut.data(),
                                      reinterpret_cast<const unsigned char*>(sB64.data()),
                                      static_cast<int>(sB64.size()));
  if (iOutLen < 0) {
    throw common::AuthenticationError(kMalformed, "Failed to decode token segment");
  }
  // EVP_DecodeBlock keeps the zero bytes produced by padding.
  return std::string(reinterpret_cast<char*>(vOut.data()),
                     static_cast<size_t>(iOutLen) - nPadding);
}

}  // anonymous namespace

// ── HmacJwtSigner ──────────────────────────────────────────────────────────

HmacJwtSigner::HmacJwtSigner(const std::string& sSecret) : _sSecret(sSecret) {
  if (_sSecret.empty()) {
    throw std::runtime_error("JWT secret cannot be empty");
  }
}

HmacJwtSigner::~HmacJwtSigner() {
  if (!_sSecret.empty()) {
    OPENSSL_cleanse(_sSecret.data(), _sSecret.size());
  }
}

std::string HmacJwtSigner::signatureFor(const std::string& sSigningInput) const {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  unsigned char* pResult = HMAC(
      EVP_sha256(),
      _sSecret.data(), static_cast<int>(_sSecret.size()),
      reinterpret_cast<const unsigned char*>(sSigningInput.data()),
      sSigningInput.size(),
      vHash, &uHashLen);

  if (!pResult) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  return base64UrlEncode(vHash, uHashLen);
}

std::string HmacJwtSigner::sign(const nlohmann::json& jPayload) const {
  const nlohmann::json jHeader = {{"alg", "HS256"}, {"typ", "JWT"}};

  const std::string sSigningInput =
      base64UrlEncode(jHeader.dump()) + "." + base64UrlEncode(jPayload.dump());

  return sSigningInput + "." + signatureFor(sSigningInput);
}

nlohmann::json HmacJwtSigner::verify(const std::string& sToken) const {
  const auto nDot1 = sToken.find('.');
  if (nDot1 == std::string::npos) {
    throw common::AuthenticationError(kMalformed, "Malformed JWT: missing first dot");
  }
  const auto nDot2 = sToken.find('.', nDot1 + 1);
  if (nDot2 == std::string::npos) {
    throw common::AuthenticationError(kMalformed, "Malformed JWT: missing second dot");
  }
  if (sToken.find('.', nDot2 + 1) != std::string::npos) {
    throw common::AuthenticationError(kMalformed, "Malformed JWT: too many dots");
  }

  const std::string sSigningInput = sToken.substr(0, nDot2);
  const std::string sProvidedSig = sToken.substr(nDot2 + 1);
  const std::string sExpectedSig = signatureFor(sSigningInput);

  // Constant-time comparison
  if (sExpectedSig.size() != sProvidedSig.size() ||
      CRYPTO_memcmp(sExpectedSig.data(), sProvidedSig.data(), sExpectedSig.size()) != 0) {
    throw common::AuthenticationError(kMalformed, "JWT signature verification failed");
  }

  nlohmann::json jHeader;
  nlohmann::json jPayload;
  try {
    jHeader = nlohmann::json::parse(base64UrlDecode(sToken.substr(0, nDot1)));
    jPayload = nlohmann::json::parse(base64UrlDecode(sToken.substr(nDot1 + 1, nDot2 - nDot1 - 1)));
  } catch (const nlohmann::json::exception&) {
    throw common::AuthenticationError(kMalformed, "JWT segment is not valid JSON");
  }

  if (!jHeader.is_object() || jHeader.value("alg", "") != "HS256") {
    throw common::AuthenticationError(kMalformed, "Unsupported JWT algorithm");
  }
  if (!jPayload.is_object()) {
    throw common::AuthenticationError(kMalformed, "JWT payload is not an object");
  }

  if (jPayload.contains("exp")) {
    if (!jPayload["exp"].is_number_integer()) {
      throw common::AuthenticationError(kMalformed, "JWT exp claim is not an integer");
    }
    const auto iExp = jPayload["exp"].get<int64_t>();
    const auto iNow = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    if (iNow > iExp) {
      throw common::AuthenticationError("token_expired", "JWT has expired");
    }
  }

  return jPayload;
}

}  // namespace sso::security
