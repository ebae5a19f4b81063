#include "security/Argon2PasswordHasher.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sso::security {

namespace {

constexpr uint32_t kMemoryCost = 65536;  // 64 MiB
constexpr uint32_t kTimeCost = 3;
constexpr uint32_t kParallelism = 1;
constexpr int kSaltLen = 16;
constexpr int kHashLen = 32;

// Parameter names of the ARGON2ID KDF (OSSL_KDF_PARAM_* in OpenSSL 3.2 headers).
constexpr const char* kParamPassword = "pass";
constexpr const char* kParamSalt = "salt";
constexpr const char* kParamIter = "iter";
constexpr const char* kParamMemCost = "memcost";
constexpr const char* kParamThreads = "threads";
constexpr const char* kParamLanes = "lanes";

std::string base64NoPad(const std::vector<unsigned char>& vData) {
  std::vector<unsigned char> vOut(4 * ((vData.size() + 2) / 3) + 1);
  const int iLen = EVP_EncodeBlock(vOut.data(), vData.data(), static_cast<int>(vData.size()));
  std::string sOut(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iLen));
  while (!sOut.empty() && sOut.back() == '=') {
    sOut.pop_back();
  }
  return sOut;
}

std::optional<std::vector<unsigned char>> base64NoPadDecode(const std::string& sEncoded) {
  std::string sB64 = sEncoded;
  size_t nPadding = 0;
  while (sB64.size() % 4 != 0) {
    sB64 += '=';
    ++nPadding;
  }
  std::vector<unsigned char> vOut(sB64.size());
  const int iLen = EVP_DecodeBlock(vOut.data(),
                                   reinterpret_cast<const unsigned char*>(sB64.data()),
                                   static_cast<int>(sB64.size()));
  if (iLen < 0 || static_cast<size_t>(iLen) < nPadding) {
    return std::nullopt;
  }
  vOut.resize(static_cast<size_t>(iLen) - nPadding);
  return vOut;
}

/// Run ARGON2ID; returns false if the KDF is unavailable or fails.
bool deriveArgon2id(const std::string& sPassword, std::vector<unsigned char>& vSalt,
                    uint32_t uTime, uint32_t uMemory, uint32_t uParallelism,
                    std::vector<unsigned char>& vOut) {
  EVP_KDF* pKdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
  if (!pKdf) return false;

  EVP_KDF_CTX* pCtx = EVP_KDF_CTX_new(pKdf);
  EVP_KDF_free(pKdf);
  if (!pCtx) return false;

  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_octet_string(kParamPassword,
                                        const_cast<char*>(sPassword.data()),
                                        sPassword.size()),
      OSSL_PARAM_construct_octet_string(kParamSalt, vSalt.data(), vSalt.size()),
      OSSL_PARAM_construct_uint32(kParamIter, &uTime),
      OSSL_PARAM_construct_uint32(kParamMemCost, &uMemory),
      OSSL_PARAM_construct_uint32(kParamThreads, &uParallelism),
      OSSL_PARAM_construct_uint32(kParamLanes, &uParallelism),
      OSSL_PARAM_construct_end(),
  };

  const bool bOk = EVP_KDF_derive(pCtx, vOut.data(), vOut.size(), params) == 1;
  EVP_KDF_CTX_free(pCtx);
  return bOk;
}

}  // namespace

Argon2PasswordHasher::Argon2PasswordHasher() = default;
Argon2PasswordHasher::~Argon2PasswordHasher() = default;

bool Argon2PasswordHasher::isAvailable() {
  EVP_KDF* pKdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
  if (!pKdf) return false;
  EVP_KDF_free(pKdf);
  return true;
}

std::string Argon2PasswordHasher::hash(const std::string& sPassword) const {
  std::vector<unsigned char> vSalt(kSaltLen);
  if (RAND_bytes(vSalt.data(), kSaltLen) != 1) {
    throw std::runtime_error("Failed to generate random salt");
  }

  std::vector<unsigned char> vHash(kHashLen);
  if (!deriveArgon2id(sPassword, vSalt, kTimeCost, kMemoryCost, kParallelism, vHash)) {
    throw std::runtime_error("Argon2id key derivation failed (requires OpenSSL >= 3.2)");
  }

  return "$argon2id$v=19$m=" + std::to_string(kMemoryCost) +
         ",t=" + std::to_string(kTimeCost) +
         ",p=" + std::to_string(kParallelism) +
         "$" + base64NoPad(vSalt) + "$" + base64NoPad(vHash);
}

bool Argon2PasswordHasher::verify(const std::string& sPassword,
                                  const std::string& sHash) const {
  // Fields: [0]="" [1]="argon2id" [2]="v=19" [3]="m=...,t=...,p=..." [4]=salt [5]=hash
  std::vector<std::string> vParts;
  std::istringstream iss(sHash);
  std::string sPart;
  while (std::getline(iss, sPart, '$')) {
    vParts.push_back(sPart);
  }
  if (vParts.size() != 6 || vParts[1] != "argon2id") {
    return false;
  }

  uint32_t uMemory = 0, uTime = 0, uParallelism = 0;
  if (std::sscanf(vParts[3].c_str(), "m=%u,t=%u,p=%u", &uMemory, &uTime, &uParallelism) != 3) {
    return false;
  }

  auto oSalt = base64NoPadDecode(vParts[4]);
  auto oStored = base64NoPadDecode(vParts[5]);
  if (!oSalt || !oStored || oStored->empty()) {
    return false;
  }

  std::vector<unsigned char> vDerived(oStored->size());
  if (!deriveArgon2id(sPassword, *oSalt, uTime, uMemory, uParallelism, vDerived)) {
    return false;
  }

  return CRYPTO_memcmp(vDerived.data(), oStored->data(), oStored->size()) == 0;
}

}  // namespace sso::security
