#include "security/SessionService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/DeviceClassifier.hpp"
#include "core/ISessionStore.hpp"
#include "security/IPasswordHasher.hpp"
#include "security/TokenCodec.hpp"

namespace sso::security {

namespace {

// Verified on an unknown email so a miss costs one Argon2 run like a wrong
// password does. No password derives to an all-zero hash.
constexpr const char* kUnknownUserHash =
    "$argon2id$v=19$m=65536,t=3,p=1$AAAAAAAAAAAAAAAAAAAAAA"
    "$AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA";

}  // namespace

SessionService::SessionService(dal::IUserRepository& urRepo,
                               const IPasswordHasher& phHasher,
                               core::ISessionStore& ssStore,
                               const TokenCodec& tcCodec,
                               std::chrono::seconds durTokenTtl)
    : _urRepo(urRepo),
      _phHasher(phHasher),
      _ssStore(ssStore),
      _tcCodec(tcCodec),
      _durTokenTtl(durTokenTtl) {}

SessionService::~SessionService() = default;

AuthResult SessionService::registerUser(const RegisterRequest& rrRequest,
                                        const common::RequestMeta& rmMeta) {
  if (_urRepo.findByEmail(rrRequest.sEmail).has_value()) {
    throw common::ConflictError("duplicate_email", "User with this email already exists");
  }

  // Hash before touching storage; create() still reports a racing duplicate.
  std::string sHash = _phHasher.hash(rrRequest.sPassword);
  auto urUser = _urRepo.create(rrRequest.sEmail, sHash, rrRequest.sName);
  common::Logger::get()->info("Registered user {}", urUser.iId);

  AuthResult arResult;
  arResult.sToken = openSession(urUser.iId, rmMeta);
  arResult.user = std::move(urUser);
  return arResult;
}

AuthResult SessionService::login(const LoginRequest& lrRequest,
                                 const common::RequestMeta& rmMeta) {
  // Same error for unknown email and wrong password to prevent enumeration
  auto oUser = _urRepo.findByEmail(lrRequest.sEmail);
  if (!oUser.has_value()) {
    _phHasher.verify(lrRequest.sPassword, kUnknownUserHash);
    throw common::AuthenticationError("invalid_credentials", "Invalid email or password");
  }
  if (!_phHasher.verify(lrRequest.sPassword, oUser->sPasswordHash)) {
    throw common::AuthenticationError("invalid_credentials", "Invalid email or password");
  }

  AuthResult arResult;
  arResult.sToken = openSession(oUser->iId, rmMeta);
  arResult.user = std::move(*oUser);
  return arResult;
}

void SessionService::logout(const std::string& sSessionId) {
  _ssStore.revoke(sSessionId);
}

int SessionService::logoutAll(int64_t iUserId) {
  int iRevoked = _ssStore.revokeAll(iUserId);
  common::Logger::get()->info("Revoked {} sessions of user {}", iRevoked, iUserId);
  return iRevoked;
}

bool SessionService::logoutDevice(int64_t iUserId, common::DeviceClass eClass) {
  bool bRevoked = _ssStore.revokeDevice(iUserId, eClass);
  if (bRevoked) {
    common::Logger::get()->info("Revoked {} session of user {}", common::toString(eClass),
                                iUserId);
  }
  return bRevoked;
}

std::vector<common::Session> SessionService::listSessions(int64_t iUserId) const {
  return _ssStore.listLive(iUserId);
}

dal::UserRow SessionService::getUser(int64_t iUserId) const {
  auto oUser = _urRepo.findById(iUserId);
  if (!oUser.has_value()) {
    throw common::NotFoundError("user_not_found", "User not found");
  }
  return *oUser;
}

std::string SessionService::openSession(int64_t iUserId, const common::RequestMeta& rmMeta) {
  auto diDevice = core::DeviceClassifier::classify(rmMeta.sUserAgent, rmMeta.sDeviceTypeHint);
  std::string sSessionId =
      _ssStore.create(iUserId, diDevice.eClass, diDevice.sName, rmMeta.sIpAddress);
  common::Logger::get()->info("Opened {} session for user {} ({})",
                              common::toString(diDevice.eClass), iUserId, diDevice.sName);
  return _tcCodec.issue(iUserId, sSessionId, _durTokenTtl);
}

}  // namespace sso::security
