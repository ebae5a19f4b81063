#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "dal/IUserRepository.hpp"

namespace sso::core {
class ISessionStore;
}

namespace sso::security {

class IPasswordHasher;
class TokenCodec;

/// Body of POST /api/auth/register.
struct RegisterRequest {
  std::string sEmail;
  std::string sPassword;
  std::string sName;
};

/// Body of POST /api/auth/login.
struct LoginRequest {
  std::string sEmail;
  std::string sPassword;
};

/// A user plus the bearer token of the session just created for them.
/// Class abbreviation: ar
struct AuthResult {
  dal::UserRow user;
  std::string sToken;
};

/// Orchestrates the session lifecycle: registration and login create one
/// session per (user, device class) and mint its token; the logout family
/// revokes sessions.
/// Class abbreviation: ss
class SessionService {
 public:
  SessionService(dal::IUserRepository& urRepo,
                 const IPasswordHasher& phHasher,
                 core::ISessionStore& ssStore,
                 const TokenCodec& tcCodec,
                 std::chrono::seconds durTokenTtl);
  ~SessionService();

  /// Throws ConflictError("duplicate_email") if the email is taken.
  AuthResult registerUser(const RegisterRequest& rrRequest, const common::RequestMeta& rmMeta);

  /// Throws AuthenticationError("invalid_credentials") for an unknown email
  /// and for a wrong password alike. Evicts the same-class session, if any.
  AuthResult login(const LoginRequest& lrRequest, const common::RequestMeta& rmMeta);

  /// Idempotent.
  void logout(const std::string& sSessionId);

  int logoutAll(int64_t iUserId);
  bool logoutDevice(int64_t iUserId, common::DeviceClass eClass);
  std::vector<common::Session> listSessions(int64_t iUserId) const;

  /// Throws NotFoundError("user_not_found").
  dal::UserRow getUser(int64_t iUserId) const;

 private:
  /// Classify the device, install the session and sign its token.
  std::string openSession(int64_t iUserId, const common::RequestMeta& rmMeta);

  dal::IUserRepository& _urRepo;
  const IPasswordHasher& _phHasher;
  core::ISessionStore& _ssStore;
  const TokenCodec& _tcCodec;
  std::chrono::seconds _durTokenTtl;
};

}  // namespace sso::security
