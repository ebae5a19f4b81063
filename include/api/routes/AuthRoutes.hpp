#pragma once

#include <crow.h>

namespace sso::security {
class SessionService;
}

namespace sso::api {
class AuthMiddleware;
}

namespace sso::api::routes {

/// Handlers for /api/auth
/// Class abbreviation: ar
class AuthRoutes {
 public:
  AuthRoutes(sso::security::SessionService& ssService,
             const sso::api::AuthMiddleware& amMiddleware);
  ~AuthRoutes();

  /// Register auth routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

 private:
  sso::security::SessionService& _ssService;
  const sso::api::AuthMiddleware& _amMiddleware;
};

}  // namespace sso::api::routes
