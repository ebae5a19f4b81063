#pragma once

#include <crow.h>

namespace sso::security {
class SessionService;
}

namespace sso::api {
class AuthMiddleware;
}

namespace sso::api::routes {

/// Handler for /api/profile
/// Class abbreviation: ur
class UserRoutes {
 public:
  UserRoutes(sso::security::SessionService& ssService,
             const sso::api::AuthMiddleware& amMiddleware);
  ~UserRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  sso::security::SessionService& _ssService;
  const sso::api::AuthMiddleware& _amMiddleware;
};

}  // namespace sso::api::routes
