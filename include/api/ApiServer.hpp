#pragma once

#include <crow.h>

namespace sso::api::routes {
class AuthRoutes;
class HealthRoutes;
class UserRoutes;
}  // namespace sso::api::routes

namespace sso::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(routes::AuthRoutes& arRoutes, routes::UserRoutes& urRoutes,
            routes::HealthRoutes& hrRoutes);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until the process is signalled; Crow handles SIGINT and SIGTERM.
  void start(int iPort, int iThreads);

  crow::SimpleApp& app() { return _app; }

 private:
  crow::SimpleApp _app;
  routes::AuthRoutes& _arRoutes;
  routes::UserRoutes& _urRoutes;
  routes::HealthRoutes& _hrRoutes;
};

}  // namespace sso::api
