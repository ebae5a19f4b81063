#include "api/ApiServer.hpp"

#include "api/routes/AuthRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/UserRoutes.hpp"
#include "common/Logger.hpp"

namespace sso::api {

ApiServer::ApiServer(routes::AuthRoutes& arRoutes, routes::UserRoutes& urRoutes,
                     routes::HealthRoutes& hrRoutes)
    : _arRoutes(arRoutes), _urRoutes(urRoutes), _hrRoutes(hrRoutes) {
  // Request logging goes through spdlog; keep Crow's own logger quiet.
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _hrRoutes.registerRoutes(_app);
  _arRoutes.registerRoutes(_app);
  _urRoutes.registerRoutes(_app);
  _app.validate();
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} ({} threads)", iPort,
                              iThreads);
  _app.port(static_cast<uint16_t>(iPort))
      .concurrency(static_cast<uint16_t>(iThreads))
      .run();
}

}  // namespace sso::api
