#pragma once

#include <crow.h>

namespace sso::api::routes {

/// Handler for /health
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);
};

}  // namespace sso::api::routes
