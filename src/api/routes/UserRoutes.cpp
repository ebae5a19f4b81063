#include "api/routes/UserRoutes.hpp"

#include "api/AuthMiddleware.hpp"
#include "api/RouteHelpers.hpp"
#include "common/Errors.hpp"
#include "security/SessionService.hpp"

namespace sso::api::routes {

UserRoutes::UserRoutes(sso::security::SessionService& ssService,
                       const sso::api::AuthMiddleware& amMiddleware)
    : _ssService(ssService), _amMiddleware(amMiddleware) {}

UserRoutes::~UserRoutes() = default;

void UserRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/profile
  CROW_ROUTE(app, "/api/profile").methods("GET"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto rcCtx = _amMiddleware.authenticate(req.get_header_value("Authorization"));
          return jsonResponse(200, userToJson(_ssService.getUser(rcCtx.iUserId)));
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });
}

}  // namespace sso::api::routes
