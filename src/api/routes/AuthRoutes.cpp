#include "api/routes/AuthRoutes.hpp"

#include "api/AuthMiddleware.hpp"
#include "api/RouteHelpers.hpp"
#include "common/Errors.hpp"
#include "security/SessionService.hpp"

#include <nlohmann/json.hpp>

namespace sso::api::routes {

namespace {

nlohmann::json authResultToJson(const sso::security::AuthResult& arResult) {
  return {{"token", arResult.sToken}, {"user", userToJson(arResult.user)}};
}

}  // namespace

AuthRoutes::AuthRoutes(sso::security::SessionService& ssService,
                       const sso::api::AuthMiddleware& amMiddleware)
    : _ssService(ssService), _amMiddleware(amMiddleware) {}

AuthRoutes::~AuthRoutes() = default;

void AuthRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /api/auth/register
  CROW_ROUTE(app, "/api/auth/register").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObject(req.body);
          sso::security::RegisterRequest rrRequest;
          rrRequest.sEmail = requireString(jBody, "email");
          rrRequest.sPassword = requireString(jBody, "password");
          rrRequest.sName = requireString(jBody, "name");

          auto arResult = _ssService.registerUser(rrRequest, requestMeta(req));
          return jsonResponse(200, authResultToJson(arResult));
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });

  // POST /api/auth/login
  CROW_ROUTE(app, "/api/auth/login").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObject(req.body);
          sso::security::LoginRequest lrRequest;
          lrRequest.sEmail = requireString(jBody, "email");
          lrRequest.sPassword = requireString(jBody, "password");

          auto arResult = _ssService.login(lrRequest, requestMeta(req));
          return jsonResponse(200, authResultToJson(arResult));
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });

  // POST /api/auth/logout
  CROW_ROUTE(app, "/api/auth/logout").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto rcCtx = _amMiddleware.authenticate(req.get_header_value("Authorization"));
          _ssService.logout(rcCtx.sSessionId);

          nlohmann::json jResp = {{"message", "Logged out successfully"}};
          return jsonResponse(200, jResp);
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });

  // POST /api/auth/logout-all
  CROW_ROUTE(app, "/api/auth/logout-all").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto rcCtx = _amMiddleware.authenticate(req.get_header_value("Authorization"));
          int iRevoked = _ssService.logoutAll(rcCtx.iUserId);

          nlohmann::json jResp = {{"message", "All sessions revoked"},
                                  {"revoked_count", iRevoked}};
          return jsonResponse(200, jResp);
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });

  // POST /api/auth/logout-device/<device_type>
  CROW_ROUTE(app, "/api/auth/logout-device/<string>").methods("POST"_method)(
      [this](const crow::request& req, const std::string& sDeviceType) -> crow::response {
        try {
          auto rcCtx = _amMiddleware.authenticate(req.get_header_value("Authorization"));

          auto oClass = common::parseDeviceClass(sDeviceType);
          if (!oClass) {
            throw common::ValidationError("invalid_device_type",
                                          "Unknown device type: " + sDeviceType);
          }
          bool bRevoked = _ssService.logoutDevice(rcCtx.iUserId, *oClass);

          const std::string sClass = common::toString(*oClass);
          nlohmann::json jResp = {
              {"message", bRevoked ? "Revoked the " + sClass + " session"
                                   : "No active " + sClass + " session"},
              {"revoked", bRevoked},
          };
          return jsonResponse(200, jResp);
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });

  // GET /api/auth/sessions
  CROW_ROUTE(app, "/api/auth/sessions").methods("GET"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto rcCtx = _amMiddleware.authenticate(req.get_header_value("Authorization"));

          nlohmann::json jSessions = nlohmann::json::array();
          for (const auto& ses : _ssService.listSessions(rcCtx.iUserId)) {
            jSessions.push_back({
                {"device_type", common::toString(ses.eClass)},
                {"device_name", ses.sDeviceName},
                {"created_at", common::formatTimestamp(ses.tpCreatedAt)},
                {"ip_address", ses.sIpAddress.empty() ? nlohmann::json(nullptr)
                                                      : nlohmann::json(ses.sIpAddress)},
                {"is_current", ses.sSessionId == rcCtx.sSessionId},
            });
          }
          return jsonResponse(200, {{"sessions", jSessions}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          return internalErrorResponse(e);
        }
      });
}

}  // namespace sso::api::routes
