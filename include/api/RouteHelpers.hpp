#pragma once

#include <exception>
#include <string>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "common/Types.hpp"
#include "dal/IUserRepository.hpp"

namespace sso::api {

/// JSON body with Content-Type set.
crow::response jsonResponse(int iStatus, const nlohmann::json& jBody);

/// {"error": code, "message": what()} with the error's HTTP status.
crow::response errorResponse(const common::AppError& e);

/// 400 invalid_json.
crow::response invalidJsonResponse();

/// Logs the exception and answers 500 internal_error without details.
crow::response internalErrorResponse(const std::exception& e);

/// Parse a request body that must be a JSON object.
/// Throws nlohmann::json::parse_error or ValidationError.
nlohmann::json parseObject(const std::string& sBody);

/// Non-empty string member of a JSON object.
/// Throws ValidationError("validation_error") naming the field.
std::string requireString(const nlohmann::json& jBody, const std::string& sField);

/// User-Agent, X-Device-Type and client address of a login request.
/// The address is the first X-Forwarded-For entry, else X-Real-IP, else the peer.
common::RequestMeta requestMeta(const crow::request& req);

/// {id, email, name, created_at}. Never includes the password hash.
nlohmann::json userToJson(const dal::UserRow& urUser);

}  // namespace sso::api
