#include "api/RouteHelpers.hpp"

#include "common/Logger.hpp"

namespace sso::api {

namespace {

std::string trim(const std::string& sValue) {
  const auto nFirst = sValue.find_first_not_of(" \t");
  if (nFirst == std::string::npos) return {};
  const auto nLast = sValue.find_last_not_of(" \t");
  return sValue.substr(nFirst, nLast - nFirst + 1);
}

}  // namespace

crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

crow::response errorResponse(const common::AppError& e) {
  nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
  return jsonResponse(e._iHttpStatus, jErr);
}

crow::response invalidJsonResponse() {
  nlohmann::json jErr = {{"error", "invalid_json"}, {"message", "Invalid JSON body"}};
  return jsonResponse(400, jErr);
}

crow::response internalErrorResponse(const std::exception& e) {
  common::Logger::get()->error("Unhandled error in request handler: {}", e.what());
  nlohmann::json jErr = {{"error", "internal_error"}, {"message", "Internal server error"}};
  return jsonResponse(500, jErr);
}

nlohmann::json parseObject(const std::string& sBody) {
  auto jBody = nlohmann::json::parse(sBody);
  if (!jBody.is_object()) {
    throw common::ValidationError("validation_error", "Request body must be a JSON object");
  }
  return jBody;
}

std::string requireString(const nlohmann::json& jBody, const std::string& sField) {
  auto it = jBody.find(sField);
  if (it == jBody.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    throw common::ValidationError("validation_error", sField + " is required");
  }
  return it->get<std::string>();
}

common::RequestMeta requestMeta(const crow::request& req) {
  common::RequestMeta rmMeta;
  rmMeta.sUserAgent = req.get_header_value("User-Agent");
  rmMeta.sDeviceTypeHint = req.get_header_value("X-Device-Type");

  const std::string sForwarded = req.get_header_value("X-Forwarded-For");
  if (!sForwarded.empty()) {
    rmMeta.sIpAddress = trim(sForwarded.substr(0, sForwarded.find(',')));
  }
  if (rmMeta.sIpAddress.empty()) {
    rmMeta.sIpAddress = trim(req.get_header_value("X-Real-IP"));
  }
  if (rmMeta.sIpAddress.empty()) {
    rmMeta.sIpAddress = req.remote_ip_address;
  }
  return rmMeta;
}

nlohmann::json userToJson(const dal::UserRow& urUser) {
  return {
      {"id", urUser.iId},
      {"email", urUser.sEmail},
      {"name", urUser.sName},
      {"created_at", common::formatTimestamp(urUser.tpCreatedAt)},
  };
}

}  // namespace sso::api
