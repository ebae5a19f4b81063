#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sso::common {

/// Coarse client category used as the single-sign-on scope.
enum class DeviceClass { Web, Mobile, Desktop, Unknown };

/// Lower-case wire name: "web", "mobile", "desktop", "unknown".
std::string toString(DeviceClass eClass);

/// Case-insensitive parse of a wire name. Returns nullopt for anything else.
std::optional<DeviceClass> parseDeviceClass(const std::string& sValue);

/// Result of classifying a login request.
/// Class abbreviation: di
struct DeviceInfo {
  DeviceClass eClass = DeviceClass::Unknown;
  std::string sName;
};

/// One authenticated device login.
/// Class abbreviation: ses
struct Session {
  std::string sSessionId;
  int64_t iUserId = 0;
  DeviceClass eClass = DeviceClass::Unknown;
  std::string sDeviceName;
  std::string sIpAddress;
  std::chrono::system_clock::time_point tpCreatedAt;
  bool bRevoked = false;
};

/// Request metadata consumed on the login/register path.
/// Class abbreviation: rm
struct RequestMeta {
  std::string sUserAgent;
  std::string sDeviceTypeHint;
  std::string sIpAddress;
};

/// Identity context injected by AuthMiddleware.
/// Class abbreviation: rc
struct RequestContext {
  int64_t iUserId = 0;
  std::string sSessionId;
};

/// RFC 3339 UTC rendering with second precision, e.g. "2024-05-01T12:00:00Z".
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace sso::common
