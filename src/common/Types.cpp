#include "common/Types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sso::common {

std::string toString(DeviceClass eClass) {
  switch (eClass) {
    case DeviceClass::Web:
      return "web";
    case DeviceClass::Mobile:
      return "mobile";
    case DeviceClass::Desktop:
      return "desktop";
    case DeviceClass::Unknown:
      return "unknown";
  }
  return "unknown";
}

std::optional<DeviceClass> parseDeviceClass(const std::string& sValue) {
  std::string sLower = sValue;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (sLower == "web") return DeviceClass::Web;
  if (sLower == "mobile") return DeviceClass::Mobile;
  if (sLower == "desktop") return DeviceClass::Desktop;
  if (sLower == "unknown") return DeviceClass::Unknown;
  return std::nullopt;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tmUtc{};
  gmtime_r(&tt, &tmUtc);

  std::ostringstream oss;
  oss << std::put_time(&tmUtc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace sso::common
