#include "core/DeviceClassifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace sso::core {

using common::DeviceClass;

namespace {

struct ClassRule {
  const char* pPattern;
  DeviceClass eClass;
};

struct LabelRule {
  const char* pPattern;
  const char* pLabel;
  const char* pUnless;  // rule is skipped when this also matches; nullptr = never
};

// Evaluated top to bottom. Mobile comes first because mobile browsers also
// announce "mozilla"/"safari".
constexpr std::array kClassRules = {
    ClassRule{"mobile", DeviceClass::Mobile},
    ClassRule{"iphone", DeviceClass::Mobile},
    ClassRule{"ipad", DeviceClass::Mobile},
    ClassRule{"android", DeviceClass::Mobile},
    ClassRule{"blackberry", DeviceClass::Mobile},
    ClassRule{"windows phone", DeviceClass::Mobile},
    ClassRule{"electron", DeviceClass::Desktop},
    ClassRule{"desktop", DeviceClass::Desktop},
    ClassRule{"mozilla", DeviceClass::Web},
    ClassRule{"chrome", DeviceClass::Web},
    ClassRule{"safari", DeviceClass::Web},
    ClassRule{"firefox", DeviceClass::Web},
    ClassRule{"edge", DeviceClass::Web},
    ClassRule{"opera", DeviceClass::Web},
};

// Android and iOS user-agents also mention "linux" and "mac os x".
constexpr std::array kOsRules = {
    LabelRule{"android", "Android", nullptr},
    LabelRule{"iphone", "iOS", nullptr},
    LabelRule{"ipad", "iOS", nullptr},
    LabelRule{"windows nt 10.0", "Windows 10", nullptr},
    LabelRule{"windows nt 6.3", "Windows 8.1", nullptr},
    LabelRule{"windows nt 6.2", "Windows 8", nullptr},
    LabelRule{"windows nt 6.1", "Windows 7", nullptr},
    LabelRule{"windows", "Windows", nullptr},
    LabelRule{"mac os x", "macOS", nullptr},
    LabelRule{"macos", "macOS", nullptr},
    LabelRule{"linux", "Linux", nullptr},
};

constexpr std::array kBrowserRules = {
    LabelRule{"firefox", "Firefox", nullptr},
    LabelRule{"edg/", "Microsoft Edge", nullptr},
    LabelRule{"opr/", "Opera", nullptr},
    LabelRule{"chrome", "Chrome", nullptr},
    LabelRule{"safari", "Safari", "chrome"},
    LabelRule{"opera", "Opera", nullptr},
};

std::string toLower(const std::string& sInput) {
  std::string sLower = sInput;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sLower;
}

template <size_t N>
std::string firstLabel(const std::array<LabelRule, N>& vRules, const std::string& sUaLower) {
  for (const auto& rule : vRules) {
    if (sUaLower.find(rule.pPattern) == std::string::npos) continue;
    if (rule.pUnless && sUaLower.find(rule.pUnless) != std::string::npos) continue;
    return rule.pLabel;
  }
  return {};
}

}  // namespace

DeviceClass DeviceClassifier::classFromUserAgent(const std::string& sUserAgent) {
  const std::string sUaLower = toLower(sUserAgent);
  for (const auto& rule : kClassRules) {
    if (sUaLower.find(rule.pPattern) != std::string::npos) {
      return rule.eClass;
    }
  }
  return DeviceClass::Unknown;
}

std::string DeviceClassifier::deviceName(DeviceClass eClass, const std::string& sUserAgent) {
  const std::string sUaLower = toLower(sUserAgent);
  const std::string sOs = firstLabel(kOsRules, sUaLower);
  const std::string sBrowser = firstLabel(kBrowserRules, sUaLower);

  switch (eClass) {
    case DeviceClass::Web:
      if (!sBrowser.empty() && !sOs.empty()) return sBrowser + " on " + sOs;
      if (!sBrowser.empty()) return sBrowser;
      if (!sOs.empty()) return "Browser on " + sOs;
      return "Web Browser";
    case DeviceClass::Mobile:
      return sOs.empty() ? "Mobile Device" : sOs + " Device";
    case DeviceClass::Desktop:
      return sOs.empty() ? "Desktop App" : "Desktop App on " + sOs;
    case DeviceClass::Unknown:
      break;
  }
  return "Unknown Device";
}

common::DeviceInfo DeviceClassifier::classify(const std::string& sUserAgent,
                                              const std::string& sDeviceTypeHint) {
  common::DeviceInfo di;
  auto oHinted = common::parseDeviceClass(sDeviceTypeHint);
  di.eClass = oHinted ? *oHinted : classFromUserAgent(sUserAgent);
  di.sName = deviceName(di.eClass, sUserAgent);
  return di;
}

}  // namespace sso::core
