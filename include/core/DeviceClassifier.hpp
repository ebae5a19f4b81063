#pragma once

#include <string>

#include "common/Types.hpp"

namespace sso::core {

/// Derives the device class and a display name from login request headers.
///
/// A hint equal (case-insensitively) to a known class name wins outright.
/// Otherwise the user-agent is matched against ordered (substring, class)
/// rules, first match wins; no match yields DeviceClass::Unknown.
/// Pure and deterministic; never throws for any input.
class DeviceClassifier {
 public:
  static common::DeviceInfo classify(const std::string& sUserAgent,
                                     const std::string& sDeviceTypeHint);

  /// User-agent rules only, ignoring any hint.
  static common::DeviceClass classFromUserAgent(const std::string& sUserAgent);

  /// "Chrome on Windows 10", "iOS Device", "Desktop App on Linux", ...
  static std::string deviceName(common::DeviceClass eClass, const std::string& sUserAgent);
};

}  // namespace sso::core
