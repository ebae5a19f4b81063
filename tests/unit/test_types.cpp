#include "common/Types.hpp"

#include "core/SessionId.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <string>

using namespace sso::common;

TEST(TypesTest, DeviceClassWireNames) {
  EXPECT_EQ(toString(DeviceClass::Web), "web");
  EXPECT_EQ(toString(DeviceClass::Mobile), "mobile");
  EXPECT_EQ(toString(DeviceClass::Desktop), "desktop");
  EXPECT_EQ(toString(DeviceClass::Unknown), "unknown");
}

TEST(TypesTest, ParseDeviceClassIsCaseInsensitive) {
  EXPECT_TRUE(parseDeviceClass("web") == DeviceClass::Web);
  EXPECT_TRUE(parseDeviceClass("MOBILE") == DeviceClass::Mobile);
  EXPECT_TRUE(parseDeviceClass("Desktop") == DeviceClass::Desktop);
  EXPECT_TRUE(parseDeviceClass("unknown") == DeviceClass::Unknown);
}

TEST(TypesTest, ParseDeviceClassRejectsOtherValues) {
  EXPECT_FALSE(parseDeviceClass("").has_value());
  EXPECT_FALSE(parseDeviceClass("tablet").has_value());
  EXPECT_FALSE(parseDeviceClass(" web").has_value());
  EXPECT_FALSE(parseDeviceClass("api").has_value());
}

TEST(TypesTest, FormatTimestampIsRfc3339Utc) {
  const auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1714564800));
  EXPECT_EQ(formatTimestamp(tp), "2024-05-01T12:00:00Z");
}

TEST(TypesTest, FormatTimestampTruncatesSubseconds) {
  const auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(999));
  EXPECT_EQ(formatTimestamp(tp), "1970-01-01T00:00:00Z");
}

TEST(SessionIdTest, GeneratesVersion4Uuids) {
  const std::regex reUuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  for (int i = 0; i < 50; ++i) {
    EXPECT_TRUE(std::regex_match(sso::core::generateSessionId(), reUuid));
  }
}

TEST(SessionIdTest, IdsDiffer) {
  EXPECT_NE(sso::core::generateSessionId(), sso::core::generateSessionId());
}
