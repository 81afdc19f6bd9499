#include "settings.hh"
#include "gtest/gtest.h"
#include <limits>

namespace {

TEST(SettingsTest, DefaultsAreValid) {
  Settings settings;
  Error err;
  EXPECT_TRUE(settings.validate(err));
  EXPECT_FALSE(err.isSet());
  EXPECT_EQ(KEYER_STRAIGHT, settings.mode);
  EXPECT_EQ(ROUTE_OUTPUT_ONLY, settings.route);
}

TEST(SettingsTest, RejectsOutOfRangeValues) {
  Settings settings;
  Error err;

  settings.wpm = 4;
  EXPECT_FALSE(settings.validate(err));
  EXPECT_EQ(Error::CONFIG, err.kind());
  settings.wpm = 51;
  EXPECT_FALSE(settings.validate(err));
  settings.wpm = 50;
  EXPECT_TRUE(settings.validate(err));

  settings = Settings();
  settings.sidetoneFrequency = 399;
  EXPECT_FALSE(settings.validate(err));
  settings.sidetoneFrequency = 1001;
  EXPECT_FALSE(settings.validate(err));

  settings = Settings();
  settings.ditDahRatio = 1.5f;
  EXPECT_FALSE(settings.validate(err));

  settings = Settings();
  settings.weighting = -60;
  EXPECT_FALSE(settings.validate(err));

  settings = Settings();
  settings.sidetoneVolume = 1.1f;
  EXPECT_FALSE(settings.validate(err));

  settings = Settings();
  settings.localSidetoneVolume = -.1f;
  EXPECT_FALSE(settings.validate(err));

  settings = Settings();
  settings.micVolume = 1.6f;
  EXPECT_FALSE(settings.validate(err));
  settings.micVolume = 1.5f;
  EXPECT_TRUE(settings.validate(err));
}

TEST(SettingsTest, RejectsNaN) {
  Settings settings;
  Error err;
  settings.wpm = std::numeric_limits<float>::quiet_NaN();
  EXPECT_FALSE(settings.validate(err));
  EXPECT_NE(std::string::npos, err.message().find("WPM"));
}

TEST(SettingsTest, RejectsUnknownEnums) {
  Settings settings;
  Error err;
  settings.mode = KeyerMode(42);
  EXPECT_FALSE(settings.validate(err));

  settings = Settings();
  settings.route = SidetoneRoute(-1);
  EXPECT_FALSE(settings.validate(err));
}

TEST(SettingsTest, Equality) {
  Settings a, b;
  EXPECT_TRUE(a == b);
  b.midiDevice = "Paddle";
  EXPECT_TRUE(a != b);
}

TEST(SettingsTest, ModeNames) {
  for (int i=KEYER_STRAIGHT; i<=KEYER_KEYAHEAD; i++) {
    KeyerMode mode = KEYER_STRAIGHT;
    ASSERT_TRUE(parseKeyerMode(keyerModeName(KeyerMode(i)), mode));
    EXPECT_EQ(i, int(mode));
  }
  KeyerMode mode = KEYER_BUG;
  EXPECT_FALSE(parseKeyerMode("iambica", mode));
  EXPECT_EQ(KEYER_BUG, mode);
  EXPECT_STREQ("IambicB", keyerModeName(KEYER_IAMBIC_B));
}

TEST(SettingsTest, RouteNames) {
  SidetoneRoute route = ROUTE_OUTPUT_ONLY;
  EXPECT_TRUE(parseRoute("Both", route));
  EXPECT_EQ(ROUTE_BOTH, route);
  EXPECT_FALSE(parseRoute("Nowhere", route));
  EXPECT_STREQ("LocalOnly", routeName(ROUTE_LOCAL_ONLY));
}

TEST(SettingsTest, DitDuration) {
  EXPECT_EQ(60000, ditDurationUs(20));
  EXPECT_EQ(100000, ditDurationUs(12));
  EXPECT_EQ(66667, ditDurationUs(18));
}

TEST(ErrorTest, KindNames) {
  Error err;
  EXPECT_FALSE(err.isSet());
  err.set(Error::DEVICE, "No such device");
  EXPECT_TRUE(err.isSet());
  EXPECT_EQ("No such device", err.message());
  EXPECT_STREQ("DeviceError", Error::kindName(err.kind()));
  err.clear();
  EXPECT_FALSE(err.isSet());
}

}
