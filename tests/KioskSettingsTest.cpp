#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "KioskSettings.h"
#include "TestSupport.h"
#include "platform/Fs.h"

using test_support::TempDir;

namespace {

const char* const kEnvVars[] = {
    "POSTER_TOKEN",   "POSTER_API_URL", "POSTER_EVENT_URL",    "DEVICE_ID",
    "DISPLAY_FRAMEBUFFER", "DISPLAY_ORIENTATION", "DISPLAY_TIME", "DISPLAY_WIDTH",
    "DISPLAY_HEIGHT", "PINNED_TIMEOUT", "LONG_PRESS_MS",       "CACHE_DIR",
    "STATE_DIR",      "CACHE_REFRESH",  "EVICTION_GRACE",      "CACHE_MAX_BYTES",
    "REQUEST_TIMEOUT", "PROBE_TIMEOUT",
};

class KioskSettingsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* name : kEnvVars) {
      ::unsetenv(name);
    }
    const char* home = std::getenv("HOME");
    savedHome_ = home != nullptr ? home : "";
    ::setenv("HOME", dir_.path().c_str(), 1);
  }

  void TearDown() override {
    for (const char* name : kEnvVars) {
      ::unsetenv(name);
    }
    if (savedHome_.empty()) {
      ::unsetenv("HOME");
    } else {
      ::setenv("HOME", savedHome_.c_str(), 1);
    }
  }

  std::string writeConfig(const std::string& json) {
    const std::string path = dir_.file("config.json");
    EXPECT_TRUE(platform::fs::writeTextAtomic(path, json));
    return path;
  }

  TempDir dir_;
  std::string savedHome_;
};

TEST_F(KioskSettingsTest, MissingTokenIsRejected) {
  KioskSettings settings;
  std::string err;
  EXPECT_FALSE(KioskSettings::load(dir_.file("absent.json"), settings, &err));
  EXPECT_NE(err.find("poster_token"), std::string::npos);
}

TEST_F(KioskSettingsTest, DefaultsApplyWhenOnlyTokenIsSet) {
  ::setenv("POSTER_TOKEN", "secret", 1);
  KioskSettings settings;
  std::string err;
  ASSERT_TRUE(KioskSettings::load(dir_.file("absent.json"), settings, &err)) << err;

  EXPECT_EQ(settings.posterToken, "secret");
  EXPECT_EQ(settings.displayTimeSec, 5u);
  EXPECT_EQ(settings.cacheRefreshSec, 60u);
  EXPECT_EQ(settings.deviceId, "default_device");
  EXPECT_EQ(settings.orientation, Orientation::kPortrait);
  EXPECT_EQ(settings.cacheDir, dir_.file("eposter_cache"));
  EXPECT_EQ(settings.stateDir, dir_.file(".eposter"));
  EXPECT_EQ(settings.framebuffer, "/dev/fb0");
  EXPECT_TRUE(settings.eventUrl.empty());
  EXPECT_EQ(settings.pinnedTimeoutSec, 0u);
  EXPECT_EQ(settings.maxCacheBytes, 0u);
}

TEST_F(KioskSettingsTest, ReadsConfigFile) {
  const std::string path = writeConfig(R"({
    "api": {"poster_token": "from-file", "event_url": "https://posters.example/event"},
    "display": {"display_time": 12, "device_id": 4, "orientation": "landscape"},
    "cache": {"refresh": "30", "dir": "/var/cache/posters", "max_bytes": 1048576}
  })");
  KioskSettings settings;
  std::string err;
  ASSERT_TRUE(KioskSettings::load(path, settings, &err)) << err;

  EXPECT_EQ(settings.posterToken, "from-file");
  EXPECT_EQ(settings.eventUrl, "https://posters.example/event");
  EXPECT_EQ(settings.displayTimeSec, 12u);
  EXPECT_EQ(settings.deviceId, "4");
  EXPECT_EQ(settings.orientation, Orientation::kLandscape);
  EXPECT_EQ(settings.cacheRefreshSec, 30u);
  EXPECT_EQ(settings.cacheDir, "/var/cache/posters");
  EXPECT_EQ(settings.maxCacheBytes, 1048576u);
}

TEST_F(KioskSettingsTest, EnvironmentOverridesFile) {
  const std::string path =
      writeConfig(R"({"api": {"poster_token": "file"}, "display": {"display_time": 12}})");
  ::setenv("DISPLAY_TIME", "7", 1);
  ::setenv("POSTER_TOKEN", "env", 1);

  KioskSettings settings;
  ASSERT_TRUE(KioskSettings::load(path, settings, nullptr));
  EXPECT_EQ(settings.displayTimeSec, 7u);
  EXPECT_EQ(settings.posterToken, "env");
}

TEST_F(KioskSettingsTest, RejectsBadNumbers) {
  ::setenv("POSTER_TOKEN", "secret", 1);
  for (const char* bad : {"abc", "0", "-5", "5s", "99999999999999999999"}) {
    ::setenv("DISPLAY_TIME", bad, 1);
    KioskSettings settings;
    std::string err;
    EXPECT_FALSE(KioskSettings::load(dir_.file("absent.json"), settings, &err)) << bad;
    EXPECT_NE(err.find("display_time"), std::string::npos) << err;
  }
}

TEST_F(KioskSettingsTest, RejectsUnknownOrientation) {
  ::setenv("POSTER_TOKEN", "secret", 1);
  ::setenv("DISPLAY_ORIENTATION", "sideways", 1);
  KioskSettings settings;
  std::string err;
  EXPECT_FALSE(KioskSettings::load(dir_.file("absent.json"), settings, &err));
  EXPECT_NE(err.find("orientation"), std::string::npos);
}

TEST_F(KioskSettingsTest, RejectsUnparsableFile) {
  ::setenv("POSTER_TOKEN", "secret", 1);
  const std::string path = writeConfig("{\"api\": ");
  KioskSettings settings;
  std::string err;
  EXPECT_FALSE(KioskSettings::load(path, settings, &err));
  EXPECT_NE(err.find("parse failed"), std::string::npos);

  const std::string arrayPath = writeConfig("[1, 2]");
  EXPECT_FALSE(KioskSettings::load(arrayPath, settings, &err));
  EXPECT_NE(err.find("not a JSON object"), std::string::npos);
}

}  // namespace
