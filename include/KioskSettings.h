#pragma once

#include <cstdint>
#include <string>

#include "PosterTypes.h"

// Immutable runtime configuration. Built once at startup and handed to each
// component by const reference.
struct KioskSettings {
  std::string posterToken;
  std::string apiUrl;
  std::string eventUrl;
  uint32_t requestTimeoutSec = 0;

  uint32_t displayTimeSec = 0;
  std::string deviceId;
  Orientation orientation = Orientation::kPortrait;
  uint16_t displayWidth = 0;
  uint16_t displayHeight = 0;
  std::string framebuffer;
  uint32_t pinnedTimeoutSec = 0;
  uint32_t longPressMs = 0;

  uint32_t cacheRefreshSec = 0;
  std::string cacheDir;
  std::string stateDir;
  uint32_t evictionGraceCycles = 0;
  uint64_t maxCacheBytes = 0;

  uint32_t probeTimeoutSec = 0;

  // Environment variables override config file values, which override
  // built-in defaults. Returns false on a missing token, an unreadable or
  // unparsable file, or an out-of-range value.
  static bool load(const std::string& configPath, KioskSettings& out, std::string* errorMessage);

  void logSummary() const;
};
