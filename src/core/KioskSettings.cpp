#include "KioskSettings.h"

#include <cerrno>
#include <cstdlib>

#include "AppConfig.h"
#include "platform/Platform.h"
#include "platform/Prefs.h"

namespace {
constexpr const char* kTag = "settings";

constexpr char kApiNs[] = "api";
constexpr char kDisplayNs[] = "display";
constexpr char kCacheNs[] = "cache";
constexpr char kNetworkNs[] = "network";

struct FieldSource {
  const char* ns;
  const char* key;
  const char* env;
};

bool lookupRaw(const FieldSource& field, std::string& out) {
  const char* envValue = std::getenv(field.env);
  if (envValue != nullptr && *envValue != '\0') {
    out = envValue;
    return true;
  }
  if (platform::prefs::contains(field.ns, field.key)) {
    out = platform::prefs::getString(field.ns, field.key);
    return true;
  }
  return false;
}

std::string readString(const FieldSource& field, const std::string& defaultValue) {
  std::string value;
  if (!lookupRaw(field, value)) {
    return defaultValue;
  }
  return value;
}

bool parseUnsigned(const std::string& raw, uint64_t maxValue, uint64_t& out) {
  if (raw.empty() || raw[0] == '-' || raw[0] == '+') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long value = std::strtoull(raw.c_str(), &end, 10);
  if (errno != 0 || end == raw.c_str() || *end != '\0' || value > maxValue) {
    return false;
  }
  out = value;
  return true;
}

bool readUnsigned(const FieldSource& field, uint64_t defaultValue, uint64_t minValue,
                  uint64_t maxValue, uint64_t& out, std::string* errorMessage) {
  std::string raw;
  if (!lookupRaw(field, raw)) {
    out = defaultValue;
    return true;
  }
  uint64_t value = 0;
  if (!parseUnsigned(raw, maxValue, value) || value < minValue) {
    if (errorMessage != nullptr) {
      *errorMessage = std::string("invalid ") + field.ns + "." + field.key + " ('" + raw +
                      "'), expected integer in [" + std::to_string(minValue) + ", " +
                      std::to_string(maxValue) + "]";
    }
    return false;
  }
  out = value;
  return true;
}

template <typename T>
bool readInto(const FieldSource& field, uint64_t defaultValue, uint64_t minValue,
              uint64_t maxValue, T& out, std::string* errorMessage) {
  uint64_t value = 0;
  if (!readUnsigned(field, defaultValue, minValue, maxValue, value, errorMessage)) {
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

std::string homeDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return ".";
  }
  return home;
}

std::string joinHome(const char* name) {
  const std::string home = homeDir();
  return home.back() == '/' ? home + name : home + "/" + name;
}
}  // namespace

bool KioskSettings::load(const std::string& configPath, KioskSettings& out,
                         std::string* errorMessage) {
  out = KioskSettings();
  if (!platform::prefs::load(configPath.c_str(), errorMessage)) {
    return false;
  }

  out.posterToken = readString({kApiNs, "poster_token", "POSTER_TOKEN"}, "");
  if (out.posterToken.empty()) {
    if (errorMessage != nullptr) {
      *errorMessage = "poster_token not configured (set api.poster_token or POSTER_TOKEN)";
    }
    return false;
  }
  out.apiUrl = readString({kApiNs, "url", "POSTER_API_URL"}, AppConfig::kDefaultApiUrl);
  out.eventUrl = readString({kApiNs, "event_url", "POSTER_EVENT_URL"}, "");

  out.deviceId = readString({kDisplayNs, "device_id", "DEVICE_ID"}, AppConfig::kDefaultDeviceId);
  out.framebuffer =
      readString({kDisplayNs, "framebuffer", "DISPLAY_FRAMEBUFFER"}, AppConfig::kDefaultFramebuffer);

  const std::string orientation =
      readString({kDisplayNs, "orientation", "DISPLAY_ORIENTATION"}, "portrait");
  if (orientation == "portrait") {
    out.orientation = Orientation::kPortrait;
  } else if (orientation == "landscape") {
    out.orientation = Orientation::kLandscape;
  } else {
    if (errorMessage != nullptr) {
      *errorMessage = "invalid display.orientation ('" + orientation +
                      "'), expected portrait or landscape";
    }
    return false;
  }

  out.cacheDir = readString({kCacheNs, "dir", "CACHE_DIR"}, joinHome(AppConfig::kCacheDirName));
  out.stateDir = readString({kCacheNs, "state_dir", "STATE_DIR"}, joinHome(AppConfig::kStateDirName));

  constexpr uint64_t kMaxSeconds = AppConfig::kMaxDisplayTimeSec;
  const bool numbersOk =
      readInto({kApiNs, "request_timeout", "REQUEST_TIMEOUT"}, AppConfig::kDefaultRequestTimeoutSec,
               1, 600, out.requestTimeoutSec, errorMessage) &&
      readInto({kDisplayNs, "display_time", "DISPLAY_TIME"}, AppConfig::kDefaultDisplayTimeSec, 1,
               kMaxSeconds, out.displayTimeSec, errorMessage) &&
      readInto({kDisplayNs, "width", "DISPLAY_WIDTH"}, 0, 0, 16384, out.displayWidth,
               errorMessage) &&
      readInto({kDisplayNs, "height", "DISPLAY_HEIGHT"}, 0, 0, 16384, out.displayHeight,
               errorMessage) &&
      readInto({kDisplayNs, "pinned_timeout", "PINNED_TIMEOUT"}, 0, 0, kMaxSeconds,
               out.pinnedTimeoutSec, errorMessage) &&
      readInto({kDisplayNs, "long_press_ms", "LONG_PRESS_MS"}, AppConfig::kDefaultLongPressMs, 0,
               60000, out.longPressMs, errorMessage) &&
      readInto({kCacheNs, "refresh", "CACHE_REFRESH"}, AppConfig::kDefaultCacheRefreshSec, 1,
               kMaxSeconds, out.cacheRefreshSec, errorMessage) &&
      readInto({kCacheNs, "eviction_grace", "EVICTION_GRACE"}, 0, 0, 1000,
               out.evictionGraceCycles, errorMessage) &&
      readInto({kCacheNs, "max_bytes", "CACHE_MAX_BYTES"}, 0, 0, UINT64_MAX, out.maxCacheBytes,
               errorMessage) &&
      readInto({kNetworkNs, "probe_timeout", "PROBE_TIMEOUT"}, AppConfig::kDefaultProbeTimeoutSec,
               1, 120, out.probeTimeoutSec, errorMessage);
  return numbersOk;
}

void KioskSettings::logSummary() const {
  platform::logi(kTag, "device=%s display_time=%us refresh=%us orientation=%s size=%ux%u",
                 deviceId.c_str(), displayTimeSec, cacheRefreshSec, orientationName(orientation),
                 displayWidth, displayHeight);
  platform::logi(kTag, "cache=%s state=%s grace=%u max_bytes=%llu pinned_timeout=%us",
                 cacheDir.c_str(), stateDir.c_str(), evictionGraceCycles,
                 static_cast<unsigned long long>(maxCacheBytes), pinnedTimeoutSec);
  platform::logi(kTag, "api=%s events=%s token=[set] probe_timeout=%us request_timeout=%us",
                 apiUrl.c_str(), eventUrl.empty() ? "(disabled)" : eventUrl.c_str(), probeTimeoutSec,
                 requestTimeoutSec);
}
