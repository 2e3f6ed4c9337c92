#include "services/ConnectivityProbe.h"

#include "platform/Net.h"
#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "probe";
}

NetConnectivityProbe::NetConnectivityProbe(const KioskSettings& settings, const HttpClient& http)
    : settings_(settings), http_(http) {}

bool NetConnectivityProbe::isOnline() {
  bool online = false;
  std::string reason;
  if (!platform::net::isConnected()) {
    reason = "no link";
  } else {
    const uint32_t startMs = platform::millisMs();
    online = http_.probe(settings_.apiUrl, settings_.probeTimeoutSec * 1000U, &reason);
    if (online) {
      reason = "reached in " + std::to_string(platform::millisMs() - startMs) + " ms";
    }
  }

  // Log transitions only; the scheduler logs every cycle's outcome.
  if (!hasResult_ || online != lastResult_) {
    if (online) {
      std::string ip;
      (void)platform::net::getLocalIp(ip);
      platform::logi(kTag, "online ip=%s (%s)", ip.empty() ? "?" : ip.c_str(), reason.c_str());
    } else {
      platform::logw(kTag, "offline (%s)", reason.c_str());
    }
  }
  hasResult_ = true;
  lastResult_ = online;
  lastReason_ = reason;
  return online;
}
