#include "core/BootCommon.h"

#include "platform/Platform.h"

namespace boot {

void start(BaselineState& state) {
  state.bootStartMs = platform::millisMs();
  state.lastLoopLogMs = 0;
}

void mark(BaselineState& state, const char* stage, bool enabled) {
  if (!enabled || stage == nullptr) {
    return;
  }
  const unsigned long nowMs = platform::millisMs();
  const unsigned long elapsedMs = nowMs - state.bootStartMs;
  platform::logi("baseline", "stage=%s t_ms=%lu rss_kb=%u rss_peak_kb=%u", stage, elapsedMs,
                 platform::residentBytes() / 1024U, platform::peakResidentBytes() / 1024U);
}

void markLoop(BaselineState& state, uint64_t snapshotVersion, const char* modeName, bool enabled,
              unsigned long periodMs) {
  if (!enabled) {
    return;
  }
  const unsigned long nowMs = platform::millisMs();
  if (state.lastLoopLogMs == 0) {
    state.lastLoopLogMs = nowMs;
    return;
  }
  if (nowMs - state.lastLoopLogMs < periodMs) {
    return;
  }
  state.lastLoopLogMs = nowMs;
  platform::logi("baseline", "uptime_s=%lu rss_kb=%u rss_peak_kb=%u posters_v=%llu mode=%s",
                 nowMs / 1000UL, platform::residentBytes() / 1024U,
                 platform::peakResidentBytes() / 1024U,
                 static_cast<unsigned long long>(snapshotVersion),
                 modeName != nullptr ? modeName : "-");
}

}  // namespace boot
