#pragma once

#include <cstdint>

namespace AppConfig {
constexpr char kDefaultConfigPath[] = "config.json";
constexpr char kDefaultApiUrl[] =
    "https://posterbridge.incandescentsolution.com/api/v1/eposter-list";
constexpr char kDefaultDeviceId[] = "default_device";
constexpr char kDefaultFramebuffer[] = "/dev/fb0";
constexpr char kCacheDirName[] = "eposter_cache";
constexpr char kStateDirName[] = ".eposter";
constexpr char kPosterMirrorFile[] = "posters.json";
constexpr char kEventMirrorFile[] = "event.json";

constexpr uint32_t kDefaultDisplayTimeSec = 5;
constexpr uint32_t kDefaultCacheRefreshSec = 60;
constexpr uint32_t kDefaultRequestTimeoutSec = 10;
constexpr uint32_t kDefaultProbeTimeoutSec = 5;
constexpr uint32_t kDefaultLongPressMs = 1500;
constexpr uint32_t kMaxDisplayTimeSec = 24U * 60U * 60U;

constexpr uint32_t kLoopDelayMs = 15;
constexpr uint64_t kMaxDownloadBytes = 64ULL * 1024ULL * 1024ULL;
constexpr uint32_t kLongPressSlopPx = 24;

// Process exit codes (sysexits.h values) read by the supervisor.
constexpr int kExitOk = 0;
constexpr int kExitConfigError = 78;
constexpr int kExitDisplayError = 69;

constexpr bool kBaselineMetricsEnabled = true;
constexpr uint32_t kBaselineLoopLogPeriodMs = 60000;
}
