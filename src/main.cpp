#include <curl/curl.h>
#include <signal.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "AppConfig.h"
#include "KioskSettings.h"
#include "core/BootCommon.h"
#include "core/CacheStore.h"
#include "core/DisplayController.h"
#include "core/ImagePreparer.h"
#include "core/RefreshScheduler.h"
#include "core/SnapshotPublisher.h"
#include "platform/Platform.h"
#include "platform/PointerInput.h"
#include "services/ConnectivityProbe.h"
#include "services/HttpClient.h"
#include "services/PosterApiClient.h"
#include "ui/LvglDisplay.h"
#include "ui/LvglImageDecoder.h"
#include "ui/PosterRenderer.h"

namespace {
constexpr const char* kTag = "main";
constexpr const char* kBootTag = "boot";
constexpr const char* kConfigEnv = "EPOSTER_CONFIG";

std::atomic<bool> sStopRequested{false};
boot::BaselineState gBaselineState;

void baselineMark(const char* stage) {
  boot::mark(gBaselineState, stage, AppConfig::kBaselineMetricsEnabled);
}

void onStopSignal(int) { sStopRequested.store(true); }

void installSignalHandlers() {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = onStopSignal;
  sigemptyset(&action.sa_mask);
  (void)sigaction(SIGINT, &action, nullptr);
  (void)sigaction(SIGTERM, &action, nullptr);
}

void printUsage(const char* argv0) {
  std::printf(
      "usage: %s [--config <path>] [--help]\n"
      "  --config <path>  settings file (default: $%s, else ./%s)\n"
      "Environment variables (POSTER_TOKEN, DISPLAY_TIME, ...) override file values.\n",
      argv0, kConfigEnv, AppConfig::kDefaultConfigPath);
}

bool parseArgs(int argc, char** argv, std::string& configPath, bool& showHelp,
               std::string* errorMessage) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      showHelp = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        *errorMessage = "--config needs a path";
        return false;
      }
      configPath = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      configPath = arg.substr(9);
    } else {
      *errorMessage = "unknown argument '" + arg + "'";
      return false;
    }
  }
  return true;
}

std::string resolveConfigPath(const std::string& fromArgs) {
  if (!fromArgs.empty()) {
    return fromArgs;
  }
  const char* fromEnv = std::getenv(kConfigEnv);
  if (fromEnv != nullptr && *fromEnv != '\0') {
    return fromEnv;
  }
  return AppConfig::kDefaultConfigPath;
}

void runDisplayLoop(const KioskSettings& settings, SnapshotPublisher& publisher,
                    uint16_t width, uint16_t height) {
  DisplayController::Options options;
  options.displayTimeMs = settings.displayTimeSec * 1000U;
  options.pinnedTimeoutMs = settings.pinnedTimeoutSec * 1000U;
  DisplayController controller(options);

  LvglImageDecoder decoder;
  const ImagePreparer preparer(decoder);
  TargetGeometry target;
  target.width = width;
  target.height = height;
  target.orientation = settings.orientation;
  PosterRenderer renderer(controller, preparer, target);

  platform::logi(kTag, "display loop started %ux%u %s", static_cast<unsigned>(width),
                 static_cast<unsigned>(height), orientationName(settings.orientation));
  while (!sStopRequested.load()) {
    const uint32_t nowMs = platform::millisMs();
    pointer_input::poll(nowMs);
    if (pointer_input::takeExitRequest()) {
      platform::logi(kTag, "exit key pressed");
      break;
    }
    for (uint32_t clicks = pointer_input::takeSecondaryClicks(); clicks > 0; --clicks) {
      controller.post({ControlEvent::Type::kSecondaryClick, std::string()});
    }

    const SnapshotPtr snapshot = publisher.current();
    const Frame& frame = controller.step(nowMs, snapshot);
    if (controller.exitRequested()) {
      break;
    }
    renderer.present(frame);
    lvgl_display::tick();

    boot::markLoop(gBaselineState, snapshot != nullptr ? snapshot->version : 0,
                   displayModeName(controller.mode()), AppConfig::kBaselineMetricsEnabled,
                   AppConfig::kBaselineLoopLogPeriodMs);
    platform::sleepMs(AppConfig::kLoopDelayMs);
  }
  if (sStopRequested.load()) {
    platform::logi(kTag, "stop signal received");
  }
}

}  // namespace

int main(int argc, char** argv) {
  boot::start(gBaselineState);

  std::string configArg;
  bool showHelp = false;
  std::string err;
  if (!parseArgs(argc, argv, configArg, showHelp, &err)) {
    std::fprintf(stderr, "%s\n", err.c_str());
    printUsage(argv[0]);
    return AppConfig::kExitConfigError;
  }
  if (showHelp) {
    printUsage(argv[0]);
    return AppConfig::kExitOk;
  }

  platform::logi(kBootTag, "poster kiosk starting");
  baselineMark("setup_start");

  const std::string configPath = resolveConfigPath(configArg);
  KioskSettings settings;
  if (!KioskSettings::load(configPath, settings, &err)) {
    platform::loge(kBootTag, "config %s: %s", configPath.c_str(), err.c_str());
    return AppConfig::kExitConfigError;
  }
  settings.logSummary();
  baselineMark("settings_ready");

  installSignalHandlers();
  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    platform::loge(kBootTag, "curl init failed; running from cache only");
  }

  CacheStore::Options cacheOptions;
  cacheOptions.directory = settings.cacheDir;
  cacheOptions.graceCycles = settings.evictionGraceCycles;
  cacheOptions.maxBytes = settings.maxCacheBytes;
  CacheStore cache(cacheOptions);
  if (!cache.open(&err)) {
    platform::loge(kBootTag, "cache unavailable: %s", err.c_str());
  }
  baselineMark("cache_ready");

  uint16_t width = 0;
  uint16_t height = 0;
  if (!lvgl_display::begin(settings, width, height, &err)) {
    platform::loge(kBootTag, "display: %s", err.c_str());
    curl_global_cleanup();
    return AppConfig::kExitDisplayError;
  }
  if (!pointer_input::init(width, height, settings.longPressMs)) {
    platform::logw(kBootTag, "pointer input unavailable");
  }
  baselineMark("display_ready");

  HttpClient http(settings.requestTimeoutSec * 1000U, AppConfig::kMaxDownloadBytes);
  NetConnectivityProbe probe(settings, http);
  HttpPosterApi api(settings, http);
  SnapshotPublisher publisher;
  RefreshScheduler scheduler(settings, probe, api, cache, publisher);
  (void)scheduler.warmStart();
  scheduler.start();
  baselineMark("setup_complete");

  runDisplayLoop(settings, publisher, width, height);

  platform::logi(kBootTag, "shutting down");
  scheduler.stop();
  pointer_input::shutdown();
  lvgl_display::shutdown();
  curl_global_cleanup();
  return AppConfig::kExitOk;
}
