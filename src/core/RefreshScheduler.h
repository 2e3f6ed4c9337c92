#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "KioskSettings.h"
#include "PosterTypes.h"
#include "core/CacheStore.h"
#include "core/SnapshotPublisher.h"
#include "services/ConnectivityProbe.h"
#include "services/PosterApiClient.h"

enum class CycleOutcome : uint8_t {
  kPublished = 0,
  kOffline,
  kFetchFailed,
  // The feed parsed but named no posters; cache and snapshot are kept.
  kEmptyList,
  kCacheWriteFailed
};

const char* cycleOutcomeName(CycleOutcome outcome);

struct CycleReport {
  CycleOutcome outcome = CycleOutcome::kOffline;
  FetchStatus fetchStatus = FetchStatus::kOk;
  size_t records = 0;
  size_t downloaded = 0;
  size_t downloadFailed = 0;
  size_t evicted = 0;
  size_t displayable = 0;
  uint64_t snapshotVersion = 0;
  uint32_t durationMs = 0;
  std::string error;
};

// Background refresh loop: probe, fetch, reconcile, download, publish. The
// first cycle runs as soon as start() is called, then one per cache_refresh
// seconds. A failed cycle leaves the published snapshot untouched.
class RefreshScheduler {
 public:
  RefreshScheduler(const KioskSettings& settings, ConnectivityProbe& probe, PosterApi& api,
                   CacheStore& cache, SnapshotPublisher& publisher);
  ~RefreshScheduler();

  RefreshScheduler(const RefreshScheduler&) = delete;
  RefreshScheduler& operator=(const RefreshScheduler&) = delete;

  // Publishes the last mirrored poster list over the on-disk cache. Returns
  // false when there is nothing to show yet.
  bool warmStart();
  void start();
  void stop();
  CycleReport runCycle();

  uint32_t lastAttemptMs() const { return lastAttemptMs_.load(); }

 private:
  using BytesById = std::map<std::string, std::shared_ptr<const ImageBytes>>;

  void threadLoop();
  void refreshEventMetadata();
  void writeMirror(const char* fileName, const std::string& text) const;
  bool downloadMissing(const std::vector<PosterRecord>& records,
                       const std::vector<std::string>& missing, BytesById& fresh,
                       CycleReport& report);
  SnapshotPtr buildSnapshot(const std::vector<PosterRecord>& records, uint32_t displayTimeSec,
                            const char* source, bool keepUncached, const BytesById& fresh);
  void logReport(const CycleReport& report) const;

  const KioskSettings& settings_;
  ConnectivityProbe& probe_;
  PosterApi& api_;
  CacheStore& cache_;
  SnapshotPublisher& publisher_;

  std::atomic<uint32_t> lastAttemptMs_{0};
  // Refresh thread only.
  EventMetadata event_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_ = false;
};
