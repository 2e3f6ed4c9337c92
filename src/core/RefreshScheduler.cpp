#include "core/RefreshScheduler.h"

#include <chrono>
#include <ctime>
#include <set>

#include "AppConfig.h"
#include "platform/Fs.h"
#include "platform/Platform.h"
#include "services/PosterFeed.h"

namespace {
constexpr const char* kTag = "refresh";
constexpr const char* kSourceApi = "api";
constexpr const char* kSourceCache = "cache";

const PosterRecord* findRecord(const std::vector<PosterRecord>& records, const std::string& id) {
  for (const PosterRecord& record : records) {
    if (record.id == id) {
      return &record;
    }
  }
  return nullptr;
}
}  // namespace

const char* cycleOutcomeName(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kPublished:
      return "published";
    case CycleOutcome::kOffline:
      return "offline";
    case CycleOutcome::kFetchFailed:
      return "fetch_failed";
    case CycleOutcome::kEmptyList:
      return "empty_list";
    case CycleOutcome::kCacheWriteFailed:
      return "cache_write_failed";
  }
  return "unknown";
}

RefreshScheduler::RefreshScheduler(const KioskSettings& settings, ConnectivityProbe& probe,
                                   PosterApi& api, CacheStore& cache, SnapshotPublisher& publisher)
    : settings_(settings), probe_(probe), api_(api), cache_(cache), publisher_(publisher) {}

RefreshScheduler::~RefreshScheduler() { stop(); }

bool RefreshScheduler::warmStart() {
  const std::string eventPath =
      platform::fs::joinPath(settings_.stateDir, AppConfig::kEventMirrorFile);
  std::string eventText;
  if (platform::fs::exists(eventPath) && platform::fs::readText(eventPath, eventText)) {
    std::string err;
    if (!poster_feed::parseEventMetadata(eventText, event_, &err)) {
      platform::logw(kTag, "ignoring %s: %s", eventPath.c_str(), err.c_str());
      event_ = EventMetadata();
    }
  }

  const std::string postersPath =
      platform::fs::joinPath(settings_.stateDir, AppConfig::kPosterMirrorFile);
  if (!platform::fs::exists(postersPath)) {
    platform::logi(kTag, "warm start: no %s yet", postersPath.c_str());
    return false;
  }
  std::string payload;
  std::string err;
  if (!platform::fs::readText(postersPath, payload, &err)) {
    platform::logw(kTag, "warm start: %s", err.c_str());
    return false;
  }
  poster_feed::PosterFeed feed;
  const poster_feed::ParseStatus status =
      poster_feed::parsePosterPayload(payload, settings_.deviceId, std::time(nullptr), feed, &err);
  if (status != poster_feed::ParseStatus::kOk) {
    platform::logw(kTag, "warm start: unusable %s: %s", postersPath.c_str(), err.c_str());
    return false;
  }

  SnapshotPtr snapshot =
      buildSnapshot(feed.records, feed.displayTimeSec, kSourceCache, true, BytesById());
  publisher_.publish(snapshot);
  platform::logi(kTag, "warm start: published v%llu posters=%u displayable=%u",
                 static_cast<unsigned long long>(snapshot->version),
                 static_cast<unsigned>(snapshot->posters.size()),
                 static_cast<unsigned>(snapshot->displayableCount()));
  return true;
}

void RefreshScheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread(&RefreshScheduler::threadLoop, this);
  platform::logi(kTag, "started interval=%us", static_cast<unsigned>(settings_.cacheRefreshSec));
}

void RefreshScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    platform::logi(kTag, "stopped");
  }
}

void RefreshScheduler::threadLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    lock.unlock();
    (void)runCycle();
    lock.lock();
    wake_.wait_for(lock, std::chrono::seconds(settings_.cacheRefreshSec),
                   [this] { return stopping_; });
  }
}

CycleReport RefreshScheduler::runCycle() {
  CycleReport report;
  const uint32_t startMs = platform::millisMs();
  lastAttemptMs_.store(startMs);

  if (!probe_.isOnline()) {
    report.outcome = CycleOutcome::kOffline;
    report.durationMs = platform::millisMs() - startMs;
    logReport(report);
    return report;
  }

  poster_feed::PosterFeed feed;
  std::string rawPayload;
  report.fetchStatus = api_.fetchPosters(feed, rawPayload, &report.error);
  if (report.fetchStatus != FetchStatus::kOk) {
    report.outcome = CycleOutcome::kFetchFailed;
    report.durationMs = platform::millisMs() - startMs;
    logReport(report);
    return report;
  }
  report.records = feed.records.size();
  if (feed.records.empty()) {
    report.outcome = CycleOutcome::kEmptyList;
    report.durationMs = platform::millisMs() - startMs;
    logReport(report);
    return report;
  }

  refreshEventMetadata();

  const EvictionReport eviction = cache_.reconcile(feed.records);
  report.evicted = eviction.evicted.size();

  BytesById fresh;
  if (!downloadMissing(feed.records, eviction.missing, fresh, report)) {
    report.outcome = CycleOutcome::kCacheWriteFailed;
    report.durationMs = platform::millisMs() - startMs;
    logReport(report);
    return report;
  }

  SnapshotPtr snapshot =
      buildSnapshot(feed.records, feed.displayTimeSec, kSourceApi, false, fresh);

  std::set<std::string> protectedIds;
  for (const PosterSlot& slot : snapshot->posters) {
    protectedIds.insert(slot.record.id);
  }
  report.evicted += cache_.enforceBudget(protectedIds).evicted.size();

  writeMirror(AppConfig::kPosterMirrorFile, rawPayload);
  publisher_.publish(snapshot);
  report.outcome = CycleOutcome::kPublished;
  report.displayable = snapshot->displayableCount();
  report.snapshotVersion = snapshot->version;
  report.durationMs = platform::millisMs() - startMs;
  logReport(report);
  return report;
}

void RefreshScheduler::refreshEventMetadata() {
  if (settings_.eventUrl.empty()) {
    return;
  }
  EventMetadata event;
  std::string err;
  const FetchStatus status = api_.fetchEventMetadata(event, &err);
  if (status != FetchStatus::kOk) {
    platform::logw(kTag, "event metadata %s, keeping previous: %s", fetchStatusName(status),
                   err.c_str());
    return;
  }
  event_ = event;
  writeMirror(AppConfig::kEventMirrorFile, event_.json);
}

void RefreshScheduler::writeMirror(const char* fileName, const std::string& text) const {
  std::string err;
  if (!platform::fs::mkdirs(settings_.stateDir)) {
    platform::logw(kTag, "cannot create state dir %s", settings_.stateDir.c_str());
    return;
  }
  const std::string path = platform::fs::joinPath(settings_.stateDir, fileName);
  if (!platform::fs::writeTextAtomic(path, text, &err)) {
    platform::logw(kTag, "%s not saved: %s", fileName, err.c_str());
  }
}

bool RefreshScheduler::downloadMissing(const std::vector<PosterRecord>& records,
                                       const std::vector<std::string>& missing, BytesById& fresh,
                                       CycleReport& report) {
  for (const std::string& id : missing) {
    const PosterRecord* record = findRecord(records, id);
    if (record == nullptr) {
      continue;
    }
    auto bytes = std::make_shared<ImageBytes>();
    std::string err;
    const FetchStatus status = api_.fetchImage(record->remoteUrl, *bytes, &err);
    if (status != FetchStatus::kOk) {
      ++report.downloadFailed;
      platform::logw(kTag, "download id=%s %s: %s", id.c_str(), fetchStatusName(status),
                     err.c_str());
      continue;
    }

    CacheEntry entry;
    const CacheWriteStatus written = cache_.putIfAbsent(*record, *bytes, entry, &err);
    switch (written) {
      case CacheWriteStatus::kOk:
      case CacheWriteStatus::kUnchanged:
        ++report.downloaded;
        fresh[id] = bytes;
        break;
      case CacheWriteStatus::kBusy:
        ++report.downloadFailed;
        platform::logw(kTag, "id=%s: %s", id.c_str(), err.c_str());
        break;
      case CacheWriteStatus::kWriteFailed:
        report.error = err;
        platform::loge(kTag, "cache write failed id=%s: %s", id.c_str(), err.c_str());
        return false;
    }
  }
  return true;
}

SnapshotPtr RefreshScheduler::buildSnapshot(const std::vector<PosterRecord>& records,
                                            uint32_t displayTimeSec, const char* source,
                                            bool keepUncached, const BytesById& fresh) {
  // Unchanged posters share bytes with the snapshot on screen.
  std::map<std::string, const CacheEntry*> previous;
  const SnapshotPtr current = publisher_.current();
  if (current != nullptr) {
    for (const PosterSlot& slot : current->posters) {
      if (slot.displayable()) {
        previous[slot.record.id] = &*slot.entry;
      }
    }
  }

  auto snapshot = std::make_shared<PosterListSnapshot>();
  snapshot->posters.reserve(records.size());
  for (const PosterRecord& record : records) {
    PosterSlot slot;
    slot.record = record;
    std::optional<CacheEntry> entry = cache_.get(record.id);
    if (entry.has_value()) {
      const auto freshIt = fresh.find(record.id);
      const auto prevIt = previous.find(record.id);
      if (freshIt != fresh.end()) {
        entry->bytes = freshIt->second;
      } else if (prevIt != previous.end() && prevIt->second->contentHash == entry->contentHash) {
        entry->bytes = prevIt->second->bytes;
      } else {
        std::string err;
        if (!cache_.loadBytes(record.id, entry->bytes, &err)) {
          platform::logw(kTag, "id=%s unreadable: %s", record.id.c_str(), err.c_str());
          entry.reset();
        }
      }
    }
    if (entry.has_value()) {
      slot.entry = std::move(entry);
    } else if (!keepUncached) {
      continue;
    }
    snapshot->posters.push_back(std::move(slot));
  }
  snapshot->event = event_;
  snapshot->displayTimeSec = displayTimeSec;
  snapshot->source = source;
  snapshot->publishedAt = std::time(nullptr);
  snapshot->version = publisher_.nextVersion();
  return snapshot;
}

void RefreshScheduler::logReport(const CycleReport& report) const {
  switch (report.outcome) {
    case CycleOutcome::kPublished:
      platform::logi(kTag,
                     "cycle published v%llu records=%u displayable=%u downloaded=%u "
                     "failed=%u evicted=%u ms=%u",
                     static_cast<unsigned long long>(report.snapshotVersion),
                     static_cast<unsigned>(report.records),
                     static_cast<unsigned>(report.displayable),
                     static_cast<unsigned>(report.downloaded),
                     static_cast<unsigned>(report.downloadFailed),
                     static_cast<unsigned>(report.evicted), static_cast<unsigned>(report.durationMs));
      break;
    case CycleOutcome::kOffline:
      platform::logi(kTag, "cycle offline, keeping current posters ms=%u",
                     static_cast<unsigned>(report.durationMs));
      break;
    case CycleOutcome::kFetchFailed:
      if (report.fetchStatus == FetchStatus::kUnauthorized) {
        platform::loge(kTag, "cycle fetch %s, check api.poster_token: %s",
                       fetchStatusName(report.fetchStatus), report.error.c_str());
      } else {
        platform::logw(kTag, "cycle fetch %s: %s", fetchStatusName(report.fetchStatus),
                       report.error.c_str());
      }
      break;
    case CycleOutcome::kEmptyList:
      platform::logw(kTag, "cycle got an empty poster list, keeping current posters ms=%u",
                     static_cast<unsigned>(report.durationMs));
      break;
    case CycleOutcome::kCacheWriteFailed:
      platform::loge(kTag, "cycle aborted on cache write, keeping current posters: %s",
                     report.error.c_str());
      break;
  }
}
