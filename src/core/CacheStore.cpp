#include "core/CacheStore.h"

#include <algorithm>
#include <utility>

#include "core/ImageHeader.h"
#include "platform/Fs.h"
#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "cache";
constexpr size_t kMaxKeyLength = 120;
constexpr const char* kKnownExtensions[] = {"png", "jpg", "jpeg", "gif", "bmp", "webp"};

bool endsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string lowerCopy(std::string text) {
  for (char& c : text) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return text;
}

}  // namespace

const char* cacheWriteStatusName(CacheWriteStatus status) {
  switch (status) {
    case CacheWriteStatus::kOk:
      return "ok";
    case CacheWriteStatus::kUnchanged:
      return "unchanged";
    case CacheWriteStatus::kWriteFailed:
      return "write_failed";
    case CacheWriteStatus::kBusy:
      return "busy";
  }
  return "unknown";
}

CacheStore::CacheStore(const Options& options)
    : options_(options), index_(std::make_shared<const Index>()) {}

std::shared_ptr<const CacheStore::Index> CacheStore::loadIndex() const {
  return std::atomic_load(&index_);
}

void CacheStore::publishIndex(std::shared_ptr<const Index> index) {
  std::atomic_store(&index_, std::move(index));
}

std::string CacheStore::keyFor(const std::string& id) {
  std::string key;
  key.reserve(id.size());
  for (const char c : id) {
    const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                      c == '-' || c == '_' || c == '.';
    key.push_back(safe ? c : '_');
  }
  if (key.empty() || key[0] == '.') {
    key.insert(key.begin(), '_');
  }
  if (key.size() > kMaxKeyLength) {
    key.resize(kMaxKeyLength);
  }
  return key;
}

std::string CacheStore::extensionFor(const std::string& url) {
  const std::string path = url.substr(0, url.find_first_of("?#"));
  const size_t slash = path.rfind('/');
  const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  const size_t dot = name.rfind('.');
  if (dot != std::string::npos) {
    const std::string ext = lowerCopy(name.substr(dot + 1));
    for (const char* known : kKnownExtensions) {
      if (ext == known) {
        return "." + ext;
      }
    }
  }
  return ".img";
}

// FNV-1a, 64 bit.
uint64_t CacheStore::contentHash(const uint8_t* data, size_t len) {
  uint64_t hash = 14695981039346656037ULL;
  for (size_t i = 0; i < len; ++i) {
    hash ^= data[i];
    hash *= 1099511628211ULL;
  }
  return hash;
}

bool CacheStore::open(std::string* errorMessage) {
  if (!platform::fs::mkdirs(options_.directory)) {
    if (errorMessage != nullptr) {
      *errorMessage = "cannot create cache dir '" + options_.directory + "'";
    }
    return false;
  }

  std::vector<platform::fs::DirEntry> files;
  if (!platform::fs::listDir(options_.directory, files, errorMessage)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(writeMutex_);
  auto index = std::make_shared<Index>();
  size_t staleTemps = 0;
  for (const platform::fs::DirEntry& file : files) {
    if (!file.isFile || file.name.empty() || file.name[0] == '.') {
      continue;
    }
    const std::string path = platform::fs::joinPath(options_.directory, file.name);
    if (endsWith(file.name, ".tmp")) {
      if (platform::fs::remove(path)) {
        ++staleTemps;
      } else {
        platform::logw(kTag, "cannot remove stale temp %s", path.c_str());
      }
      continue;
    }

    const size_t dot = file.name.rfind('.');
    const std::string key = dot == std::string::npos ? file.name : file.name.substr(0, dot);

    std::vector<uint8_t> bytes;
    std::string readErr;
    if (!platform::fs::readFile(path, bytes, &readErr)) {
      platform::logw(kTag, "skip unreadable %s: %s", path.c_str(), readErr.c_str());
      continue;
    }

    CacheEntry entry;
    entry.id = key;
    entry.localPath = path;
    entry.byteSize = bytes.size();
    entry.fetchedAt = file.modifiedAt;
    entry.contentHash = contentHash(bytes.data(), bytes.size());
    if (!probeImageGeometry(bytes.data(), bytes.size(), entry.geometry)) {
      platform::logw(kTag, "unknown image header in %s", file.name.c_str());
    }

    auto existing = index->find(key);
    if (existing != index->end()) {
      // Two files for one poster: keep the newer download.
      const bool keepNew = entry.fetchedAt > existing->second.fetchedAt;
      const std::string& drop = keepNew ? existing->second.localPath : entry.localPath;
      platform::logw(kTag, "duplicate file for key=%s, removing %s", key.c_str(), drop.c_str());
      (void)platform::fs::remove(drop);
      if (!keepNew) {
        continue;
      }
    }
    lastSeen_[key] = entry.fetchedAt;
    (*index)[key] = entry;
  }
  publishIndex(index);

  platform::logi(kTag, "opened dir=%s entries=%u bytes=%llu stale_tmp=%u",
                 options_.directory.c_str(), static_cast<unsigned>(index->size()),
                 static_cast<unsigned long long>(totalBytes()), static_cast<unsigned>(staleTemps));
  return true;
}

std::optional<CacheEntry> CacheStore::get(const std::string& id) const {
  const std::shared_ptr<const Index> index = loadIndex();
  const auto it = index->find(keyFor(id));
  if (it == index->end()) {
    return std::nullopt;
  }
  CacheEntry entry = it->second;
  entry.id = id;
  return entry;
}

size_t CacheStore::size() const { return loadIndex()->size(); }

uint64_t CacheStore::totalBytes() const {
  uint64_t total = 0;
  for (const auto& kv : *loadIndex()) {
    total += kv.second.byteSize;
  }
  return total;
}

void CacheStore::releaseInFlight(const std::string& key) {
  std::lock_guard<std::mutex> lock(writeMutex_);
  inFlight_.erase(key);
}

CacheWriteStatus CacheStore::putIfAbsent(const PosterRecord& record, const ImageBytes& bytes,
                                         CacheEntry& out, std::string* errorMessage) {
  const std::string key = keyFor(record.id);
  {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!inFlight_.insert(key).second) {
      if (errorMessage != nullptr) {
        *errorMessage = "write already in flight for id=" + record.id;
      }
      return CacheWriteStatus::kBusy;
    }
  }

  const uint64_t hash = contentHash(bytes.data(), bytes.size());
  const std::optional<CacheEntry> current = get(record.id);
  if (current.has_value() && current->contentHash == hash && current->byteSize == bytes.size() &&
      platform::fs::exists(current->localPath)) {
    out = *current;
    releaseInFlight(key);
    return CacheWriteStatus::kUnchanged;
  }

  CacheEntry entry;
  entry.id = record.id;
  entry.localPath =
      platform::fs::joinPath(options_.directory, key + extensionFor(record.remoteUrl));
  entry.byteSize = bytes.size();
  entry.fetchedAt = std::time(nullptr);
  entry.contentHash = hash;
  if (!probeImageGeometry(bytes.data(), bytes.size(), entry.geometry)) {
    platform::logw(kTag, "id=%s: unknown image header, geometry left unset", record.id.c_str());
  }

  std::string writeErr;
  if (!platform::fs::writeFileAtomic(entry.localPath, bytes.data(), bytes.size(), &writeErr)) {
    if (errorMessage != nullptr) {
      *errorMessage = writeErr;
    }
    releaseInFlight(key);
    return CacheWriteStatus::kWriteFailed;
  }
  if (current.has_value() && current->localPath != entry.localPath) {
    (void)platform::fs::remove(current->localPath);
  }

  {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto next = std::make_shared<Index>(*loadIndex());
    (*next)[key] = entry;
    lastSeen_[key] = record.lastSeen != 0 ? record.lastSeen : entry.fetchedAt;
    publishIndex(next);
    inFlight_.erase(key);
  }
  out = entry;
  return CacheWriteStatus::kOk;
}

bool CacheStore::evictLocked(Index& index, const std::string& key, EvictionReport& report) {
  const auto it = index.find(key);
  if (it == index.end()) {
    return false;
  }
  const CacheEntry& entry = it->second;
  if (!platform::fs::remove(entry.localPath) && platform::fs::exists(entry.localPath)) {
    platform::logw(kTag, "evict id=%s: cannot remove %s", key.c_str(), entry.localPath.c_str());
    report.failed.push_back(entry.id);
    return false;
  }
  report.evicted.push_back(entry.id);
  report.bytesFreed += entry.byteSize;
  missingCycles_.erase(key);
  lastSeen_.erase(key);
  index.erase(it);
  return true;
}

EvictionReport CacheStore::reconcile(const std::vector<PosterRecord>& latest) {
  EvictionReport report;
  std::lock_guard<std::mutex> lock(writeMutex_);
  auto next = std::make_shared<Index>(*loadIndex());

  std::set<std::string> latestKeys;
  for (const PosterRecord& record : latest) {
    const std::string key = keyFor(record.id);
    latestKeys.insert(key);
    missingCycles_.erase(key);
    if (next->count(key) != 0) {
      lastSeen_[key] = record.lastSeen != 0 ? record.lastSeen : std::time(nullptr);
    } else {
      report.missing.push_back(record.id);
    }
  }

  std::vector<std::string> candidates;
  for (const auto& kv : *next) {
    if (latestKeys.count(kv.first) == 0 && inFlight_.count(kv.first) == 0) {
      candidates.push_back(kv.first);
    }
  }
  for (const std::string& key : candidates) {
    const uint32_t absentFor = ++missingCycles_[key];
    if (absentFor <= options_.graceCycles) {
      report.retained.push_back((*next)[key].id);
      continue;
    }
    (void)evictLocked(*next, key, report);
  }
  publishIndex(next);

  if (!report.evicted.empty() || !report.failed.empty()) {
    platform::logi(kTag, "reconcile evicted=%u failed=%u freed=%llu retained=%u missing=%u",
                   static_cast<unsigned>(report.evicted.size()),
                   static_cast<unsigned>(report.failed.size()),
                   static_cast<unsigned long long>(report.bytesFreed),
                   static_cast<unsigned>(report.retained.size()),
                   static_cast<unsigned>(report.missing.size()));
  }
  return report;
}

EvictionReport CacheStore::enforceBudget(const std::set<std::string>& protectedIds) {
  EvictionReport report;
  if (options_.maxBytes == 0) {
    return report;
  }
  std::lock_guard<std::mutex> lock(writeMutex_);
  auto next = std::make_shared<Index>(*loadIndex());

  uint64_t total = 0;
  for (const auto& kv : *next) {
    total += kv.second.byteSize;
  }
  if (total <= options_.maxBytes) {
    return report;
  }

  std::set<std::string> protectedKeys;
  for (const std::string& id : protectedIds) {
    protectedKeys.insert(keyFor(id));
  }
  std::vector<std::pair<std::time_t, std::string>> candidates;
  for (const auto& kv : *next) {
    if (protectedKeys.count(kv.first) != 0 || inFlight_.count(kv.first) != 0) {
      continue;
    }
    const auto seen = lastSeen_.find(kv.first);
    candidates.emplace_back(seen == lastSeen_.end() ? kv.second.fetchedAt : seen->second,
                            kv.first);
  }
  std::sort(candidates.begin(), candidates.end());

  for (const auto& candidate : candidates) {
    if (total <= options_.maxBytes) {
      break;
    }
    const uint64_t size = (*next)[candidate.second].byteSize;
    if (evictLocked(*next, candidate.second, report)) {
      total -= size;
    }
  }
  publishIndex(next);

  if (total > options_.maxBytes) {
    platform::logw(kTag, "over budget after eviction: %llu > %llu bytes (protected=%u)",
                   static_cast<unsigned long long>(total),
                   static_cast<unsigned long long>(options_.maxBytes),
                   static_cast<unsigned>(protectedKeys.size()));
  } else {
    platform::logi(kTag, "budget eviction evicted=%u freed=%llu",
                   static_cast<unsigned>(report.evicted.size()),
                   static_cast<unsigned long long>(report.bytesFreed));
  }
  return report;
}

bool CacheStore::loadBytes(const std::string& id, std::shared_ptr<const ImageBytes>& out,
                           std::string* errorMessage) const {
  const std::optional<CacheEntry> entry = get(id);
  if (!entry.has_value()) {
    if (errorMessage != nullptr) {
      *errorMessage = "id=" + id + " not cached";
    }
    return false;
  }
  auto bytes = std::make_shared<ImageBytes>();
  if (!platform::fs::readFile(entry->localPath, *bytes, errorMessage)) {
    return false;
  }
  out = std::move(bytes);
  return true;
}
