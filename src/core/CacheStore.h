#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "PosterTypes.h"

enum class CacheWriteStatus : uint8_t { kOk = 0, kUnchanged, kWriteFailed, kBusy };

const char* cacheWriteStatusName(CacheWriteStatus status);

struct EvictionReport {
  std::vector<std::string> evicted;
  // Absent from the latest list but still inside the grace window.
  std::vector<std::string> retained;
  // In the latest list but not cached; the caller downloads these.
  std::vector<std::string> missing;
  // Eviction attempted but the file could not be removed; kept for next time.
  std::vector<std::string> failed;
  uint64_t bytesFreed = 0;
};

// Poster images on disk, one file per poster id, plus an in-memory index.
//
// Readers (get, size, totalBytes) load an immutable index snapshot and never
// block. Everything else is called from the refresh thread only; a per-id
// in-flight set rejects overlapping writes of the same id.
class CacheStore {
 public:
  struct Options {
    std::string directory;
    uint32_t graceCycles = 0;
    // 0 disables the disk budget.
    uint64_t maxBytes = 0;
  };

  explicit CacheStore(const Options& options);

  // Creates the directory, drops stale temp files and indexes what is there.
  bool open(std::string* errorMessage = nullptr);

  std::optional<CacheEntry> get(const std::string& id) const;
  size_t size() const;
  uint64_t totalBytes() const;

  // Returned entries carry no bytes; use loadBytes or the bytes passed in.
  CacheWriteStatus putIfAbsent(const PosterRecord& record, const ImageBytes& bytes,
                               CacheEntry& out, std::string* errorMessage = nullptr);
  EvictionReport reconcile(const std::vector<PosterRecord>& latest);
  // Evicts least recently seen entries outside protectedIds until the cache
  // fits maxBytes. Protected ids are never evicted, even if still over budget.
  EvictionReport enforceBudget(const std::set<std::string>& protectedIds);
  bool loadBytes(const std::string& id, std::shared_ptr<const ImageBytes>& out,
                 std::string* errorMessage = nullptr) const;

  const std::string& directory() const { return options_.directory; }

  // File stem used on disk for a poster id.
  static std::string keyFor(const std::string& id);
  static std::string extensionFor(const std::string& url);
  static uint64_t contentHash(const uint8_t* data, size_t len);

 private:
  using Index = std::map<std::string, CacheEntry>;

  std::shared_ptr<const Index> loadIndex() const;
  void publishIndex(std::shared_ptr<const Index> index);
  bool evictLocked(Index& index, const std::string& key, EvictionReport& report);
  void releaseInFlight(const std::string& key);

  Options options_;
  std::shared_ptr<const Index> index_;
  std::mutex writeMutex_;
  std::set<std::string> inFlight_;
  // Writer-only bookkeeping, keyed like the index.
  std::map<std::string, uint32_t> missingCycles_;
  std::map<std::string, std::time_t> lastSeen_;
};
