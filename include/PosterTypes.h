#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class Orientation : uint8_t { kPortrait = 0, kLandscape };

inline const char* orientationName(Orientation orientation) {
  return orientation == Orientation::kLandscape ? "landscape" : "portrait";
}

struct ImageGeometry {
  uint32_t width = 0;
  uint32_t height = 0;
  Orientation orientation = Orientation::kPortrait;
};

struct PosterRecord {
  std::string id;
  std::string remoteUrl;
  std::string title;
  std::string topic;
  std::string presenter;
  std::string institute;
  // Schedule window as sent by the feed ("%d-%m-%Y %H:%M:%S"), informational.
  std::string startsAt;
  std::string endsAt;
  std::time_t lastSeen = 0;
};

using ImageBytes = std::vector<uint8_t>;

struct CacheEntry {
  std::string id;
  std::string localPath;
  uint64_t byteSize = 0;
  std::time_t fetchedAt = 0;
  ImageGeometry geometry;
  uint64_t contentHash = 0;
  // Loaded by the refresh thread so the render loop never reads the disk.
  std::shared_ptr<const ImageBytes> bytes;
};

struct PosterSlot {
  PosterRecord record;
  std::optional<CacheEntry> entry;

  bool displayable() const { return entry.has_value() && entry->bytes != nullptr; }
};

struct EventMetadata {
  std::string json;
  std::string title;

  bool empty() const { return json.empty(); }
};

struct PosterListSnapshot {
  uint64_t version = 0;
  std::vector<PosterSlot> posters;
  EventMetadata event;
  // Feed-supplied per-poster time; 0 means use the configured display time.
  uint32_t displayTimeSec = 0;
  std::string source;
  std::time_t publishedAt = 0;

  size_t displayableCount() const {
    size_t count = 0;
    for (const PosterSlot& slot : posters) {
      if (slot.displayable()) {
        ++count;
      }
    }
    return count;
  }
};

using SnapshotPtr = std::shared_ptr<const PosterListSnapshot>;
