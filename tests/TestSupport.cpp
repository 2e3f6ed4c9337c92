#include "TestSupport.h"

#include <ftw.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "platform/Fs.h"

namespace test_support {

namespace {

int removeEntry(const char* path, const struct stat*, int, struct FTW*) {
  return ::remove(path);
}

void putBe32(ImageBytes& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value >> 24));
  out.push_back(static_cast<uint8_t>(value >> 16));
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value));
}

}  // namespace

TempDir::TempDir() {
  const char* base = std::getenv("TMPDIR");
  std::string pattern = std::string(base != nullptr && *base != '\0' ? base : "/tmp") +
                        "/poster_kiosk_test_XXXXXX";
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed");
  }
  path_ = buf.data();
}

TempDir::~TempDir() { (void)::nftw(path_.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS); }

std::string TempDir::file(const std::string& name) const {
  return platform::fs::joinPath(path_, name);
}

ImageBytes makePng(uint32_t width, uint32_t height, uint8_t salt) {
  ImageBytes out = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  putBe32(out, 13);
  out.insert(out.end(), {'I', 'H', 'D', 'R'});
  putBe32(out, width);
  putBe32(out, height);
  out.insert(out.end(), {8, 6, 0, 0, 0});
  putBe32(out, 0);  // CRC, not checked by the header probe
  for (uint8_t i = 0; i < 16; ++i) {
    out.push_back(static_cast<uint8_t>(salt + i));
  }
  return out;
}

ImageBytes makeJpeg(uint32_t width, uint32_t height) {
  ImageBytes out = {0xFF, 0xD8};
  // APP0 segment ahead of the frame header.
  out.insert(out.end(), {0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00, 0x01, 0x01, 0x00,
                         0x00, 0x01, 0x00, 0x01, 0x00, 0x00});
  out.insert(out.end(), {0xFF, 0xC0, 0x00, 0x11, 0x08});
  out.push_back(static_cast<uint8_t>(height >> 8));
  out.push_back(static_cast<uint8_t>(height));
  out.push_back(static_cast<uint8_t>(width >> 8));
  out.push_back(static_cast<uint8_t>(width));
  out.insert(out.end(), {0x03, 0x01, 0x22, 0x00, 0x02, 0x11, 0x01, 0x03, 0x11, 0x01});
  out.insert(out.end(), {0xFF, 0xD9});
  return out;
}

std::string urlFor(const std::string& id) { return "https://posters.example/files/" + id + ".png"; }

PosterRecord makeRecord(const std::string& id, const std::string& url) {
  PosterRecord record;
  record.id = id;
  record.remoteUrl = url.empty() ? urlFor(id) : url;
  record.title = "Poster " + id;
  record.lastSeen = 1700000000;
  return record;
}

SnapshotPtr makeSnapshot(uint64_t version, const std::vector<std::string>& ids,
                         uint32_t displayTimeSec) {
  auto snapshot = std::make_shared<PosterListSnapshot>();
  snapshot->version = version;
  snapshot->displayTimeSec = displayTimeSec;
  snapshot->source = "api";
  uint8_t salt = 0;
  for (const std::string& id : ids) {
    PosterSlot slot;
    slot.record = makeRecord(id);
    CacheEntry entry;
    entry.id = id;
    entry.bytes = std::make_shared<ImageBytes>(makePng(600, 900, salt++));
    entry.byteSize = entry.bytes->size();
    entry.contentHash = 1000 + salt;
    slot.entry = entry;
    snapshot->posters.push_back(slot);
  }
  return snapshot;
}

std::vector<std::string> listFiles(const std::string& dir) {
  std::vector<platform::fs::DirEntry> entries;
  std::vector<std::string> names;
  if (!platform::fs::listDir(dir, entries)) {
    return names;
  }
  for (const platform::fs::DirEntry& entry : entries) {
    if (entry.isFile) {
      names.push_back(entry.name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

FetchStatus FakePosterApi::fetchPosters(poster_feed::PosterFeed& out, std::string& raw,
                                        std::string* errorMessage) {
  ++posterFetches;
  if (postersStatus != FetchStatus::kOk) {
    if (errorMessage != nullptr) {
      *errorMessage = std::string("fake ") + fetchStatusName(postersStatus);
    }
    return postersStatus;
  }
  out = feed;
  raw = rawPayload;
  return FetchStatus::kOk;
}

FetchStatus FakePosterApi::fetchEventMetadata(EventMetadata& out, std::string* errorMessage) {
  if (eventStatus != FetchStatus::kOk) {
    if (errorMessage != nullptr) {
      *errorMessage = "fake event failure";
    }
    return eventStatus;
  }
  out = event;
  return FetchStatus::kOk;
}

FetchStatus FakePosterApi::fetchImage(const std::string& url, ImageBytes& out,
                                      std::string* errorMessage) {
  ++imageFetches;
  if (failingUrls.count(url) != 0) {
    if (errorMessage != nullptr) {
      *errorMessage = "fake download failure";
    }
    return FetchStatus::kTransient;
  }
  const auto it = images.find(url);
  if (it == images.end()) {
    if (errorMessage != nullptr) {
      *errorMessage = "HTTP status 404";
    }
    return FetchStatus::kTransient;
  }
  out = it->second;
  return FetchStatus::kOk;
}

void FakePosterApi::setPosters(const std::vector<std::string>& ids) {
  feed = poster_feed::PosterFeed();
  rawPayload = "[";
  uint8_t salt = 0;
  for (const std::string& id : ids) {
    PosterRecord record = makeRecord(id);
    feed.records.push_back(record);
    if (images.count(record.remoteUrl) == 0) {
      images[record.remoteUrl] = makePng(800, 1200, salt);
    }
    ++salt;
    if (rawPayload.size() > 1) {
      rawPayload += ",";
    }
    rawPayload += "{\"id\":\"" + id + "\",\"eposter_file\":\"" + record.remoteUrl +
                  "\",\"poster_title\":\"" + record.title + "\"}";
  }
  rawPayload += "]";
}

}  // namespace test_support
