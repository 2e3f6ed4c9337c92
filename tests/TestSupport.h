#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "PosterTypes.h"
#include "services/ConnectivityProbe.h"
#include "services/PosterApiClient.h"

namespace test_support {

// Fresh directory under $TMPDIR, removed with its contents on destruction.
class TempDir {
 public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }
  std::string file(const std::string& name) const;

 private:
  std::string path_;
};

// Minimal PNG header (signature + IHDR). salt varies the trailing bytes so
// equal sizes can still hash differently.
ImageBytes makePng(uint32_t width, uint32_t height, uint8_t salt = 0);
ImageBytes makeJpeg(uint32_t width, uint32_t height);

PosterRecord makeRecord(const std::string& id, const std::string& url = std::string());

// Snapshot whose posters all carry in-memory bytes.
SnapshotPtr makeSnapshot(uint64_t version, const std::vector<std::string>& ids,
                         uint32_t displayTimeSec = 0);

std::vector<std::string> listFiles(const std::string& dir);

class FakeProbe : public ConnectivityProbe {
 public:
  bool isOnline() override {
    ++calls;
    return online;
  }

  bool online = true;
  int calls = 0;
};

class FakePosterApi : public PosterApi {
 public:
  FetchStatus fetchPosters(poster_feed::PosterFeed& out, std::string& rawPayload,
                           std::string* errorMessage) override;
  FetchStatus fetchEventMetadata(EventMetadata& out, std::string* errorMessage) override;
  FetchStatus fetchImage(const std::string& url, ImageBytes& out,
                         std::string* errorMessage) override;

  // Sets the feed and a matching raw payload in the bare-array shape.
  void setPosters(const std::vector<std::string>& ids);

  FetchStatus postersStatus = FetchStatus::kOk;
  poster_feed::PosterFeed feed;
  std::string rawPayload;
  FetchStatus eventStatus = FetchStatus::kOk;
  EventMetadata event;
  std::map<std::string, ImageBytes> images;
  std::set<std::string> failingUrls;
  int posterFetches = 0;
  int imageFetches = 0;
};

std::string urlFor(const std::string& id);

}  // namespace test_support
