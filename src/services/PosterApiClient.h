#pragma once

#include <cstdint>
#include <string>

#include "KioskSettings.h"
#include "PosterTypes.h"
#include "services/HttpClient.h"
#include "services/PosterFeed.h"

enum class FetchStatus : uint8_t { kOk = 0, kUnauthorized, kMalformed, kTransient };

const char* fetchStatusName(FetchStatus status);

// One attempt per call. Callers decide whether and when to try again.
class PosterApi {
 public:
  virtual ~PosterApi() = default;

  // rawPayload receives the body as received so it can be mirrored to disk.
  virtual FetchStatus fetchPosters(poster_feed::PosterFeed& out, std::string& rawPayload,
                                   std::string* errorMessage) = 0;
  virtual FetchStatus fetchEventMetadata(EventMetadata& out, std::string* errorMessage) = 0;
  virtual FetchStatus fetchImage(const std::string& url, ImageBytes& out,
                                 std::string* errorMessage) = 0;
};

class HttpPosterApi : public PosterApi {
 public:
  HttpPosterApi(const KioskSettings& settings, const HttpClient& http);

  FetchStatus fetchPosters(poster_feed::PosterFeed& out, std::string& rawPayload,
                           std::string* errorMessage) override;
  FetchStatus fetchEventMetadata(EventMetadata& out, std::string* errorMessage) override;
  FetchStatus fetchImage(const std::string& url, ImageBytes& out,
                         std::string* errorMessage) override;

 private:
  std::string withKey(const std::string& url) const;
  FetchStatus fetchText(const std::string& url, std::string& out, std::string* errorMessage);

  const KioskSettings& settings_;
  const HttpClient& http_;
  HttpClient::Headers authHeaders_;
};
