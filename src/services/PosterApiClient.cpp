#include "services/PosterApiClient.h"

#include <ctime>

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "api";

FetchStatus classifyHttpFailure(const HttpFetchMeta& meta) {
  if (meta.statusCode == 401 || meta.statusCode == 403) {
    return FetchStatus::kUnauthorized;
  }
  return FetchStatus::kTransient;
}

FetchStatus fromParseStatus(poster_feed::ParseStatus status) {
  switch (status) {
    case poster_feed::ParseStatus::kOk:
      return FetchStatus::kOk;
    case poster_feed::ParseStatus::kUnauthorized:
      return FetchStatus::kUnauthorized;
    case poster_feed::ParseStatus::kMalformed:
      return FetchStatus::kMalformed;
  }
  return FetchStatus::kMalformed;
}
}  // namespace

const char* fetchStatusName(FetchStatus status) {
  switch (status) {
    case FetchStatus::kOk:
      return "ok";
    case FetchStatus::kUnauthorized:
      return "unauthorized";
    case FetchStatus::kMalformed:
      return "malformed";
    case FetchStatus::kTransient:
      return "transient";
  }
  return "unknown";
}

HttpPosterApi::HttpPosterApi(const KioskSettings& settings, const HttpClient& http)
    : settings_(settings), http_(http) {
  authHeaders_["Accept"] = "application/json";
  authHeaders_["Authorization"] = "Bearer " + settings_.posterToken;
}

std::string HttpPosterApi::withKey(const std::string& url) const {
  const char sep = url.find('?') == std::string::npos ? '?' : '&';
  return url + sep + "key=" + HttpClient::urlEncode(settings_.posterToken);
}

FetchStatus HttpPosterApi::fetchText(const std::string& url, std::string& out,
                                     std::string* errorMessage) {
  std::vector<uint8_t> body;
  HttpFetchMeta meta;
  std::string err;
  if (!http_.get(withKey(url), body, &err, &meta, &authHeaders_)) {
    const FetchStatus status = classifyHttpFailure(meta);
    if (status == FetchStatus::kUnauthorized) {
      platform::loge(kTag, "poster token rejected status=%d url=%s", meta.statusCode,
                     HttpClient::redactUrl(url).c_str());
    }
    if (errorMessage != nullptr) {
      *errorMessage = err;
    }
    return status;
  }
  out.assign(body.begin(), body.end());
  platform::logi(kTag, "GET %s status=%d bytes=%u ms=%u", HttpClient::redactUrl(url).c_str(),
                 meta.statusCode, static_cast<unsigned>(meta.payloadBytes),
                 static_cast<unsigned>(meta.elapsedMs));
  return FetchStatus::kOk;
}

FetchStatus HttpPosterApi::fetchPosters(poster_feed::PosterFeed& out, std::string& rawPayload,
                                        std::string* errorMessage) {
  rawPayload.clear();
  const FetchStatus status = fetchText(settings_.apiUrl, rawPayload, errorMessage);
  if (status != FetchStatus::kOk) {
    return status;
  }
  const poster_feed::ParseStatus parsed = poster_feed::parsePosterPayload(
      rawPayload, settings_.deviceId, std::time(nullptr), out, errorMessage);
  if (parsed == poster_feed::ParseStatus::kUnauthorized) {
    platform::loge(kTag, "poster service refused the configured token");
  }
  return fromParseStatus(parsed);
}

FetchStatus HttpPosterApi::fetchEventMetadata(EventMetadata& out, std::string* errorMessage) {
  std::string payload;
  const FetchStatus status = fetchText(settings_.eventUrl, payload, errorMessage);
  if (status != FetchStatus::kOk) {
    return status;
  }
  if (!poster_feed::parseEventMetadata(payload, out, errorMessage)) {
    return FetchStatus::kMalformed;
  }
  return FetchStatus::kOk;
}

FetchStatus HttpPosterApi::fetchImage(const std::string& url, ImageBytes& out,
                                      std::string* errorMessage) {
  out.clear();
  HttpFetchMeta meta;
  if (!http_.get(url, out, errorMessage, &meta)) {
    return classifyHttpFailure(meta);
  }
  if (out.empty()) {
    if (errorMessage != nullptr) {
      *errorMessage = "empty image body from " + HttpClient::redactUrl(url);
    }
    return FetchStatus::kMalformed;
  }
  return FetchStatus::kOk;
}
