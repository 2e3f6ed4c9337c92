#include "services/HttpClient.h"

#include <curl/curl.h>

#include <cstdio>

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "http";
constexpr char kUserAgent[] = "PosterKiosk/1.0";
constexpr uint8_t kTransportFailureLogThreshold = 3U;

uint8_t sTransportFailureStreak = 0;

struct HttpCapture {
  std::vector<uint8_t>* body = nullptr;
  uint64_t maxBytes = 0;
  bool overflow = false;
  std::string contentType;
  std::string retryAfter;
};

std::string lowerCopy(const std::string& text) {
  std::string out = text;
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

std::string trimCopy(const std::string& text) {
  const size_t start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return std::string();
  }
  const size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

size_t writeBodyCb(char* data, size_t size, size_t nmemb, void* userData) {
  HttpCapture* cap = static_cast<HttpCapture*>(userData);
  const size_t len = size * nmemb;
  if (cap->body->size() + len > cap->maxBytes) {
    cap->overflow = true;
    return 0;
  }
  cap->body->insert(cap->body->end(), reinterpret_cast<uint8_t*>(data),
                    reinterpret_cast<uint8_t*>(data) + len);
  return len;
}

size_t headerCb(char* data, size_t size, size_t nmemb, void* userData) {
  HttpCapture* cap = static_cast<HttpCapture*>(userData);
  const size_t len = size * nmemb;
  const std::string line(data, len);
  const size_t colon = line.find(':');
  if (colon == std::string::npos) {
    return len;
  }
  const std::string key = lowerCopy(trimCopy(line.substr(0, colon)));
  const std::string value = trimCopy(line.substr(colon + 1));
  if (key == "content-type") {
    cap->contentType = value;
  } else if (key == "retry-after") {
    cap->retryAfter = value;
  }
  return len;
}

std::string extractLikelyJson(const std::string& payload) {
  const size_t startObj = payload.find('{');
  const size_t startArr = payload.find('[');

  size_t start = std::string::npos;
  if (startObj != std::string::npos && startArr != std::string::npos) {
    start = (startObj < startArr) ? startObj : startArr;
  } else if (startObj != std::string::npos) {
    start = startObj;
  } else if (startArr != std::string::npos) {
    start = startArr;
  }

  if (start == std::string::npos) {
    return payload;
  }

  const size_t endObj = payload.rfind('}');
  const size_t endArr = payload.rfind(']');
  size_t end = std::string::npos;
  if (endObj != std::string::npos && endArr != std::string::npos) {
    end = (endObj > endArr) ? endObj : endArr;
  } else if (endObj != std::string::npos) {
    end = endObj;
  } else {
    end = endArr;
  }
  if (end == std::string::npos || end < start) {
    return payload.substr(start);
  }
  return payload.substr(start, end - start + 1);
}

void noteTransportFailure(const std::string& reason) {
  if (sTransportFailureStreak < 255) {
    ++sTransportFailureStreak;
  }
  if (sTransportFailureStreak >= kTransportFailureLogThreshold) {
    platform::logw(kTag, "transport fail streak=%u reason='%s'",
                   static_cast<unsigned>(sTransportFailureStreak), reason.c_str());
  }
}

void noteSuccessfulHttpResponse() { sTransportFailureStreak = 0; }

}  // namespace

HttpClient::HttpClient(uint32_t timeoutMs, uint64_t maxBodyBytes)
    : timeoutMs_(timeoutMs), maxBodyBytes_(maxBodyBytes) {}

bool HttpClient::get(const std::string& url, std::vector<uint8_t>& outBody,
                     std::string* errorMessage, HttpFetchMeta* meta,
                     const Headers* extraHeaders) const {
  outBody.clear();
  if (meta != nullptr) {
    *meta = HttpFetchMeta();
  }
  const uint32_t startMs = platform::millisMs();

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    if (meta != nullptr) {
      meta->statusCode = -1;
      meta->transportReason = "curl_easy_init failed";
    }
    if (errorMessage != nullptr) {
      *errorMessage = "HTTP init failed";
    }
    return false;
  }

  HttpCapture cap;
  cap.body = &outBody;
  cap.maxBytes = maxBodyBytes_;

  curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept-Encoding: identity");
  if (extraHeaders != nullptr) {
    for (const auto& kv : *extraHeaders) {
      const std::string name = trimCopy(kv.first);
      if (name.empty() || name.find_first_of("\r\n:") != std::string::npos) {
        continue;
      }
      std::string value = kv.second;
      for (char& c : value) {
        if (c == '\r' || c == '\n') {
          c = ' ';
        }
      }
      value = trimCopy(value);
      if (value.empty()) {
        continue;
      }
      const std::string line = name + ": " + value;
      headers = curl_slist_append(headers, line.c_str());
    }
  }

  char curlError[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs_));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeoutMs_));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBodyCb);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &cap);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCb);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &cap);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curlError);

  const CURLcode performErr = curl_easy_perform(curl);
  long statusCode = -1;
  if (performErr == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
  }
  curl_off_t contentLength = -1;
  curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (meta != nullptr) {
    meta->statusCode = static_cast<int>(statusCode);
    meta->contentLengthBytes = static_cast<long>(contentLength);
    meta->payloadBytes = outBody.size();
    meta->contentType = cap.contentType;
    meta->retryAfter = cap.retryAfter;
    meta->elapsedMs = platform::millisMs() - startMs;
  }

  if (performErr != CURLE_OK || statusCode <= 0) {
    std::string transportReason;
    if (cap.overflow) {
      transportReason = "body exceeds " + std::to_string(maxBodyBytes_) + " bytes";
    } else if (curlError[0] != '\0') {
      transportReason = curlError;
    } else {
      transportReason = curl_easy_strerror(performErr);
    }
    noteTransportFailure(transportReason);
    if (meta != nullptr) {
      meta->statusCode = -1;
      meta->transportReason = transportReason;
    }
    if (errorMessage != nullptr) {
      *errorMessage = "HTTP transport failure reason='" + transportReason + "' url=" +
                      redactUrl(url);
    }
    outBody.clear();
    return false;
  }

  noteSuccessfulHttpResponse();

  if (statusCode < 200 || statusCode >= 300) {
    if (errorMessage != nullptr) {
      const std::string preview(outBody.begin(), outBody.end());
      *errorMessage = "HTTP status " + std::to_string(statusCode) + ", retry-after='" +
                      cap.retryAfter + "', preview='" + compactPreview(preview) + "'";
    }
    outBody.clear();
    return false;
  }
  return true;
}

bool HttpClient::probe(const std::string& url, uint32_t timeoutMs, std::string* errorMessage) const {
  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    if (errorMessage != nullptr) {
      *errorMessage = "HTTP init failed";
    }
    return false;
  }
  char curlError[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeoutMs));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curlError);
  const CURLcode err = curl_easy_perform(curl);
  curl_easy_cleanup(curl);
  if (err != CURLE_OK) {
    if (errorMessage != nullptr) {
      *errorMessage = curlError[0] != '\0' ? curlError : curl_easy_strerror(err);
    }
    return false;
  }
  return true;
}

bool HttpClient::parseJson(const std::string& payload, JsonDocument& outDoc,
                           std::string* errorMessage) {
  std::string body = trimCopy(payload);
  if (body.rfind("\xEF\xBB\xBF", 0) == 0) {
    body = body.substr(3);
  }
  if (body.empty()) {
    if (errorMessage != nullptr) {
      *errorMessage = "Empty payload";
    }
    return false;
  }

  const std::string jsonBody = extractLikelyJson(body);
  const DeserializationError err = deserializeJson(outDoc, jsonBody);
  if (err) {
    if (errorMessage != nullptr) {
      *errorMessage = std::string("JSON parse failed (") + err.c_str() + "), bytes=" +
                      std::to_string(body.size()) + ", preview='" + compactPreview(body) + "'";
    }
    return false;
  }
  return true;
}

std::string HttpClient::compactPreview(const std::string& payload, size_t maxLen) {
  std::string out = payload;
  for (char& c : out) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  out = trimCopy(out);
  if (out.size() > maxLen) {
    out = out.substr(0, maxLen) + "...";
  }
  return out;
}

std::string HttpClient::redactUrl(const std::string& url) {
  std::string out = url.substr(0, url.find_first_of("?#"));
  const size_t scheme = out.find("://");
  if (scheme != std::string::npos) {
    const size_t hostStart = scheme + 3;
    const size_t at = out.find('@', hostStart);
    const size_t slash = out.find('/', hostStart);
    if (at != std::string::npos && (slash == std::string::npos || at < slash)) {
      out.erase(hostStart, at - hostStart + 1);
    }
  }
  return out;
}

std::string HttpClient::urlEncode(const std::string& input) {
  std::string out;
  out.reserve(input.size() * 3);
  for (const char c : input) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~') {
      out += c;
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned char>(c));
      out += buf;
    }
  }
  return out;
}
