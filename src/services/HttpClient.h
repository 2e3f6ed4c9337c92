#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct HttpFetchMeta {
  // HTTP status, or -1 when the request never produced one (DNS, connect,
  // TLS, timeout, body too large).
  int statusCode = 0;
  long contentLengthBytes = -1;
  size_t payloadBytes = 0;
  std::string contentType;
  std::string transportReason;
  std::string retryAfter;
  uint32_t elapsedMs = 0;
};

class HttpClient {
 public:
  using Headers = std::map<std::string, std::string>;

  HttpClient(uint32_t timeoutMs, uint64_t maxBodyBytes);

  // Single attempt, no retry. Returns true only for a 2xx response.
  bool get(const std::string& url, std::vector<uint8_t>& outBody, std::string* errorMessage = nullptr,
           HttpFetchMeta* meta = nullptr, const Headers* extraHeaders = nullptr) const;
  // Opens a connection to the URL's host without sending a request.
  bool probe(const std::string& url, uint32_t timeoutMs, std::string* errorMessage = nullptr) const;

  // Tolerates a UTF-8 BOM and text around the outermost JSON value.
  static bool parseJson(const std::string& payload, JsonDocument& outDoc,
                        std::string* errorMessage = nullptr);
  static std::string compactPreview(const std::string& payload, size_t maxLen = 120);
  // URL with query string and credentials removed, safe for logs.
  static std::string redactUrl(const std::string& url);
  static std::string urlEncode(const std::string& input);

 private:
  uint32_t timeoutMs_;
  uint64_t maxBodyBytes_;
};
