#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "PosterTypes.h"

namespace poster_feed {

enum class ParseStatus : uint8_t { kOk = 0, kUnauthorized, kMalformed };

struct PosterFeed {
  std::vector<PosterRecord> records;
  // From the matching screen's minutes_per_record; 0 when absent.
  uint32_t displayTimeSec = 0;
};

// Accepts the three payload shapes the poster service has used:
//   {"screens": [{"screen_number": ..., "records": [...], "minutes_per_record": n}]}
//   {"status": true, "data": [...]} / {"eposters": [...]}
//   [...]
// A body with "status": false is a rejected key.
ParseStatus parsePosterFeed(JsonVariantConst root, const std::string& deviceId, std::time_t now,
                            PosterFeed& out, std::string* errorMessage = nullptr);
ParseStatus parsePosterPayload(const std::string& payload, const std::string& deviceId,
                               std::time_t now, PosterFeed& out,
                               std::string* errorMessage = nullptr);

bool parseEventMetadata(const std::string& payload, EventMetadata& out,
                        std::string* errorMessage = nullptr);

}  // namespace poster_feed
