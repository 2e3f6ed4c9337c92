#include "services/PosterFeed.h"

#include <algorithm>
#include <cstdlib>
#include <set>

#include "AppConfig.h"
#include "platform/Platform.h"
#include "services/HttpClient.h"

namespace {
constexpr const char* kTag = "feed";
constexpr const char* kUrlKeys[] = {"eposter_file", "file", "image_url", "url"};
constexpr const char* kTitleKeys[] = {"poster_title", "title"};
constexpr const char* kEventTitleKeys[] = {"name", "event_name", "title"};

std::string scalarText(JsonVariantConst value) {
  if (value.is<const char*>()) {
    return value.as<const char*>();
  }
  if (value.is<long long>()) {
    return std::to_string(value.as<long long>());
  }
  if (value.is<unsigned long long>()) {
    return std::to_string(value.as<unsigned long long>());
  }
  return std::string();
}

std::string firstString(JsonObjectConst obj, const char* const* keys, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    const char* value = obj[keys[i]] | "";
    if (value[0] != '\0') {
      return value;
    }
  }
  return std::string();
}

bool numericId(const std::string& id, long long& out) {
  if (id.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtoll(id.c_str(), &end, 10);
  return end != id.c_str() && *end == '\0';
}

// Newest first by numeric id; non-numeric ids keep their order after them.
void sortNewestFirst(std::vector<PosterRecord>& records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const PosterRecord& a, const PosterRecord& b) {
                     long long idA = 0;
                     long long idB = 0;
                     const bool numA = numericId(a.id, idA);
                     const bool numB = numericId(b.id, idB);
                     if (numA && numB) {
                       return idA > idB;
                     }
                     return numA && !numB;
                   });
}

void appendRecords(JsonArrayConst arr, std::time_t now, std::vector<PosterRecord>& out) {
  std::set<std::string> seen;
  size_t index = 0;
  for (JsonVariantConst item : arr) {
    ++index;
    JsonObjectConst obj = item.as<JsonObjectConst>();
    if (obj.isNull()) {
      platform::logw(kTag, "record %u is not an object, skipped", static_cast<unsigned>(index));
      continue;
    }
    PosterRecord record;
    record.id = scalarText(obj["id"]);
    record.remoteUrl = firstString(obj, kUrlKeys, sizeof(kUrlKeys) / sizeof(kUrlKeys[0]));
    if (record.id.empty() || record.remoteUrl.empty()) {
      platform::logw(kTag, "record %u lacks %s, skipped", static_cast<unsigned>(index),
                     record.id.empty() ? "id" : "image url");
      continue;
    }
    if (!seen.insert(record.id).second) {
      platform::logw(kTag, "duplicate id=%s, keeping first", record.id.c_str());
      continue;
    }
    record.title = firstString(obj, kTitleKeys, sizeof(kTitleKeys) / sizeof(kTitleKeys[0]));
    record.topic = obj["topic"] | "";
    record.presenter = obj["main_presenter"] | "";
    record.institute = obj["institute"] | "";
    record.startsAt = obj["start_date_time"] | "";
    record.endsAt = obj["end_date_time"] | "";
    record.lastSeen = now;
    out.push_back(record);
  }
}

poster_feed::ParseStatus parseScreens(JsonArrayConst screens, const std::string& deviceId,
                                      std::time_t now, poster_feed::PosterFeed& out,
                                      std::string* errorMessage) {
  for (JsonVariantConst screen : screens) {
    if (scalarText(screen["screen_number"]) != deviceId) {
      continue;
    }
    JsonArrayConst records = screen["records"].as<JsonArrayConst>();
    if (!screen["records"].isNull() && records.isNull()) {
      if (errorMessage != nullptr) {
        *errorMessage = "screen '" + deviceId + "' records is not an array";
      }
      return poster_feed::ParseStatus::kMalformed;
    }
    appendRecords(records, now, out.records);
    const long minutes = screen["minutes_per_record"] | 0L;
    if (minutes > 0) {
      out.displayTimeSec = static_cast<uint32_t>(
          std::min<long>(minutes, static_cast<long>(AppConfig::kMaxDisplayTimeSec)));
    }
    return poster_feed::ParseStatus::kOk;
  }
  platform::logw(kTag, "no screen for device_id=%s (%u screens)", deviceId.c_str(),
                 static_cast<unsigned>(screens.size()));
  return poster_feed::ParseStatus::kOk;
}

}  // namespace

namespace poster_feed {

ParseStatus parsePosterFeed(JsonVariantConst root, const std::string& deviceId, std::time_t now,
                            PosterFeed& out, std::string* errorMessage) {
  out = PosterFeed();

  JsonArrayConst bare = root.as<JsonArrayConst>();
  if (!bare.isNull()) {
    appendRecords(bare, now, out.records);
    sortNewestFirst(out.records);
    return ParseStatus::kOk;
  }

  JsonObjectConst obj = root.as<JsonObjectConst>();
  if (obj.isNull()) {
    if (errorMessage != nullptr) {
      *errorMessage = "payload is neither an object nor an array";
    }
    return ParseStatus::kMalformed;
  }

  if (obj["status"].is<bool>() && !obj["status"].as<bool>()) {
    if (errorMessage != nullptr) {
      const char* message = obj["message"] | "status=false";
      *errorMessage = std::string("service rejected request: ") + message;
    }
    return ParseStatus::kUnauthorized;
  }

  JsonArrayConst screens = obj["screens"].as<JsonArrayConst>();
  if (!screens.isNull()) {
    return parseScreens(screens, deviceId, now, out, errorMessage);
  }

  JsonObjectConst nested = obj["data"].as<JsonObjectConst>();
  if (!nested.isNull()) {
    return parsePosterFeed(nested, deviceId, now, out, errorMessage);
  }

  for (const char* key : {"data", "eposters"}) {
    JsonArrayConst arr = obj[key].as<JsonArrayConst>();
    if (!arr.isNull()) {
      appendRecords(arr, now, out.records);
      sortNewestFirst(out.records);
      return ParseStatus::kOk;
    }
  }

  if (errorMessage != nullptr) {
    *errorMessage = "payload has no screens, data or eposters list";
  }
  return ParseStatus::kMalformed;
}

ParseStatus parsePosterPayload(const std::string& payload, const std::string& deviceId,
                               std::time_t now, PosterFeed& out, std::string* errorMessage) {
  JsonDocument doc;
  if (!HttpClient::parseJson(payload, doc, errorMessage)) {
    out = PosterFeed();
    return ParseStatus::kMalformed;
  }
  return parsePosterFeed(doc.as<JsonVariantConst>(), deviceId, now, out, errorMessage);
}

bool parseEventMetadata(const std::string& payload, EventMetadata& out,
                        std::string* errorMessage) {
  JsonDocument doc;
  if (!HttpClient::parseJson(payload, doc, errorMessage)) {
    return false;
  }
  JsonObjectConst obj = doc.as<JsonObjectConst>();
  if (obj.isNull()) {
    if (errorMessage != nullptr) {
      *errorMessage = "event metadata is not an object";
    }
    return false;
  }
  JsonObjectConst data = obj["data"].as<JsonObjectConst>();
  JsonObjectConst source = data.isNull() ? obj : data;

  out = EventMetadata();
  out.title = firstString(source, kEventTitleKeys,
                          sizeof(kEventTitleKeys) / sizeof(kEventTitleKeys[0]));
  serializeJson(doc, out.json);
  return true;
}

}  // namespace poster_feed
