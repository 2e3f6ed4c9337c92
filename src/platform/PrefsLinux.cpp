#include "platform/Prefs.h"

#include <ArduinoJson.h>

#include "platform/Fs.h"

namespace {
JsonDocument sDoc;
}  // namespace

namespace platform::prefs {

bool load(const char* path, std::string* errorMessage) {
  sDoc.clear();
  if (path == nullptr || *path == '\0' || !platform::fs::exists(path)) {
    return true;
  }

  std::string text;
  if (!platform::fs::readText(path, text, errorMessage)) {
    return false;
  }

  const DeserializationError err = deserializeJson(sDoc, text);
  if (err) {
    if (errorMessage != nullptr) {
      *errorMessage = std::string("config '") + path + "' parse failed: " + err.c_str();
    }
    sDoc.clear();
    return false;
  }
  if (!sDoc.is<JsonObjectConst>()) {
    if (errorMessage != nullptr) {
      *errorMessage = std::string("config '") + path + "' is not a JSON object";
    }
    sDoc.clear();
    return false;
  }
  return true;
}

bool contains(const char* ns, const char* key) {
  if (ns == nullptr || key == nullptr) {
    return false;
  }
  const JsonVariantConst value = sDoc[ns][key];
  return !value.isNull();
}

std::string getString(const char* ns, const char* key, const char* defaultValue) {
  if (defaultValue == nullptr) {
    defaultValue = "";
  }
  if (!contains(ns, key)) {
    return std::string(defaultValue);
  }
  const JsonVariantConst value = sDoc[ns][key];
  if (value.is<const char*>()) {
    return std::string(value.as<const char*>());
  }
  std::string text;
  serializeJson(value, text);
  return text;
}

}  // namespace platform::prefs
