#pragma once

#include <string>

// Read-only settings store backed by a JSON document of sections:
//   { "api": { "poster_token": "..." }, "display": { "display_time": 5 } }
namespace platform::prefs {

// A missing file loads as an empty store. An unreadable or invalid file fails.
bool load(const char* path, std::string* errorMessage = nullptr);
bool contains(const char* ns, const char* key);
// Numbers and booleans are returned in their JSON text form.
std::string getString(const char* ns, const char* key, const char* defaultValue = "");

}  // namespace platform::prefs
