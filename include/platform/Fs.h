#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace platform::fs {

struct DirEntry {
  std::string name;
  uint64_t sizeBytes = 0;
  std::time_t modifiedAt = 0;
  bool isFile = false;
};

// Creates every missing component of path.
bool mkdirs(const std::string& path);
bool exists(const std::string& path);
bool remove(const std::string& path);
bool listDir(const std::string& path, std::vector<DirEntry>& out, std::string* errorMessage = nullptr);

bool readFile(const std::string& path, std::vector<uint8_t>& out,
              std::string* errorMessage = nullptr);
bool readText(const std::string& path, std::string& out, std::string* errorMessage = nullptr);

// Writes to "<path>.tmp", flushes it to disk, then renames over path. A crash
// leaves either the old file or the new one, never a partial file under path.
bool writeFileAtomic(const std::string& path, const uint8_t* data, size_t len,
                     std::string* errorMessage = nullptr);
bool writeTextAtomic(const std::string& path, const std::string& text,
                     std::string* errorMessage = nullptr);

std::string joinPath(const std::string& dir, const std::string& name);

}  // namespace platform::fs
