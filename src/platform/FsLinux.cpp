#include "platform/Fs.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace {

void setErrno(std::string* errorMessage, const char* op, const std::string& path) {
  if (errorMessage != nullptr) {
    *errorMessage = std::string(op) + " '" + path + "' failed: " + std::strerror(errno);
  }
}

bool writeAll(int fd, const uint8_t* data, size_t len) {
  size_t written = 0;
  while (written < len) {
    const ssize_t n = ::write(fd, data + written, len - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

}  // namespace

namespace platform::fs {

bool mkdirs(const std::string& path) {
  if (path.empty()) {
    return false;
  }
  std::string partial;
  partial.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    partial.push_back(path[i]);
    const bool atSeparator = path[i] == '/' && i > 0;
    const bool atEnd = i + 1 == path.size();
    if (!atSeparator && !atEnd) {
      continue;
    }
    if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      return false;
    }
  }
  struct stat st = {};
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool exists(const std::string& path) {
  struct stat st = {};
  return !path.empty() && stat(path.c_str(), &st) == 0;
}

bool remove(const std::string& path) { return !path.empty() && ::unlink(path.c_str()) == 0; }

bool listDir(const std::string& path, std::vector<DirEntry>& out, std::string* errorMessage) {
  out.clear();
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    setErrno(errorMessage, "opendir", path);
    return false;
  }
  while (dirent* ent = readdir(dir)) {
    if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) {
      continue;
    }
    DirEntry entry;
    entry.name = ent->d_name;
    struct stat st = {};
    if (stat(joinPath(path, entry.name).c_str(), &st) == 0) {
      entry.isFile = S_ISREG(st.st_mode);
      entry.sizeBytes = static_cast<uint64_t>(st.st_size);
      entry.modifiedAt = st.st_mtime;
    }
    out.push_back(std::move(entry));
  }
  closedir(dir);
  return true;
}

bool readFile(const std::string& path, std::vector<uint8_t>& out, std::string* errorMessage) {
  out.clear();
  FILE* file = std::fopen(path.c_str(), "rb");
  if (file == nullptr) {
    setErrno(errorMessage, "open", path);
    return false;
  }
  uint8_t chunk[8192];
  for (;;) {
    const size_t n = std::fread(chunk, 1, sizeof(chunk), file);
    out.insert(out.end(), chunk, chunk + n);
    if (n < sizeof(chunk)) {
      break;
    }
  }
  const bool failed = std::ferror(file) != 0;
  std::fclose(file);
  if (failed) {
    if (errorMessage != nullptr) {
      *errorMessage = "read '" + path + "' failed";
    }
    out.clear();
    return false;
  }
  return true;
}

bool readText(const std::string& path, std::string& out, std::string* errorMessage) {
  std::vector<uint8_t> raw;
  if (!readFile(path, raw, errorMessage)) {
    out.clear();
    return false;
  }
  out.assign(raw.begin(), raw.end());
  return true;
}

bool writeFileAtomic(const std::string& path, const uint8_t* data, size_t len,
                     std::string* errorMessage) {
  const std::string tmpPath = path + ".tmp";
  const int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    setErrno(errorMessage, "create", tmpPath);
    return false;
  }
  if (!writeAll(fd, data, len) || ::fsync(fd) != 0) {
    setErrno(errorMessage, "write", tmpPath);
    ::close(fd);
    ::unlink(tmpPath.c_str());
    return false;
  }
  if (::close(fd) != 0) {
    setErrno(errorMessage, "close", tmpPath);
    ::unlink(tmpPath.c_str());
    return false;
  }
  if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
    setErrno(errorMessage, "rename", tmpPath);
    ::unlink(tmpPath.c_str());
    return false;
  }
  return true;
}

bool writeTextAtomic(const std::string& path, const std::string& text, std::string* errorMessage) {
  return writeFileAtomic(path, reinterpret_cast<const uint8_t*>(text.data()), text.size(),
                         errorMessage);
}

std::string joinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) {
    return name;
  }
  if (dir.back() == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}

}  // namespace platform::fs
