#include "platform/Platform.h"

#include <sys/resource.h>
#include <unistd.h>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace platform {
namespace {

uint64_t monotonicMs() {
  timespec ts = {};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1000000ULL;
}

const uint64_t sStartMs = monotonicMs();

// One fwrite per line keeps lines from the render loop and the refresh thread
// from interleaving on stderr.
void writeLine(const char* prefix, const char* body) {
  char line[640];
  const int n = std::snprintf(line, sizeof(line), "%s%s\n", prefix, body);
  if (n <= 0) {
    return;
  }
  if (n < static_cast<int>(sizeof(line))) {
    std::fwrite(line, 1, static_cast<size_t>(n), stderr);
    return;
  }
  char* dynamic = static_cast<char*>(std::malloc(static_cast<size_t>(n) + 1U));
  if (dynamic == nullptr) {
    std::fwrite(line, 1, sizeof(line) - 1U, stderr);
    std::fputc('\n', stderr);
    return;
  }
  std::snprintf(dynamic, static_cast<size_t>(n) + 1U, "%s%s\n", prefix, body);
  std::fwrite(dynamic, 1, static_cast<size_t>(n), stderr);
  std::free(dynamic);
}

void vlogLevel(const char* level, const char* tag, const char* fmt, va_list args) {
  if (fmt == nullptr) {
    return;
  }
  if (level == nullptr) {
    level = "I";
  }
  if (tag == nullptr || *tag == '\0') {
    tag = "app";
  }

  char prefix[64];
  std::snprintf(prefix, sizeof(prefix), "%s (%lu) %s: ", level,
                static_cast<unsigned long>(millisMs()), tag);

  char buffer[512];
  va_list copy;
  va_copy(copy, args);
  const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, copy);
  va_end(copy);

  if (n <= 0) {
    writeLine(prefix, "");
    return;
  }
  if (n < static_cast<int>(sizeof(buffer))) {
    writeLine(prefix, buffer);
    return;
  }

  char* dynamic = static_cast<char*>(std::malloc(static_cast<size_t>(n) + 1U));
  if (dynamic == nullptr) {
    writeLine(prefix, buffer);
    return;
  }
  std::vsnprintf(dynamic, static_cast<size_t>(n) + 1U, fmt, args);
  writeLine(prefix, dynamic);
  std::free(dynamic);
}

}  // namespace

uint32_t millisMs() { return static_cast<uint32_t>(monotonicMs() - sStartMs); }

void sleepMs(uint32_t ms) {
  timespec req = {};
  req.tv_sec = static_cast<time_t>(ms / 1000U);
  req.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;
  while (nanosleep(&req, &req) != 0 && errno == EINTR) {
  }
}

void logi(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlogLevel("I", tag, fmt, args);
  va_end(args);
}

void logw(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlogLevel("W", tag, fmt, args);
  va_end(args);
}

void loge(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlogLevel("E", tag, fmt, args);
  va_end(args);
}

uint32_t residentBytes() {
  FILE* statm = std::fopen("/proc/self/statm", "r");
  if (statm == nullptr) {
    return 0;
  }
  unsigned long sizePages = 0;
  unsigned long residentPages = 0;
  const int matched = std::fscanf(statm, "%lu %lu", &sizePages, &residentPages);
  std::fclose(statm);
  if (matched != 2) {
    return 0;
  }
  const long pageSize = sysconf(_SC_PAGESIZE);
  return static_cast<uint32_t>(residentPages * static_cast<unsigned long>(pageSize > 0 ? pageSize : 4096));
}

uint32_t peakResidentBytes() {
  rusage usage = {};
  if (getrusage(RUSAGE_SELF, &usage) != 0) {
    return 0;
  }
  return static_cast<uint32_t>(usage.ru_maxrss * 1024L);
}

}  // namespace platform
