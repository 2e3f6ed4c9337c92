#include "platform/PointerInput.h"

#include <dirent.h>
#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

#include "AppConfig.h"
#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "input";
constexpr const char* kInputDir = "/dev/input";
constexpr uint32_t kRescanPeriodMs = 5000;

struct AbsRange {
  int32_t min = 0;
  int32_t max = 0;
  bool valid = false;
};

struct Device {
  int fd = -1;
  std::string path;
  AbsRange absX;
  AbsRange absY;
};

std::vector<Device> sDevices;
uint16_t sWidth = 0;
uint16_t sHeight = 0;
uint32_t sLongPressMs = 0;
uint32_t sLastScanMs = 0;
bool sInitialized = false;

int32_t sX = 0;
int32_t sY = 0;
bool sPressed = false;
// Set when a held press was turned into a secondary click; the press is
// hidden from LVGL until the finger or button is released.
bool sSwallowPress = false;
bool sLongPressFired = false;
uint32_t sPressStartMs = 0;
int32_t sPressStartX = 0;
int32_t sPressStartY = 0;
uint32_t sSecondaryClicks = 0;
bool sExitRequested = false;

int32_t clampi(int32_t value, int32_t minValue, int32_t maxValue) {
  if (value < minValue) {
    return minValue;
  }
  if (value > maxValue) {
    return maxValue;
  }
  return value;
}

int32_t mapLinear(int32_t x, int32_t inMin, int32_t inMax, int32_t outMin, int32_t outMax) {
  if (inMax == inMin) {
    return outMin;
  }
  const int64_t num = static_cast<int64_t>(x - inMin) * static_cast<int64_t>(outMax - outMin);
  const int64_t den = static_cast<int64_t>(inMax - inMin);
  return static_cast<int32_t>(num / den + outMin);
}

bool testBit(const unsigned long* bits, unsigned bit) {
  const unsigned perWord = sizeof(unsigned long) * 8U;
  return (bits[bit / perWord] >> (bit % perWord)) & 1UL;
}

bool readAbsRange(int fd, unsigned axis, AbsRange& out) {
  input_absinfo info = {};
  if (ioctl(fd, EVIOCGABS(axis), &info) != 0) {
    return false;
  }
  out.min = info.minimum;
  out.max = info.maximum;
  out.valid = info.maximum > info.minimum;
  return out.valid;
}

bool openDevice(const std::string& path, Device& out) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }

  unsigned long evBits[(EV_MAX + 1 + sizeof(unsigned long) * 8 - 1) / (sizeof(unsigned long) * 8)] =
      {};
  if (ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) < 0) {
    ::close(fd);
    return false;
  }
  // Only keyboards, mice and touch panels are of interest.
  if (!testBit(evBits, EV_KEY) && !testBit(evBits, EV_REL) && !testBit(evBits, EV_ABS)) {
    ::close(fd);
    return false;
  }

  out = Device();
  out.fd = fd;
  out.path = path;
  if (testBit(evBits, EV_ABS)) {
    if (!readAbsRange(fd, ABS_X, out.absX)) {
      (void)readAbsRange(fd, ABS_MT_POSITION_X, out.absX);
    }
    if (!readAbsRange(fd, ABS_Y, out.absY)) {
      (void)readAbsRange(fd, ABS_MT_POSITION_Y, out.absY);
    }
  }
  return true;
}

bool isOpen(const std::string& path) {
  for (const Device& dev : sDevices) {
    if (dev.path == path) {
      return true;
    }
  }
  return false;
}

void scanDevices(uint32_t nowMs) {
  sLastScanMs = nowMs;
  DIR* dir = opendir(kInputDir);
  if (dir == nullptr) {
    return;
  }
  while (dirent* ent = readdir(dir)) {
    if (std::strncmp(ent->d_name, "event", 5) != 0) {
      continue;
    }
    const std::string path = std::string(kInputDir) + "/" + ent->d_name;
    if (isOpen(path)) {
      continue;
    }
    Device dev;
    if (openDevice(path, dev)) {
      platform::logi(kTag, "opened %s abs=%s", path.c_str(),
                     (dev.absX.valid && dev.absY.valid) ? "yes" : "no");
      sDevices.push_back(dev);
    }
  }
  closedir(dir);
}

void beginPress(uint32_t nowMs) {
  sPressed = true;
  sLongPressFired = false;
  sPressStartMs = nowMs;
  sPressStartX = sX;
  sPressStartY = sY;
}

void endPress() {
  sPressed = false;
  sSwallowPress = false;
  sLongPressFired = false;
}

void handleKey(uint16_t code, int32_t value, uint32_t nowMs) {
  switch (code) {
    case BTN_LEFT:
    case BTN_TOUCH:
      if (value == 1 && !sPressed) {
        beginPress(nowMs);
      } else if (value == 0 && sPressed) {
        endPress();
      }
      break;
    case BTN_RIGHT:
      if (value == 1) {
        ++sSecondaryClicks;
      }
      break;
    case KEY_ESC:
    case KEY_Q:
      if (value == 1) {
        sExitRequested = true;
      }
      break;
    default:
      break;
  }
}

void handleEvent(const Device& dev, const input_event& ev, uint32_t nowMs) {
  if (ev.type == EV_KEY) {
    handleKey(ev.code, ev.value, nowMs);
  } else if (ev.type == EV_REL) {
    if (ev.code == REL_X) {
      sX = clampi(sX + ev.value, 0, static_cast<int32_t>(sWidth) - 1);
    } else if (ev.code == REL_Y) {
      sY = clampi(sY + ev.value, 0, static_cast<int32_t>(sHeight) - 1);
    }
  } else if (ev.type == EV_ABS) {
    if ((ev.code == ABS_X || ev.code == ABS_MT_POSITION_X) && dev.absX.valid) {
      sX = clampi(mapLinear(ev.value, dev.absX.min, dev.absX.max, 0, sWidth - 1), 0,
                  static_cast<int32_t>(sWidth) - 1);
    } else if ((ev.code == ABS_Y || ev.code == ABS_MT_POSITION_Y) && dev.absY.valid) {
      sY = clampi(mapLinear(ev.value, dev.absY.min, dev.absY.max, 0, sHeight - 1), 0,
                  static_cast<int32_t>(sHeight) - 1);
    }
  }
}

// Returns false once the device is gone.
bool drainDevice(const Device& dev, uint32_t nowMs) {
  input_event events[32];
  for (;;) {
    const ssize_t n = ::read(dev.fd, events, sizeof(events));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        return true;
      }
      return false;
    }
    if (n == 0) {
      return true;
    }
    const size_t count = static_cast<size_t>(n) / sizeof(input_event);
    for (size_t i = 0; i < count; ++i) {
      handleEvent(dev, events[i], nowMs);
    }
  }
}

void checkLongPress(uint32_t nowMs) {
  if (!sPressed || sLongPressFired || sLongPressMs == 0) {
    return;
  }
  const int32_t dx = sX - sPressStartX;
  const int32_t dy = sY - sPressStartY;
  const int32_t slop = static_cast<int32_t>(AppConfig::kLongPressSlopPx);
  if (dx * dx + dy * dy > slop * slop) {
    // Dragging, not holding.
    sPressStartMs = nowMs;
    sPressStartX = sX;
    sPressStartY = sY;
    return;
  }
  if (nowMs - sPressStartMs >= sLongPressMs) {
    sLongPressFired = true;
    sSwallowPress = true;
    ++sSecondaryClicks;
  }
}

}  // namespace

namespace pointer_input {

bool init(uint16_t screenWidth, uint16_t screenHeight, uint32_t longPressMs) {
  sWidth = screenWidth > 0 ? screenWidth : 1;
  sHeight = screenHeight > 0 ? screenHeight : 1;
  sLongPressMs = longPressMs;
  sX = sWidth / 2;
  sY = sHeight / 2;
  scanDevices(platform::millisMs());
  sInitialized = true;
  if (sDevices.empty()) {
    platform::logw(kTag, "no input devices under %s yet", kInputDir);
  }
  return true;
}

void poll(uint32_t nowMs) {
  if (!sInitialized) {
    return;
  }
  for (size_t i = 0; i < sDevices.size();) {
    if (drainDevice(sDevices[i], nowMs)) {
      ++i;
      continue;
    }
    platform::logw(kTag, "lost %s", sDevices[i].path.c_str());
    ::close(sDevices[i].fd);
    sDevices.erase(sDevices.begin() + static_cast<std::ptrdiff_t>(i));
  }
  checkLongPress(nowMs);
  if (nowMs - sLastScanMs >= kRescanPeriodMs) {
    scanDevices(nowMs);
  }
}

void read(Point& out) {
  out.x = sX;
  out.y = sY;
  out.pressed = sPressed && !sSwallowPress;
}

uint32_t takeSecondaryClicks() {
  const uint32_t clicks = sSecondaryClicks;
  sSecondaryClicks = 0;
  return clicks;
}

bool takeExitRequest() {
  const bool requested = sExitRequested;
  sExitRequested = false;
  return requested;
}

void shutdown() {
  for (Device& dev : sDevices) {
    ::close(dev.fd);
  }
  sDevices.clear();
  sInitialized = false;
}

}  // namespace pointer_input
