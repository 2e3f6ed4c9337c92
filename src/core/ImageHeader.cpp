#include "core/ImageHeader.h"

#include <cstring>

namespace {

uint32_t be16(const uint8_t* p) { return (static_cast<uint32_t>(p[0]) << 8) | p[1]; }

uint32_t be32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

uint32_t le16(const uint8_t* p) { return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8); }

int32_t le32s(const uint8_t* p) {
  const uint32_t v = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                     (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
  return static_cast<int32_t>(v);
}

bool probePng(const uint8_t* data, size_t len, uint32_t& w, uint32_t& h) {
  static const uint8_t kSig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  if (len < 24 || std::memcmp(data, kSig, sizeof(kSig)) != 0 ||
      std::memcmp(data + 12, "IHDR", 4) != 0) {
    return false;
  }
  w = be32(data + 16);
  h = be32(data + 20);
  return true;
}

bool isJpegSof(uint8_t marker) {
  return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

bool probeJpeg(const uint8_t* data, size_t len, uint32_t& w, uint32_t& h) {
  if (len < 4 || data[0] != 0xFF || data[1] != 0xD8) {
    return false;
  }
  size_t pos = 2;
  while (pos + 4 <= len) {
    if (data[pos] != 0xFF) {
      return false;
    }
    const uint8_t marker = data[pos + 1];
    if (marker == 0xFF) {
      ++pos;  // fill byte
      continue;
    }
    if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      pos += 2;
      continue;
    }
    if (marker == 0xD9 || marker == 0xDA) {
      return false;  // end of image or start of scan before any frame header
    }
    const uint32_t segLen = be16(data + pos + 2);
    if (segLen < 2) {
      return false;
    }
    if (isJpegSof(marker)) {
      if (pos + 9 > len) {
        return false;
      }
      h = be16(data + pos + 5);
      w = be16(data + pos + 7);
      return true;
    }
    pos += 2 + segLen;
  }
  return false;
}

bool probeGif(const uint8_t* data, size_t len, uint32_t& w, uint32_t& h) {
  if (len < 10 || (std::memcmp(data, "GIF87a", 6) != 0 && std::memcmp(data, "GIF89a", 6) != 0)) {
    return false;
  }
  w = le16(data + 6);
  h = le16(data + 8);
  return true;
}

bool probeBmp(const uint8_t* data, size_t len, uint32_t& w, uint32_t& h) {
  if (len < 26 || data[0] != 'B' || data[1] != 'M') {
    return false;
  }
  const int32_t sw = le32s(data + 18);
  const int32_t sh = le32s(data + 22);
  // Negative height marks a top-down bitmap.
  w = static_cast<uint32_t>(sw < 0 ? -static_cast<int64_t>(sw) : sw);
  h = static_cast<uint32_t>(sh < 0 ? -static_cast<int64_t>(sh) : sh);
  return true;
}

}  // namespace

bool probeImageGeometry(const uint8_t* data, size_t len, ImageGeometry& out) {
  if (data == nullptr) {
    return false;
  }
  uint32_t w = 0;
  uint32_t h = 0;
  if (!probePng(data, len, w, h) && !probeJpeg(data, len, w, h) && !probeGif(data, len, w, h) &&
      !probeBmp(data, len, w, h)) {
    return false;
  }
  if (w == 0 || h == 0) {
    return false;
  }
  out.width = w;
  out.height = h;
  out.orientation = w > h ? Orientation::kLandscape : Orientation::kPortrait;
  return true;
}
