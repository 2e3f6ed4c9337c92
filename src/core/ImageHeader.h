#pragma once

#include <cstddef>
#include <cstdint>

#include "PosterTypes.h"

// Reads width and height from PNG, JPEG, GIF or BMP headers without decoding
// pixels. Square images count as portrait.
bool probeImageGeometry(const uint8_t* data, size_t len, ImageGeometry& out);
