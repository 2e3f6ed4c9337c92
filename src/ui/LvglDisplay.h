#pragma once

#include <cstdint>
#include <string>

#include "KioskSettings.h"

// LVGL on the Linux framebuffer with the evdev pointer as its input device.
namespace lvgl_display {

// Reports the resolution LVGL renders at. False when the framebuffer cannot
// be opened.
bool begin(const KioskSettings& settings, uint16_t& outWidth, uint16_t& outHeight,
           std::string* errorMessage = nullptr);
void tick();
void shutdown();

}  // namespace lvgl_display
