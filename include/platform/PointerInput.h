#pragma once

#include <cstdint>

// Non-blocking pointer/keyboard reader over Linux evdev devices. Polled from
// the render loop; never starts a thread of its own.
namespace pointer_input {

struct Point {
  int32_t x = 0;
  int32_t y = 0;
  bool pressed = false;
};

bool init(uint16_t screenWidth, uint16_t screenHeight, uint32_t longPressMs);
void poll(uint32_t nowMs);
void read(Point& out);
// Right-button presses plus long presses on touch panels since the last call.
uint32_t takeSecondaryClicks();
// Esc or q was pressed since the last call.
bool takeExitRequest();
void shutdown();

}  // namespace pointer_input
