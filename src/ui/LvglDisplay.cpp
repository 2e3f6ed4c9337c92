#include "ui/LvglDisplay.h"

#include <unistd.h>

#include "lvgl.h"
#include "platform/Platform.h"
#include "platform/PointerInput.h"

namespace {

constexpr const char* kTag = "lvgl";

bool sLvglReady = false;
lv_display_t* sDisplay = nullptr;
lv_indev_t* sPointer = nullptr;

uint32_t tickCb() { return platform::millisMs(); }

void pointerReadCb(lv_indev_t* indev, lv_indev_data_t* data) {
  (void)indev;
  pointer_input::Point p;
  pointer_input::read(p);
  data->point.x = p.x;
  data->point.y = p.y;
  data->state = p.pressed ? LV_INDEV_STATE_PRESSED : LV_INDEV_STATE_RELEASED;
}

}  // namespace

namespace lvgl_display {

bool begin(const KioskSettings& settings, uint16_t& outWidth, uint16_t& outHeight,
           std::string* errorMessage) {
  if (sLvglReady) {
    outWidth = static_cast<uint16_t>(lv_display_get_horizontal_resolution(sDisplay));
    outHeight = static_cast<uint16_t>(lv_display_get_vertical_resolution(sDisplay));
    return true;
  }
  // The fbdev driver only logs an open failure, so check access up front.
  if (::access(settings.framebuffer.c_str(), R_OK | W_OK) != 0) {
    if (errorMessage != nullptr) {
      *errorMessage = "framebuffer " + settings.framebuffer + " is not accessible";
    }
    return false;
  }

  if (!lv_is_initialized()) {
    lv_init();
  }
  lv_tick_set_cb(tickCb);

  sDisplay = lv_linux_fbdev_create();
  if (sDisplay == nullptr) {
    if (errorMessage != nullptr) {
      *errorMessage = "lvgl fbdev display create failed";
    }
    return false;
  }
  lv_linux_fbdev_set_file(sDisplay, settings.framebuffer.c_str());
  if (settings.displayWidth > 0 && settings.displayHeight > 0) {
    lv_display_set_resolution(sDisplay, settings.displayWidth, settings.displayHeight);
  }

  const int32_t w = lv_display_get_horizontal_resolution(sDisplay);
  const int32_t h = lv_display_get_vertical_resolution(sDisplay);
  if (w <= 0 || h <= 0) {
    if (errorMessage != nullptr) {
      *errorMessage = "framebuffer " + settings.framebuffer + " reports no resolution";
    }
    return false;
  }

  sPointer = lv_indev_create();
  if (sPointer == nullptr) {
    if (errorMessage != nullptr) {
      *errorMessage = "lvgl input create failed";
    }
    return false;
  }
  lv_indev_set_type(sPointer, LV_INDEV_TYPE_POINTER);
  lv_indev_set_read_cb(sPointer, pointerReadCb);
  lv_indev_set_display(sPointer, sDisplay);

  outWidth = static_cast<uint16_t>(w);
  outHeight = static_cast<uint16_t>(h);
  sLvglReady = true;
  platform::logi(kTag, "lvgl ready fb=%s %dx%d", settings.framebuffer.c_str(),
                 static_cast<int>(w), static_cast<int>(h));
  return true;
}

void tick() {
  if (sLvglReady) {
    (void)lv_timer_handler();
  }
}

void shutdown() {
  if (!sLvglReady) {
    return;
  }
  lv_obj_clean(lv_screen_active());
  (void)lv_timer_handler();
  lv_indev_delete(sPointer);
  lv_display_delete(sDisplay);
  sPointer = nullptr;
  sDisplay = nullptr;
  lv_deinit();
  sLvglReady = false;
}

}  // namespace lvgl_display
