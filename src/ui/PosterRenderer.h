#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/DisplayController.h"
#include "core/ImagePreparer.h"
#include "lvgl.h"

// Turns controller frames into LVGL screens. Widgets are rebuilt only when
// the frame serial changes; menu clicks are posted back to the controller.
class PosterRenderer {
 public:
  PosterRenderer(DisplayController& controller, const ImagePreparer& preparer,
                 const TargetGeometry& target);

  void present(const Frame& frame);

 private:
  struct MenuAction {
    PosterRenderer* owner = nullptr;
    ControlEvent event;
  };

  lv_obj_t* createScreen() const;
  void swapScreen(lv_obj_t* screen);
  void buildPlaceholder(lv_obj_t* screen, const std::string& message) const;
  bool buildPoster(lv_obj_t* screen, const PosterSlot& slot, RenderableSurface& surface);
  void buildMenu(lv_obj_t* screen, const Frame& frame);
  lv_obj_t* addMenuButton(lv_obj_t* list, const char* symbol, const std::string& label,
                          const ControlEvent& event, bool enabled);
  static void menuClickedCb(lv_event_t* e);

  DisplayController& controller_;
  const ImagePreparer& preparer_;
  TargetGeometry target_;
  uint64_t shownSerial_ = 0;

  // The surface on screen and the poster it came from.
  RenderableSurface surface_;
  std::string surfaceId_;
  uint64_t surfaceHash_ = 0;
  std::vector<std::unique_ptr<MenuAction>> actions_;
};
