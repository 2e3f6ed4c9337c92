#include "ui/PosterRenderer.h"

#include <utility>

#include "platform/Platform.h"
#include "ui/LvglImageDecoder.h"

namespace {
constexpr const char* kTag = "render";
constexpr uint32_t kBackgroundColor = 0x000000;
constexpr uint32_t kTextColor = 0xE6EEF8;
constexpr uint32_t kMenuBgColor = 0x0A1222;
constexpr int32_t kQuarterTurn = 900;
}  // namespace

PosterRenderer::PosterRenderer(DisplayController& controller, const ImagePreparer& preparer,
                               const TargetGeometry& target)
    : controller_(controller), preparer_(preparer), target_(target) {}

void PosterRenderer::present(const Frame& frame) {
  if (frame.serial == shownSerial_) {
    return;
  }
  shownSerial_ = frame.serial;

  lv_obj_t* screen = createScreen();
  std::vector<std::unique_ptr<MenuAction>> oldActions;
  oldActions.swap(actions_);
  RenderableSurface surface;
  bool keepSurface = false;

  switch (frame.kind) {
    case Frame::Kind::kPlaceholder:
      buildPlaceholder(screen, frame.message);
      break;
    case Frame::Kind::kPoster:
      if (buildPoster(screen, frame.poster, surface)) {
        keepSurface = true;
      } else {
        controller_.post({ControlEvent::Type::kRenderFailed, frame.poster.record.id});
      }
      break;
    case Frame::Kind::kMenu:
      buildMenu(screen, frame);
      break;
  }

  // The old screen still references the old surface and actions; drop it first.
  swapScreen(screen);
  if (keepSurface) {
    surface_ = std::move(surface);
    surfaceId_ = frame.poster.record.id;
    surfaceHash_ = frame.poster.entry.has_value() ? frame.poster.entry->contentHash : 0;
  } else {
    surface_ = RenderableSurface();
    surfaceId_.clear();
    surfaceHash_ = 0;
  }
}

lv_obj_t* PosterRenderer::createScreen() const {
  lv_obj_t* screen = lv_obj_create(nullptr);
  lv_obj_set_style_bg_color(screen, lv_color_hex(kBackgroundColor), 0);
  lv_obj_set_style_bg_opa(screen, LV_OPA_COVER, 0);
  lv_obj_remove_flag(screen, LV_OBJ_FLAG_SCROLLABLE);
  return screen;
}

void PosterRenderer::swapScreen(lv_obj_t* screen) {
  lv_obj_t* old = lv_screen_active();
  lv_screen_load(screen);
  if (old != nullptr && old != screen) {
    lv_obj_delete(old);
  }
}

void PosterRenderer::buildPlaceholder(lv_obj_t* screen, const std::string& message) const {
  lv_obj_t* label = lv_label_create(screen);
  lv_label_set_text(label, message.c_str());
  lv_obj_set_style_text_color(label, lv_color_hex(kTextColor), 0);
  lv_obj_center(label);
}

bool PosterRenderer::buildPoster(lv_obj_t* screen, const PosterSlot& slot,
                                 RenderableSurface& surface) {
  if (!slot.displayable()) {
    return false;
  }
  const uint64_t hash = slot.entry->contentHash;
  if (surface_.image != nullptr && surfaceId_ == slot.record.id && surfaceHash_ == hash) {
    surface = surface_;
  } else {
    std::string err;
    if (!preparer_.prepare(*slot.entry->bytes, target_, surface, &err)) {
      platform::logw(kTag, "decode id=%s failed: %s", slot.record.id.c_str(), err.c_str());
      return false;
    }
  }

  const LvglDecodedImage* decoded = static_cast<const LvglDecodedImage*>(surface.image.get());
  lv_obj_t* img = lv_image_create(screen);
  lv_image_set_src(img, decoded->source());
  lv_obj_set_size(img, static_cast<int32_t>(decoded->width()),
                  static_cast<int32_t>(decoded->height()));
  lv_image_set_pivot(img, static_cast<int32_t>(decoded->width() / 2),
                     static_cast<int32_t>(decoded->height() / 2));
  lv_image_set_scale(img, surface.placement.lvScale);
  lv_image_set_rotation(img, surface.placement.rotate90 ? kQuarterTurn : 0);
  lv_obj_center(img);
  return true;
}

void PosterRenderer::buildMenu(lv_obj_t* screen, const Frame& frame) {
  lv_obj_set_style_bg_color(screen, lv_color_hex(kMenuBgColor), 0);

  lv_obj_t* list = lv_list_create(screen);
  lv_obj_set_size(list, lv_pct(100), lv_pct(100));
  lv_obj_center(list);

  lv_list_add_text(list, frame.menuTitle.c_str());
  (void)addMenuButton(list, LV_SYMBOL_PLAY, "Timed Poster",
                      {ControlEvent::Type::kSelectTimed, std::string()}, true);
  for (const MenuItem& item : frame.menu) {
    (void)addMenuButton(list, LV_SYMBOL_IMAGE, item.label,
                        {ControlEvent::Type::kSelectPoster, item.posterId}, item.selectable);
  }
  (void)addMenuButton(list, LV_SYMBOL_CLOSE, "Exit",
                      {ControlEvent::Type::kSelectExit, std::string()}, true);
}

lv_obj_t* PosterRenderer::addMenuButton(lv_obj_t* list, const char* symbol,
                                        const std::string& label, const ControlEvent& event,
                                        bool enabled) {
  lv_obj_t* btn = lv_list_add_button(list, symbol, label.c_str());
  if (!enabled) {
    lv_obj_add_state(btn, LV_STATE_DISABLED);
    return btn;
  }
  auto action = std::make_unique<MenuAction>();
  action->owner = this;
  action->event = event;
  lv_obj_add_event_cb(btn, menuClickedCb, LV_EVENT_CLICKED, action.get());
  actions_.push_back(std::move(action));
  return btn;
}

void PosterRenderer::menuClickedCb(lv_event_t* e) {
  const MenuAction* action = static_cast<const MenuAction*>(lv_event_get_user_data(e));
  if (action == nullptr || action->owner == nullptr) {
    return;
  }
  action->owner->controller_.post(action->event);
}
