#include "core/DisplayController.h"

#include <cstdint>
#include <utility>

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "display";
constexpr char kWaitingMessage[] = "Waiting for posters...";
constexpr char kEmptyMessage[] = "No posters for this display";
constexpr char kDefaultMenuTitle[] = "Select a poster";

std::string menuLabel(const PosterRecord& record) {
  std::string label = record.title.empty() ? "Poster " + record.id : record.title;
  if (!record.presenter.empty()) {
    label += " (" + record.presenter + ")";
  }
  return label;
}

uint64_t posterHash(const PosterSlot& slot) {
  return slot.entry.has_value() ? slot.entry->contentHash : 0;
}

bool sameMenu(const std::vector<MenuItem>& a, const std::vector<MenuItem>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].posterId != b[i].posterId || a[i].label != b[i].label ||
        a[i].selectable != b[i].selectable) {
      return false;
    }
  }
  return true;
}

bool sameContent(const Frame& a, const Frame& b) {
  if (a.kind != b.kind || a.mode != b.mode || a.message != b.message) {
    return false;
  }
  switch (a.kind) {
    case Frame::Kind::kPlaceholder:
      return true;
    case Frame::Kind::kPoster:
      return a.poster.record.id == b.poster.record.id && posterHash(a.poster) == posterHash(b.poster);
    case Frame::Kind::kMenu:
      return a.menuTitle == b.menuTitle && sameMenu(a.menu, b.menu);
  }
  return false;
}
}  // namespace

const char* displayModeName(DisplayMode mode) {
  switch (mode) {
    case DisplayMode::kTimed:
      return "TIMED";
    case DisplayMode::kManualMenu:
      return "MANUAL_MENU";
    case DisplayMode::kManualPinned:
      return "MANUAL_PINNED";
  }
  return "UNKNOWN";
}

DisplayController::DisplayController(const Options& options) : options_(options) {}

void DisplayController::post(const ControlEvent& event) { pending_.push_back(event); }

const Frame& DisplayController::step(uint32_t nowMs, const SnapshotPtr& snapshot) {
  adoptSnapshot(snapshot);

  std::vector<ControlEvent> events;
  events.swap(pending_);
  for (const ControlEvent& event : events) {
    applyEvent(event, nowMs);
  }

  switch (mode_) {
    case DisplayMode::kTimed:
      advanceTimed(nowMs);
      break;
    case DisplayMode::kManualPinned:
      if (options_.pinnedTimeoutMs > 0 && nowMs - pinnedAtMs_ >= options_.pinnedTimeoutMs) {
        platform::logi(kTag, "pinned timeout after %u ms", static_cast<unsigned>(nowMs - pinnedAtMs_));
        resumeTimed(nowMs);
        advanceTimed(nowMs);
      }
      break;
    case DisplayMode::kManualMenu:
      break;
  }

  buildFrame();
  listChanged_ = false;
  return frame_;
}

void DisplayController::adoptSnapshot(const SnapshotPtr& snapshot) {
  if (snapshot == nullptr || snapshot == snapshot_) {
    return;
  }
  if (snapshot_ != nullptr && snapshot_->version == snapshot->version) {
    return;
  }
  snapshot_ = snapshot;
  listChanged_ = true;
  failed_.clear();
  platform::logi(kTag, "poster list v%llu source=%s posters=%u displayable=%u",
                 static_cast<unsigned long long>(snapshot_->version), snapshot_->source.c_str(),
                 static_cast<unsigned>(snapshot_->posters.size()),
                 static_cast<unsigned>(snapshot_->displayableCount()));
}

void DisplayController::applyEvent(const ControlEvent& event, uint32_t nowMs) {
  switch (event.type) {
    case ControlEvent::Type::kSecondaryClick:
      if (mode_ == DisplayMode::kTimed) {
        leaveTimed();
        enterMode(DisplayMode::kManualMenu, nowMs);
      } else if (mode_ == DisplayMode::kManualPinned) {
        enterMode(DisplayMode::kManualMenu, nowMs);
      }
      break;

    case ControlEvent::Type::kSelectPoster: {
      if (mode_ != DisplayMode::kManualMenu) {
        break;
      }
      const PosterSlot* slot = findSlot(event.posterId);
      if (slot == nullptr || !slot->displayable()) {
        platform::logw(kTag, "poster id=%s is not selectable", event.posterId.c_str());
        break;
      }
      pinnedSlot_ = *slot;
      pinnedAtMs_ = nowMs;
      enterMode(DisplayMode::kManualPinned, nowMs);
      logPosterChange(pinnedSlot_);
      break;
    }

    case ControlEvent::Type::kSelectTimed:
      if (mode_ == DisplayMode::kManualMenu) {
        resumeTimed(nowMs);
      }
      break;

    case ControlEvent::Type::kSelectExit:
      if (mode_ == DisplayMode::kManualMenu) {
        platform::logi(kTag, "exit selected");
        exitRequested_ = true;
      }
      break;

    case ControlEvent::Type::kRenderFailed:
      failed_.insert(event.posterId);
      platform::logw(kTag, "cannot render id=%s, skipping it", event.posterId.c_str());
      if (mode_ == DisplayMode::kManualPinned && pinnedSlot_.record.id == event.posterId) {
        resumeTimed(nowMs);
      } else if (mode_ == DisplayMode::kTimed && currentId_ == event.posterId) {
        (void)showNext(currentId_, currentIndex_, nowMs);
      }
      break;
  }
}

void DisplayController::enterMode(DisplayMode mode, uint32_t nowMs) {
  if (mode_ == mode) {
    return;
  }
  platform::logi(kTag, "mode %s -> %s at %u", displayModeName(mode_), displayModeName(mode),
                 static_cast<unsigned>(nowMs));
  mode_ = mode;
}

void DisplayController::leaveTimed() {
  resumeAfterId_ = currentId_;
  resumeIndex_ = currentIndex_;
}

void DisplayController::resumeTimed(uint32_t nowMs) {
  enterMode(DisplayMode::kTimed, nowMs);
  resumePending_ = true;
}

void DisplayController::advanceTimed(uint32_t nowMs) {
  if (resumePending_) {
    resumePending_ = false;
    started_ = true;
    (void)showNext(resumeAfterId_, resumeIndex_, nowMs);
    return;
  }
  if (!started_) {
    started_ = true;
    (void)showNext(std::string(), 0, nowMs);
    return;
  }
  if (currentId_.empty() && listChanged_) {
    (void)showNext(std::string(), currentIndex_, nowMs);
    return;
  }
  if (nowMs - shownAtMs_ >= effectiveDisplayTimeMs()) {
    (void)showNext(currentId_, currentIndex_, nowMs);
  }
}

bool DisplayController::showNext(const std::string& afterId, size_t fallbackIndex,
                                 uint32_t nowMs) {
  shownAtMs_ = nowMs;
  const size_t count = snapshot_ == nullptr ? 0 : snapshot_->posters.size();
  if (count == 0) {
    currentId_.clear();
    currentSlot_ = PosterSlot();
    return false;
  }

  const std::vector<PosterSlot>& posters = snapshot_->posters;
  size_t start = fallbackIndex;
  if (!afterId.empty()) {
    for (size_t i = 0; i < count; ++i) {
      if (posters[i].record.id == afterId) {
        start = i + 1;
        break;
      }
    }
  }
  bool wrapped = false;
  if (start >= count) {
    start = 0;
    wrapped = true;
  }

  const PosterSlot* chosen = nullptr;
  size_t chosenIndex = 0;
  for (size_t k = 0; k < count; ++k) {
    const size_t pos = start + k;
    if (pos >= count) {
      wrapped = true;
    }
    const size_t index = pos % count;
    const PosterSlot& slot = posters[index];
    if (!slot.displayable() || failed_.count(slot.record.id) != 0) {
      continue;
    }
    chosen = &slot;
    chosenIndex = index;
    break;
  }
  // Skipped posters get another try on the next pass.
  if (wrapped) {
    failed_.clear();
  }

  if (chosen == nullptr) {
    currentId_.clear();
    currentSlot_ = PosterSlot();
    return false;
  }
  const bool changed = chosen->record.id != currentId_;
  currentId_ = chosen->record.id;
  currentIndex_ = chosenIndex;
  currentSlot_ = *chosen;
  if (changed) {
    logPosterChange(currentSlot_);
  }
  return true;
}

const PosterSlot* DisplayController::findSlot(const std::string& id) const {
  if (snapshot_ == nullptr) {
    return nullptr;
  }
  for (const PosterSlot& slot : snapshot_->posters) {
    if (slot.record.id == id) {
      return &slot;
    }
  }
  return nullptr;
}

uint32_t DisplayController::effectiveDisplayTimeMs() const {
  if (snapshot_ != nullptr && snapshot_->displayTimeSec > 0) {
    const uint64_t ms = static_cast<uint64_t>(snapshot_->displayTimeSec) * 1000ULL;
    return ms > UINT32_MAX / 2 ? UINT32_MAX / 2 : static_cast<uint32_t>(ms);
  }
  return options_.displayTimeMs > 0 ? options_.displayTimeMs : 1;
}

void DisplayController::buildFrame() {
  Frame next;
  next.mode = mode_;
  switch (mode_) {
    case DisplayMode::kTimed:
      if (currentId_.empty()) {
        next.kind = Frame::Kind::kPlaceholder;
        const bool empty = snapshot_ != nullptr && snapshot_->posters.empty();
        next.message = empty ? kEmptyMessage : kWaitingMessage;
      } else {
        next.kind = Frame::Kind::kPoster;
        next.poster = currentSlot_;
      }
      break;
    case DisplayMode::kManualMenu:
      next.kind = Frame::Kind::kMenu;
      next.menuTitle = kDefaultMenuTitle;
      if (snapshot_ != nullptr) {
        if (!snapshot_->event.title.empty()) {
          next.menuTitle = snapshot_->event.title;
        }
        for (const PosterSlot& slot : snapshot_->posters) {
          MenuItem item;
          item.posterId = slot.record.id;
          item.label = menuLabel(slot.record);
          item.selectable = slot.displayable();
          next.menu.push_back(item);
        }
      }
      break;
    case DisplayMode::kManualPinned:
      next.kind = Frame::Kind::kPoster;
      next.poster = pinnedSlot_;
      break;
  }

  if (frame_.serial != 0 && sameContent(frame_, next)) {
    return;
  }
  next.serial = frame_.serial + 1;
  frame_ = std::move(next);
}

void DisplayController::logPosterChange(const PosterSlot& slot) const {
  const PosterRecord& r = slot.record;
  platform::logi(kTag, "%s id=%s title='%s' presenter='%s' institute='%s' window=%s..%s",
                 displayModeName(mode_), r.id.c_str(), r.title.c_str(), r.presenter.c_str(),
                 r.institute.c_str(), r.startsAt.empty() ? "-" : r.startsAt.c_str(),
                 r.endsAt.empty() ? "-" : r.endsAt.c_str());
}
