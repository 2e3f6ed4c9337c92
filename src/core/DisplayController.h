#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "PosterTypes.h"

enum class DisplayMode : uint8_t { kTimed = 0, kManualMenu, kManualPinned };

const char* displayModeName(DisplayMode mode);

struct ControlEvent {
  enum class Type : uint8_t {
    kSecondaryClick = 0,
    kSelectPoster,
    kSelectTimed,
    kSelectExit,
    // The renderer could not decode posterId.
    kRenderFailed,
  };

  Type type = Type::kSecondaryClick;
  std::string posterId;
};

struct MenuItem {
  std::string posterId;
  std::string label;
  bool selectable = false;
};

// What the renderer should show. serial changes whenever the content does,
// so the renderer rebuilds its widgets only on a change.
struct Frame {
  enum class Kind : uint8_t { kPlaceholder = 0, kPoster, kMenu };

  Kind kind = Kind::kPlaceholder;
  DisplayMode mode = DisplayMode::kTimed;
  std::string message;
  PosterSlot poster;
  std::string menuTitle;
  std::vector<MenuItem> menu;
  uint64_t serial = 0;
};

// Three-state display machine driven from the render loop. Events are queued
// by post() and applied at the start of the next step(), before the frame is
// computed. Not thread-safe; post() and step() run on the render thread.
class DisplayController {
 public:
  struct Options {
    uint32_t displayTimeMs = 5000;
    // 0 keeps a pinned poster until the user leaves it.
    uint32_t pinnedTimeoutMs = 0;
  };

  explicit DisplayController(const Options& options);

  void post(const ControlEvent& event);
  const Frame& step(uint32_t nowMs, const SnapshotPtr& snapshot);

  DisplayMode mode() const { return mode_; }
  bool exitRequested() const { return exitRequested_; }
  // Poster currently in the timed rotation, empty while a placeholder shows.
  const std::string& currentPosterId() const { return currentId_; }

 private:
  void adoptSnapshot(const SnapshotPtr& snapshot);
  void applyEvent(const ControlEvent& event, uint32_t nowMs);
  void enterMode(DisplayMode mode, uint32_t nowMs);
  void leaveTimed();
  void resumeTimed(uint32_t nowMs);
  void advanceTimed(uint32_t nowMs);
  bool showNext(const std::string& afterId, size_t fallbackIndex, uint32_t nowMs);
  const PosterSlot* findSlot(const std::string& id) const;
  uint32_t effectiveDisplayTimeMs() const;
  void buildFrame();
  void logPosterChange(const PosterSlot& slot) const;

  Options options_;
  DisplayMode mode_ = DisplayMode::kTimed;
  std::vector<ControlEvent> pending_;
  SnapshotPtr snapshot_;
  // Set when step() picked up a new snapshot version.
  bool listChanged_ = false;
  bool exitRequested_ = false;

  // Timed rotation.
  std::string currentId_;
  size_t currentIndex_ = 0;
  PosterSlot currentSlot_;
  uint32_t shownAtMs_ = 0;
  bool started_ = false;
  bool resumePending_ = false;
  // Undecodable posters, skipped until the rotation wraps or the list changes.
  std::set<std::string> failed_;

  // Poster on screen when the timed rotation was left.
  std::string resumeAfterId_;
  size_t resumeIndex_ = 0;

  PosterSlot pinnedSlot_;
  uint32_t pinnedAtMs_ = 0;

  Frame frame_;
};
