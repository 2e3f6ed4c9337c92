#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "core/DisplayController.h"

using test_support::makeSnapshot;

namespace {

DisplayController::Options timedOptions(uint32_t displayTimeMs = 5000,
                                        uint32_t pinnedTimeoutMs = 0) {
  DisplayController::Options options;
  options.displayTimeMs = displayTimeMs;
  options.pinnedTimeoutMs = pinnedTimeoutMs;
  return options;
}

ControlEvent event(ControlEvent::Type type, const std::string& posterId = std::string()) {
  ControlEvent ev;
  ev.type = type;
  ev.posterId = posterId;
  return ev;
}

// Steps the controller every 100 ms over [fromMs, toMs] and records each
// poster id as it comes on screen.
std::vector<std::string> runTimed(DisplayController& controller, const SnapshotPtr& snapshot,
                                  uint32_t fromMs, uint32_t toMs) {
  std::vector<std::string> shown;
  for (uint32_t now = fromMs; now <= toMs; now += 100) {
    const Frame& frame = controller.step(now, snapshot);
    if (frame.kind != Frame::Kind::kPoster) {
      continue;
    }
    if (shown.empty() || shown.back() != frame.poster.record.id) {
      shown.push_back(frame.poster.record.id);
    }
  }
  return shown;
}

TEST(DisplayControllerTest, RotatesPostersInListOrderAndWraps) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});

  EXPECT_EQ(runTimed(controller, snapshot, 0, 16000),
            std::vector<std::string>({"A", "B", "C", "A"}));
  EXPECT_EQ(controller.mode(), DisplayMode::kTimed);
}

TEST(DisplayControllerTest, FeedDisplayTimeOverridesConfiguredTime) {
  DisplayController controller(timedOptions(5000));
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B"}, 2);

  controller.step(0, snapshot);
  controller.step(1900, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "A");
  controller.step(2000, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "B");
}

TEST(DisplayControllerTest, LongFeedDisplayTimeDoesNotWrap) {
  DisplayController controller(timedOptions(5000));
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"}, 4294968);

  controller.step(0, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "A");
  controller.step(1000, snapshot);
  controller.step(3600000, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "A");
}

TEST(DisplayControllerTest, PlaceholderUntilFirstSnapshot) {
  DisplayController controller(timedOptions());

  const Frame& waiting = controller.step(0, nullptr);
  EXPECT_EQ(waiting.kind, Frame::Kind::kPlaceholder);
  EXPECT_EQ(waiting.message, "Waiting for posters...");

  const Frame& empty = controller.step(100, makeSnapshot(1, {}));
  EXPECT_EQ(empty.kind, Frame::Kind::kPlaceholder);
  EXPECT_EQ(empty.message, "No posters for this display");

  const Frame& poster = controller.step(200, makeSnapshot(2, {"A"}));
  EXPECT_EQ(poster.kind, Frame::Kind::kPoster);
  EXPECT_EQ(poster.poster.record.id, "A");
}

TEST(DisplayControllerTest, PlaceholderWhenNothingIsDownloaded) {
  DisplayController controller(timedOptions());
  auto snapshot = std::make_shared<PosterListSnapshot>(*makeSnapshot(1, {"A", "B"}));
  for (PosterSlot& slot : snapshot->posters) {
    slot.entry.reset();
  }

  const Frame& frame = controller.step(0, snapshot);
  EXPECT_EQ(frame.kind, Frame::Kind::kPlaceholder);
  EXPECT_EQ(frame.message, "Waiting for posters...");
}

TEST(DisplayControllerTest, SecondaryClickOpensMenuOnNextStep) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, snapshot);

  controller.post(event(ControlEvent::Type::kSecondaryClick));
  const Frame& frame = controller.step(16, snapshot);

  EXPECT_EQ(controller.mode(), DisplayMode::kManualMenu);
  EXPECT_EQ(frame.kind, Frame::Kind::kMenu);
  EXPECT_EQ(frame.mode, DisplayMode::kManualMenu);
  ASSERT_EQ(frame.menu.size(), 3u);
  EXPECT_EQ(frame.menu[0].posterId, "A");
  EXPECT_EQ(frame.menu[0].label, "Poster A");
  EXPECT_TRUE(frame.menu[0].selectable);
}

TEST(DisplayControllerTest, MenuStaysOpenWhileTimeElapses) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B"});
  controller.step(0, snapshot);
  controller.post(event(ControlEvent::Type::kSecondaryClick));
  controller.step(100, snapshot);

  const Frame& frame = controller.step(60000, snapshot);
  EXPECT_EQ(frame.kind, Frame::Kind::kMenu);
  EXPECT_EQ(controller.currentPosterId(), "A");
}

TEST(DisplayControllerTest, MenuTitleComesFromEventMetadata) {
  DisplayController controller(timedOptions());
  auto snapshot = std::make_shared<PosterListSnapshot>(*makeSnapshot(1, {"A"}));
  snapshot->event.json = "{\"name\":\"Spring Symposium\"}";
  snapshot->event.title = "Spring Symposium";
  controller.step(0, snapshot);

  controller.post(event(ControlEvent::Type::kSecondaryClick));
  EXPECT_EQ(controller.step(10, snapshot).menuTitle, "Spring Symposium");

  DisplayController untitled(timedOptions());
  untitled.post(event(ControlEvent::Type::kSecondaryClick));
  EXPECT_EQ(untitled.step(0, makeSnapshot(1, {"A"})).menuTitle, "Select a poster");
}

TEST(DisplayControllerTest, ResumingTimedShowsNextPosterWithFreshInterval) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, snapshot);
  controller.post(event(ControlEvent::Type::kSecondaryClick));
  controller.step(1000, snapshot);

  controller.post(event(ControlEvent::Type::kSelectTimed));
  const Frame& frame = controller.step(2000, snapshot);
  EXPECT_EQ(controller.mode(), DisplayMode::kTimed);
  EXPECT_EQ(frame.kind, Frame::Kind::kPoster);
  EXPECT_EQ(frame.poster.record.id, "B");

  controller.step(6900, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "B");
  controller.step(7000, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "C");
}

TEST(DisplayControllerTest, SelectingPosterPinsItUntilSecondaryClick) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, snapshot);
  controller.post(event(ControlEvent::Type::kSecondaryClick));
  controller.step(100, snapshot);

  controller.post(event(ControlEvent::Type::kSelectPoster, "C"));
  const Frame& pinned = controller.step(200, snapshot);
  EXPECT_EQ(controller.mode(), DisplayMode::kManualPinned);
  EXPECT_EQ(pinned.kind, Frame::Kind::kPoster);
  EXPECT_EQ(pinned.poster.record.id, "C");

  EXPECT_EQ(controller.step(600000, snapshot).poster.record.id, "C");
  EXPECT_EQ(controller.mode(), DisplayMode::kManualPinned);

  controller.post(event(ControlEvent::Type::kSecondaryClick));
  EXPECT_EQ(controller.step(600100, snapshot).kind, Frame::Kind::kMenu);
  EXPECT_EQ(controller.mode(), DisplayMode::kManualMenu);
}

TEST(DisplayControllerTest, PinnedTimeoutReturnsToTimed) {
  DisplayController controller(timedOptions(5000, 3000));
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, snapshot);
  controller.post(event(ControlEvent::Type::kSecondaryClick));
  controller.step(100, snapshot);
  controller.post(event(ControlEvent::Type::kSelectPoster, "C"));
  controller.step(200, snapshot);

  controller.step(3100, snapshot);
  EXPECT_EQ(controller.mode(), DisplayMode::kManualPinned);
  const Frame& frame = controller.step(3200, snapshot);
  EXPECT_EQ(controller.mode(), DisplayMode::kTimed);
  EXPECT_EQ(frame.poster.record.id, "B");
}

TEST(DisplayControllerTest, UndownloadedPostersAreListedButNotSelectable) {
  DisplayController controller(timedOptions());
  auto snapshot = std::make_shared<PosterListSnapshot>(*makeSnapshot(1, {"A", "B"}));
  snapshot->posters[1].entry.reset();
  const SnapshotPtr published = snapshot;
  controller.step(0, published);

  controller.post(event(ControlEvent::Type::kSecondaryClick));
  const Frame& menu = controller.step(100, published);
  ASSERT_EQ(menu.menu.size(), 2u);
  EXPECT_TRUE(menu.menu[0].selectable);
  EXPECT_FALSE(menu.menu[1].selectable);

  controller.post(event(ControlEvent::Type::kSelectPoster, "B"));
  controller.step(200, published);
  EXPECT_EQ(controller.mode(), DisplayMode::kManualMenu);
}

TEST(DisplayControllerTest, TimedRotationSkipsUndownloadedPosters) {
  DisplayController controller(timedOptions());
  auto snapshot = std::make_shared<PosterListSnapshot>(*makeSnapshot(1, {"A", "B", "C"}));
  snapshot->posters[1].entry->bytes.reset();

  EXPECT_EQ(runTimed(controller, snapshot, 0, 10000), std::vector<std::string>({"A", "C", "A"}));
}

TEST(DisplayControllerTest, ExitOnlyFromMenu) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A"});
  controller.post(event(ControlEvent::Type::kSelectExit));
  controller.step(0, snapshot);
  EXPECT_FALSE(controller.exitRequested());

  controller.post(event(ControlEvent::Type::kSecondaryClick));
  controller.post(event(ControlEvent::Type::kSelectExit));
  controller.step(100, snapshot);
  EXPECT_TRUE(controller.exitRequested());
}

TEST(DisplayControllerTest, RenderFailureSkipsToNextPoster) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, snapshot);

  controller.post(event(ControlEvent::Type::kRenderFailed, "A"));
  EXPECT_EQ(controller.step(50, snapshot).poster.record.id, "B");
  controller.step(5050, snapshot);
  EXPECT_EQ(controller.currentPosterId(), "C");
}

TEST(DisplayControllerTest, RenderFailureOfPinnedPosterResumesTimed) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, snapshot);
  controller.post(event(ControlEvent::Type::kSecondaryClick));
  controller.step(100, snapshot);
  controller.post(event(ControlEvent::Type::kSelectPoster, "C"));
  controller.step(200, snapshot);

  controller.post(event(ControlEvent::Type::kRenderFailed, "C"));
  controller.step(300, snapshot);
  EXPECT_EQ(controller.mode(), DisplayMode::kTimed);
  EXPECT_EQ(controller.currentPosterId(), "B");
}

TEST(DisplayControllerTest, NewListContinuesAfterCurrentPoster) {
  DisplayController controller(timedOptions());
  controller.step(0, makeSnapshot(1, {"A", "B", "C"}));
  EXPECT_EQ(controller.currentPosterId(), "A");

  const SnapshotPtr updated = makeSnapshot(2, {"X", "A", "C"});
  EXPECT_EQ(controller.step(1000, updated).poster.record.id, "A");
  controller.step(5000, updated);
  EXPECT_EQ(controller.currentPosterId(), "C");
}

TEST(DisplayControllerTest, NewListWithoutCurrentPosterKeepsPosition) {
  DisplayController controller(timedOptions());
  const SnapshotPtr first = makeSnapshot(1, {"A", "B", "C"});
  controller.step(0, first);
  controller.step(5000, first);
  EXPECT_EQ(controller.currentPosterId(), "B");

  const SnapshotPtr updated = makeSnapshot(2, {"A", "C", "D"});
  controller.step(6000, updated);
  controller.step(10000, updated);
  EXPECT_EQ(controller.currentPosterId(), "C");
}

TEST(DisplayControllerTest, FrameSerialChangesOnlyWithContent) {
  DisplayController controller(timedOptions());
  const SnapshotPtr snapshot = makeSnapshot(1, {"A", "B"});

  const uint64_t first = controller.step(0, snapshot).serial;
  EXPECT_EQ(controller.step(100, snapshot).serial, first);
  EXPECT_EQ(controller.step(4900, snapshot).serial, first);
  EXPECT_GT(controller.step(5000, snapshot).serial, first);
}

}  // namespace
