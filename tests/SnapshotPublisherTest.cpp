#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "TestSupport.h"
#include "core/SnapshotPublisher.h"

using test_support::makeSnapshot;

namespace {

TEST(SnapshotPublisherTest, EmptyUntilFirstPublish) {
  SnapshotPublisher publisher;
  EXPECT_EQ(publisher.current(), nullptr);
}

TEST(SnapshotPublisherTest, VersionsIncrease) {
  SnapshotPublisher publisher;
  const uint64_t first = publisher.nextVersion();
  const uint64_t second = publisher.nextVersion();
  EXPECT_GT(first, 0u);
  EXPECT_GT(second, first);
}

TEST(SnapshotPublisherTest, ReaderKeepsItsSnapshotAcrossPublish) {
  SnapshotPublisher publisher;
  publisher.publish(makeSnapshot(1, {"A", "B", "C"}));
  const SnapshotPtr held = publisher.current();

  publisher.publish(makeSnapshot(2, {"D"}));

  ASSERT_EQ(held->posters.size(), 3u);
  EXPECT_EQ(held->posters[2].record.id, "C");
  EXPECT_EQ(publisher.current()->version, 2u);
}

TEST(SnapshotPublisherTest, ConcurrentReadersSeeWholeSnapshots) {
  SnapshotPublisher publisher;
  publisher.publish(makeSnapshot(1, {"A", "B"}));
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread reader([&] {
    while (!done.load()) {
      const SnapshotPtr snapshot = publisher.current();
      // Even versions carry three posters, odd ones two.
      const size_t expected = snapshot->version % 2 == 0 ? 3 : 2;
      if (snapshot->posters.size() != expected) {
        ++torn;
      }
    }
  });
  for (uint64_t v = 2; v < 500; ++v) {
    publisher.publish(v % 2 == 0 ? makeSnapshot(v, {"A", "B", "C"}) : makeSnapshot(v, {"A", "B"}));
  }
  done.store(true);
  reader.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(publisher.current()->version, 499u);
}

}  // namespace
