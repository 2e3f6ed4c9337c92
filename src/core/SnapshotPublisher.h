#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

#include "PosterTypes.h"

// Single-writer handle to the current poster list. The refresh thread builds
// a complete snapshot and swaps it in; the render loop takes a reference per
// frame and never sees a partial list.
class SnapshotPublisher {
 public:
  void publish(SnapshotPtr snapshot) { std::atomic_store(&current_, std::move(snapshot)); }
  SnapshotPtr current() const { return std::atomic_load(&current_); }
  uint64_t nextVersion() { return ++version_; }

 private:
  SnapshotPtr current_;
  std::atomic<uint64_t> version_{0};
};
