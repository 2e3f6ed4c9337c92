#pragma once

#include <cstdint>

namespace boot {

struct BaselineState {
  unsigned long bootStartMs = 0;
  unsigned long lastLoopLogMs = 0;
};

void start(BaselineState& state);
void mark(BaselineState& state, const char* stage, bool enabled);
void markLoop(BaselineState& state, uint64_t snapshotVersion, const char* modeName, bool enabled,
              unsigned long periodMs);

}  // namespace boot
