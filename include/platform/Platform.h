#pragma once

#include <cstdint>

namespace platform {

uint32_t millisMs();
void sleepMs(uint32_t ms);

void logi(const char* tag, const char* fmt, ...);
void logw(const char* tag, const char* fmt, ...);
void loge(const char* tag, const char* fmt, ...);

uint32_t residentBytes();
uint32_t peakResidentBytes();

}  // namespace platform
