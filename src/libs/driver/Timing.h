#pragma once
#include <stdint.h>
#include "src/libs/config/PreemptConfig.h"

namespace preempt {

static constexpr uint32_t kInfiniteMs = 0xffffffffu;
static constexpr uint32_t kTickPeriodUs =
    1000000u / PREEMPT_CONFIG_TICK_RATE_HZ;

// Saturates at driver::kForever
uint32_t millisecondsToMicros(uint32_t ms);

// Sleeps the calling task through the registered driver.
// kInfiniteMs never returns.
void delayMilliseconds(uint32_t ms);
}
