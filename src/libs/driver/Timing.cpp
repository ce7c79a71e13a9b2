#include "src/libs/driver/Timing.h"
#include "src/libs/driver/SchedulerDriver.h"

namespace preempt {

uint32_t millisecondsToMicros(uint32_t ms) {
  if (ms >= driver::kForever / 1000u) {
    return driver::kForever;
  }
  return ms * 1000u;
}

void delayMilliseconds(uint32_t ms) {
  if (ms == kInfiniteMs) {
    while (true) {
      driver::usleep(driver::kForever);
    }
  }
  // usleep takes 32 bits of microseconds; go in whole seconds
  while (ms > 1000u) {
    driver::usleep(1000000u);
    ms -= 1000u;
  }
  driver::usleep(ms * 1000u);
}
}
