#include "src/libs/result/Logging.h"
#ifdef __PREEMPT_HOST_BOARD
#include <cstdio>
#else
// ROM routine present on every ESP32 family chip
extern "C" int uart_tx_one_char(uint8_t c);
#endif

namespace preempt {
void logImpl(const char* start, const char* end) __attribute__((weak));

void logImpl(const char* start, const char* end) {
#ifdef __PREEMPT_HOST_BOARD
  fwrite(start, sizeof(char), end - start, stdout);
#else
  while (start != end) {
    uart_tx_one_char(uint8_t(*start));
    ++start;
  }
#endif
}

void panicReset() __attribute__((weak));
void panicReset() {
  while (true) {
  }
}
}
