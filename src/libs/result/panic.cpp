#include "src/libs/result/Logging.h"
#ifdef __EXCEPTIONS
#include <stdexcept>
#endif

namespace preempt {

[[noreturn]] void panicImpl() __attribute__((weak));
[[noreturn]] void panicImpl() {
#ifdef __EXCEPTIONS
  throw std::runtime_error("panicked");
#endif
  panicReset();
  while (true) {
  }
}
}
