#pragma once
// Remembers, per core, that a tick interrupt was taken but its task
// switch was handed to a lower priority software interrupt.  The
// software interrupt consumes the flag and runs the switch handler as
// a tick.
#include <stdint.h>

namespace preempt {
namespace port {

template <uint8_t Cores>
class TickLatch {
  volatile bool pending_[Cores];

 public:
  TickLatch() : pending_{} {}

  void post(uint8_t core) {
    pending_[core] = true;
  }

  // True once for every run of posts
  bool take(uint8_t core) {
    if (!pending_[core]) {
      return false;
    }
    pending_[core] = false;
    return true;
  }

  bool pending(uint8_t core) const {
    return pending_[core];
  }
};
}
}
