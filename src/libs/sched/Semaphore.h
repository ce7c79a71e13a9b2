#pragma once
#include <stdint.h>
#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/result/Error.h"

namespace preempt {
namespace sched {

// Semaphore state.  Blocking and waking of tasks is done by the
// scheduler; this only tracks units and ownership.  Owners are opaque
// tokens, normally the TaskControlBlock of the caller.
class Semaphore {
  driver::SemaphoreKind kind_;
  uint32_t count_;
  uint32_t max_;
  const void* owner_;
  uint32_t recursion_;

 public:
  // Mutexes ignore max and initial and start out unlocked
  Semaphore(driver::SemaphoreKind kind, uint32_t max, uint32_t initial);
  Semaphore(const Semaphore&) = delete;

  // Acquires without blocking; false if unavailable
  bool tryTake(const void* taker);

  // Errors: Full when a counting semaphore is already at its maximum,
  // NotOwner when giver does not hold the mutex
  Status give(const void* giver);

  driver::SemaphoreKind kind() const {
    return kind_;
  }

  uint32_t count() const {
    return count_;
  }

  uint32_t max() const {
    return max_;
  }

  const void* owner() const {
    return owner_;
  }

  uint32_t recursion() const {
    return recursion_;
  }
};
}
}
