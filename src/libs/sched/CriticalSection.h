#pragma once
#include "src/libs/chip/Chip.h"
#include "src/libs/port/Port.h"

namespace preempt {

namespace detail {
// Cross core lock taken by CriticalSection on multi core chips.
// Re-entrant for the owning core.  Owners are core number + 1.
struct CoreLock {
  uint32_t owner;
  uint32_t depth;

  bool tryAcquire(uint32_t self) {
    if (__atomic_load_n(&owner, __ATOMIC_ACQUIRE) == self) {
      ++depth;
      return true;
    }
    uint32_t expected = 0;
    if (!__atomic_compare_exchange_n(
            &owner,
            &expected,
            self,
            false,
            __ATOMIC_ACQUIRE,
            __ATOMIC_RELAXED)) {
      return false;
    }
    depth = 1;
    return true;
  }

  void acquire(uint32_t self) {
    while (!tryAcquire(self)) {
    }
  }

  void release() {
    if (--depth == 0) {
      __atomic_store_n(&owner, 0, __ATOMIC_RELEASE);
    }
  }
};

inline CoreLock& coreLock() {
  static CoreLock lock{0, 0};
  return lock;
}

inline void acquireCoreLock() {
  if (chip::kCores < 2) {
    return;
  }
  coreLock().acquire(uint32_t(port::currentCore()) + 1);
}

inline void releaseCoreLock() {
  if (chip::kCores < 2) {
    return;
  }
  coreLock().release();
}

// Holds the cross core lock without touching the interrupt mask; for
// code that already runs with interrupts masked
class CoreLockGuard {
 public:
  CoreLockGuard() {
    acquireCoreLock();
  }
  ~CoreLockGuard() {
    releaseCoreLock();
  }

  CoreLockGuard(const CoreLockGuard&) = delete;
  CoreLockGuard(CoreLockGuard&&) = delete;
};

struct SwitchSuspension {
  uint32_t depth;
  bool deferred;
};

inline SwitchSuspension& switchSuspension() {
  static SwitchSuspension suspension{0, false};
  return suspension;
}
}

// A CriticalSection masks interrupts on the current core while it is
// in scope and, on multi core chips, excludes the other cores.
// CriticalSections nest; each restores the state it saved.
// Blocking scheduler calls must not be made while one is held.
// Unmasking may run a switch that was requested meanwhile, and on the
// host a panic in that switch is thrown from the destructor.
class CriticalSection {
  port::InterruptState state_;

 public:
  CriticalSection() : state_(port::disableInterrupts()) {
    detail::acquireCoreLock();
  }
  ~CriticalSection() noexcept(false) {
    detail::releaseCoreLock();
    port::restoreInterrupts(state_);
  }

  CriticalSection(const CriticalSection&) = delete;
  CriticalSection(CriticalSection&&) = delete;
};

// While an instance of SuspendSwitching is in scope the scheduler will
// not switch away from the current task.  Interrupts are still
// enabled!  A switch requested in the meantime happens when the
// outermost instance goes out of scope.
class SuspendSwitching {
 public:
  SuspendSwitching() {
    CriticalSection cs;
    ++detail::switchSuspension().depth;
  }
  ~SuspendSwitching() noexcept(false) {
    bool yield = false;
    {
      CriticalSection cs;
      auto& suspension = detail::switchSuspension();
      if (--suspension.depth == 0 && suspension.deferred) {
        suspension.deferred = false;
        yield = true;
      }
    }
    if (yield) {
      port::requestYield();
    }
  }

  SuspendSwitching(const SuspendSwitching&) = delete;
  SuspendSwitching(SuspendSwitching&&) = delete;

  // Used by the switch handler: true, and the switch is remembered,
  // when switching is currently suspended
  static bool deferIfSuspended() {
    auto& suspension = detail::switchSuspension();
    if (suspension.depth == 0) {
      return false;
    }
    suspension.deferred = true;
    return true;
  }
};
}
