#pragma once
// Host port: tasks are ucontext coroutines and interrupts are
// simulated.  Time is the host monotonic clock plus whatever the idle
// loop skipped ahead.
#include <stdint.h>
#include <ucontext.h>

namespace preempt {
namespace port {

struct Context {
  ucontext_t uc;
  void (*entry)(void*);
  void* param;
};

namespace host {
// Advances simulated time by one tick period and raises the tick
// interrupt.  No-op while the tick timer is stopped.
void fireTick();

// Moves the clock forward without raising any interrupt
void advanceTime(uint64_t micros);

// Runs handler(param) as a peripheral interrupt would, then services
// any switch it requested.  Interrupts must be enabled.
void raiseInterrupt(void (*handler)(void*), void* param);

bool tickRunning();
uint32_t tickPeriodMicros();
}
}
}
