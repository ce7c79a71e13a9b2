#include <string.h>
#include <time.h>
#include "src/libs/port/Port.h"
#include "src/libs/result/Logging.h"

namespace preempt {
namespace port {

namespace {
enum Pending : uint32_t {
  kYieldPending = 1,
  kTickPending = 2,
};

volatile bool masked = false;
volatile bool inIsr = false;
volatile uint32_t pending = 0;
bool multitasking = false;
SwitchHandler switchHandler = nullptr;
uint32_t tickPeriod = 0;
uint64_t skipped = 0;

// The context being entered for the first time
Context* starting = nullptr;

uint64_t monotonicMicros() {
  timespec ts;
  if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    panic("clock_gettime failed");
  }
  return uint64_t(ts.tv_sec) * 1000000u + uint64_t(ts.tv_nsec) / 1000u;
}

const uint64_t bootMicros = monotonicMicros();

// Marks the simulated CPU as servicing an interrupt for its lifetime
struct InterruptFrame {
  InterruptFrame() {
    masked = true;
    inIsr = true;
  }
  ~InterruptFrame() {
    inIsr = false;
    masked = false;
  }
};

// Services pending interrupts as a real core would when unmasked
void dispatch() {
  while (!masked && !inIsr && pending != 0) {
    const uint32_t which = pending;
    pending = 0;
    InterruptFrame frame;
    if (switchHandler) {
      if (which & kTickPending) {
        switchHandler(true);
      } else {
        switchHandler(false);
      }
    }
  }
}

void taskStart() {
  Context* ctx = starting;
  starting = nullptr;
  // Mirror the return from the switch interrupt that got us here
  inIsr = false;
  masked = false;
  dispatch();
  ctx->entry(ctx->param);
  panic("task entry returned");
}
}

InterruptState disableInterrupts() {
  const InterruptState prior = masked ? 1 : 0;
  masked = true;
  return prior;
}

void restoreInterrupts(InterruptState state) {
  masked = state != 0;
  dispatch();
}

uint8_t currentCore() {
  return 0;
}

void initTaskContext(
    Context& ctx,
    EntryFn entry,
    void* param,
    void* stackBottom,
    size_t stackSize) {
  memset(&ctx, 0, sizeof(ctx));
  if (getcontext(&ctx.uc) != 0) {
    panic("getcontext failed");
  }
  ctx.uc.uc_stack.ss_sp = stackBottom;
  ctx.uc.uc_stack.ss_size = stackSize;
  ctx.uc.uc_link = nullptr;
  ctx.entry = entry;
  ctx.param = param;
  makecontext(&ctx.uc, taskStart, 0);
}

bool switchContext(Context& from, Context& to) {
  if (!inIsr) {
    return false;
  }
  starting = &to;
  if (swapcontext(&from.uc, &to.uc) != 0) {
    panic("swapcontext failed");
  }
  return true;
}

void requestYield() {
  if (!multitasking) {
    return;
  }
  pending = pending | kYieldPending;
  dispatch();
}

void installSwitchHandler(SwitchHandler handler) {
  switchHandler = handler;
}

void setupMultitasking() {
  multitasking = true;
}

void disableMultitasking() {
  multitasking = false;
  pending = pending & ~uint32_t(kYieldPending);
}

void startTickTimer(uint32_t hz) {
  if (hz == 0 || hz > 1000000u) {
    panic("unsupported tick rate ", hz);
  }
  tickPeriod = 1000000u / hz;
}

void stopTickTimer() {
  tickPeriod = 0;
  clearTickInterrupt();
}

void clearTickInterrupt() {
  pending = pending & ~uint32_t(kTickPending);
}

uint64_t nowMicros() {
  return monotonicMicros() - bootMicros + skipped;
}

void waitForInterrupt() {
  if (tickPeriod == 0) {
    // Nothing would ever wake us
    panic("waitForInterrupt with the tick stopped");
  }
  host::fireTick();
}

bool inInterrupt() {
  return inIsr;
}

namespace host {
void fireTick() {
  if (tickPeriod == 0) {
    return;
  }
  skipped += tickPeriod;
  pending = pending | kTickPending;
  dispatch();
}

void raiseInterrupt(void (*handler)(void*), void* param) {
  if (masked || inIsr) {
    panic("interrupt raised while interrupts are masked");
  }
  {
    InterruptFrame frame;
    handler(param);
  }
  dispatch();
}

void advanceTime(uint64_t micros) {
  skipped += micros;
}

bool tickRunning() {
  return tickPeriod != 0;
}

uint32_t tickPeriodMicros() {
  return tickPeriod;
}
}
}
}
