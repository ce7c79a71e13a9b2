#include <string.h>
#include "src/libs/hal/Cpu.h"
#include "src/libs/hal/InterruptMatrix.h"
#include "src/libs/hal/TimerGroup.h"
#include "src/libs/port/Port.h"
#include "src/libs/port/TickLatch.h"
#include "src/libs/result/Logging.h"
#include "src/libs/traits/Traits.h"

namespace preempt {
namespace port {

namespace {
#if defined(PREEMPT_CHIP_ESP32)
using TimgLayout = hal::Esp32TimgLayout;
#elif defined(PREEMPT_CHIP_ESP32S2)
using TimgLayout = hal::Esp32S2TimgLayout;
#else
using TimgLayout = hal::Esp32S3TimgLayout;
#endif

using TickTimer = hal::
    TimerGroup<hal::MmioBlock<chip::kTimg0Base>, TimgLayout, chip::kApbClockHz>;
using Map = hal::InterruptMap<hal::MmioBlock<chip::kIntMatrixBase>>;

// APB / 80 gives a 1 MHz counter
constexpr uint32_t kTimerDivider = chip::kApbClockHz / 1000000u;

// Level 2 CPU interrupt lines (19, 20, 21)
constexpr uint32_t kLevel2Mask = 0x00380000;

SwitchHandler switchHandler = nullptr;
uint64_t tickPeriod = 0;

// Trap frame of the interrupt currently being served, per core
TrapFrame* volatile activeFrame[chip::kCores];
volatile uint32_t isrDepth[chip::kCores];

// Ticks whose switch was deferred to the software interrupt
TickLatch<chip::kCores> deferredTicks;

void ensureCounter() {
  if (!TickTimer::isRunning()) {
    TickTimer::startCounter(kTimerDivider);
  }
}

void runHandler(TrapFrame* frame, bool tick) {
  const uint8_t core = hal::cpu::coreId();
  TrapFrame* const outer = activeFrame[core];
  activeFrame[core] = frame;
  ++isrDepth[core];
  if (switchHandler) {
    switchHandler(tick);
  }
  --isrDepth[core];
  activeFrame[core] = outer;
}

#ifdef PREEMPT_CHIP_ESP32
void deferTick() {
  deferredTicks.post(hal::cpu::coreId());
  requestYield();
}
#endif

void runSwitchInterrupt(TrapFrame* frame) {
  runHandler(frame, deferredTicks.take(hal::cpu::coreId()));
}
}

InterruptState disableInterrupts() {
  return hal::cpu::disableInterrupts();
}

void restoreInterrupts(InterruptState state) {
  hal::cpu::restoreInterrupts(state);
}

uint8_t currentCore() {
  return hal::cpu::coreId();
}

void initTaskContext(
    Context& ctx,
    EntryFn entry,
    void* param,
    void* stackBottom,
    size_t stackSize) {
  memset(&ctx, 0, sizeof(ctx));
  const uintptr_t top =
      alignDown(reinterpret_cast<uintptr_t>(stackBottom) + stackSize, 16);
  ctx.PC = uint32_t(reinterpret_cast<uintptr_t>(entry));
  ctx.A0 = 0;
  ctx.A1 = uint32_t(top);
  ctx.A6 = uint32_t(reinterpret_cast<uintptr_t>(param));
  ctx.PS = kPsWoe | kPsCallInc1;
}

bool switchContext(Context& from, Context& to) {
  TrapFrame* frame = activeFrame[hal::cpu::coreId()];
  if (frame == nullptr) {
    return false;
  }
  from = *frame;
  *frame = to;
  return true;
}

void requestYield() {
  hal::cpu::setSoftwareInterrupt(chip::kSoftwareInterruptMask);
}

void installSwitchHandler(SwitchHandler handler) {
  switchHandler = handler;
}

void setupMultitasking() {
  hal::cpu::enableInterruptMask(chip::kSoftwareInterruptMask | kLevel2Mask);
}

void disableMultitasking() {
  hal::cpu::disableInterruptMask(chip::kSoftwareInterruptMask);
}

void startTickTimer(uint32_t hz) {
  if (hz == 0) {
    panic("tick rate must not be zero");
  }
  tickPeriod = 1000000u / hz;
  ensureCounter();
  TickTimer::clearInterrupt();
  TickTimer::setAlarmIn(tickPeriod).panicIfError();
  TickTimer::enableInterrupt(true);
  Map::map(chip::kTimg0T0Source, chip::kTickCpuInterrupt);
  hal::cpu::enableInterruptMask(1u << chip::kTickCpuInterrupt);
}

void stopTickTimer() {
  hal::cpu::disableInterruptMask(1u << chip::kTickCpuInterrupt);
  TickTimer::enableInterrupt(false);
  Map::unmap(chip::kTimg0T0Source);
  TickTimer::clearInterrupt();
  tickPeriod = 0;
}

// The alarm disarms itself when it fires; re-arm it for the next tick
void clearTickInterrupt() {
  TickTimer::clearInterrupt();
  if (tickPeriod != 0) {
    TickTimer::setAlarmIn(tickPeriod).panicIfError();
  }
}

uint64_t nowMicros() {
  ensureCounter();
  return TickTimer::nowMicros();
}

void waitForInterrupt() {
  hal::cpu::waitForInterrupt();
}

bool inInterrupt() {
  return isrDepth[hal::cpu::coreId()] != 0;
}
}
}

extern "C" {

// Level 1 handler for the TIMG0 alarm, called by the interrupt
// dispatcher with the interrupted task's frame
void preempt_timer_tick_handler(preempt::port::TrapFrame* frame) {
  preempt::port::clearTickInterrupt();
#ifdef PREEMPT_CHIP_ESP32
  // The tick runs at priority 1 but task switches must all happen at
  // the software interrupt's priority 3
  (void)frame;
  preempt::port::deferTick();
#else
  preempt::port::runHandler(frame, true);
#endif
}

#ifdef PREEMPT_CHIP_ESP32
// Software0 is reserved for the Bluetooth stack on ESP32
void Software1(preempt::port::TrapFrame* frame) {
#else
void Software0(preempt::port::TrapFrame* frame) {
#endif
  preempt::hal::cpu::clearSoftwareInterrupt(
      preempt::chip::kSoftwareInterruptMask);
  preempt::port::runSwitchInterrupt(frame);
}
}
