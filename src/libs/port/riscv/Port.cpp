#include <string.h>
#include "src/libs/hal/Cpu.h"
#include "src/libs/hal/InterruptMatrix.h"
#include "src/libs/hal/SoftwareInterrupt.h"
#include "src/libs/hal/Systimer.h"
#include "src/libs/port/Port.h"
#include "src/libs/result/Logging.h"
#include "src/libs/traits/Traits.h"

// Shared with switch.S
extern "C" {
preempt::port::Context* volatile preempt_current_ctx = nullptr;
preempt::port::Context* volatile preempt_next_ctx = nullptr;
void preempt_sys_switch();
}

namespace preempt {
namespace port {

namespace {
using SwitchLine = hal::SoftwareInterrupt<
    hal::MmioBlock<chip::kFromCpuIntrBase>,
    chip::kSwitchSoftwareInterrupt>;
using TickTimer =
    hal::Systimer<hal::MmioBlock<chip::kSystimerBase>, chip::kSystimerTicksPerUs>;
using Matrix = hal::InterruptMatrix<
    hal::MmioBlock<chip::kIntMatrixBase>,
    hal::MmioBlock<chip::kCpuIntCtrlBase>>;

constexpr uint8_t kTickComparator = 0;
constexpr uint8_t kSwitchSource =
    chip::kFromCpuIntr0Source + chip::kSwitchSoftwareInterrupt;

SwitchHandler switchHandler = nullptr;
volatile uint32_t isrDepth = 0;

void runHandler(bool tick) {
  ++isrDepth;
  if (switchHandler) {
    switchHandler(tick);
  }
  --isrDepth;
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
  ctx.pc = uint32_t(reinterpret_cast<uintptr_t>(entry));
  ctx.a0 = uint32_t(reinterpret_cast<uintptr_t>(param));
  ctx.sp = uint32_t(top);
  ctx.gp = hal::cpu::readGp();
}

bool switchContext(Context& from, Context& to) {
  // A tick that arrived while the software interrupt was being served
  // is taken before mret reaches preempt_sys_switch; refuse it.
  if (preempt_next_ctx != nullptr) {
    return false;
  }

  preempt_current_ctx = &from;
  preempt_next_ctx = &to;

  from.pc = hal::cpu::readMepc();

  // mret restores MIE from MPIE, so the incoming task resumes with
  // interrupts enabled while preempt_sys_switch itself runs masked.
  const uint32_t mstatus = hal::cpu::readMstatus();
  to.mstatus = mstatus;
  hal::cpu::writeMstatus(mstatus & ~hal::cpu::kMstatusMpie);
  hal::cpu::writeMepc(
      uint32_t(reinterpret_cast<uintptr_t>(&preempt_sys_switch)));
  return true;
}

void requestYield() {
  SwitchLine::raise();
}

void installSwitchHandler(SwitchHandler handler) {
  switchHandler = handler;
}

void setupMultitasking() {
  SwitchLine::reset();
  Matrix::bind(
      kSwitchSource,
      chip::kSwitchCpuInterrupt,
      chip::kSchedulerInterruptPriority,
      hal::InterruptType::Level);
}

void disableMultitasking() {
  Matrix::disable(chip::kSwitchCpuInterrupt);
  Matrix::unmap(kSwitchSource);
  SwitchLine::reset();
}

void startTickTimer(uint32_t hz) {
  const uint64_t ticks = TickTimer::microsToTicks(1000000u) / hz;
  TickTimer::enableUnit0();
  if (!TickTimer::setPeriod(kTickComparator, uint32_t(ticks))) {
    panic("tick rate ", hz, " out of range for SYSTIMER");
  }
  TickTimer::clearInterrupt(kTickComparator);
  TickTimer::enableInterrupt(kTickComparator, true);
  Matrix::bind(
      chip::kSystimerTarget0Source,
      chip::kTickCpuInterrupt,
      chip::kSchedulerInterruptPriority,
      hal::InterruptType::Level);
}

void stopTickTimer() {
  TickTimer::enableInterrupt(kTickComparator, false);
  TickTimer::enableComparator(kTickComparator, false);
  Matrix::disable(chip::kTickCpuInterrupt);
  Matrix::unmap(chip::kSystimerTarget0Source);
  clearTickInterrupt();
}

void clearTickInterrupt() {
  TickTimer::clearInterrupt(kTickComparator);
}

uint64_t nowMicros() {
  return TickTimer::nowMicros();
}

void waitForInterrupt() {
  hal::cpu::waitForInterrupt();
}

bool inInterrupt() {
  return isrDepth != 0;
}
}
}

// Entry points called by the interrupt dispatcher.  Both lines run at
// the same priority so a switch never nests inside another.
extern "C" void FROM_CPU_INTR2() {
  preempt::port::SwitchLine::reset();
  preempt::port::runHandler(false);
}

extern "C" void SYSTIMER_TARGET0() {
  preempt::port::clearTickInterrupt();
  preempt::port::runHandler(true);
}
