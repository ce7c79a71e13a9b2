#pragma once
// The architecture port: everything the scheduler needs from the CPU
// and the timer hardware.  Exactly one implementation is compiled in,
// chosen by the selected chip.
#include <stddef.h>
#include <stdint.h>
#include "src/libs/chip/Chip.h"

#if defined(PREEMPT_ARCH_RISCV)
#include "src/libs/port/riscv/Context.h"
#elif defined(PREEMPT_ARCH_XTENSA)
#include "src/libs/port/xtensa/Context.h"
#else
#include "src/libs/port/host/Context.h"
#endif

namespace preempt {
namespace port {

using EntryFn = void (*)(void*);

// Opaque saved interrupt enable state
using InterruptState = uint32_t;

// Called with interrupts masked, from the task switch interrupt or the
// tick interrupt (tick == true).  It decides which task runs next and
// calls switchContext().
using SwitchHandler = void (*)(bool tick);

// Masks interrupts on the current core, returning the prior state
InterruptState disableInterrupts();
void restoreInterrupts(InterruptState state);

uint8_t currentCore();

// Prepares ctx so that the first switch to it calls entry(param) on
// the stack [stackBottom, stackBottom + stackSize).  entry must not
// return.
void initTaskContext(
    Context& ctx,
    EntryFn entry,
    void* param,
    void* stackBottom,
    size_t stackSize);

// Only valid from the switch handler.  Arranges for `to` to run when
// the handler returns, saving the interrupted state into `from`.
// Returns false if a switch is already in flight.
bool switchContext(Context& from, Context& to);

// Asks for the switch handler to run as soon as interrupts allow
void requestYield();

void installSwitchHandler(SwitchHandler handler);

// Enables the task switch interrupt on the current core
void setupMultitasking();
void disableMultitasking();

void startTickTimer(uint32_t hz);
void stopTickTimer();
void clearTickInterrupt();

// Monotonic microseconds since boot
uint64_t nowMicros();

void waitForInterrupt();

// True while executing in interrupt context
bool inInterrupt();
}
}
