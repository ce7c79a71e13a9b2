#pragma once
// Static description of the supported chips.  Exactly one of the
// PREEMPT_CHIP_* macros selects the chip the build targets; the build
// defaults to the host board.
#include <stdint.h>

#if defined(PREEMPT_CHIP_ESP32) + defined(PREEMPT_CHIP_ESP32S2) +    \
        defined(PREEMPT_CHIP_ESP32S3) + defined(PREEMPT_CHIP_ESP32C2) + \
        defined(PREEMPT_CHIP_ESP32C3) + defined(PREEMPT_CHIP_ESP32C6) + \
        defined(PREEMPT_CHIP_ESP32H2) + defined(PREEMPT_CHIP_HOST) >    \
    1
#error "select exactly one PREEMPT_CHIP_* target"
#endif

#if !defined(PREEMPT_CHIP_ESP32) && !defined(PREEMPT_CHIP_ESP32S2) &&   \
    !defined(PREEMPT_CHIP_ESP32S3) && !defined(PREEMPT_CHIP_ESP32C2) && \
    !defined(PREEMPT_CHIP_ESP32C3) && !defined(PREEMPT_CHIP_ESP32C6) && \
    !defined(PREEMPT_CHIP_ESP32H2) && !defined(PREEMPT_CHIP_HOST)
#define PREEMPT_CHIP_HOST 1
#endif

#if defined(PREEMPT_CHIP_ESP32) || defined(PREEMPT_CHIP_ESP32S2) || \
    defined(PREEMPT_CHIP_ESP32S3)
#define PREEMPT_ARCH_XTENSA 1
#elif defined(PREEMPT_CHIP_HOST)
#define PREEMPT_ARCH_HOST 1
#else
#define PREEMPT_ARCH_RISCV 1
#endif

namespace preempt {
namespace chip {

enum class Arch : uint8_t { RiscV, Xtensa, Host };

enum Radio : uint8_t {
  kWifi = 1 << 0,
  kBle = 1 << 1,
  kIeee802154 = 1 << 2,
};

struct ChipInfo {
  const char* name;
  Arch arch;
  uint8_t cores;
  uint8_t timerGroups;
  bool hasSystimer;
  uint8_t radios;

  bool supports(Radio radio) const {
    return (radios & radio) != 0;
  }
};

// All chips known to this build, independent of the selected target
const ChipInfo* chips(uint8_t& count);

// Lookup by name ("esp32c6"); nullptr if unknown
const ChipInfo* findChip(const char* name);

// The chip this build targets
const ChipInfo& current();

// Register bases and interrupt routing for the selected chip.  The
// interrupt source numbers index the interrupt matrix map registers.
#if defined(PREEMPT_CHIP_ESP32C2) || defined(PREEMPT_CHIP_ESP32C3)
static constexpr uint8_t kCores = 1;
static constexpr uintptr_t kSystimerBase = 0x60023000;
static constexpr uintptr_t kFromCpuIntrBase = 0x600C0028;
static constexpr uintptr_t kIntMatrixBase = 0x600C2000;
static constexpr uintptr_t kCpuIntCtrlBase = 0x600C2104;
#if defined(PREEMPT_CHIP_ESP32C2)
static constexpr uint8_t kSystimerTarget0Source = 31;
static constexpr uint8_t kFromCpuIntr0Source = 43;
#else
static constexpr uint8_t kSystimerTarget0Source = 37;
static constexpr uint8_t kFromCpuIntr0Source = 50;
#endif
#elif defined(PREEMPT_CHIP_ESP32C6) || defined(PREEMPT_CHIP_ESP32H2)
static constexpr uint8_t kCores = 1;
static constexpr uintptr_t kSystimerBase = 0x6000A000;
static constexpr uintptr_t kFromCpuIntrBase = 0x600C5094;
static constexpr uintptr_t kIntMatrixBase = 0x60010000;
static constexpr uintptr_t kCpuIntCtrlBase = 0x600C5000;
#if defined(PREEMPT_CHIP_ESP32C6)
static constexpr uint8_t kSystimerTarget0Source = 57;
static constexpr uint8_t kFromCpuIntr0Source = 51;
#else
static constexpr uint8_t kSystimerTarget0Source = 47;
static constexpr uint8_t kFromCpuIntr0Source = 41;
#endif
#elif defined(PREEMPT_CHIP_ESP32)
static constexpr uint8_t kCores = 2;
static constexpr uintptr_t kTimg0Base = 0x3FF5F000;
static constexpr uintptr_t kIntMatrixBase = 0x3FF00104;
static constexpr uint8_t kTimg0T0Source = 14;
// Software1 (priority 3); Software0 is reserved for the Bluetooth stack
static constexpr uint32_t kSoftwareInterruptMask = 1u << 29;
#elif defined(PREEMPT_CHIP_ESP32S2)
static constexpr uint8_t kCores = 1;
static constexpr uintptr_t kTimg0Base = 0x3F41F000;
static constexpr uintptr_t kIntMatrixBase = 0x3F4C2000;
static constexpr uint8_t kTimg0T0Source = 37;
static constexpr uint32_t kSoftwareInterruptMask = 1u << 7;
#elif defined(PREEMPT_CHIP_ESP32S3)
static constexpr uint8_t kCores = 2;
static constexpr uintptr_t kTimg0Base = 0x6001F000;
static constexpr uintptr_t kIntMatrixBase = 0x600C2000;
static constexpr uint8_t kTimg0T0Source = 50;
static constexpr uint32_t kSoftwareInterruptMask = 1u << 7;
#else
static constexpr uint8_t kCores = 1;
#endif

#ifdef PREEMPT_ARCH_RISCV
// SYSTIMER counts at 16 MHz on every RISC-V chip in the family
static constexpr uint32_t kSystimerTicksPerUs = 16;
// CPU interrupt lines used for the tick and the task switch.  Both run
// at the same priority so that the switch never nests.
static constexpr uint8_t kTickCpuInterrupt = 10;
static constexpr uint8_t kSwitchCpuInterrupt = 11;
static constexpr uint8_t kSchedulerInterruptPriority = 1;
// FROM_CPU_INTR2 is reserved for the scheduler
static constexpr uint8_t kSwitchSoftwareInterrupt = 2;
#endif

#ifdef PREEMPT_ARCH_XTENSA
static constexpr uint32_t kApbClockHz = 80000000;
// Level triggered, priority 1 CPU interrupt the timer group alarm is
// routed to
static constexpr uint8_t kTickCpuInterrupt = 1;
#endif
}
}
