#pragma once
// Timer group (TIMG) timer 0.  On Xtensa chips the scheduler uses it
// both as the monotonic clock (free running, divided down to 1 MHz) and
// as the preemption tick (alarm re-armed on every tick).
#include "src/libs/hal/Mmio.h"
#include "src/libs/result/Error.h"

namespace preempt {
namespace hal {

namespace timg {
static constexpr uint32_t kT0Config = 0x00;
static constexpr uint32_t kT0Lo = 0x04;
static constexpr uint32_t kT0Hi = 0x08;
static constexpr uint32_t kT0Update = 0x0C;
static constexpr uint32_t kT0AlarmLo = 0x10;
static constexpr uint32_t kT0AlarmHi = 0x14;
static constexpr uint32_t kT0LoadLo = 0x18;
static constexpr uint32_t kT0LoadHi = 0x1C;
static constexpr uint32_t kT0Load = 0x20;

static constexpr uint32_t kConfigEnable = 1u << 31;
static constexpr uint32_t kConfigIncrease = 1u << 30;
static constexpr uint32_t kConfigAutoReload = 1u << 29;
static constexpr uint32_t kConfigDividerShift = 13;
static constexpr uint32_t kConfigDividerWidth = 16;
static constexpr uint32_t kConfigLevelIntEn = 1u << 11;
static constexpr uint32_t kConfigAlarmEn = 1u << 10;

static constexpr uint32_t kUpdateBit = 1u << 31;

// The counter is 54 bits wide
static constexpr uint64_t kCounterMask = 0x3FFFFFFFFFFFFFull;
}

// ESP32: interrupt status lives at 0x98.., int_ena is ineffective so the
// level interrupt enable bit in the config register is used, and the
// update register does not self clear.
struct Esp32TimgLayout {
  static constexpr uint32_t kIntEna = 0x98;
  static constexpr uint32_t kIntRaw = 0x9C;
  static constexpr uint32_t kIntSt = 0xA0;
  static constexpr uint32_t kIntClr = 0xA4;
  static constexpr bool kUseLevelIntEnable = true;
  static constexpr bool kUpdateSelfClears = false;
};

struct Esp32S2TimgLayout {
  static constexpr uint32_t kIntEna = 0x70;
  static constexpr uint32_t kIntRaw = 0x74;
  static constexpr uint32_t kIntSt = 0x78;
  static constexpr uint32_t kIntClr = 0x7C;
  static constexpr bool kUseLevelIntEnable = true;
  static constexpr bool kUpdateSelfClears = true;
};

struct Esp32S3TimgLayout {
  static constexpr uint32_t kIntEna = 0x70;
  static constexpr uint32_t kIntRaw = 0x74;
  static constexpr uint32_t kIntSt = 0x78;
  static constexpr uint32_t kIntClr = 0x7C;
  static constexpr bool kUseLevelIntEnable = false;
  static constexpr bool kUpdateSelfClears = true;
};

// Converts a prescaler register value to the effective divisor
inline uint32_t dividerFromField(uint32_t field) {
  switch (field) {
    case 0:
      return 65536;
    case 1:
    case 2:
      return 2;
    default:
      return field;
  }
}

// Microseconds to counter ticks; fails when the result would not fit
// the 54 bit counter
inline Result<uint64_t, Error>
timeoutToTicks(uint64_t micros, uint32_t clockHz, uint32_t divider) {
  const uint64_t ticksPerSec = clockHz / divider;
  if (ticksPerSec != 0 && micros > ~uint64_t(0) / ticksPerSec) {
    return Result<uint64_t, Error>::Error(Error::InvalidArgument);
  }
  const uint64_t ticks = micros * ticksPerSec / 1000000u;
  if ((ticks & ~timg::kCounterMask) != 0) {
    return Result<uint64_t, Error>::Error(Error::InvalidArgument);
  }
  return Result<uint64_t, Error>::Ok(ticks);
}

// Counter ticks to microseconds.  Exact for the whole 54 bit range:
// whole seconds and the remainder are scaled separately.
inline uint64_t
ticksToTimeout(uint64_t ticks, uint32_t clockHz, uint32_t divider) {
  const uint64_t ticksPerSec = clockHz / divider;
  const uint64_t seconds = ticks / ticksPerSec;
  const uint64_t rest = ticks % ticksPerSec;
  return seconds * 1000000u + rest * 1000000u / ticksPerSec;
}

template <class Block, class Layout, uint32_t ClockHz = 80000000>
struct TimerGroup {
  static constexpr uint32_t clockHz = ClockHz;

  static void setDivider(uint32_t divider) {
    writeField<Block>(
        timg::kT0Config,
        timg::kConfigDividerShift,
        timg::kConfigDividerWidth,
        divider == 65536 ? 0 : divider);
  }

  static uint32_t divider() {
    return dividerFromField(readField<Block>(
        timg::kT0Config,
        timg::kConfigDividerShift,
        timg::kConfigDividerWidth));
  }

  // Free running up counter starting at zero
  static void startCounter(uint32_t divider) {
    clearBits<Block>(timg::kT0Config, timg::kConfigEnable);
    setDivider(divider);
    setBits<Block>(timg::kT0Config, timg::kConfigIncrease);
    clearBits<Block>(timg::kT0Config, timg::kConfigAutoReload);
    Block::reg(timg::kT0LoadLo) = 0;
    Block::reg(timg::kT0LoadHi) = 0;
    Block::reg(timg::kT0Load) = 1;
    setBits<Block>(timg::kT0Config, timg::kConfigEnable);
  }

  static void stopCounter() {
    clearBits<Block>(timg::kT0Config, timg::kConfigEnable);
  }

  static bool isRunning() {
    return (Block::reg(timg::kT0Config) & timg::kConfigEnable) != 0;
  }

  static uint64_t counter() {
    Block::reg(timg::kT0Update) = timg::kUpdateBit;
    if (Layout::kUpdateSelfClears) {
      while ((Block::reg(timg::kT0Update) & timg::kUpdateBit) != 0) {
      }
    }
    uint64_t lo = Block::reg(timg::kT0Lo);
    uint64_t hi = Block::reg(timg::kT0Hi);
    return (hi << 32) | lo;
  }

  static uint64_t nowMicros() {
    return ticksToTimeout(counter(), ClockHz, divider());
  }

  // Programs an absolute alarm, in counter ticks, and arms it
  static Status setAlarm(uint64_t ticks) {
    if ((ticks & ~timg::kCounterMask) != 0) {
      return failed(Error::InvalidArgument);
    }
    Block::reg(timg::kT0AlarmLo) = uint32_t(ticks);
    Block::reg(timg::kT0AlarmHi) = uint32_t(ticks >> 32);
    setBits<Block>(timg::kT0Config, timg::kConfigAlarmEn);
    return ok();
  }

  // Programs an alarm `micros` after the current counter value
  static Status setAlarmIn(uint64_t micros) {
    auto ticks = timeoutToTicks(micros, ClockHz, divider());
    if (ticks.hasError()) {
      return failed(ticks.error());
    }
    return setAlarm((counter() + ticks.value()) & timg::kCounterMask);
  }

  static void enableInterrupt(bool enable) {
    if (Layout::kUseLevelIntEnable) {
      if (enable) {
        setBits<Block>(timg::kT0Config, timg::kConfigLevelIntEn);
      } else {
        clearBits<Block>(timg::kT0Config, timg::kConfigLevelIntEn);
      }
    }
    if (enable) {
      setBits<Block>(Layout::kIntEna, 1u);
    } else {
      clearBits<Block>(Layout::kIntEna, 1u);
    }
  }

  static void clearInterrupt() {
    Block::reg(Layout::kIntClr) = 1u;
  }

  static bool isInterruptSet() {
    return (Block::reg(Layout::kIntRaw) & 1u) != 0;
  }
};
}
}
