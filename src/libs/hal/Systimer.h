#pragma once
// SYSTIMER: a 52 bit counter unit with three comparators.  The
// scheduler uses unit 0 as its monotonic clock and comparator 0 in
// period mode as the preemption tick.
#include "src/libs/hal/Mmio.h"

namespace preempt {
namespace hal {

namespace systimer {
static constexpr uint32_t kConf = 0x00;
static constexpr uint32_t kUnit0Op = 0x04;
static constexpr uint32_t kTarget0Hi = 0x1C;
static constexpr uint32_t kTarget0Lo = 0x20;
static constexpr uint32_t kTarget0Conf = 0x34;
static constexpr uint32_t kUnit0ValueHi = 0x40;
static constexpr uint32_t kUnit0ValueLo = 0x44;
static constexpr uint32_t kComp0Load = 0x50;
static constexpr uint32_t kIntEna = 0x64;
static constexpr uint32_t kIntRaw = 0x68;
static constexpr uint32_t kIntClr = 0x6C;
static constexpr uint32_t kIntSt = 0x70;

static constexpr uint32_t kConfClkEn = 1u << 31;
static constexpr uint32_t kConfUnit0WorkEn = 1u << 30;
// TARGETn_WORK_EN is bit 24 - n
static constexpr uint32_t kConfTarget0WorkEn = 1u << 24;

static constexpr uint32_t kOpUpdate = 1u << 30;
static constexpr uint32_t kOpValueValid = 1u << 29;

static constexpr uint32_t kTargetConfPeriodMode = 1u << 30;
static constexpr uint32_t kTargetConfUnit1 = 1u << 31;
static constexpr uint32_t kMaxPeriod = (1u << 26) - 1;

static constexpr uint8_t kComparators = 3;
}

template <class Block, uint32_t TicksPerUs = 16>
struct Systimer {
  static constexpr uint32_t ticksPerUs = TicksPerUs;

  static void enableUnit0() {
    setBits<Block>(
        systimer::kConf, systimer::kConfClkEn | systimer::kConfUnit0WorkEn);
  }

  // Latches and reads the current counter value
  static uint64_t unit0Value() {
    setBits<Block>(systimer::kUnit0Op, systimer::kOpUpdate);
    while ((Block::reg(systimer::kUnit0Op) & systimer::kOpValueValid) == 0) {
    }
    uint64_t hi = Block::reg(systimer::kUnit0ValueHi) & 0xfffffu;
    uint64_t lo = Block::reg(systimer::kUnit0ValueLo);
    return (hi << 32) | lo;
  }

  static uint64_t nowMicros() {
    return unit0Value() / TicksPerUs;
  }

  static constexpr uint64_t microsToTicks(uint64_t us) {
    return us * TicksPerUs;
  }

  // Configures comparator to fire every `ticks` unit 0 ticks.
  // Returns false when the period does not fit the comparator.
  static bool setPeriod(uint8_t comparator, uint32_t ticks) {
    if (comparator >= systimer::kComparators || ticks == 0 ||
        ticks > systimer::kMaxPeriod) {
      return false;
    }
    enableComparator(comparator, false);
    Block::reg(confOffset(comparator)) =
        systimer::kTargetConfPeriodMode | ticks;
    Block::reg(systimer::kComp0Load + 4u * comparator) = 1;
    enableComparator(comparator, true);
    return true;
  }

  // Configures comparator to fire once when unit 0 reaches `ticks`
  static bool setTarget(uint8_t comparator, uint64_t ticks) {
    if (comparator >= systimer::kComparators) {
      return false;
    }
    enableComparator(comparator, false);
    Block::reg(confOffset(comparator)) = 0;
    Block::reg(systimer::kTarget0Hi + 8u * comparator) =
        uint32_t(ticks >> 32) & 0xfffffu;
    Block::reg(systimer::kTarget0Lo + 8u * comparator) = uint32_t(ticks);
    Block::reg(systimer::kComp0Load + 4u * comparator) = 1;
    enableComparator(comparator, true);
    return true;
  }

  static void enableComparator(uint8_t comparator, bool enable) {
    const uint32_t bit = systimer::kConfTarget0WorkEn >> comparator;
    if (enable) {
      setBits<Block>(systimer::kConf, bit);
    } else {
      clearBits<Block>(systimer::kConf, bit);
    }
  }

  static void enableInterrupt(uint8_t comparator, bool enable) {
    if (enable) {
      setBits<Block>(systimer::kIntEna, 1u << comparator);
    } else {
      clearBits<Block>(systimer::kIntEna, 1u << comparator);
    }
  }

  static void clearInterrupt(uint8_t comparator) {
    Block::reg(systimer::kIntClr) = 1u << comparator;
  }

  static bool isInterruptSet(uint8_t comparator) {
    return (Block::reg(systimer::kIntSt) & (1u << comparator)) != 0;
  }

 private:
  static constexpr uint32_t confOffset(uint8_t comparator) {
    return systimer::kTarget0Conf + 4u * comparator;
  }
};
}
}
