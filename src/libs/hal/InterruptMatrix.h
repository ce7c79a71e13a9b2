#pragma once
// Routes peripheral interrupt sources to CPU interrupt lines.
// MapBlock holds one map register per source.  CtrlBlock, present on
// the RISC-V chips, holds the CPU interrupt enable, type, clear and
// priority registers.
#include "src/libs/hal/Mmio.h"

namespace preempt {
namespace hal {

namespace intmatrix {
static constexpr uint32_t kCpuIntEnable = 0x00;
static constexpr uint32_t kCpuIntType = 0x04;
static constexpr uint32_t kCpuIntClear = 0x08;
static constexpr uint32_t kCpuIntEipStatus = 0x0C;
static constexpr uint32_t kCpuIntPri0 = 0x10;

// Writing this line number to a map register disconnects the source
static constexpr uint8_t kDisabledLine = 0;
}

enum class InterruptType : uint8_t { Level, Edge };

template <class MapBlock>
struct InterruptMap {
  static void map(uint8_t source, uint8_t cpuInterrupt) {
    MapBlock::reg(4u * source) = cpuInterrupt;
  }

  static void unmap(uint8_t source) {
    MapBlock::reg(4u * source) = intmatrix::kDisabledLine;
  }

  static uint8_t mappedTo(uint8_t source) {
    return uint8_t(MapBlock::reg(4u * source) & 0x1f);
  }
};

template <class MapBlock, class CtrlBlock>
struct InterruptMatrix : InterruptMap<MapBlock> {
  static void setPriority(uint8_t cpuInterrupt, uint8_t priority) {
    CtrlBlock::reg(intmatrix::kCpuIntPri0 + 4u * cpuInterrupt) = priority;
  }

  static uint8_t priority(uint8_t cpuInterrupt) {
    return uint8_t(
        CtrlBlock::reg(intmatrix::kCpuIntPri0 + 4u * cpuInterrupt) & 0xf);
  }

  static void setType(uint8_t cpuInterrupt, InterruptType type) {
    if (type == InterruptType::Edge) {
      setBits<CtrlBlock>(intmatrix::kCpuIntType, 1u << cpuInterrupt);
    } else {
      clearBits<CtrlBlock>(intmatrix::kCpuIntType, 1u << cpuInterrupt);
    }
  }

  static void enable(uint8_t cpuInterrupt) {
    setBits<CtrlBlock>(intmatrix::kCpuIntEnable, 1u << cpuInterrupt);
  }

  static void disable(uint8_t cpuInterrupt) {
    clearBits<CtrlBlock>(intmatrix::kCpuIntEnable, 1u << cpuInterrupt);
  }

  static bool isEnabled(uint8_t cpuInterrupt) {
    return (CtrlBlock::reg(intmatrix::kCpuIntEnable) &
            (1u << cpuInterrupt)) != 0;
  }

  // Edge triggered lines latch; this clears the latch
  static void clear(uint8_t cpuInterrupt) {
    setBits<CtrlBlock>(intmatrix::kCpuIntClear, 1u << cpuInterrupt);
    clearBits<CtrlBlock>(intmatrix::kCpuIntClear, 1u << cpuInterrupt);
  }

  // Routes source to cpuInterrupt and enables it
  static void bind(
      uint8_t source,
      uint8_t cpuInterrupt,
      uint8_t priority,
      InterruptType type) {
    InterruptMap<MapBlock>::map(source, cpuInterrupt);
    setType(cpuInterrupt, type);
    setPriority(cpuInterrupt, priority);
    enable(cpuInterrupt);
  }
};
}
}
