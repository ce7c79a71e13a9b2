#pragma once
// FROM_CPU_INTR software interrupts on the RISC-V chips.  Writing 1 to
// the line's register asserts the interrupt; writing 0 deasserts it.
#include "src/libs/hal/Mmio.h"

namespace preempt {
namespace hal {

template <class Block, uint8_t Num>
struct SoftwareInterrupt {
  static_assert(Num < 4, "FROM_CPU_INTR lines are numbered 0..3");

  static constexpr uint8_t number = Num;
  static constexpr uint32_t offset = 4u * Num;

  static inline void raise() {
    Block::reg(offset) = 1u;
  }

  static inline void reset() {
    Block::reg(offset) = 0u;
  }

  static inline bool isRaised() {
    return (Block::reg(offset) & 1u) != 0;
  }
};
}
}
