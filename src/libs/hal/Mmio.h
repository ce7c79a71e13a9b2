#pragma once
// Register block access.  Peripheral drivers are templates over a
// Block type providing reg(offset); MmioBlock maps that onto the
// memory mapped peripheral and TestBlock onto static RAM so that the
// drivers can be exercised on the host.
#include <stddef.h>
#include <stdint.h>

namespace preempt {
namespace hal {

template <uintptr_t Base>
struct MmioBlock {
  static constexpr uintptr_t base = Base;

  static inline volatile uint32_t& reg(uint32_t offset) {
    return *reinterpret_cast<volatile uint32_t*>(Base + offset);
  }
};

// Tag selects a distinct storage instance per simulated peripheral
template <class Tag, size_t Words = 256>
struct TestBlock {
  static volatile uint32_t storage[Words];

  static inline volatile uint32_t& reg(uint32_t offset) {
    return storage[offset / 4];
  }

  static void clear() {
    for (size_t i = 0; i < Words; ++i) {
      storage[i] = 0;
    }
  }
};

template <class Tag, size_t Words>
volatile uint32_t TestBlock<Tag, Words>::storage[Words];

// Read-modify-write helpers
template <class Block>
inline void setBits(uint32_t offset, uint32_t mask) {
  Block::reg(offset) = Block::reg(offset) | mask;
}

template <class Block>
inline void clearBits(uint32_t offset, uint32_t mask) {
  Block::reg(offset) = Block::reg(offset) & ~mask;
}

template <class Block>
inline void writeField(
    uint32_t offset,
    uint32_t shift,
    uint32_t width,
    uint32_t value) {
  const uint32_t mask = ((width >= 32) ? 0xffffffffu : ((1u << width) - 1u))
      << shift;
  Block::reg(offset) = (Block::reg(offset) & ~mask) | ((value << shift) & mask);
}

template <class Block>
inline uint32_t readField(uint32_t offset, uint32_t shift, uint32_t width) {
  const uint32_t mask = (width >= 32) ? 0xffffffffu : ((1u << width) - 1u);
  return (Block::reg(offset) >> shift) & mask;
}
}
}
