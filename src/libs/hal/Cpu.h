#pragma once
// CPU core primitives: interrupt masking, core identification and
// special register access.  Only meaningful on the target
// architectures; the host port simulates these.
#include <stdint.h>
#include "src/libs/chip/Chip.h"

namespace preempt {
namespace hal {
namespace cpu {

#ifdef PREEMPT_ARCH_RISCV
static constexpr uint32_t kMstatusMie = 1u << 3;
static constexpr uint32_t kMstatusMpie = 1u << 7;

// Clears MIE, returning the previous mstatus
inline uint32_t disableInterrupts() {
  uint32_t previous;
  __asm__ volatile("csrrci %0, mstatus, 8" : "=r"(previous)::"memory");
  return previous;
}

inline void restoreInterrupts(uint32_t previous) {
  if (previous & kMstatusMie) {
    __asm__ volatile("csrsi mstatus, 8" ::: "memory");
  }
}

inline uint32_t readMstatus() {
  uint32_t value;
  __asm__ volatile("csrr %0, mstatus" : "=r"(value));
  return value;
}

inline void writeMstatus(uint32_t value) {
  __asm__ volatile("csrw mstatus, %0" ::"r"(value) : "memory");
}

inline uint32_t readMepc() {
  uint32_t value;
  __asm__ volatile("csrr %0, mepc" : "=r"(value));
  return value;
}

inline void writeMepc(uint32_t value) {
  __asm__ volatile("csrw mepc, %0" ::"r"(value) : "memory");
}

inline uint32_t readGp() {
  uint32_t value;
  __asm__ volatile("mv %0, gp" : "=r"(value));
  return value;
}

inline uint8_t coreId() {
  uint32_t hart;
  __asm__ volatile("csrr %0, mhartid" : "=r"(hart));
  return uint8_t(hart);
}

inline void waitForInterrupt() {
  __asm__ volatile("wfi");
}
#endif

#ifdef PREEMPT_ARCH_XTENSA
// PS.INTLEVEL masked while a critical section is held; covers the
// level 3 task switch interrupt.
static constexpr uint32_t kCriticalIntLevel = 3;

inline uint32_t disableInterrupts() {
  uint32_t previous;
  __asm__ volatile("rsil %0, 3" : "=a"(previous)::"memory");
  return previous;
}

inline void restoreInterrupts(uint32_t previous) {
  __asm__ volatile("wsr.ps %0\n\trsync" ::"a"(previous) : "memory");
}

inline uint32_t readIntEnable() {
  uint32_t value;
  __asm__ volatile("rsr.intenable %0" : "=a"(value));
  return value;
}

inline void writeIntEnable(uint32_t value) {
  __asm__ volatile("wsr.intenable %0\n\trsync" ::"a"(value) : "memory");
}

inline void enableInterruptMask(uint32_t mask) {
  uint32_t ps = disableInterrupts();
  writeIntEnable(readIntEnable() | mask);
  restoreInterrupts(ps);
}

inline void disableInterruptMask(uint32_t mask) {
  uint32_t ps = disableInterrupts();
  writeIntEnable(readIntEnable() & ~mask);
  restoreInterrupts(ps);
}

inline void setSoftwareInterrupt(uint32_t mask) {
  __asm__ volatile("wsr.intset %0\n\trsync" ::"a"(mask) : "memory");
}

inline void clearSoftwareInterrupt(uint32_t mask) {
  __asm__ volatile("wsr.intclear %0\n\trsync" ::"a"(mask) : "memory");
}

inline uint8_t coreId() {
  uint32_t prid;
  __asm__ volatile("rsr.prid %0" : "=a"(prid));
  return uint8_t((prid >> 13) & 1);
}

inline void waitForInterrupt() {
  __asm__ volatile("waiti 0" ::: "memory");
}
#endif
}
}
}
