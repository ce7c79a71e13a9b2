#pragma once
#include <stdint.h>

namespace preempt {
namespace port {

// The register frame the xtensa-lx-rt exception vectors push before
// calling an interrupt handler and pop on return.  A task switch
// swaps its contents with the saved task context.
struct TrapFrame {
  uint32_t PC;
  uint32_t PS;

  uint32_t A0;
  uint32_t A1;
  uint32_t A2;
  uint32_t A3;
  uint32_t A4;
  uint32_t A5;
  uint32_t A6;
  uint32_t A7;
  uint32_t A8;
  uint32_t A9;
  uint32_t A10;
  uint32_t A11;
  uint32_t A12;
  uint32_t A13;
  uint32_t A14;
  uint32_t A15;
  uint32_t SAR;
  uint32_t EXCCAUSE;
  uint32_t EXCVADDR;
  uint32_t LBEG;
  uint32_t LEND;
  uint32_t LCOUNT;
  uint32_t THREADPTR;
  uint32_t SCOMPARE1;
  uint32_t BR;
  uint32_t ACCLO;
  uint32_t ACCHI;
  uint32_t M0;
  uint32_t M1;
  uint32_t M2;
  uint32_t M3;
  uint32_t F64R_LO;
  uint32_t F64R_HI;
  uint32_t F64S;
  uint32_t FCR;
  uint32_t FSR;
  uint32_t F[16];
};

using Context = TrapFrame;

// PS for a fresh task: window overflow enabled, entered as if by call4
static constexpr uint32_t kPsWoe = 0x00040000;
static constexpr uint32_t kPsCallInc1 = 1u << 16;
}
}
