#include "lest/lest.hpp"
#include "src/libs/hal/Systimer.h"
using namespace lest;
using namespace preempt;
using namespace preempt::hal;

static tests specification;

struct SystimerTag;
using Block = TestBlock<SystimerTag>;
using Timer = Systimer<Block>;

lest_CASE(specification, "enabling unit 0 turns on the clock") {
  Block::clear();
  Timer::enableUnit0();
  EXPECT(
      Block::reg(systimer::kConf) ==
      (systimer::kConfClkEn | systimer::kConfUnit0WorkEn));
}

lest_CASE(specification, "reads the latched 52 bit counter") {
  Block::clear();
  // Hardware reports the latched value as valid
  Block::reg(systimer::kUnit0Op) = systimer::kOpValueValid;
  Block::reg(systimer::kUnit0ValueHi) = 0xfff00002;
  Block::reg(systimer::kUnit0ValueLo) = 0x00000010;

  EXPECT(Timer::unit0Value() == ((uint64_t(2) << 32) | 0x10));
  EXPECT((Block::reg(systimer::kUnit0Op) & systimer::kOpUpdate) != 0u);
  EXPECT(Timer::nowMicros() == ((uint64_t(2) << 32) | 0x10) / 16);
}

lest_CASE(specification, "period mode programs the comparator") {
  Block::clear();
  EXPECT(Timer::setPeriod(0, 160000));
  EXPECT(
      Block::reg(systimer::kTarget0Conf) ==
      (systimer::kTargetConfPeriodMode | 160000u));
  EXPECT(Block::reg(systimer::kComp0Load) == 1u);
  EXPECT((Block::reg(systimer::kConf) & systimer::kConfTarget0WorkEn) != 0u);

  EXPECT(Timer::setPeriod(2, 16));
  EXPECT(Block::reg(systimer::kTarget0Conf + 8) ==
         (systimer::kTargetConfPeriodMode | 16u));
  EXPECT((Block::reg(systimer::kConf) & (systimer::kConfTarget0WorkEn >> 2)) !=
         0u);
}

lest_CASE(specification, "rejects periods the comparator cannot hold") {
  Block::clear();
  EXPECT_NOT(Timer::setPeriod(0, 0));
  EXPECT_NOT(Timer::setPeriod(0, systimer::kMaxPeriod + 1));
  EXPECT_NOT(Timer::setPeriod(3, 100));
  EXPECT(Block::reg(systimer::kConf) == 0u);
}

lest_CASE(specification, "one shot target splits the value") {
  Block::clear();
  EXPECT(Timer::setTarget(1, (uint64_t(0x12345) << 32) | 0xdeadbeef));
  EXPECT(Block::reg(systimer::kTarget0Hi + 8) == 0x12345u);
  EXPECT(Block::reg(systimer::kTarget0Lo + 8) == 0xdeadbeefu);
  EXPECT(Block::reg(systimer::kTarget0Conf + 4) == 0u);
  EXPECT(Block::reg(systimer::kComp0Load + 4) == 1u);
}

lest_CASE(specification, "interrupt enable and clear") {
  Block::clear();
  Timer::enableInterrupt(0, true);
  Timer::enableInterrupt(2, true);
  EXPECT(Block::reg(systimer::kIntEna) == 0x5u);
  Timer::enableInterrupt(0, false);
  EXPECT(Block::reg(systimer::kIntEna) == 0x4u);

  Timer::clearInterrupt(2);
  EXPECT(Block::reg(systimer::kIntClr) == 0x4u);

  Block::reg(systimer::kIntSt) = 0x2;
  EXPECT(Timer::isInterruptSet(1));
  EXPECT_NOT(Timer::isInterruptSet(0));
}

int main(int argc, char* argv[]) {
  return run(specification, argc, argv);
}
