#include "lest/lest.hpp"
#include "src/libs/hal/InterruptMatrix.h"
#include "src/libs/hal/SoftwareInterrupt.h"
using namespace lest;
using namespace preempt;
using namespace preempt::hal;

static tests specification;

struct FromCpuTag;
struct MapTag;
struct CtrlTag;
using FromCpu = TestBlock<FromCpuTag, 4>;
using Map = TestBlock<MapTag>;
using Ctrl = TestBlock<CtrlTag, 64>;
using Matrix = InterruptMatrix<Map, Ctrl>;

lest_CASE(specification, "software interrupt raise and reset") {
  FromCpu::clear();
  using Switch = SoftwareInterrupt<FromCpu, 2>;
  Switch::raise();
  EXPECT(FromCpu::reg(8) == 1u);
  EXPECT(Switch::isRaised());
  EXPECT(FromCpu::reg(0) == 0u);

  Switch::reset();
  EXPECT_NOT(Switch::isRaised());
}

lest_CASE(specification, "binding a source to a cpu interrupt") {
  Map::clear();
  Ctrl::clear();
  Matrix::bind(37, 10, 1, InterruptType::Level);
  EXPECT(Matrix::mappedTo(37) == 10);
  EXPECT(Matrix::isEnabled(10));
  EXPECT(Matrix::priority(10) == 1);
  EXPECT((Ctrl::reg(intmatrix::kCpuIntType) & (1u << 10)) == 0u);

  Matrix::bind(50, 11, 1, InterruptType::Edge);
  EXPECT((Ctrl::reg(intmatrix::kCpuIntType) & (1u << 11)) != 0u);
  EXPECT(
      Ctrl::reg(intmatrix::kCpuIntEnable) == ((1u << 10) | (1u << 11)));

  Matrix::disable(10);
  EXPECT_NOT(Matrix::isEnabled(10));
  EXPECT(Matrix::isEnabled(11));

  Matrix::unmap(37);
  EXPECT(Matrix::mappedTo(37) == 0);
}

lest_CASE(specification, "clearing an edge latch leaves the register idle") {
  Ctrl::clear();
  Matrix::clear(11);
  EXPECT(Ctrl::reg(intmatrix::kCpuIntClear) == 0u);
}

int main(int argc, char* argv[]) {
  return run(specification, argc, argv);
}
