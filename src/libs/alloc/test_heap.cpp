#include <stdexcept>
#include "lest/lest.hpp"
#include "src/libs/alloc/Heap.h"
#include "src/libs/alloc/StackAllocator.h"
using namespace lest;
using namespace preempt;
using namespace preempt::alloc;

static tests specification;

alignas(16) static uint8_t arena[4096];
alignas(16) static uint8_t psram[4096];

lest_CASE(specification, "regions and stats") {
  Heap heap;
  EXPECT(heap.addRegion(arena, sizeof(arena), kInternal).hasValue());
  EXPECT(heap.regionCount() == 1);

  auto stats = heap.stats();
  EXPECT(stats.size == sizeof(arena));
  EXPECT(stats.used == 0u);
  EXPECT(stats.free == sizeof(arena));

  auto tooSmall = heap.addRegion(psram, 4, kExternal);
  EXPECT(tooSmall.hasError());
  EXPECT(tooSmall.error() == Error::InvalidArgument);
}

lest_CASE(specification, "region slots run out") {
  Heap heap;
  for (unsigned i = 0; i < PREEMPT_CONFIG_MAX_HEAP_REGIONS; ++i) {
    EXPECT(heap.addRegion(arena + i * 512, 512, kInternal).hasValue());
  }
  auto res = heap.addRegion(psram, sizeof(psram), kExternal);
  EXPECT(res.hasError());
  EXPECT(res.error() == Error::Full);
}

lest_CASE(specification, "allocations are aligned and disjoint") {
  Heap heap;
  heap.addRegion(arena, sizeof(arena), kInternal).panicIfError();

  auto a = static_cast<uint8_t*>(heap.allocate(100));
  auto b = static_cast<uint8_t*>(heap.allocate(100, 64));
  EXPECT(a != nullptr);
  EXPECT(b != nullptr);
  EXPECT(reinterpret_cast<uintptr_t>(a) % Heap::kMinAlign == 0u);
  EXPECT(reinterpret_cast<uintptr_t>(b) % 64 == 0u);
  EXPECT((b >= a + 100 || a >= b + 100));

  EXPECT(heap.stats().used >= 200u);
  EXPECT(heap.allocate(0) == nullptr);
  EXPECT(heap.allocate(16, 3) == nullptr);
}

lest_CASE(specification, "freeing coalesces neighbours") {
  Heap heap;
  heap.addRegion(arena, sizeof(arena), kInternal).panicIfError();

  auto a = heap.allocate(1000);
  auto b = heap.allocate(1000);
  auto c = heap.allocate(1000);
  EXPECT(a != nullptr);
  EXPECT(b != nullptr);
  EXPECT(c != nullptr);
  // No room left for a block that needs all three
  EXPECT(heap.allocate(3000) == nullptr);
  EXPECT(heap.stats().failures == 1u);

  heap.free(a);
  heap.free(c);
  heap.free(b);
  EXPECT(heap.stats().used == 0u);

  auto big = heap.allocate(3000);
  EXPECT(big != nullptr);
  EXPECT(big == a);
  heap.free(big);
  heap.free(nullptr);
}

lest_CASE(specification, "peak usage is remembered") {
  Heap heap;
  heap.addRegion(arena, sizeof(arena), kInternal).panicIfError();
  auto a = heap.allocate(1024);
  auto b = heap.allocate(1024);
  const auto peak = heap.stats().used;
  heap.free(a);
  heap.free(b);
  EXPECT(heap.stats().used == 0u);
  EXPECT(heap.stats().peakUsed == peak);
}

lest_CASE(specification, "capabilities select the region") {
  Heap heap;
  heap.addRegion(arena, sizeof(arena), kInternal).panicIfError();
  heap.addRegion(psram, sizeof(psram), kExternal).panicIfError();

  auto internal = static_cast<uint8_t*>(heap.allocate(64, 16, kInternal));
  auto external = static_cast<uint8_t*>(heap.allocate(64, 16, kExternal));
  EXPECT((internal >= arena && internal < arena + sizeof(arena)));
  EXPECT((external >= psram && external < psram + sizeof(psram)));

  EXPECT(heap.allocate(64, 16, kInternal | kExternal) == nullptr);
  EXPECT(heap.freeBytes(kExternal) < sizeof(psram));
  EXPECT(heap.freeBytes(0) == heap.stats().free);
}

lest_CASE(specification, "foreign pointers panic") {
  Heap heap;
  heap.addRegion(arena, sizeof(arena), kInternal).panicIfError();
  int local = 0;
  EXPECT_THROWS_AS(heap.free(&local), std::runtime_error);
}

lest_CASE(specification, "default stack allocator uses the built in heap") {
  auto& allocator = defaultStackAllocator();
  const auto before = defaultHeap().stats().used;
  auto stack = allocator.allocate(PREEMPT_CONFIG_MIN_STACK_SIZE, 16);
  EXPECT(stack != nullptr);
  EXPECT(defaultHeap().stats().used > before);
  allocator.deallocate(stack);
  EXPECT(defaultHeap().stats().used == before);
}

lest_CASE(specification, "heap stack allocator honours capabilities") {
  Heap heap;
  heap.addRegion(psram, sizeof(psram), kExternal).panicIfError();
  HeapStackAllocator internalOnly(heap, kInternal);
  EXPECT(internalOnly.allocate(128, 16) == nullptr);

  HeapStackAllocator anywhere(heap);
  auto p = anywhere.allocate(128, 16);
  EXPECT(p != nullptr);
  anywhere.deallocate(p);
}

int main(int argc, char* argv[]) {
  return run(specification, argc, argv);
}
