#include "src/libs/alloc/StackAllocator.h"
#include "src/libs/alloc/Heap.h"

namespace preempt {
namespace alloc {
#if PREEMPT_CONFIG_USE_HEAP_ALLOCATOR

HeapStackAllocator::HeapStackAllocator(Heap& heap, uint8_t caps)
    : heap_(heap), caps_(caps) {}

void* HeapStackAllocator::allocate(size_t size, size_t align) {
  return heap_.allocate(size, align, caps_);
}

void HeapStackAllocator::deallocate(void* ptr) {
  heap_.free(ptr);
}

StackAllocator& defaultStackAllocator() {
  static HeapStackAllocator allocator(defaultHeap(), kInternal);
  return allocator;
}
#endif
}
}
