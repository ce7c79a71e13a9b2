#pragma once
#include <stddef.h>
#include <stdint.h>
#include "src/libs/config/PreemptConfig.h"

namespace preempt {
namespace alloc {

// Source of task stacks and task control blocks.  The scheduler uses
// the default heap unless a different allocator is supplied.
class StackAllocator {
 public:
  virtual ~StackAllocator() {}

  // nullptr when out of memory
  virtual void* allocate(size_t size, size_t align) = 0;
  virtual void deallocate(void* ptr) = 0;
};

#if PREEMPT_CONFIG_USE_HEAP_ALLOCATOR
class Heap;

class HeapStackAllocator : public StackAllocator {
  Heap& heap_;
  uint8_t caps_;

 public:
  explicit HeapStackAllocator(Heap& heap, uint8_t caps = 0);

  void* allocate(size_t size, size_t align) override;
  void deallocate(void* ptr) override;
};

// Backed by defaultHeap(), internal memory only
StackAllocator& defaultStackAllocator();
#endif
}
}
