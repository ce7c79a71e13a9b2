#pragma once
// Region based heap used for task stacks and control blocks.
//
// Memory is added as up to PREEMPT_CONFIG_MAX_HEAP_REGIONS regions,
// each tagged with capability flags.  Allocation is first fit over an
// address ordered free list per region; freed blocks are merged with
// their neighbours.
#include <stddef.h>
#include <stdint.h>
#include "src/libs/config/PreemptConfig.h"
#include "src/libs/result/Error.h"

namespace preempt {
namespace alloc {

enum Capability : uint8_t {
  kInternal = 1 << 0,
  kExternal = 1 << 1,
};

struct HeapStats {
  size_t size;
  size_t used;
  size_t free;
  size_t peakUsed;
  uint32_t failures;
};

class Heap {
 public:
  static constexpr size_t kMinAlign = 2 * sizeof(void*);

  Heap();
  Heap(const Heap&) = delete;
  Heap(Heap&&) = delete;

  // Hands [start, start + size) to the heap.  Fails with Full when all
  // region slots are taken and InvalidArgument when the memory is too
  // small to hold a single block.
  Status addRegion(void* start, size_t size, uint8_t caps);

  // Returns nullptr when no region with all of `caps` can satisfy the
  // request.  caps == 0 accepts any region.
  void* allocate(size_t size, size_t align = kMinAlign, uint8_t caps = 0);

  // Accepts nullptr.  Panics on pointers the heap did not hand out.
  void free(void* ptr);

  HeapStats stats() const;

  uint8_t regionCount() const {
    return numRegions_;
  }

  // Free bytes in regions carrying all of caps
  size_t freeBytes(uint8_t caps) const;

 private:
  struct FreeBlock {
    size_t size;
    FreeBlock* next;
  };

  // Precedes every allocation
  struct AllocHeader {
    size_t chunkSize;
    uintptr_t chunk;
  };

  struct Region {
    uintptr_t start;
    uintptr_t end;
    uint8_t caps;
    size_t used;
    FreeBlock* freeList;
  };

  void* allocateFrom(Region& region, size_t size, size_t align);
  Region* regionFor(uintptr_t addr);
  void release(Region& region, uintptr_t chunk, size_t chunkSize);

  Region regions_[PREEMPT_CONFIG_MAX_HEAP_REGIONS];
  uint8_t numRegions_;
  size_t peakUsed_;
  uint32_t failures_;
};

// The built in heap of PREEMPT_CONFIG_HEAP_SIZE bytes of internal
// memory, initialized on first use
Heap& defaultHeap();
}
}
