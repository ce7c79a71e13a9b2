#include "src/libs/alloc/Heap.h"
#include "src/libs/result/Logging.h"
#include "src/libs/sched/CriticalSection.h"
#include "src/libs/traits/Traits.h"

namespace preempt {
namespace alloc {

Heap::Heap() : regions_{}, numRegions_(0), peakUsed_(0), failures_(0) {}

Status Heap::addRegion(void* start, size_t size, uint8_t caps) {
  const uintptr_t begin = alignUp(reinterpret_cast<uintptr_t>(start), kMinAlign);
  const uintptr_t end =
      alignDown(reinterpret_cast<uintptr_t>(start) + size, kMinAlign);
  if (end <= begin || end - begin < sizeof(FreeBlock) + kMinAlign) {
    return failed(Error::InvalidArgument);
  }

  CriticalSection cs;
  if (numRegions_ >= PREEMPT_CONFIG_MAX_HEAP_REGIONS) {
    return failed(Error::Full);
  }
  auto& region = regions_[numRegions_++];
  region.start = begin;
  region.end = end;
  region.caps = caps;
  region.used = 0;
  region.freeList = reinterpret_cast<FreeBlock*>(begin);
  region.freeList->size = end - begin;
  region.freeList->next = nullptr;
  return ok();
}

void* Heap::allocate(size_t size, size_t align, uint8_t caps) {
  if (size == 0 || !isPowerOfTwo(align)) {
    return nullptr;
  }
  if (align < kMinAlign) {
    align = kMinAlign;
  }

  CriticalSection cs;
  for (uint8_t i = 0; i < numRegions_; ++i) {
    auto& region = regions_[i];
    if ((region.caps & caps) != caps) {
      continue;
    }
    auto ptr = allocateFrom(region, size, align);
    if (ptr) {
      const auto used = stats().used;
      if (used > peakUsed_) {
        peakUsed_ = used;
      }
      return ptr;
    }
  }
  ++failures_;
  return nullptr;
}

void* Heap::allocateFrom(Region& region, size_t size, size_t align) {
  FreeBlock** link = &region.freeList;
  while (*link) {
    FreeBlock* block = *link;
    const uintptr_t chunk = reinterpret_cast<uintptr_t>(block);
    const uintptr_t user = alignUp(chunk + sizeof(AllocHeader), align);
    const uintptr_t userEnd = alignUp(user + size, kMinAlign);
    if (userEnd < user || userEnd - chunk > block->size) {
      link = &block->next;
      continue;
    }

    size_t chunkSize = userEnd - chunk;
    const size_t remainder = block->size - chunkSize;
    if (remainder >= sizeof(FreeBlock) + kMinAlign) {
      auto rest = reinterpret_cast<FreeBlock*>(userEnd);
      rest->size = remainder;
      rest->next = block->next;
      *link = rest;
    } else {
      chunkSize = block->size;
      *link = block->next;
    }

    auto header = reinterpret_cast<AllocHeader*>(user - sizeof(AllocHeader));
    header->chunkSize = chunkSize;
    header->chunk = chunk;
    region.used += chunkSize;
    return reinterpret_cast<void*>(user);
  }
  return nullptr;
}

Heap::Region* Heap::regionFor(uintptr_t addr) {
  for (uint8_t i = 0; i < numRegions_; ++i) {
    if (addr >= regions_[i].start && addr < regions_[i].end) {
      return &regions_[i];
    }
  }
  return nullptr;
}

void Heap::free(void* ptr) {
  if (!ptr) {
    return;
  }
  const uintptr_t user = reinterpret_cast<uintptr_t>(ptr);

  CriticalSection cs;
  auto region = regionFor(user);
  if (!region) {
    panic("Heap::free of foreign pointer ", ptr);
  }
  auto header = reinterpret_cast<AllocHeader*>(user - sizeof(AllocHeader));
  if (header->chunk < region->start || header->chunk >= user ||
      header->chunk + header->chunkSize > region->end) {
    panic("Heap::free: corrupt block header at ", ptr);
  }
  release(*region, header->chunk, header->chunkSize);
}

void Heap::release(Region& region, uintptr_t chunk, size_t chunkSize) {
  region.used -= chunkSize;

  FreeBlock* prev = nullptr;
  FreeBlock* next = region.freeList;
  while (next && reinterpret_cast<uintptr_t>(next) < chunk) {
    prev = next;
    next = next->next;
  }

  auto block = reinterpret_cast<FreeBlock*>(chunk);
  block->size = chunkSize;
  block->next = next;

  if (next && chunk + chunkSize == reinterpret_cast<uintptr_t>(next)) {
    block->size += next->size;
    block->next = next->next;
  }

  if (prev) {
    if (reinterpret_cast<uintptr_t>(prev) + prev->size == chunk) {
      prev->size += block->size;
      prev->next = block->next;
    } else {
      prev->next = block;
    }
  } else {
    region.freeList = block;
  }
}

HeapStats Heap::stats() const {
  CriticalSection cs;
  HeapStats stats{0, 0, 0, peakUsed_, failures_};
  for (uint8_t i = 0; i < numRegions_; ++i) {
    stats.size += regions_[i].end - regions_[i].start;
    stats.used += regions_[i].used;
  }
  stats.free = stats.size - stats.used;
  return stats;
}

size_t Heap::freeBytes(uint8_t caps) const {
  CriticalSection cs;
  size_t total = 0;
  for (uint8_t i = 0; i < numRegions_; ++i) {
    if ((regions_[i].caps & caps) == caps) {
      total += (regions_[i].end - regions_[i].start) - regions_[i].used;
    }
  }
  return total;
}

Heap& defaultHeap() {
  alignas(16) static uint8_t storage[PREEMPT_CONFIG_HEAP_SIZE];
  static Heap heap;
  static bool initialized = false;
  CriticalSection cs;
  if (!initialized) {
    initialized = true;
    heap.addRegion(storage, sizeof(storage), kInternal).panicIfError();
  }
  return heap;
}
}
}
