#include "src/libs/sched/Semaphore.h"

namespace preempt {
namespace sched {

using driver::SemaphoreKind;

Semaphore::Semaphore(SemaphoreKind kind, uint32_t max, uint32_t initial)
    : kind_(kind), count_(0), max_(1), owner_(nullptr), recursion_(0) {
  if (kind_ == SemaphoreKind::Counting) {
    max_ = max == 0 ? 1 : max;
    count_ = initial > max_ ? max_ : initial;
  } else {
    count_ = 1;
  }
}

bool Semaphore::tryTake(const void* taker) {
  switch (kind_) {
    case SemaphoreKind::Counting:
      if (count_ == 0) {
        return false;
      }
      --count_;
      return true;

    case SemaphoreKind::Mutex:
      if (owner_) {
        return false;
      }
      owner_ = taker;
      count_ = 0;
      return true;

    case SemaphoreKind::RecursiveMutex:
      if (owner_ && owner_ != taker) {
        return false;
      }
      owner_ = taker;
      ++recursion_;
      count_ = 0;
      return true;
  }
  return false;
}

Status Semaphore::give(const void* giver) {
  switch (kind_) {
    case SemaphoreKind::Counting:
      if (count_ >= max_) {
        return failed(Error::Full);
      }
      ++count_;
      return ok();

    case SemaphoreKind::Mutex:
      if (owner_ != giver) {
        return failed(Error::NotOwner);
      }
      owner_ = nullptr;
      count_ = 1;
      return ok();

    case SemaphoreKind::RecursiveMutex:
      if (!owner_ || owner_ != giver) {
        return failed(Error::NotOwner);
      }
      if (--recursion_ == 0) {
        owner_ = nullptr;
        count_ = 1;
      }
      return ok();
  }
  return failed(Error::InvalidArgument);
}
}
}
