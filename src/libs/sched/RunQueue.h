#pragma once
#include "src/libs/sched/TaskControlBlock.h"

namespace preempt {
namespace sched {

// All live tasks in a circular singly linked list, in creation
// order.  Callers serialize access with a CriticalSection.
class RunQueue {
  // Most recently inserted task; tail_->next is the oldest
  TaskControlBlock* tail_;
  size_t size_;

 public:
  RunQueue() : tail_(nullptr), size_(0) {}
  RunQueue(const RunQueue&) = delete;

  void insert(TaskControlBlock* task);
  // Returns false if task is not in the queue
  bool remove(TaskControlBlock* task);
  bool contains(const TaskControlBlock* task) const;

  TaskControlBlock* head() const {
    return tail_ ? tail_->next : nullptr;
  }

  size_t size() const {
    return size_;
  }

  bool empty() const {
    return size_ == 0;
  }

  // Visits every task once, starting at head().  fn may not remove
  // tasks.
  template <typename Fn>
  void forEach(Fn&& fn) const {
    auto task = head();
    for (size_t i = 0; i < size_; ++i) {
      auto next = task->next;
      fn(task);
      task = next;
    }
  }

  // Makes Sleeping and Blocked tasks whose deadline is at or before
  // now Ready again.  Returns how many were woken.
  size_t wakeExpired(uint64_t now);

  // The highest priority Ready task allowed on core.  Among equal
  // priorities the first one after current wins, so equals take
  // turns.  current itself is a candidate while it is still Running.
  // nullptr when nothing is eligible.
  TaskControlBlock* selectNext(TaskControlBlock* current, uint8_t core) const;

  // The highest priority task Blocked on sem, first in list order
  TaskControlBlock* highestWaiter(const Semaphore* sem) const;
};
}
}
