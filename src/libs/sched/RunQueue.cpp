#include "src/libs/sched/RunQueue.h"

namespace preempt {
namespace sched {

void RunQueue::insert(TaskControlBlock* task) {
  if (!tail_) {
    task->next = task;
  } else {
    task->next = tail_->next;
    tail_->next = task;
  }
  tail_ = task;
  ++size_;
}

bool RunQueue::remove(TaskControlBlock* task) {
  if (!tail_) {
    return false;
  }
  auto prev = tail_;
  for (size_t i = 0; i < size_; ++i) {
    auto node = prev->next;
    if (node == task) {
      if (node == prev) {
        tail_ = nullptr;
      } else {
        prev->next = node->next;
        if (node == tail_) {
          tail_ = prev;
        }
      }
      task->next = nullptr;
      --size_;
      return true;
    }
    prev = node;
  }
  return false;
}

bool RunQueue::contains(const TaskControlBlock* task) const {
  bool found = false;
  forEach([&](TaskControlBlock* t) {
    if (t == task) {
      found = true;
    }
  });
  return found;
}

size_t RunQueue::wakeExpired(uint64_t now) {
  size_t woken = 0;
  forEach([&](TaskControlBlock* task) {
    if ((task->state == TaskState::Sleeping ||
         task->state == TaskState::Blocked) &&
        task->wakeAt <= now) {
      if (task->state == TaskState::Blocked) {
        task->timedOut = true;
      }
      task->state = TaskState::Ready;
      task->wakeAt = kNoDeadline;
      ++woken;
    }
  });
  return woken;
}

TaskControlBlock* RunQueue::selectNext(
    TaskControlBlock* current,
    uint8_t core) const {
  if (!tail_) {
    return nullptr;
  }
  const bool currentQueued = current && current->next != nullptr;
  auto task = currentQueued ? current->next : head();
  TaskControlBlock* best = nullptr;
  for (size_t i = 0; i < size_; ++i) {
    const bool eligible = task->state == TaskState::Ready ||
        (task == current && task->state == TaskState::Running);
    if (eligible && task->runnableOn(core) &&
        (!best || task->priority > best->priority)) {
      best = task;
    }
    task = task->next;
  }
  return best;
}

TaskControlBlock* RunQueue::highestWaiter(const Semaphore* sem) const {
  TaskControlBlock* best = nullptr;
  forEach([&](TaskControlBlock* task) {
    if (task->state == TaskState::Blocked && task->waitingOn == sem &&
        (!best || task->priority > best->priority)) {
      best = task;
    }
  });
  return best;
}
}
}
