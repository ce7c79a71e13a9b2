#pragma once
#include <stddef.h>
#include <stdint.h>
#include "src/libs/config/PreemptConfig.h"
#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/port/Port.h"
#include "src/libs/strings/FixedString.h"

namespace preempt {
namespace sched {

class Semaphore;

enum class TaskState : uint8_t {
  Ready,
  Running,
  Sleeping,
  Blocked,
  Deleted,
};

const char* taskStateName(TaskState state);

static constexpr uint64_t kNoDeadline = ~uint64_t(0);
static constexpr uint32_t kStackGuardWord = 0xA5A5A5A5u;

using TaskName = FixedString<PREEMPT_CONFIG_MAX_TASK_NAME_LEN>;

struct TaskControlBlock {
  port::Context context;

  // Next task in the circular run list
  TaskControlBlock* next{nullptr};

  TaskState state{TaskState::Ready};
  uint8_t priority{0};
  // driver::kAnyCore or the core the task is pinned to
  int8_t affinity{-1};
  // Core the task last ran on
  uint8_t core{0};

  // Sleeping and Blocked tasks become Ready once now() passes this
  uint64_t wakeAt{kNoDeadline};
  // Semaphore a Blocked task waits for
  const Semaphore* waitingOn{nullptr};
  // Set when a Blocked task was woken by its deadline
  bool timedOut{false};

  driver::TaskEntry entry{nullptr};
  void* param{nullptr};

  // Owned stack memory; null for tasks running on a stack they did
  // not get from the scheduler, such as main
  uint8_t* stackBottom{nullptr};
  size_t stackSize{0};

  Semaphore* threadSemaphore{nullptr};

  TaskName name;
  uint32_t switches{0};

  bool ownsStack() const {
    return stackBottom != nullptr;
  }

  bool runnableOn(uint8_t cpu) const {
    return affinity < 0 || uint8_t(affinity) == cpu;
  }

  // Fills the low end of the stack with kStackGuardWord
  void paintStackGuard();
  bool stackGuardIntact() const;
};

// Panics, naming the task, when its stack guard has been overwritten
void checkStackGuard(const TaskControlBlock& task);
}
}
