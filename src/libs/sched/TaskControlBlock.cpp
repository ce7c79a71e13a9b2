#include "src/libs/sched/TaskControlBlock.h"
#include "src/libs/result/Logging.h"

namespace preempt {
namespace sched {

const char* taskStateName(TaskState state) {
  switch (state) {
    case TaskState::Ready:
      return "ready";
    case TaskState::Running:
      return "running";
    case TaskState::Sleeping:
      return "sleeping";
    case TaskState::Blocked:
      return "blocked";
    case TaskState::Deleted:
      return "deleted";
  }
  return "?";
}

void TaskControlBlock::paintStackGuard() {
  if (!ownsStack()) {
    return;
  }
  auto words = reinterpret_cast<uint32_t*>(stackBottom);
  for (size_t i = 0; i < PREEMPT_CONFIG_STACK_GUARD_WORDS; ++i) {
    words[i] = kStackGuardWord;
  }
}

bool TaskControlBlock::stackGuardIntact() const {
  if (!ownsStack()) {
    return true;
  }
  auto words = reinterpret_cast<const uint32_t*>(stackBottom);
  for (size_t i = 0; i < PREEMPT_CONFIG_STACK_GUARD_WORDS; ++i) {
    if (words[i] != kStackGuardWord) {
      return false;
    }
  }
  return true;
}

void checkStackGuard(const TaskControlBlock& task) {
  if (!task.stackGuardIntact()) {
    panic("stack overflow in task ", task.name);
  }
}
}
}
