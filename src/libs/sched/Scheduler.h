#pragma once
// The bare-metal preemptive scheduler.
//
// Every task, including the one that called enable() ("main") and a
// per-core idle task, has a TaskControlBlock in a circular run list.
// A periodic tick and explicit yields raise the switch interrupt; its
// handler wakes tasks whose deadline passed, reaps deleted tasks and
// picks the highest priority ready task, rotating among equals.
#include "src/libs/alloc/StackAllocator.h"
#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/sched/RunQueue.h"
#include "src/libs/sched/Semaphore.h"
#include "src/libs/sched/TaskControlBlock.h"

namespace preempt {
namespace sched {

static_assert(
    chip::kCores <= PREEMPT_CONFIG_MAX_CORES,
    "PREEMPT_CONFIG_MAX_CORES is smaller than the chip's core count");
static_assert(
    PREEMPT_CONFIG_MAX_TASK_PRIORITY <= 255,
    "priorities are stored in 8 bits");

class BaremetalScheduler : public driver::SchedulerDriver {
 public:
#if PREEMPT_CONFIG_USE_HEAP_ALLOCATOR
  // Task memory comes from the built in heap
  BaremetalScheduler();
#endif
  explicit BaremetalScheduler(alloc::StackAllocator& allocator);
  ~BaremetalScheduler();

  BaremetalScheduler(const BaremetalScheduler&) = delete;
  BaremetalScheduler(BaremetalScheduler&&) = delete;

  bool initialized() override;
  Status enable() override;
  Status disable() override;
  void yieldTask() override;
  void yieldTaskFromIsr() override;
  uint32_t maxTaskPriority() override;
  Result<driver::TaskHandle, Error> taskCreate(
      driver::TaskEntry entry,
      void* param,
      uint32_t priority,
      int32_t pinToCore,
      size_t stackSize) override;
  driver::TaskHandle currentTask() override;
  Status scheduleTaskDeletion(driver::TaskHandle task) override;
  driver::SemaphoreHandle currentTaskThreadSemaphore() override;
  void usleep(uint32_t us) override;
  uint64_t now() override;
  Result<driver::SemaphoreHandle, Error> semaphoreCreate(
      driver::SemaphoreKind kind,
      uint32_t max,
      uint32_t initial) override;
  void semaphoreDelete(driver::SemaphoreHandle sem) override;
  Status semaphoreTake(driver::SemaphoreHandle sem, uint32_t timeoutUs)
      override;
  Status semaphoreGive(driver::SemaphoreHandle sem) override;

  // Called on a secondary core once enable() has run on the first.
  // The caller becomes that core's main task.
  Status attachCore();

  // Like taskCreate, with a name for diagnostics
  Result<driver::TaskHandle, Error> taskCreateNamed(
      const char* name,
      driver::TaskEntry entry,
      void* param,
      uint32_t priority,
      int32_t pinToCore,
      size_t stackSize);

  // Live tasks, including main and idle
  size_t taskCount();
  uint64_t tickCount();

  // State of task, or Deleted when the handle is unknown
  TaskState taskState(driver::TaskHandle task);

  // The scheduler currently enabled, if any
  static BaremetalScheduler* active();

 private:
  Result<TaskControlBlock*, Error> createTask(
      const char* name,
      driver::TaskEntry entry,
      void* param,
      uint8_t priority,
      int8_t affinity,
      size_t stackSize);
  Result<TaskControlBlock*, Error> createBookkeeping(uint8_t core);
  void freeTask(TaskControlBlock* task);
  // Frees every task; returns how many user tasks were still alive
  size_t releaseAll();
  void reapDeleted();
  bool isIdle(const TaskControlBlock* task) const;
  bool isCurrent(const TaskControlBlock* task) const;
  TaskControlBlock* current() const;
  const void* ownerToken() const;

  // The body of the switch interrupt
  void switchTask(bool tick);
  static void onSwitchInterrupt(bool tick);
  static void taskTrampoline(void* param);
  static void idleLoop(void* param);

  alloc::StackAllocator& allocator_;
  RunQueue tasks_;
  TaskControlBlock* current_[PREEMPT_CONFIG_MAX_CORES];
  TaskControlBlock* idle_[PREEMPT_CONFIG_MAX_CORES];
  TaskControlBlock* main_;
  volatile bool enabled_;
  uint64_t ticks_;
  uint32_t nextTaskId_;
};
}
}
