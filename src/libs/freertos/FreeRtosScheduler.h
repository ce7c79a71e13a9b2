#pragma once
// SchedulerDriver on top of a FreeRTOS kernel.  The kernel does the
// scheduling; enable() and disable() gate this driver, and disable()
// from a running kernel also suspends task switching.  The
// kernel itself is started by vTaskStartScheduler() in the startup
// code once launchTasks() has created the first tasks.
#include "FreeRTOS.h"
#include "semphr.h"
#include "task.h"
#include "src/libs/driver/SchedulerDriver.h"

namespace preempt {
namespace freertos {

// Thread local storage slot holding a task's thread semaphore
static constexpr BaseType_t kThreadSemaphoreSlot = 0;

// A Critical section disables interrupts while it is in scope.
// CriticalSections must not nest.
// FreeRTOS APIs must not be called from within a CriticalSection.
struct CriticalSection {
  CriticalSection() {
    taskENTER_CRITICAL();
  }
  ~CriticalSection() {
    taskEXIT_CRITICAL();
  }

  CriticalSection(const CriticalSection&) = delete;
  CriticalSection(CriticalSection&&) = delete;
};

// Microseconds to whole ticks, rounding up.  kForever maps to
// portMAX_DELAY.
TickType_t microsToTicks(uint32_t us);

class FreeRtosScheduler : public driver::SchedulerDriver {
 public:
  FreeRtosScheduler();
  FreeRtosScheduler(const FreeRtosScheduler&) = delete;
  FreeRtosScheduler(FreeRtosScheduler&&) = delete;

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

 private:
  // What a driver::SemaphoreHandle points to
  struct Semaphore {
    SemaphoreHandle_t handle;
    driver::SemaphoreKind kind;
  };

  // Handed to taskTrampoline; freed once the task is running
  struct TaskStart {
    driver::TaskEntry entry;
    void* param;
  };

  static void taskTrampoline(void* param);
  static void releaseThreadSemaphore(TaskHandle_t task);
  static void destroy(Semaphore* sem);
  static Status take(Semaphore* sem, TickType_t ticks);

  bool enabled_;
  // disable() suspended the kernel scheduler
  bool suspended_;
  // The task that enabled the driver; null when that was the startup
  // code
  TaskHandle_t main_;
  // Extends the kernel tick count to 64 bits
  TickType_t lastTick_;
  uint64_t tickHigh_;
};
}
}
