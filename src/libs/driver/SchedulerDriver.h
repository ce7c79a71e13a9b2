#pragma once
// The contract between the radio stack and whichever scheduler backs
// it.  A backend implements SchedulerDriver and registers a single
// instance at startup; the stack only ever talks to the free
// functions at the bottom of this file.
#include <stddef.h>
#include <stdint.h>
#include "src/libs/result/Error.h"

namespace preempt {
namespace driver {

using TaskEntry = void (*)(void* param);
using TaskHandle = void*;
using SemaphoreHandle = void*;

enum class SemaphoreKind : uint8_t {
  Counting,
  Mutex,
  RecursiveMutex,
};

// semaphoreTake timeout that never expires
static constexpr uint32_t kForever = 0xffffffffu;

// taskCreate pinToCore value for tasks that may run on any core
static constexpr int32_t kAnyCore = -1;

class SchedulerDriver {
 public:
  virtual ~SchedulerDriver() {}

  virtual bool initialized() = 0;

  // Starts multitasking.  The caller becomes the main task.
  virtual Status enable() = 0;
  virtual Status disable() = 0;

  virtual void yieldTask() = 0;
  virtual void yieldTaskFromIsr() = 0;

  virtual uint32_t maxTaskPriority() = 0;

  virtual Result<TaskHandle, Error> taskCreate(
      TaskEntry entry,
      void* param,
      uint32_t priority,
      int32_t pinToCore,
      size_t stackSize) = 0;

  virtual TaskHandle currentTask() = 0;

  // nullptr deletes the calling task, in which case this does not
  // return
  virtual Status scheduleTaskDeletion(TaskHandle task) = 0;

  // A binary semaphore owned by the calling task
  virtual SemaphoreHandle currentTaskThreadSemaphore() = 0;

  virtual void usleep(uint32_t us) = 0;

  // Microseconds since boot
  virtual uint64_t now() = 0;

  virtual Result<SemaphoreHandle, Error>
  semaphoreCreate(SemaphoreKind kind, uint32_t max, uint32_t initial) = 0;
  virtual void semaphoreDelete(SemaphoreHandle sem) = 0;
  virtual Status semaphoreTake(SemaphoreHandle sem, uint32_t timeoutUs) = 0;
  virtual Status semaphoreGive(SemaphoreHandle sem) = 0;
};

// Installs the process wide driver.  Registering a second, different
// driver panics.
void registerScheduler(SchedulerDriver* driver);

// nullptr until registerScheduler() has been called
SchedulerDriver* registeredScheduler();

// Forwarders to the registered driver.  Each panics if no driver has
// been registered.
bool initialized();
Status enable();
Status disable();
void yieldTask();
void yieldTaskFromIsr();
uint32_t maxTaskPriority();
Result<TaskHandle, Error> taskCreate(
    TaskEntry entry,
    void* param,
    uint32_t priority,
    int32_t pinToCore,
    size_t stackSize);
TaskHandle currentTask();
Status scheduleTaskDeletion(TaskHandle task);
SemaphoreHandle currentTaskThreadSemaphore();
void usleep(uint32_t us);
uint64_t now();
Result<SemaphoreHandle, Error>
semaphoreCreate(SemaphoreKind kind, uint32_t max, uint32_t initial);
void semaphoreDelete(SemaphoreHandle sem);
Status semaphoreTake(SemaphoreHandle sem, uint32_t timeoutUs);
Status semaphoreGive(SemaphoreHandle sem);
}
}
