#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/result/Logging.h"

namespace preempt {
namespace driver {

namespace {
SchedulerDriver* registered = nullptr;

SchedulerDriver& scheduler() {
  if (!registered) {
    panic("no scheduler driver registered");
  }
  return *registered;
}
}

void registerScheduler(SchedulerDriver* driver) {
  if (!driver) {
    panic("registerScheduler(nullptr)");
  }
  if (registered && registered != driver) {
    panic("a different scheduler driver is already registered");
  }
  registered = driver;
}

SchedulerDriver* registeredScheduler() {
  return registered;
}

bool initialized() {
  return scheduler().initialized();
}

Status enable() {
  return scheduler().enable();
}

Status disable() {
  return scheduler().disable();
}

void yieldTask() {
  scheduler().yieldTask();
}

void yieldTaskFromIsr() {
  scheduler().yieldTaskFromIsr();
}

uint32_t maxTaskPriority() {
  return scheduler().maxTaskPriority();
}

Result<TaskHandle, Error> taskCreate(
    TaskEntry entry,
    void* param,
    uint32_t priority,
    int32_t pinToCore,
    size_t stackSize) {
  return scheduler().taskCreate(entry, param, priority, pinToCore, stackSize);
}

TaskHandle currentTask() {
  return scheduler().currentTask();
}

Status scheduleTaskDeletion(TaskHandle task) {
  return scheduler().scheduleTaskDeletion(task);
}

SemaphoreHandle currentTaskThreadSemaphore() {
  return scheduler().currentTaskThreadSemaphore();
}

void usleep(uint32_t us) {
  scheduler().usleep(us);
}

uint64_t now() {
  return scheduler().now();
}

Result<SemaphoreHandle, Error>
semaphoreCreate(SemaphoreKind kind, uint32_t max, uint32_t initial) {
  return scheduler().semaphoreCreate(kind, max, initial);
}

void semaphoreDelete(SemaphoreHandle sem) {
  scheduler().semaphoreDelete(sem);
}

Status semaphoreTake(SemaphoreHandle sem, uint32_t timeoutUs) {
  return scheduler().semaphoreTake(sem, timeoutUs);
}

Status semaphoreGive(SemaphoreHandle sem) {
  return scheduler().semaphoreGive(sem);
}
}
}
