#include "src/libs/freertos/FreeRtosScheduler.h"
#include <new>
#include "src/libs/chip/Chip.h"
#include "src/libs/freertos/Result.h"
#include "src/libs/port/Port.h"
#include "src/libs/result/Logging.h"

namespace preempt {
namespace freertos {

using driver::SemaphoreHandle;
using driver::SemaphoreKind;
using driver::TaskEntry;
using driver::TaskHandle;

namespace {
constexpr uint32_t kTickPeriodUs = 1000000u / configTICK_RATE_HZ;

// Blocking kernel calls are only allowed while this holds
bool kernelRunning() {
  return xTaskGetSchedulerState() == taskSCHEDULER_RUNNING;
}

// The kernel tick does not advance before the kernel starts, so waits
// outside of it are timed with the hardware clock
uint64_t deadlineAfter(uint32_t us) {
  if (us == driver::kForever) {
    return ~uint64_t(0);
  }
  return port::nowMicros() + us;
}
}

TickType_t microsToTicks(uint32_t us) {
  if (us == driver::kForever) {
    return portMAX_DELAY;
  }
  const uint64_t ticks = (uint64_t(us) + kTickPeriodUs - 1) / kTickPeriodUs;
  if (ticks >= portMAX_DELAY) {
    return portMAX_DELAY - 1;
  }
  return TickType_t(ticks);
}

FreeRtosScheduler::FreeRtosScheduler()
    : enabled_(false),
      suspended_(false),
      main_(nullptr),
      lastTick_(0),
      tickHigh_(0) {}

bool FreeRtosScheduler::initialized() {
  return enabled_;
}

Status FreeRtosScheduler::enable() {
  if (enabled_) {
    return failed(Error::AlreadyStarted);
  }
  if (suspended_) {
    suspended_ = false;
    xTaskResumeAll();
  }
  // Enabled from the startup code, no task counts as main
  main_ = kernelRunning() ? xTaskGetCurrentTaskHandle() : nullptr;
  enabled_ = true;
  logInfo(
      "FreeRTOS driver enabled, tick ",
      uint32_t(configTICK_RATE_HZ),
      " Hz");
  return ok();
}

Status FreeRtosScheduler::disable() {
  if (!enabled_) {
    return failed(Error::NotStarted);
  }
  if (kernelRunning()) {
    if (xTaskGetCurrentTaskHandle() != main_) {
      return failed(Error::InvalidArgument);
    }
    // The caller keeps the CPU until the driver is enabled again
    vTaskSuspendAll();
    suspended_ = true;
  }
  enabled_ = false;
  logInfo("FreeRTOS driver disabled");
  return ok();
}

void FreeRtosScheduler::yieldTask() {
  if (enabled_ && kernelRunning()) {
    taskYIELD();
  }
}

void FreeRtosScheduler::yieldTaskFromIsr() {
  if (enabled_) {
    portYIELD_FROM_ISR(pdTRUE);
  }
}

uint32_t FreeRtosScheduler::maxTaskPriority() {
  return configMAX_PRIORITIES - 1;
}

void FreeRtosScheduler::taskTrampoline(void* param) {
  auto start = static_cast<TaskStart*>(param);
  const TaskEntry entry = start->entry;
  void* arg = start->param;
  vPortFree(start);

  entry(arg);

  // Returning from the entry function deletes the task
  releaseThreadSemaphore(nullptr);
  vTaskDelete(nullptr);
}

Result<TaskHandle, Error> FreeRtosScheduler::taskCreate(
    TaskEntry entry,
    void* param,
    uint32_t priority,
    int32_t pinToCore,
    size_t stackSize) {
  using R = Result<TaskHandle, Error>;
  if (!entry) {
    return R::Error(Error::InvalidArgument);
  }
  if (pinToCore < driver::kAnyCore || pinToCore >= int32_t(chip::kCores)) {
    return R::Error(Error::InvalidCore);
  }
  if (priority > maxTaskPriority()) {
    priority = maxTaskPriority();
  }
  configSTACK_DEPTH_TYPE depth =
      (stackSize + sizeof(StackType_t) - 1) / sizeof(StackType_t);
  if (depth < configMINIMAL_STACK_SIZE) {
    depth = configMINIMAL_STACK_SIZE;
  }

  auto start = static_cast<TaskStart*>(pvPortMalloc(sizeof(TaskStart)));
  if (!start) {
    return R::Error(Error::OutOfMemory);
  }
  start->entry = entry;
  start->param = param;

  TaskHandle_t handle = nullptr;
#if configUSE_CORE_AFFINITY
  const UBaseType_t affinity = pinToCore == driver::kAnyCore
      ? tskNO_AFFINITY
      : UBaseType_t(1u << pinToCore);
  auto created = xTaskCreateAffinitySet(
      &taskTrampoline,
      "preempt",
      depth,
      start,
      UBaseType_t(priority),
      affinity,
      &handle);
#else
  // Single core kernels have nowhere else to run a pinned task
  auto created = xTaskCreate(
      &taskTrampoline,
      "preempt",
      depth,
      start,
      UBaseType_t(priority),
      &handle);
#endif
  if (created != pdPASS) {
    vPortFree(start);
    logWarn("no memory for a ", uint32_t(depth), " word task stack");
    return R::Error(Error::OutOfMemory);
  }
  return R::Ok(handle);
}

TaskHandle FreeRtosScheduler::currentTask() {
  if (xTaskGetSchedulerState() == taskSCHEDULER_NOT_STARTED) {
    return nullptr;
  }
  return xTaskGetCurrentTaskHandle();
}

void FreeRtosScheduler::releaseThreadSemaphore(TaskHandle_t task) {
  auto sem = pvTaskGetThreadLocalStoragePointer(task, kThreadSemaphoreSlot);
  if (sem) {
    vTaskSetThreadLocalStoragePointer(task, kThreadSemaphoreSlot, nullptr);
    destroy(static_cast<Semaphore*>(sem));
  }
}

void FreeRtosScheduler::destroy(Semaphore* sem) {
  vSemaphoreDelete(sem->handle);
  sem->~Semaphore();
  vPortFree(sem);
}

Status FreeRtosScheduler::scheduleTaskDeletion(TaskHandle task) {
  auto handle = static_cast<TaskHandle_t>(task);
  if (handle && handle == xTaskGetIdleTaskHandle()) {
    return failed(Error::InvalidArgument);
  }
  if (!handle && !currentTask()) {
    return failed(Error::InvalidArgument);
  }
  releaseThreadSemaphore(handle);
  // Does not return when handle is the calling task
  vTaskDelete(handle);
  return ok();
}

SemaphoreHandle FreeRtosScheduler::currentTaskThreadSemaphore() {
  if (!currentTask()) {
    panic("thread semaphore requested outside of a task");
  }
  auto existing =
      pvTaskGetThreadLocalStoragePointer(nullptr, kThreadSemaphoreSlot);
  if (existing) {
    return existing;
  }
  auto sem = semaphoreCreate(SemaphoreKind::Counting, 1, 0);
  if (sem.hasError()) {
    panic("no memory for a thread semaphore");
  }
  vTaskSetThreadLocalStoragePointer(
      nullptr, kThreadSemaphoreSlot, sem.value());
  return sem.value();
}

void FreeRtosScheduler::usleep(uint32_t us) {
  if (!enabled_ || !kernelRunning()) {
    const uint64_t deadline = deadlineAfter(us);
    while (port::nowMicros() < deadline) {
    }
    return;
  }
  if (us == 0) {
    taskYIELD();
    return;
  }
  vTaskDelay(microsToTicks(us));
}

uint64_t FreeRtosScheduler::now() {
  uint64_t ticks;
  {
    CriticalSection cs;
    const TickType_t tick = xTaskGetTickCount();
    if (tick < lastTick_) {
      tickHigh_ += uint64_t(1) << (sizeof(TickType_t) * 8);
    }
    lastTick_ = tick;
    ticks = tickHigh_ + tick;
  }
  return ticks * kTickPeriodUs;
}

Result<SemaphoreHandle, Error> FreeRtosScheduler::semaphoreCreate(
    SemaphoreKind kind,
    uint32_t max,
    uint32_t initial) {
  using R = Result<SemaphoreHandle, Error>;
  if (kind == SemaphoreKind::Counting && (max == 0 || initial > max)) {
    return R::Error(Error::InvalidArgument);
  }

  SemaphoreHandle_t handle = nullptr;
  switch (kind) {
    case SemaphoreKind::Counting:
      handle = xSemaphoreCreateCounting(max, initial);
      break;
    case SemaphoreKind::Mutex:
      handle = xSemaphoreCreateMutex();
      break;
    case SemaphoreKind::RecursiveMutex:
      handle = xSemaphoreCreateRecursiveMutex();
      break;
  }
  if (!handle) {
    return R::Error(Error::OutOfMemory);
  }

  void* mem = pvPortMalloc(sizeof(Semaphore));
  if (!mem) {
    vSemaphoreDelete(handle);
    return R::Error(Error::OutOfMemory);
  }
  return R::Ok(new (mem) Semaphore{handle, kind});
}

void FreeRtosScheduler::semaphoreDelete(SemaphoreHandle handle) {
  auto sem = static_cast<Semaphore*>(handle);
  if (sem) {
    destroy(sem);
  }
}

Status FreeRtosScheduler::semaphoreTake(
    SemaphoreHandle handle,
    uint32_t timeoutUs) {
  auto sem = static_cast<Semaphore*>(handle);
  if (!sem) {
    return failed(Error::InvalidArgument);
  }
  if (timeoutUs == 0 || kernelRunning()) {
    return take(sem, microsToTicks(timeoutUs));
  }

  // No task can run to give it; poll for an interrupt handler to
  const uint64_t deadline = deadlineAfter(timeoutUs);
  while (true) {
    auto taken = take(sem, 0);
    if (taken.hasValue() || port::nowMicros() >= deadline) {
      return taken;
    }
  }
}

Status FreeRtosScheduler::take(Semaphore* sem, TickType_t ticks) {
  if (sem->kind == SemaphoreKind::RecursiveMutex) {
    return statusFrom(
        xSemaphoreTakeRecursive(sem->handle, ticks), Error::Timeout);
  }
  return statusFrom(xSemaphoreTake(sem->handle, ticks), Error::Timeout);
}

Status FreeRtosScheduler::semaphoreGive(SemaphoreHandle handle) {
  auto sem = static_cast<Semaphore*>(handle);
  if (!sem) {
    return failed(Error::InvalidArgument);
  }
  switch (sem->kind) {
    case SemaphoreKind::Counting:
      return statusFrom(xSemaphoreGive(sem->handle), Error::Full);
    case SemaphoreKind::Mutex:
      if (xSemaphoreGetMutexHolder(sem->handle) !=
          xTaskGetCurrentTaskHandle()) {
        return failed(Error::NotOwner);
      }
      return statusFrom(xSemaphoreGive(sem->handle), Error::NotOwner);
    case SemaphoreKind::RecursiveMutex:
      return statusFrom(
          xSemaphoreGiveRecursive(sem->handle), Error::NotOwner);
  }
  return failed(Error::InvalidArgument);
}
}
}

// Kernel callbacks enabled by FreeRTOSConfig.h.  They live here so that
// any program using the driver pulls them in ahead of the kernel.

extern "C" void vApplicationStackOverflowHook(
    TaskHandle_t task,
    char* name) {
  (void)task;
  preempt::panic("stack overflow in task ", name);
}

extern "C" void vApplicationMallocFailedHook(void) {
  preempt::panic("FreeRTOS heap exhausted");
}

extern "C" void preempt_freertos_assert(const char* file, int line) {
  preempt::panic("FreeRTOS assertion at ", file, ":", line);
}
