#include <stdexcept>
#include <string>
#include "lest/lest.hpp"
#include "src/libs/alloc/Heap.h"
#include "src/libs/driver/Mutex.h"
#include "src/libs/sched/CriticalSection.h"
#include "src/libs/sched/Scheduler.h"
#include "src/libs/driver/Timing.h"
using namespace lest;
using namespace preempt;
using namespace preempt::sched;
using driver::SemaphoreHandle;
using driver::SemaphoreKind;
using driver::TaskHandle;
using driver::kAnyCore;
using driver::kForever;

static tests specification;

// Tasks run on their own stacks, so they record what they saw here
// and the test body checks it once control is back on main.
static BaremetalScheduler scheduler;
static std::string trace;
static int counter;
static SemaphoreHandle sharedSem;
static Error observed;
static bool observedOk;
static volatile bool stopSpinning;
static volatile uint64_t spins;

static void resetRecords() {
  trace.clear();
  counter = 0;
  sharedSem = nullptr;
  observed = Error::Timeout;
  observedOk = false;
  stopSpinning = false;
  spins = 0;
}

static size_t heapUsed() {
  return alloc::defaultHeap().stats().used;
}

static void bump(void*) {
  ++counter;
}

static void appendThrice(void* param) {
  const char c = *static_cast<const char*>(param);
  for (int i = 0; i < 3; ++i) {
    trace.push_back(c);
    driver::yieldTask();
  }
}

static void takeShared(void*) {
  auto status = driver::semaphoreTake(sharedSem, kForever);
  observedOk = status.hasValue();
  trace.append("taken");
}

static void giveShared(void*) {
  auto status = driver::semaphoreGive(sharedSem);
  observedOk = status.hasValue();
  if (status.hasError()) {
    observed = status.error();
  }
}

static void takeAndReleaseShared(void*) {
  observedOk = driver::semaphoreTake(sharedSem, kForever).hasValue() &&
      driver::semaphoreGive(sharedSem).hasValue();
}

static void spin(void*) {
  while (!stopSpinning) {
    ++spins;
    port::host::fireTick();
  }
}

static void tryDisable(void*) {
  auto status = scheduler.disable();
  observedOk = status.hasValue();
  if (status.hasError()) {
    observed = status.error();
  }
}

static Synchronized<int>* sharedValue;

static void incrementShared(void*) {
  auto locked = sharedValue->lock();
  ++*locked;
}

// Clobbers its own stack guard before each switch and records the
// panic the switch raises
static void overrunStack(void*) {
  auto self = static_cast<TaskControlBlock*>(driver::currentTask());
  const uint8_t saved = self->stackBottom[0];

  self->stackBottom[0] = 0;
  try {
    driver::yieldTask();
  } catch (const std::runtime_error&) {
    trace.append("yield ");
  }
  self->stackBottom[0] = saved;

  self->stackBottom[0] = 0;
  try {
    driver::usleep(1000);
  } catch (const std::runtime_error&) {
    trace.append("sleep");
  }
  self->stackBottom[0] = saved;
}

static SemaphoreHandle isrSem;

// Runs as an interrupt handler; nothing here may block
static void giveAndTakeInInterrupt(void*) {
  if (port::inInterrupt()) {
    trace.append("isr ");
  }
  if (driver::semaphoreGive(sharedSem).hasValue()) {
    trace.append("give ");
  }
  if (driver::semaphoreTake(isrSem, 0).hasValue()) {
    trace.append("take ");
  }
  if (driver::semaphoreTake(isrSem, kForever).error() == Error::Timeout) {
    trace.append("timeout ");
  }
}

// Hands out at most `budget` blocks from the default heap
class BudgetAllocator : public alloc::StackAllocator {
 public:
  size_t budget{0};
  size_t live{0};

  void* allocate(size_t size, size_t align) override {
    if (budget == 0) {
      return nullptr;
    }
    void* mem = alloc::defaultStackAllocator().allocate(size, align);
    if (mem) {
      --budget;
      ++live;
    }
    return mem;
  }

  void deallocate(void* ptr) override {
    if (ptr) {
      --live;
    }
    alloc::defaultStackAllocator().deallocate(ptr);
  }
};

static void recordThreadSemaphore(void*) {
  sharedSem = driver::currentTaskThreadSemaphore();
}

lest_CASE(specification, "enable and disable") {
  resetRecords();
  const size_t before = heapUsed();
  EXPECT_NOT(scheduler.initialized());
  EXPECT(scheduler.currentTask() == nullptr);
  EXPECT(scheduler.disable().error() == Error::NotStarted);

  EXPECT(scheduler.enable().hasValue());
  EXPECT(scheduler.initialized());
  EXPECT(BaremetalScheduler::active() == &scheduler);
  EXPECT(port::host::tickRunning());
  // main and idle
  EXPECT(scheduler.taskCount() == 2u);
  EXPECT(scheduler.enable().error() == Error::AlreadyStarted);

  auto self = scheduler.currentTask();
  EXPECT(self != nullptr);
  EXPECT(scheduler.taskState(self) == TaskState::Running);
  EXPECT(scheduler.scheduleTaskDeletion(self).error() == Error::InvalidArgument);

  BaremetalScheduler other;
  EXPECT(other.enable().error() == Error::AlreadyStarted);

  EXPECT(scheduler.disable().hasValue());
  EXPECT_NOT(scheduler.initialized());
  EXPECT(BaremetalScheduler::active() == nullptr);
  EXPECT_NOT(port::host::tickRunning());
  EXPECT(scheduler.taskCount() == 0u);
  EXPECT(heapUsed() == before);
}

lest_CASE(specification, "task creation rejects bad arguments") {
  resetRecords();
  EXPECT(
      scheduler.taskCreate(nullptr, nullptr, 1, kAnyCore, 0).error() ==
      Error::InvalidArgument);
  EXPECT(
      scheduler.taskCreate(&bump, nullptr, 1, int32_t(chip::kCores), 0)
          .error() == Error::InvalidCore);
  EXPECT(
      scheduler.taskCreate(&bump, nullptr, 1, -2, 0).error() ==
      Error::InvalidCore);
}

lest_CASE(specification, "priority and stack size are clamped") {
  resetRecords();
  const size_t before = heapUsed();
  auto created = scheduler.taskCreateNamed(
      "clamped", &bump, nullptr, 100000, kAnyCore, 16);
  EXPECT(created.hasValue());
  auto task = static_cast<TaskControlBlock*>(created.value());
  EXPECT(task->priority == PREEMPT_CONFIG_MAX_TASK_PRIORITY);
  EXPECT(task->stackSize == PREEMPT_CONFIG_MIN_STACK_SIZE);
  EXPECT(task->name == "clamped");
  EXPECT(task->stackGuardIntact());
  EXPECT(scheduler.maxTaskPriority() == PREEMPT_CONFIG_MAX_TASK_PRIORITY);

  // Not running yet, so deletion frees it straight away
  EXPECT(scheduler.scheduleTaskDeletion(task).hasValue());
  EXPECT(scheduler.taskCount() == 0u);
  EXPECT(counter == 0);
  EXPECT(heapUsed() == before);
}

lest_CASE(specification, "a supplied allocator backs every task") {
  resetRecords();
  BudgetAllocator budget;
  BaremetalScheduler own(budget);

  // main bookkeeping, idle control block, idle stack
  EXPECT(own.enable().error() == Error::OutOfMemory);
  budget.budget = 1;
  EXPECT(own.enable().error() == Error::OutOfMemory);
  EXPECT_NOT(own.initialized());
  EXPECT(budget.live == 0u);

  budget.budget = 3;
  EXPECT(own.enable().hasValue());
  EXPECT(budget.live == 3u);
  EXPECT(
      own.taskCreate(&bump, nullptr, 1, kAnyCore, 0).error() ==
      Error::OutOfMemory);
  EXPECT(
      own.semaphoreCreate(SemaphoreKind::Counting, 1, 0).error() ==
      Error::OutOfMemory);

  // The control block fits but the stack does not
  budget.budget = 1;
  EXPECT(
      own.taskCreate(&bump, nullptr, 1, kAnyCore, 0).error() ==
      Error::OutOfMemory);
  EXPECT(budget.live == 3u);
  EXPECT(own.taskCount() == 2u);

  budget.budget = 2;
  EXPECT(own.taskCreate(&bump, nullptr, 5, kAnyCore, 0).hasValue());
  EXPECT(counter == 1);

  EXPECT(own.disable().hasValue());
  EXPECT(budget.live == 0u);
}

lest_CASE(specification, "attaching a core") {
  resetRecords();
  EXPECT(scheduler.attachCore().error() == Error::NotStarted);
  EXPECT(scheduler.enable().hasValue());
  // The core that enabled the scheduler is already attached
  EXPECT(scheduler.attachCore().error() == Error::AlreadyStarted);
  EXPECT(scheduler.taskCount() == 2u);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "tasks created before enable run afterwards") {
  resetRecords();
  EXPECT(scheduler.taskCreate(&bump, nullptr, 1, kAnyCore, 0).hasValue());
  EXPECT(counter == 0);
  EXPECT(scheduler.enable().hasValue());
  EXPECT(scheduler.taskCount() == 3u);
  scheduler.yieldTask();
  EXPECT(counter == 1);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "a higher priority task runs at once") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto created = driver::taskCreate(&bump, nullptr, 5, kAnyCore, 0);
  EXPECT(created.hasValue());
  EXPECT(counter == 1);
  // Its entry returned, so it is gone
  EXPECT(scheduler.taskState(created.value()) == TaskState::Deleted);
  scheduler.yieldTask();
  EXPECT(scheduler.taskCount() == 2u);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "yield does not hand over to lower priorities") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  static const char h = 'h';
  EXPECT(scheduler.taskCreate(&appendThrice, (void*)&h, 3, kAnyCore, 0)
             .hasValue());
  EXPECT(trace == "hhh");
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "equal priorities take turns") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  static const char a = 'a';
  static const char b = 'b';
  auto first = scheduler.taskCreate(&appendThrice, (void*)&a, 1, kAnyCore, 0);
  auto second =
      scheduler.taskCreate(&appendThrice, (void*)&b, 1, kAnyCore, 0);
  EXPECT(trace.empty());

  while (trace.size() < 6) {
    driver::yieldTask();
  }
  EXPECT(trace == "ababab");

  while (scheduler.taskState(first.value()) != TaskState::Deleted ||
         scheduler.taskState(second.value()) != TaskState::Deleted) {
    driver::yieldTask();
  }
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "the tick preempts a busy task") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  const uint64_t ticks = scheduler.tickCount();
  EXPECT(scheduler.taskCreate(&spin, nullptr, 1, kAnyCore, 0).hasValue());
  driver::yieldTask();
  const uint64_t spun = spins;
  EXPECT(spun >= 1u);
  EXPECT(scheduler.tickCount() > ticks);

  stopSpinning = true;
  driver::yieldTask();
  EXPECT(scheduler.taskCount() <= 3u);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "a clobbered stack guard panics on the next switch") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto task = scheduler.taskCreate(
      &overrunStack, nullptr, PREEMPT_CONFIG_MAIN_TASK_PRIORITY, kAnyCore, 0);
  EXPECT(task.hasValue());
  while (scheduler.taskState(task.value()) != TaskState::Deleted) {
    driver::yieldTask();
  }
  EXPECT(trace == "yield sleep");
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "usleep blocks until the deadline") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  const uint64_t ticks = scheduler.tickCount();
  const uint64_t start = driver::now();
  driver::usleep(30000);
  EXPECT(driver::now() - start >= 30000u);
  EXPECT(scheduler.tickCount() > ticks);

  delayMilliseconds(20);
  EXPECT(driver::now() - start >= 50000u);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "usleep without the scheduler busy waits") {
  const uint64_t start = scheduler.now();
  scheduler.usleep(2000);
  EXPECT(scheduler.now() - start >= 2000u);
}

lest_CASE(specification, "semaphore give wakes a blocked task") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto sem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 0);
  EXPECT(sem.hasValue());
  sharedSem = sem.value();

  auto waiter = scheduler.taskCreate(&takeShared, nullptr, 2, kAnyCore, 0);
  EXPECT(waiter.hasValue());
  EXPECT(scheduler.taskState(waiter.value()) == TaskState::Blocked);
  EXPECT(trace.empty());

  EXPECT(scheduler.semaphoreGive(sharedSem).hasValue());
  EXPECT(trace == "taken");
  EXPECT(observedOk);
  EXPECT(scheduler.taskState(waiter.value()) == TaskState::Deleted);

  scheduler.semaphoreDelete(sharedSem);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "semaphore take times out") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto sem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 2, 0);
  EXPECT(sem.hasValue());

  auto poll = scheduler.semaphoreTake(sem.value(), 0);
  EXPECT(poll.error() == Error::Timeout);

  const uint64_t start = scheduler.now();
  auto waited = scheduler.semaphoreTake(sem.value(), 25000);
  EXPECT(waited.error() == Error::Timeout);
  EXPECT(scheduler.now() - start >= 25000u);

  EXPECT(scheduler.semaphoreGive(sem.value()).hasValue());
  EXPECT(scheduler.semaphoreGive(sem.value()).hasValue());
  EXPECT(scheduler.semaphoreGive(sem.value()).error() == Error::Full);
  EXPECT(scheduler.semaphoreTake(sem.value(), 25000).hasValue());
  EXPECT(scheduler.semaphoreTake(sem.value(), 0).hasValue());

  scheduler.semaphoreDelete(sem.value());
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "semaphores are usable from interrupt handlers") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  sharedSem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 0).value();
  isrSem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 1).value();
  auto waiter = scheduler.taskCreate(&takeShared, nullptr, 2, kAnyCore, 0);
  EXPECT(scheduler.taskState(waiter.value()) == TaskState::Blocked);

  port::host::raiseInterrupt(&giveAndTakeInInterrupt, nullptr);
  // The woken waiter ran as the interrupt returned
  EXPECT(trace == "isr give take timeout taken");
  EXPECT(observedOk);
  EXPECT_NOT(port::inInterrupt());

  scheduler.yieldTask();
  scheduler.semaphoreDelete(sharedSem);
  scheduler.semaphoreDelete(isrSem);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "semaphores without the scheduler") {
  auto sem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 1);
  EXPECT(sem.hasValue());
  EXPECT(scheduler.semaphoreTake(sem.value(), 1000).hasValue());
  EXPECT(scheduler.semaphoreTake(sem.value(), 1000).error() == Error::Timeout);
  scheduler.semaphoreDelete(sem.value());

  EXPECT(
      scheduler.semaphoreCreate(SemaphoreKind::Counting, 0, 0).error() ==
      Error::InvalidArgument);
  EXPECT(
      scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 2).error() ==
      Error::InvalidArgument);
  EXPECT(scheduler.semaphoreTake(nullptr, 0).error() == Error::InvalidArgument);
  EXPECT(scheduler.semaphoreGive(nullptr).error() == Error::InvalidArgument);
}

lest_CASE(specification, "mutexes belong to the task holding them") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto mutex = scheduler.semaphoreCreate(SemaphoreKind::Mutex, 0, 0);
  EXPECT(mutex.hasValue());
  sharedSem = mutex.value();
  EXPECT(scheduler.semaphoreTake(sharedSem, kForever).hasValue());

  EXPECT(scheduler.taskCreate(&giveShared, nullptr, 2, kAnyCore, 0)
             .hasValue());
  EXPECT_NOT(observedOk);
  EXPECT(observed == Error::NotOwner);

  auto contender =
      scheduler.taskCreate(&takeAndReleaseShared, nullptr, 2, kAnyCore, 0);
  EXPECT(scheduler.taskState(contender.value()) == TaskState::Blocked);
  EXPECT(scheduler.semaphoreGive(sharedSem).hasValue());
  EXPECT(observedOk);
  EXPECT(scheduler.semaphoreTake(sharedSem, 0).hasValue());
  EXPECT(scheduler.semaphoreGive(sharedSem).hasValue());

  scheduler.semaphoreDelete(sharedSem);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "recursive mutexes nest") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto mutex = scheduler.semaphoreCreate(SemaphoreKind::RecursiveMutex, 0, 0);
  EXPECT(mutex.hasValue());
  EXPECT(scheduler.semaphoreTake(mutex.value(), kForever).hasValue());
  EXPECT(scheduler.semaphoreTake(mutex.value(), kForever).hasValue());
  EXPECT(scheduler.semaphoreGive(mutex.value()).hasValue());
  EXPECT(scheduler.semaphoreGive(mutex.value()).hasValue());
  EXPECT(scheduler.semaphoreGive(mutex.value()).error() == Error::NotOwner);
  scheduler.semaphoreDelete(mutex.value());
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "every task has its own thread semaphore") {
  resetRecords();
  EXPECT_THROWS_AS(scheduler.currentTaskThreadSemaphore(), std::runtime_error);

  EXPECT(scheduler.enable().hasValue());
  auto mine = scheduler.currentTaskThreadSemaphore();
  EXPECT(mine != nullptr);
  EXPECT(scheduler.currentTaskThreadSemaphore() == mine);

  EXPECT(scheduler.taskCreate(&recordThreadSemaphore, nullptr, 2, kAnyCore, 0)
             .hasValue());
  EXPECT(sharedSem != nullptr);
  EXPECT(sharedSem != mine);

  EXPECT(scheduler.semaphoreTake(mine, 0).error() == Error::Timeout);
  EXPECT(scheduler.semaphoreGive(mine).hasValue());
  EXPECT(scheduler.semaphoreGive(mine).error() == Error::Full);
  EXPECT(scheduler.semaphoreTake(mine, 0).hasValue());
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "synchronized values are reached under the lock") {
  resetRecords();
  const size_t before = heapUsed();
  EXPECT(scheduler.enable().hasValue());
  {
    Synchronized<int> value(41);
    sharedValue = &value;
    {
      auto held = value.lock();
      auto worker =
          scheduler.taskCreate(&incrementShared, nullptr, 2, kAnyCore, 0);
      EXPECT(scheduler.taskState(worker.value()) == TaskState::Blocked);
      EXPECT(*held == 41);
    }
    EXPECT(*value.lock() == 42);

    Mutex mutex;
    auto first = mutex.lock();
    auto second = mutex.lock(5);
    EXPECT(second.hasError());
    EXPECT(second.error() == Error::Timeout);
  }
  EXPECT(scheduler.disable().hasValue());
  EXPECT(heapUsed() == before);
}

lest_CASE(specification, "deleting another task") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  auto sem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 0);
  sharedSem = sem.value();
  auto waiter = scheduler.taskCreate(&takeShared, nullptr, 1, kAnyCore, 0);
  driver::yieldTask();
  EXPECT(scheduler.taskState(waiter.value()) == TaskState::Blocked);
  EXPECT(scheduler.taskCount() == 3u);

  int unknown = 0;
  EXPECT(
      scheduler.scheduleTaskDeletion(&unknown).error() ==
      Error::InvalidArgument);

  EXPECT(scheduler.scheduleTaskDeletion(waiter.value()).hasValue());
  EXPECT(scheduler.taskState(waiter.value()) == TaskState::Deleted);
  driver::yieldTask();
  EXPECT(scheduler.taskCount() == 2u);
  EXPECT(trace.empty());

  scheduler.semaphoreDelete(sharedSem);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "only main may disable") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  EXPECT(scheduler.taskCreate(&tryDisable, nullptr, 2, kAnyCore, 0)
             .hasValue());
  EXPECT_NOT(observedOk);
  EXPECT(observed == Error::InvalidArgument);
  EXPECT(scheduler.initialized());
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "disable releases tasks still alive") {
  resetRecords();
  const size_t before = heapUsed();
  EXPECT(scheduler.enable().hasValue());
  auto sem = scheduler.semaphoreCreate(SemaphoreKind::Counting, 1, 0);
  sharedSem = sem.value();
  auto waiter = scheduler.taskCreate(&takeShared, nullptr, 2, kAnyCore, 0);
  EXPECT(scheduler.taskState(waiter.value()) == TaskState::Blocked);

  EXPECT(scheduler.disable().hasValue());
  EXPECT(scheduler.taskCount() == 0u);
  scheduler.semaphoreDelete(sharedSem);
  EXPECT(heapUsed() == before);
}

lest_CASE(specification, "suspended switching defers a yield") {
  resetRecords();
  EXPECT(scheduler.enable().hasValue());
  {
    SuspendSwitching suspended;
    EXPECT(scheduler.taskCreate(&bump, nullptr, 5, kAnyCore, 0).hasValue());
    EXPECT(counter == 0);
    {
      SuspendSwitching nested;
    }
    EXPECT(counter == 0);
  }
  EXPECT(counter == 1);
  EXPECT(scheduler.disable().hasValue());
}

lest_CASE(specification, "critical sections nest") {
  EXPECT_NOT(port::inInterrupt());
  {
    CriticalSection outer;
    {
      CriticalSection inner;
    }
    // The outer section still masks
    EXPECT(port::disableInterrupts() == 1u);
    port::restoreInterrupts(1);
  }
  EXPECT(port::disableInterrupts() == 0u);
  port::restoreInterrupts(0);
}

lest_CASE(specification, "the cross core lock excludes other cores") {
  detail::CoreLock lock{0, 0};
  // Owners are core + 1
  EXPECT(lock.tryAcquire(1));
  EXPECT(lock.tryAcquire(1));
  EXPECT_NOT(lock.tryAcquire(2));

  lock.release();
  EXPECT_NOT(lock.tryAcquire(2));
  lock.release();
  EXPECT(lock.owner == 0u);

  EXPECT(lock.tryAcquire(2));
  EXPECT_NOT(lock.tryAcquire(1));
  lock.release();
  EXPECT(lock.tryAcquire(1));
  lock.release();
}

lest_CASE(specification, "millisecond conversion saturates") {
  EXPECT(millisecondsToMicros(0) == 0u);
  EXPECT(millisecondsToMicros(5) == 5000u);
  EXPECT(millisecondsToMicros(kInfiniteMs) == kForever);
  EXPECT(kTickPeriodUs == 1000000u / PREEMPT_CONFIG_TICK_RATE_HZ);
}

int main(int argc, char* argv[]) {
  driver::registerScheduler(&scheduler);
  return run(specification, argc, argv);
}
