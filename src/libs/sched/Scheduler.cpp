#include "src/libs/sched/Scheduler.h"
#include <new>
#include "src/libs/result/Logging.h"
#include "src/libs/sched/CriticalSection.h"

namespace preempt {
namespace sched {

using driver::SemaphoreHandle;
using driver::SemaphoreKind;
using driver::TaskEntry;
using driver::TaskHandle;

namespace {
BaremetalScheduler* activeScheduler = nullptr;

constexpr size_t kStackAlign = 16;
}

#if PREEMPT_CONFIG_USE_HEAP_ALLOCATOR
BaremetalScheduler::BaremetalScheduler()
    : BaremetalScheduler(alloc::defaultStackAllocator()) {}
#endif

BaremetalScheduler::BaremetalScheduler(alloc::StackAllocator& allocator)
    : allocator_(allocator),
      current_{},
      idle_{},
      main_(nullptr),
      enabled_(false),
      ticks_(0),
      nextTaskId_(0) {}

BaremetalScheduler::~BaremetalScheduler() {
  if (enabled_) {
    CriticalSection cs;
    port::stopTickTimer();
    port::disableMultitasking();
    port::installSwitchHandler(nullptr);
    enabled_ = false;
    activeScheduler = nullptr;
  }
  releaseAll();
}

BaremetalScheduler* BaremetalScheduler::active() {
  return activeScheduler;
}

bool BaremetalScheduler::initialized() {
  return enabled_;
}

Status BaremetalScheduler::enable() {
  const uint8_t core = port::currentCore();
  {
    CriticalSection cs;
    if (enabled_ || activeScheduler) {
      return failed(Error::AlreadyStarted);
    }
  }

  auto main = createBookkeeping(core);
  if (main.hasError()) {
    return failed(main.error());
  }
  auto idle = createTask(
      "idle",
      &idleLoop,
      this,
      0,
      int8_t(core),
      PREEMPT_CONFIG_IDLE_STACK_SIZE);
  if (idle.hasError()) {
    freeTask(main.value());
    return failed(idle.error());
  }

  {
    CriticalSection cs;
    main_ = main.value();
    tasks_.insert(main_);
    current_[core] = main_;
    idle_[core] = idle.value();
    ticks_ = 0;
    activeScheduler = this;
    enabled_ = true;
    port::installSwitchHandler(&onSwitchInterrupt);
    port::setupMultitasking();
    port::startTickTimer(PREEMPT_CONFIG_TICK_RATE_HZ);
  }
  logInfo(
      "scheduler enabled on core ",
      core,
      ", tick ",
      PREEMPT_CONFIG_TICK_RATE_HZ,
      " Hz");
  return ok();
}

Status BaremetalScheduler::disable() {
  {
    CriticalSection cs;
    if (!enabled_) {
      return failed(Error::NotStarted);
    }
    if (current() != main_) {
      return failed(Error::InvalidArgument);
    }
    port::stopTickTimer();
    port::disableMultitasking();
    port::installSwitchHandler(nullptr);
    enabled_ = false;
    activeScheduler = nullptr;
  }

  const size_t abandoned = releaseAll();
  if (abandoned) {
    logWarn("scheduler disabled with ", abandoned, " tasks still alive");
  } else {
    logInfo("scheduler disabled");
  }
  return ok();
}

Status BaremetalScheduler::attachCore() {
  const uint8_t core = port::currentCore();
  if (core >= chip::kCores) {
    return failed(Error::InvalidCore);
  }
  {
    CriticalSection cs;
    if (!enabled_) {
      return failed(Error::NotStarted);
    }
    if (current_[core]) {
      return failed(Error::AlreadyStarted);
    }
  }

  auto main = createBookkeeping(core);
  if (main.hasError()) {
    return failed(main.error());
  }
  auto idle = createTask(
      "idle",
      &idleLoop,
      this,
      0,
      int8_t(core),
      PREEMPT_CONFIG_IDLE_STACK_SIZE);
  if (idle.hasError()) {
    freeTask(main.value());
    return failed(idle.error());
  }

  CriticalSection cs;
  tasks_.insert(main.value());
  current_[core] = main.value();
  idle_[core] = idle.value();
  port::setupMultitasking();
  return ok();
}

void BaremetalScheduler::yieldTask() {
  if (!enabled_) {
    return;
  }
  if (port::inInterrupt()) {
    yieldTaskFromIsr();
    return;
  }
  port::requestYield();
}

void BaremetalScheduler::yieldTaskFromIsr() {
  if (enabled_) {
    port::requestYield();
  }
}

uint32_t BaremetalScheduler::maxTaskPriority() {
  return PREEMPT_CONFIG_MAX_TASK_PRIORITY;
}

Result<TaskHandle, Error> BaremetalScheduler::taskCreate(
    TaskEntry entry,
    void* param,
    uint32_t priority,
    int32_t pinToCore,
    size_t stackSize) {
  return taskCreateNamed(
      nullptr, entry, param, priority, pinToCore, stackSize);
}

Result<TaskHandle, Error> BaremetalScheduler::taskCreateNamed(
    const char* name,
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
  if (priority > PREEMPT_CONFIG_MAX_TASK_PRIORITY) {
    priority = PREEMPT_CONFIG_MAX_TASK_PRIORITY;
  }
  if (stackSize < PREEMPT_CONFIG_MIN_STACK_SIZE) {
    stackSize = PREEMPT_CONFIG_MIN_STACK_SIZE;
  }

  TaskName label;
  if (name) {
    label.append(name);
  } else {
    CriticalSection cs;
    label.append("task");
    label.appendDecimal(uint64_t(++nextTaskId_));
  }

  auto created = createTask(
      label.c_str(),
      entry,
      param,
      uint8_t(priority),
      int8_t(pinToCore),
      stackSize);
  if (created.hasError()) {
    return R::Error(created.error());
  }

  auto task = created.value();
  bool switchNow = false;
  {
    CriticalSection cs;
    auto running = current();
    switchNow = enabled_ && running && task->priority > running->priority &&
        task->runnableOn(port::currentCore());
  }
  if (switchNow) {
    yieldTask();
  }
  return R::Ok(task);
}

TaskHandle BaremetalScheduler::currentTask() {
  CriticalSection cs;
  return current();
}

Status BaremetalScheduler::scheduleTaskDeletion(TaskHandle handle) {
  TaskControlBlock* task;
  {
    CriticalSection cs;
    task = handle ? static_cast<TaskControlBlock*>(handle) : current();
    if (!task || !tasks_.contains(task)) {
      return failed(Error::InvalidArgument);
    }
    // main tasks and idle tasks are part of the scheduler
    if (!task->ownsStack() || isIdle(task)) {
      return failed(Error::InvalidArgument);
    }
    if (task->state == TaskState::Deleted) {
      return ok();
    }
    task->state = TaskState::Deleted;
    task->waitingOn = nullptr;
    task->wakeAt = kNoDeadline;
    if (!enabled_) {
      tasks_.remove(task);
      freeTask(task);
      return ok();
    }
  }

  if (task == currentTask()) {
    port::requestYield();
    // Spin until the switch interrupt takes us away for good
    while (true) {
    }
  }
  return ok();
}

SemaphoreHandle BaremetalScheduler::currentTaskThreadSemaphore() {
  auto task = currentTask();
  if (!task) {
    panic("thread semaphore requested outside of a task");
  }
  auto tcb = static_cast<TaskControlBlock*>(task);
  {
    CriticalSection cs;
    if (tcb->threadSemaphore) {
      return tcb->threadSemaphore;
    }
  }

  auto sem = semaphoreCreate(SemaphoreKind::Counting, 1, 0);
  if (sem.hasError()) {
    panic("no memory for the thread semaphore of ", tcb->name);
  }
  CriticalSection cs;
  tcb->threadSemaphore = static_cast<Semaphore*>(sem.value());
  return tcb->threadSemaphore;
}

void BaremetalScheduler::usleep(uint32_t us) {
  const uint64_t deadline = port::nowMicros() + us;
  if (!enabled_ || port::inInterrupt()) {
    while (port::nowMicros() < deadline) {
    }
    return;
  }
  if (us == 0) {
    yieldTask();
    return;
  }

  while (true) {
    CriticalSection cs;
    if (port::nowMicros() >= deadline) {
      return;
    }
    auto task = current();
    task->state = TaskState::Sleeping;
    task->wakeAt = deadline;
    // Taken once the critical section ends
    port::requestYield();
  }
}

uint64_t BaremetalScheduler::now() {
  return port::nowMicros();
}

Result<SemaphoreHandle, Error> BaremetalScheduler::semaphoreCreate(
    SemaphoreKind kind,
    uint32_t max,
    uint32_t initial) {
  using R = Result<SemaphoreHandle, Error>;
  if (kind == SemaphoreKind::Counting && (max == 0 || initial > max)) {
    return R::Error(Error::InvalidArgument);
  }
  void* mem = allocator_.allocate(sizeof(Semaphore), alignof(Semaphore));
  if (!mem) {
    return R::Error(Error::OutOfMemory);
  }
  return R::Ok(new (mem) Semaphore(kind, max, initial));
}

void BaremetalScheduler::semaphoreDelete(SemaphoreHandle handle) {
  if (!handle) {
    return;
  }
  auto sem = static_cast<Semaphore*>(handle);
  {
    CriticalSection cs;
    auto waiter = tasks_.highestWaiter(sem);
    if (waiter) {
      panic("semaphore deleted while ", waiter->name, " waits on it");
    }
  }
  sem->~Semaphore();
  allocator_.deallocate(sem);
}

Status BaremetalScheduler::semaphoreTake(
    SemaphoreHandle handle,
    uint32_t timeoutUs) {
  auto sem = static_cast<Semaphore*>(handle);
  if (!sem) {
    return failed(Error::InvalidArgument);
  }
  const uint64_t deadline = timeoutUs == driver::kForever
      ? kNoDeadline
      : port::nowMicros() + timeoutUs;

  if (timeoutUs == 0 || port::inInterrupt()) {
    CriticalSection cs;
    return sem->tryTake(ownerToken()) ? ok() : failed(Error::Timeout);
  }

  if (!enabled_) {
    // Nothing to switch to; poll for an interrupt handler to give
    while (true) {
      {
        CriticalSection cs;
        if (sem->tryTake(ownerToken())) {
          return ok();
        }
      }
      if (port::nowMicros() >= deadline) {
        return failed(Error::Timeout);
      }
    }
  }

  while (true) {
    CriticalSection cs;
    auto task = current();
    task->waitingOn = nullptr;
    if (sem->tryTake(task)) {
      task->timedOut = false;
      return ok();
    }
    if (task->timedOut || port::nowMicros() >= deadline) {
      task->timedOut = false;
      return failed(Error::Timeout);
    }
    task->state = TaskState::Blocked;
    task->waitingOn = sem;
    task->wakeAt = deadline;
    port::requestYield();
  }
}

Status BaremetalScheduler::semaphoreGive(SemaphoreHandle handle) {
  auto sem = static_cast<Semaphore*>(handle);
  if (!sem) {
    return failed(Error::InvalidArgument);
  }

  bool yield = false;
  {
    CriticalSection cs;
    auto status = sem->give(ownerToken());
    if (status.hasError()) {
      return status;
    }
    auto waiter = tasks_.highestWaiter(sem);
    if (waiter) {
      waiter->state = TaskState::Ready;
      waiter->waitingOn = nullptr;
      waiter->wakeAt = kNoDeadline;
      auto running = current();
      yield = enabled_ && (!running || waiter->priority > running->priority);
    }
  }
  if (yield) {
    yieldTask();
  }
  return ok();
}

size_t BaremetalScheduler::taskCount() {
  CriticalSection cs;
  return tasks_.size();
}

uint64_t BaremetalScheduler::tickCount() {
  CriticalSection cs;
  return ticks_;
}

TaskState BaremetalScheduler::taskState(TaskHandle handle) {
  CriticalSection cs;
  auto task = static_cast<TaskControlBlock*>(handle);
  if (!task || !tasks_.contains(task)) {
    return TaskState::Deleted;
  }
  return task->state;
}

Result<TaskControlBlock*, Error> BaremetalScheduler::createTask(
    const char* name,
    TaskEntry entry,
    void* param,
    uint8_t priority,
    int8_t affinity,
    size_t stackSize) {
  using R = Result<TaskControlBlock*, Error>;
  void* mem =
      allocator_.allocate(sizeof(TaskControlBlock), alignof(TaskControlBlock));
  if (!mem) {
    return R::Error(Error::OutOfMemory);
  }
  void* stack = allocator_.allocate(stackSize, kStackAlign);
  if (!stack) {
    allocator_.deallocate(mem);
    logWarn("no memory for a ", stackSize, " byte stack for ", name);
    return R::Error(Error::OutOfMemory);
  }

  auto task = new (mem) TaskControlBlock();
  task->name.append(name);
  task->entry = entry;
  task->param = param;
  task->priority = priority;
  task->affinity = affinity;
  task->stackBottom = static_cast<uint8_t*>(stack);
  task->stackSize = stackSize;
  task->paintStackGuard();
  port::initTaskContext(
      task->context, &taskTrampoline, task, stack, stackSize);

  {
    CriticalSection cs;
    tasks_.insert(task);
  }
  logDebug("created ", task->name, " priority ", priority);
  return R::Ok(task);
}

Result<TaskControlBlock*, Error> BaremetalScheduler::createBookkeeping(
    uint8_t core) {
  using R = Result<TaskControlBlock*, Error>;
  void* mem =
      allocator_.allocate(sizeof(TaskControlBlock), alignof(TaskControlBlock));
  if (!mem) {
    return R::Error(Error::OutOfMemory);
  }
  auto task = new (mem) TaskControlBlock();
  task->name.append("main");
  if (core != 0) {
    task->name.appendDecimal(uint64_t(core));
  }
  task->priority = PREEMPT_CONFIG_MAIN_TASK_PRIORITY;
  task->affinity = int8_t(core);
  task->core = core;
  task->state = TaskState::Running;
  return R::Ok(task);
}

void BaremetalScheduler::freeTask(TaskControlBlock* task) {
  if (task->threadSemaphore) {
    task->threadSemaphore->~Semaphore();
    allocator_.deallocate(task->threadSemaphore);
  }
  if (task->ownsStack()) {
    allocator_.deallocate(task->stackBottom);
  }
  task->~TaskControlBlock();
  allocator_.deallocate(task);
}

size_t BaremetalScheduler::releaseAll() {
  size_t abandoned = 0;
  CriticalSection cs;
  while (!tasks_.empty()) {
    auto task = tasks_.head();
    tasks_.remove(task);
    if (task->ownsStack() && !isIdle(task) &&
        task->state != TaskState::Deleted) {
      ++abandoned;
    }
    freeTask(task);
  }
  for (auto& task : current_) {
    task = nullptr;
  }
  for (auto& task : idle_) {
    task = nullptr;
  }
  main_ = nullptr;
  return abandoned;
}

bool BaremetalScheduler::isIdle(const TaskControlBlock* task) const {
  for (auto idle : idle_) {
    if (idle == task) {
      return true;
    }
  }
  return false;
}

bool BaremetalScheduler::isCurrent(const TaskControlBlock* task) const {
  for (auto running : current_) {
    if (running == task) {
      return true;
    }
  }
  return false;
}

TaskControlBlock* BaremetalScheduler::current() const {
  return current_[port::currentCore()];
}

const void* BaremetalScheduler::ownerToken() const {
  auto task = current();
  if (task) {
    return task;
  }
  return this;
}

// Deleted tasks are released once no core is running on their stack
void BaremetalScheduler::reapDeleted() {
  while (true) {
    TaskControlBlock* victim = nullptr;
    tasks_.forEach([&](TaskControlBlock* task) {
      if (!victim && task->state == TaskState::Deleted && !isCurrent(task)) {
        victim = task;
      }
    });
    if (!victim) {
      return;
    }
    tasks_.remove(victim);
    logDebug("reaped ", victim->name);
    freeTask(victim);
  }
}

void BaremetalScheduler::switchTask(bool tick) {
  // Held until the new task is published in current_ and its frame is
  // loaded, so two cores never pick the same task
  detail::CoreLockGuard lock;
  if (!enabled_) {
    return;
  }
  if (tick) {
    ++ticks_;
  }
  if (SuspendSwitching::deferIfSuspended()) {
    return;
  }

  const uint8_t core = port::currentCore();
  TaskControlBlock* const running = current_[core];
  if (!running) {
    // This core has not been attached
    return;
  }

  tasks_.wakeExpired(port::nowMicros());
  reapDeleted();

  TaskControlBlock* next = tasks_.selectNext(running, core);
  if (!next) {
    next = idle_[core];
  }
  if (!next || next == running) {
    return;
  }

  checkStackGuard(*running);
  const bool demoted = running->state == TaskState::Running;
  if (demoted) {
    running->state = TaskState::Ready;
  }
  next->state = TaskState::Running;
  next->core = core;
  ++next->switches;
  current_[core] = next;

  if (!port::switchContext(running->context, next->context)) {
    // A switch is still in flight; the next interrupt retries
    next->state = TaskState::Ready;
    --next->switches;
    current_[core] = running;
    if (demoted) {
      running->state = TaskState::Running;
    }
  }
}

void BaremetalScheduler::onSwitchInterrupt(bool tick) {
  if (activeScheduler) {
    activeScheduler->switchTask(tick);
  }
}

void BaremetalScheduler::taskTrampoline(void* param) {
  auto task = static_cast<TaskControlBlock*>(param);
  task->entry(task->param);

  // Returning from the entry function deletes the task
  auto scheduler = activeScheduler;
  if (!scheduler) {
    panic("task ", task->name, " returned while no scheduler is enabled");
  }
  scheduler->scheduleTaskDeletion(nullptr).panicIfError();
  panic("deleted task ", task->name, " resumed");
}

void BaremetalScheduler::idleLoop(void*) {
  while (true) {
    port::waitForInterrupt();
  }
}
}
}
