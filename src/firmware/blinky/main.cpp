#include "src/libs/driver/Mutex.h"
#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/driver/Timing.h"
#include "src/libs/result/Logging.h"

// A blinker task toggles a (logged) LED and hands a token to a
// reporter task for every toggle.  Works on either scheduler backend.

using namespace preempt;

namespace {
driver::SemaphoreHandle toggled;
Synchronized<uint32_t>* toggles;

void blinker(void*) {
  bool on = false;
  while (true) {
    on = !on;
    logln(on ? "led on" : "led off");
    ++*toggles->lock();

    auto given = driver::semaphoreGive(toggled);
    if (given.hasError()) {
      logWarn("reporter is behind: ", errorName(given.error()));
    }
    delayMilliseconds(500);
  }
}

void reporter(void*) {
  while (true) {
    driver::semaphoreTake(toggled, driver::kForever).panicIfError();
    const uint32_t count = *toggles->lock();
    if (count % 10 == 0) {
      logInfo("toggled ", count, " times");
    }
  }
}

void start(const char* what, driver::TaskEntry entry, uint32_t priority) {
  auto task = driver::taskCreate(
      entry,
      nullptr,
      priority,
      driver::kAnyCore,
      PREEMPT_CONFIG_DEFAULT_STACK_SIZE);
  if (task.hasError()) {
    panic("failed to start ", what, ": ", errorName(task.error()));
  }
}
}

extern "C" void launchTasks(void) {
  static Synchronized<uint32_t> counter(0u);
  toggles = &counter;

  auto sem = driver::semaphoreCreate(driver::SemaphoreKind::Counting, 16, 0);
  if (sem.hasError()) {
    panic("semaphore: ", errorName(sem.error()));
  }
  toggled = sem.value();

  start("reporter", &reporter, 3);
  start("blinker", &blinker, 2);
}
