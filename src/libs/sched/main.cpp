#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/result/Logging.h"
#include "src/libs/sched/Scheduler.h"
#include "src/libs/driver/Timing.h"

// This file serves as the second tier startup code for firmware built
// on the bare-metal scheduler.  The chip runtime calls main() once the
// heap and interrupts are set up.

// This function is provided by the firmware project to create the
// tasks that will be run by the firmware.  It runs as the main task,
// with multitasking already enabled.
extern "C" void launchTasks(void);

extern "C" int main(void) {
  static preempt::sched::BaremetalScheduler scheduler;
  preempt::driver::registerScheduler(&scheduler);
  auto enabled = preempt::driver::enable();
  if (enabled.hasError()) {
    preempt::panic(
        "failed to start the scheduler: ",
        preempt::errorName(enabled.error()));
  }

  launchTasks();

  // main cannot be deleted; park it
  preempt::delayMilliseconds(preempt::kInfiniteMs);
}
