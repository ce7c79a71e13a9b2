#include "src/libs/freertos/FreeRtosScheduler.h"
#include "src/libs/result/Logging.h"

// This file serves as the second tier startup code for firmware built
// on the FreeRTOS backend.

// Provided by the firmware project to create its tasks.  Runs before
// the kernel is started, so it must not block.
extern "C" void launchTasks(void);

extern "C" int main(void) {
  static preempt::freertos::FreeRtosScheduler scheduler;
  preempt::driver::registerScheduler(&scheduler);
  auto enabled = preempt::driver::enable();
  if (enabled.hasError()) {
    preempt::panic(
        "failed to enable the FreeRTOS driver: ",
        preempt::errorName(enabled.error()));
  }

  // Call out to the firmware-provided function to set
  // up tasks
  launchTasks();

  // And start up the scheduler
  vTaskStartScheduler();
  preempt::panic("vTaskStartScheduler returned");
}
