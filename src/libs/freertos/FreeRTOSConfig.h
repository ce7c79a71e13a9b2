#pragma once
// Kernel configuration for the FreeRTOS scheduler backend.  Stack,
// tick and heap figures follow src/libs/config/PreemptConfig.h so the
// two backends give tasks the same limits.
#include "src/libs/config/PreemptConfig.h"

#ifdef __PREEMPT_HOST_BOARD
// The POSIX port runs tasks as host threads
#define configCPU_CLOCK_HZ 1000000U
#else
#define configCPU_CLOCK_HZ 160000000U
#endif

#define configMINIMAL_STACK_SIZE \
  (PREEMPT_CONFIG_MIN_STACK_SIZE / sizeof(StackType_t))
#define configSTACK_DEPTH_TYPE uint32_t
#define configTICK_RATE_HZ PREEMPT_CONFIG_TICK_RATE_HZ
#define configUSE_16_BIT_TICKS 0
#define configTOTAL_HEAP_SIZE PREEMPT_CONFIG_HEAP_SIZE

#define configUSE_PREEMPTION 1
#define configUSE_IDLE_HOOK 0
#define configUSE_TICK_HOOK 0
#define configMAX_PRIORITIES 25
#define configMAX_TASK_NAME_LEN PREEMPT_CONFIG_MAX_TASK_NAME_LEN
#define configUSE_TRACE_FACILITY 0
#define configIDLE_SHOULD_YIELD 1
#define configUSE_TICKLESS_IDLE 0
#define configUSE_MUTEXES 1
#define configUSE_RECURSIVE_MUTEXES 1
#define configUSE_COUNTING_SEMAPHORES 1
#define configUSE_QUEUE_SETS 0
#define configQUEUE_REGISTRY_SIZE 0
#define configUSE_TIME_SLICING 1
#define configCHECK_FOR_STACK_OVERFLOW 2
#define configUSE_MALLOC_FAILED_HOOK 1

// Slot 0 holds the task's thread semaphore
#define configNUM_THREAD_LOCAL_STORAGE_POINTERS 1

#define configSUPPORT_STATIC_ALLOCATION 0
#define configSUPPORT_DYNAMIC_ALLOCATION 1

#define configUSE_TIMERS 0
#define configTIMER_TASK_PRIORITY 3U
#define configTIMER_QUEUE_LENGTH 10U
#define configTIMER_TASK_STACK_DEPTH configMINIMAL_STACK_SIZE

#define configUSE_CO_ROUTINES 0

#define INCLUDE_vTaskPrioritySet 0
#define INCLUDE_uxTaskPriorityGet 0
#define INCLUDE_vTaskDelete 1
#define INCLUDE_vTaskCleanUpResources 0
#define INCLUDE_vTaskSuspend 1
#define INCLUDE_vResumeFromISR 1
#define INCLUDE_vTaskDelayUntil 1
#define INCLUDE_vTaskDelay 1
#define INCLUDE_xTaskGetSchedulerState 1
#define INCLUDE_xTaskGetIdleTaskHandle 1
#define INCLUDE_xTaskGetCurrentTaskHandle 1
#define INCLUDE_xSemaphoreGetMutexHolder 1
#define INCLUDE_uxTaskGetStackHighWaterMark 1

#ifdef __cplusplus
extern "C" {
#endif
void preempt_freertos_assert(const char* file, int line);
#ifdef __cplusplus
}
#endif
#define configASSERT(x)                          \
  if ((x) == 0) {                                \
    preempt_freertos_assert(__FILE__, __LINE__); \
  }
