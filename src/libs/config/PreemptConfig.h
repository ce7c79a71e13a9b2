#pragma once
// Build time configuration for the scheduler.  Every value may be
// overridden from the build with -D.

#ifdef __PREEMPT_HOST_BOARD
// Host task stacks also carry libc, stdio and the test harness
#ifndef PREEMPT_CONFIG_MIN_STACK_SIZE
#define PREEMPT_CONFIG_MIN_STACK_SIZE 65536U
#endif
#ifndef PREEMPT_CONFIG_HEAP_SIZE
#define PREEMPT_CONFIG_HEAP_SIZE (8U * 1024U * 1024U)
#endif
#else
#ifndef PREEMPT_CONFIG_MIN_STACK_SIZE
#define PREEMPT_CONFIG_MIN_STACK_SIZE 1024U
#endif
#ifndef PREEMPT_CONFIG_HEAP_SIZE
#define PREEMPT_CONFIG_HEAP_SIZE (72U * 1024U)
#endif
#endif

#ifndef PREEMPT_CONFIG_TICK_RATE_HZ
#define PREEMPT_CONFIG_TICK_RATE_HZ 100U
#endif

#ifndef PREEMPT_CONFIG_DEFAULT_STACK_SIZE
#define PREEMPT_CONFIG_DEFAULT_STACK_SIZE (PREEMPT_CONFIG_MIN_STACK_SIZE * 4U)
#endif

#ifndef PREEMPT_CONFIG_IDLE_STACK_SIZE
#define PREEMPT_CONFIG_IDLE_STACK_SIZE PREEMPT_CONFIG_MIN_STACK_SIZE
#endif

#ifndef PREEMPT_CONFIG_MAX_TASK_PRIORITY
#define PREEMPT_CONFIG_MAX_TASK_PRIORITY 255U
#endif

// Priority of the task that called enable()
#ifndef PREEMPT_CONFIG_MAIN_TASK_PRIORITY
#define PREEMPT_CONFIG_MAIN_TASK_PRIORITY 1U
#endif

#ifndef PREEMPT_CONFIG_MAX_CORES
#define PREEMPT_CONFIG_MAX_CORES 2U
#endif

#ifndef PREEMPT_CONFIG_MAX_TASK_NAME_LEN
#define PREEMPT_CONFIG_MAX_TASK_NAME_LEN 16U
#endif

// Number of 32 bit words painted at the low end of each task stack and
// checked whenever the task is switched out.  0 disables the check.
#ifndef PREEMPT_CONFIG_STACK_GUARD_WORDS
#define PREEMPT_CONFIG_STACK_GUARD_WORDS 4U
#endif

// Equivalent of the esp-alloc feature: task stacks and control blocks
// come from the built in heap unless the caller supplies an allocator.
#ifndef PREEMPT_CONFIG_USE_HEAP_ALLOCATOR
#define PREEMPT_CONFIG_USE_HEAP_ALLOCATOR 1
#endif

#ifndef PREEMPT_CONFIG_MAX_HEAP_REGIONS
#define PREEMPT_CONFIG_MAX_HEAP_REGIONS 4U
#endif

// 0 off, 1 error, 2 warn, 3 info, 4 debug, 5 trace
#ifndef PREEMPT_LOG_LEVEL
#define PREEMPT_LOG_LEVEL 3
#endif
