#pragma once
#include <stdint.h>
#include "src/libs/config/PreemptConfig.h"
#include "src/libs/strings/FixedString.h"

namespace preempt {

enum class LogLevel : uint8_t {
  Off = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
  Debug = 4,
  Trace = 5,
};

// The output sink; weakly defined so that a board may route it
// to a different device.
void logImpl(const char* start, const char* end);

void panicReset();

[[noreturn]] void panicImpl();

void logImpl(long long numeric);
void logImpl(unsigned long long numeric);
void logImpl(const void* pointer);
void logImpl(const char* cstr);

inline void logImpl(char* cstr) {
  logImpl(static_cast<const char*>(cstr));
}

inline void logImpl(char c) {
  logImpl(&c, &c + 1);
}

inline void logImpl(bool flag) {
  logImpl(flag ? "true" : "false");
}

inline void logImpl(signed char numeric) {
  logImpl((long long)numeric);
}

inline void logImpl(unsigned char numeric) {
  logImpl((unsigned long long)numeric);
}

inline void logImpl(short numeric) {
  logImpl((long long)numeric);
}

inline void logImpl(unsigned short numeric) {
  logImpl((unsigned long long)numeric);
}

inline void logImpl(int numeric) {
  logImpl((long long)numeric);
}

inline void logImpl(unsigned int numeric) {
  logImpl((unsigned long long)numeric);
}

inline void logImpl(long numeric) {
  logImpl((long long)numeric);
}

inline void logImpl(unsigned long numeric) {
  logImpl((unsigned long long)numeric);
}

template <typename String>
void logImpl(const StringBase<String>& str) {
  logImpl(str.begin(), str.end());
}

inline void logHelper() {}

template <typename First, typename... Args>
void logHelper(First&& first, Args&&... args) {
  logImpl(first);
  logHelper(args...);
}

template <typename... Args>
void log(Args&&... args) {
  logHelper(args...);
}

template <typename... Args>
void logln(Args&&... args) {
  logHelper(args..., makeConstString("\r\n"));
}

template <typename... Args>
void logAt(LogLevel level, const char* tag, Args&&... args) {
  if (static_cast<uint8_t>(level) > PREEMPT_LOG_LEVEL) {
    return;
  }
  logln(tag, args...);
}

template <typename... Args>
void logError(Args&&... args) {
  logAt(LogLevel::Error, "E preempt: ", args...);
}

template <typename... Args>
void logWarn(Args&&... args) {
  logAt(LogLevel::Warn, "W preempt: ", args...);
}

template <typename... Args>
void logInfo(Args&&... args) {
  logAt(LogLevel::Info, "I preempt: ", args...);
}

template <typename... Args>
void logDebug(Args&&... args) {
  logAt(LogLevel::Debug, "D preempt: ", args...);
}

template <typename... Args>
void logTrace(Args&&... args) {
  logAt(LogLevel::Trace, "T preempt: ", args...);
}

template <typename... Args>
[[noreturn]] void panic(Args&&... args) {
  logln(makeConstString("panic: "), args...);
  panicImpl();
}
}
