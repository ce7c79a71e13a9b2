#include "src/libs/driver/Mutex.h"
#include "src/libs/result/Logging.h"
#include "src/libs/driver/Timing.h"

namespace preempt {

Mutex::Mutex() {
  auto sem = driver::semaphoreCreate(driver::SemaphoreKind::Mutex, 1, 0);
  if (sem.hasError()) {
    panic("mutex: ", errorName(sem.error()));
  }
  h_ = sem.value();
}

Mutex::~Mutex() {
  driver::semaphoreDelete(h_);
}

Mutex::Lock::Lock(driver::SemaphoreHandle h) : h_(h) {}
Mutex::Lock::~Lock() {
  unlock();
}

Mutex::Lock::Lock(Lock&& other) : h_(other.h_) {
  other.h_ = nullptr;
}

Mutex::Lock& Mutex::Lock::operator=(Mutex::Lock&& other) {
  if (&other != this) {
    unlock();
    h_ = other.h_;
    other.h_ = nullptr;
  }
  return *this;
}

void Mutex::Lock::unlock() {
  if (h_) {
    driver::semaphoreGive(h_).panicIfError();
    h_ = nullptr;
  }
}

Mutex::Lock Mutex::lock() {
  driver::semaphoreTake(h_, driver::kForever).panicIfError();
  return Lock(h_);
}

Result<Mutex::Lock, Error> Mutex::lock(uint32_t ms) {
  auto res = driver::semaphoreTake(h_, millisecondsToMicros(ms));
  if (res.hasError()) {
    return Result<Lock, Error>::Error(res.error());
  }
  return Result<Lock, Error>::Ok(Lock(h_));
}
}
