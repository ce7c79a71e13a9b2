#pragma once
#include "src/libs/driver/SchedulerDriver.h"
#include "src/libs/traits/Traits.h"

namespace preempt {

// The Mutex class is used to implement mutual exclusion between
// tasks.  Only one task can own a mutex at a time.  Ownership
// of a Mutex is represented by the Mutex::Lock class.  Owning
// a mutex does not disable interrupts or task scheduling.
// Mutexes are not recursive!
// The semaphore comes from the registered scheduler driver, so a
// Mutex may only be constructed once one has been registered.
class Mutex {
  driver::SemaphoreHandle h_;

 public:
  // Construct an unowned mutex
  Mutex();
  ~Mutex();
  // No copying or moving
  Mutex(const Mutex&) = delete;
  Mutex(Mutex&&) = delete;

  // A lock represents ownership of the associated mutex.
  // The lock is released when the Lock object is destroyed.
  class Lock {
    friend class Mutex;
    driver::SemaphoreHandle h_;

    // Construct from an owned semaphore
    explicit Lock(driver::SemaphoreHandle h);

   public:
    // No copying
    Lock(const Lock&) = delete;
    // Moving is allowed
    Lock(Lock&&);
    Lock& operator=(Lock&& other);
    // The destructor implicitly calls unlock()
    ~Lock();
    // Unlock and release ownership of the mutex
    void unlock();
  };

  // Lock the mutex, blocking until the mutex is acquired
  Lock lock();

  // Attempt to lock the mutex, failing with Error::Timeout
  Result<Lock, Error> lock(uint32_t ms);
};

// LockedPtr is a helper class representing a pointer to a locked
// resource and its associated Lock.  While the LockedPtr is in
// scope it owns the lock.  When it falls out of scope the lock
// is also released.
template <typename T>
class LockedPtr {
  Mutex::Lock l_;
  T* t_;

 public:
  LockedPtr(Mutex::Lock&& l, T* t) : l_(move(l)), t_(t) {}
  LockedPtr(const LockedPtr&) = delete;
  LockedPtr(LockedPtr&& other) : l_(move(other.l_)), t_(other.t_) {
    other.t_ = nullptr;
  }

  T* operator->() {
    return t_;
  }

  T& operator*() {
    return *t_;
  }
};

// The Synchronized class makes it difficult to access a resource
// without holding its lock.  The resource is only reachable through
// the LockedPtr returned by lock().
template <typename T>
class Synchronized {
  T t_;
  Mutex m_;

 public:
  template <typename... Args>
  explicit Synchronized(Args&&... args) : t_(forward<Args>(args)...) {}

  LockedPtr<T> lock() {
    return LockedPtr<T>(m_.lock(), &t_);
  }
};
}
