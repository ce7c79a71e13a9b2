#pragma once
#include <stdint.h>
#include "src/libs/result/Result.h"

namespace preempt {

enum class Error : uint8_t {
  OutOfMemory,
  InvalidArgument,
  InvalidCore,
  Timeout,
  NotOwner,
  Full,
  NotStarted,
  AlreadyStarted,
  NoScheduler,
};

const char* errorName(Error error);

// The common shape of operations that either succeed or fail
// with an Error
using Status = Result<Unit, Error>;

inline Status ok() {
  return Status::Ok();
}

inline Status failed(Error error) {
  return Status::Error(error);
}
}
