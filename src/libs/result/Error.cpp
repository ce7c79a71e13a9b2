#include "src/libs/result/Error.h"

namespace preempt {

const char* errorName(Error error) {
  switch (error) {
    case Error::OutOfMemory:
      return "out of memory";
    case Error::InvalidArgument:
      return "invalid argument";
    case Error::InvalidCore:
      return "invalid core";
    case Error::Timeout:
      return "timeout";
    case Error::NotOwner:
      return "not owner";
    case Error::Full:
      return "full";
    case Error::NotStarted:
      return "not started";
    case Error::AlreadyStarted:
      return "already started";
    case Error::NoScheduler:
      return "no scheduler registered";
  }
  return "unknown error";
}
}
