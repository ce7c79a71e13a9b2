#include "src/libs/freertos/Result.h"

namespace preempt {
namespace freertos {

Status statusFrom(BaseType_t result, Error error) {
  if (result == pdTRUE) {
    return ok();
  }
  return failed(error);
}
}
}
