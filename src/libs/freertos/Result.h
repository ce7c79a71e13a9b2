#pragma once
#include "FreeRTOS.h"
#include "src/libs/result/Error.h"

namespace preempt {
namespace freertos {

// Maps pdTRUE to ok() and anything else to error
Status statusFrom(BaseType_t result, Error error);
}
}
