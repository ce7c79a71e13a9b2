#include "src/libs/chip/Chip.h"
#include <string.h>

namespace preempt {
namespace chip {

namespace {
const ChipInfo kChips[] = {
    {"esp32", Arch::Xtensa, 2, 2, false, kWifi | kBle},
    {"esp32s2", Arch::Xtensa, 1, 2, true, kWifi},
    {"esp32s3", Arch::Xtensa, 2, 2, true, kWifi | kBle},
    {"esp32c2", Arch::RiscV, 1, 1, true, kWifi | kBle},
    {"esp32c3", Arch::RiscV, 1, 2, true, kWifi | kBle},
    {"esp32c6", Arch::RiscV, 1, 2, true, kWifi | kBle | kIeee802154},
    {"esp32h2", Arch::RiscV, 1, 2, true, kBle | kIeee802154},
    {"host", Arch::Host, 1, 0, false, 0},
};

constexpr uint8_t kNumChips = sizeof(kChips) / sizeof(kChips[0]);

#if defined(PREEMPT_CHIP_ESP32)
constexpr const char* kCurrentName = "esp32";
#elif defined(PREEMPT_CHIP_ESP32S2)
constexpr const char* kCurrentName = "esp32s2";
#elif defined(PREEMPT_CHIP_ESP32S3)
constexpr const char* kCurrentName = "esp32s3";
#elif defined(PREEMPT_CHIP_ESP32C2)
constexpr const char* kCurrentName = "esp32c2";
#elif defined(PREEMPT_CHIP_ESP32C3)
constexpr const char* kCurrentName = "esp32c3";
#elif defined(PREEMPT_CHIP_ESP32C6)
constexpr const char* kCurrentName = "esp32c6";
#elif defined(PREEMPT_CHIP_ESP32H2)
constexpr const char* kCurrentName = "esp32h2";
#else
constexpr const char* kCurrentName = "host";
#endif
}

const ChipInfo* chips(uint8_t& count) {
  count = kNumChips;
  return kChips;
}

const ChipInfo* findChip(const char* name) {
  for (uint8_t i = 0; i < kNumChips; ++i) {
    if (::strcmp(kChips[i].name, name) == 0) {
      return &kChips[i];
    }
  }
  return nullptr;
}

const ChipInfo& current() {
  static const ChipInfo* info = findChip(kCurrentName);
  return *info;
}
}
}
