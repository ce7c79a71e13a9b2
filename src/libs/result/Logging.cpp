#include "src/libs/result/Logging.h"
#include <string.h>

namespace preempt {

void logImpl(long long numeric) {
  FixedString<24> buf;
  buf.appendDecimal(int64_t(numeric));
  logImpl(buf.begin(), buf.end());
}

void logImpl(unsigned long long numeric) {
  FixedString<24> buf;
  buf.appendDecimal(uint64_t(numeric));
  logImpl(buf.begin(), buf.end());
}

void logImpl(const void* pointer) {
  FixedString<2 + 2 * sizeof(uintptr_t)> buf;
  buf.append("0x", 2);
  buf.appendHex(reinterpret_cast<uintptr_t>(pointer));
  logImpl(buf.begin(), buf.end());
}

void logImpl(const char* cstr) {
  if (!cstr) {
    cstr = "(null)";
  }
  logImpl(cstr, cstr + ::strlen(cstr));
}

void panic(const char* reason) {
  logln(makeConstString("panic: "), reason);
  panicImpl();
}
}
