#include "src/libs/strings/FixedString.h"
#include <string>
#include "lest/lest.hpp"
using namespace lest;
using namespace preempt;

static tests specification;

lest_CASE(specification, "const string") {
  auto cstr = makeConstString("idle");
  EXPECT(cstr == "idle");
  EXPECT(cstr != "idla");
  EXPECT(cstr != "i");
  EXPECT(cstr != "idlers");
  EXPECT(cstr.startsWith("id"));
  EXPECT_NOT(cstr.startsWith("idle task"));
  EXPECT(ConstString().empty());
}

lest_CASE(specification, "fixed string truncates") {
  FixedString<12> name("main");
  EXPECT(name.size() == 4u);
  EXPECT(std::string(name.data(), name.size()) == "main");
  EXPECT(name.append("-task"));
  EXPECT(name == "main-task");
  // Only part of the suffix fits
  EXPECT_NOT(name.append("-1234"));
  EXPECT(name == "main-task-12");
  EXPECT(name.capacity() == 12u);
  EXPECT(std::string(name.c_str()) == "main-task-12");

  name.clear();
  EXPECT(name.empty());
  EXPECT(name.append(static_cast<const char*>(nullptr)));
  EXPECT(name.empty());
}

lest_CASE(specification, "concat") {
  FixedString<24> str;
  str.append(makeConstString("task"));
  EXPECT(str == "task");

  auto there = makeConstString("switch");
  str.append(there.begin(), 2);
  EXPECT(str == "tasksw");
  EXPECT(str == makeConstString("tasksw"));
}

lest_CASE(specification, "numeric formatting") {
  FixedString<24> str;
  str.appendHex(uint16_t(0xbeef));
  EXPECT(str == "BEEF");

  str.clear();
  str.appendHex(uint32_t(0x1f));
  EXPECT(str == "0000001F");

  str.clear();
  str.appendDecimal(uint64_t(0));
  EXPECT(str == "0");

  str.clear();
  str.appendDecimal(int64_t(-1234567));
  EXPECT(str == "-1234567");

  str.clear();
  str.appendDecimal(uint64_t(18446744073709551615ull));
  EXPECT(str == "18446744073709551615");

  FixedString<3> tiny;
  EXPECT_NOT(tiny.appendDecimal(uint64_t(12345)));
  EXPECT(tiny == "123");
}

int main(int argc, char* argv[]) {
  return run(specification, argc, argv);
}
