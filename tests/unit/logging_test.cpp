#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>

namespace {

namespace observability = llrp::observability;

using observability::CurrentReaderLabel;
using observability::FormatLogLine;
using observability::IntField;
using observability::ReaderLogScope;
using observability::StringField;

void TestLineWithoutReader() {
  assert(CurrentReaderLabel().empty());
  assert(FormatLogLine("session state", {}) == "session state");
  assert(FormatLogLine("session state", {StringField("from", "Connected"), StringField("to", "Operational")}) ==
         "session state from=Connected to=Operational");
}

void TestReaderLabelLeadsTheFields() {
  ReaderLogScope scope("dock-door-3");
  assert(FormatLogLine("command failed", {IntField("message_id", 12)}) ==
         "command failed reader=dock-door-3 message_id=12");
}

void TestScopesNestAndRestore() {
  {
    ReaderLogScope outer("10.0.0.5:5084");
    {
      ReaderLogScope inner("portal-b");
      assert(CurrentReaderLabel() == "portal-b");
    }
    assert(CurrentReaderLabel() == "10.0.0.5:5084");

    // Labels are per thread.
    std::string seen = "unset";
    std::thread other([&] { seen = CurrentReaderLabel(); });
    other.join();
    assert(seen.empty());
  }
  assert(CurrentReaderLabel().empty());

  ReaderLogScope quiet("");
  assert(FormatLogLine("keepalive", {}) == "keepalive");
}

} // namespace

int main() {
  TestLineWithoutReader();
  TestReaderLabelLeadsTheFields();
  TestScopesNestAndRestore();

  std::cout << "llrp_engine_unit_logging: pass\n";
  return 0;
}
