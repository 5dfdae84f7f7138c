#include "internal/lifecycle/accessspec_registry.hpp"

#include <cassert>
#include <iostream>
#include <variant>
#include <vector>

namespace {

using llrp::lifecycle::AccessSpecRegistry;
using llrp::lifecycle::ExecutionRecord;
using llrp::lifecycle::LifecycleStatus;
using llrp::lifecycle::OpOutcome;
using llrp::lifecycle::RoSpecRegistry;
using llrp::model::AccessSpecState;

namespace model = llrp::model;

model::AccessSpec MakeAccessSpec(std::uint32_t id, std::uint32_t rospec_id = 0, std::uint16_t antenna_id = 0) {
  model::AccessSpec spec;
  spec.id         = id;
  spec.rospec_id  = rospec_id;
  spec.antenna_id = antenna_id;

  model::C1G2TargetTag target;
  target.memory_bank = 1;
  spec.command.tag_spec.target_tags.push_back(target);

  model::C1G2Read read;
  read.op_spec_id  = 1;
  read.memory_bank = 3;
  read.word_count  = 2;

  model::C1G2Write write;
  write.op_spec_id  = 2;
  write.memory_bank = 3;
  write.data        = {0xBEEF};

  model::C1G2Lock lock;
  lock.op_spec_id = 3;
  lock.payloads.push_back(model::C1G2LockPayload{0, 2});

  spec.command.op_specs = {read, write, lock};
  return spec;
}

std::vector<model::OpSpecResult> ReadOkWriteFailLockOk() {
  return {
      model::C1G2ReadOpSpecResult{0, 1, {0x1234, 0x5678}},
      model::C1G2WriteOpSpecResult{3, 2, 0},
      model::C1G2LockOpSpecResult{0, 3},
  };
}

void TestFailureSkipsRemainingOperations() {
  AccessSpecRegistry registry;
  assert(registry.Add(MakeAccessSpec(1)));
  assert(registry.Enable(1));

  ExecutionRecord record;
  assert(registry.RecordExecution(1, ReadOkWriteFailLockOk(), false, &record));

  assert(record.operations.size() == 3);
  assert(record.operations[0].outcome == OpOutcome::kSucceeded);
  assert(record.operations[1].outcome == OpOutcome::kFailed);
  assert(record.operations[2].outcome == OpOutcome::kSkipped);
  assert(record.operations[2].op_spec_id == 3);
  assert(!record.operations[2].result);
  assert(!record.Succeeded());
}

void TestContinueOnFailureEvaluatesEveryOperation() {
  AccessSpecRegistry registry;
  assert(registry.Add(MakeAccessSpec(1)));
  assert(registry.Enable(1));

  ExecutionRecord record;
  assert(registry.RecordExecution(1, ReadOkWriteFailLockOk(), true, &record));

  assert(record.operations[0].outcome == OpOutcome::kSucceeded);
  assert(record.operations[1].outcome == OpOutcome::kFailed);
  assert(record.operations[2].outcome == OpOutcome::kSucceeded);
}

void TestResultsPairByOpSpecId() {
  AccessSpecRegistry registry;
  assert(registry.Add(MakeAccessSpec(1)));
  assert(registry.Enable(1));

  // The reader lists results in its own order.
  const std::vector<model::OpSpecResult> results{
      model::C1G2LockOpSpecResult{0, 3},
      model::C1G2ReadOpSpecResult{0, 1, {0x1234, 0x5678}},
      model::C1G2WriteOpSpecResult{0, 2, 1},
  };

  ExecutionRecord record;
  assert(registry.RecordExecution(1, results, false, &record));
  assert(record.Succeeded());
  assert(record.operations[0].op_spec_id == 1);
  assert(std::holds_alternative<model::C1G2ReadOpSpecResult>(*record.operations[0].result));
  assert(std::holds_alternative<model::C1G2WriteOpSpecResult>(*record.operations[1].result));
  assert(std::holds_alternative<model::C1G2LockOpSpecResult>(*record.operations[2].result));

  const auto last = registry.LastExecution(1);
  assert(last && last->Succeeded());
  assert(!registry.LastExecution(2));
}

void TestMissingAndMismatchedResults() {
  AccessSpecRegistry registry;
  assert(registry.Add(MakeAccessSpec(1)));
  assert(registry.Enable(1));

  // No result for the Write; the Lock is reported.
  ExecutionRecord partial;
  assert(registry.RecordExecution(
      1, {model::C1G2ReadOpSpecResult{0, 1, {}}, model::C1G2LockOpSpecResult{0, 3}}, false, &partial));
  assert(partial.operations[0].outcome == OpOutcome::kSucceeded);
  assert(partial.operations[1].outcome == OpOutcome::kSkipped);
  assert(partial.operations[2].outcome == OpOutcome::kSucceeded);

  // A successful Write result under the Read's OpSpecID is still a failure.
  ExecutionRecord mismatched;
  assert(registry.RecordExecution(1, {model::C1G2WriteOpSpecResult{0, 1, 2}, model::C1G2WriteOpSpecResult{0, 2, 1}},
                                  false, &mismatched));
  assert(mismatched.operations[0].outcome == OpOutcome::kFailed);
  assert(mismatched.operations[1].outcome == OpOutcome::kSkipped);
  assert(mismatched.operations[2].outcome == OpOutcome::kSkipped);
}

void TestOperationCountRemovesSpec() {
  AccessSpecRegistry registry;
  auto               spec = MakeAccessSpec(4);
  spec.stop_trigger       = model::AccessSpecStopTrigger{model::AccessSpecStopTriggerType::kOperationCount, 1};
  assert(registry.Add(spec));
  assert(registry.Enable(4));

  ExecutionRecord record;
  assert(registry.RecordExecution(4, ReadOkWriteFailLockOk(), true, &record));
  assert(record.removed);
  assert(record.executions == 1);
  assert(!registry.Get(4));
  assert(registry.RecordExecution(4, ReadOkWriteFailLockOk(), true, &record).status ==
         LifecycleStatus::kAccessSpecNotFound);
}

void TestExecutionRequiresEnabledSpec() {
  AccessSpecRegistry registry;
  assert(registry.Add(MakeAccessSpec(1)));

  ExecutionRecord record;
  assert(registry.RecordExecution(1, ReadOkWriteFailLockOk(), false, &record).status ==
         LifecycleStatus::kInvalidState);
}

void TestLifecycleValidation() {
  AccessSpecRegistry registry;

  assert(registry.Add(MakeAccessSpec(0)).status == LifecycleStatus::kInvalidId);
  assert(registry.Add(MakeAccessSpec(1)));
  assert(registry.Add(MakeAccessSpec(1)).status == LifecycleStatus::kDuplicateId);
  assert(registry.Disable(1).status == LifecycleStatus::kInvalidState);
  assert(registry.Enable(2).status == LifecycleStatus::kAccessSpecNotFound);
  assert(registry.Enable(0).status == LifecycleStatus::kInvalidId);

  assert(registry.Enable(1));
  assert(registry.Get(1)->current_state == AccessSpecState::kEnabled);
  assert(registry.Disable(1));
  assert(registry.Delete(0));
  assert(registry.size() == 0);
}

void TestEligibleFollowsInsertionOrder() {
  RoSpecRegistry rospecs;
  model::RoSpec  rospec;
  rospec.id = 9;
  model::AiSpec ai;
  ai.antenna_ids = {1, 2};
  ai.inventory_parameter_specs.push_back(model::InventoryParameterSpec{});
  rospec.specs.emplace_back(ai);
  assert(rospecs.Add(rospec));
  assert(rospecs.Enable(9));

  AccessSpecRegistry registry;
  assert(registry.Add(MakeAccessSpec(30, 9, 0)));
  assert(registry.Add(MakeAccessSpec(10, 0, 2)));
  assert(registry.Add(MakeAccessSpec(20, 8, 0)));
  assert(registry.Add(MakeAccessSpec(40, 0, 1)));
  for (auto id : {30u, 10u, 20u}) {
    assert(registry.Enable(id));
  }

  // Nothing runs while the ROSpec is not Active.
  assert(registry.Eligible(rospecs, 9, 2).empty());

  assert(rospecs.Start(9));
  const auto eligible = registry.Eligible(rospecs, 9, 2);
  assert(eligible.size() == 2);
  assert(eligible[0].id == 30);
  assert(eligible[1].id == 10);

  const auto listed = registry.List();
  assert(listed.size() == 4);
  assert(listed[0].id == 30 && listed[3].id == 40);
}

} // namespace

int main() {
  TestFailureSkipsRemainingOperations();
  TestContinueOnFailureEvaluatesEveryOperation();
  TestResultsPairByOpSpecId();
  TestMissingAndMismatchedResults();
  TestOperationCountRemovesSpec();
  TestExecutionRequiresEnabledSpec();
  TestLifecycleValidation();
  TestEligibleFollowsInsertionOrder();

  std::cout << "llrp_engine_unit_accessspec_registry: pass\n";
  return 0;
}
