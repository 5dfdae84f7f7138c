#include "internal/lifecycle/rospec_registry.hpp"

#include <cassert>
#include <iostream>

namespace {

using llrp::lifecycle::LifecycleStatus;
using llrp::lifecycle::RoSpecRegistry;
using llrp::lifecycle::TriggerCause;
using llrp::model::RoSpecState;

namespace model = llrp::model;

model::RoSpec MakeRoSpec(std::uint32_t id, std::vector<std::uint16_t> antennas, std::uint8_t priority = 0) {
  model::RoSpec rospec;
  rospec.id       = id;
  rospec.priority = priority;
  model::AiSpec ai;
  ai.antenna_ids = std::move(antennas);
  ai.inventory_parameter_specs.push_back(model::InventoryParameterSpec{});
  rospec.specs.emplace_back(ai);
  return rospec;
}

void TestFullLifecycle() {
  RoSpecRegistry registry;

  assert(registry.Add(MakeRoSpec(0x04D2, {1})));
  assert(registry.State(0x04D2) == RoSpecState::kDisabled);

  assert(registry.Enable(0x04D2));
  assert(registry.State(0x04D2) == RoSpecState::kInactive);

  assert(registry.Start(0x04D2));
  assert(registry.State(0x04D2) == RoSpecState::kActive);

  assert(registry.Stop(0x04D2));
  assert(registry.State(0x04D2) == RoSpecState::kInactive);

  assert(registry.Disable(0x04D2));
  assert(registry.State(0x04D2) == RoSpecState::kDisabled);

  assert(registry.Delete(0x04D2));
  assert(!registry.Get(0x04D2));
  assert(registry.size() == 0);
}

void TestStartOnDisabledLeavesRegistryUnchanged() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(0x04D2, {1})));
  const auto before = registry.List();

  const auto result = registry.Start(0x04D2);
  assert(!result);
  assert(result.status == LifecycleStatus::kInvalidState);
  assert(registry.List() == before);
  assert(registry.State(0x04D2) == RoSpecState::kDisabled);
}

void TestDisableRequiresInactive() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(5, {1})));
  assert(registry.Enable(5));
  assert(registry.Start(5));

  assert(registry.Disable(5).status == LifecycleStatus::kInvalidState);
  assert(registry.Enable(5).status == LifecycleStatus::kInvalidState);
  assert(registry.State(5) == RoSpecState::kActive);
}

void TestAddValidation() {
  RoSpecRegistry registry;

  assert(registry.Add(MakeRoSpec(0, {1})).status == LifecycleStatus::kInvalidId);
  assert(registry.Add(MakeRoSpec(1, {1})));
  assert(registry.Add(MakeRoSpec(1, {2})).status == LifecycleStatus::kDuplicateId);

  auto active          = MakeRoSpec(2, {1});
  active.current_state = RoSpecState::kActive;
  assert(registry.Add(active).status == LifecycleStatus::kInvalidState);

  assert(registry.Start(99).status == LifecycleStatus::kROSpecNotFound);
  assert(registry.Start(0).status == LifecycleStatus::kInvalidId);
  assert(registry.size() == 1);
}

void TestDeleteZeroRemovesEverything() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(1, {1})));
  assert(registry.Add(MakeRoSpec(2, {2})));
  assert(registry.Enable(2));

  assert(registry.Delete(0));
  assert(registry.size() == 0);
}

void TestTriggersFireOnlyWhenConfigured() {
  RoSpecRegistry registry;

  auto gpi                                = MakeRoSpec(10, {1});
  gpi.boundary.start_trigger.type         = model::StartTriggerType::kGpi;
  gpi.boundary.start_trigger.gpi          = model::GpiTriggerValue{1, true, 0};
  gpi.boundary.stop_trigger.type          = model::StopTriggerType::kGpiWithTimeout;
  gpi.boundary.stop_trigger.gpi           = model::GpiTriggerValue{1, false, 1000};
  assert(registry.Add(gpi));

  auto timed                           = MakeRoSpec(11, {2});
  timed.boundary.start_trigger.type    = model::StartTriggerType::kPeriodic;
  timed.boundary.start_trigger.periodic = model::PeriodicTriggerValue{0, 1000, std::nullopt};
  timed.boundary.stop_trigger.type     = model::StopTriggerType::kDuration;
  timed.boundary.stop_trigger.duration_ms = 500;
  assert(registry.Add(timed));

  // Disabled specs ignore their triggers.
  assert(registry.OnGpiEvent(1, true).empty());
  assert(registry.FireStartTrigger(11, TriggerCause::kPeriodic).status == LifecycleStatus::kInvalidState);

  assert(registry.Enable(10));
  assert(registry.Enable(11));

  assert(registry.OnGpiEvent(1, false).empty());
  assert((registry.OnGpiEvent(1, true) == std::vector<std::uint32_t>{10}));
  assert(registry.State(10) == RoSpecState::kActive);
  assert((registry.OnGpiEvent(1, false) == std::vector<std::uint32_t>{10}));
  assert(registry.State(10) == RoSpecState::kInactive);

  assert(registry.FireStartTrigger(11, TriggerCause::kGpi).status == LifecycleStatus::kTriggerMismatch);
  assert(registry.FireStartTrigger(11, TriggerCause::kPeriodic));
  assert(registry.FireStopTrigger(11, TriggerCause::kTagObservation).status == LifecycleStatus::kTriggerMismatch);
  assert(registry.FireStopTrigger(11, TriggerCause::kDuration));
  assert(registry.State(11) == RoSpecState::kInactive);
}

void TestReaderEventsDriveState() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(20, {1})));

  model::RoSpecEvent start{model::RoSpecEventType::kStart, 20, 0};
  assert(registry.ApplyRoSpecEvent(start).status == LifecycleStatus::kInvalidState);
  assert(registry.State(20) == RoSpecState::kDisabled);

  assert(registry.Enable(20));
  assert(registry.ApplyRoSpecEvent(start));
  assert(registry.State(20) == RoSpecState::kActive);

  model::RoSpecEvent preempted{model::RoSpecEventType::kPreempted, 20, 21};
  assert(registry.ApplyRoSpecEvent(preempted));
  assert(registry.State(20) == RoSpecState::kInactive);

  model::RoSpecEvent unknown{model::RoSpecEventType::kEnd, 99, 0};
  assert(registry.ApplyRoSpecEvent(unknown).status == LifecycleStatus::kROSpecNotFound);
}

void TestImmediateRoSpecStartsOnce() {
  RoSpecRegistry registry;

  auto rospec                        = MakeRoSpec(0x04D2, {1});
  rospec.boundary.start_trigger.type = model::StartTriggerType::kImmediate;
  rospec.boundary.stop_trigger.type  = model::StopTriggerType::kNull;
  assert(registry.Add(rospec));

  assert(registry.Enable(0x04D2));
  assert(registry.Start(0x04D2));
  assert(registry.State(0x04D2) == RoSpecState::kActive);

  const auto again = registry.Start(0x04D2);
  assert(again.status == LifecycleStatus::kInvalidState);
  assert(registry.State(0x04D2) == RoSpecState::kActive);
}

void TestStartEventBeforeEnableIsConfirmed() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(30, {1})));

  assert(registry.Begin(model::RoSpecCommand::kEnable, 30));
  assert(registry.ApplyRoSpecEvent(model::RoSpecEvent{model::RoSpecEventType::kStart, 30, 0}));
  assert(registry.State(30) == RoSpecState::kDisabled);

  assert(registry.Confirm(model::RoSpecCommand::kEnable, 30));
  assert(registry.State(30) == RoSpecState::kActive);

  assert(registry.Check(model::RoSpecCommand::kStop, 30));
  assert(registry.Stop(30));
  assert(registry.State(30) == RoSpecState::kInactive);
}

void TestConfirmKeepsStateReachedByEvents() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(31, {1})));
  assert(registry.Enable(31));

  assert(registry.Begin(model::RoSpecCommand::kStart, 31));
  assert(registry.ApplyRoSpecEvent(model::RoSpecEvent{model::RoSpecEventType::kStart, 31, 0}));
  assert(registry.Confirm(model::RoSpecCommand::kStart, 31));
  assert(registry.State(31) == RoSpecState::kActive);

  assert(registry.Begin(model::RoSpecCommand::kStop, 31));
  assert(registry.ApplyRoSpecEvent(model::RoSpecEvent{model::RoSpecEventType::kEnd, 31, 0}));
  assert(registry.Confirm(model::RoSpecCommand::kStop, 31));
  assert(registry.State(31) == RoSpecState::kInactive);
}

void TestAbandonedEnableDropsHeldStart() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(32, {1})));

  assert(registry.Begin(model::RoSpecCommand::kEnable, 32));
  assert(registry.ApplyRoSpecEvent(model::RoSpecEvent{model::RoSpecEventType::kStart, 32, 0}));
  registry.Abandon(32);
  assert(registry.State(32) == RoSpecState::kDisabled);

  // Without an Enable in flight the event is refused.
  assert(registry.ApplyRoSpecEvent(model::RoSpecEvent{model::RoSpecEventType::kStart, 32, 0}).status ==
         LifecycleStatus::kInvalidState);
  assert(registry.Enable(32));
  assert(registry.State(32) == RoSpecState::kInactive);
}

void TestAntennaConflicts() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(1, {1, 2}, 0)));
  assert(registry.Add(MakeRoSpec(2, {2, 3}, 3)));
  assert(registry.Add(MakeRoSpec(3, {4}, 1)));
  for (std::uint32_t id = 1; id <= 3; ++id) {
    assert(registry.Enable(id));
    assert(registry.Start(id));
  }

  const auto conflicts = registry.AntennaConflicts();
  assert(conflicts.size() == 1);
  assert(conflicts[0].first_id == 1 && conflicts[0].second_id == 2);
  assert(conflicts[0].first_priority == 0 && conflicts[0].second_priority == 3);
  assert((conflicts[0].antennas == std::vector<std::uint16_t>{2}));

  assert(registry.Add(MakeRoSpec(4, {0}, 7)));
  assert(registry.Enable(4));
  assert(registry.Start(4));
  assert(registry.AntennaConflicts().size() == 4);
}

void TestReplaceAllIsAtomic() {
  RoSpecRegistry registry;
  assert(registry.Add(MakeRoSpec(1, {1})));

  auto listed          = MakeRoSpec(7, {1});
  listed.current_state = RoSpecState::kActive;
  assert(!registry.ReplaceAll({listed, listed}));
  assert(registry.Get(1));

  assert(registry.ReplaceAll({listed}));
  assert(!registry.Get(1));
  assert(registry.State(7) == RoSpecState::kActive);
}

} // namespace

int main() {
  TestFullLifecycle();
  TestStartOnDisabledLeavesRegistryUnchanged();
  TestDisableRequiresInactive();
  TestAddValidation();
  TestDeleteZeroRemovesEverything();
  TestTriggersFireOnlyWhenConfigured();
  TestReaderEventsDriveState();
  TestImmediateRoSpecStartsOnce();
  TestStartEventBeforeEnableIsConfirmed();
  TestConfirmKeepsStateReachedByEvents();
  TestAbandonedEnableDropsHeldStart();
  TestAntennaConflicts();
  TestReplaceAllIsAtomic();

  std::cout << "llrp_engine_unit_rospec_registry: pass\n";
  return 0;
}
