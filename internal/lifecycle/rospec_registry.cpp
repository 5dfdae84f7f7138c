#include "rospec_registry.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <string>

#include "internal/observability/logging.hpp"

namespace llrp::lifecycle {
namespace {

std::string Describe(std::uint32_t id) {
  return "ROSpec " + std::to_string(id);
}

LifecycleResult Reject(LifecycleResult result, const char* operation, std::uint32_t id) {
  LLRP_LOG_WARN("rospec command rejected",
                {observability::StringField("op", operation),
                 observability::IntField("rospec_id", id),
                 observability::StringField("status", LifecycleStatusName(result.status)),
                 observability::StringField("reason", result.message)});
  return result;
}

bool StartTriggerMatches(const model::RoSpecStartTrigger& trigger, TriggerCause cause) {
  switch (cause) {
    case TriggerCause::kPeriodic: return trigger.type == model::StartTriggerType::kPeriodic;
    case TriggerCause::kGpi: return trigger.type == model::StartTriggerType::kGpi;
    default: return false;
  }
}

bool StopTriggerMatches(const model::RoSpec& rospec, TriggerCause cause) {
  const auto& stop = rospec.boundary.stop_trigger;
  switch (cause) {
    case TriggerCause::kDuration: return stop.type == model::StopTriggerType::kDuration;
    case TriggerCause::kGpi:
    case TriggerCause::kTimeout: return stop.type == model::StopTriggerType::kGpiWithTimeout;
    case TriggerCause::kTagObservation:
      return std::any_of(rospec.specs.begin(), rospec.specs.end(), [](const model::SpecParameter& spec) {
        const auto* ai = std::get_if<model::AiSpec>(&spec);
        return ai && ai->stop_trigger.type == model::AiSpecStopTriggerType::kTagObservation;
      });
    case TriggerCause::kPeriodic: return false;
  }
  return false;
}

// True when ROSpecEvents already carried the ROSpec to where `command` leads.
bool AlreadyReached(model::RoSpecState state, model::RoSpecCommand command) {
  const auto target = model::TargetState(command);
  if (target && state == *target) {
    return true;
  }
  return command == model::RoSpecCommand::kEnable && state == model::RoSpecState::kActive;
}

std::vector<std::uint16_t> Overlap(const std::vector<std::uint16_t>& a, const std::vector<std::uint16_t>& b) {
  const bool a_all = std::find(a.begin(), a.end(), 0) != a.end();
  const bool b_all = std::find(b.begin(), b.end(), 0) != b.end();
  if (a_all && b_all) {
    return {0};
  }
  if (a_all) {
    return b;
  }
  if (b_all) {
    return a;
  }

  std::vector<std::uint16_t> out;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
  return out;
}

} // namespace

const char* TriggerCauseName(TriggerCause cause) {
  switch (cause) {
    case TriggerCause::kPeriodic: return "Periodic";
    case TriggerCause::kGpi: return "GPI";
    case TriggerCause::kDuration: return "Duration";
    case TriggerCause::kTagObservation: return "TagObservation";
    case TriggerCause::kTimeout: return "Timeout";
  }
  return "Unknown";
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

LifecycleResult RoSpecRegistry::CheckAddLocked(const model::RoSpec& rospec) const {
  if (rospec.id == 0) {
    return LifecycleResult::Fail(LifecycleStatus::kInvalidId, "ROSpec id 0 is reserved");
  }
  if (rospecs_.count(rospec.id)) {
    return LifecycleResult::Fail(LifecycleStatus::kDuplicateId, Describe(rospec.id) + " already exists");
  }
  if (rospec.current_state != model::RoSpecState::kDisabled) {
    return LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                 Describe(rospec.id) + " must be added Disabled, not " +
                                     model::RoSpecStateName(rospec.current_state));
  }
  return LifecycleResult::Ok();
}

LifecycleResult RoSpecRegistry::CheckLocked(model::RoSpecCommand command, std::uint32_t id) const {
  if (id == 0) {
    if (command == model::RoSpecCommand::kDelete) {
      return LifecycleResult::Ok();
    }
    return LifecycleResult::Fail(LifecycleStatus::kInvalidId,
                                 std::string(model::RoSpecCommandName(command)) + " requires a ROSpec id");
  }

  auto it = rospecs_.find(id);
  if (it == rospecs_.end()) {
    return LifecycleResult::Fail(LifecycleStatus::kROSpecNotFound, Describe(id) + " not found");
  }

  if (!model::CanApply(it->second.current_state, command)) {
    return LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                 std::string(model::RoSpecCommandName(command)) + " not valid for " + Describe(id) +
                                     " in state " + model::RoSpecStateName(it->second.current_state));
  }
  return LifecycleResult::Ok();
}

LifecycleResult RoSpecRegistry::CheckAdd(const model::RoSpec& rospec) const {
  std::lock_guard lock(mutex_);
  return CheckAddLocked(rospec);
}

LifecycleResult RoSpecRegistry::Check(model::RoSpecCommand command, std::uint32_t id) const {
  std::lock_guard lock(mutex_);
  return CheckLocked(command, id);
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

LifecycleResult RoSpecRegistry::Add(const model::RoSpec& rospec) {
  std::lock_guard lock(mutex_);

  auto result = CheckAddLocked(rospec);
  if (!result) {
    return Reject(std::move(result), "AddROSpec", rospec.id);
  }

  rospecs_.emplace(rospec.id, rospec);
  return result;
}

LifecycleResult RoSpecRegistry::Apply(model::RoSpecCommand command, std::uint32_t id) {
  std::lock_guard lock(mutex_);

  auto result = CheckLocked(command, id);
  if (!result) {
    return Reject(std::move(result), model::RoSpecCommandName(command), id);
  }

  auto target = model::TargetState(command);
  if (!target) {
    if (id == 0) {
      rospecs_.clear();
      in_flight_.clear();
      started_early_.clear();
    } else {
      rospecs_.erase(id);
      in_flight_.erase(id);
      started_early_.erase(id);
    }
    return result;
  }

  rospecs_.at(id).current_state = *target;
  return result;
}

LifecycleResult RoSpecRegistry::Begin(model::RoSpecCommand command, std::uint32_t id) {
  std::lock_guard lock(mutex_);

  auto result = CheckLocked(command, id);
  if (result) {
    in_flight_[id] = command;
  }
  return result;
}

LifecycleResult RoSpecRegistry::Confirm(model::RoSpecCommand command, std::uint32_t id) {
  std::lock_guard lock(mutex_);

  in_flight_.erase(id);
  const bool started_early = started_early_.erase(id) > 0;

  const auto target = model::TargetState(command);
  if (!target) {
    if (id == 0) {
      rospecs_.clear();
      in_flight_.clear();
      started_early_.clear();
    } else {
      rospecs_.erase(id);
    }
    return LifecycleResult::Ok();
  }

  auto it = rospecs_.find(id);
  if (it == rospecs_.end()) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kROSpecNotFound, Describe(id) + " not found"),
                  model::RoSpecCommandName(command), id);
  }

  auto& state = it->second.current_state;
  if (AlreadyReached(state, command)) {
    return LifecycleResult::Ok();
  }
  if (!model::CanApply(state, command)) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                        std::string(model::RoSpecCommandName(command)) + " accepted by reader but " +
                                            Describe(id) + " is " + model::RoSpecStateName(state)),
                  model::RoSpecCommandName(command), id);
  }

  state = *target;
  if (command == model::RoSpecCommand::kEnable && started_early) {
    state = model::RoSpecState::kActive;
  }
  return LifecycleResult::Ok();
}

void RoSpecRegistry::Abandon(std::uint32_t id) {
  std::lock_guard lock(mutex_);
  in_flight_.erase(id);
  started_early_.erase(id);
}

LifecycleResult RoSpecRegistry::Enable(std::uint32_t id) {
  return Apply(model::RoSpecCommand::kEnable, id);
}

LifecycleResult RoSpecRegistry::Start(std::uint32_t id) {
  return Apply(model::RoSpecCommand::kStart, id);
}

LifecycleResult RoSpecRegistry::Stop(std::uint32_t id) {
  return Apply(model::RoSpecCommand::kStop, id);
}

LifecycleResult RoSpecRegistry::Disable(std::uint32_t id) {
  return Apply(model::RoSpecCommand::kDisable, id);
}

LifecycleResult RoSpecRegistry::Delete(std::uint32_t id) {
  return Apply(model::RoSpecCommand::kDelete, id);
}

// ------------------------------------------------------------
// Triggers
// ------------------------------------------------------------

LifecycleResult RoSpecRegistry::FireStartTrigger(std::uint32_t id, TriggerCause cause) {
  std::lock_guard lock(mutex_);

  auto it = rospecs_.find(id);
  if (it == rospecs_.end()) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kROSpecNotFound, Describe(id) + " not found"),
                  "StartTrigger", id);
  }

  auto& rospec = it->second;
  if (rospec.current_state != model::RoSpecState::kInactive) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                        Describe(id) + " is " + model::RoSpecStateName(rospec.current_state)),
                  "StartTrigger", id);
  }
  if (!StartTriggerMatches(rospec.boundary.start_trigger, cause)) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kTriggerMismatch,
                                        std::string(TriggerCauseName(cause)) + " is not a start trigger of " +
                                            Describe(id)),
                  "StartTrigger", id);
  }

  rospec.current_state = model::RoSpecState::kActive;
  return LifecycleResult::Ok();
}

LifecycleResult RoSpecRegistry::FireStopTrigger(std::uint32_t id, TriggerCause cause) {
  std::lock_guard lock(mutex_);

  auto it = rospecs_.find(id);
  if (it == rospecs_.end()) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kROSpecNotFound, Describe(id) + " not found"),
                  "StopTrigger", id);
  }

  auto& rospec = it->second;
  if (rospec.current_state != model::RoSpecState::kActive) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                        Describe(id) + " is " + model::RoSpecStateName(rospec.current_state)),
                  "StopTrigger", id);
  }
  if (!StopTriggerMatches(rospec, cause)) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kTriggerMismatch,
                                        std::string(TriggerCauseName(cause)) + " is not a stop trigger of " +
                                            Describe(id)),
                  "StopTrigger", id);
  }

  rospec.current_state = model::RoSpecState::kInactive;
  return LifecycleResult::Ok();
}

std::vector<std::uint32_t> RoSpecRegistry::OnGpiEvent(std::uint16_t port, bool level) {
  std::lock_guard lock(mutex_);

  std::vector<std::uint32_t> starts;
  std::vector<std::uint32_t> stops;

  for (const auto& [id, rospec] : rospecs_) {
    const auto& start = rospec.boundary.start_trigger;
    const auto& stop  = rospec.boundary.stop_trigger;

    if (rospec.current_state == model::RoSpecState::kInactive && start.type == model::StartTriggerType::kGpi &&
        start.gpi && start.gpi->gpi_port == port && start.gpi->gpi_event == level) {
      starts.push_back(id);
    } else if (rospec.current_state == model::RoSpecState::kActive &&
               stop.type == model::StopTriggerType::kGpiWithTimeout && stop.gpi && stop.gpi->gpi_port == port &&
               stop.gpi->gpi_event == level) {
      stops.push_back(id);
    }
  }

  for (auto id : starts) {
    rospecs_.at(id).current_state = model::RoSpecState::kActive;
  }
  for (auto id : stops) {
    rospecs_.at(id).current_state = model::RoSpecState::kInactive;
  }

  std::vector<std::uint32_t> changed;
  std::merge(starts.begin(), starts.end(), stops.begin(), stops.end(), std::back_inserter(changed));
  return changed;
}

LifecycleResult RoSpecRegistry::ApplyRoSpecEvent(const model::RoSpecEvent& event) {
  std::lock_guard lock(mutex_);

  auto it = rospecs_.find(event.rospec_id);
  if (it == rospecs_.end()) {
    return LifecycleResult::Fail(LifecycleStatus::kROSpecNotFound, Describe(event.rospec_id) + " not found");
  }

  auto& state = it->second.current_state;
  switch (event.type) {
    case model::RoSpecEventType::kStart:
      if (state == model::RoSpecState::kDisabled) {
        const auto pending = in_flight_.find(event.rospec_id);
        if (pending != in_flight_.end() && pending->second == model::RoSpecCommand::kEnable) {
          started_early_.insert(event.rospec_id);
          LLRP_LOG_DEBUG("rospec start held until enable is confirmed",
                         {observability::IntField("rospec_id", event.rospec_id)});
          return LifecycleResult::Ok();
        }
        return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                            "reader started disabled " + Describe(event.rospec_id)),
                      "ROSpecEvent", event.rospec_id);
      }
      state = model::RoSpecState::kActive;
      break;

    case model::RoSpecEventType::kEnd:
    case model::RoSpecEventType::kPreempted:
      started_early_.erase(event.rospec_id);
      if (state == model::RoSpecState::kActive) {
        state = model::RoSpecState::kInactive;
      }
      break;
  }
  return LifecycleResult::Ok();
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<AntennaConflict> RoSpecRegistry::AntennaConflicts() const {
  std::lock_guard lock(mutex_);

  std::vector<const model::RoSpec*> active;
  for (const auto& [id, rospec] : rospecs_) {
    if (rospec.current_state == model::RoSpecState::kActive) {
      active.push_back(&rospec);
    }
  }

  std::vector<AntennaConflict> conflicts;
  for (std::size_t i = 0; i < active.size(); ++i) {
    const auto first_antennas = model::AntennasOf(*active[i]);
    for (std::size_t j = i + 1; j < active.size(); ++j) {
      auto shared = Overlap(first_antennas, model::AntennasOf(*active[j]));
      if (shared.empty()) {
        continue;
      }
      conflicts.push_back(AntennaConflict{active[i]->id, active[i]->priority, active[j]->id, active[j]->priority,
                                          std::move(shared)});
    }
  }
  return conflicts;
}

LifecycleResult RoSpecRegistry::ReplaceAll(const std::vector<model::RoSpec>& rospecs) {
  std::map<std::uint32_t, model::RoSpec> rebuilt;
  for (const auto& rospec : rospecs) {
    if (rospec.id == 0) {
      return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidId, "listing contains ROSpec id 0"),
                    "ReplaceAll", 0);
    }
    if (!rebuilt.emplace(rospec.id, rospec).second) {
      return Reject(LifecycleResult::Fail(LifecycleStatus::kDuplicateId,
                                          "listing repeats " + Describe(rospec.id)),
                    "ReplaceAll", rospec.id);
    }
  }

  std::lock_guard lock(mutex_);
  rospecs_.swap(rebuilt);
  started_early_.clear();
  return LifecycleResult::Ok();
}

std::optional<model::RoSpec> RoSpecRegistry::Get(std::uint32_t id) const {
  std::lock_guard lock(mutex_);
  auto it = rospecs_.find(id);
  if (it == rospecs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<model::RoSpecState> RoSpecRegistry::State(std::uint32_t id) const {
  std::lock_guard lock(mutex_);
  auto it = rospecs_.find(id);
  if (it == rospecs_.end()) {
    return std::nullopt;
  }
  return it->second.current_state;
}

std::vector<model::RoSpec> RoSpecRegistry::List() const {
  std::lock_guard lock(mutex_);
  std::vector<model::RoSpec> out;
  out.reserve(rospecs_.size());
  for (const auto& [id, rospec] : rospecs_) {
    out.push_back(rospec);
  }
  return out;
}

std::size_t RoSpecRegistry::size() const {
  std::lock_guard lock(mutex_);
  return rospecs_.size();
}

} // namespace llrp::lifecycle
