#include "accessspec_registry.hpp"

#include <algorithm>
#include <string>

#include "internal/observability/logging.hpp"

namespace llrp::lifecycle {
namespace {

std::string Describe(std::uint32_t id) {
  return "AccessSpec " + std::to_string(id);
}

LifecycleResult Reject(LifecycleResult result, const char* operation, std::uint32_t id) {
  LLRP_LOG_WARN("accessspec command rejected",
                {observability::StringField("op", operation),
                 observability::IntField("accessspec_id", id),
                 observability::StringField("status", LifecycleStatusName(result.status)),
                 observability::StringField("reason", result.message)});
  return result;
}

// Index of the first unused result that belongs to `op`.
std::optional<std::size_t> FindResult(const model::OpSpec& op, const std::vector<model::OpSpecResult>& results,
                                      std::vector<bool>* used) {
  const auto id = model::OpSpecIdOf(op);
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (!(*used)[i] && model::OpSpecIdOf(results[i]) == id) {
      (*used)[i] = true;
      return i;
    }
  }
  return std::nullopt;
}

} // namespace

const char* OpOutcomeName(OpOutcome outcome) {
  switch (outcome) {
    case OpOutcome::kSucceeded: return "Succeeded";
    case OpOutcome::kFailed: return "Failed";
    case OpOutcome::kSkipped: return "Skipped";
  }
  return "Unknown";
}

bool ExecutionRecord::Succeeded() const {
  return std::all_of(operations.begin(), operations.end(),
                     [](const OpExecution& op) { return op.outcome == OpOutcome::kSucceeded; });
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

LifecycleResult AccessSpecRegistry::CheckAddLocked(const model::AccessSpec& accessspec) const {
  if (accessspec.id == 0) {
    return LifecycleResult::Fail(LifecycleStatus::kInvalidId, "AccessSpec id 0 is reserved");
  }
  if (accessspecs_.count(accessspec.id)) {
    return LifecycleResult::Fail(LifecycleStatus::kDuplicateId, Describe(accessspec.id) + " already exists");
  }
  if (accessspec.current_state != model::AccessSpecState::kDisabled) {
    return LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                 Describe(accessspec.id) + " must be added Disabled");
  }
  return LifecycleResult::Ok();
}

LifecycleResult AccessSpecRegistry::CheckLocked(model::AccessSpecCommand command, std::uint32_t id) const {
  if (id == 0) {
    if (command == model::AccessSpecCommand::kDelete) {
      return LifecycleResult::Ok();
    }
    return LifecycleResult::Fail(LifecycleStatus::kInvalidId,
                                 std::string(model::AccessSpecCommandName(command)) + " requires an AccessSpec id");
  }

  auto it = accessspecs_.find(id);
  if (it == accessspecs_.end()) {
    return LifecycleResult::Fail(LifecycleStatus::kAccessSpecNotFound, Describe(id) + " not found");
  }

  if (!model::CanApply(it->second.spec.current_state, command)) {
    return LifecycleResult::Fail(LifecycleStatus::kInvalidState,
                                 std::string(model::AccessSpecCommandName(command)) + " not valid for " +
                                     Describe(id) + " in state " +
                                     model::AccessSpecStateName(it->second.spec.current_state));
  }
  return LifecycleResult::Ok();
}

LifecycleResult AccessSpecRegistry::CheckAdd(const model::AccessSpec& accessspec) const {
  std::lock_guard lock(mutex_);
  return CheckAddLocked(accessspec);
}

LifecycleResult AccessSpecRegistry::Check(model::AccessSpecCommand command, std::uint32_t id) const {
  std::lock_guard lock(mutex_);
  return CheckLocked(command, id);
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

LifecycleResult AccessSpecRegistry::Add(const model::AccessSpec& accessspec) {
  std::lock_guard lock(mutex_);

  auto result = CheckAddLocked(accessspec);
  if (!result) {
    return Reject(std::move(result), "AddAccessSpec", accessspec.id);
  }

  accessspecs_.emplace(accessspec.id, Entry{accessspec, next_sequence_++, 0});
  return result;
}

LifecycleResult AccessSpecRegistry::Apply(model::AccessSpecCommand command, std::uint32_t id) {
  std::lock_guard lock(mutex_);

  auto result = CheckLocked(command, id);
  if (!result) {
    return Reject(std::move(result), model::AccessSpecCommandName(command), id);
  }

  switch (command) {
    case model::AccessSpecCommand::kEnable:
      accessspecs_.at(id).spec.current_state = model::AccessSpecState::kEnabled;
      break;
    case model::AccessSpecCommand::kDisable:
      accessspecs_.at(id).spec.current_state = model::AccessSpecState::kDisabled;
      break;
    case model::AccessSpecCommand::kDelete:
      if (id == 0) {
        accessspecs_.clear();
      } else {
        accessspecs_.erase(id);
      }
      break;
  }
  return result;
}

LifecycleResult AccessSpecRegistry::Enable(std::uint32_t id) {
  return Apply(model::AccessSpecCommand::kEnable, id);
}

LifecycleResult AccessSpecRegistry::Disable(std::uint32_t id) {
  return Apply(model::AccessSpecCommand::kDisable, id);
}

LifecycleResult AccessSpecRegistry::Delete(std::uint32_t id) {
  return Apply(model::AccessSpecCommand::kDelete, id);
}

LifecycleResult AccessSpecRegistry::ReplaceAll(const std::vector<model::AccessSpec>& accessspecs) {
  std::map<std::uint32_t, Entry> rebuilt;
  std::uint64_t                  sequence = 0;
  for (const auto& accessspec : accessspecs) {
    if (accessspec.id == 0) {
      return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidId, "listing contains AccessSpec id 0"),
                    "ReplaceAll", 0);
    }
    if (!rebuilt.emplace(accessspec.id, Entry{accessspec, sequence++, 0}).second) {
      return Reject(LifecycleResult::Fail(LifecycleStatus::kDuplicateId,
                                          "listing repeats " + Describe(accessspec.id)),
                    "ReplaceAll", accessspec.id);
    }
  }

  std::lock_guard lock(mutex_);
  for (auto& [id, entry] : rebuilt) {
    auto previous = accessspecs_.find(id);
    if (previous != accessspecs_.end()) {
      entry.spec.continue_on_failure = previous->second.spec.continue_on_failure;
    }
  }
  accessspecs_.swap(rebuilt);
  next_sequence_ = sequence;
  return LifecycleResult::Ok();
}

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

std::vector<model::AccessSpec> AccessSpecRegistry::Eligible(const RoSpecRegistry& rospecs, std::uint32_t rospec_id,
                                                            std::uint16_t antenna_id) const {
  if (rospecs.State(rospec_id) != model::RoSpecState::kActive) {
    return {};
  }

  std::lock_guard lock(mutex_);

  std::vector<model::AccessSpec> out;
  for (const auto* entry : OrderedLocked()) {
    const auto& spec = entry->spec;
    if (spec.current_state != model::AccessSpecState::kEnabled) {
      continue;
    }
    if (spec.rospec_id != 0 && spec.rospec_id != rospec_id) {
      continue;
    }
    if (spec.antenna_id != 0 && spec.antenna_id != antenna_id) {
      continue;
    }
    out.push_back(spec);
  }
  return out;
}

LifecycleResult AccessSpecRegistry::RecordExecution(std::uint32_t id, const std::vector<model::OpSpecResult>& results,
                                                    bool continue_on_failure, ExecutionRecord* record) {
  std::lock_guard lock(mutex_);

  auto it = accessspecs_.find(id);
  if (it == accessspecs_.end()) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kAccessSpecNotFound, Describe(id) + " not found"),
                  "RecordExecution", id);
  }
  auto& entry = it->second;
  if (entry.spec.current_state != model::AccessSpecState::kEnabled) {
    return Reject(LifecycleResult::Fail(LifecycleStatus::kInvalidState, Describe(id) + " is not enabled"),
                  "RecordExecution", id);
  }

  ExecutionRecord out;
  out.accessspec_id = id;

  std::vector<bool> used(results.size(), false);
  bool              failed = false;
  for (const auto& spec_op : entry.spec.command.op_specs) {
    OpExecution op;
    op.op_spec_id = model::OpSpecIdOf(spec_op);

    const auto match = FindResult(spec_op, results, &used);
    if (match && !(failed && !continue_on_failure)) {
      const auto& result = results[*match];
      op.result          = result;
      if (!model::ResultMatches(spec_op, result)) {
        LLRP_LOG_WARN("opspec result does not match its operation",
                      {observability::IntField("accessspec_id", id),
                       observability::IntField("op_spec_id", op.op_spec_id.value_or(0))});
        op.outcome = OpOutcome::kFailed;
      } else {
        op.outcome = model::Succeeded(result) ? OpOutcome::kSucceeded : OpOutcome::kFailed;
      }
      failed = failed || op.outcome == OpOutcome::kFailed;
    }
    out.operations.push_back(std::move(op));
  }

  const auto unmatched = std::count(used.begin(), used.end(), false);
  if (unmatched > 0) {
    LLRP_LOG_DEBUG("opspec results without an operation",
                   {observability::IntField("accessspec_id", id), observability::IntField("count", unmatched)});
  }

  out.executions       = ++entry.executions;
  entry.last_execution = out;

  const auto& stop = entry.spec.stop_trigger;
  if (stop.type == model::AccessSpecStopTriggerType::kOperationCount && stop.operation_count > 0 &&
      entry.executions >= stop.operation_count) {
    LLRP_LOG_INFO("accessspec operation count reached",
                  {observability::IntField("accessspec_id", id),
                   observability::IntField("operation_count", stop.operation_count)});
    accessspecs_.erase(it);
    out.removed = true;
  }

  if (record) {
    *record = std::move(out);
  }
  return LifecycleResult::Ok();
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<const AccessSpecRegistry::Entry*> AccessSpecRegistry::OrderedLocked() const {
  std::vector<const Entry*> ordered;
  ordered.reserve(accessspecs_.size());
  for (const auto& [id, entry] : accessspecs_) {
    ordered.push_back(&entry);
  }
  std::sort(ordered.begin(), ordered.end(),
            [](const Entry* a, const Entry* b) { return a->sequence < b->sequence; });
  return ordered;
}

std::optional<model::AccessSpec> AccessSpecRegistry::Get(std::uint32_t id) const {
  std::lock_guard lock(mutex_);
  auto it = accessspecs_.find(id);
  if (it == accessspecs_.end()) {
    return std::nullopt;
  }
  return it->second.spec;
}

std::vector<model::AccessSpec> AccessSpecRegistry::List() const {
  std::lock_guard lock(mutex_);
  std::vector<model::AccessSpec> out;
  for (const auto* entry : OrderedLocked()) {
    out.push_back(entry->spec);
  }
  return out;
}

std::optional<ExecutionRecord> AccessSpecRegistry::LastExecution(std::uint32_t id) const {
  std::lock_guard lock(mutex_);
  auto it = accessspecs_.find(id);
  if (it == accessspecs_.end()) {
    return std::nullopt;
  }
  return it->second.last_execution;
}

std::size_t AccessSpecRegistry::size() const {
  std::lock_guard lock(mutex_);
  return accessspecs_.size();
}

} // namespace llrp::lifecycle
