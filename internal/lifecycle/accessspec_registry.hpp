#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/lifecycle/lifecycle_status.hpp"
#include "internal/lifecycle/rospec_registry.hpp"
#include "internal/model/accessspec.hpp"
#include "internal/model/state_machine.hpp"

namespace llrp::lifecycle {

enum class OpOutcome : std::uint8_t {
  kSucceeded,
  kFailed,
  kSkipped,
};

const char* OpOutcomeName(OpOutcome outcome);

struct OpExecution {
  std::optional<std::uint16_t>       op_spec_id;
  OpOutcome                          outcome = OpOutcome::kSkipped;
  std::optional<model::OpSpecResult> result;
};

// Outcome of one AccessSpec invocation against a singulated tag.
struct ExecutionRecord {
  std::uint32_t            accessspec_id = 0;
  std::vector<OpExecution> operations;
  std::uint32_t            executions = 0;      // invocations recorded so far
  bool                     removed    = false;  // OperationCount reached

  bool Succeeded() const;
};

/*
  AccessSpecRegistry

  Mirror of the reader's AccessSpecs with the same all-or-nothing discipline
  as RoSpecRegistry. Specs are kept in the order they were added, which is
  the order a reader evaluates them in.
*/
class AccessSpecRegistry {
 public:
  LifecycleResult Add(const model::AccessSpec& accessspec);

  LifecycleResult Enable(std::uint32_t id);
  LifecycleResult Disable(std::uint32_t id);

  // Id 0 removes every AccessSpec.
  LifecycleResult Delete(std::uint32_t id);

  LifecycleResult CheckAdd(const model::AccessSpec& accessspec) const;
  LifecycleResult Check(model::AccessSpecCommand command, std::uint32_t id) const;

  LifecycleResult Apply(model::AccessSpecCommand command, std::uint32_t id);

  LifecycleResult ReplaceAll(const std::vector<model::AccessSpec>& accessspecs);

  // Enabled specs that run when `rospec_id` singulates a tag on `antenna_id`.
  std::vector<model::AccessSpec> Eligible(const RoSpecRegistry& rospecs, std::uint32_t rospec_id,
                                          std::uint16_t antenna_id) const;

  // Pairs each of the spec's op_specs with the result carrying its OpSpecID;
  // vendor operations take vendor results in order. A result of the wrong
  // type counts as a failure. Operations without a result, and those after
  // the first failure unless `continue_on_failure` is set, are Skipped.
  LifecycleResult RecordExecution(std::uint32_t id, const std::vector<model::OpSpecResult>& results,
                                  bool continue_on_failure, ExecutionRecord* record);

  std::optional<model::AccessSpec> Get(std::uint32_t id) const;
  std::vector<model::AccessSpec>   List() const;
  std::size_t                      size() const;

  // Most recent RecordExecution outcome of a registered spec.
  std::optional<ExecutionRecord> LastExecution(std::uint32_t id) const;

 private:
  struct Entry {
    model::AccessSpec spec;
    std::uint64_t     sequence   = 0;
    std::uint32_t     executions = 0;

    std::optional<ExecutionRecord> last_execution;
  };

  LifecycleResult CheckAddLocked(const model::AccessSpec& accessspec) const;
  LifecycleResult CheckLocked(model::AccessSpecCommand command, std::uint32_t id) const;

  std::vector<const Entry*> OrderedLocked() const;

  mutable std::mutex mutex_;

  std::map<std::uint32_t, Entry> accessspecs_;
  std::uint64_t                  next_sequence_ = 0;
};

} // namespace llrp::lifecycle
