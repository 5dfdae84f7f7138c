#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "internal/lifecycle/lifecycle_status.hpp"
#include "internal/model/events.hpp"
#include "internal/model/rospec.hpp"
#include "internal/model/state_machine.hpp"

namespace llrp::lifecycle {

// What made the reader start or stop a ROSpec on its own.
enum class TriggerCause : std::uint8_t {
  kPeriodic,
  kGpi,
  kDuration,
  kTagObservation,
  kTimeout,
};

const char* TriggerCauseName(TriggerCause cause);

// Two Active ROSpecs that inventory at least one common antenna.
struct AntennaConflict {
  std::uint32_t              first_id        = 0;
  std::uint8_t               first_priority  = 0;
  std::uint32_t              second_id       = 0;
  std::uint8_t               second_priority = 0;
  std::vector<std::uint16_t> antennas;  // {0} when both cover all antennas

  bool operator==(const AntennaConflict&) const = default;
};

/*
  RoSpecRegistry

  Client-side mirror of the ROSpecs held by the reader. Every mutation is
  validated first and applied whole or not at all; a rejected command leaves
  the registry untouched.
*/
class RoSpecRegistry {
 public:
  LifecycleResult Add(const model::RoSpec& rospec);

  LifecycleResult Enable(std::uint32_t id);
  LifecycleResult Start(std::uint32_t id);
  LifecycleResult Stop(std::uint32_t id);
  LifecycleResult Disable(std::uint32_t id);

  // Id 0 removes every ROSpec.
  LifecycleResult Delete(std::uint32_t id);

  // Validation without mutation.
  LifecycleResult CheckAdd(const model::RoSpec& rospec) const;
  LifecycleResult Check(model::RoSpecCommand command, std::uint32_t id) const;

  LifecycleResult Apply(model::RoSpecCommand command, std::uint32_t id);

  // Reader round trip: Begin validates and marks `command` in flight, then
  // Confirm applies it once the reader accepted it or Abandon drops it.
  // Confirm leaves a ROSpec that ROSpecEvents already moved to the target
  // state, or past it, as it is.
  LifecycleResult Begin(model::RoSpecCommand command, std::uint32_t id);
  LifecycleResult Confirm(model::RoSpecCommand command, std::uint32_t id);
  void            Abandon(std::uint32_t id);

  // Autonomous transitions driven by start/stop triggers.
  LifecycleResult FireStartTrigger(std::uint32_t id, TriggerCause cause);
  LifecycleResult FireStopTrigger(std::uint32_t id, TriggerCause cause);

  // Fires every GPI trigger that matches; returns the ids that changed state.
  std::vector<std::uint32_t> OnGpiEvent(std::uint16_t port, bool level);

  // A Start event for a Disabled ROSpec whose Enable is in flight is held
  // and applied by Confirm.
  LifecycleResult ApplyRoSpecEvent(const model::RoSpecEvent& event);

  std::vector<AntennaConflict> AntennaConflicts() const;

  // Rebuilds the registry from a GET_ROSPECS listing.
  LifecycleResult ReplaceAll(const std::vector<model::RoSpec>& rospecs);

  std::optional<model::RoSpec>      Get(std::uint32_t id) const;
  std::optional<model::RoSpecState> State(std::uint32_t id) const;
  std::vector<model::RoSpec>        List() const;
  std::size_t                       size() const;

 private:
  LifecycleResult CheckAddLocked(const model::RoSpec& rospec) const;
  LifecycleResult CheckLocked(model::RoSpecCommand command, std::uint32_t id) const;

  mutable std::mutex mutex_;

  std::map<std::uint32_t, model::RoSpec>        rospecs_;
  std::map<std::uint32_t, model::RoSpecCommand> in_flight_;
  std::set<std::uint32_t>                       started_early_;
};

} // namespace llrp::lifecycle
