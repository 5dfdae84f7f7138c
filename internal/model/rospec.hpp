#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "internal/model/antenna.hpp"
#include "internal/model/common.hpp"

namespace llrp::model {

enum class RoSpecState : std::uint8_t {
  kDisabled = 0,
  kInactive = 1,
  kActive   = 2,
};

const char* RoSpecStateName(RoSpecState state);

// ------------------------------------------------------------
// Boundary triggers
// ------------------------------------------------------------

enum class StartTriggerType : std::uint8_t {
  kNull      = 0,
  kImmediate = 1,
  kPeriodic  = 2,
  kGpi       = 3,
};

enum class StopTriggerType : std::uint8_t {
  kNull           = 0,
  kDuration       = 1,
  kGpiWithTimeout = 2,
};

struct PeriodicTriggerValue {
  std::uint32_t                offset_ms = 0;
  std::uint32_t                period_ms = 0;
  std::optional<std::uint64_t> utc_timestamp;  // microseconds since epoch
  std::vector<OpaqueParameter> unknown;

  bool operator==(const PeriodicTriggerValue&) const = default;
};

struct GpiTriggerValue {
  std::uint16_t gpi_port   = 0;
  bool          gpi_event  = false;  // level that fires the trigger
  std::uint32_t timeout_ms = 0;

  bool operator==(const GpiTriggerValue&) const = default;
};

struct RoSpecStartTrigger {
  StartTriggerType                    type = StartTriggerType::kNull;
  std::optional<PeriodicTriggerValue> periodic;
  std::optional<GpiTriggerValue>      gpi;
  std::vector<OpaqueParameter>        unknown;

  bool operator==(const RoSpecStartTrigger&) const = default;
};

struct RoSpecStopTrigger {
  StopTriggerType                type        = StopTriggerType::kNull;
  std::uint32_t                  duration_ms = 0;
  std::optional<GpiTriggerValue> gpi;
  std::vector<OpaqueParameter>   unknown;

  bool operator==(const RoSpecStopTrigger&) const = default;
};

struct RoBoundarySpec {
  RoSpecStartTrigger           start_trigger;
  RoSpecStopTrigger            stop_trigger;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const RoBoundarySpec&) const = default;
};

// ------------------------------------------------------------
// Antenna inventory specs
// ------------------------------------------------------------

enum class AiSpecStopTriggerType : std::uint8_t {
  kNull           = 0,
  kDuration       = 1,
  kGpiWithTimeout = 2,
  kTagObservation = 3,
};

struct TagObservationTrigger {
  // 0 upon seeing N tags or timeout, 1 upon seeing no more new tags for T ms
  // or timeout, 2 N attempts to see all tags in the FOV or timeout.
  std::uint8_t  trigger_type       = 0;
  std::uint16_t number_of_tags     = 0;
  std::uint16_t number_of_attempts = 0;
  std::uint16_t t_ms               = 0;
  std::uint32_t timeout_ms         = 0;

  bool operator==(const TagObservationTrigger&) const = default;
};

struct AiSpecStopTrigger {
  AiSpecStopTriggerType                type        = AiSpecStopTriggerType::kNull;
  std::uint32_t                        duration_ms = 0;
  std::optional<GpiTriggerValue>       gpi;
  std::optional<TagObservationTrigger> tag_observation;
  std::vector<OpaqueParameter>         unknown;

  bool operator==(const AiSpecStopTrigger&) const = default;
};

struct InventoryParameterSpec {
  std::uint16_t                     spec_id     = 0;
  std::uint8_t                      protocol_id = 1;  // EPCGlobal Class 1 Gen 2
  std::vector<AntennaConfiguration> antenna_configurations;
  std::vector<CustomParameter>      custom;
  std::vector<OpaqueParameter>      unknown;

  bool operator==(const InventoryParameterSpec&) const = default;
};

struct AiSpec {
  std::vector<std::uint16_t>          antenna_ids;  // {0} = all antennas
  AiSpecStopTrigger                   stop_trigger;
  std::vector<InventoryParameterSpec> inventory_parameter_specs;
  std::vector<CustomParameter>        custom;
  std::vector<OpaqueParameter>        unknown;

  bool operator==(const AiSpec&) const = default;
};

struct RfSurveySpecStopTrigger {
  std::uint8_t  type        = 0;  // 0 null, 1 duration, 2 N iterations through range
  std::uint32_t duration_ms = 0;
  std::uint32_t n           = 0;

  bool operator==(const RfSurveySpecStopTrigger&) const = default;
};

struct RfSurveySpec {
  std::uint16_t                antenna_id      = 0;
  std::uint32_t                start_frequency = 0;  // kHz
  std::uint32_t                end_frequency   = 0;  // kHz
  RfSurveySpecStopTrigger      stop_trigger;
  std::vector<CustomParameter> custom;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const RfSurveySpec&) const = default;
};

using SpecParameter = std::variant<AiSpec, RfSurveySpec, CustomParameter>;

// ------------------------------------------------------------
// Report selection
// ------------------------------------------------------------

struct C1G2EpcMemorySelector {
  bool enable_crc     = false;
  bool enable_pc_bits = false;

  bool operator==(const C1G2EpcMemorySelector&) const = default;
};

struct TagReportContentSelector {
  bool enable_rospec_id                    = false;
  bool enable_spec_index                   = false;
  bool enable_inventory_parameter_spec_id  = false;
  bool enable_antenna_id                   = false;
  bool enable_channel_index                = false;
  bool enable_peak_rssi                    = false;
  bool enable_first_seen_timestamp         = false;
  bool enable_last_seen_timestamp          = false;
  bool enable_tag_seen_count               = false;
  bool enable_access_spec_id               = false;
  std::vector<C1G2EpcMemorySelector> air_protocol_selectors;
  std::vector<OpaqueParameter>       unknown;

  bool operator==(const TagReportContentSelector&) const = default;
};

enum class RoReportTrigger : std::uint8_t {
  kNone                   = 0,
  kUponNTagsOrEndOfAiSpec = 1,
  kUponNTagsOrEndOfRoSpec = 2,
};

struct RoReportSpec {
  RoReportTrigger              trigger = RoReportTrigger::kNone;
  std::uint16_t                n       = 0;
  TagReportContentSelector     content_selector;
  std::vector<CustomParameter> custom;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const RoReportSpec&) const = default;
};

// ------------------------------------------------------------
// ROSpec
// ------------------------------------------------------------

struct RoSpec {
  std::uint32_t                id            = 0;
  std::uint8_t                 priority      = 0;  // 0 highest .. 7
  RoSpecState                  current_state = RoSpecState::kDisabled;
  RoBoundarySpec               boundary;
  std::vector<SpecParameter>   specs;
  std::optional<RoReportSpec>  report_spec;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const RoSpec&) const = default;
};

// Antennas the ROSpec's AISpecs and RFSurveySpecs touch. Contains 0 when any
// spec covers all antennas.
std::vector<std::uint16_t> AntennasOf(const RoSpec& spec);

} // namespace llrp::model
