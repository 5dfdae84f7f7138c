#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/accessspec.hpp"
#include "internal/model/antenna.hpp"
#include "internal/model/common.hpp"
#include "internal/model/rospec.hpp"

namespace llrp::model {

// GET_READER_CONFIG RequestedData selector.
enum class ConfigRequest : std::uint8_t {
  kAll                         = 0,
  kIdentification              = 1,
  kAntennaProperties           = 2,
  kAntennaConfiguration        = 3,
  kRoReportSpec                = 4,
  kReaderEventNotificationSpec = 5,
  kAccessReportSpec            = 6,
  kLlrpConfigurationStateValue = 7,
  kKeepaliveSpec               = 8,
  kGpiPortCurrentState         = 9,
  kGpoWriteData                = 10,
  kEventsAndReports            = 11,
};

struct Identification {
  std::uint8_t id_type   = 0;  // 0 MAC address, 1 EPC
  Bytes        reader_id;

  bool operator==(const Identification&) const = default;
};

struct EventNotificationState {
  std::uint16_t event_type = 0;  // ReaderEventType
  bool          enabled    = false;

  bool operator==(const EventNotificationState&) const = default;
};

struct ReaderEventNotificationSpec {
  std::vector<EventNotificationState> states;
  std::vector<OpaqueParameter>        unknown;

  bool operator==(const ReaderEventNotificationSpec&) const = default;
};

enum class KeepaliveTriggerType : std::uint8_t {
  kNull     = 0,
  kPeriodic = 1,
};

struct KeepaliveSpec {
  KeepaliveTriggerType trigger   = KeepaliveTriggerType::kNull;
  std::uint32_t        period_ms = 0;

  bool operator==(const KeepaliveSpec&) const = default;
};

struct GpiPortCurrentState {
  std::uint16_t port    = 0;
  bool          enabled = false;
  std::uint8_t  state   = 0;  // 0 low, 1 high, 2 unknown

  bool operator==(const GpiPortCurrentState&) const = default;
};

struct GpoWriteData {
  std::uint16_t port = 0;
  bool          data = false;

  bool operator==(const GpoWriteData&) const = default;
};

struct EventsAndReports {
  bool hold_events_and_reports_upon_reconnect = false;

  bool operator==(const EventsAndReports&) const = default;
};

/*
  ReaderConfig

  Mirrors the reader's configuration groups. Every field is optional: on
  SET_READER_CONFIG an absent field means "leave unchanged"; in a
  GET_READER_CONFIG_RESPONSE it means "not requested or not supported".
  Identification and the configuration state value are read-only.
*/
struct ReaderConfig {
  std::optional<Identification>              identification;
  std::vector<AntennaProperties>             antenna_properties;
  std::vector<AntennaConfiguration>          antenna_configurations;
  std::optional<ReaderEventNotificationSpec> event_notification_spec;
  std::optional<RoReportSpec>                ro_report_spec;
  std::optional<AccessReportSpec>            access_report_spec;
  std::optional<std::uint32_t>               configuration_state;
  std::optional<KeepaliveSpec>               keepalive_spec;
  std::vector<GpiPortCurrentState>           gpi_port_states;
  std::vector<GpoWriteData>                  gpo_write_data;
  std::optional<EventsAndReports>            events_and_reports;
  std::vector<CustomParameter>               custom;
  std::vector<OpaqueParameter>               unknown;

  bool operator==(const ReaderConfig&) const = default;
};

// Applies the fields present in `partial` to `dst`. Per-antenna entries
// replace the entry with the same antenna id; GPI/GPO entries replace by port;
// event notification states replace by event type. Custom parameters replace
// by (vendor, subtype).
void MergeReaderConfig(ReaderConfig* dst, const ReaderConfig& partial);

} // namespace llrp::model
