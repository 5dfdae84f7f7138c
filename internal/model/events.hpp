#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/common.hpp"

namespace llrp::model {

// EventNotificationState event types.
enum class ReaderEventType : std::uint16_t {
  kUpstreamHopping           = 0,
  kGpi                       = 1,
  kRoSpec                    = 2,
  kReportBufferFillWarning   = 3,
  kReaderException           = 4,
  kRfSurvey                  = 5,
  kAiSpec                    = 6,
  kAiSpecWithDetails         = 7,
  kAntenna                   = 8,
};

struct HoppingEvent {
  std::uint16_t hop_table_id       = 0;
  std::uint16_t next_channel_index = 0;

  bool operator==(const HoppingEvent&) const = default;
};

struct GpiEvent {
  std::uint16_t gpi_port = 0;
  bool          level    = false;

  bool operator==(const GpiEvent&) const = default;
};

enum class RoSpecEventType : std::uint8_t {
  kStart     = 0,
  kEnd       = 1,
  kPreempted = 2,
};

struct RoSpecEvent {
  RoSpecEventType type                  = RoSpecEventType::kStart;
  std::uint32_t   rospec_id             = 0;
  std::uint32_t   preempting_rospec_id  = 0;

  bool operator==(const RoSpecEvent&) const = default;
};

struct ReportBufferLevelWarningEvent {
  std::uint8_t percentage_full = 0;

  bool operator==(const ReportBufferLevelWarningEvent&) const = default;
};

struct ReportBufferOverflowErrorEvent {
  bool operator==(const ReportBufferOverflowErrorEvent&) const = default;
};

struct ReaderExceptionEvent {
  std::string                  message;
  std::optional<std::uint32_t> rospec_id;
  std::optional<std::uint16_t> spec_index;
  std::optional<std::uint16_t> inventory_parameter_spec_id;
  std::optional<std::uint16_t> antenna_id;
  std::optional<std::uint32_t> access_spec_id;
  std::optional<std::uint16_t> op_spec_id;
  std::vector<CustomParameter> custom;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const ReaderExceptionEvent&) const = default;
};

struct RfSurveyEvent {
  std::uint8_t  type       = 0;  // 0 start, 1 end
  std::uint32_t rospec_id  = 0;
  std::uint16_t spec_index = 0;

  bool operator==(const RfSurveyEvent&) const = default;
};

struct C1G2SingulationDetails {
  std::uint16_t num_collision_slots = 0;
  std::uint16_t num_empty_slots     = 0;

  bool operator==(const C1G2SingulationDetails&) const = default;
};

struct AiSpecEvent {
  std::uint8_t                          type       = 0;  // 0 end of AISpec
  std::uint32_t                         rospec_id  = 0;
  std::uint16_t                         spec_index = 0;
  std::optional<C1G2SingulationDetails> singulation_details;
  std::vector<OpaqueParameter>          unknown;

  bool operator==(const AiSpecEvent&) const = default;
};

struct AntennaEvent {
  bool          connected  = false;  // event type 1 = connected
  std::uint16_t antenna_id = 0;

  bool operator==(const AntennaEvent&) const = default;
};

// 0 success; non-zero values tell the client why the reader refused it.
struct ConnectionAttemptEvent {
  std::uint16_t status = 0;

  bool operator==(const ConnectionAttemptEvent&) const = default;
};

struct ConnectionCloseEvent {
  bool operator==(const ConnectionCloseEvent&) const = default;
};

struct ReaderEventNotificationData {
  Timestamp                                     timestamp;
  std::optional<HoppingEvent>                   hopping;
  std::optional<GpiEvent>                       gpi;
  std::optional<RoSpecEvent>                    rospec;
  std::optional<ReportBufferLevelWarningEvent>  buffer_level_warning;
  std::optional<ReportBufferOverflowErrorEvent> buffer_overflow;
  std::optional<ReaderExceptionEvent>           reader_exception;
  std::optional<RfSurveyEvent>                  rf_survey;
  std::optional<AiSpecEvent>                    aispec;
  std::optional<AntennaEvent>                   antenna;
  std::optional<ConnectionAttemptEvent>         connection_attempt;
  std::optional<ConnectionCloseEvent>           connection_close;
  std::vector<CustomParameter>                  custom;
  std::vector<OpaqueParameter>                  unknown;

  bool operator==(const ReaderEventNotificationData&) const = default;
};

} // namespace llrp::model
