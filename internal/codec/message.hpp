#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/accessspec.hpp"
#include "internal/model/capabilities.hpp"
#include "internal/model/common.hpp"
#include "internal/model/events.hpp"
#include "internal/model/reader_config.hpp"
#include "internal/model/report.hpp"
#include "internal/model/rospec.hpp"

namespace llrp::codec {

// LLRP v1.0.1 message types.
enum class MessageType : std::uint16_t {
  kGetReaderCapabilities         = 1,
  kGetReaderConfig               = 2,
  kSetReaderConfig               = 3,
  kCloseConnectionResponse       = 4,
  kGetReaderCapabilitiesResponse = 11,
  kGetReaderConfigResponse       = 12,
  kSetReaderConfigResponse       = 13,
  kCloseConnection               = 14,
  kAddRoSpec                     = 20,
  kDeleteRoSpec                  = 21,
  kStartRoSpec                   = 22,
  kStopRoSpec                    = 23,
  kEnableRoSpec                  = 24,
  kDisableRoSpec                 = 25,
  kGetRoSpecs                    = 26,
  kAddRoSpecResponse             = 30,
  kDeleteRoSpecResponse          = 31,
  kStartRoSpecResponse           = 32,
  kStopRoSpecResponse            = 33,
  kEnableRoSpecResponse          = 34,
  kDisableRoSpecResponse         = 35,
  kGetRoSpecsResponse            = 36,
  kAddAccessSpec                 = 40,
  kDeleteAccessSpec              = 41,
  kEnableAccessSpec              = 42,
  kDisableAccessSpec             = 43,
  kGetAccessSpecs                = 44,
  kAddAccessSpecResponse         = 50,
  kDeleteAccessSpecResponse      = 51,
  kEnableAccessSpecResponse      = 52,
  kDisableAccessSpecResponse     = 53,
  kGetAccessSpecsResponse        = 54,
  kGetReport                     = 60,
  kRoAccessReport                = 61,
  kKeepalive                     = 62,
  kReaderEventNotification       = 63,
  kEnableEventsAndReports        = 64,
  kKeepaliveAck                  = 72,
  kErrorMessage                  = 100,
  kCustomMessage                 = 1023,
};

constexpr std::uint8_t  kProtocolVersion     = 1;
constexpr std::size_t   kMessageHeaderSize   = 10;
constexpr std::uint16_t kMessageTypeMask     = 0x03FF;

const char* MessageTypeName(MessageType type);

bool IsKnownMessageType(std::uint16_t type);

// Response type the reader answers `request` with; nullopt for messages that
// have no response.
std::optional<MessageType> ResponseTypeFor(MessageType request);

// ------------------------------------------------------------
// Message bodies
// ------------------------------------------------------------
//
// `unknown` holds top-level parameters with no schema here. They are
// written back after the known parameters.

// GET_ROSPECS, GET_ACCESSSPECS, GET_REPORT, KEEPALIVE, KEEPALIVE_ACK,
// ENABLE_EVENTS_AND_REPORTS, CLOSE_CONNECTION.
struct EmptyBody {
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const EmptyBody&) const = default;
};

// Responses that carry only an LLRPStatus, and ERROR_MESSAGE.
struct StatusResponse {
  model::LlrpStatus                   status;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const StatusResponse&) const = default;
};

struct GetReaderCapabilities {
  model::CapabilitiesRequest          requested = model::CapabilitiesRequest::kAll;
  std::vector<model::CustomParameter> custom;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const GetReaderCapabilities&) const = default;
};

struct GetReaderCapabilitiesResponse {
  model::LlrpStatus         status;
  model::ReaderCapabilities capabilities;

  bool operator==(const GetReaderCapabilitiesResponse&) const = default;
};

struct GetReaderConfig {
  std::uint16_t                       antenna_id = 0;  // 0 = all
  model::ConfigRequest                requested  = model::ConfigRequest::kAll;
  std::uint16_t                       gpi_port   = 0;  // 0 = all
  std::uint16_t                       gpo_port   = 0;  // 0 = all
  std::vector<model::CustomParameter> custom;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const GetReaderConfig&) const = default;
};

struct GetReaderConfigResponse {
  model::LlrpStatus   status;
  model::ReaderConfig config;

  bool operator==(const GetReaderConfigResponse&) const = default;
};

struct SetReaderConfig {
  bool                reset_to_factory_default = false;
  model::ReaderConfig config;

  bool operator==(const SetReaderConfig&) const = default;
};

struct AddRoSpec {
  model::RoSpec                       rospec;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const AddRoSpec&) const = default;
};

// DELETE/START/STOP/ENABLE/DISABLE_ROSPEC. Id 0 addresses all ROSpecs.
struct RoSpecIdRequest {
  std::uint32_t rospec_id = 0;

  bool operator==(const RoSpecIdRequest&) const = default;
};

struct GetRoSpecsResponse {
  model::LlrpStatus                   status;
  std::vector<model::RoSpec>          rospecs;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const GetRoSpecsResponse&) const = default;
};

struct AddAccessSpec {
  model::AccessSpec                   accessspec;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const AddAccessSpec&) const = default;
};

// DELETE/ENABLE/DISABLE_ACCESSSPEC. Id 0 addresses all AccessSpecs.
struct AccessSpecIdRequest {
  std::uint32_t accessspec_id = 0;

  bool operator==(const AccessSpecIdRequest&) const = default;
};

struct GetAccessSpecsResponse {
  model::LlrpStatus                   status;
  std::vector<model::AccessSpec>      accessspecs;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const GetAccessSpecsResponse&) const = default;
};

struct RoAccessReport {
  std::vector<model::TagReportData>   tag_reports;
  std::vector<model::CustomParameter> custom;
  std::vector<model::OpaqueParameter> unknown;  // e.g. RFSurveyReportData

  bool operator==(const RoAccessReport&) const = default;
};

struct ReaderEventNotification {
  model::ReaderEventNotificationData  data;
  std::vector<model::OpaqueParameter> unknown;

  bool operator==(const ReaderEventNotification&) const = default;
};

struct CustomMessage {
  std::uint32_t vendor_id = 0;
  std::uint8_t  subtype   = 0;
  util::Bytes   data;

  bool operator==(const CustomMessage&) const = default;
};

// Body of a message type this engine has no schema for.
struct UnknownMessage {
  util::Bytes raw_body;

  bool operator==(const UnknownMessage&) const = default;
};

using MessageBody = std::variant<EmptyBody,
                                 StatusResponse,
                                 GetReaderCapabilities,
                                 GetReaderCapabilitiesResponse,
                                 GetReaderConfig,
                                 GetReaderConfigResponse,
                                 SetReaderConfig,
                                 AddRoSpec,
                                 RoSpecIdRequest,
                                 GetRoSpecsResponse,
                                 AddAccessSpec,
                                 AccessSpecIdRequest,
                                 GetAccessSpecsResponse,
                                 RoAccessReport,
                                 ReaderEventNotification,
                                 CustomMessage,
                                 UnknownMessage>;

/*
  Message

  `type` is kept as the raw 10-bit code so messages of unknown types keep
  their identity; `message_id` is echoed by the reader in the response.
*/
struct Message {
  MessageType   type       = MessageType::kKeepalive;
  std::uint8_t  version    = kProtocolVersion;
  std::uint32_t message_id = 0;
  MessageBody   body;

  bool operator==(const Message&) const = default;
};

Message MakeMessage(MessageType type, std::uint32_t message_id, MessageBody body = EmptyBody{});

// Status carried by a response body; nullopt for bodies without one.
std::optional<model::LlrpStatus> StatusOf(const Message& message);

// One-line summary for logs.
std::string DescribeMessage(const Message& message);

// True when `body` holds the alternative that `type` is encoded from.
bool BodyMatchesType(MessageType type, const MessageBody& body);

} // namespace llrp::codec
