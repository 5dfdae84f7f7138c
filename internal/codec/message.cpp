#include "message.hpp"

#include <sstream>
#include <string_view>
#include <type_traits>

namespace llrp::codec {

const char* MessageTypeName(MessageType type) {
  switch (type) {
    case MessageType::kGetReaderCapabilities: return "GET_READER_CAPABILITIES";
    case MessageType::kGetReaderConfig: return "GET_READER_CONFIG";
    case MessageType::kSetReaderConfig: return "SET_READER_CONFIG";
    case MessageType::kCloseConnectionResponse: return "CLOSE_CONNECTION_RESPONSE";
    case MessageType::kGetReaderCapabilitiesResponse: return "GET_READER_CAPABILITIES_RESPONSE";
    case MessageType::kGetReaderConfigResponse: return "GET_READER_CONFIG_RESPONSE";
    case MessageType::kSetReaderConfigResponse: return "SET_READER_CONFIG_RESPONSE";
    case MessageType::kCloseConnection: return "CLOSE_CONNECTION";
    case MessageType::kAddRoSpec: return "ADD_ROSPEC";
    case MessageType::kDeleteRoSpec: return "DELETE_ROSPEC";
    case MessageType::kStartRoSpec: return "START_ROSPEC";
    case MessageType::kStopRoSpec: return "STOP_ROSPEC";
    case MessageType::kEnableRoSpec: return "ENABLE_ROSPEC";
    case MessageType::kDisableRoSpec: return "DISABLE_ROSPEC";
    case MessageType::kGetRoSpecs: return "GET_ROSPECS";
    case MessageType::kAddRoSpecResponse: return "ADD_ROSPEC_RESPONSE";
    case MessageType::kDeleteRoSpecResponse: return "DELETE_ROSPEC_RESPONSE";
    case MessageType::kStartRoSpecResponse: return "START_ROSPEC_RESPONSE";
    case MessageType::kStopRoSpecResponse: return "STOP_ROSPEC_RESPONSE";
    case MessageType::kEnableRoSpecResponse: return "ENABLE_ROSPEC_RESPONSE";
    case MessageType::kDisableRoSpecResponse: return "DISABLE_ROSPEC_RESPONSE";
    case MessageType::kGetRoSpecsResponse: return "GET_ROSPECS_RESPONSE";
    case MessageType::kAddAccessSpec: return "ADD_ACCESSSPEC";
    case MessageType::kDeleteAccessSpec: return "DELETE_ACCESSSPEC";
    case MessageType::kEnableAccessSpec: return "ENABLE_ACCESSSPEC";
    case MessageType::kDisableAccessSpec: return "DISABLE_ACCESSSPEC";
    case MessageType::kGetAccessSpecs: return "GET_ACCESSSPECS";
    case MessageType::kAddAccessSpecResponse: return "ADD_ACCESSSPEC_RESPONSE";
    case MessageType::kDeleteAccessSpecResponse: return "DELETE_ACCESSSPEC_RESPONSE";
    case MessageType::kEnableAccessSpecResponse: return "ENABLE_ACCESSSPEC_RESPONSE";
    case MessageType::kDisableAccessSpecResponse: return "DISABLE_ACCESSSPEC_RESPONSE";
    case MessageType::kGetAccessSpecsResponse: return "GET_ACCESSSPECS_RESPONSE";
    case MessageType::kGetReport: return "GET_REPORT";
    case MessageType::kRoAccessReport: return "RO_ACCESS_REPORT";
    case MessageType::kKeepalive: return "KEEPALIVE";
    case MessageType::kReaderEventNotification: return "READER_EVENT_NOTIFICATION";
    case MessageType::kEnableEventsAndReports: return "ENABLE_EVENTS_AND_REPORTS";
    case MessageType::kKeepaliveAck: return "KEEPALIVE_ACK";
    case MessageType::kErrorMessage: return "ERROR_MESSAGE";
    case MessageType::kCustomMessage: return "CUSTOM_MESSAGE";
  }
  return "UNKNOWN";
}

bool IsKnownMessageType(std::uint16_t type) {
  return std::string_view(MessageTypeName(static_cast<MessageType>(type))) != "UNKNOWN";
}

std::optional<MessageType> ResponseTypeFor(MessageType request) {
  switch (request) {
    case MessageType::kGetReaderCapabilities: return MessageType::kGetReaderCapabilitiesResponse;
    case MessageType::kGetReaderConfig: return MessageType::kGetReaderConfigResponse;
    case MessageType::kSetReaderConfig: return MessageType::kSetReaderConfigResponse;
    case MessageType::kCloseConnection: return MessageType::kCloseConnectionResponse;
    case MessageType::kAddRoSpec: return MessageType::kAddRoSpecResponse;
    case MessageType::kDeleteRoSpec: return MessageType::kDeleteRoSpecResponse;
    case MessageType::kStartRoSpec: return MessageType::kStartRoSpecResponse;
    case MessageType::kStopRoSpec: return MessageType::kStopRoSpecResponse;
    case MessageType::kEnableRoSpec: return MessageType::kEnableRoSpecResponse;
    case MessageType::kDisableRoSpec: return MessageType::kDisableRoSpecResponse;
    case MessageType::kGetRoSpecs: return MessageType::kGetRoSpecsResponse;
    case MessageType::kAddAccessSpec: return MessageType::kAddAccessSpecResponse;
    case MessageType::kDeleteAccessSpec: return MessageType::kDeleteAccessSpecResponse;
    case MessageType::kEnableAccessSpec: return MessageType::kEnableAccessSpecResponse;
    case MessageType::kDisableAccessSpec: return MessageType::kDisableAccessSpecResponse;
    case MessageType::kGetAccessSpecs: return MessageType::kGetAccessSpecsResponse;
    // The reader answers a vendor message with a vendor message.
    case MessageType::kCustomMessage: return MessageType::kCustomMessage;
    default: return std::nullopt;
  }
}

Message MakeMessage(MessageType type, std::uint32_t message_id, MessageBody body) {
  Message message;
  message.type       = type;
  message.message_id = message_id;
  message.body       = std::move(body);
  return message;
}

std::optional<model::LlrpStatus> StatusOf(const Message& message) {
  return std::visit(
      [](const auto& body) -> std::optional<model::LlrpStatus> {
        if constexpr (requires { body.status; }) {
          return body.status;
        } else {
          return std::nullopt;
        }
      },
      message.body);
}

bool BodyMatchesType(MessageType type, const MessageBody& body) {
  switch (type) {
    case MessageType::kGetRoSpecs:
    case MessageType::kGetAccessSpecs:
    case MessageType::kGetReport:
    case MessageType::kKeepalive:
    case MessageType::kKeepaliveAck:
    case MessageType::kEnableEventsAndReports:
    case MessageType::kCloseConnection: return std::holds_alternative<EmptyBody>(body);

    case MessageType::kCloseConnectionResponse:
    case MessageType::kSetReaderConfigResponse:
    case MessageType::kAddRoSpecResponse:
    case MessageType::kDeleteRoSpecResponse:
    case MessageType::kStartRoSpecResponse:
    case MessageType::kStopRoSpecResponse:
    case MessageType::kEnableRoSpecResponse:
    case MessageType::kDisableRoSpecResponse:
    case MessageType::kAddAccessSpecResponse:
    case MessageType::kDeleteAccessSpecResponse:
    case MessageType::kEnableAccessSpecResponse:
    case MessageType::kDisableAccessSpecResponse:
    case MessageType::kErrorMessage: return std::holds_alternative<StatusResponse>(body);

    case MessageType::kGetReaderCapabilities: return std::holds_alternative<GetReaderCapabilities>(body);
    case MessageType::kGetReaderCapabilitiesResponse:
      return std::holds_alternative<GetReaderCapabilitiesResponse>(body);
    case MessageType::kGetReaderConfig: return std::holds_alternative<GetReaderConfig>(body);
    case MessageType::kGetReaderConfigResponse: return std::holds_alternative<GetReaderConfigResponse>(body);
    case MessageType::kSetReaderConfig: return std::holds_alternative<SetReaderConfig>(body);
    case MessageType::kAddRoSpec: return std::holds_alternative<AddRoSpec>(body);

    case MessageType::kDeleteRoSpec:
    case MessageType::kStartRoSpec:
    case MessageType::kStopRoSpec:
    case MessageType::kEnableRoSpec:
    case MessageType::kDisableRoSpec: return std::holds_alternative<RoSpecIdRequest>(body);

    case MessageType::kGetRoSpecsResponse: return std::holds_alternative<GetRoSpecsResponse>(body);
    case MessageType::kAddAccessSpec: return std::holds_alternative<AddAccessSpec>(body);

    case MessageType::kDeleteAccessSpec:
    case MessageType::kEnableAccessSpec:
    case MessageType::kDisableAccessSpec: return std::holds_alternative<AccessSpecIdRequest>(body);

    case MessageType::kGetAccessSpecsResponse: return std::holds_alternative<GetAccessSpecsResponse>(body);
    case MessageType::kRoAccessReport: return std::holds_alternative<RoAccessReport>(body);
    case MessageType::kReaderEventNotification: return std::holds_alternative<ReaderEventNotification>(body);
    case MessageType::kCustomMessage: return std::holds_alternative<CustomMessage>(body);
  }
  return std::holds_alternative<UnknownMessage>(body);
}

std::string DescribeMessage(const Message& message) {
  std::ostringstream out;
  out << MessageTypeName(message.type) << "(" << static_cast<std::uint16_t>(message.type) << ")"
      << " id=" << message.message_id;

  std::visit(
      [&out](const auto& body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (requires { body.status; }) {
          out << " status=" << model::StatusCodeName(body.status.code);
          if (!body.status.error_description.empty()) {
            out << " \"" << body.status.error_description << "\"";
          }
        }
        if constexpr (std::is_same_v<T, AddRoSpec>) {
          out << " rospec=" << body.rospec.id;
        } else if constexpr (std::is_same_v<T, RoSpecIdRequest>) {
          out << " rospec=" << body.rospec_id;
        } else if constexpr (std::is_same_v<T, AddAccessSpec>) {
          out << " accessspec=" << body.accessspec.id;
        } else if constexpr (std::is_same_v<T, AccessSpecIdRequest>) {
          out << " accessspec=" << body.accessspec_id;
        } else if constexpr (std::is_same_v<T, GetRoSpecsResponse>) {
          out << " rospecs=" << body.rospecs.size();
        } else if constexpr (std::is_same_v<T, GetAccessSpecsResponse>) {
          out << " accessspecs=" << body.accessspecs.size();
        } else if constexpr (std::is_same_v<T, RoAccessReport>) {
          out << " tags=" << body.tag_reports.size();
        } else if constexpr (std::is_same_v<T, CustomMessage>) {
          out << " vendor=" << body.vendor_id << " subtype=" << static_cast<int>(body.subtype);
        } else if constexpr (std::is_same_v<T, UnknownMessage>) {
          out << " body_bytes=" << body.raw_body.size();
        }
      },
      message.body);
  return out.str();
}

} // namespace llrp::codec
