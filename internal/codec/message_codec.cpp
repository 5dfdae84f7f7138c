#include "message_codec.hpp"

#include <algorithm>
#include <type_traits>

#include "internal/codec/byte_buffer.hpp"
#include "internal/codec/parameters.hpp"
#include "internal/util/errors.hpp"

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

// ------------------------------------------------------------
// ByteStream
// ------------------------------------------------------------

void ByteStream::Append(const std::uint8_t* data, std::size_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

void ByteStream::Append(const util::Bytes& bytes) {
  Append(bytes.data(), bytes.size());
}

void ByteStream::Consume(std::size_t n) {
  offset_ += std::min(n, Buffered());
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  } else if (offset_ > buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
  }
}

void ByteStream::Clear() {
  buffer_.clear();
  offset_ = 0;
}

namespace {

// ------------------------------------------------------------
// Body encoders
// ------------------------------------------------------------

void EncodeConfig(ByteWriter& w, const model::ReaderConfig& c, bool for_set) {
  if (!for_set) {
    if (c.identification) Encode(w, *c.identification);
    for (const auto& p : c.antenna_properties) Encode(w, p);
    for (const auto& a : c.antenna_configurations) Encode(w, a);
    if (c.event_notification_spec) Encode(w, *c.event_notification_spec);
    if (c.ro_report_spec) Encode(w, *c.ro_report_spec);
    if (c.access_report_spec) Encode(w, *c.access_report_spec);
    if (c.configuration_state) EncodeConfigurationStateValue(w, *c.configuration_state);
    if (c.keepalive_spec) Encode(w, *c.keepalive_spec);
    for (const auto& g : c.gpi_port_states) Encode(w, g);
    for (const auto& g : c.gpo_write_data) Encode(w, g);
    if (c.events_and_reports) Encode(w, *c.events_and_reports);
  } else {
    if (c.identification || c.configuration_state) {
      throw CodecError(CodecErrorCode::kSchemaMismatch,
                       "SET_READER_CONFIG cannot carry Identification or LLRPConfigurationStateValue");
    }
    if (c.event_notification_spec) Encode(w, *c.event_notification_spec);
    for (const auto& p : c.antenna_properties) Encode(w, p);
    for (const auto& a : c.antenna_configurations) Encode(w, a);
    if (c.ro_report_spec) Encode(w, *c.ro_report_spec);
    if (c.access_report_spec) Encode(w, *c.access_report_spec);
    if (c.keepalive_spec) Encode(w, *c.keepalive_spec);
    for (const auto& g : c.gpo_write_data) Encode(w, g);
    for (const auto& g : c.gpi_port_states) Encode(w, g);
    if (c.events_and_reports) Encode(w, *c.events_and_reports);
  }
  EncodeExtensions(w, c.custom, c.unknown);
}

void EncodeBody(ByteWriter& w, const MessageBody& body) {
  std::visit(
      [&w](const auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, EmptyBody>) {
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, StatusResponse>) {
          Encode(w, b.status);
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, GetReaderCapabilities>) {
          w.U8(static_cast<std::uint8_t>(b.requested));
          EncodeExtensions(w, b.custom, b.unknown);
        } else if constexpr (std::is_same_v<T, GetReaderCapabilitiesResponse>) {
          Encode(w, b.status);
          const auto& caps = b.capabilities;
          if (caps.general) Encode(w, *caps.general);
          if (caps.llrp) Encode(w, *caps.llrp);
          if (caps.regulatory) Encode(w, *caps.regulatory);
          if (caps.air_protocol) Encode(w, *caps.air_protocol);
          EncodeExtensions(w, caps.custom, caps.unknown);
        } else if constexpr (std::is_same_v<T, GetReaderConfig>) {
          w.U16(b.antenna_id);
          w.U8(static_cast<std::uint8_t>(b.requested));
          w.U16(b.gpi_port);
          w.U16(b.gpo_port);
          EncodeExtensions(w, b.custom, b.unknown);
        } else if constexpr (std::is_same_v<T, GetReaderConfigResponse>) {
          Encode(w, b.status);
          EncodeConfig(w, b.config, false);
        } else if constexpr (std::is_same_v<T, SetReaderConfig>) {
          w.U8(b.reset_to_factory_default ? 0x80 : 0x00);
          EncodeConfig(w, b.config, true);
        } else if constexpr (std::is_same_v<T, AddRoSpec>) {
          Encode(w, b.rospec);
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, RoSpecIdRequest>) {
          w.U32(b.rospec_id);
        } else if constexpr (std::is_same_v<T, GetRoSpecsResponse>) {
          Encode(w, b.status);
          for (const auto& spec : b.rospecs) Encode(w, spec);
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, AddAccessSpec>) {
          Encode(w, b.accessspec);
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, AccessSpecIdRequest>) {
          w.U32(b.accessspec_id);
        } else if constexpr (std::is_same_v<T, GetAccessSpecsResponse>) {
          Encode(w, b.status);
          for (const auto& spec : b.accessspecs) Encode(w, spec);
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, RoAccessReport>) {
          for (const auto& tag : b.tag_reports) Encode(w, tag);
          EncodeExtensions(w, b.custom, b.unknown);
        } else if constexpr (std::is_same_v<T, ReaderEventNotification>) {
          Encode(w, b.data);
          EncodeExtensions(w, {}, b.unknown);
        } else if constexpr (std::is_same_v<T, CustomMessage>) {
          w.U32(b.vendor_id);
          w.U8(b.subtype);
          w.Raw(b.data);
        } else {
          static_assert(std::is_same_v<T, UnknownMessage>);
          w.Raw(b.raw_body);
        }
      },
      body);
}

// ------------------------------------------------------------
// Body decoders
// ------------------------------------------------------------

model::LlrpStatus ExpectStatus(ParameterCursor& cursor) {
  return DecodeLlrpStatus(cursor.Expect(ParameterType::kLlrpStatus));
}

// `cursor` may already point its unknown sink at config->unknown.
void DecodeConfig(ParameterCursor& cursor, model::ReaderConfig* out) {
  auto& config = *out;
  // Children are matched by type so GET and SET orderings both decode.
  while (const auto next = cursor.PeekType()) {
    switch (static_cast<ParameterType>(*next)) {
      case ParameterType::kIdentification: config.identification = DecodeIdentification(cursor.Next()); break;
      case ParameterType::kAntennaProperties:
        config.antenna_properties.push_back(DecodeAntennaProperties(cursor.Next()));
        break;
      case ParameterType::kAntennaConfiguration:
        config.antenna_configurations.push_back(DecodeAntennaConfiguration(cursor.Next()));
        break;
      case ParameterType::kReaderEventNotificationSpec:
        config.event_notification_spec = DecodeReaderEventNotificationSpec(cursor.Next());
        break;
      case ParameterType::kRoReportSpec: config.ro_report_spec = DecodeRoReportSpec(cursor.Next()); break;
      case ParameterType::kAccessReportSpec:
        config.access_report_spec = DecodeAccessReportSpec(cursor.Next());
        break;
      case ParameterType::kLlrpConfigurationStateValue:
        config.configuration_state = DecodeConfigurationStateValue(cursor.Next());
        break;
      case ParameterType::kKeepaliveSpec: config.keepalive_spec = DecodeKeepaliveSpec(cursor.Next()); break;
      case ParameterType::kGpiPortCurrentState:
        config.gpi_port_states.push_back(DecodeGpiPortCurrentState(cursor.Next()));
        break;
      case ParameterType::kGpoWriteData: config.gpo_write_data.push_back(DecodeGpoWriteData(cursor.Next())); break;
      case ParameterType::kEventsAndReports:
        config.events_and_reports = DecodeEventsAndReports(cursor.Next());
        break;
      case ParameterType::kCustom: config.custom.push_back(DecodeCustom(cursor.Next())); break;
      default: cursor.ExpectEnd(); break;
    }
  }
}

MessageBody DecodeBody(MessageType type, ByteReader& body) {
  switch (type) {
    case MessageType::kGetRoSpecs:
    case MessageType::kGetAccessSpecs:
    case MessageType::kGetReport:
    case MessageType::kKeepalive:
    case MessageType::kKeepaliveAck:
    case MessageType::kEnableEventsAndReports:
    case MessageType::kCloseConnection: {
      EmptyBody       out;
      ParameterCursor cursor(body, &out.unknown, MessageTypeName(type));
      cursor.ExpectEnd();
      return out;
    }

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
    case MessageType::kErrorMessage: {
      StatusResponse  out;
      ParameterCursor cursor(body, &out.unknown, MessageTypeName(type));
      out.status = ExpectStatus(cursor);
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kGetReaderCapabilities: {
      GetReaderCapabilities out;
      const auto            requested = body.U8();
      if (requested > 4) {
        throw CodecError(CodecErrorCode::kFieldOutOfRange, "RequestedData " + std::to_string(requested));
      }
      out.requested = static_cast<model::CapabilitiesRequest>(requested);
      ParameterCursor cursor(body, &out.unknown, "GET_READER_CAPABILITIES");
      cursor.TakeCustom(&out.custom);
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kGetReaderCapabilitiesResponse: {
      GetReaderCapabilitiesResponse out;
      auto&                         caps = out.capabilities;
      ParameterCursor               cursor(body, &caps.unknown, "GET_READER_CAPABILITIES_RESPONSE");
      out.status = ExpectStatus(cursor);
      if (auto p = cursor.TakeIf(ParameterType::kGeneralDeviceCapabilities)) {
        caps.general = DecodeGeneralDeviceCapabilities(*p);
      }
      if (auto p = cursor.TakeIf(ParameterType::kLlrpCapabilities)) {
        caps.llrp = DecodeLlrpCapabilities(*p);
      }
      if (auto p = cursor.TakeIf(ParameterType::kRegulatoryCapabilities)) {
        caps.regulatory = DecodeRegulatoryCapabilities(*p);
      }
      if (auto p = cursor.TakeIf(ParameterType::kC1G2LlrpCapabilities)) {
        caps.air_protocol = DecodeC1G2LlrpCapabilities(*p);
      }
      cursor.TakeCustom(&caps.custom);
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kGetReaderConfig: {
      GetReaderConfig out;
      out.antenna_id       = body.U16();
      const auto requested = body.U8();
      if (requested > 11) {
        throw CodecError(CodecErrorCode::kFieldOutOfRange, "RequestedData " + std::to_string(requested));
      }
      out.requested = static_cast<model::ConfigRequest>(requested);
      out.gpi_port  = body.U16();
      out.gpo_port  = body.U16();
      ParameterCursor cursor(body, &out.unknown, "GET_READER_CONFIG");
      cursor.TakeCustom(&out.custom);
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kGetReaderConfigResponse: {
      GetReaderConfigResponse out;
      ParameterCursor         cursor(body, &out.config.unknown, "GET_READER_CONFIG_RESPONSE");
      out.status = ExpectStatus(cursor);
      DecodeConfig(cursor, &out.config);
      return out;
    }

    case MessageType::kSetReaderConfig: {
      SetReaderConfig out;
      out.reset_to_factory_default = (body.U8() & 0x80) != 0;
      ParameterCursor cursor(body, &out.config.unknown, "SET_READER_CONFIG");
      DecodeConfig(cursor, &out.config);
      return out;
    }

    case MessageType::kAddRoSpec: {
      AddRoSpec       out;
      ParameterCursor cursor(body, &out.unknown, "ADD_ROSPEC");
      out.rospec = DecodeRoSpec(cursor.Expect(ParameterType::kRoSpec));
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kDeleteRoSpec:
    case MessageType::kStartRoSpec:
    case MessageType::kStopRoSpec:
    case MessageType::kEnableRoSpec:
    case MessageType::kDisableRoSpec: return RoSpecIdRequest{body.U32()};

    case MessageType::kGetRoSpecsResponse: {
      GetRoSpecsResponse out;
      ParameterCursor    cursor(body, &out.unknown, "GET_ROSPECS_RESPONSE");
      out.status = ExpectStatus(cursor);
      while (auto p = cursor.TakeIf(ParameterType::kRoSpec)) {
        out.rospecs.push_back(DecodeRoSpec(*p));
      }
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kAddAccessSpec: {
      AddAccessSpec   out;
      ParameterCursor cursor(body, &out.unknown, "ADD_ACCESSSPEC");
      out.accessspec = DecodeAccessSpec(cursor.Expect(ParameterType::kAccessSpec));
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kDeleteAccessSpec:
    case MessageType::kEnableAccessSpec:
    case MessageType::kDisableAccessSpec: return AccessSpecIdRequest{body.U32()};

    case MessageType::kGetAccessSpecsResponse: {
      GetAccessSpecsResponse out;
      ParameterCursor        cursor(body, &out.unknown, "GET_ACCESSSPECS_RESPONSE");
      out.status = ExpectStatus(cursor);
      while (auto p = cursor.TakeIf(ParameterType::kAccessSpec)) {
        out.accessspecs.push_back(DecodeAccessSpec(*p));
      }
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kRoAccessReport: {
      RoAccessReport  out;
      ParameterCursor cursor(body, &out.unknown, "RO_ACCESS_REPORT");
      while (auto p = cursor.TakeIf(ParameterType::kTagReportData)) {
        out.tag_reports.push_back(DecodeTagReportData(*p));
      }
      cursor.TakeCustom(&out.custom);
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kReaderEventNotification: {
      ReaderEventNotification out;
      ParameterCursor         cursor(body, &out.unknown, "READER_EVENT_NOTIFICATION");
      out.data = DecodeReaderEventNotificationData(cursor.Expect(ParameterType::kReaderEventNotificationData));
      cursor.ExpectEnd();
      return out;
    }

    case MessageType::kCustomMessage: {
      CustomMessage out;
      out.vendor_id = body.U32();
      out.subtype   = body.U8();
      out.data      = body.Raw(body.remaining());
      return out;
    }
  }

  return UnknownMessage{body.Raw(body.remaining())};
}

} // namespace

// ------------------------------------------------------------
// MessageCodec
// ------------------------------------------------------------

MessageCodec::MessageCodec(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {
}

util::Bytes MessageCodec::Encode(const Message& message) const {
  const auto type = static_cast<std::uint16_t>(message.type);
  if (type > kMessageTypeMask) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "message type " + std::to_string(type));
  }
  CheckWidth(message.version, 3, "message version");
  if (!BodyMatchesType(message.type, message.body)) {
    throw CodecError(CodecErrorCode::kSchemaMismatch,
                     std::string("body does not belong to ") + MessageTypeName(message.type));
  }

  ByteWriter w;
  w.U16(static_cast<std::uint16_t>((message.version << 10) | type));
  w.U32(0);
  w.U32(message.message_id);
  EncodeBody(w, message.body);

  if (w.size() > max_frame_bytes_ || w.size() > 0xFFFFFFFFu) {
    throw CodecError(CodecErrorCode::kFrameTooLarge, std::to_string(w.size()) + " byte frame");
  }
  w.PatchU32(2, static_cast<std::uint32_t>(w.size()));
  return w.Take();
}

std::optional<Message> MessageCodec::Decode(ByteStream& stream) const {
  if (stream.Buffered() < kMessageHeaderSize) {
    return std::nullopt;
  }

  ByteReader header(stream.data(), kMessageHeaderSize);
  header.U16();
  const std::uint32_t length = header.U32();
  if (length < kMessageHeaderSize) {
    throw CodecError(CodecErrorCode::kBadLength, "frame declares length " + std::to_string(length));
  }
  if (length > max_frame_bytes_) {
    throw CodecError(CodecErrorCode::kFrameTooLarge,
                     "frame declares " + std::to_string(length) + " bytes, limit " +
                         std::to_string(max_frame_bytes_));
  }
  if (stream.Buffered() < length) {
    return std::nullopt;
  }

  auto message = DecodeFrame(stream.data(), length);
  stream.Consume(length);
  return message;
}

Message MessageCodec::DecodeFrame(const std::uint8_t* frame, std::size_t size) const {
  ByteReader header(frame, size);
  const auto first  = header.U16();
  const auto length = header.U32();
  if (length != size) {
    throw CodecError(CodecErrorCode::kBadLength,
                     "frame declares " + std::to_string(length) + " bytes, got " + std::to_string(size));
  }

  Message message;
  message.version    = static_cast<std::uint8_t>((first >> 10) & 0x07);
  message.type       = static_cast<MessageType>(first & kMessageTypeMask);
  message.message_id = header.U32();

  ByteReader body(frame + kMessageHeaderSize, size - kMessageHeaderSize);
  message.body = DecodeBody(message.type, body);
  if (!body.AtEnd()) {
    throw CodecError(CodecErrorCode::kBadLength,
                     std::string(MessageTypeName(message.type)) + " has " + std::to_string(body.remaining()) +
                         " bytes beyond its body");
  }
  return message;
}

} // namespace llrp::codec
