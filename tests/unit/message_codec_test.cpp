#include "internal/codec/message_codec.hpp"

#include <cassert>
#include <iostream>
#include <variant>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using llrp::codec::ByteStream;
using llrp::codec::MakeMessage;
using llrp::codec::Message;
using llrp::codec::MessageCodec;
using llrp::codec::MessageType;
using llrp::util::Bytes;
using llrp::util::CodecError;
using llrp::util::CodecErrorCode;

namespace codec = llrp::codec;
namespace model = llrp::model;

CodecErrorCode DecodeError(const MessageCodec& codec, const Bytes& bytes) {
  ByteStream stream;
  stream.Append(bytes);
  try {
    (void)codec.Decode(stream);
  } catch (const CodecError& e) {
    return e.code();
  }
  assert(false && "expected CodecError");
  return CodecErrorCode::kTruncated;
}

model::TagReportData MakeTag(std::uint8_t last_byte) {
  model::TagReportData tag;
  tag.epc        = Bytes{0x30, 0x08, 0x33, 0xB2, 0xDD, 0xD9, 0x01, 0x40, 0x00, 0x00, 0x00, last_byte};
  tag.antenna_id = 1;
  tag.peak_rssi  = -61;
  return tag;
}

std::vector<Message> SampleConversation() {
  model::RoSpec rospec;
  rospec.id = 1;
  model::AiSpec ai;
  ai.antenna_ids = {0};
  ai.inventory_parameter_specs.push_back(model::InventoryParameterSpec{});
  rospec.specs.emplace_back(ai);

  codec::RoAccessReport report;
  report.tag_reports = {MakeTag(1), MakeTag(2)};

  return {
      MakeMessage(MessageType::kAddRoSpec, 10, codec::AddRoSpec{rospec}),
      MakeMessage(MessageType::kRoAccessReport, 0, report),
      MakeMessage(MessageType::kKeepalive, 99),
      MakeMessage(MessageType::kEnableRoSpecResponse, 11, codec::StatusResponse{}),
  };
}

void TestHeaderLayout() {
  MessageCodec codec;
  const auto   bytes = codec.Encode(MakeMessage(MessageType::kKeepalive, 0x12345678));

  const Bytes expected{0x04, 0x3E, 0x00, 0x00, 0x00, 0x0A, 0x12, 0x34, 0x56, 0x78};
  assert(bytes == expected);
}

void TestReassemblyAtEveryOffset() {
  MessageCodec codec;
  const auto   messages = SampleConversation();

  Bytes wire;
  for (const auto& message : messages) {
    const auto frame = codec.Encode(message);
    wire.insert(wire.end(), frame.begin(), frame.end());
  }

  for (std::size_t split = 0; split <= wire.size(); ++split) {
    ByteStream           stream;
    std::vector<Message> decoded;

    stream.Append(wire.data(), split);
    while (auto message = codec.Decode(stream)) {
      decoded.push_back(std::move(*message));
    }
    stream.Append(wire.data() + split, wire.size() - split);
    while (auto message = codec.Decode(stream)) {
      decoded.push_back(std::move(*message));
    }

    assert(decoded == messages);
    assert(stream.Buffered() == 0);
  }
}

void TestPartialFrameConsumesNothing() {
  MessageCodec codec;
  const auto   frame = codec.Encode(MakeMessage(MessageType::kGetRoSpecs, 3));

  ByteStream stream;
  stream.Append(frame.data(), frame.size() - 1);
  assert(!codec.Decode(stream));
  assert(stream.Buffered() == frame.size() - 1);
}

void TestUnknownMessageTypeKeepsBody() {
  const Bytes frame{0x05, 0xF4, 0x00, 0x00, 0x00, 0x0D, 0x00, 0x00, 0x00, 0x07, 0x01, 0x02, 0x03};

  MessageCodec codec;
  const auto   message = codec.DecodeFrame(frame.data(), frame.size());
  assert(static_cast<std::uint16_t>(message.type) == 500);
  assert(message.message_id == 7);

  const auto* body = std::get_if<codec::UnknownMessage>(&message.body);
  assert(body != nullptr);
  assert((body->raw_body == Bytes{0x01, 0x02, 0x03}));
  assert(codec.Encode(message) == frame);
}

void TestMalformedFrames() {
  MessageCodec codec;

  const Bytes short_length{0x04, 0x3E, 0x00, 0x00, 0x00, 0x06, 0x00, 0x00, 0x00, 0x01};
  assert(DecodeError(codec, short_length) == CodecErrorCode::kBadLength);

  MessageCodec small(64);
  const Bytes  oversized{0x04, 0x3D, 0x00, 0x00, 0x03, 0xE8, 0x00, 0x00, 0x00, 0x01};
  assert(DecodeError(small, oversized) == CodecErrorCode::kFrameTooLarge);

  // KEEPALIVE has no body; a stray byte inside the frame is rejected.
  const Bytes trailing{0x04, 0x3E, 0x00, 0x00, 0x00, 0x0B, 0x00, 0x00, 0x00, 0x01, 0xFF};
  assert(DecodeError(codec, trailing) != CodecErrorCode::kFrameTooLarge);
}

void TestBodyMustMatchType() {
  MessageCodec codec;

  bool threw = false;
  try {
    (void)codec.Encode(MakeMessage(MessageType::kAddRoSpec, 1));
  } catch (const CodecError& e) {
    threw = e.code() == CodecErrorCode::kSchemaMismatch;
  }
  assert(threw);
}

void TestResponseTypes() {
  assert(codec::ResponseTypeFor(MessageType::kCloseConnection) == MessageType::kCloseConnectionResponse);
  assert(static_cast<std::uint16_t>(MessageType::kCloseConnection) == 14);
  assert(static_cast<std::uint16_t>(MessageType::kCloseConnectionResponse) == 4);
  assert(codec::ResponseTypeFor(MessageType::kStartRoSpec) == MessageType::kStartRoSpecResponse);
  assert(codec::ResponseTypeFor(MessageType::kCustomMessage) == MessageType::kCustomMessage);
  assert(!codec::ResponseTypeFor(MessageType::kKeepaliveAck));
  assert(!codec::ResponseTypeFor(MessageType::kGetReport));
}

void TestErrorMessageCarriesStatus() {
  model::LlrpStatus status;
  status.code              = static_cast<std::uint16_t>(model::StatusCode::kMsgUnsupportedMessage);
  status.error_description = "unsupported";

  MessageCodec codec;
  const auto   frame = codec.Encode(MakeMessage(MessageType::kErrorMessage, 5, codec::StatusResponse{status}));
  const auto   back  = codec.DecodeFrame(frame.data(), frame.size());

  const auto decoded = codec::StatusOf(back);
  assert(decoded && decoded->code == 109);
  assert(decoded->error_description == "unsupported");
  assert(!decoded->ok());
}

void TestStatusResponseKeepsUnknownParameter() {
  // ADD_ROSPEC_RESPONSE: LLRPStatus(Success) followed by a TLV of type 900.
  const Bytes frame{0x04, 0x1E, 0x00, 0x00, 0x00, 0x18, 0x00, 0x00, 0x00, 0x01,
                    0x01, 0x1F, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00,
                    0x03, 0x84, 0x00, 0x06, 0xAB, 0xCD};

  MessageCodec codec;
  const auto   message = codec.DecodeFrame(frame.data(), frame.size());
  assert(message.type == MessageType::kAddRoSpecResponse);

  const auto& body = std::get<codec::StatusResponse>(message.body);
  assert(body.status.ok());
  assert(body.unknown.size() == 1);
  assert(body.unknown[0].type == 900);
  assert((body.unknown[0].body == Bytes{0xAB, 0xCD}));
  assert(codec.Encode(message) == frame);
}

void TestCapabilitiesResponseKeepsUnknownChild() {
  model::GeneralDeviceCapabilities general;
  general.max_antennas     = 4;
  general.manufacturer     = 25882;
  general.firmware_version = "5.14.0";
  general.unknown.push_back(model::OpaqueParameter{900, {0xAB, 0xCD}});

  codec::GetReaderCapabilitiesResponse response;
  response.capabilities.general = general;

  MessageCodec codec;
  const auto   frame = codec.Encode(MakeMessage(MessageType::kGetReaderCapabilitiesResponse, 4, response));
  const auto   back  = codec.DecodeFrame(frame.data(), frame.size());

  const auto& decoded = std::get<codec::GetReaderCapabilitiesResponse>(back.body);
  assert(decoded.capabilities.general);
  assert(decoded.capabilities.general->unknown == general.unknown);
  assert(decoded.capabilities.unknown.empty());
  assert(codec.Encode(back) == frame);
}

} // namespace

int main() {
  TestHeaderLayout();
  TestReassemblyAtEveryOffset();
  TestPartialFrameConsumesNothing();
  TestUnknownMessageTypeKeepsBody();
  TestMalformedFrames();
  TestBodyMustMatchType();
  TestResponseTypes();
  TestErrorMessageCarriesStatus();
  TestStatusResponseKeepsUnknownParameter();
  TestCapabilitiesResponseKeepsUnknownChild();

  std::cout << "llrp_engine_unit_message_codec: pass\n";
  return 0;
}
