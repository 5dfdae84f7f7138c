#include "parameters.hpp"

namespace llrp::codec {

void Encode(ByteWriter& w, const model::Identification& v) {
  WriteTlv(w, ParameterType::kIdentification, [&] {
    w.U8(v.id_type);
    w.U8v(v.reader_id);
  });
}

model::Identification DecodeIdentification(const ParameterView& view) {
  RequireType(view, ParameterType::kIdentification);
  auto                  body = view.Body();
  model::Identification out;
  out.id_type   = body.U8();
  out.reader_id = body.U8v();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::ReaderEventNotificationSpec& v) {
  WriteTlv(w, ParameterType::kReaderEventNotificationSpec, [&] {
    for (const auto& state : v.states) {
      WriteTlv(w, ParameterType::kEventNotificationState, [&] {
        w.U16(state.event_type);
        w.U8(state.enabled ? 0x80 : 0x00);
      });
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::ReaderEventNotificationSpec DecodeReaderEventNotificationSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kReaderEventNotificationSpec);
  auto                               body = view.Body();
  model::ReaderEventNotificationSpec out;

  ParameterCursor cursor(body, &out.unknown, "ReaderEventNotificationSpec");
  while (auto p = cursor.TakeIf(ParameterType::kEventNotificationState)) {
    auto                          state_body = p->Body();
    model::EventNotificationState state;
    state.event_type = state_body.U16();
    state.enabled    = (state_body.U8() & 0x80) != 0;
    ExpectConsumed(state_body, *p);
    out.states.push_back(state);
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::KeepaliveSpec& v) {
  WriteTlv(w, ParameterType::kKeepaliveSpec, [&] {
    w.U8(static_cast<std::uint8_t>(v.trigger));
    w.U32(v.period_ms);
  });
}

model::KeepaliveSpec DecodeKeepaliveSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kKeepaliveSpec);
  auto                 body = view.Body();
  model::KeepaliveSpec out;
  const auto           trigger = body.U8();
  if (trigger > 1) {
    throw util::CodecError(util::CodecErrorCode::kFieldOutOfRange,
                           "KeepaliveTriggerType " + std::to_string(trigger));
  }
  out.trigger   = static_cast<model::KeepaliveTriggerType>(trigger);
  out.period_ms = body.U32();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::GpiPortCurrentState& v) {
  WriteTlv(w, ParameterType::kGpiPortCurrentState, [&] {
    w.U16(v.port);
    w.U8(v.enabled ? 0x80 : 0x00);
    w.U8(v.state);
  });
}

model::GpiPortCurrentState DecodeGpiPortCurrentState(const ParameterView& view) {
  RequireType(view, ParameterType::kGpiPortCurrentState);
  auto                       body = view.Body();
  model::GpiPortCurrentState out;
  out.port    = body.U16();
  out.enabled = (body.U8() & 0x80) != 0;
  out.state   = body.U8();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::GpoWriteData& v) {
  WriteTlv(w, ParameterType::kGpoWriteData, [&] {
    w.U16(v.port);
    w.U8(v.data ? 0x80 : 0x00);
  });
}

model::GpoWriteData DecodeGpoWriteData(const ParameterView& view) {
  RequireType(view, ParameterType::kGpoWriteData);
  auto                body = view.Body();
  model::GpoWriteData out;
  out.port = body.U16();
  out.data = (body.U8() & 0x80) != 0;
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::EventsAndReports& v) {
  WriteTlv(w, ParameterType::kEventsAndReports,
           [&] { w.U8(v.hold_events_and_reports_upon_reconnect ? 0x80 : 0x00); });
}

model::EventsAndReports DecodeEventsAndReports(const ParameterView& view) {
  RequireType(view, ParameterType::kEventsAndReports);
  auto                    body = view.Body();
  model::EventsAndReports out;
  out.hold_events_and_reports_upon_reconnect = (body.U8() & 0x80) != 0;
  ExpectConsumed(body, view);
  return out;
}

void EncodeConfigurationStateValue(ByteWriter& w, std::uint32_t v) {
  WriteTlv(w, ParameterType::kLlrpConfigurationStateValue, [&] { w.U32(v); });
}

std::uint32_t DecodeConfigurationStateValue(const ParameterView& view) {
  RequireType(view, ParameterType::kLlrpConfigurationStateValue);
  auto       body  = view.Body();
  const auto value = body.U32();
  ExpectConsumed(body, view);
  return value;
}

} // namespace llrp::codec
