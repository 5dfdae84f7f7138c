#include "parameters.hpp"

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

namespace {

void Encode(ByteWriter& w, const model::ReaderExceptionEvent& v) {
  WriteTlv(w, ParameterType::kReaderExceptionEvent, [&] {
    w.Utf8v(v.message);
    if (v.rospec_id) WriteTvU32(w, ParameterType::kRoSpecId, *v.rospec_id);
    if (v.spec_index) WriteTvU16(w, ParameterType::kSpecIndex, *v.spec_index);
    if (v.inventory_parameter_spec_id) {
      WriteTvU16(w, ParameterType::kInventoryParameterSpecId, *v.inventory_parameter_spec_id);
    }
    if (v.antenna_id) WriteTvU16(w, ParameterType::kAntennaId, *v.antenna_id);
    if (v.access_spec_id) WriteTvU32(w, ParameterType::kAccessSpecId, *v.access_spec_id);
    if (v.op_spec_id) WriteTvU16(w, ParameterType::kOpSpecId, *v.op_spec_id);
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::ReaderExceptionEvent DecodeReaderExceptionEvent(const ParameterView& view) {
  auto                        body = view.Body();
  model::ReaderExceptionEvent out;
  out.message = body.Utf8v();

  ParameterCursor cursor(body, &out.unknown, "ReaderExceptionEvent");
  if (auto p = cursor.TakeIf(ParameterType::kRoSpecId)) out.rospec_id = p->Body().U32();
  if (auto p = cursor.TakeIf(ParameterType::kSpecIndex)) out.spec_index = p->Body().U16();
  if (auto p = cursor.TakeIf(ParameterType::kInventoryParameterSpecId)) {
    out.inventory_parameter_spec_id = p->Body().U16();
  }
  if (auto p = cursor.TakeIf(ParameterType::kAntennaId)) out.antenna_id = p->Body().U16();
  if (auto p = cursor.TakeIf(ParameterType::kAccessSpecId)) out.access_spec_id = p->Body().U32();
  if (auto p = cursor.TakeIf(ParameterType::kOpSpecId)) out.op_spec_id = p->Body().U16();
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

model::AiSpecEvent DecodeAiSpecEvent(const ParameterView& view) {
  auto               body = view.Body();
  model::AiSpecEvent out;
  out.type       = body.U8();
  out.rospec_id  = body.U32();
  out.spec_index = body.U16();

  ParameterCursor cursor(body, &out.unknown, "AISpecEvent");
  if (auto p = cursor.TakeIf(ParameterType::kC1G2SingulationDetails)) {
    auto details = p->Body();
    model::C1G2SingulationDetails d;
    d.num_collision_slots   = details.U16();
    d.num_empty_slots       = details.U16();
    out.singulation_details = d;
  }
  cursor.ExpectEnd();
  return out;
}

} // namespace

void Encode(ByteWriter& w, const model::ReaderEventNotificationData& v) {
  WriteTlv(w, ParameterType::kReaderEventNotificationData, [&] {
    Encode(w, v.timestamp);
    if (v.hopping) {
      WriteTlv(w, ParameterType::kHoppingEvent, [&] {
        w.U16(v.hopping->hop_table_id);
        w.U16(v.hopping->next_channel_index);
      });
    }
    if (v.gpi) {
      WriteTlv(w, ParameterType::kGpiEvent, [&] {
        w.U16(v.gpi->gpi_port);
        w.U8(v.gpi->level ? 0x80 : 0x00);
      });
    }
    if (v.rospec) {
      WriteTlv(w, ParameterType::kRoSpecEvent, [&] {
        w.U8(static_cast<std::uint8_t>(v.rospec->type));
        w.U32(v.rospec->rospec_id);
        w.U32(v.rospec->preempting_rospec_id);
      });
    }
    if (v.buffer_level_warning) {
      WriteTlv(w, ParameterType::kReportBufferLevelWarningEvent,
               [&] { w.U8(v.buffer_level_warning->percentage_full); });
    }
    if (v.buffer_overflow) {
      WriteTlv(w, ParameterType::kReportBufferOverflowErrorEvent, [] {});
    }
    if (v.reader_exception) {
      Encode(w, *v.reader_exception);
    }
    if (v.rf_survey) {
      WriteTlv(w, ParameterType::kRfSurveyEvent, [&] {
        w.U8(v.rf_survey->type);
        w.U32(v.rf_survey->rospec_id);
        w.U16(v.rf_survey->spec_index);
      });
    }
    if (v.aispec) {
      WriteTlv(w, ParameterType::kAiSpecEvent, [&] {
        w.U8(v.aispec->type);
        w.U32(v.aispec->rospec_id);
        w.U16(v.aispec->spec_index);
        if (v.aispec->singulation_details) {
          WriteTvHeader(w, ParameterType::kC1G2SingulationDetails);
          w.U16(v.aispec->singulation_details->num_collision_slots);
          w.U16(v.aispec->singulation_details->num_empty_slots);
        }
        EncodeExtensions(w, {}, v.aispec->unknown);
      });
    }
    if (v.antenna) {
      WriteTlv(w, ParameterType::kAntennaEvent, [&] {
        w.U8(v.antenna->connected ? 1 : 0);
        w.U16(v.antenna->antenna_id);
      });
    }
    if (v.connection_attempt) {
      WriteTlv(w, ParameterType::kConnectionAttemptEvent, [&] { w.U16(v.connection_attempt->status); });
    }
    if (v.connection_close) {
      WriteTlv(w, ParameterType::kConnectionCloseEvent, [] {});
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::ReaderEventNotificationData DecodeReaderEventNotificationData(const ParameterView& view) {
  RequireType(view, ParameterType::kReaderEventNotificationData);
  auto                               body = view.Body();
  model::ReaderEventNotificationData out;

  ParameterCursor cursor(body, &out.unknown, "ReaderEventNotificationData");
  out.timestamp = DecodeTimestamp(cursor.ExpectOneOf({ParameterType::kUtcTimestamp, ParameterType::kUptime}));

  while (const auto next = cursor.PeekType()) {
    const auto type = static_cast<ParameterType>(*next);
    if (type == ParameterType::kCustom) {
      out.custom.push_back(DecodeCustom(cursor.Next()));
      continue;
    }

    const auto p = cursor.Next();
    auto       e = p.Body();
    switch (type) {
      case ParameterType::kHoppingEvent: {
        model::HoppingEvent hop;
        hop.hop_table_id       = e.U16();
        hop.next_channel_index = e.U16();
        out.hopping            = hop;
        break;
      }
      case ParameterType::kGpiEvent: {
        model::GpiEvent gpi;
        gpi.gpi_port = e.U16();
        gpi.level    = (e.U8() & 0x80) != 0;
        out.gpi      = gpi;
        break;
      }
      case ParameterType::kRoSpecEvent: {
        model::RoSpecEvent ev;
        const auto         raw = e.U8();
        if (raw > 2) {
          throw CodecError(CodecErrorCode::kFieldOutOfRange, "ROSpecEvent type " + std::to_string(raw));
        }
        ev.type                 = static_cast<model::RoSpecEventType>(raw);
        ev.rospec_id            = e.U32();
        ev.preempting_rospec_id = e.U32();
        out.rospec              = ev;
        break;
      }
      case ParameterType::kReportBufferLevelWarningEvent:
        out.buffer_level_warning = model::ReportBufferLevelWarningEvent{e.U8()};
        break;
      case ParameterType::kReportBufferOverflowErrorEvent:
        out.buffer_overflow = model::ReportBufferOverflowErrorEvent{};
        break;
      case ParameterType::kReaderExceptionEvent:
        out.reader_exception = DecodeReaderExceptionEvent(p);
        e.Skip(e.remaining());
        break;
      case ParameterType::kRfSurveyEvent: {
        model::RfSurveyEvent ev;
        ev.type       = e.U8();
        ev.rospec_id  = e.U32();
        ev.spec_index = e.U16();
        out.rf_survey = ev;
        break;
      }
      case ParameterType::kAiSpecEvent:
        out.aispec = DecodeAiSpecEvent(p);
        e.Skip(e.remaining());
        break;
      case ParameterType::kAntennaEvent: {
        model::AntennaEvent ev;
        ev.connected  = e.U8() == 1;
        ev.antenna_id = e.U16();
        out.antenna   = ev;
        break;
      }
      case ParameterType::kConnectionAttemptEvent:
        out.connection_attempt = model::ConnectionAttemptEvent{e.U16()};
        break;
      case ParameterType::kConnectionCloseEvent:
        out.connection_close = model::ConnectionCloseEvent{};
        break;
      default:
        throw CodecError(CodecErrorCode::kUnexpectedParameter,
                         std::string("ReaderEventNotificationData: unexpected ") + ParameterTypeName(p.type));
    }
    ExpectConsumed(e, p);
  }
  return out;
}

} // namespace llrp::codec
