#include "parameters.hpp"

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

namespace {

template <typename Enum>
Enum ReadEnum(ByteReader& body, std::uint8_t max, const char* field) {
  const auto raw = body.U8();
  if (raw > max) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange,
                     std::string(field) + " value " + std::to_string(raw));
  }
  return static_cast<Enum>(raw);
}

[[noreturn]] void MissingTriggerValue(const char* what) {
  throw CodecError(CodecErrorCode::kMissingParameter, what);
}

void Encode(ByteWriter& w, const model::PeriodicTriggerValue& v) {
  WriteTlv(w, ParameterType::kPeriodicTriggerValue, [&] {
    w.U32(v.offset_ms);
    w.U32(v.period_ms);
    if (v.utc_timestamp) {
      Encode(w, model::Timestamp{model::Timestamp::Kind::kUtc, *v.utc_timestamp});
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::PeriodicTriggerValue DecodePeriodicTriggerValue(const ParameterView& view) {
  RequireType(view, ParameterType::kPeriodicTriggerValue);
  auto                        body = view.Body();
  model::PeriodicTriggerValue out;
  out.offset_ms = body.U32();
  out.period_ms = body.U32();

  ParameterCursor cursor(body, &out.unknown, "PeriodicTriggerValue");
  if (auto p = cursor.TakeIf(ParameterType::kUtcTimestamp)) {
    out.utc_timestamp = DecodeTimestamp(*p).microseconds;
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::TagObservationTrigger& v) {
  WriteTlv(w, ParameterType::kTagObservationTrigger, [&] {
    w.U8(v.trigger_type);
    w.U8(0);
    w.U16(v.number_of_tags);
    w.U16(v.number_of_attempts);
    w.U16(v.t_ms);
    w.U32(v.timeout_ms);
  });
}

model::TagObservationTrigger DecodeTagObservationTrigger(const ParameterView& view) {
  RequireType(view, ParameterType::kTagObservationTrigger);
  auto                         body = view.Body();
  model::TagObservationTrigger out;
  out.trigger_type = body.U8();
  body.Skip(1);
  out.number_of_tags     = body.U16();
  out.number_of_attempts = body.U16();
  out.t_ms               = body.U16();
  out.timeout_ms         = body.U32();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::RfSurveySpecStopTrigger& v) {
  WriteTlv(w, ParameterType::kRfSurveySpecStopTrigger, [&] {
    w.U8(v.type);
    w.U32(v.duration_ms);
    w.U32(v.n);
  });
}

model::RfSurveySpecStopTrigger DecodeRfSurveySpecStopTrigger(const ParameterView& view) {
  RequireType(view, ParameterType::kRfSurveySpecStopTrigger);
  auto                           body = view.Body();
  model::RfSurveySpecStopTrigger out;
  out.type        = body.U8();
  out.duration_ms = body.U32();
  out.n           = body.U32();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::C1G2EpcMemorySelector& v) {
  WriteTlv(w, ParameterType::kC1G2EpcMemorySelector, [&] {
    std::uint8_t bits = 0;
    if (v.enable_crc) bits |= 0x80;
    if (v.enable_pc_bits) bits |= 0x40;
    w.U8(bits);
  });
}

model::C1G2EpcMemorySelector DecodeC1G2EpcMemorySelector(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2EpcMemorySelector);
  auto       body = view.Body();
  const auto bits = body.U8();
  ExpectConsumed(body, view);
  return model::C1G2EpcMemorySelector{(bits & 0x80) != 0, (bits & 0x40) != 0};
}

} // namespace

// ------------------------------------------------------------
// Boundary
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::GpiTriggerValue& v) {
  WriteTlv(w, ParameterType::kGpiTriggerValue, [&] {
    w.U16(v.gpi_port);
    w.U8(v.gpi_event ? 0x80 : 0x00);
    w.U32(v.timeout_ms);
  });
}

model::GpiTriggerValue DecodeGpiTriggerValue(const ParameterView& view) {
  RequireType(view, ParameterType::kGpiTriggerValue);
  auto                   body = view.Body();
  model::GpiTriggerValue out;
  out.gpi_port   = body.U16();
  out.gpi_event  = (body.U8() & 0x80) != 0;
  out.timeout_ms = body.U32();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::RoSpecStartTrigger& v) {
  if (v.type == model::StartTriggerType::kPeriodic && !v.periodic) {
    MissingTriggerValue("periodic start trigger without PeriodicTriggerValue");
  }
  if (v.type == model::StartTriggerType::kGpi && !v.gpi) {
    MissingTriggerValue("GPI start trigger without GPITriggerValue");
  }
  WriteTlv(w, ParameterType::kRoSpecStartTrigger, [&] {
    w.U8(static_cast<std::uint8_t>(v.type));
    if (v.periodic) {
      Encode(w, *v.periodic);
    }
    if (v.gpi) {
      Encode(w, *v.gpi);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::RoSpecStartTrigger DecodeRoSpecStartTrigger(const ParameterView& view) {
  RequireType(view, ParameterType::kRoSpecStartTrigger);
  auto                      body = view.Body();
  model::RoSpecStartTrigger out;
  out.type = ReadEnum<model::StartTriggerType>(body, 3, "ROSpecStartTriggerType");

  ParameterCursor cursor(body, &out.unknown, "ROSpecStartTrigger");
  if (auto p = cursor.TakeIf(ParameterType::kPeriodicTriggerValue)) {
    out.periodic = DecodePeriodicTriggerValue(*p);
  }
  if (auto p = cursor.TakeIf(ParameterType::kGpiTriggerValue)) {
    out.gpi = DecodeGpiTriggerValue(*p);
  }
  cursor.ExpectEnd();

  if (out.type == model::StartTriggerType::kPeriodic && !out.periodic) {
    MissingTriggerValue("periodic start trigger without PeriodicTriggerValue");
  }
  if (out.type == model::StartTriggerType::kGpi && !out.gpi) {
    MissingTriggerValue("GPI start trigger without GPITriggerValue");
  }
  return out;
}

void Encode(ByteWriter& w, const model::RoSpecStopTrigger& v) {
  if (v.type == model::StopTriggerType::kGpiWithTimeout && !v.gpi) {
    MissingTriggerValue("GPI stop trigger without GPITriggerValue");
  }
  WriteTlv(w, ParameterType::kRoSpecStopTrigger, [&] {
    w.U8(static_cast<std::uint8_t>(v.type));
    w.U32(v.duration_ms);
    if (v.gpi) {
      Encode(w, *v.gpi);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::RoSpecStopTrigger DecodeRoSpecStopTrigger(const ParameterView& view) {
  RequireType(view, ParameterType::kRoSpecStopTrigger);
  auto                     body = view.Body();
  model::RoSpecStopTrigger out;
  out.type        = ReadEnum<model::StopTriggerType>(body, 2, "ROSpecStopTriggerType");
  out.duration_ms = body.U32();

  ParameterCursor cursor(body, &out.unknown, "ROSpecStopTrigger");
  if (auto p = cursor.TakeIf(ParameterType::kGpiTriggerValue)) {
    out.gpi = DecodeGpiTriggerValue(*p);
  }
  cursor.ExpectEnd();

  if (out.type == model::StopTriggerType::kGpiWithTimeout && !out.gpi) {
    MissingTriggerValue("GPI stop trigger without GPITriggerValue");
  }
  return out;
}

void Encode(ByteWriter& w, const model::RoBoundarySpec& v) {
  WriteTlv(w, ParameterType::kRoBoundarySpec, [&] {
    Encode(w, v.start_trigger);
    Encode(w, v.stop_trigger);
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::RoBoundarySpec DecodeRoBoundarySpec(const ParameterView& view) {
  RequireType(view, ParameterType::kRoBoundarySpec);
  auto                  body = view.Body();
  model::RoBoundarySpec out;

  ParameterCursor cursor(body, &out.unknown, "ROBoundarySpec");
  out.start_trigger = DecodeRoSpecStartTrigger(cursor.Expect(ParameterType::kRoSpecStartTrigger));
  out.stop_trigger  = DecodeRoSpecStopTrigger(cursor.Expect(ParameterType::kRoSpecStopTrigger));
  cursor.ExpectEnd();
  return out;
}

// ------------------------------------------------------------
// AISpec / RFSurveySpec
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::AiSpecStopTrigger& v) {
  if (v.type == model::AiSpecStopTriggerType::kGpiWithTimeout && !v.gpi) {
    MissingTriggerValue("GPI AISpec stop trigger without GPITriggerValue");
  }
  if (v.type == model::AiSpecStopTriggerType::kTagObservation && !v.tag_observation) {
    MissingTriggerValue("tag observation stop trigger without TagObservationTrigger");
  }
  WriteTlv(w, ParameterType::kAiSpecStopTrigger, [&] {
    w.U8(static_cast<std::uint8_t>(v.type));
    w.U32(v.duration_ms);
    if (v.gpi) {
      Encode(w, *v.gpi);
    }
    if (v.tag_observation) {
      Encode(w, *v.tag_observation);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::AiSpecStopTrigger DecodeAiSpecStopTrigger(const ParameterView& view) {
  RequireType(view, ParameterType::kAiSpecStopTrigger);
  auto                     body = view.Body();
  model::AiSpecStopTrigger out;
  out.type        = ReadEnum<model::AiSpecStopTriggerType>(body, 3, "AISpecStopTriggerType");
  out.duration_ms = body.U32();

  ParameterCursor cursor(body, &out.unknown, "AISpecStopTrigger");
  if (auto p = cursor.TakeIf(ParameterType::kGpiTriggerValue)) {
    out.gpi = DecodeGpiTriggerValue(*p);
  }
  if (auto p = cursor.TakeIf(ParameterType::kTagObservationTrigger)) {
    out.tag_observation = DecodeTagObservationTrigger(*p);
  }
  cursor.ExpectEnd();

  if (out.type == model::AiSpecStopTriggerType::kGpiWithTimeout && !out.gpi) {
    MissingTriggerValue("GPI AISpec stop trigger without GPITriggerValue");
  }
  if (out.type == model::AiSpecStopTriggerType::kTagObservation && !out.tag_observation) {
    MissingTriggerValue("tag observation stop trigger without TagObservationTrigger");
  }
  return out;
}

void Encode(ByteWriter& w, const model::InventoryParameterSpec& v) {
  WriteTlv(w, ParameterType::kInventoryParameterSpec, [&] {
    w.U16(v.spec_id);
    w.U8(v.protocol_id);
    for (const auto& cfg : v.antenna_configurations) {
      Encode(w, cfg);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::InventoryParameterSpec DecodeInventoryParameterSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kInventoryParameterSpec);
  auto                          body = view.Body();
  model::InventoryParameterSpec out;
  out.spec_id     = body.U16();
  out.protocol_id = body.U8();

  ParameterCursor cursor(body, &out.unknown, "InventoryParameterSpec");
  while (auto p = cursor.TakeIf(ParameterType::kAntennaConfiguration)) {
    out.antenna_configurations.push_back(DecodeAntennaConfiguration(*p));
  }
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::AiSpec& v) {
  if (v.inventory_parameter_specs.empty()) {
    throw CodecError(CodecErrorCode::kMissingParameter, "AISpec needs an InventoryParameterSpec");
  }
  WriteTlv(w, ParameterType::kAiSpec, [&] {
    w.U16v(v.antenna_ids);
    Encode(w, v.stop_trigger);
    for (const auto& spec : v.inventory_parameter_specs) {
      Encode(w, spec);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::AiSpec DecodeAiSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kAiSpec);
  auto          body = view.Body();
  model::AiSpec out;
  out.antenna_ids = body.U16v();

  ParameterCursor cursor(body, &out.unknown, "AISpec");
  out.stop_trigger = DecodeAiSpecStopTrigger(cursor.Expect(ParameterType::kAiSpecStopTrigger));
  out.inventory_parameter_specs.push_back(
      DecodeInventoryParameterSpec(cursor.Expect(ParameterType::kInventoryParameterSpec)));
  while (auto p = cursor.TakeIf(ParameterType::kInventoryParameterSpec)) {
    out.inventory_parameter_specs.push_back(DecodeInventoryParameterSpec(*p));
  }
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::RfSurveySpec& v) {
  WriteTlv(w, ParameterType::kRfSurveySpec, [&] {
    w.U16(v.antenna_id);
    w.U32(v.start_frequency);
    w.U32(v.end_frequency);
    Encode(w, v.stop_trigger);
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::RfSurveySpec DecodeRfSurveySpec(const ParameterView& view) {
  RequireType(view, ParameterType::kRfSurveySpec);
  auto                body = view.Body();
  model::RfSurveySpec out;
  out.antenna_id      = body.U16();
  out.start_frequency = body.U32();
  out.end_frequency   = body.U32();

  ParameterCursor cursor(body, &out.unknown, "RFSurveySpec");
  out.stop_trigger = DecodeRfSurveySpecStopTrigger(cursor.Expect(ParameterType::kRfSurveySpecStopTrigger));
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

// ------------------------------------------------------------
// Report selection
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::TagReportContentSelector& v) {
  WriteTlv(w, ParameterType::kTagReportContentSelector, [&] {
    std::uint16_t bits = 0;
    if (v.enable_rospec_id) bits |= 1u << 15;
    if (v.enable_spec_index) bits |= 1u << 14;
    if (v.enable_inventory_parameter_spec_id) bits |= 1u << 13;
    if (v.enable_antenna_id) bits |= 1u << 12;
    if (v.enable_channel_index) bits |= 1u << 11;
    if (v.enable_peak_rssi) bits |= 1u << 10;
    if (v.enable_first_seen_timestamp) bits |= 1u << 9;
    if (v.enable_last_seen_timestamp) bits |= 1u << 8;
    if (v.enable_tag_seen_count) bits |= 1u << 7;
    if (v.enable_access_spec_id) bits |= 1u << 6;
    w.U16(bits);
    for (const auto& selector : v.air_protocol_selectors) {
      Encode(w, selector);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::TagReportContentSelector DecodeTagReportContentSelector(const ParameterView& view) {
  RequireType(view, ParameterType::kTagReportContentSelector);
  auto                            body = view.Body();
  model::TagReportContentSelector out;
  const auto                      bits = body.U16();
  out.enable_rospec_id                   = (bits & (1u << 15)) != 0;
  out.enable_spec_index                  = (bits & (1u << 14)) != 0;
  out.enable_inventory_parameter_spec_id = (bits & (1u << 13)) != 0;
  out.enable_antenna_id                  = (bits & (1u << 12)) != 0;
  out.enable_channel_index               = (bits & (1u << 11)) != 0;
  out.enable_peak_rssi                   = (bits & (1u << 10)) != 0;
  out.enable_first_seen_timestamp        = (bits & (1u << 9)) != 0;
  out.enable_last_seen_timestamp         = (bits & (1u << 8)) != 0;
  out.enable_tag_seen_count              = (bits & (1u << 7)) != 0;
  out.enable_access_spec_id              = (bits & (1u << 6)) != 0;

  ParameterCursor cursor(body, &out.unknown, "TagReportContentSelector");
  while (auto p = cursor.TakeIf(ParameterType::kC1G2EpcMemorySelector)) {
    out.air_protocol_selectors.push_back(DecodeC1G2EpcMemorySelector(*p));
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::RoReportSpec& v) {
  WriteTlv(w, ParameterType::kRoReportSpec, [&] {
    w.U8(static_cast<std::uint8_t>(v.trigger));
    w.U16(v.n);
    Encode(w, v.content_selector);
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::RoReportSpec DecodeRoReportSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kRoReportSpec);
  auto                body = view.Body();
  model::RoReportSpec out;
  out.trigger = ReadEnum<model::RoReportTrigger>(body, 2, "ROReportTrigger");
  out.n       = body.U16();

  ParameterCursor cursor(body, &out.unknown, "ROReportSpec");
  out.content_selector =
      DecodeTagReportContentSelector(cursor.Expect(ParameterType::kTagReportContentSelector));
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

// ------------------------------------------------------------
// ROSpec
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::RoSpec& v) {
  if (v.specs.empty()) {
    throw CodecError(CodecErrorCode::kMissingParameter, "ROSpec needs at least one spec");
  }
  WriteTlv(w, ParameterType::kRoSpec, [&] {
    w.U32(v.id);
    w.U8(v.priority);
    w.U8(static_cast<std::uint8_t>(v.current_state));
    Encode(w, v.boundary);
    for (const auto& spec : v.specs) {
      std::visit([&](const auto& s) { Encode(w, s); }, spec);
    }
    if (v.report_spec) {
      Encode(w, *v.report_spec);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::RoSpec DecodeRoSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kRoSpec);
  auto          body = view.Body();
  model::RoSpec out;
  out.id            = body.U32();
  out.priority      = body.U8();
  out.current_state = ReadEnum<model::RoSpecState>(body, 2, "ROSpecState");

  ParameterCursor cursor(body, &out.unknown, "ROSpec");
  out.boundary = DecodeRoBoundarySpec(cursor.Expect(ParameterType::kRoBoundarySpec));

  auto decode_spec = [](const ParameterView& p) -> model::SpecParameter {
    switch (static_cast<ParameterType>(p.type)) {
      case ParameterType::kAiSpec: return DecodeAiSpec(p);
      case ParameterType::kRfSurveySpec: return DecodeRfSurveySpec(p);
      default: return DecodeCustom(p);
    }
  };
  out.specs.push_back(decode_spec(cursor.ExpectOneOf(
      {ParameterType::kAiSpec, ParameterType::kRfSurveySpec, ParameterType::kCustom})));
  while (auto p = cursor.TakeOneOf(
             {ParameterType::kAiSpec, ParameterType::kRfSurveySpec, ParameterType::kCustom})) {
    out.specs.push_back(decode_spec(*p));
  }
  if (auto p = cursor.TakeIf(ParameterType::kRoReportSpec)) {
    out.report_spec = DecodeRoReportSpec(*p);
  }
  cursor.ExpectEnd();
  return out;
}

} // namespace llrp::codec
