#include "parameters.hpp"

namespace llrp::codec {

namespace {

void Encode(ByteWriter& w, const model::ReceiveSensitivityTableEntry& v) {
  WriteTlv(w, ParameterType::kReceiveSensitivityTableEntry, [&] {
    w.U16(v.index);
    w.S16(v.sensitivity);
  });
}

model::ReceiveSensitivityTableEntry DecodeReceiveSensitivityTableEntry(const ParameterView& view) {
  RequireType(view, ParameterType::kReceiveSensitivityTableEntry);
  auto                                body = view.Body();
  model::ReceiveSensitivityTableEntry out;
  out.index       = body.U16();
  out.sensitivity = body.S16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::PerAntennaReceiveSensitivityRange& v) {
  WriteTlv(w, ParameterType::kPerAntennaReceiveSensitivityRange, [&] {
    w.U16(v.antenna_id);
    w.U16(v.min_index);
    w.U16(v.max_index);
  });
}

model::PerAntennaReceiveSensitivityRange DecodePerAntennaReceiveSensitivityRange(const ParameterView& view) {
  RequireType(view, ParameterType::kPerAntennaReceiveSensitivityRange);
  auto                                     body = view.Body();
  model::PerAntennaReceiveSensitivityRange out;
  out.antenna_id = body.U16();
  out.min_index  = body.U16();
  out.max_index  = body.U16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::GpioCapabilities& v) {
  WriteTlv(w, ParameterType::kGpioCapabilities, [&] {
    w.U16(v.num_gpis);
    w.U16(v.num_gpos);
  });
}

model::GpioCapabilities DecodeGpioCapabilities(const ParameterView& view) {
  RequireType(view, ParameterType::kGpioCapabilities);
  auto                    body = view.Body();
  model::GpioCapabilities out;
  out.num_gpis = body.U16();
  out.num_gpos = body.U16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::PerAntennaAirProtocol& v) {
  WriteTlv(w, ParameterType::kPerAntennaAirProtocol, [&] {
    w.U16(v.antenna_id);
    w.U8v(v.protocol_ids);
  });
}

model::PerAntennaAirProtocol DecodePerAntennaAirProtocol(const ParameterView& view) {
  RequireType(view, ParameterType::kPerAntennaAirProtocol);
  auto                         body = view.Body();
  model::PerAntennaAirProtocol out;
  out.antenna_id   = body.U16();
  out.protocol_ids = body.U8v();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::TransmitPowerLevelTableEntry& v) {
  WriteTlv(w, ParameterType::kTransmitPowerLevelTableEntry, [&] {
    w.U16(v.index);
    w.S16(v.power);
  });
}

model::TransmitPowerLevelTableEntry DecodeTransmitPowerLevelTableEntry(const ParameterView& view) {
  RequireType(view, ParameterType::kTransmitPowerLevelTableEntry);
  auto                                body = view.Body();
  model::TransmitPowerLevelTableEntry out;
  out.index = body.U16();
  out.power = body.S16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::FrequencyHopTable& v) {
  WriteTlv(w, ParameterType::kFrequencyHopTable, [&] {
    w.U8(v.hop_table_id);
    w.U8(0);
    w.U32v(v.frequencies);
  });
}

model::FrequencyHopTable DecodeFrequencyHopTable(const ParameterView& view) {
  RequireType(view, ParameterType::kFrequencyHopTable);
  auto                     body = view.Body();
  model::FrequencyHopTable out;
  out.hop_table_id = body.U8();
  body.Skip(1);
  out.frequencies = body.U32v();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::FrequencyInformation& v) {
  WriteTlv(w, ParameterType::kFrequencyInformation, [&] {
    w.U8(v.hopping ? 0x80 : 0x00);
    for (const auto& table : v.hop_tables) {
      Encode(w, table);
    }
    if (v.fixed_frequencies) {
      WriteTlv(w, ParameterType::kFixedFrequencyTable, [&] { w.U32v(v.fixed_frequencies->frequencies); });
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::FrequencyInformation DecodeFrequencyInformation(const ParameterView& view) {
  RequireType(view, ParameterType::kFrequencyInformation);
  auto                        body = view.Body();
  model::FrequencyInformation out;
  out.hopping = (body.U8() & 0x80) != 0;

  ParameterCursor cursor(body, &out.unknown, "FrequencyInformation");
  while (auto p = cursor.TakeIf(ParameterType::kFrequencyHopTable)) {
    out.hop_tables.push_back(DecodeFrequencyHopTable(*p));
  }
  if (auto p = cursor.TakeIf(ParameterType::kFixedFrequencyTable)) {
    auto                       fixed = p->Body();
    model::FixedFrequencyTable table;
    table.frequencies = fixed.U32v();
    ExpectConsumed(fixed, *p);
    out.fixed_frequencies = table;
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::UhfC1G2RfModeTableEntry& v) {
  WriteTlv(w, ParameterType::kUhfC1G2RfModeTableEntry, [&] {
    w.U32(v.mode_id);
    std::uint8_t bits = 0;
    if (v.dr_value) bits |= 0x80;
    if (v.epc_hag_conformance) bits |= 0x40;
    w.U8(bits);
    w.U8(v.modulation);
    w.U8(v.forward_link_modulation);
    w.U8(v.spectral_mask_indicator);
    w.U32(v.bdr);
    w.U32(v.pie);
    w.U32(v.min_tari);
    w.U32(v.max_tari);
    w.U32(v.step_tari);
  });
}

model::UhfC1G2RfModeTableEntry DecodeUhfC1G2RfModeTableEntry(const ParameterView& view) {
  RequireType(view, ParameterType::kUhfC1G2RfModeTableEntry);
  auto                           body = view.Body();
  model::UhfC1G2RfModeTableEntry out;
  out.mode_id = body.U32();
  const auto bits = body.U8();
  out.dr_value                = (bits & 0x80) != 0;
  out.epc_hag_conformance     = (bits & 0x40) != 0;
  out.modulation              = body.U8();
  out.forward_link_modulation = body.U8();
  out.spectral_mask_indicator = body.U8();
  out.bdr                     = body.U32();
  out.pie                     = body.U32();
  out.min_tari                = body.U32();
  out.max_tari                = body.U32();
  out.step_tari               = body.U32();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::UhfBandCapabilities& v) {
  WriteTlv(w, ParameterType::kUhfBandCapabilities, [&] {
    for (const auto& entry : v.transmit_power_table) {
      Encode(w, entry);
    }
    Encode(w, v.frequency_information);
    for (const auto& table : v.rf_mode_tables) {
      WriteTlv(w, ParameterType::kUhfC1G2RfModeTable, [&] {
        for (const auto& entry : table.entries) {
          Encode(w, entry);
        }
        EncodeExtensions(w, {}, table.unknown);
      });
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::UhfBandCapabilities DecodeUhfBandCapabilities(const ParameterView& view) {
  RequireType(view, ParameterType::kUhfBandCapabilities);
  auto                       body = view.Body();
  model::UhfBandCapabilities out;

  ParameterCursor cursor(body, &out.unknown, "UHFBandCapabilities");
  while (auto p = cursor.TakeIf(ParameterType::kTransmitPowerLevelTableEntry)) {
    out.transmit_power_table.push_back(DecodeTransmitPowerLevelTableEntry(*p));
  }
  out.frequency_information = DecodeFrequencyInformation(cursor.Expect(ParameterType::kFrequencyInformation));
  while (auto p = cursor.TakeIf(ParameterType::kUhfC1G2RfModeTable)) {
    auto                      table_body = p->Body();
    model::UhfC1G2RfModeTable table;
    ParameterCursor           entries(table_body, &table.unknown, "UHFC1G2RFModeTable");
    while (auto e = entries.TakeIf(ParameterType::kUhfC1G2RfModeTableEntry)) {
      table.entries.push_back(DecodeUhfC1G2RfModeTableEntry(*e));
    }
    entries.ExpectEnd();
    out.rf_mode_tables.push_back(std::move(table));
  }
  cursor.ExpectEnd();
  return out;
}

} // namespace

// ------------------------------------------------------------
// Capability groups
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::GeneralDeviceCapabilities& v) {
  WriteTlv(w, ParameterType::kGeneralDeviceCapabilities, [&] {
    w.U16(v.max_antennas);
    std::uint16_t bits = 0;
    if (v.can_set_antenna_properties) bits |= 0x8000;
    if (v.has_utc_clock) bits |= 0x4000;
    w.U16(bits);
    w.U32(v.manufacturer);
    w.U32(v.model);
    w.Utf8v(v.firmware_version);
    for (const auto& entry : v.receive_sensitivity_table) {
      Encode(w, entry);
    }
    for (const auto& range : v.receive_sensitivity_ranges) {
      Encode(w, range);
    }
    Encode(w, v.gpio);
    for (const auto& protocols : v.air_protocols) {
      Encode(w, protocols);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::GeneralDeviceCapabilities DecodeGeneralDeviceCapabilities(const ParameterView& view) {
  RequireType(view, ParameterType::kGeneralDeviceCapabilities);
  auto                             body = view.Body();
  model::GeneralDeviceCapabilities out;
  out.max_antennas = body.U16();
  const auto bits  = body.U16();
  out.can_set_antenna_properties = (bits & 0x8000) != 0;
  out.has_utc_clock              = (bits & 0x4000) != 0;
  out.manufacturer               = body.U32();
  out.model                      = body.U32();
  out.firmware_version           = body.Utf8v();

  ParameterCursor cursor(body, &out.unknown, "GeneralDeviceCapabilities");
  while (auto p = cursor.TakeIf(ParameterType::kReceiveSensitivityTableEntry)) {
    out.receive_sensitivity_table.push_back(DecodeReceiveSensitivityTableEntry(*p));
  }
  while (auto p = cursor.TakeIf(ParameterType::kPerAntennaReceiveSensitivityRange)) {
    out.receive_sensitivity_ranges.push_back(DecodePerAntennaReceiveSensitivityRange(*p));
  }
  out.gpio = DecodeGpioCapabilities(cursor.Expect(ParameterType::kGpioCapabilities));
  while (auto p = cursor.TakeIf(ParameterType::kPerAntennaAirProtocol)) {
    out.air_protocols.push_back(DecodePerAntennaAirProtocol(*p));
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::LlrpCapabilities& v) {
  WriteTlv(w, ParameterType::kLlrpCapabilities, [&] {
    std::uint8_t bits = 0;
    if (v.can_do_rf_survey) bits |= 0x80;
    if (v.can_report_buffer_fill_warning) bits |= 0x40;
    if (v.supports_client_request_op_spec) bits |= 0x20;
    if (v.can_do_state_aware_singulation) bits |= 0x10;
    if (v.supports_event_and_report_holding) bits |= 0x08;
    w.U8(bits);
    w.U8(v.max_priority_levels);
    w.U16(v.client_request_op_spec_timeout);
    w.U32(v.max_rospecs);
    w.U32(v.max_specs_per_rospec);
    w.U32(v.max_inventory_parameter_specs_per_aispec);
    w.U32(v.max_accessspecs);
    w.U32(v.max_opspecs_per_accessspec);
  });
}

model::LlrpCapabilities DecodeLlrpCapabilities(const ParameterView& view) {
  RequireType(view, ParameterType::kLlrpCapabilities);
  auto                    body = view.Body();
  model::LlrpCapabilities out;
  const auto              bits = body.U8();
  out.can_do_rf_survey                         = (bits & 0x80) != 0;
  out.can_report_buffer_fill_warning           = (bits & 0x40) != 0;
  out.supports_client_request_op_spec          = (bits & 0x20) != 0;
  out.can_do_state_aware_singulation           = (bits & 0x10) != 0;
  out.supports_event_and_report_holding        = (bits & 0x08) != 0;
  out.max_priority_levels                      = body.U8();
  out.client_request_op_spec_timeout           = body.U16();
  out.max_rospecs                              = body.U32();
  out.max_specs_per_rospec                     = body.U32();
  out.max_inventory_parameter_specs_per_aispec = body.U32();
  out.max_accessspecs                          = body.U32();
  out.max_opspecs_per_accessspec               = body.U32();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::RegulatoryCapabilities& v) {
  WriteTlv(w, ParameterType::kRegulatoryCapabilities, [&] {
    w.U16(v.country_code);
    w.U16(v.communications_standard);
    if (v.uhf_band) {
      Encode(w, *v.uhf_band);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::RegulatoryCapabilities DecodeRegulatoryCapabilities(const ParameterView& view) {
  RequireType(view, ParameterType::kRegulatoryCapabilities);
  auto                          body = view.Body();
  model::RegulatoryCapabilities out;
  out.country_code            = body.U16();
  out.communications_standard = body.U16();

  ParameterCursor cursor(body, &out.unknown, "RegulatoryCapabilities");
  if (auto p = cursor.TakeIf(ParameterType::kUhfBandCapabilities)) {
    out.uhf_band = DecodeUhfBandCapabilities(*p);
  }
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::C1G2LlrpCapabilities& v) {
  WriteTlv(w, ParameterType::kC1G2LlrpCapabilities, [&] {
    std::uint8_t bits = 0;
    if (v.can_support_block_erase) bits |= 0x80;
    if (v.can_support_block_write) bits |= 0x40;
    w.U8(bits);
    w.U16(v.max_select_filters_per_query);
  });
}

model::C1G2LlrpCapabilities DecodeC1G2LlrpCapabilities(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2LlrpCapabilities);
  auto                        body = view.Body();
  model::C1G2LlrpCapabilities out;
  const auto                  bits = body.U8();
  out.can_support_block_erase      = (bits & 0x80) != 0;
  out.can_support_block_write      = (bits & 0x40) != 0;
  out.max_select_filters_per_query = body.U16();
  ExpectConsumed(body, view);
  return out;
}

} // namespace llrp::codec
