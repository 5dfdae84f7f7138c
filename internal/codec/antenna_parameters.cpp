#include "parameters.hpp"

namespace llrp::codec {

void Encode(ByteWriter& w, const model::RfReceiver& v) {
  WriteTlv(w, ParameterType::kRfReceiver, [&] { w.U16(v.receiver_sensitivity); });
}

model::RfReceiver DecodeRfReceiver(const ParameterView& view) {
  RequireType(view, ParameterType::kRfReceiver);
  auto              body = view.Body();
  model::RfReceiver out;
  out.receiver_sensitivity = body.U16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::RfTransmitter& v) {
  WriteTlv(w, ParameterType::kRfTransmitter, [&] {
    w.U16(v.hop_table_id);
    w.U16(v.channel_index);
    w.U16(v.transmit_power);
  });
}

model::RfTransmitter DecodeRfTransmitter(const ParameterView& view) {
  RequireType(view, ParameterType::kRfTransmitter);
  auto                 body = view.Body();
  model::RfTransmitter out;
  out.hop_table_id   = body.U16();
  out.channel_index  = body.U16();
  out.transmit_power = body.U16();
  ExpectConsumed(body, view);
  return out;
}

// ------------------------------------------------------------
// C1G2 inventory command
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::C1G2TagInventoryMask& v) {
  CheckWidth(v.memory_bank, 2, "C1G2TagInventoryMask.MB");
  WriteTlv(w, ParameterType::kC1G2TagInventoryMask, [&] {
    w.U8(static_cast<std::uint8_t>(v.memory_bank << 6));
    w.U16(v.pointer);
    w.U1v(v.tag_mask, v.mask_bit_count);
  });
}

model::C1G2TagInventoryMask DecodeC1G2TagInventoryMask(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2TagInventoryMask);
  auto                        body = view.Body();
  model::C1G2TagInventoryMask out;
  out.memory_bank = body.U8() >> 6;
  out.pointer     = body.U16();
  out.tag_mask    = body.U1v(&out.mask_bit_count);
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::C1G2Filter& v) {
  CheckWidth(v.truncate, 2, "C1G2Filter.T");
  WriteTlv(w, ParameterType::kC1G2Filter, [&] {
    w.U8(static_cast<std::uint8_t>(v.truncate << 6));
    Encode(w, v.mask);
    if (v.state_aware_action) {
      WriteTlv(w, ParameterType::kC1G2TagInventoryStateAwareFilterAction, [&] {
        w.U8(v.state_aware_action->target);
        w.U8(v.state_aware_action->action);
      });
    }
    if (v.state_unaware_action) {
      WriteTlv(w, ParameterType::kC1G2TagInventoryStateUnawareFilterAction,
               [&] { w.U8(v.state_unaware_action->action); });
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::C1G2Filter DecodeC1G2Filter(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2Filter);
  auto              body = view.Body();
  model::C1G2Filter out;
  out.truncate = body.U8() >> 6;

  ParameterCursor cursor(body, &out.unknown, "C1G2Filter");
  out.mask = DecodeC1G2TagInventoryMask(cursor.Expect(ParameterType::kC1G2TagInventoryMask));
  if (auto p = cursor.TakeIf(ParameterType::kC1G2TagInventoryStateAwareFilterAction)) {
    auto                                          action = p->Body();
    model::C1G2TagInventoryStateAwareFilterAction aware;
    aware.target = action.U8();
    aware.action = action.U8();
    ExpectConsumed(action, *p);
    out.state_aware_action = aware;
  }
  if (auto p = cursor.TakeIf(ParameterType::kC1G2TagInventoryStateUnawareFilterAction)) {
    auto                                            action = p->Body();
    model::C1G2TagInventoryStateUnawareFilterAction unaware;
    unaware.action = action.U8();
    ExpectConsumed(action, *p);
    out.state_unaware_action = unaware;
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::C1G2RfControl& v) {
  WriteTlv(w, ParameterType::kC1G2RfControl, [&] {
    w.U16(v.mode_index);
    w.U16(v.tari);
  });
}

model::C1G2RfControl DecodeC1G2RfControl(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2RfControl);
  auto                 body = view.Body();
  model::C1G2RfControl out;
  out.mode_index = body.U16();
  out.tari       = body.U16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::C1G2SingulationControl& v) {
  CheckWidth(v.session, 2, "C1G2SingulationControl.Session");
  WriteTlv(w, ParameterType::kC1G2SingulationControl, [&] {
    w.U8(static_cast<std::uint8_t>(v.session << 6));
    w.U16(v.tag_population);
    w.U32(v.tag_transit_time);
    if (v.state_aware_action) {
      WriteTlv(w, ParameterType::kC1G2TagInventoryStateAwareSingulationAction, [&] {
        std::uint8_t bits = 0;
        if (v.state_aware_action->inventoried_state_b) bits |= 0x80;
        if (v.state_aware_action->sl_deasserted) bits |= 0x40;
        w.U8(bits);
      });
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::C1G2SingulationControl DecodeC1G2SingulationControl(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2SingulationControl);
  auto                          body = view.Body();
  model::C1G2SingulationControl out;
  out.session          = body.U8() >> 6;
  out.tag_population   = body.U16();
  out.tag_transit_time = body.U32();

  ParameterCursor cursor(body, &out.unknown, "C1G2SingulationControl");
  if (auto p = cursor.TakeIf(ParameterType::kC1G2TagInventoryStateAwareSingulationAction)) {
    auto action = p->Body();
    const auto bits = action.U8();
    ExpectConsumed(action, *p);
    out.state_aware_action = model::C1G2TagInventoryStateAwareSingulationAction{
        (bits & 0x80) != 0, (bits & 0x40) != 0};
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::C1G2InventoryCommand& v) {
  WriteTlv(w, ParameterType::kC1G2InventoryCommand, [&] {
    w.U8(v.tag_inventory_state_aware ? 0x80 : 0x00);
    for (const auto& filter : v.filters) {
      Encode(w, filter);
    }
    if (v.rf_control) {
      Encode(w, *v.rf_control);
    }
    if (v.singulation_control) {
      Encode(w, *v.singulation_control);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::C1G2InventoryCommand DecodeC1G2InventoryCommand(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2InventoryCommand);
  auto                        body = view.Body();
  model::C1G2InventoryCommand out;
  out.tag_inventory_state_aware = (body.U8() & 0x80) != 0;

  ParameterCursor cursor(body, &out.unknown, "C1G2InventoryCommand");
  while (auto p = cursor.TakeIf(ParameterType::kC1G2Filter)) {
    out.filters.push_back(DecodeC1G2Filter(*p));
  }
  if (auto p = cursor.TakeIf(ParameterType::kC1G2RfControl)) {
    out.rf_control = DecodeC1G2RfControl(*p);
  }
  if (auto p = cursor.TakeIf(ParameterType::kC1G2SingulationControl)) {
    out.singulation_control = DecodeC1G2SingulationControl(*p);
  }
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

// ------------------------------------------------------------
// Antenna configuration and properties
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::AntennaConfiguration& v) {
  WriteTlv(w, ParameterType::kAntennaConfiguration, [&] {
    w.U16(v.antenna_id);
    if (v.rf_receiver) {
      Encode(w, *v.rf_receiver);
    }
    if (v.rf_transmitter) {
      Encode(w, *v.rf_transmitter);
    }
    for (const auto& command : v.inventory_commands) {
      Encode(w, command);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::AntennaConfiguration DecodeAntennaConfiguration(const ParameterView& view) {
  RequireType(view, ParameterType::kAntennaConfiguration);
  auto                        body = view.Body();
  model::AntennaConfiguration out;
  out.antenna_id = body.U16();

  ParameterCursor cursor(body, &out.unknown, "AntennaConfiguration");
  if (auto p = cursor.TakeIf(ParameterType::kRfReceiver)) {
    out.rf_receiver = DecodeRfReceiver(*p);
  }
  if (auto p = cursor.TakeIf(ParameterType::kRfTransmitter)) {
    out.rf_transmitter = DecodeRfTransmitter(*p);
  }
  while (auto p = cursor.TakeIf(ParameterType::kC1G2InventoryCommand)) {
    out.inventory_commands.push_back(DecodeC1G2InventoryCommand(*p));
  }
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::AntennaProperties& v) {
  WriteTlv(w, ParameterType::kAntennaProperties, [&] {
    w.U8(v.connected ? 0x80 : 0x00);
    w.U16(v.antenna_id);
    w.S16(v.gain);
  });
}

model::AntennaProperties DecodeAntennaProperties(const ParameterView& view) {
  RequireType(view, ParameterType::kAntennaProperties);
  auto                     body = view.Body();
  model::AntennaProperties out;
  out.connected  = (body.U8() & 0x80) != 0;
  out.antenna_id = body.U16();
  out.gain       = body.S16();
  ExpectConsumed(body, view);
  return out;
}

} // namespace llrp::codec
