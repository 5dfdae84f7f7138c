#include "parameters.hpp"

#include <type_traits>

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

namespace {

void Encode(ByteWriter& w, const model::AccessSpecStopTrigger& v) {
  WriteTlv(w, ParameterType::kAccessSpecStopTrigger, [&] {
    w.U8(static_cast<std::uint8_t>(v.type));
    w.U16(v.operation_count);
  });
}

model::AccessSpecStopTrigger DecodeAccessSpecStopTrigger(const ParameterView& view) {
  RequireType(view, ParameterType::kAccessSpecStopTrigger);
  auto                         body = view.Body();
  model::AccessSpecStopTrigger out;
  const auto                   type = body.U8();
  if (type > 1) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "AccessSpecStopTriggerType " + std::to_string(type));
  }
  out.type            = static_cast<model::AccessSpecStopTriggerType>(type);
  out.operation_count = body.U16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::C1G2TargetTag& v) {
  CheckWidth(v.memory_bank, 2, "C1G2TargetTag.MB");
  WriteTlv(w, ParameterType::kC1G2TargetTag, [&] {
    w.U8(static_cast<std::uint8_t>((v.memory_bank << 6) | (v.match ? 0x20 : 0x00)));
    w.U16(v.pointer);
    w.U1v(v.tag_mask, v.mask_bit_count);
    w.U1v(v.tag_data, v.data_bit_count);
  });
}

model::C1G2TargetTag DecodeC1G2TargetTag(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2TargetTag);
  auto                 body = view.Body();
  model::C1G2TargetTag out;
  const auto           bits = body.U8();
  out.memory_bank = bits >> 6;
  out.match       = (bits & 0x20) != 0;
  out.pointer     = body.U16();
  out.tag_mask    = body.U1v(&out.mask_bit_count);
  out.tag_data    = body.U1v(&out.data_bit_count);
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::C1G2Read& v) {
  CheckWidth(v.memory_bank, 2, "C1G2Read.MB");
  WriteTlv(w, ParameterType::kC1G2Read, [&] {
    w.U16(v.op_spec_id);
    w.U32(v.access_password);
    w.U8(static_cast<std::uint8_t>(v.memory_bank << 6));
    w.U16(v.word_pointer);
    w.U16(v.word_count);
  });
}

void Encode(ByteWriter& w, const model::C1G2Write& v) {
  CheckWidth(v.memory_bank, 2, "C1G2Write.MB");
  WriteTlv(w, ParameterType::kC1G2Write, [&] {
    w.U16(v.op_spec_id);
    w.U32(v.access_password);
    w.U8(static_cast<std::uint8_t>(v.memory_bank << 6));
    w.U16(v.word_pointer);
    w.U16v(v.data);
  });
}

void Encode(ByteWriter& w, const model::C1G2Kill& v) {
  WriteTlv(w, ParameterType::kC1G2Kill, [&] {
    w.U16(v.op_spec_id);
    w.U32(v.kill_password);
  });
}

void Encode(ByteWriter& w, const model::C1G2Lock& v) {
  if (v.payloads.empty()) {
    throw CodecError(CodecErrorCode::kMissingParameter, "C1G2Lock needs a C1G2LockPayload");
  }
  WriteTlv(w, ParameterType::kC1G2Lock, [&] {
    w.U16(v.op_spec_id);
    w.U32(v.access_password);
    for (const auto& payload : v.payloads) {
      WriteTlv(w, ParameterType::kC1G2LockPayload, [&] {
        w.U8(payload.privilege);
        w.U8(payload.data_field);
      });
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::C1G2LockPayload DecodeC1G2LockPayload(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2LockPayload);
  auto                   body = view.Body();
  model::C1G2LockPayload out;
  out.privilege  = body.U8();
  out.data_field = body.U8();
  ExpectConsumed(body, view);
  return out;
}

} // namespace

// ------------------------------------------------------------
// Tag matching and operations
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::C1G2TagSpec& v) {
  if (v.target_tags.empty() || v.target_tags.size() > 2) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "C1G2TagSpec carries one or two C1G2TargetTag");
  }
  WriteTlv(w, ParameterType::kC1G2TagSpec, [&] {
    for (const auto& tag : v.target_tags) {
      Encode(w, tag);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::C1G2TagSpec DecodeC1G2TagSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kC1G2TagSpec);
  auto               body = view.Body();
  model::C1G2TagSpec out;

  ParameterCursor cursor(body, &out.unknown, "C1G2TagSpec");
  out.target_tags.push_back(DecodeC1G2TargetTag(cursor.Expect(ParameterType::kC1G2TargetTag)));
  if (auto p = cursor.TakeIf(ParameterType::kC1G2TargetTag)) {
    out.target_tags.push_back(DecodeC1G2TargetTag(*p));
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::OpSpec& v) {
  std::visit([&](const auto& op) { Encode(w, op); }, v);
}

model::OpSpec DecodeOpSpec(const ParameterView& view) {
  auto body = view.Body();
  switch (static_cast<ParameterType>(view.type)) {
    case ParameterType::kC1G2Read: {
      model::C1G2Read out;
      out.op_spec_id      = body.U16();
      out.access_password = body.U32();
      out.memory_bank     = body.U8() >> 6;
      out.word_pointer    = body.U16();
      out.word_count      = body.U16();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kC1G2Write: {
      model::C1G2Write out;
      out.op_spec_id      = body.U16();
      out.access_password = body.U32();
      out.memory_bank     = body.U8() >> 6;
      out.word_pointer    = body.U16();
      out.data            = body.U16v();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kC1G2Kill: {
      model::C1G2Kill out;
      out.op_spec_id    = body.U16();
      out.kill_password = body.U32();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kC1G2Lock: {
      model::C1G2Lock out;
      out.op_spec_id      = body.U16();
      out.access_password = body.U32();
      ParameterCursor cursor(body, &out.unknown, "C1G2Lock");
      out.payloads.push_back(DecodeC1G2LockPayload(cursor.Expect(ParameterType::kC1G2LockPayload)));
      while (auto p = cursor.TakeIf(ParameterType::kC1G2LockPayload)) {
        out.payloads.push_back(DecodeC1G2LockPayload(*p));
      }
      cursor.ExpectEnd();
      return out;
    }
    case ParameterType::kCustom: return DecodeCustom(view);
    default: break;
  }
  throw CodecError(CodecErrorCode::kUnexpectedParameter,
                   std::string("not an OpSpec: ") + ParameterTypeName(view.type));
}

void Encode(ByteWriter& w, const model::AccessCommand& v) {
  if (v.op_specs.empty()) {
    throw CodecError(CodecErrorCode::kMissingParameter, "AccessCommand needs at least one OpSpec");
  }
  WriteTlv(w, ParameterType::kAccessCommand, [&] {
    Encode(w, v.tag_spec);
    for (const auto& op : v.op_specs) {
      Encode(w, op);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::AccessCommand DecodeAccessCommand(const ParameterView& view) {
  RequireType(view, ParameterType::kAccessCommand);
  auto                 body = view.Body();
  model::AccessCommand out;

  ParameterCursor cursor(body, &out.unknown, "AccessCommand");
  out.tag_spec = DecodeC1G2TagSpec(cursor.Expect(ParameterType::kC1G2TagSpec));

  const auto op_types = {ParameterType::kC1G2Read, ParameterType::kC1G2Write, ParameterType::kC1G2Kill,
                         ParameterType::kC1G2Lock};
  out.op_specs.push_back(DecodeOpSpec(cursor.ExpectOneOf(op_types)));
  while (auto p = cursor.TakeOneOf(op_types)) {
    out.op_specs.push_back(DecodeOpSpec(*p));
  }
  while (auto p = cursor.TakeIf(ParameterType::kCustom)) {
    out.op_specs.push_back(DecodeCustom(*p));
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::AccessReportSpec& v) {
  WriteTlv(w, ParameterType::kAccessReportSpec, [&] { w.U8(v.trigger); });
}

model::AccessReportSpec DecodeAccessReportSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kAccessReportSpec);
  auto                    body = view.Body();
  model::AccessReportSpec out;
  out.trigger = body.U8();
  ExpectConsumed(body, view);
  return out;
}

// ------------------------------------------------------------
// AccessSpec
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::AccessSpec& v) {
  WriteTlv(w, ParameterType::kAccessSpec, [&] {
    w.U32(v.id);
    w.U16(v.antenna_id);
    w.U8(v.protocol_id);
    w.U8(v.current_state == model::AccessSpecState::kEnabled ? 0x80 : 0x00);
    w.U32(v.rospec_id);
    Encode(w, v.stop_trigger);
    Encode(w, v.command);
    if (v.report_spec) {
      Encode(w, *v.report_spec);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::AccessSpec DecodeAccessSpec(const ParameterView& view) {
  RequireType(view, ParameterType::kAccessSpec);
  auto              body = view.Body();
  model::AccessSpec out;
  out.id            = body.U32();
  out.antenna_id    = body.U16();
  out.protocol_id   = body.U8();
  out.current_state = (body.U8() & 0x80) ? model::AccessSpecState::kEnabled : model::AccessSpecState::kDisabled;
  out.rospec_id     = body.U32();

  ParameterCursor cursor(body, &out.unknown, "AccessSpec");
  out.stop_trigger = DecodeAccessSpecStopTrigger(cursor.Expect(ParameterType::kAccessSpecStopTrigger));
  out.command      = DecodeAccessCommand(cursor.Expect(ParameterType::kAccessCommand));
  if (auto p = cursor.TakeIf(ParameterType::kAccessReportSpec)) {
    out.report_spec = DecodeAccessReportSpec(*p);
  }
  cursor.TakeCustom(&out.custom);
  cursor.ExpectEnd();
  return out;
}

// ------------------------------------------------------------
// Results
// ------------------------------------------------------------

void Encode(ByteWriter& w, const model::OpSpecResult& v) {
  std::visit(
      [&](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, model::CustomParameter>) {
          Encode(w, r);
        } else if constexpr (std::is_same_v<T, model::C1G2ReadOpSpecResult>) {
          WriteTlv(w, ParameterType::kC1G2ReadOpSpecResult, [&] {
            w.U8(r.result);
            w.U16(r.op_spec_id);
            w.U16v(r.read_data);
          });
        } else if constexpr (std::is_same_v<T, model::C1G2WriteOpSpecResult>) {
          WriteTlv(w, ParameterType::kC1G2WriteOpSpecResult, [&] {
            w.U8(r.result);
            w.U16(r.op_spec_id);
            w.U16(r.num_words_written);
          });
        } else {
          const auto type = std::is_same_v<T, model::C1G2KillOpSpecResult> ? ParameterType::kC1G2KillOpSpecResult
                                                                           : ParameterType::kC1G2LockOpSpecResult;
          WriteTlv(w, type, [&] {
            w.U8(r.result);
            w.U16(r.op_spec_id);
          });
        }
      },
      v);
}

model::OpSpecResult DecodeOpSpecResult(const ParameterView& view) {
  auto body = view.Body();
  switch (static_cast<ParameterType>(view.type)) {
    case ParameterType::kC1G2ReadOpSpecResult: {
      model::C1G2ReadOpSpecResult out;
      out.result     = body.U8();
      out.op_spec_id = body.U16();
      out.read_data  = body.U16v();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kC1G2WriteOpSpecResult: {
      model::C1G2WriteOpSpecResult out;
      out.result            = body.U8();
      out.op_spec_id        = body.U16();
      out.num_words_written = body.U16();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kC1G2KillOpSpecResult: {
      model::C1G2KillOpSpecResult out;
      out.result     = body.U8();
      out.op_spec_id = body.U16();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kC1G2LockOpSpecResult: {
      model::C1G2LockOpSpecResult out;
      out.result     = body.U8();
      out.op_spec_id = body.U16();
      ExpectConsumed(body, view);
      return out;
    }
    case ParameterType::kCustom: return DecodeCustom(view);
    default: break;
  }
  throw CodecError(CodecErrorCode::kUnexpectedParameter,
                   std::string("not an OpSpecResult: ") + ParameterTypeName(view.type));
}

} // namespace llrp::codec
