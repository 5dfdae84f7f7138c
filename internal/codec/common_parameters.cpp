#include "parameters.hpp"

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

void Encode(ByteWriter& w, const model::FieldError& v) {
  WriteTlv(w, ParameterType::kFieldError, [&] {
    w.U16(v.field_num);
    w.U16(v.error_code);
  });
}

model::FieldError DecodeFieldError(const ParameterView& view) {
  RequireType(view, ParameterType::kFieldError);
  auto              body = view.Body();
  model::FieldError out;
  out.field_num  = body.U16();
  out.error_code = body.U16();
  ExpectConsumed(body, view);
  return out;
}

void Encode(ByteWriter& w, const model::ParameterError& v) {
  if (v.parameter_error.size() > 1) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "ParameterError nests at most one ParameterError");
  }
  WriteTlv(w, ParameterType::kParameterError, [&] {
    w.U16(v.parameter_type);
    w.U16(v.error_code);
    if (v.field_error) {
      Encode(w, *v.field_error);
    }
    for (const auto& nested : v.parameter_error) {
      Encode(w, nested);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::ParameterError DecodeParameterError(const ParameterView& view) {
  RequireType(view, ParameterType::kParameterError);
  auto                  body = view.Body();
  model::ParameterError out;
  out.parameter_type = body.U16();
  out.error_code     = body.U16();

  ParameterCursor cursor(body, &out.unknown, "ParameterError");
  if (auto p = cursor.TakeIf(ParameterType::kFieldError)) {
    out.field_error = DecodeFieldError(*p);
  }
  if (auto p = cursor.TakeIf(ParameterType::kParameterError)) {
    out.parameter_error.push_back(DecodeParameterError(*p));
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::LlrpStatus& v) {
  WriteTlv(w, ParameterType::kLlrpStatus, [&] {
    w.U16(v.code);
    w.Utf8v(v.error_description);
    if (v.field_error) {
      Encode(w, *v.field_error);
    }
    if (v.parameter_error) {
      Encode(w, *v.parameter_error);
    }
    EncodeExtensions(w, {}, v.unknown);
  });
}

model::LlrpStatus DecodeLlrpStatus(const ParameterView& view) {
  RequireType(view, ParameterType::kLlrpStatus);
  auto              body = view.Body();
  model::LlrpStatus out;
  out.code              = body.U16();
  out.error_description = body.Utf8v();

  ParameterCursor cursor(body, &out.unknown, "LLRPStatus");
  if (auto p = cursor.TakeIf(ParameterType::kFieldError)) {
    out.field_error = DecodeFieldError(*p);
  }
  if (auto p = cursor.TakeIf(ParameterType::kParameterError)) {
    out.parameter_error = DecodeParameterError(*p);
  }
  cursor.ExpectEnd();
  return out;
}

void Encode(ByteWriter& w, const model::Timestamp& v) {
  const auto type = v.kind == model::Timestamp::Kind::kUtc ? ParameterType::kUtcTimestamp
                                                           : ParameterType::kUptime;
  WriteTlv(w, type, [&] { w.U64(v.microseconds); });
}

model::Timestamp DecodeTimestamp(const ParameterView& view) {
  model::Timestamp out;
  if (view.type == ToWire(ParameterType::kUtcTimestamp)) {
    out.kind = model::Timestamp::Kind::kUtc;
  } else {
    RequireType(view, ParameterType::kUptime);
    out.kind = model::Timestamp::Kind::kUptime;
  }
  auto body        = view.Body();
  out.microseconds = body.U64();
  ExpectConsumed(body, view);
  return out;
}

ParameterView SingleParameter(const Bytes& bytes) {
  const auto view = ReadParameterView(bytes.data(), bytes.size());
  if (view.size != bytes.size()) {
    throw CodecError(CodecErrorCode::kBadLength,
                     std::to_string(bytes.size() - view.size) + " bytes after the parameter");
  }
  return view;
}

} // namespace llrp::codec
