#include "parameter_codec.hpp"

#include <algorithm>

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

namespace {

std::string TypeLabel(std::uint16_t type) {
  return std::string(ParameterTypeName(type)) + "(" + std::to_string(type) + ")";
}

} // namespace

// ------------------------------------------------------------
// Raw parameters
// ------------------------------------------------------------

ParameterView ReadParameterView(const std::uint8_t* data, std::size_t size) {
  if (size < 1) {
    throw CodecError(CodecErrorCode::kTruncated, "empty parameter");
  }

  ParameterView view;
  view.data = data;

  if (data[0] & kTvFlag) {
    const std::uint16_t type = data[0] & 0x7F;
    const auto          length = TvPayloadLength(type);
    if (!length) {
      throw CodecError(CodecErrorCode::kUnknownTvType, "TV type " + std::to_string(type));
    }
    view.type        = type;
    view.encoding    = Encoding::kTv;
    view.header_size = kTvHeaderSize;
    view.size        = kTvHeaderSize + *length;
    if (view.size > size) {
      throw CodecError(CodecErrorCode::kTruncated,
                       TypeLabel(type) + " needs " + std::to_string(view.size) + " bytes, " +
                           std::to_string(size) + " available");
    }
    return view;
  }

  if (size < kTlvHeaderSize) {
    throw CodecError(CodecErrorCode::kTruncated, "TLV header needs 4 bytes");
  }
  const std::uint16_t type   = static_cast<std::uint16_t>(((data[0] << 8) | data[1]) & kTypeMask);
  const std::uint16_t length = static_cast<std::uint16_t>((data[2] << 8) | data[3]);
  if (length < kTlvHeaderSize) {
    throw CodecError(CodecErrorCode::kBadLength,
                     TypeLabel(type) + " declares length " + std::to_string(length));
  }
  if (length > size) {
    throw CodecError(CodecErrorCode::kTruncated,
                     TypeLabel(type) + " declares length " + std::to_string(length) + ", " +
                         std::to_string(size) + " bytes available");
  }
  view.type        = type;
  view.encoding    = Encoding::kTlv;
  view.header_size = kTlvHeaderSize;
  view.size        = length;
  return view;
}

RawParameter ParameterView::ToRaw() const {
  RawParameter raw;
  raw.type     = type;
  raw.encoding = encoding;
  raw.value.assign(data + header_size, data + size);
  return raw;
}

DecodedParameter DecodeParameter(const std::uint8_t* data, std::size_t size) {
  const auto view = ReadParameterView(data, size);
  return DecodedParameter{view.ToRaw(), view.size};
}

DecodedParameter DecodeParameter(const Bytes& bytes) {
  return DecodeParameter(bytes.data(), bytes.size());
}

void EncodeParameter(ByteWriter& w, const RawParameter& parameter) {
  if (parameter.encoding == Encoding::kTv) {
    const auto length = TvPayloadLength(parameter.type);
    if (!length) {
      throw CodecError(CodecErrorCode::kUnknownTvType, "TV type " + std::to_string(parameter.type));
    }
    if (parameter.value.size() != *length) {
      throw CodecError(CodecErrorCode::kBadLength,
                       TypeLabel(parameter.type) + " payload must be " + std::to_string(*length) +
                           " bytes");
    }
    w.U8(static_cast<std::uint8_t>(kTvFlag | parameter.type));
    w.Raw(parameter.value);
    return;
  }

  if (parameter.type <= kTvMaxType || parameter.type > kTypeMask) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange,
                     "TLV type " + std::to_string(parameter.type) + " outside 128..1023");
  }
  WriteTlv(w, static_cast<ParameterType>(parameter.type), [&] { w.Raw(parameter.value); });
}

Bytes EncodeParameter(const RawParameter& parameter) {
  ByteWriter w;
  EncodeParameter(w, parameter);
  return w.Take();
}

void ExpectConsumed(const ByteReader& reader, const ParameterView& view) {
  if (!reader.AtEnd()) {
    throw CodecError(CodecErrorCode::kBadLength,
                     TypeLabel(view.type) + " has " + std::to_string(reader.remaining()) +
                         " bytes beyond its fields");
  }
}

void CheckWidth(std::uint32_t value, unsigned bits, const char* field) {
  if (bits < 32 && value >= (1u << bits)) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange,
                     std::string(field) + " value " + std::to_string(value) + " exceeds " +
                         std::to_string(bits) + " bits");
  }
}

void RequireType(const ParameterView& view, ParameterType type) {
  if (view.type != ToWire(type)) {
    throw CodecError(CodecErrorCode::kSchemaMismatch,
                     "expected " + TypeLabel(ToWire(type)) + ", got " + TypeLabel(view.type));
  }
}

// ------------------------------------------------------------
// ParameterCursor
// ------------------------------------------------------------

ParameterCursor::ParameterCursor(ByteReader&                          reader,
                                 std::vector<model::OpaqueParameter>* unknown,
                                 const char*                          context)
    : reader_(reader), unknown_(unknown), context_(context) {
}

void ParameterCursor::DrainUnknown() {
  if (!unknown_) {
    return;
  }
  while (!reader_.AtEnd()) {
    if (reader_.PeekU8() & kTvFlag) {
      return;
    }
    const auto view = ReadParameterView(reader_.cursor(), reader_.remaining());
    if (IsKnownParameterType(view.type)) {
      return;
    }
    unknown_->push_back(DecodeOpaque(view));
    reader_.Skip(view.size);
  }
}

bool ParameterCursor::AtEnd() {
  DrainUnknown();
  return reader_.AtEnd();
}

std::optional<std::uint16_t> ParameterCursor::PeekType() {
  if (AtEnd()) {
    return std::nullopt;
  }
  return ReadParameterView(reader_.cursor(), reader_.remaining()).type;
}

ParameterView ParameterCursor::Next() {
  if (AtEnd()) {
    Fail(CodecErrorCode::kMissingParameter, "expected a parameter, found end of list");
  }
  const auto view = ReadParameterView(reader_.cursor(), reader_.remaining());
  reader_.Skip(view.size);
  return view;
}

std::optional<ParameterView> ParameterCursor::TakeIf(ParameterType type) {
  const auto next = PeekType();
  if (!next || *next != ToWire(type)) {
    return std::nullopt;
  }
  return Next();
}

std::optional<ParameterView> ParameterCursor::TakeOneOf(std::initializer_list<ParameterType> types) {
  const auto next = PeekType();
  if (!next) {
    return std::nullopt;
  }
  const bool match = std::any_of(types.begin(), types.end(),
                                 [&](ParameterType t) { return ToWire(t) == *next; });
  if (!match) {
    return std::nullopt;
  }
  return Next();
}

ParameterView ParameterCursor::Expect(ParameterType type) {
  return ExpectOneOf({type});
}

ParameterView ParameterCursor::ExpectOneOf(std::initializer_list<ParameterType> types) {
  std::string wanted;
  for (auto t : types) {
    if (!wanted.empty()) wanted += "|";
    wanted += ParameterTypeName(ToWire(t));
  }

  const auto next = PeekType();
  if (!next) {
    Fail(CodecErrorCode::kMissingParameter, "missing " + wanted);
  }
  if (auto view = TakeOneOf(types)) {
    return *view;
  }
  Fail(CodecErrorCode::kUnexpectedParameter, "expected " + wanted + ", found " + TypeLabel(*next));
}

void ParameterCursor::TakeCustom(std::vector<model::CustomParameter>* out) {
  while (auto view = TakeIf(ParameterType::kCustom)) {
    out->push_back(DecodeCustom(*view));
  }
}

void ParameterCursor::ExpectEnd() {
  if (const auto next = PeekType()) {
    Fail(CodecErrorCode::kUnexpectedParameter, "unexpected " + TypeLabel(*next));
  }
}

void ParameterCursor::Fail(CodecErrorCode code, const std::string& what) const {
  throw CodecError(code, std::string(context_) + ": " + what);
}

// ------------------------------------------------------------
// Extension parameters
// ------------------------------------------------------------

model::CustomParameter DecodeCustom(const ParameterView& view) {
  if (view.encoding != Encoding::kTlv || view.type != ToWire(ParameterType::kCustom)) {
    throw CodecError(CodecErrorCode::kSchemaMismatch, "not a Custom parameter: " + TypeLabel(view.type));
  }
  auto                   body = view.Body();
  model::CustomParameter custom;
  custom.vendor_id = body.U32();
  custom.subtype   = body.U32();
  custom.payload   = body.Raw(body.remaining());
  return custom;
}

void Encode(ByteWriter& w, const model::CustomParameter& custom) {
  WriteTlv(w, ParameterType::kCustom, [&] {
    w.U32(custom.vendor_id);
    w.U32(custom.subtype);
    w.Raw(custom.payload);
  });
}

model::OpaqueParameter DecodeOpaque(const ParameterView& view) {
  if (view.encoding != Encoding::kTlv) {
    throw CodecError(CodecErrorCode::kSchemaMismatch, "TV parameters cannot be kept opaque");
  }
  return model::OpaqueParameter{view.type, Bytes(view.data + view.header_size, view.data + view.size)};
}

void Encode(ByteWriter& w, const model::OpaqueParameter& opaque) {
  EncodeParameter(w, RawParameter{opaque.type, Encoding::kTlv, opaque.body});
}

void EncodeExtensions(ByteWriter&                                w,
                      const std::vector<model::CustomParameter>& custom,
                      const std::vector<model::OpaqueParameter>& unknown) {
  for (const auto& c : custom) {
    Encode(w, c);
  }
  for (const auto& u : unknown) {
    Encode(w, u);
  }
}

} // namespace llrp::codec
