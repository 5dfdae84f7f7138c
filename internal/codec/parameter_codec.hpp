#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/byte_buffer.hpp"
#include "internal/codec/parameter_type.hpp"
#include "internal/model/common.hpp"
#include "internal/util/errors.hpp"

namespace llrp::codec {

enum class Encoding : std::uint8_t {
  kTv,
  kTlv,
};

/*
  RawParameter

  Schema-free view of one parameter. `value` excludes the header; for TLV
  parameters the length is recomputed on encode.
*/
struct RawParameter {
  std::uint16_t type     = 0;
  Encoding      encoding = Encoding::kTlv;
  Bytes         value;

  bool operator==(const RawParameter&) const = default;
};

struct DecodedParameter {
  RawParameter parameter;
  std::size_t  consumed = 0;
};

// Decodes the parameter at the front of `data`. Throws CodecError on an
// unknown TV type, a length below the header size, or a length that runs past
// the buffer.
DecodedParameter DecodeParameter(const std::uint8_t* data, std::size_t size);
DecodedParameter DecodeParameter(const Bytes& bytes);

void  EncodeParameter(ByteWriter& w, const RawParameter& parameter);
Bytes EncodeParameter(const RawParameter& parameter);

/*
  ParameterView

  Non-owning, validated slice of a parameter inside a larger buffer. Body()
  reads the value; typed decoders check that it is consumed exactly.
*/
struct ParameterView {
  std::uint16_t       type        = 0;
  Encoding            encoding    = Encoding::kTlv;
  const std::uint8_t* data        = nullptr;  // start of header
  std::size_t         size        = 0;        // header + value
  std::size_t         header_size = 0;

  ByteReader Body() const {
    return ByteReader(data + header_size, size - header_size);
  }

  std::size_t body_size() const {
    return size - header_size;
  }

  RawParameter ToRaw() const;
};

ParameterView ReadParameterView(const std::uint8_t* data, std::size_t size);

// Throws kBadLength when `reader` still has bytes after a parameter's fields.
void ExpectConsumed(const ByteReader& reader, const ParameterView& view);

// Throws kFieldOutOfRange when `value` does not fit a `bits`-wide field.
void CheckWidth(std::uint32_t value, unsigned bits, const char* field);

// Throws kSchemaMismatch when a typed decoder is handed the wrong parameter.
void RequireType(const ParameterView& view, ParameterType type);

/*
  ParameterCursor

  Walks the child parameters that follow a parameter's fixed fields. The
  cursor consumes from the reader it was built over.

  When an `unknown` sink is given, TLVs with no schema are moved into it as
  they are encountered, so known children are matched in order around them.
  Without a sink they surface as unexpected parameters.
*/
class ParameterCursor {
 public:
  explicit ParameterCursor(ByteReader& reader,
                           std::vector<model::OpaqueParameter>* unknown = nullptr,
                           const char* context = "parameter");

  bool AtEnd();

  // Type of the next parameter; nullopt at the end.
  std::optional<std::uint16_t> PeekType();

  ParameterView Next();

  std::optional<ParameterView> TakeIf(ParameterType type);
  std::optional<ParameterView> TakeOneOf(std::initializer_list<ParameterType> types);

  // Mandatory slots. A different parameter raises kUnexpectedParameter; the
  // end of the list raises kMissingParameter.
  ParameterView Expect(ParameterType type);
  ParameterView ExpectOneOf(std::initializer_list<ParameterType> types);

  // Appends every Custom parameter at the current position.
  void TakeCustom(std::vector<model::CustomParameter>* out);

  // Throws kUnexpectedParameter if anything is left.
  void ExpectEnd();

 private:
  void DrainUnknown();
  [[noreturn]] void Fail(util::CodecErrorCode code, const std::string& what) const;

  ByteReader&                          reader_;
  std::vector<model::OpaqueParameter>* unknown_;
  const char*                          context_;
};

// Writes a TLV header, runs `body`, then patches the length from the bytes
// actually written.
template <typename Fn>
void WriteTlv(ByteWriter& w, ParameterType type, Fn&& body) {
  const std::size_t start = w.size();
  w.U16(ToWire(type));
  w.U16(0);
  body();
  const std::size_t length = w.size() - start;
  if (length > 0xFFFF) {
    throw util::CodecError(util::CodecErrorCode::kFieldOutOfRange,
                           std::string(ParameterTypeName(ToWire(type))) + " longer than 65535 bytes");
  }
  w.PatchU16(start + 2, static_cast<std::uint16_t>(length));
}

// Writes the 1-byte TV header; the caller writes the fixed payload.
inline void WriteTvHeader(ByteWriter& w, ParameterType type) {
  w.U8(static_cast<std::uint8_t>(kTvFlag | ToWire(type)));
}

inline void WriteTvU8(ByteWriter& w, ParameterType type, std::uint8_t v) {
  WriteTvHeader(w, type);
  w.U8(v);
}

inline void WriteTvU16(ByteWriter& w, ParameterType type, std::uint16_t v) {
  WriteTvHeader(w, type);
  w.U16(v);
}

inline void WriteTvU32(ByteWriter& w, ParameterType type, std::uint32_t v) {
  WriteTvHeader(w, type);
  w.U32(v);
}

inline void WriteTvU64(ByteWriter& w, ParameterType type, std::uint64_t v) {
  WriteTvHeader(w, type);
  w.U64(v);
}

// ------------------------------------------------------------
// Extension parameters
// ------------------------------------------------------------

model::CustomParameter DecodeCustom(const ParameterView& view);
void                   Encode(ByteWriter& w, const model::CustomParameter& custom);

model::OpaqueParameter DecodeOpaque(const ParameterView& view);
void                   Encode(ByteWriter& w, const model::OpaqueParameter& opaque);

// Custom parameters first, then unknown TLVs.
void EncodeExtensions(ByteWriter&                                w,
                      const std::vector<model::CustomParameter>& custom,
                      const std::vector<model::OpaqueParameter>& unknown);

} // namespace llrp::codec
