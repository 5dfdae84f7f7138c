#include "byte_buffer.hpp"

#include "internal/util/errors.hpp"

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

// ------------------------------------------------------------
// ByteWriter
// ------------------------------------------------------------

void ByteWriter::U8(std::uint8_t v) {
  out_.push_back(v);
}

void ByteWriter::U16(std::uint16_t v) {
  out_.push_back(static_cast<std::uint8_t>(v >> 8));
  out_.push_back(static_cast<std::uint8_t>(v));
}

void ByteWriter::U32(std::uint32_t v) {
  U16(static_cast<std::uint16_t>(v >> 16));
  U16(static_cast<std::uint16_t>(v));
}

void ByteWriter::U64(std::uint64_t v) {
  U32(static_cast<std::uint32_t>(v >> 32));
  U32(static_cast<std::uint32_t>(v));
}

void ByteWriter::S8(std::int8_t v) {
  U8(static_cast<std::uint8_t>(v));
}

void ByteWriter::S16(std::int16_t v) {
  U16(static_cast<std::uint16_t>(v));
}

void ByteWriter::U8v(const Bytes& v) {
  if (v.size() > 0xFFFF) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "u8v longer than 65535 elements");
  }
  U16(static_cast<std::uint16_t>(v.size()));
  Raw(v);
}

void ByteWriter::U16v(const std::vector<std::uint16_t>& v) {
  if (v.size() > 0xFFFF) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "u16v longer than 65535 elements");
  }
  U16(static_cast<std::uint16_t>(v.size()));
  for (const auto e : v) U16(e);
}

void ByteWriter::U32v(const std::vector<std::uint32_t>& v) {
  if (v.size() > 0xFFFF) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "u32v longer than 65535 elements");
  }
  U16(static_cast<std::uint16_t>(v.size()));
  for (const auto e : v) U32(e);
}

void ByteWriter::U1v(const Bytes& bits, std::uint16_t bit_count) {
  const std::size_t byte_count = (static_cast<std::size_t>(bit_count) + 7) / 8;
  if (bits.size() != byte_count) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange,
                     "u1v bit count " + std::to_string(bit_count) + " does not match " + std::to_string(bits.size()) + " bytes");
  }
  U16(bit_count);
  Raw(bits);
}

void ByteWriter::Utf8v(const std::string& v) {
  if (v.size() > 0xFFFF) {
    throw CodecError(CodecErrorCode::kFieldOutOfRange, "utf8v longer than 65535 bytes");
  }
  U16(static_cast<std::uint16_t>(v.size()));
  out_.insert(out_.end(), v.begin(), v.end());
}

void ByteWriter::Raw(const Bytes& v) {
  out_.insert(out_.end(), v.begin(), v.end());
}

void ByteWriter::Raw(const std::uint8_t* data, std::size_t size) {
  out_.insert(out_.end(), data, data + size);
}

void ByteWriter::PatchU16(std::size_t offset, std::uint16_t v) {
  out_.at(offset)     = static_cast<std::uint8_t>(v >> 8);
  out_.at(offset + 1) = static_cast<std::uint8_t>(v);
}

void ByteWriter::PatchU32(std::size_t offset, std::uint32_t v) {
  PatchU16(offset, static_cast<std::uint16_t>(v >> 16));
  PatchU16(offset + 2, static_cast<std::uint16_t>(v));
}

// ------------------------------------------------------------
// ByteReader
// ------------------------------------------------------------

void ByteReader::Require(std::size_t n, const char* what) const {
  if (remaining() < n) {
    throw CodecError(CodecErrorCode::kTruncated,
                     std::string(what) + " needs " + std::to_string(n) + " bytes, " + std::to_string(remaining()) + " remain");
  }
}

std::uint8_t ByteReader::U8() {
  Require(1, "u8");
  return data_[pos_++];
}

std::uint16_t ByteReader::U16() {
  Require(2, "u16");
  const auto v = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
  pos_ += 2;
  return v;
}

std::uint32_t ByteReader::U32() {
  Require(4, "u32");
  const std::uint32_t hi = U16();
  const std::uint32_t lo = U16();
  return (hi << 16) | lo;
}

std::uint64_t ByteReader::U64() {
  Require(8, "u64");
  const std::uint64_t hi = U32();
  const std::uint64_t lo = U32();
  return (hi << 32) | lo;
}

std::int8_t ByteReader::S8() {
  return static_cast<std::int8_t>(U8());
}

std::int16_t ByteReader::S16() {
  return static_cast<std::int16_t>(U16());
}

Bytes ByteReader::U8v() {
  const auto count = U16();
  return Raw(count);
}

std::vector<std::uint16_t> ByteReader::U16v() {
  const auto count = U16();
  Require(static_cast<std::size_t>(count) * 2, "u16v");
  std::vector<std::uint16_t> v;
  v.reserve(count);
  for (std::uint16_t i = 0; i < count; ++i) v.push_back(U16());
  return v;
}

std::vector<std::uint32_t> ByteReader::U32v() {
  const auto count = U16();
  Require(static_cast<std::size_t>(count) * 4, "u32v");
  std::vector<std::uint32_t> v;
  v.reserve(count);
  for (std::uint16_t i = 0; i < count; ++i) v.push_back(U32());
  return v;
}

Bytes ByteReader::U1v(std::uint16_t* bit_count) {
  const auto bits = U16();
  if (bit_count) *bit_count = bits;
  return Raw((static_cast<std::size_t>(bits) + 7) / 8);
}

std::string ByteReader::Utf8v() {
  const auto count = U16();
  Require(count, "utf8v");
  std::string v(reinterpret_cast<const char*>(data_ + pos_), count);
  pos_ += count;
  return v;
}

Bytes ByteReader::Raw(std::size_t n) {
  Require(n, "raw bytes");
  Bytes v(data_ + pos_, data_ + pos_ + n);
  pos_ += n;
  return v;
}

std::uint8_t ByteReader::PeekU8() const {
  Require(1, "peek");
  return data_[pos_];
}

void ByteReader::Skip(std::size_t n) {
  Require(n, "skip");
  pos_ += n;
}

} // namespace llrp::codec
