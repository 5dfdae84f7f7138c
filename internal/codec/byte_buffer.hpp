#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/bytes.hpp"

namespace llrp::codec {

using util::Bytes;

/*
  ByteWriter

  Appends network-order fields. LLRP variable arrays carry a 16-bit element
  count; bit arrays (u1v) carry a 16-bit bit count followed by ceil(bits/8)
  bytes.
*/
class ByteWriter {
 public:
  void U8(std::uint8_t v);
  void U16(std::uint16_t v);
  void U32(std::uint32_t v);
  void U64(std::uint64_t v);
  void S8(std::int8_t v);
  void S16(std::int16_t v);

  void U8v(const Bytes& v);
  void U16v(const std::vector<std::uint16_t>& v);
  void U32v(const std::vector<std::uint32_t>& v);
  void U1v(const Bytes& bits, std::uint16_t bit_count);
  void Utf8v(const std::string& v);
  void Raw(const Bytes& v);
  void Raw(const std::uint8_t* data, std::size_t size);

  // Overwrites a previously written 16-bit field.
  void PatchU16(std::size_t offset, std::uint16_t v);
  // Overwrites a previously written 32-bit field.
  void PatchU32(std::size_t offset, std::uint32_t v);

  std::size_t size() const {
    return out_.size();
  }

  const Bytes& bytes() const {
    return out_;
  }

  Bytes Take() {
    return std::move(out_);
  }

 private:
  Bytes out_;
};

/*
  ByteReader

  Bounds-checked view over an immutable buffer. Every read throws
  CodecError(kTruncated) instead of reading past the end.
*/
class ByteReader {
 public:
  ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {
  }

  explicit ByteReader(const Bytes& bytes) : ByteReader(bytes.data(), bytes.size()) {
  }

  std::uint8_t  U8();
  std::uint16_t U16();
  std::uint32_t U32();
  std::uint64_t U64();
  std::int8_t   S8();
  std::int16_t  S16();

  Bytes                      U8v();
  std::vector<std::uint16_t> U16v();
  std::vector<std::uint32_t> U32v();
  // Returns the packed bits; the bit count is written to *bit_count.
  Bytes       U1v(std::uint16_t* bit_count);
  std::string Utf8v();
  Bytes       Raw(std::size_t n);

  std::uint8_t PeekU8() const;

  void Skip(std::size_t n);

  std::size_t remaining() const {
    return size_ - pos_;
  }

  std::size_t position() const {
    return pos_;
  }

  bool AtEnd() const {
    return pos_ == size_;
  }

  const std::uint8_t* cursor() const {
    return data_ + pos_;
  }

 private:
  void Require(std::size_t n, const char* what) const;

  const std::uint8_t* data_;
  std::size_t         size_;
  std::size_t         pos_ = 0;
};

} // namespace llrp::codec
