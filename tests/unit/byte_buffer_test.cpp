#include "internal/codec/byte_buffer.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using llrp::codec::ByteReader;
using llrp::codec::ByteWriter;
using llrp::util::Bytes;
using llrp::util::CodecError;
using llrp::util::CodecErrorCode;

void TestFieldsAreBigEndian() {
  ByteWriter w;
  w.U16(0x0102);
  w.U32(0x03040506);
  w.S8(-77);

  const Bytes expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0xB3};
  assert(w.bytes() == expected);

  ByteReader r(w.bytes());
  assert(r.U16() == 0x0102);
  assert(r.U32() == 0x03040506);
  assert(r.S8() == -77);
  assert(r.AtEnd());
}

void TestBitArrayCarriesBitCount() {
  ByteWriter w;
  w.U1v({0xE2, 0x80}, 12);

  const Bytes expected{0x00, 0x0C, 0xE2, 0x80};
  assert(w.bytes() == expected);

  ByteReader    r(w.bytes());
  std::uint16_t bits = 0;
  const auto    data = r.U1v(&bits);
  assert(bits == 12);
  assert((data == Bytes{0xE2, 0x80}));

  bool threw = false;
  try {
    ByteWriter bad;
    bad.U1v({0x01}, 12);
  } catch (const CodecError& e) {
    threw = e.code() == CodecErrorCode::kFieldOutOfRange;
  }
  assert(threw && "bit count must match the byte count");
}

void TestReadPastEndIsTruncated() {
  const Bytes bytes{0x00, 0x03, 'a', 'b'};
  ByteReader  r(bytes);

  bool threw = false;
  try {
    (void)r.Utf8v();
  } catch (const CodecError& e) {
    threw = e.code() == CodecErrorCode::kTruncated;
  }
  assert(threw && "a string longer than the buffer must not be read");
}

void TestPatchRewritesLength() {
  ByteWriter w;
  w.U16(0x00DC);
  w.U16(0);
  w.U8(1);
  w.PatchU16(2, static_cast<std::uint16_t>(w.size()));

  const Bytes expected{0x00, 0xDC, 0x00, 0x05, 0x01};
  assert(w.bytes() == expected);
}

} // namespace

int main() {
  TestFieldsAreBigEndian();
  TestBitArrayCarriesBitCount();
  TestReadPastEndIsTruncated();
  TestPatchRewritesLength();

  std::cout << "llrp_engine_unit_byte_buffer: pass\n";
  return 0;
}
