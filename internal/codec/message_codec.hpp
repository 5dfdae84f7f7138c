#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "internal/codec/message.hpp"
#include "internal/util/bytes.hpp"

namespace llrp::codec {

constexpr std::size_t kDefaultMaxFrameBytes = 16u * 1024u * 1024u;

/*
  ByteStream

  Reassembly buffer for the inbound TCP stream. Bytes are appended as the
  transport delivers them and consumed a whole frame at a time.
*/
class ByteStream {
 public:
  void Append(const std::uint8_t* data, std::size_t size);
  void Append(const util::Bytes& bytes);

  std::size_t Buffered() const {
    return buffer_.size() - offset_;
  }

  const std::uint8_t* data() const {
    return buffer_.data() + offset_;
  }

  void Consume(std::size_t n);

  void Clear();

 private:
  util::Bytes buffer_;
  std::size_t offset_ = 0;
};

/*
  MessageCodec

  Frames messages as
    3 reserved bits | 3-bit version | 10-bit type, u32 length, u32 message id
  followed by the body. Every field is big-endian; length includes the
  10-byte header.
*/
class MessageCodec {
 public:
  explicit MessageCodec(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

  // Throws CodecError(kSchemaMismatch) when the body does not belong to the
  // message type.
  util::Bytes Encode(const Message& message) const;

  // Returns nullopt without consuming anything while the stream holds less
  // than one complete frame. Throws CodecError on a malformed frame.
  std::optional<Message> Decode(ByteStream& stream) const;

  // Decodes exactly one complete frame.
  Message DecodeFrame(const std::uint8_t* frame, std::size_t size) const;

  std::size_t max_frame_bytes() const {
    return max_frame_bytes_;
  }

 private:
  std::size_t max_frame_bytes_;
};

} // namespace llrp::codec
