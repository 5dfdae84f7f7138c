#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace llrp::transport {

/*
  Transport

  Byte transport under a session. Failures are reported by throwing
  util::TransportError, util::TimeoutError or util::ConnectionLost.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual void Connect() = 0;

  // Blocks up to `timeout` for inbound bytes. Returns 0 when nothing arrived
  // in time; throws util::ConnectionLost once the peer has closed.
  virtual std::size_t Read(std::uint8_t* buffer, std::size_t size, std::chrono::milliseconds timeout) = 0;

  // Writes the whole buffer or throws.
  virtual void Write(const std::uint8_t* data, std::size_t size) = 0;

  // Idempotent.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;
};

} // namespace llrp::transport
