#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "internal/transport/transport.hpp"

namespace llrp::transport {

constexpr std::uint16_t kDefaultLlrpPort = 5084;

struct TcpEndpoint {
  std::string               host;
  std::uint16_t             port            = kDefaultLlrpPort;
  std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(5000);
};

/*
  TcpTransport

  POSIX socket transport. Connect resolves the host, tries each address with
  a bounded non-blocking connect, and disables Nagle so small command frames
  go out immediately.
*/
class TcpTransport : public Transport {
 public:
  explicit TcpTransport(TcpEndpoint endpoint);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&)            = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  void        Connect() override;
  std::size_t Read(std::uint8_t* buffer, std::size_t size, std::chrono::milliseconds timeout) override;
  void        Write(const std::uint8_t* data, std::size_t size) override;
  void        Close() override;
  bool        IsOpen() const override;

  const TcpEndpoint& endpoint() const {
    return endpoint_;
  }

 private:
  TcpEndpoint      endpoint_;
  std::atomic<int> fd_{-1};
};

} // namespace llrp::transport
