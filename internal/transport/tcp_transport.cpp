#include "tcp_transport.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace llrp::transport {
namespace {

std::string Errno(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

void SetNonBlocking(int fd, bool enabled) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    throw util::TransportError(Errno("fcntl(F_GETFL)"));
  }
  flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (::fcntl(fd, F_SETFL, flags) < 0) {
    throw util::TransportError(Errno("fcntl(F_SETFL)"));
  }
}

// Returns the connected descriptor, or -1 with `error` filled in.
int ConnectOne(const addrinfo* ai, std::chrono::milliseconds timeout, std::string* error) {
  int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
  if (fd < 0) {
    *error = Errno("socket");
    return -1;
  }

  SetNonBlocking(fd, true);

  if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      *error = Errno("connect");
      ::close(fd);
      return -1;
    }

    pollfd pfd{fd, POLLOUT, 0};
    int    ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
      *error = "connect timed out";
      ::close(fd);
      return -1;
    }
    if (ready < 0) {
      *error = Errno("poll");
      ::close(fd);
      return -1;
    }

    int       so_error = 0;
    socklen_t len      = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
      *error = std::string("connect: ") + std::strerror(so_error ? so_error : errno);
      ::close(fd);
      return -1;
    }
  }

  SetNonBlocking(fd, false);

  int one = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
    LLRP_LOG_WARN("failed to set TCP_NODELAY", {observability::StringField("error", std::strerror(errno))});
  }
  return fd;
}

} // namespace

TcpTransport::TcpTransport(TcpEndpoint endpoint) : endpoint_(std::move(endpoint)) {
}

TcpTransport::~TcpTransport() {
  Close();
}

void TcpTransport::Connect() {
  if (IsOpen()) {
    throw util::InvalidState("transport already connected");
  }

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*   raw     = nullptr;
  std::string service = std::to_string(endpoint_.port);
  int         rc      = ::getaddrinfo(endpoint_.host.c_str(), service.c_str(), &hints, &raw);
  if (rc != 0) {
    throw util::TransportError("resolve " + endpoint_.host + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(raw, &::freeaddrinfo);

  std::string last_error = "no addresses";
  bool        timed_out  = false;
  for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    int fd = ConnectOne(ai, endpoint_.connect_timeout, &last_error);
    if (fd >= 0) {
      fd_ = fd;
      LLRP_LOG_INFO("tcp connected",
                    {observability::StringField("host", endpoint_.host), observability::IntField("port", endpoint_.port)});
      return;
    }
    timed_out = timed_out || last_error == "connect timed out";
  }

  const std::string message = endpoint_.host + ":" + service + ": " + last_error;
  if (timed_out) {
    throw util::TimeoutError(message);
  }
  throw util::TransportError(message);
}

std::size_t TcpTransport::Read(std::uint8_t* buffer, std::size_t size, std::chrono::milliseconds timeout) {
  int fd = fd_.load();
  if (fd < 0) {
    throw util::ConnectionLost("transport closed");
  }

  pollfd pfd{fd, POLLIN, 0};
  int    ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready == 0) {
    return 0;
  }
  if (ready < 0) {
    if (errno == EINTR) {
      return 0;
    }
    throw util::TransportError(Errno("poll"));
  }

  ssize_t n = ::recv(fd, buffer, size, 0);
  if (n == 0) {
    throw util::ConnectionLost("reader closed the connection");
  }
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      return 0;
    }
    if (errno == ECONNRESET) {
      throw util::ConnectionLost(Errno("recv"));
    }
    throw util::TransportError(Errno("recv"));
  }
  return static_cast<std::size_t>(n);
}

void TcpTransport::Write(const std::uint8_t* data, std::size_t size) {
  int fd = fd_.load();
  if (fd < 0) {
    throw util::ConnectionLost("transport closed");
  }

  std::size_t sent = 0;
  while (sent < size) {
    ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE || errno == ECONNRESET) {
        throw util::ConnectionLost(Errno("send"));
      }
      throw util::TransportError(Errno("send"));
    }
    sent += static_cast<std::size_t>(n);
  }
}

void TcpTransport::Close() {
  int fd = fd_.exchange(-1);
  if (fd < 0) {
    return;
  }
  ::shutdown(fd, SHUT_RDWR);
  ::close(fd);
}

bool TcpTransport::IsOpen() const {
  return fd_.load() >= 0;
}

} // namespace llrp::transport
