#include "network_transport.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace pan_tilt {

namespace {

TransportError ConnectErrorFromErrno(int err) noexcept {
  switch (err) {
    case ECONNREFUSED:
    case EHOSTUNREACH:
    case ENETUNREACH:
      return TransportError::PortUnavailable;
    case EACCES:
    case EPERM:
      return TransportError::PermissionDenied;
    case ETIMEDOUT:
      return TransportError::Timeout;
    default:
      return TransportError::IoFailure;
  }
}

/** Неблокирующий connect с ожиданием не дольше timeout_ms. */
int ConnectWithTimeout(int fd, const sockaddr* addr, socklen_t len,
                       uint32_t timeout_ms) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  if (::connect(fd, addr, len) == 0) {
    return 0;
  }
  if (errno != EINPROGRESS) {
    return errno;
  }

  pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
  if (ready == 0) {
    return ETIMEDOUT;
  }
  if (ready < 0) {
    return errno;
  }
  int so_error = 0;
  socklen_t so_len = sizeof(so_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
    return errno;
  }
  return so_error;
}

}  // namespace

NetworkTransport::NetworkTransport(PtzPlatform& platform,
                                   ConnectionConfig config)
    : Transport(platform, std::move(config)) {}

NetworkTransport::~NetworkTransport() { Close(); }

TransportResult<bool> NetworkTransport::DoOpen(
    const ConnectionConfig& config) {
  const NetworkSettings& n = config.network;
  const std::string port = std::to_string(n.port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const int gai = ::getaddrinfo(n.host.c_str(), port.c_str(), &hints, &results);
  if (gai != 0) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::TransportOpenFailed,
              "Resolve %s: %s", n.host.c_str(), ::gai_strerror(gai));
    return TransportError::PortUnavailable;
  }

  int last_error = ECONNREFUSED;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = errno;
      continue;
    }
    const int err =
        ConnectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, config.timeout_ms);
    if (err == 0) {
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      fd_ = fd;
      connect_timeout_ms_ = config.timeout_ms;
      ::freeaddrinfo(results);
      return true;
    }
    last_error = err;
    ::close(fd);
  }
  ::freeaddrinfo(results);

  LogFormat(platform_, LogLevel::Warning, LogEvent::TransportOpenFailed,
            "Connect %s:%u: %s", n.host.c_str(), n.port,
            std::strerror(last_error));
  return ConnectErrorFromErrno(last_error);
}

void NetworkTransport::DoClose() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
}

bool NetworkTransport::DoIsOpen() const { return fd_ >= 0; }

TransportResult<size_t> NetworkTransport::DoWrite(
    std::span<const uint8_t> data) {
  size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent,
                             MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
      if (::poll(&pfd, 1, static_cast<int>(connect_timeout_ms_)) > 0) {
        continue;
      }
    }
    if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
      return TransportError::Closed;
    }
    LogFormat(platform_, LogLevel::Error, LogEvent::Generic,
              "Socket send failed: %s", std::strerror(errno));
    return TransportError::IoFailure;
  }
  return sent;
}

TransportResult<size_t> NetworkTransport::DoRead(std::span<uint8_t> buffer,
                                                 uint32_t timeout_ms) {
  pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
  int ready = 0;
  do {
    ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
  } while (ready < 0 && errno == EINTR);

  if (ready < 0) {
    return TransportError::IoFailure;
  }
  if (ready == 0) {
    return size_t{0};
  }

  const ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
  if (n == 0) {
    platform_.Log(LogLevel::Warning, LogEvent::TransportClosed,
                  "Connection closed by peer");
    return TransportError::Closed;
  }
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return size_t{0};
    }
    return errno == ECONNRESET ? TransportError::Closed
                               : TransportError::IoFailure;
  }
  return static_cast<size_t>(n);
}

}  // namespace pan_tilt
