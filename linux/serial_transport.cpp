#include "serial_transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <utility>

namespace pan_tilt {

namespace {

std::optional<speed_t> BaudConstant(uint32_t baud_rate) noexcept {
  switch (baud_rate) {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    default:
      return std::nullopt;
  }
}

tcflag_t DataBitsFlag(uint8_t data_bits) noexcept {
  switch (data_bits) {
    case 5:
      return CS5;
    case 6:
      return CS6;
    case 7:
      return CS7;
    default:
      return CS8;
  }
}

TransportError OpenErrorFromErrno(int err) noexcept {
  switch (err) {
    case EACCES:
    case EPERM:
      return TransportError::PermissionDenied;
    case EBUSY:
    case EWOULDBLOCK:
      return TransportError::Busy;
    case ENOENT:
    case ENODEV:
    case ENXIO:
      return TransportError::PortUnavailable;
    default:
      return TransportError::IoFailure;
  }
}

}  // namespace

SerialTransport::SerialTransport(PtzPlatform& platform,
                                 ConnectionConfig config)
    : Transport(platform, std::move(config)) {}

SerialTransport::~SerialTransport() { Close(); }

TransportResult<bool> SerialTransport::DoOpen(const ConnectionConfig& config) {
  const SerialSettings& s = config.serial;
  const auto speed = BaudConstant(s.baud_rate);
  if (!speed) {
    LogFormat(platform_, LogLevel::Error, LogEvent::TransportOpenFailed,
              "Unsupported baud rate %u", s.baud_rate);
    return TransportError::InvalidConfig;
  }

  const int fd = ::open(s.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    const int err = errno;
    LogFormat(platform_, LogLevel::Warning, LogEvent::TransportOpenFailed,
              "open(%s): %s", s.port.c_str(), std::strerror(err));
    return OpenErrorFromErrno(err);
  }

  // Порт занят другим процессом
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    LogFormat(platform_, LogLevel::Warning, LogEvent::TransportOpenFailed,
              "flock(%s): %s", s.port.c_str(), std::strerror(err));
    return OpenErrorFromErrno(err);
  }

  termios tty{};
  if (::tcgetattr(fd, &tty) != 0) {
    const int err = errno;
    ::close(fd);
    LogFormat(platform_, LogLevel::Error, LogEvent::TransportOpenFailed,
              "tcgetattr(%s): %s", s.port.c_str(), std::strerror(err));
    return TransportError::IoFailure;
  }

  ::cfmakeraw(&tty);
  ::cfsetispeed(&tty, *speed);
  ::cfsetospeed(&tty, *speed);

  tty.c_cflag &= ~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS);
  tty.c_cflag |= DataBitsFlag(s.data_bits) | CLOCAL | CREAD;
  if (s.parity != Parity::None) {
    tty.c_cflag |= PARENB;
    if (s.parity == Parity::Odd) {
      tty.c_cflag |= PARODD;
    }
  }
  if (s.stop_bits == 2) {
    tty.c_cflag |= CSTOPB;
  }
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd, TCSANOW, &tty) != 0) {
    const int err = errno;
    ::close(fd);
    LogFormat(platform_, LogLevel::Error, LogEvent::TransportOpenFailed,
              "tcsetattr(%s): %s", s.port.c_str(), std::strerror(err));
    return TransportError::IoFailure;
  }
  ::tcflush(fd, TCIOFLUSH);

  fd_ = fd;
  write_timeout_ms_ = config.timeout_ms;
  return true;
}

void SerialTransport::DoClose() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialTransport::DoIsOpen() const { return fd_ >= 0; }

TransportResult<size_t> SerialTransport::DoWrite(
    std::span<const uint8_t> data) {
  using Clock = std::chrono::steady_clock;
  // Весь кадр должен уйти за write_timeout_ms_, иначе шина остаётся занятой
  const auto deadline =
      Clock::now() + std::chrono::milliseconds(write_timeout_ms_);

  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n =
        ::write(fd_, data.data() + written, data.size() - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      LogFormat(platform_, LogLevel::Error, LogEvent::Generic,
                "Serial write failed: %s", std::strerror(errno));
      return TransportError::IoFailure;
    }

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (left.count() <= 0) {
      LogFormat(platform_, LogLevel::Error, LogEvent::Generic,
                "Serial write stalled: %zu of %zu bytes in %u ms", written,
                data.size(), write_timeout_ms_);
      return TransportError::Timeout;
    }
    pollfd pfd{.fd = fd_, .events = POLLOUT, .revents = 0};
    if (::poll(&pfd, 1, static_cast<int>(left.count())) < 0 &&
        errno != EINTR) {
      LogFormat(platform_, LogLevel::Error, LogEvent::Generic,
                "Serial poll failed: %s", std::strerror(errno));
      return TransportError::IoFailure;
    }
  }
  ::tcdrain(fd_);
  return written;
}

TransportResult<size_t> SerialTransport::DoRead(std::span<uint8_t> buffer,
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
  if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 &&
      (pfd.revents & POLLIN) == 0) {
    return TransportError::IoFailure;
  }

  const ssize_t n = ::read(fd_, buffer.data(), buffer.size());
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return size_t{0};
    }
    return TransportError::IoFailure;
  }
  return static_cast<size_t>(n);
}

}  // namespace pan_tilt
