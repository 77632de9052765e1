#include "transport.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

#include "protocol.hpp"

namespace pan_tilt {

bool IsRetriable(TransportError error) noexcept {
  return error == TransportError::PermissionDenied ||
         error == TransportError::Busy;
}

const char* ToString(TransportError error) noexcept {
  switch (error) {
    case TransportError::NotOpen:
      return "not open";
    case TransportError::PortUnavailable:
      return "port unavailable";
    case TransportError::PermissionDenied:
      return "permission denied";
    case TransportError::Busy:
      return "port busy";
    case TransportError::IoFailure:
      return "i/o failure";
    case TransportError::Timeout:
      return "timeout";
    case TransportError::InvalidConfig:
      return "invalid config";
    case TransportError::Closed:
      return "closed by peer";
  }
  return "unknown";
}

namespace {

const char* KindName(TransportKind kind) noexcept {
  switch (kind) {
    case TransportKind::Serial:
      return "serial";
    case TransportKind::Network:
      return "network";
    case TransportKind::Simulator:
      return "simulator";
  }
  return "?";
}

void LogTx(const PtzPlatform& platform, std::span<const uint8_t> data) {
  const std::string hex = protocol::FormatHex(data);
  if (data.size() == protocol::COMMAND_FRAME_SIZE &&
      data[0] == protocol::SYNC_BYTE) {
    const protocol::CommandFrame frame(data[1], data[2], data[3], data[4],
                                       data[5]);
    LogFormat(platform, LogLevel::Debug, LogEvent::FrameSent, "TX %s | %s",
              hex.c_str(), protocol::Describe(frame).c_str());
    return;
  }
  LogFormat(platform, LogLevel::Debug, LogEvent::FrameSent, "TX %s",
            hex.c_str());
}

}  // namespace

Transport::Transport(PtzPlatform& platform, ConnectionConfig config)
    : platform_(platform), config_(std::move(config)) {}

// ═══════════════════════════════════════════════════════════════════════════
// Жизненный цикл
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<bool> Transport::Open() {
  BusLock lock(bus_mutex_);
  return OpenLocked();
}

TransportResult<bool> Transport::OpenLocked() {
  if (DoIsOpen()) {
    return true;
  }
  if (!config_.IsValid()) {
    platform_.Log(LogLevel::Error, LogEvent::TransportOpenFailed,
                  "Invalid connection config");
    return TransportError::InvalidConfig;
  }

  const ConnectionConfig& cfg = config_;
  auto result = RetryWithBackoff(
      cfg.retry, platform_, [&] { return DoOpen(cfg); },
      [](TransportError e) { return IsRetriable(e); },
      [&](uint32_t attempt, TransportError e) {
        LogFormat(platform_, LogLevel::Warning, LogEvent::TransportOpenRetry,
                  "Open %s failed (%s), attempt %u/%u, retry in %u ms",
                  KindName(cfg.kind), ToString(e), attempt,
                  cfg.retry.max_attempts, cfg.retry.backoff_ms);
      });

  if (IsError(result)) {
    LogFormat(platform_, LogLevel::Error, LogEvent::TransportOpenFailed,
              "Open %s failed: %s", KindName(cfg.kind),
              ToString(GetError(result)));
    return result;
  }

  // Дескриптор может оказаться невалидным даже при успешном DoOpen
  if (!DoIsOpen()) {
    LogFormat(platform_, LogLevel::Error, LogEvent::TransportOpenFailed,
              "Open %s reported success but handle is not open",
              KindName(cfg.kind));
    return TransportError::IoFailure;
  }

  LogFormat(platform_, LogLevel::Info, LogEvent::TransportOpened,
            "Transport %s opened", KindName(cfg.kind));
  return true;
}

void Transport::Close() {
  BusLock lock(bus_mutex_);
  if (!DoIsOpen()) {
    return;
  }
  DoClose();
  LogFormat(platform_, LogLevel::Info, LogEvent::TransportClosed,
            "Transport %s closed", KindName(config_.kind));
}

bool Transport::IsOpen() const {
  BusLock lock(bus_mutex_);
  return DoIsOpen();
}

TransportResult<bool> Transport::Configure(const ConnectionConfig& config) {
  BusLock lock(bus_mutex_);
  if (!config.IsValid() || config.kind != config_.kind) {
    return TransportError::InvalidConfig;
  }

  const bool was_open = DoIsOpen();
  if (was_open) {
    DoClose();
  }

  ConnectionConfig previous = config_;
  config_ = config;
  if (!was_open) {
    return true;
  }

  auto result = OpenLocked();
  if (IsOk(result)) {
    return true;
  }

  platform_.Log(LogLevel::Warning, LogEvent::ConfigureRollback,
                "Reopen with new config failed, restoring previous config");
  config_ = std::move(previous);
  auto rollback = OpenLocked();
  if (IsError(rollback)) {
    LogFormat(platform_, LogLevel::Error, LogEvent::ConfigureRollback,
              "Reopen with previous config failed: %s",
              ToString(GetError(rollback)));
  }
  return result;
}

ConnectionConfig Transport::Config() const {
  BusLock lock(bus_mutex_);
  return config_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Ввод-вывод
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<size_t> Transport::Send(std::span<const uint8_t> data) {
  BusLock lock(bus_mutex_);
  if (!DoIsOpen()) {
    return TransportError::NotOpen;
  }
  LogTx(platform_, data);
  auto result = DoWrite(data);
  if (IsError(result)) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::Generic,
              "Write failed: %s", ToString(GetError(result)));
  }
  return result;
}

TransportResult<Bytes> Transport::Receive(size_t max_len,
                                          uint32_t timeout_ms) {
  BusLock lock(bus_mutex_);
  if (!DoIsOpen()) {
    return TransportError::NotOpen;
  }

  Bytes buffer(max_len);
  auto result = DoRead(buffer, timeout_ms);
  if (IsError(result)) {
    return GetError(result);
  }
  const size_t n = GetValue(result);
  if (n == 0) {
    LogFormat(platform_, LogLevel::Debug, LogEvent::ReceiveTimeout,
              "No data within %u ms", timeout_ms);
    return TransportError::Timeout;
  }
  buffer.resize(n);
  LogFormat(platform_, LogLevel::Debug, LogEvent::FrameReceived, "RX %s",
            protocol::FormatHex(buffer).c_str());
  return buffer;
}

TransportResult<Bytes> Transport::ReceiveUntil(
    std::span<const uint8_t> terminator, size_t max_len, uint32_t timeout_ms) {
  BusLock lock(bus_mutex_);
  if (!DoIsOpen()) {
    return TransportError::NotOpen;
  }

  Bytes out;
  out.reserve(max_len);
  const uint64_t deadline = platform_.GetTimeMs() + timeout_ms;
  size_t search_from = 0;

  while (out.size() < max_len) {
    const uint64_t now = platform_.GetTimeMs();
    const uint32_t remaining =
        now >= deadline ? 0 : static_cast<uint32_t>(deadline - now);
    if (remaining == 0 && !out.empty()) {
      break;
    }

    // С терминатором читаем по байту: всё после него остаётся во входе
    const size_t old_size = out.size();
    const size_t chunk = terminator.empty() ? max_len - old_size : 1;
    out.resize(old_size + chunk);
    auto result = DoRead(std::span(out).subspan(old_size), remaining);
    if (IsError(result)) {
      out.resize(old_size);
      if (out.empty()) {
        return GetError(result);
      }
      break;
    }
    const size_t n = GetValue(result);
    out.resize(old_size + n);
    if (n == 0) {
      break;  // таймаут
    }

    if (!terminator.empty() && out.size() >= terminator.size()) {
      // Терминатор мог начаться в предыдущем фрагменте
      const auto it = std::search(out.begin() + static_cast<std::ptrdiff_t>(search_from),
                                  out.end(), terminator.begin(), terminator.end());
      if (it != out.end()) {
        out.resize(static_cast<size_t>(it - out.begin()) + terminator.size());
        break;
      }
      search_from = out.size() - (terminator.size() - 1);
    }
  }

  if (out.empty()) {
    LogFormat(platform_, LogLevel::Debug, LogEvent::ReceiveTimeout,
              "No data within %u ms", timeout_ms);
    return TransportError::Timeout;
  }
  LogFormat(platform_, LogLevel::Debug, LogEvent::FrameReceived, "RX %s",
            protocol::FormatHex(out).c_str());
  return out;
}

size_t Transport::FlushInput(size_t max_bytes, uint32_t timeout_ms) {
  BusLock lock(bus_mutex_);
  if (!DoIsOpen()) {
    return 0;
  }

  Bytes scratch(max_bytes);
  size_t flushed = 0;
  while (flushed < max_bytes) {
    auto result = DoRead(std::span(scratch).first(max_bytes - flushed),
                         flushed == 0 ? timeout_ms : 0);
    if (IsError(result)) {
      LogFormat(platform_, LogLevel::Warning, LogEvent::Generic,
                "Flush stopped: %s", ToString(GetError(result)));
      break;
    }
    const size_t n = GetValue(result);
    if (n == 0) {
      break;
    }
    flushed += n;
  }

  if (flushed > 0) {
    LogFormat(platform_, LogLevel::Debug, LogEvent::Generic,
              "Flushed %zu stale bytes", flushed);
  }
  return flushed;
}

// ═══════════════════════════════════════════════════════════════════════════
// Шина
// ═══════════════════════════════════════════════════════════════════════════

Transport::BusLock Transport::AcquireBus() { return BusLock(bus_mutex_); }

Transport::BusLock Transport::TryAcquireBus(uint32_t timeout_ms) {
  return BusLock(bus_mutex_, std::chrono::milliseconds(timeout_ms));
}

}  // namespace pan_tilt
