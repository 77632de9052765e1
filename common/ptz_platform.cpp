#include "ptz_platform.hpp"

#include <cstdarg>
#include <cstdio>

namespace pan_tilt {

const char* ToString(LogEvent event) noexcept {
  switch (event) {
    case LogEvent::Generic:
      return "generic";
    case LogEvent::TransportOpened:
      return "transport_opened";
    case LogEvent::TransportOpenRetry:
      return "transport_open_retry";
    case LogEvent::TransportOpenFailed:
      return "transport_open_failed";
    case LogEvent::TransportClosed:
      return "transport_closed";
    case LogEvent::ConfigureRollback:
      return "configure_rollback";
    case LogEvent::FrameSent:
      return "tx";
    case LogEvent::FrameReceived:
      return "rx";
    case LogEvent::ReceiveTimeout:
      return "rx_timeout";
    case LogEvent::PartialFrame:
      return "partial_frame";
    case LogEvent::DecodeFailed:
      return "decode_failed";
    case LogEvent::ChecksumMismatch:
      return "checksum_mismatch";
    case LogEvent::ChecksumQuirk:
      return "checksum_quirk";
    case LogEvent::UnexpectedResponse:
      return "unexpected_response";
    case LogEvent::QueryFailed:
      return "query_failed";
    case LogEvent::BlockingWaitReached:
      return "wait_reached";
    case LogEvent::BlockingWaitTimeout:
      return "wait_timeout";
    case LogEvent::ZeroPointCaptured:
      return "zero_point";
    case LogEvent::HomeCaptureFailed:
      return "home_failed";
    case LogEvent::CommandFailed:
      return "command_failed";
    case LogEvent::CommandDropped:
      return "command_dropped";
    case LogEvent::TelemetryDegraded:
      return "telemetry_degraded";
    case LogEvent::SubscriberFailed:
      return "subscriber_failed";
  }
  return "unknown";
}

char LevelLetter(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Warning:
      return 'W';
    case LogLevel::Error:
      return 'E';
  }
  return '?';
}

void LogFormat(const PtzPlatform& platform, LogLevel level, LogEvent event,
               const char* fmt, ...) {
  char buffer[256];
  va_list args;
  va_start(args, fmt);
  const int len = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  if (len < 0) {
    platform.Log(level, event, fmt);
    return;
  }
  platform.Log(level, event, buffer);
}

}  // namespace pan_tilt
