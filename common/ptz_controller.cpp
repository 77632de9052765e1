#include "ptz_controller.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace pan_tilt {

using protocol::Command;
using protocol::Operation;
using protocol::Protocol;
using protocol::ResponseKind;

const char* ToString(ControllerError error) noexcept {
  switch (error) {
    case ControllerError::NotInitialized:
      return "not initialized";
    case ControllerError::TransportFailed:
      return "transport failed";
  }
  return "unknown";
}

namespace {

const char* AxisName(ResponseKind kind) noexcept {
  return kind == ResponseKind::PanPosition ? "pan" : "tilt";
}

Operation ToOperation(Direction direction) noexcept {
  switch (direction) {
    case Direction::Up:
      return Operation::Up;
    case Direction::Down:
      return Operation::Down;
    case Direction::Left:
      return Operation::Left;
    case Direction::Right:
      return Operation::Right;
    case Direction::LeftUp:
      return Operation::LeftUp;
    case Direction::LeftDown:
      return Operation::LeftDown;
    case Direction::RightUp:
      return Operation::RightUp;
    case Direction::RightDown:
      return Operation::RightDown;
  }
  return Operation::Stop;
}

/** Угловое расстояние по панораме, [0, 180]. */
double PanDistance(double a, double b) noexcept {
  double diff = std::fabs(a - b);
  if (diff > 180.0) {
    diff = 360.0 - diff;
  }
  return diff;
}

}  // namespace

PtzController::PtzController(PtzPlatform& platform, Transport& transport,
                             ControllerConfig config)
    : platform_(platform), transport_(transport), config_(config) {}

// ═══════════════════════════════════════════════════════════════════════════
// Жизненный цикл
// ═══════════════════════════════════════════════════════════════════════════

Result<bool, ControllerError> PtzController::Init() {
  auto opened = transport_.Open();
  if (IsError(opened)) {
    LogFormat(platform_, LogLevel::Error, LogEvent::TransportOpenFailed,
              "Controller init failed: %s", ToString(GetError(opened)));
    return ControllerError::TransportFailed;
  }

  {
    auto bus = transport_.AcquireBus();
    transport_.FlushInput(config::TransportConfig::kFlushMaxBytes,
                          config::TransportConfig::kFlushTimeoutMs);
  }

  platform_.Log(LogLevel::Info, LogEvent::Generic, "Zeroing pan and tilt");
  SendZeroPointCommands();

  const AxisReading pan = QueryAxis(Operation::QueryPan, ResponseKind::PanPosition);
  const AxisReading tilt =
      QueryAxis(Operation::QueryTilt, ResponseKind::TiltPosition);
  {
    std::lock_guard lock(zero_mutex_);
    zero_ = ZeroPoint{.pan_deg = pan.angle_deg, .tilt_deg = tilt.angle_deg};
  }
  LogFormat(platform_, LogLevel::Info, LogEvent::ZeroPointCaptured,
            "Zero point: pan %.2f, tilt %.2f", pan.angle_deg, tilt.angle_deg);

  initialized_ = true;
  return true;
}

void PtzController::Close() {
  initialized_ = false;
  transport_.Close();
}

// ═══════════════════════════════════════════════════════════════════════════
// Отправка команд
// ═══════════════════════════════════════════════════════════════════════════

bool PtzController::Send(const Command& cmd) {
  const auto frame = Protocol::Encode(cmd, config_.address);
  auto result = transport_.Send(frame.Bytes());
  if (IsError(result)) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::CommandFailed,
              "Send failed (%s): %s", ToString(GetError(result)),
              protocol::Describe(frame).c_str());
    return false;
  }
  return true;
}

bool PtzController::Move(Direction direction, uint8_t pan_speed,
                         uint8_t tilt_speed) {
  return Send(Command{.op = ToOperation(direction),
                      .pan_speed = Protocol::ClampSpeed(pan_speed),
                      .tilt_speed = Protocol::ClampSpeed(tilt_speed)});
}

bool PtzController::MoveUp(uint8_t speed) {
  return Move(Direction::Up, 0, speed);
}

bool PtzController::MoveDown(uint8_t speed) {
  return Move(Direction::Down, 0, speed);
}

bool PtzController::MoveLeft(uint8_t speed) {
  return Move(Direction::Left, speed, 0);
}

bool PtzController::MoveRight(uint8_t speed) {
  return Move(Direction::Right, speed, 0);
}

bool PtzController::Stop() { return Send(Command{.op = Operation::Stop}); }

bool PtzController::SetPreset(uint8_t id) {
  return Send(Command{.op = Operation::SetPreset, .id = id});
}

bool PtzController::CallPreset(uint8_t id) {
  return Send(Command{.op = Operation::CallPreset, .id = id});
}

bool PtzController::ClearPreset(uint8_t id) {
  return Send(Command{.op = Operation::ClearPreset, .id = id});
}

bool PtzController::AuxOn(uint8_t id) {
  return Send(Command{.op = Operation::AuxOn, .id = id});
}

bool PtzController::AuxOff(uint8_t id) {
  return Send(Command{.op = Operation::AuxOff, .id = id});
}

bool PtzController::ZoomIn() { return Send(Command{.op = Operation::ZoomIn}); }
bool PtzController::ZoomOut() { return Send(Command{.op = Operation::ZoomOut}); }
bool PtzController::FocusFar() { return Send(Command{.op = Operation::FocusFar}); }
bool PtzController::FocusNear() {
  return Send(Command{.op = Operation::FocusNear});
}
bool PtzController::IrisOpen() { return Send(Command{.op = Operation::IrisOpen}); }
bool PtzController::IrisClose() {
  return Send(Command{.op = Operation::IrisClose});
}

bool PtzController::RemoteReset() {
  return Send(Command{.op = Operation::RemoteReset});
}

bool PtzController::StartCruise() {
  return Send(Command{.op = Operation::StartCruise});
}

bool PtzController::SetLineScanStart() {
  return Send(Command{.op = Operation::SetLineScanStart});
}

bool PtzController::SetLineScanEnd() {
  return Send(Command{.op = Operation::SetLineScanEnd});
}

bool PtzController::RunLineScan() {
  return Send(Command{.op = Operation::RunLineScan});
}

bool PtzController::SetGuard(bool enable) {
  return Send(Command{.op = enable ? Operation::EnableGuard
                                   : Operation::DisableGuard});
}

bool PtzController::SetRealtimeFeedback(bool enable) {
  return Send(Command{.op = enable ? Operation::EnableFeedback
                                   : Operation::DisableFeedback});
}

bool PtzController::SendZeroPointCommands() {
  const bool pan_ok = Send(Command{.op = Operation::SetPanZero});
  platform_.DelayMs(config::MotionConfig::kZeroCommandDelayMs);
  const bool tilt_ok = Send(Command{.op = Operation::SetTiltZero});
  platform_.DelayMs(config::MotionConfig::kZeroCommandDelayMs);
  return pan_ok && tilt_ok;
}

bool PtzController::FactoryDefault() {
  bool all_sent = true;
  const auto frames = Protocol::FactoryDefaultSequence(config_.address);
  for (size_t i = 0; i < frames.size(); ++i) {
    if (i > 0) {
      platform_.DelayMs(config::MotionConfig::kFactoryStepDelayMs);
    }
    auto result = transport_.Send(frames[i].Bytes());
    if (IsError(result)) {
      LogFormat(platform_, LogLevel::Warning, LogEvent::CommandFailed,
                "Factory default step %zu failed: %s", i + 1,
                ToString(GetError(result)));
      all_sent = false;
    }
  }
  return all_sent;
}

// ═══════════════════════════════════════════════════════════════════════════
// Приём ответа
// ═══════════════════════════════════════════════════════════════════════════

std::optional<protocol::ParsedResponse> PtzController::ReadResponse(
    uint32_t timeout_ms) {
  const uint64_t deadline = platform_.GetTimeMs() + timeout_ms;

  auto first = transport_.Receive(config::ProtocolConfig::kMaxResponseSize,
                                  timeout_ms);
  if (IsError(first)) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::ReceiveTimeout,
              "No response: %s", ToString(GetError(first)));
    return std::nullopt;
  }

  Bytes buffer = std::move(GetValue(first));
  // Длина кадра определяется первым байтом
  const size_t expected = Protocol::ExpectedResponseSize(buffer.front());

  while (buffer.size() < expected) {
    const uint64_t now = platform_.GetTimeMs();
    if (now >= deadline) {
      break;
    }
    auto chunk = transport_.Receive(expected - buffer.size(),
                                    static_cast<uint32_t>(deadline - now));
    if (IsError(chunk)) {
      break;
    }
    const Bytes& bytes = GetValue(chunk);
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
  }

  if (buffer.size() < expected) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::PartialFrame,
              "Expected %zu bytes, got %zu: %s", expected, buffer.size(),
              protocol::FormatHex(buffer).c_str());
    return std::nullopt;
  }
  if (buffer.size() > expected) {
    LogFormat(platform_, LogLevel::Debug, LogEvent::Generic,
              "Dropping %zu trailing bytes", buffer.size() - expected);
    buffer.resize(expected);
  }

  auto decoded = Protocol::Decode(buffer);
  if (IsError(decoded)) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::DecodeFailed,
              "Cannot decode %s: %s", protocol::FormatHex(buffer).c_str(),
              protocol::ToString(GetError(decoded)));
    return std::nullopt;
  }

  const protocol::ParsedResponse& parsed = GetValue(decoded);
  switch (parsed.checksum) {
    case protocol::ChecksumStatus::Mismatch:
      LogFormat(platform_, LogLevel::Warning, LogEvent::ChecksumMismatch,
                "Checksum mismatch in %s (expected %02X)",
                protocol::FormatHex(buffer).c_str(), parsed.expected_checksum);
      return std::nullopt;
    case protocol::ChecksumStatus::Quirk:
      LogFormat(platform_, LogLevel::Debug, LogEvent::ChecksumQuirk,
                "Checksum +1 accepted in %s",
                protocol::FormatHex(buffer).c_str());
      break;
    case protocol::ChecksumStatus::Exact:
      break;
  }
  return parsed;
}

PtzController::AxisReading PtzController::QueryAxis(Operation query,
                                                    ResponseKind expected) {
  return QueryAxis(query, expected, config_.response_timeout_ms);
}

PtzController::AxisReading PtzController::QueryAxis(Operation query,
                                                    ResponseKind expected,
                                                    uint32_t timeout_ms) {
  auto bus = transport_.AcquireBus();

  if (!Send(Command{.op = query})) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::QueryFailed,
              "Query %s: send failed, reporting 0.0", AxisName(expected));
    return {};
  }

  const auto response = ReadResponse(timeout_ms);
  if (!response) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::QueryFailed,
              "Query %s: no valid response, reporting 0.0", AxisName(expected));
    return {};
  }
  if (response->kind != expected) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::UnexpectedResponse,
              "Query %s: unexpected response type, reporting 0.0",
              AxisName(expected));
    return {};
  }

  return AxisReading{.angle_deg = response->angle_deg,
                     .raw = response->raw,
                     .ok = true};
}

// ═══════════════════════════════════════════════════════════════════════════
// Запросы позиции
// ═══════════════════════════════════════════════════════════════════════════

double PtzController::QueryPanPosition() {
  return QueryAxis(Operation::QueryPan, ResponseKind::PanPosition).angle_deg;
}

double PtzController::QueryTiltPosition() {
  return QueryAxis(Operation::QueryTilt, ResponseKind::TiltPosition).angle_deg;
}

Position PtzController::QueryPosition() {
  auto bus = transport_.AcquireBus();
  const AxisReading pan = QueryAxis(Operation::QueryPan, ResponseKind::PanPosition);
  const AxisReading tilt =
      QueryAxis(Operation::QueryTilt, ResponseKind::TiltPosition);
  return Position{.pan_deg = pan.angle_deg,
                  .tilt_deg = tilt.angle_deg,
                  .raw_pan = pan.raw,
                  .raw_tilt = tilt.raw};
}

// ═══════════════════════════════════════════════════════════════════════════
// Абсолютное позиционирование
// ═══════════════════════════════════════════════════════════════════════════

PanDirection PtzController::SelectPanDirection(double current_deg,
                                               double target_deg) noexcept {
  const double diff = target_deg - current_deg;
  if (diff == 0.0) {
    return PanDirection::None;
  }
  const bool clockwise = diff > 0.0;
  // Длинная дуга: идём в обратную сторону через 0/360
  if (std::fabs(diff) > 180.0) {
    return clockwise ? PanDirection::CounterClockwise : PanDirection::Clockwise;
  }
  return clockwise ? PanDirection::Clockwise : PanDirection::CounterClockwise;
}

MoveResult PtzController::AbsolutePan(double angle_deg) {
  return AbsolutePan(angle_deg, config_.blocking);
}

MoveResult PtzController::AbsolutePan(double angle_deg, bool blocking) {
  MoveResult result{.target_deg = Protocol::NormalizePan(angle_deg),
                    .blocking = blocking};

  if (blocking) {
    const AxisReading start =
        QueryAxis(Operation::QueryPan, ResponseKind::PanPosition);
    if (start.ok) {
      result.direction = SelectPanDirection(start.angle_deg, result.target_deg);
    }
  }

  Send(Command{.op = Operation::AbsolutePan, .angle_deg = result.target_deg});

  if (!blocking) {
    result.final_deg = result.target_deg;
    return result;
  }
  return WaitForAxis(Operation::QueryPan, ResponseKind::PanPosition, result);
}

MoveResult PtzController::AbsoluteTilt(double angle_deg) {
  return AbsoluteTilt(angle_deg, config_.blocking);
}

MoveResult PtzController::AbsoluteTilt(double angle_deg, bool blocking) {
  MoveResult result{.target_deg = Protocol::ClampTilt(angle_deg),
                    .blocking = blocking};

  Send(Command{.op = Operation::AbsoluteTilt, .angle_deg = result.target_deg});

  if (!blocking) {
    result.final_deg = result.target_deg;
    return result;
  }
  return WaitForAxis(Operation::QueryTilt, ResponseKind::TiltPosition, result);
}

MoveResult PtzController::WaitForAxis(Operation query, ResponseKind expected,
                                      MoveResult result) {
  const bool is_pan = expected == ResponseKind::PanPosition;
  const uint64_t start = platform_.GetTimeMs();
  std::optional<double> last;

  while (platform_.GetTimeMs() - start < config_.max_wait_ms) {
    const AxisReading reading = QueryAxis(query, expected);
    if (reading.ok) {
      last = reading.angle_deg;
      const double diff =
          is_pan ? PanDistance(reading.angle_deg, result.target_deg)
                 : std::fabs(reading.angle_deg - result.target_deg);
      if (diff <= config_.tolerance_deg) {
        result.reached = true;
        break;
      }
    }
    platform_.DelayMs(config_.poll_interval_ms);
  }

  result.final_deg = last.value_or(0.0);
  result.elapsed_ms = static_cast<uint32_t>(platform_.GetTimeMs() - start);

  if (result.reached) {
    LogFormat(platform_, LogLevel::Info, LogEvent::BlockingWaitReached,
              "Reached %s %.2f (target %.2f) in %u ms", AxisName(expected),
              result.final_deg, result.target_deg, result.elapsed_ms);
  } else {
    LogFormat(platform_, LogLevel::Warning, LogEvent::BlockingWaitTimeout,
              "%s did not reach %.2f within %u ms, last %.2f",
              AxisName(expected), result.target_deg, config_.max_wait_ms,
              result.final_deg);
  }
  return result;
}

bool PtzController::WaitForSettled(uint32_t stable_ms, uint32_t max_wait_ms) {
  const uint64_t start = platform_.GetTimeMs();
  std::optional<Position> previous;
  uint64_t stable_since = start;

  while (platform_.GetTimeMs() - start < max_wait_ms) {
    const Position current = QueryPosition();
    const uint64_t now = platform_.GetTimeMs();
    if (previous &&
        PanDistance(current.pan_deg, previous->pan_deg) <= config_.tolerance_deg &&
        std::fabs(current.tilt_deg - previous->tilt_deg) <= config_.tolerance_deg) {
      if (now - stable_since >= stable_ms) {
        return true;
      }
    } else {
      stable_since = now;
    }
    previous = current;
    platform_.DelayMs(config_.poll_interval_ms);
  }

  LogFormat(platform_, LogLevel::Warning, LogEvent::BlockingWaitTimeout,
            "Device did not settle within %u ms", max_wait_ms);
  return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Программный ноль
// ═══════════════════════════════════════════════════════════════════════════

RelativePosition PtzController::ReadRelativeLocked(uint32_t timeout_ms) {
  const AxisReading pan =
      QueryAxis(Operation::QueryPan, ResponseKind::PanPosition, timeout_ms);
  const AxisReading tilt =
      QueryAxis(Operation::QueryTilt, ResponseKind::TiltPosition, timeout_ms);
  return MakeRelative(pan, tilt);
}

RelativePosition PtzController::MakeRelative(const AxisReading& pan,
                                             const AxisReading& tilt) const {
  const ZeroPoint zero = GetZeroPoint();

  RelativePosition out;
  out.absolute = Position{.pan_deg = pan.angle_deg,
                          .tilt_deg = tilt.angle_deg,
                          .raw_pan = pan.raw,
                          .raw_tilt = tilt.raw};
  out.pan_deg = pan.angle_deg - zero.pan_deg;
  out.tilt_deg = tilt.angle_deg - zero.tilt_deg;
  out.status.pan_valid = pan.angle_deg != 0.0;
  out.status.tilt_valid = tilt.raw != 0 || tilt.angle_deg != 0.0;
  return out;
}

RelativePosition PtzController::GetRelativePosition() {
  auto bus = transport_.AcquireBus();
  return ReadRelativeLocked(config_.response_timeout_ms);
}

std::optional<RelativePosition> PtzController::TryGetRelativePosition(
    uint32_t budget_ms, uint32_t response_timeout_ms) {
  auto bus = transport_.TryAcquireBus(budget_ms);
  if (!bus.owns_lock()) {
    return std::nullopt;
  }

  // Обе оси укладываются в один response_timeout_ms
  const uint64_t started = platform_.GetTimeMs();
  const AxisReading pan = QueryAxis(Operation::QueryPan,
                                    ResponseKind::PanPosition,
                                    response_timeout_ms);
  const uint64_t spent = platform_.GetTimeMs() - started;
  const uint32_t left =
      spent < response_timeout_ms
          ? static_cast<uint32_t>(response_timeout_ms - spent)
          : 0;
  AxisReading tilt;
  if (left > 0) {
    tilt = QueryAxis(Operation::QueryTilt, ResponseKind::TiltPosition, left);
  } else {
    LogFormat(platform_, LogLevel::Warning, LogEvent::QueryFailed,
              "Query tilt skipped: %u ms spent on pan, reporting 0.0",
              response_timeout_ms);
  }
  return MakeRelative(pan, tilt);
}

bool PtzController::SetHome() {
  AxisReading pan;
  AxisReading tilt;
  {
    auto bus = transport_.AcquireBus();
    pan = QueryAxis(Operation::QueryPan, ResponseKind::PanPosition);
    tilt = QueryAxis(Operation::QueryTilt, ResponseKind::TiltPosition);
  }

  ZeroPoint zero;
  {
    std::lock_guard lock(zero_mutex_);
    if (pan.ok) zero_.pan_deg = pan.angle_deg;
    if (tilt.ok) zero_.tilt_deg = tilt.angle_deg;
    zero = zero_;
  }

  if (!pan.ok || !tilt.ok) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::HomeCaptureFailed,
              "Home capture incomplete (pan %s, tilt %s)",
              pan.ok ? "ok" : "failed", tilt.ok ? "ok" : "failed");
    return false;
  }
  LogFormat(platform_, LogLevel::Info, LogEvent::ZeroPointCaptured,
            "Home set: pan %.2f, tilt %.2f", zero.pan_deg, zero.tilt_deg);
  return true;
}

ZeroPoint PtzController::GetZeroPoint() const {
  std::lock_guard lock(zero_mutex_);
  return zero_;
}

}  // namespace pan_tilt
