#include "simulator_transport.hpp"

#include <algorithm>
#include <cmath>

#include "protocol.hpp"

namespace pan_tilt {

using protocol::Protocol;

namespace {

// Встроенные позиции пресетов 1..4, пока пользователь их не перезаписал
std::optional<std::pair<double, double>> BuiltinPreset(uint8_t id) {
  switch (id) {
    case 1:
      return std::pair{0.0, 0.0};
    case 2:
      return std::pair{90.0, 45.0};
    case 3:
      return std::pair{180.0, 0.0};
    case 4:
      return std::pair{270.0, -45.0};
    default:
      return std::nullopt;
  }
}

bool IsReservedPreset(uint8_t id) noexcept {
  switch (id) {
    case protocol::PRESET_PAN_ZERO:
    case protocol::PRESET_TILT_ZERO:
    case protocol::PRESET_CRUISE:
    case protocol::PRESET_LINE_SCAN_START:
    case protocol::PRESET_LINE_SCAN_END:
    case protocol::PRESET_LINE_SCAN_RUN:
    case protocol::PRESET_GUARD:
    case protocol::PRESET_FEEDBACK:
    case protocol::PRESET_FACTORY_A:
    case protocol::PRESET_FACTORY_B:
      return true;
    default:
      return false;
  }
}

/** Кратчайшая разность углов панорамы, (-180, 180]. */
double ShortestPanDelta(double from, double to) noexcept {
  double delta = std::fmod(to - from, 360.0);
  if (delta > 180.0) delta -= 360.0;
  if (delta <= -180.0) delta += 360.0;
  return delta;
}

}  // namespace

SimulatorTransport::SimulatorTransport(PtzPlatform& platform,
                                       ConnectionConfig config)
    : Transport(platform, config),
      options_(config.simulator),
      pan_deg_(Protocol::NormalizePan(config.simulator.initial_pan_deg)),
      tilt_deg_(Protocol::ClampTilt(config.simulator.initial_tilt_deg)) {}

SimulatorTransport::~SimulatorTransport() { Close(); }

// ─────────────────────────────────────────────────────────────────────────
// Наблюдение и управление моделью
// ─────────────────────────────────────────────────────────────────────────

SimulatorState SimulatorTransport::State() {
  std::lock_guard lock(mutex_);
  AdvanceLocked(platform_.GetTimeMs());
  return SimulatorState{.pan_deg = pan_deg_,
                        .tilt_deg = tilt_deg_,
                        .pan_velocity_dps = pan_velocity_dps_,
                        .tilt_velocity_dps = tilt_velocity_dps_,
                        .has_pan_target = pan_target_.has_value(),
                        .has_tilt_target = tilt_target_.has_value(),
                        .queries = queries_};
}

void SimulatorTransport::SetPosition(double pan_deg, double tilt_deg) {
  std::lock_guard lock(mutex_);
  last_update_ms_ = platform_.GetTimeMs();
  pan_deg_ = Protocol::NormalizePan(pan_deg);
  tilt_deg_ = Protocol::ClampTilt(tilt_deg);
  pan_velocity_dps_ = 0.0;
  tilt_velocity_dps_ = 0.0;
  pan_target_.reset();
  tilt_target_.reset();
}

void SimulatorTransport::SetStalled(bool stalled) {
  std::lock_guard lock(mutex_);
  AdvanceLocked(platform_.GetTimeMs());
  options_.stalled = stalled;
}

// ─────────────────────────────────────────────────────────────────────────
// Transport
// ─────────────────────────────────────────────────────────────────────────

TransportResult<bool> SimulatorTransport::DoOpen(
    const ConnectionConfig& config) {
  std::lock_guard lock(mutex_);
  options_ = config.simulator;
  open_ = true;
  last_update_ms_ = platform_.GetTimeMs();
  pending_.clear();
  return true;
}

void SimulatorTransport::DoClose() {
  std::lock_guard lock(mutex_);
  AdvanceLocked(platform_.GetTimeMs());
  pan_velocity_dps_ = 0.0;
  tilt_velocity_dps_ = 0.0;
  pending_.clear();
  open_ = false;
}

bool SimulatorTransport::DoIsOpen() const {
  std::lock_guard lock(mutex_);
  return open_;
}

TransportResult<size_t> SimulatorTransport::DoWrite(
    std::span<const uint8_t> data) {
  std::lock_guard lock(mutex_);
  if (!open_) {
    return TransportError::NotOpen;
  }
  AdvanceLocked(platform_.GetTimeMs());

  size_t i = 0;
  while (i + protocol::COMMAND_FRAME_SIZE <= data.size()) {
    if (data[i] != protocol::SYNC_BYTE) {
      ++i;
      continue;
    }
    ProcessFrameLocked(data.subspan(i, protocol::COMMAND_FRAME_SIZE));
    i += protocol::COMMAND_FRAME_SIZE;
  }
  return data.size();
}

TransportResult<size_t> SimulatorTransport::DoRead(std::span<uint8_t> buffer,
                                                   uint32_t timeout_ms) {
  {
    std::lock_guard lock(mutex_);
    if (!open_) {
      return TransportError::NotOpen;
    }
    AdvanceLocked(platform_.GetTimeMs());

    if (!pending_.empty()) {
      size_t n = std::min(buffer.size(), pending_.size());
      if (options_.max_chunk > 0) {
        n = std::min(n, options_.max_chunk);
      }
      std::copy_n(pending_.begin(), n, buffer.begin());
      pending_.erase(pending_.begin(),
                     pending_.begin() + static_cast<std::ptrdiff_t>(n));
      return n;
    }
  }

  // Ответа нет: ведём себя как реальный порт и ждём весь таймаут
  platform_.DelayMs(timeout_ms);
  return size_t{0};
}

// ─────────────────────────────────────────────────────────────────────────
// Модель
// ─────────────────────────────────────────────────────────────────────────

void SimulatorTransport::AdvanceLocked(uint64_t now_ms) {
  // dt может быть нулевым: мгновенная отработка цели от времени не зависит
  const double dt =
      now_ms > last_update_ms_
          ? static_cast<double>(now_ms - last_update_ms_) / 1000.0
          : 0.0;
  last_update_ms_ = std::max(last_update_ms_, now_ms);

  if (options_.stalled) {
    return;
  }

  const double max_step = options_.slew_deg_per_sec > 0.0
                              ? options_.slew_deg_per_sec * dt
                              : 360.0;

  if (pan_target_) {
    const double delta = ShortestPanDelta(pan_deg_, *pan_target_);
    if (std::fabs(delta) <= max_step) {
      pan_deg_ = *pan_target_;
      pan_target_.reset();
    } else {
      pan_deg_ = Protocol::NormalizePan(pan_deg_ + std::copysign(max_step, delta));
    }
  } else {
    pan_deg_ = Protocol::NormalizePan(pan_deg_ + pan_velocity_dps_ * dt);
  }

  if (tilt_target_) {
    const double delta = *tilt_target_ - tilt_deg_;
    if (std::fabs(delta) <= max_step) {
      tilt_deg_ = *tilt_target_;
      tilt_target_.reset();
    } else {
      tilt_deg_ += std::copysign(max_step, delta);
    }
  } else {
    tilt_deg_ = Protocol::ClampTilt(tilt_deg_ + tilt_velocity_dps_ * dt);
  }
}

void SimulatorTransport::SetTargetLocked(std::optional<double> pan_deg,
                                         std::optional<double> tilt_deg) {
  if (pan_deg) {
    pan_target_ = Protocol::NormalizePan(*pan_deg);
    pan_velocity_dps_ = 0.0;
  }
  if (tilt_deg) {
    tilt_target_ = Protocol::ClampTilt(*tilt_deg);
    tilt_velocity_dps_ = 0.0;
  }
}

void SimulatorTransport::ProcessFrameLocked(std::span<const uint8_t> frame) {
  const uint8_t address = frame[1];
  const uint8_t cmd1 = frame[2];
  const uint8_t cmd2 = frame[3];
  const uint8_t data1 = frame[4];
  const uint8_t data2 = frame[5];

  if (address != options_.address) {
    return;
  }
  if (Protocol::CalculateChecksum(frame.subspan(1, 5)) != frame[6]) {
    platform_.Log(LogLevel::Debug, LogEvent::Generic,
                  "SIM: frame with bad checksum ignored");
    return;
  }
  if (cmd1 != 0x00) {
    return;  // оптика: положение не меняется
  }

  const uint16_t value = static_cast<uint16_t>((data1 << 8) | data2);

  switch (cmd2) {
    case 0x00:
      pan_velocity_dps_ = 0.0;
      tilt_velocity_dps_ = 0.0;
      pan_target_.reset();
      tilt_target_.reset();
      break;

    case 0x02:
    case 0x04:
    case 0x08:
    case 0x10:
    case 0x0A:
    case 0x0C:
    case 0x12:
    case 0x14: {
      const double pan_sign = (cmd2 & 0x02) ? 1.0 : (cmd2 & 0x04) ? -1.0 : 0.0;
      const double tilt_sign = (cmd2 & 0x08) ? 1.0 : (cmd2 & 0x10) ? -1.0 : 0.0;
      constexpr double kMax = protocol::MAX_SPEED;
      const double pan_norm = std::min(data1, protocol::MAX_SPEED) / kMax;
      const double tilt_norm = std::min(data2, protocol::MAX_SPEED) / kMax;
      pan_target_.reset();
      tilt_target_.reset();
      pan_velocity_dps_ = pan_sign * pan_norm * options_.pan_deg_per_sec;
      tilt_velocity_dps_ = tilt_sign * tilt_norm * options_.tilt_deg_per_sec;
      break;
    }

    case 0x4B:
      SetTargetLocked(Protocol::DecodePanRaw(value), std::nullopt);
      break;

    case 0x4D:
      SetTargetLocked(std::nullopt, Protocol::DecodeTiltRaw(value));
      break;

    case 0x51:
    case 0x53: {
      ++queries_;
      if (options_.drop_every != 0 && queries_ % options_.drop_every == 0) {
        break;
      }
      if (cmd2 == 0x51) {
        QueueResponseLocked(protocol::TAG_PAN_POSITION,
                            Protocol::EncodePanAngle(pan_deg_));
      } else {
        QueueResponseLocked(protocol::TAG_TILT_POSITION,
                            Protocol::EncodeTiltAngle(tilt_deg_));
      }
      break;
    }

    case 0x03:
      if (!IsReservedPreset(data2)) {
        presets_[data2] = {pan_deg_, tilt_deg_};
      }
      break;

    case 0x07: {
      if (IsReservedPreset(data2)) {
        break;
      }
      std::optional<std::pair<double, double>> target;
      if (auto it = presets_.find(data2); it != presets_.end()) {
        target = it->second;
      } else {
        target = BuiltinPreset(data2);
      }
      if (target) {
        SetTargetLocked(target->first, target->second);
      }
      break;
    }

    case 0x05:
      presets_.erase(data2);
      break;

    default:
      break;
  }
}

void SimulatorTransport::QueueResponseLocked(uint8_t tag, uint16_t raw) {
  const uint8_t msb = static_cast<uint8_t>(raw >> 8);
  const uint8_t lsb = static_cast<uint8_t>(raw & 0xFF);
  const uint8_t quirk = options_.checksum_quirk ? 1 : 0;

  if (options_.format == SimResponseFormat::Standard7Byte) {
    const uint8_t covered[] = {options_.address, 0x00, tag, msb, lsb};
    const uint8_t sum =
        static_cast<uint8_t>(Protocol::CalculateChecksum(covered) + quirk);
    pending_.insert(pending_.end(), {protocol::SYNC_BYTE, options_.address,
                                     0x00, tag, msb, lsb, sum});
    return;
  }

  const uint8_t covered[] = {tag, msb, lsb};
  const uint8_t sum =
      static_cast<uint8_t>(Protocol::CalculateChecksum(covered) + quirk);
  pending_.insert(pending_.end(), {uint8_t{0x00}, tag, msb, lsb, sum});
}

}  // namespace pan_tilt
