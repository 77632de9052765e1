#include "protocol.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pan_tilt::protocol {

namespace {

struct Opcode {
  uint8_t cmd1;
  uint8_t cmd2;
};

// Пара cmd1/cmd2 для каждой операции
Opcode OpcodeFor(Operation op) noexcept {
  switch (op) {
    case Operation::Stop:
      return {0x00, 0x00};
    case Operation::Up:
      return {0x00, 0x08};
    case Operation::Down:
      return {0x00, 0x10};
    case Operation::Left:
      return {0x00, 0x04};
    case Operation::Right:
      return {0x00, 0x02};
    case Operation::LeftUp:
      return {0x00, 0x0C};
    case Operation::LeftDown:
      return {0x00, 0x14};
    case Operation::RightUp:
      return {0x00, 0x0A};
    case Operation::RightDown:
      return {0x00, 0x12};
    case Operation::SetPreset:
    case Operation::SetPanZero:
    case Operation::SetTiltZero:
    case Operation::SetLineScanStart:
    case Operation::SetLineScanEnd:
    case Operation::EnableGuard:
    case Operation::EnableFeedback:
      return {0x00, 0x03};
    case Operation::CallPreset:
    case Operation::StartCruise:
    case Operation::RunLineScan:
    case Operation::DisableGuard:
    case Operation::DisableFeedback:
      return {0x00, 0x07};
    case Operation::ClearPreset:
      return {0x00, 0x05};
    case Operation::QueryPan:
      return {0x00, 0x51};
    case Operation::QueryTilt:
      return {0x00, 0x53};
    case Operation::AbsolutePan:
      return {0x00, 0x4B};
    case Operation::AbsoluteTilt:
      return {0x00, 0x4D};
    case Operation::AuxOn:
      return {0x00, 0x09};
    case Operation::AuxOff:
      return {0x00, 0x0B};
    case Operation::ZoomIn:
      return {0x00, 0x20};
    case Operation::ZoomOut:
      return {0x00, 0x40};
    case Operation::FocusFar:
      return {0x00, 0x80};
    case Operation::FocusNear:
      return {0x01, 0x00};
    case Operation::IrisOpen:
      return {0x02, 0x00};
    case Operation::IrisClose:
      return {0x04, 0x00};
    case Operation::RemoteReset:
      return {0x00, 0x0F};
  }
  return {0x00, 0x00};
}

// id для операций, реализованных через зарезервированные пресеты
uint8_t ReservedPresetFor(Operation op, uint8_t fallback) noexcept {
  switch (op) {
    case Operation::SetPanZero:
      return PRESET_PAN_ZERO;
    case Operation::SetTiltZero:
      return PRESET_TILT_ZERO;
    case Operation::StartCruise:
      return PRESET_CRUISE;
    case Operation::SetLineScanStart:
      return PRESET_LINE_SCAN_START;
    case Operation::SetLineScanEnd:
      return PRESET_LINE_SCAN_END;
    case Operation::RunLineScan:
      return PRESET_LINE_SCAN_RUN;
    case Operation::EnableGuard:
    case Operation::DisableGuard:
      return PRESET_GUARD;
    case Operation::EnableFeedback:
    case Operation::DisableFeedback:
      return PRESET_FEEDBACK;
    default:
      return fallback;
  }
}

uint16_t ReadBigEndian(uint8_t msb, uint8_t lsb) noexcept {
  return static_cast<uint16_t>((msb << 8) | lsb);
}

ResponseKind KindForTag(uint8_t tag) noexcept {
  if (tag == TAG_PAN_POSITION) return ResponseKind::PanPosition;
  if (tag == TAG_TILT_POSITION) return ResponseKind::TiltPosition;
  return ResponseKind::Unknown;
}

void FillPosition(ParsedResponse& out, uint8_t data1, uint8_t data2) noexcept {
  out.raw = ReadBigEndian(data1, data2);
  if (out.kind == ResponseKind::PanPosition) {
    out.angle_deg = Protocol::DecodePanRaw(out.raw);
  } else if (out.kind == ResponseKind::TiltPosition) {
    out.angle_deg = Protocol::DecodeTiltRaw(out.raw);
  }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// CommandFrame
// ═══════════════════════════════════════════════════════════════════════════

CommandFrame::CommandFrame(uint8_t address, uint8_t cmd1, uint8_t cmd2,
                           uint8_t data1, uint8_t data2) noexcept
    : address_(address),
      cmd1_(cmd1),
      cmd2_(cmd2),
      data1_(data1),
      data2_(data2) {
  const uint8_t covered[] = {address, cmd1, cmd2, data1, data2};
  checksum_ = Protocol::CalculateChecksum(covered);
}

std::array<uint8_t, COMMAND_FRAME_SIZE> CommandFrame::Bytes() const noexcept {
  return {SYNC_BYTE, address_, cmd1_, cmd2_, data1_, data2_, checksum_};
}

// ═══════════════════════════════════════════════════════════════════════════
// Protocol - кодирование
// ═══════════════════════════════════════════════════════════════════════════

CommandFrame Protocol::Encode(const Command& cmd, uint8_t address) noexcept {
  const Opcode opcode = OpcodeFor(cmd.op);
  const uint8_t pan_speed = std::min(cmd.pan_speed, MAX_SPEED);
  const uint8_t tilt_speed = std::min(cmd.tilt_speed, MAX_SPEED);

  uint8_t data1 = 0;
  uint8_t data2 = 0;

  switch (cmd.op) {
    case Operation::Left:
    case Operation::Right:
      data1 = pan_speed;
      break;
    case Operation::Up:
    case Operation::Down:
      data2 = tilt_speed;
      break;
    case Operation::LeftUp:
    case Operation::LeftDown:
    case Operation::RightUp:
    case Operation::RightDown:
      data1 = pan_speed;
      data2 = tilt_speed;
      break;
    case Operation::AbsolutePan: {
      const uint16_t raw = EncodePanAngle(cmd.angle_deg);
      data1 = static_cast<uint8_t>(raw >> 8);
      data2 = static_cast<uint8_t>(raw & 0xFF);
      break;
    }
    case Operation::AbsoluteTilt: {
      const uint16_t raw = EncodeTiltAngle(cmd.angle_deg);
      data1 = static_cast<uint8_t>(raw >> 8);
      data2 = static_cast<uint8_t>(raw & 0xFF);
      break;
    }
    case Operation::SetPreset:
    case Operation::CallPreset:
    case Operation::ClearPreset:
    case Operation::AuxOn:
    case Operation::AuxOff:
      data2 = cmd.id;
      break;
    default:
      data2 = ReservedPresetFor(cmd.op, 0);
      break;
  }

  return CommandFrame(address, opcode.cmd1, opcode.cmd2, data1, data2);
}

std::array<CommandFrame, 4> Protocol::FactoryDefaultSequence(
    uint8_t address) noexcept {
  return {CommandFrame(address, 0x00, 0x03, 0x00, PRESET_FACTORY_A),
          CommandFrame(address, 0x00, 0x07, 0x00, PRESET_FACTORY_A),
          CommandFrame(address, 0x00, 0x03, 0x00, PRESET_FACTORY_B),
          CommandFrame(address, 0x00, 0x07, 0x00, PRESET_FACTORY_B)};
}

// ═══════════════════════════════════════════════════════════════════════════
// Protocol - разбор ответов
// ═══════════════════════════════════════════════════════════════════════════

DecodeResult<ParsedResponse> Protocol::Decode(
    std::span<const uint8_t> buffer) noexcept {
  if (buffer.empty()) {
    return DecodeError::Empty;
  }

  ParsedResponse out;

  if (buffer.size() == VENDOR_RESPONSE_SIZE) {
    Vendor5Byte frame{.lead = buffer[0],
                      .tag = buffer[1],
                      .data1 = buffer[2],
                      .data2 = buffer[3],
                      .checksum = buffer[4]};
    out.kind = KindForTag(frame.tag);
    if (out.kind == ResponseKind::Unknown) {
      return DecodeError::UnrecognizedTag;
    }
    // Сумма считается от тега, ведущий байт не входит
    const auto covered = buffer.subspan(1, 3);
    out.expected_checksum = CalculateChecksum(covered);
    out.checksum = CheckChecksum(covered, frame.checksum);
    FillPosition(out, frame.data1, frame.data2);
    out.frame = frame;
    return out;
  }

  if (buffer.size() == STANDARD_RESPONSE_SIZE && buffer[0] == SYNC_BYTE) {
    Standard7Byte frame{.address = buffer[1],
                        .cmd1 = buffer[2],
                        .cmd2 = buffer[3],
                        .data1 = buffer[4],
                        .data2 = buffer[5],
                        .checksum = buffer[6]};
    const auto covered = buffer.subspan(1, 5);
    out.expected_checksum = CalculateChecksum(covered);
    out.checksum = CheckChecksum(covered, frame.checksum);
    out.kind = KindForTag(frame.cmd2);
    FillPosition(out, frame.data1, frame.data2);
    out.frame = frame;
    return out;
  }

  return DecodeError::MalformedLength;
}

uint8_t Protocol::CalculateChecksum(std::span<const uint8_t> bytes) noexcept {
  unsigned sum = 0;
  for (uint8_t b : bytes) {
    sum += b;
  }
  return static_cast<uint8_t>(sum & 0xFF);
}

ChecksumStatus Protocol::CheckChecksum(std::span<const uint8_t> covered,
                                       uint8_t received) noexcept {
  const int calc = CalculateChecksum(covered);
  if (received == calc) {
    return ChecksumStatus::Exact;
  }
  // Прошивка иногда отдаёт сумму +1; переход 0xFF -> 0x00 не считается
  if (received == calc + 1) {
    return ChecksumStatus::Quirk;
  }
  return ChecksumStatus::Mismatch;
}

// ═══════════════════════════════════════════════════════════════════════════
// Углы
// ═══════════════════════════════════════════════════════════════════════════

uint16_t Protocol::EncodePanAngle(double angle_deg) noexcept {
  if (!std::isfinite(angle_deg)) {
    return 0;
  }
  long raw = std::lround(angle_deg * 100.0) % RAW_FULL_TURN;
  if (raw < 0) {
    raw += RAW_FULL_TURN;
  }
  return static_cast<uint16_t>(raw);
}

uint16_t Protocol::EncodeTiltAngle(double angle_deg) noexcept {
  const double clamped = ClampTilt(angle_deg);
  if (clamped >= 0.0) {
    return static_cast<uint16_t>(RAW_FULL_TURN - std::lround(clamped * 100.0));
  }
  return static_cast<uint16_t>(std::lround(-clamped * 100.0));
}

double Protocol::DecodeTiltRaw(uint16_t raw) noexcept {
  if (raw > RAW_TILT_SPLIT) {
    return static_cast<double>(RAW_FULL_TURN - raw) / 100.0;
  }
  return -static_cast<double>(raw) / 100.0;
}

double Protocol::NormalizePan(double angle_deg) noexcept {
  if (!std::isfinite(angle_deg)) {
    return 0.0;
  }
  double normalized = std::fmod(angle_deg, 360.0);
  if (normalized < 0.0) {
    normalized += 360.0;
  }
  // fmod(-1e-12) + 360 округляется до 360.0
  if (normalized >= 360.0) {
    normalized = 0.0;
  }
  return normalized;
}

double Protocol::ClampTilt(double angle_deg) noexcept {
  if (std::isnan(angle_deg)) {
    return 0.0;
  }
  return std::clamp(angle_deg, TILT_MIN_DEG, TILT_MAX_DEG);
}

uint8_t Protocol::ClampSpeed(int speed) noexcept {
  return static_cast<uint8_t>(std::clamp(speed, 0, static_cast<int>(MAX_SPEED)));
}

// ═══════════════════════════════════════════════════════════════════════════
// Форматирование
// ═══════════════════════════════════════════════════════════════════════════

std::string FormatHex(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  char buf[4];
  for (size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(buf, sizeof(buf), i == 0 ? "%02X" : " %02X", bytes[i]);
    out += buf;
  }
  return out;
}

namespace {

const char* DirectionName(uint8_t cmd2) noexcept {
  switch (cmd2 & 0x1E) {
    case 0x02:
      return "Right";
    case 0x04:
      return "Left";
    case 0x08:
      return "Up";
    case 0x10:
      return "Down";
    case 0x0A:
      return "Right-Up";
    case 0x12:
      return "Right-Down";
    case 0x0C:
      return "Left-Up";
    case 0x14:
      return "Left-Down";
    default:
      return nullptr;
  }
}

std::string DescribePresetFamily(uint8_t cmd2, uint8_t id) {
  char buf[64];
  const bool set = cmd2 == 0x03;
  switch (id) {
    case PRESET_PAN_ZERO:
      if (set) return "ZERO: Set pan zero";
      break;
    case PRESET_TILT_ZERO:
      if (set) return "ZERO: Set tilt zero";
      break;
    case PRESET_CRUISE:
      if (!set) return "CRUISE: Start";
      break;
    case PRESET_LINE_SCAN_START:
      if (set) return "LINE SCAN: Set start";
      break;
    case PRESET_LINE_SCAN_END:
      if (set) return "LINE SCAN: Set end";
      break;
    case PRESET_LINE_SCAN_RUN:
      if (!set) return "LINE SCAN: Run";
      break;
    case PRESET_GUARD:
      return set ? "GUARD: Enable" : "GUARD: Disable";
    case PRESET_FEEDBACK:
      return set ? "FEEDBACK: Enable" : "FEEDBACK: Disable";
    case PRESET_FACTORY_A:
    case PRESET_FACTORY_B:
      return "FACTORY DEFAULT: Step";
    default:
      break;
  }
  std::snprintf(buf, sizeof(buf), "PRESET: %s %u", set ? "Set" : "Call",
                static_cast<unsigned>(id));
  return buf;
}

}  // namespace

std::string Describe(const CommandFrame& frame) {
  char buf[96];
  const uint8_t cmd1 = frame.Cmd1();
  const uint8_t cmd2 = frame.Cmd2();
  std::string action;

  if (cmd1 == 0x00 && cmd2 == 0x00 && frame.Data1() == 0 &&
      frame.Data2() == 0) {
    action = "STOP";
  } else if (cmd1 != 0x00) {
    if (cmd1 & 0x01) action = "OPTICAL: Focus near";
    else if (cmd1 & 0x02) action = "OPTICAL: Iris open";
    else if (cmd1 & 0x04) action = "OPTICAL: Iris close";
    else action = "UNKNOWN";
  } else {
    switch (cmd2) {
      case 0x4B:
        std::snprintf(buf, sizeof(buf), "ABSOLUTE: Pan to %.2f deg",
                      Protocol::DecodePanRaw(frame.Value()));
        action = buf;
        break;
      case 0x4D:
        std::snprintf(buf, sizeof(buf), "ABSOLUTE: Tilt to %.2f deg",
                      Protocol::DecodeTiltRaw(frame.Value()));
        action = buf;
        break;
      case 0x51:
        action = "QUERY: Pan position";
        break;
      case 0x53:
        action = "QUERY: Tilt position";
        break;
      case 0x03:
      case 0x07:
        action = DescribePresetFamily(cmd2, frame.Data2());
        break;
      case 0x05:
        std::snprintf(buf, sizeof(buf), "PRESET: Clear %u",
                      static_cast<unsigned>(frame.Data2()));
        action = buf;
        break;
      case 0x09:
      case 0x0B:
        std::snprintf(buf, sizeof(buf), "AUX: %s %u",
                      cmd2 == 0x09 ? "On" : "Off",
                      static_cast<unsigned>(frame.Data2()));
        action = buf;
        break;
      case 0x0F:
        action = "RESET: Remote reset";
        break;
      case 0x20:
        action = "OPTICAL: Zoom in";
        break;
      case 0x40:
        action = "OPTICAL: Zoom out";
        break;
      case 0x80:
        action = "OPTICAL: Focus far";
        break;
      default:
        if (const char* dir = DirectionName(cmd2)) {
          std::snprintf(buf, sizeof(buf), "MOVE: %s (pan %u, tilt %u)", dir,
                        static_cast<unsigned>(frame.Data1()),
                        static_cast<unsigned>(frame.Data2()));
          action = buf;
        } else {
          action = "UNKNOWN";
        }
        break;
    }
  }

  std::snprintf(buf, sizeof(buf), "Addr %02X | %02X %02X %02X %02X | sum %02X | ",
                frame.Address(), cmd1, cmd2, frame.Data1(), frame.Data2(),
                frame.Checksum());
  return std::string(buf) + action;
}

const char* ToString(DecodeError error) noexcept {
  switch (error) {
    case DecodeError::Empty:
      return "empty buffer";
    case DecodeError::MalformedLength:
      return "malformed length";
    case DecodeError::UnrecognizedTag:
      return "unrecognized tag";
  }
  return "unknown";
}

}  // namespace pan_tilt::protocol
