#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include "result.hpp"

namespace pan_tilt::protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr uint8_t SYNC_BYTE = 0xFF;
inline constexpr size_t COMMAND_FRAME_SIZE = 7;  // FF addr cmd1 cmd2 d1 d2 sum
inline constexpr size_t STANDARD_RESPONSE_SIZE = 7;
inline constexpr size_t VENDOR_RESPONSE_SIZE = 5;  // lead tag d1 d2 sum

inline constexpr uint8_t TAG_PAN_POSITION = 0x59;
inline constexpr uint8_t TAG_TILT_POSITION = 0x5B;

inline constexpr uint8_t MAX_SPEED = 0x3F;

inline constexpr uint16_t RAW_FULL_TURN = 36000;  // 360.00° с шагом 0.01°
inline constexpr uint16_t RAW_TILT_SPLIT = 18000;

inline constexpr double TILT_MIN_DEG = -90.0;
inline constexpr double TILT_MAX_DEG = 90.0;

// Служебные номера пресетов (команды 03/07 с зарезервированным id)
inline constexpr uint8_t PRESET_PAN_ZERO = 0x67;
inline constexpr uint8_t PRESET_TILT_ZERO = 0x68;
inline constexpr uint8_t PRESET_CRUISE = 0x62;
inline constexpr uint8_t PRESET_LINE_SCAN_START = 0x5C;
inline constexpr uint8_t PRESET_LINE_SCAN_END = 0x5D;
inline constexpr uint8_t PRESET_LINE_SCAN_RUN = 0x63;
inline constexpr uint8_t PRESET_GUARD = 0x5E;
inline constexpr uint8_t PRESET_FEEDBACK = 0x69;
inline constexpr uint8_t PRESET_FACTORY_A = 0x5A;
inline constexpr uint8_t PRESET_FACTORY_B = 0xFF;

// ═══════════════════════════════════════════════════════════════════════════
// Операции
// ═══════════════════════════════════════════════════════════════════════════

/** Семантические операции; каждой соответствует фиксированная пара cmd1/cmd2.
 */
enum class Operation : uint8_t {
  Stop,
  Up,
  Down,
  Left,
  Right,
  LeftUp,
  LeftDown,
  RightUp,
  RightDown,
  SetPreset,
  CallPreset,
  ClearPreset,
  QueryPan,
  QueryTilt,
  AbsolutePan,
  AbsoluteTilt,
  AuxOn,
  AuxOff,
  ZoomIn,
  ZoomOut,
  FocusFar,
  FocusNear,
  IrisOpen,
  IrisClose,
  SetPanZero,
  SetTiltZero,
  RemoteReset,
  StartCruise,
  SetLineScanStart,
  SetLineScanEnd,
  RunLineScan,
  EnableGuard,
  DisableGuard,
  EnableFeedback,
  DisableFeedback
};

/**
 * Параметры команды. Используются только поля, относящиеся к операции:
 * скорости — для движения, id — для пресетов/aux, angle_deg — для абсолютных
 * позиций.
 */
struct Command {
  Operation op{Operation::Stop};
  uint8_t pan_speed{0};   // [0x00, 0x3F]
  uint8_t tilt_speed{0};  // [0x00, 0x3F]
  uint8_t id{0};
  double angle_deg{0.0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Ошибки разбора
// ═══════════════════════════════════════════════════════════════════════════

enum class DecodeError : uint8_t {
  Empty,            ///< Пустой буфер
  MalformedLength,  ///< Длина/первый байт не соответствуют ни одному формату
  UnrecognizedTag   ///< 5-байтный кадр с тегом, отличным от 0x59/0x5B
};

template <typename T>
using DecodeResult = Result<T, DecodeError>;

// ═══════════════════════════════════════════════════════════════════════════
// Кадры
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Командный кадр Pelco-D. Контрольная сумма вычисляется при создании,
 * после чего кадр не изменяется.
 */
class CommandFrame {
 public:
  CommandFrame(uint8_t address, uint8_t cmd1, uint8_t cmd2, uint8_t data1,
               uint8_t data2) noexcept;

  [[nodiscard]] uint8_t Address() const noexcept { return address_; }
  [[nodiscard]] uint8_t Cmd1() const noexcept { return cmd1_; }
  [[nodiscard]] uint8_t Cmd2() const noexcept { return cmd2_; }
  [[nodiscard]] uint8_t Data1() const noexcept { return data1_; }
  [[nodiscard]] uint8_t Data2() const noexcept { return data2_; }
  [[nodiscard]] uint8_t Checksum() const noexcept { return checksum_; }

  /** 16-битное значение data1:data2 (big-endian). */
  [[nodiscard]] uint16_t Value() const noexcept {
    return static_cast<uint16_t>((data1_ << 8) | data2_);
  }

  /** Байты кадра для передачи: FF addr cmd1 cmd2 d1 d2 sum. */
  [[nodiscard]] std::array<uint8_t, COMMAND_FRAME_SIZE> Bytes() const noexcept;

  bool operator==(const CommandFrame&) const = default;

 private:
  uint8_t address_;
  uint8_t cmd1_;
  uint8_t cmd2_;
  uint8_t data1_;
  uint8_t data2_;
  uint8_t checksum_;
};

/** Стандартный 7-байтный ответ: FF addr cmd1 cmd2 d1 d2 sum. */
struct Standard7Byte {
  uint8_t address{0};
  uint8_t cmd1{0};
  uint8_t cmd2{0};
  uint8_t data1{0};
  uint8_t data2{0};
  uint8_t checksum{0};
};

/** Короткий ответ производителя: lead tag d1 d2 sum. */
struct Vendor5Byte {
  uint8_t lead{0};
  uint8_t tag{0};
  uint8_t data1{0};
  uint8_t data2{0};
  uint8_t checksum{0};
};

using ResponseFrame = std::variant<Standard7Byte, Vendor5Byte>;

enum class ResponseKind : uint8_t { PanPosition, TiltPosition, Unknown };

/**
 * Результат проверки контрольной суммы.
 * Quirk — сумма на единицу больше расчётной (особенность прошивки),
 * считается валидной.
 */
enum class ChecksumStatus : uint8_t { Exact, Quirk, Mismatch };

/**
 * Разобранный ответ устройства.
 * При ChecksumStatus::Mismatch поля заполнены, но выборка считается
 * недостоверной — решение (отбросить/повторить) принимает вызывающий.
 */
struct ParsedResponse {
  ResponseFrame frame;
  ResponseKind kind{ResponseKind::Unknown};
  uint16_t raw{0};
  double angle_deg{0.0};
  ChecksumStatus checksum{ChecksumStatus::Exact};
  uint8_t expected_checksum{0};

  [[nodiscard]] bool IsStandard() const noexcept {
    return std::holds_alternative<Standard7Byte>(frame);
  }
  [[nodiscard]] bool HasChecksumWarning() const noexcept {
    return checksum == ChecksumStatus::Mismatch;
  }
  [[nodiscard]] bool IsPosition() const noexcept {
    return kind == ResponseKind::PanPosition ||
           kind == ResponseKind::TiltPosition;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Основной API протокола
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Кодек кадров Pelco-D (без состояния и без ввода-вывода).
 */
class Protocol {
 public:
  /**
   * Построить командный кадр для операции.
   * @param cmd Операция и её параметры
   * @param address Адрес устройства на шине
   * @return Готовый кадр
   */
  [[nodiscard]] static CommandFrame Encode(const Command& cmd,
                                           uint8_t address) noexcept;

  /**
   * Разобрать ответ устройства (5 или 7 байт).
   * Длина 5 — формат производителя; длина 7 с первым байтом 0xFF —
   * стандартный формат; иначе MalformedLength.
   * @param buffer Принятые байты (ровно один кадр)
   * @return Разобранный ответ или ошибка
   */
  [[nodiscard]] static DecodeResult<ParsedResponse> Decode(
      std::span<const uint8_t> buffer) noexcept;

  /** Сумма байт по модулю 256. */
  [[nodiscard]] static uint8_t CalculateChecksum(
      std::span<const uint8_t> bytes) noexcept;

  /**
   * Проверить контрольную сумму с учётом особенности прошивки (+1).
   * @param covered Байты, входящие в сумму
   * @param received Принятая контрольная сумма
   */
  [[nodiscard]] static ChecksumStatus CheckChecksum(
      std::span<const uint8_t> covered, uint8_t received) noexcept;

  /**
   * Ожидаемая длина ответа по первому байту.
   * @return 7 для 0xFF, иначе 5
   */
  [[nodiscard]] static size_t ExpectedResponseSize(uint8_t first_byte) noexcept {
    return first_byte == SYNC_BYTE ? STANDARD_RESPONSE_SIZE
                                   : VENDOR_RESPONSE_SIZE;
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Кодирование углов
  // ─────────────────────────────────────────────────────────────────────────

  /** raw = round(angle * 100) mod 36000. */
  [[nodiscard]] static uint16_t EncodePanAngle(double angle_deg) noexcept;

  /** angle >= 0: 36000 - round(angle*100); angle < 0: round(|angle|*100). */
  [[nodiscard]] static uint16_t EncodeTiltAngle(double angle_deg) noexcept;

  [[nodiscard]] static double DecodePanRaw(uint16_t raw) noexcept {
    return static_cast<double>(raw) / 100.0;
  }

  /** raw > 18000: (36000 - raw) / 100, иначе -raw / 100. */
  [[nodiscard]] static double DecodeTiltRaw(uint16_t raw) noexcept;

  /** Привести угол панорамы к диапазону [0, 360). */
  [[nodiscard]] static double NormalizePan(double angle_deg) noexcept;

  /** Ограничить угол наклона диапазоном [-90, 90]. */
  [[nodiscard]] static double ClampTilt(double angle_deg) noexcept;

  /** Ограничить скорость диапазоном Pelco-D [0x00, 0x3F]. */
  [[nodiscard]] static uint8_t ClampSpeed(int speed) noexcept;

  /** Последовательность кадров сброса к заводским настройкам. */
  [[nodiscard]] static std::array<CommandFrame, 4> FactoryDefaultSequence(
      uint8_t address) noexcept;
};

// ─────────────────────────────────────────────────────────────────────────
// Форматирование для логов
// ─────────────────────────────────────────────────────────────────────────

/** "FF 01 00 4B 23 28 97" */
[[nodiscard]] std::string FormatHex(std::span<const uint8_t> bytes);

/** Человекочитаемое описание командного кадра. */
[[nodiscard]] std::string Describe(const CommandFrame& frame);

[[nodiscard]] const char* ToString(DecodeError error) noexcept;

}  // namespace pan_tilt::protocol
