#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

#include "protocol.hpp"
#include "ptz_config.hpp"
#include "ptz_platform.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace pan_tilt {

// ═══════════════════════════════════════════════════════════════════════════
// Типы данных
// ═══════════════════════════════════════════════════════════════════════════

enum class ControllerError : uint8_t {
  NotInitialized,  ///< Init() не выполнялся или устройство закрыто
  TransportFailed  ///< Транспорт не открылся
};

[[nodiscard]] const char* ToString(ControllerError error) noexcept;

/** Направление ручного движения. */
enum class Direction : uint8_t {
  Up,
  Down,
  Left,
  Right,
  LeftUp,
  LeftDown,
  RightUp,
  RightDown
};

/** Направление, которым панорама пойдёт к абсолютной цели. */
enum class PanDirection : uint8_t { None, Clockwise, CounterClockwise };

/** Программный ноль (home). */
struct ZeroPoint {
  double pan_deg{0.0};
  double tilt_deg{0.0};
};

/** Абсолютная позиция по последним запросам. */
struct Position {
  double pan_deg{0.0};   ///< [0, 360)
  double tilt_deg{0.0};  ///< [-90, 90]
  uint16_t raw_pan{0};
  uint16_t raw_tilt{0};
};

/**
 * Достоверность выборки.
 * Эвристика устройства: pan_valid = (pan != 0.0),
 * tilt_valid = (raw_tilt != 0 || tilt != 0.0). Неудачный запрос даёт нули,
 * поэтому флаги отличают "стоим в нуле" от "ответа не было".
 */
struct PositionStatus {
  bool pan_valid{false};
  bool tilt_valid{false};
  bool estimated{false};  ///< Выборка не опрашивалась (шина занята)
};

/** Позиция относительно программного нуля. */
struct RelativePosition {
  double pan_deg{0.0};
  double tilt_deg{0.0};
  Position absolute{};
  PositionStatus status{};
};

/** Итог абсолютного перемещения. */
struct MoveResult {
  double target_deg{0.0};
  double final_deg{0.0};  ///< Последнее показание (или цель без ожидания)
  bool blocking{false};
  bool reached{false};    ///< Достигнута в пределах допуска
  PanDirection direction{PanDirection::None};
  uint32_t elapsed_ms{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Контроллер устройства
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Драйвер поворотного устройства поверх Protocol + Transport.
 *
 * Команды движения отправляются один раз и не подтверждаются устройством.
 * Запросы позиции не возвращают ошибок: при любой проблеме пишется
 * предупреждение и возвращается 0.0.
 *
 * Потокобезопасность: пара запрос-ответ выполняется под захватом шины
 * транспорта, программный ноль защищён собственным мьютексом.
 */
class PtzController {
 public:
  PtzController(PtzPlatform& platform, Transport& transport,
                ControllerConfig config = {});

  PtzController(const PtzController&) = delete;
  PtzController& operator=(const PtzController&) = delete;

  // ─────────────────────────────────────────────────────────────────────────
  // Жизненный цикл
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Открыть транспорт, очистить вход, обнулить оси устройства и запомнить
   * текущую позицию как программный ноль.
   * @return true или TransportFailed
   */
  [[nodiscard]] Result<bool, ControllerError> Init();

  /** Закрыть транспорт. Очередь и телеметрия должны быть уже остановлены. */
  void Close();

  [[nodiscard]] bool IsInitialized() const noexcept {
    return initialized_.load();
  }

  [[nodiscard]] const ControllerConfig& Config() const noexcept {
    return config_;
  }

  // ─────────────────────────────────────────────────────────────────────────
  // Движение (без подтверждения)
  // ─────────────────────────────────────────────────────────────────────────

  bool Move(Direction direction, uint8_t pan_speed, uint8_t tilt_speed);
  bool MoveUp(uint8_t speed);
  bool MoveDown(uint8_t speed);
  bool MoveLeft(uint8_t speed);
  bool MoveRight(uint8_t speed);
  bool Stop();

  // ─────────────────────────────────────────────────────────────────────────
  // Пресеты, aux, оптика
  // ─────────────────────────────────────────────────────────────────────────

  bool SetPreset(uint8_t id);
  bool CallPreset(uint8_t id);
  bool ClearPreset(uint8_t id);
  bool AuxOn(uint8_t id);
  bool AuxOff(uint8_t id);
  bool ZoomIn();
  bool ZoomOut();
  bool FocusFar();
  bool FocusNear();
  bool IrisOpen();
  bool IrisClose();

  // ─────────────────────────────────────────────────────────────────────────
  // Расширенные функции устройства
  // ─────────────────────────────────────────────────────────────────────────

  bool RemoteReset();
  bool StartCruise();
  bool SetLineScanStart();
  bool SetLineScanEnd();
  bool RunLineScan();
  bool SetGuard(bool enable);
  bool SetRealtimeFeedback(bool enable);

  /** Обнулить энкодеры обеих осей на устройстве (03/67, 03/68). */
  bool SendZeroPointCommands();

  /**
   * Сброс к заводским настройкам: 4 кадра с паузой между ними.
   * @return true, если все кадры отправлены
   */
  bool FactoryDefault();

  // ─────────────────────────────────────────────────────────────────────────
  // Запросы позиции (fail-soft)
  // ─────────────────────────────────────────────────────────────────────────

  /** @return Угол панорамы или 0.0 при ошибке */
  double QueryPanPosition();

  /** @return Угол наклона или 0.0 при ошибке */
  double QueryTiltPosition();

  /** Обе оси, включая сырые значения. */
  Position QueryPosition();

  // ─────────────────────────────────────────────────────────────────────────
  // Абсолютное позиционирование
  // ─────────────────────────────────────────────────────────────────────────

  /** Режим ожидания берётся из ControllerConfig::blocking. */
  MoveResult AbsolutePan(double angle_deg);

  /**
   * Повернуть панораму в абсолютный угол. Угол приводится к [0, 360).
   * В блокирующем режиме опрашивает позицию до попадания в допуск или
   * истечения max_wait_ms; таймаут не является ошибкой.
   */
  MoveResult AbsolutePan(double angle_deg, bool blocking);

  MoveResult AbsoluteTilt(double angle_deg);

  /** Угол ограничивается [-90, 90]. */
  MoveResult AbsoluteTilt(double angle_deg, bool blocking);

  /**
   * Кратчайшее направление от current к target.
   * |target - current| > 180 означает движение через 0/360.
   */
  [[nodiscard]] static PanDirection SelectPanDirection(double current_deg,
                                                       double target_deg) noexcept;

  /**
   * Ждать, пока обе оси не перестанут двигаться в течение stable_ms.
   * @return true, если устройство успокоилось до max_wait_ms
   */
  bool WaitForSettled(uint32_t stable_ms, uint32_t max_wait_ms);

  // ─────────────────────────────────────────────────────────────────────────
  // Программный ноль
  // ─────────────────────────────────────────────────────────────────────────

  /** Позиция относительно программного нуля (блокирует шину). */
  RelativePosition GetRelativePosition();

  /**
   * То же, но ждёт шину не дольше budget_ms, а ответы обеих осей — не
   * дольше response_timeout_ms в сумме. Если на наклон времени не осталось,
   * он не запрашивается и считается неудачным.
   * @return std::nullopt, если шина занята
   */
  std::optional<RelativePosition> TryGetRelativePosition(
      uint32_t budget_ms, uint32_t response_timeout_ms);

  /**
   * Запомнить текущую позицию как ноль. Ось, запрос которой не удался,
   * сохраняет прежнее значение.
   * @return true, если обе оси прочитаны
   */
  bool SetHome();

  [[nodiscard]] ZeroPoint GetZeroPoint() const;

 private:
  struct AxisReading {
    double angle_deg{0.0};
    uint16_t raw{0};
    bool ok{false};
  };

  bool Send(const protocol::Command& cmd);
  std::optional<protocol::ParsedResponse> ReadResponse(uint32_t timeout_ms);
  AxisReading QueryAxis(protocol::Operation query,
                        protocol::ResponseKind expected);
  AxisReading QueryAxis(protocol::Operation query,
                        protocol::ResponseKind expected, uint32_t timeout_ms);
  RelativePosition ReadRelativeLocked(uint32_t timeout_ms);
  RelativePosition MakeRelative(const AxisReading& pan,
                                const AxisReading& tilt) const;
  MoveResult WaitForAxis(protocol::Operation query,
                         protocol::ResponseKind expected, MoveResult result);

  PtzPlatform& platform_;
  Transport& transport_;
  ControllerConfig config_;
  std::atomic<bool> initialized_{false};

  mutable std::mutex zero_mutex_;
  ZeroPoint zero_;
};

}  // namespace pan_tilt
