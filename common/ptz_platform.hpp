#pragma once

#include <cstdint>
#include <string_view>

namespace pan_tilt {

/**
 * @brief Уровни логирования
 */
enum class LogLevel : uint8_t { Debug = 0, Info, Warning, Error };

/**
 * @brief Структурированные события лога
 *
 * Каждое сообщение помечается событием, чтобы тесты могли проверять
 * факт предупреждения без разбора текста.
 */
enum class LogEvent : uint8_t {
  Generic = 0,
  TransportOpened,
  TransportOpenRetry,
  TransportOpenFailed,
  TransportClosed,
  ConfigureRollback,
  FrameSent,
  FrameReceived,
  ReceiveTimeout,
  PartialFrame,
  DecodeFailed,
  ChecksumMismatch,
  ChecksumQuirk,
  UnexpectedResponse,
  QueryFailed,
  BlockingWaitReached,
  BlockingWaitTimeout,
  ZeroPointCaptured,
  HomeCaptureFailed,
  CommandFailed,
  CommandDropped,
  TelemetryDegraded,
  SubscriberFailed
};

[[nodiscard]] const char* ToString(LogEvent event) noexcept;
[[nodiscard]] char LevelLetter(LogLevel level) noexcept;

/**
 * @brief Абстрактный интерфейс платформы для драйвера поворотного устройства
 *
 * Предоставляет время, задержки и логирование. Реализация: Linux
 * (монотонные часы + stderr) или тестовая платформа с ручными часами.
 *
 * @note Все методы должны быть потокобезопасными: их вызывают рабочий поток
 * очереди команд, цикл телеметрии и внешние потоки.
 */
class PtzPlatform {
 public:
  virtual ~PtzPlatform() = default;

  // ─────────────────────────────────────────────────────────────────────────
  // Время
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Текущее время в миллисекундах
   * @return Монотонное время с момента старта
   */
  [[nodiscard]] virtual uint64_t GetTimeMs() const noexcept = 0;

  /**
   * @brief Задержка текущего потока
   * @param ms Длительность в миллисекундах
   */
  virtual void DelayMs(uint32_t ms) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Логирование
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Вывод лог-сообщения
   * @param level Уровень важности
   * @param event Событие
   * @param msg Текст сообщения (UTF-8)
   */
  virtual void Log(LogLevel level, LogEvent event,
                   std::string_view msg) const = 0;
};

/**
 * @brief printf-подобная обёртка над PtzPlatform::Log
 *
 * Сообщение обрезается до 256 байт.
 */
void LogFormat(const PtzPlatform& platform, LogLevel level, LogEvent event,
               const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

}  // namespace pan_tilt
