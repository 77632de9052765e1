#pragma once

#include <cstddef>
#include <cstdint>

namespace pan_tilt::config {

/**
 * @brief Параметры протокола
 */
struct ProtocolConfig {
  static constexpr uint8_t kDefaultAddress = 0x01;  ///< Адрес устройства
  static constexpr uint8_t kDefaultSpeed = 25;  ///< Скорость по умолчанию
  static constexpr size_t kMaxResponseSize =
      7;  ///< Максимальная длина ответа (стандартный кадр)
};

/**
 * @brief Параметры транспорта
 */
struct TransportConfig {
  static constexpr uint32_t kDefaultBaudRate = 9600;  ///< Скорость порта
  static constexpr uint32_t kResponseTimeoutMs =
      1000;  ///< Таймаут ожидания ответа
  static constexpr uint32_t kFlushTimeoutMs =
      100;  ///< Таймаут очистки входного буфера
  static constexpr size_t kFlushMaxBytes = 64;  ///< Лимит очистки за вызов
  static constexpr uint16_t kDefaultNetworkPort = 4001;  ///< TCP-порт моста
};

/**
 * @brief Повторные попытки открытия порта
 */
struct RetryConfig {
  static constexpr uint32_t kMaxAttempts = 3;     ///< Всего попыток
  static constexpr uint32_t kBackoffMs = 1000;    ///< Пауза между попытками
};

/**
 * @brief Параметры движения и ожидания позиции
 */
struct MotionConfig {
  static constexpr double kToleranceDeg = 0.2;  ///< Допуск достижения цели
  static constexpr uint32_t kPollIntervalMs = 50;  ///< Интервал опроса
  static constexpr uint32_t kMaxWaitMs = 5000;  ///< Максимальное ожидание
  static constexpr uint32_t kSettleStableMs =
      300;  ///< Время без движения для wait_for_settled
  static constexpr uint32_t kSettleMaxWaitMs =
      10000;  ///< Максимальное ожидание остановки
  static constexpr uint32_t kZeroCommandDelayMs =
      200;  ///< Пауза после каждой команды установки нуля
  static constexpr uint32_t kFactoryStepDelayMs =
      500;  ///< Пауза между кадрами сброса к заводским настройкам
};

/**
 * @brief Очередь команд
 */
struct QueueConfig {
  static constexpr size_t kMaxPending = 64;  ///< Лимит ожидающих команд
};

/**
 * @brief Конфигурация телеметрии
 */
struct TelemetryConfig {
  static constexpr uint32_t kPeriodMs = 200;     ///< Период опроса (5 Hz)
  static constexpr uint32_t kMinPeriodMs = 100;  ///< Нижняя граница периода
  static constexpr uint32_t kMaxPeriodMs = 250;  ///< Верхняя граница периода
  static constexpr uint32_t kQueryBudgetMs =
      50;  ///< Сколько ждать шину, прежде чем выдать оценку
  static constexpr uint32_t kResponseTimeoutMs =
      80;  ///< Таймаут ответа на запрос позиции из цикла телеметрии
};

/**
 * @brief Модель симулятора
 */
struct SimulatorConfigDefaults {
  static constexpr double kPanDegPerSecAtMax =
      30.0;  ///< Скорость панорамы при speed = 0x3F
  static constexpr double kTiltDegPerSecAtMax =
      18.0;  ///< Скорость наклона при speed = 0x3F
  static constexpr double kSlewDegPerSec =
      90.0;  ///< Скорость отработки абсолютной позиции (0 = мгновенно)
};

}  // namespace pan_tilt::config
