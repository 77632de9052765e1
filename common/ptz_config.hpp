#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "config.hpp"
#include "retry.hpp"

namespace pan_tilt {

// ═══════════════════════════════════════════════════════════════════════════
// Параметры подключения
// ═══════════════════════════════════════════════════════════════════════════

/** Тип транспорта; выбирается вызывающим явно. */
enum class TransportKind : uint8_t { Serial, Network, Simulator };

enum class Parity : uint8_t { None, Even, Odd };

struct SerialSettings {
  std::string port{"/dev/ttyUSB0"};
  uint32_t baud_rate{config::TransportConfig::kDefaultBaudRate};
  uint8_t data_bits{8};  ///< 5..8
  Parity parity{Parity::None};
  uint8_t stop_bits{1};  ///< 1 или 2

  [[nodiscard]] bool IsValid() const noexcept {
    return !port.empty() && baud_rate > 0 && data_bits >= 5 &&
           data_bits <= 8 && (stop_bits == 1 || stop_bits == 2);
  }
};

struct NetworkSettings {
  std::string host{"127.0.0.1"};
  uint16_t port{config::TransportConfig::kDefaultNetworkPort};

  [[nodiscard]] bool IsValid() const noexcept {
    return !host.empty() && port != 0;
  }
};

/** Формат ответов симулятора на запросы позиции. */
enum class SimResponseFormat : uint8_t { Vendor5Byte, Standard7Byte };

/**
 * Поведение симулятора.
 * Позволяет воспроизвести особенности реального устройства в тестах.
 */
struct SimulatorOptions {
  uint8_t address{config::ProtocolConfig::kDefaultAddress};
  SimResponseFormat format{SimResponseFormat::Vendor5Byte};
  bool checksum_quirk{false};  ///< Отвечать с суммой +1
  uint32_t drop_every{0};      ///< Не отвечать на каждый N-й запрос (0 = никогда)
  size_t max_chunk{0};  ///< Отдавать ответ кусками (0 = целиком)
  bool stalled{false};  ///< Абсолютные позиции никогда не достигаются
  double pan_deg_per_sec{config::SimulatorConfigDefaults::kPanDegPerSecAtMax};
  double tilt_deg_per_sec{
      config::SimulatorConfigDefaults::kTiltDegPerSecAtMax};
  double slew_deg_per_sec{config::SimulatorConfigDefaults::kSlewDegPerSec};
  double initial_pan_deg{0.0};
  double initial_tilt_deg{0.0};

  [[nodiscard]] bool IsValid() const noexcept {
    return pan_deg_per_sec >= 0.0 && tilt_deg_per_sec >= 0.0 &&
           slew_deg_per_sec >= 0.0 && initial_tilt_deg >= -90.0 &&
           initial_tilt_deg <= 90.0;
  }
};

/**
 * Конфигурация транспорта. Задаётся при создании, изменяется через
 * Transport::Configure().
 */
struct ConnectionConfig {
  TransportKind kind{TransportKind::Serial};
  SerialSettings serial{};
  NetworkSettings network{};
  SimulatorOptions simulator{};
  uint32_t timeout_ms{config::TransportConfig::kResponseTimeoutMs};
  RetryPolicy retry{};

  [[nodiscard]] bool IsValid() const noexcept {
    if (!retry.IsValid()) return false;
    switch (kind) {
      case TransportKind::Serial:
        return serial.IsValid();
      case TransportKind::Network:
        return network.IsValid();
      case TransportKind::Simulator:
        return simulator.IsValid();
    }
    return false;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Параметры контроллера
// ═══════════════════════════════════════════════════════════════════════════

struct ControllerConfig {
  uint8_t address{config::ProtocolConfig::kDefaultAddress};
  bool blocking{false};  ///< Ждать достижения абсолютной позиции
  double tolerance_deg{config::MotionConfig::kToleranceDeg};
  uint32_t poll_interval_ms{config::MotionConfig::kPollIntervalMs};
  uint32_t max_wait_ms{config::MotionConfig::kMaxWaitMs};
  uint32_t response_timeout_ms{config::TransportConfig::kResponseTimeoutMs};
  uint8_t default_speed{config::ProtocolConfig::kDefaultSpeed};

  [[nodiscard]] bool IsValid() const noexcept {
    return tolerance_deg > 0.0 && poll_interval_ms > 0 &&
           max_wait_ms >= poll_interval_ms && response_timeout_ms > 0 &&
           default_speed <= 0x3F;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Параметры телеметрии
// ═══════════════════════════════════════════════════════════════════════════

struct TelemetryConfig {
  uint32_t period_ms{config::TelemetryConfig::kPeriodMs};
  uint32_t query_budget_ms{config::TelemetryConfig::kQueryBudgetMs};
  uint32_t response_timeout_ms{config::TelemetryConfig::kResponseTimeoutMs};

  [[nodiscard]] bool IsValid() const noexcept {
    return period_ms >= config::TelemetryConfig::kMinPeriodMs &&
           period_ms <= config::TelemetryConfig::kMaxPeriodMs &&
           response_timeout_ms > 0 &&
           query_budget_ms + response_timeout_ms < period_ms;
  }
};

}  // namespace pan_tilt
