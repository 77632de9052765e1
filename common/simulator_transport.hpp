#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "transport.hpp"

namespace pan_tilt {

/** Наблюдаемое состояние модели симулятора. */
struct SimulatorState {
  double pan_deg{0.0};
  double tilt_deg{0.0};
  double pan_velocity_dps{0.0};
  double tilt_velocity_dps{0.0};
  bool has_pan_target{false};
  bool has_tilt_target{false};
  uint32_t queries{0};  ///< Сколько запросов позиции получено
};

/**
 * Транспорт-симулятор поворотного устройства.
 *
 * Позиция интегрирует скорость по времени платформы, наклон ограничен
 * [-90, 90]. Абсолютные команды и вызов пресета отрабатываются с
 * ограниченной скоростью (slew_deg_per_sec, 0 = мгновенно). На запросы
 * позиции отвечает кадром производителя (или стандартным), остальные
 * команды не подтверждаются.
 */
class SimulatorTransport final : public Transport {
 public:
  SimulatorTransport(PtzPlatform& platform, ConnectionConfig config);
  ~SimulatorTransport() override;

  /** Текущее состояние (модель продвигается до текущего времени). */
  [[nodiscard]] SimulatorState State();

  /** Установить позицию (сбрасывает скорости и цели). */
  void SetPosition(double pan_deg, double tilt_deg);

  /** Включить/выключить "заклинивший" двигатель. */
  void SetStalled(bool stalled);

 protected:
  TransportResult<bool> DoOpen(const ConnectionConfig& config) override;
  void DoClose() override;
  [[nodiscard]] bool DoIsOpen() const override;
  TransportResult<size_t> DoWrite(std::span<const uint8_t> data) override;
  TransportResult<size_t> DoRead(std::span<uint8_t> buffer,
                                 uint32_t timeout_ms) override;

 private:
  void AdvanceLocked(uint64_t now_ms);
  void ProcessFrameLocked(std::span<const uint8_t> frame);
  void QueueResponseLocked(uint8_t tag, uint16_t raw);
  void SetTargetLocked(std::optional<double> pan_deg,
                       std::optional<double> tilt_deg);

  mutable std::mutex mutex_;
  SimulatorOptions options_;
  bool open_{false};
  uint64_t last_update_ms_{0};

  double pan_deg_{0.0};
  double tilt_deg_{0.0};
  double pan_velocity_dps_{0.0};
  double tilt_velocity_dps_{0.0};
  std::optional<double> pan_target_;
  std::optional<double> tilt_target_;

  std::map<uint8_t, std::pair<double, double>> presets_;
  std::deque<uint8_t> pending_;
  uint32_t queries_{0};
};

}  // namespace pan_tilt
