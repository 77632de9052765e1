#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "command_queue.hpp"
#include "ptz_config.hpp"
#include "ptz_controller.hpp"
#include "ptz_platform.hpp"
#include "result.hpp"
#include "telemetry_loop.hpp"
#include "transport.hpp"

namespace pan_tilt {

/**
 * Устройство целиком: транспорт, контроллер, очередь команд и телеметрия.
 *
 * Через этот интерфейс работают внешние клиенты (HTTP/WebSocket-фасад,
 * GUI, консоль). Изменяющие команды идут через очередь, Stop() и чтение
 * позиции вызываются напрямую.
 */
class PtzDevice {
 public:
  PtzDevice(PtzPlatform& platform, std::unique_ptr<Transport> transport,
            ControllerConfig controller_config = {},
            TelemetryConfig telemetry_config = {});
  ~PtzDevice();

  PtzDevice(const PtzDevice&) = delete;
  PtzDevice& operator=(const PtzDevice&) = delete;

  /**
   * Инициализировать контроллер и запустить очередь и телеметрию.
   * @param with_telemetry Запускать ли поток телеметрии
   */
  [[nodiscard]] Result<bool, ControllerError> Open(bool with_telemetry = true);

  /** Остановить телеметрию и очередь, затем закрыть транспорт. */
  void Close();

  [[nodiscard]] bool IsOpen() const;

  // ─────────────────────────────────────────────────────────────────────────
  // Команды
  // ─────────────────────────────────────────────────────────────────────────

  /** Движение в направлении; для диагоналей скорость общая. */
  [[nodiscard]] Result<uint64_t, QueueError> Move(
      Direction direction, uint8_t speed, CompletionFn on_complete = {});

  /** Немедленная остановка в обход очереди. */
  bool Stop();

  /** Абсолютная позиция по одной или обеим осям. */
  [[nodiscard]] Result<uint64_t, QueueError> Absolute(
      std::optional<double> pan_deg, std::optional<double> tilt_deg,
      CompletionFn on_complete = {});

  /** Запомнить текущую позицию как программный ноль. */
  [[nodiscard]] Result<uint64_t, QueueError> Home(
      CompletionFn on_complete = {});

  /** Произвольная операция над контроллером через очередь. */
  [[nodiscard]] Result<uint64_t, QueueError> Enqueue(
      std::string name, CommandFn operation, CompletionFn on_complete = {});

  /** Текущая позиция (прямой запрос к устройству). */
  [[nodiscard]] Result<RelativePosition, ControllerError> Position();

  // ─────────────────────────────────────────────────────────────────────────
  // Телеметрия
  // ─────────────────────────────────────────────────────────────────────────

  uint32_t SubscribeTelemetry(TelemetrySubscriber subscriber);
  void UnsubscribeTelemetry(uint32_t id);

  // ─────────────────────────────────────────────────────────────────────────
  // Доступ к компонентам
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] PtzController& Controller() noexcept { return controller_; }
  [[nodiscard]] Transport& GetTransport() noexcept { return *transport_; }
  [[nodiscard]] CommandQueue& Queue() noexcept { return queue_; }
  [[nodiscard]] TelemetryLoop& Telemetry() noexcept { return telemetry_; }

 private:
  PtzPlatform& platform_;
  std::unique_ptr<Transport> transport_;
  PtzController controller_;
  CommandQueue queue_;
  TelemetryLoop telemetry_;
};

}  // namespace pan_tilt
