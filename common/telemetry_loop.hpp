#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

#include "ptz_config.hpp"
#include "ptz_controller.hpp"
#include "ptz_platform.hpp"

namespace pan_tilt {

/** Одна публикация телеметрии. */
struct TelemetrySample {
  uint64_t seq{0};
  uint64_t timestamp_ms{0};
  RelativePosition position{};
  bool degraded{false};  ///< Позиция не опрошена, значения — последние известные
};

using TelemetrySubscriber = std::function<void(const TelemetrySample&)>;

/**
 * Периодический опрос позиции и рассылка подписчикам.
 *
 * Шина ждётся не дольше query_budget_ms: если её держит команда (например,
 * блокирующее ожидание), тик публикует оценку с degraded = true и не
 * сдвигает расписание.
 */
class TelemetryLoop {
 public:
  TelemetryLoop(PtzPlatform& platform, PtzController& controller,
                TelemetryConfig config = {});
  ~TelemetryLoop();

  TelemetryLoop(const TelemetryLoop&) = delete;
  TelemetryLoop& operator=(const TelemetryLoop&) = delete;

  /**
   * Запустить поток телеметрии.
   * @return false, если конфигурация некорректна
   */
  bool Start();
  void Stop();
  [[nodiscard]] bool IsRunning() const;

  /** @return Идентификатор подписки */
  uint32_t Subscribe(TelemetrySubscriber subscriber);
  void Unsubscribe(uint32_t id);

  /** Один цикл опроса и рассылки (вызывается потоком или тестом). */
  TelemetrySample Tick();

  [[nodiscard]] std::optional<TelemetrySample> LastSample() const;

 private:
  void Run();
  void Publish(const TelemetrySample& sample);

  PtzPlatform& platform_;
  PtzController& controller_;
  const TelemetryConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable stop_cv_;
  bool running_{false};
  std::thread thread_;

  std::map<uint32_t, TelemetrySubscriber> subscribers_;
  uint32_t next_subscriber_id_{1};
  std::optional<TelemetrySample> last_;
  uint64_t next_seq_{1};
  bool degraded_logged_{false};
};

}  // namespace pan_tilt
