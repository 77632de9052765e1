#include "ptz_device.hpp"

#include <utility>

namespace pan_tilt {

PtzDevice::PtzDevice(PtzPlatform& platform,
                     std::unique_ptr<Transport> transport,
                     ControllerConfig controller_config,
                     TelemetryConfig telemetry_config)
    : platform_(platform),
      transport_(std::move(transport)),
      controller_(platform, *transport_, controller_config),
      queue_(platform, controller_),
      telemetry_(platform, controller_, telemetry_config) {}

PtzDevice::~PtzDevice() { Close(); }

Result<bool, ControllerError> PtzDevice::Open(bool with_telemetry) {
  auto result = controller_.Init();
  if (IsError(result)) {
    return result;
  }
  queue_.Start();
  if (with_telemetry && !telemetry_.Start()) {
    platform_.Log(LogLevel::Warning, LogEvent::Generic,
                  "Telemetry not started, device runs without it");
  }
  return true;
}

void PtzDevice::Close() {
  // Очередь и телеметрия должны стихнуть до закрытия транспорта
  telemetry_.Stop();
  queue_.Stop();
  controller_.Close();
}

bool PtzDevice::IsOpen() const {
  return controller_.IsInitialized() && queue_.IsRunning();
}

Result<uint64_t, QueueError> PtzDevice::Move(Direction direction,
                                             uint8_t speed,
                                             CompletionFn on_complete) {
  return queue_.Enqueue(
      "move",
      [direction, speed](PtzController& c) { c.Move(direction, speed, speed); },
      std::move(on_complete));
}

bool PtzDevice::Stop() { return controller_.Stop(); }

Result<uint64_t, QueueError> PtzDevice::Absolute(std::optional<double> pan_deg,
                                                 std::optional<double> tilt_deg,
                                                 CompletionFn on_complete) {
  return queue_.Enqueue(
      "absolute",
      [pan_deg, tilt_deg](PtzController& c) {
        if (pan_deg) {
          c.AbsolutePan(*pan_deg);
        }
        if (tilt_deg) {
          c.AbsoluteTilt(*tilt_deg);
        }
      },
      std::move(on_complete));
}

Result<uint64_t, QueueError> PtzDevice::Home(CompletionFn on_complete) {
  return queue_.Enqueue(
      "home", [](PtzController& c) { c.SetHome(); }, std::move(on_complete));
}

Result<uint64_t, QueueError> PtzDevice::Enqueue(std::string name,
                                                CommandFn operation,
                                                CompletionFn on_complete) {
  return queue_.Enqueue(std::move(name), std::move(operation),
                        std::move(on_complete));
}

Result<RelativePosition, ControllerError> PtzDevice::Position() {
  if (!controller_.IsInitialized()) {
    return ControllerError::NotInitialized;
  }
  return controller_.GetRelativePosition();
}

uint32_t PtzDevice::SubscribeTelemetry(TelemetrySubscriber subscriber) {
  return telemetry_.Subscribe(std::move(subscriber));
}

void PtzDevice::UnsubscribeTelemetry(uint32_t id) {
  telemetry_.Unsubscribe(id);
}

}  // namespace pan_tilt
