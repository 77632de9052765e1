#include "telemetry_loop.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <vector>

namespace pan_tilt {

TelemetryLoop::TelemetryLoop(PtzPlatform& platform, PtzController& controller,
                             TelemetryConfig config)
    : platform_(platform), controller_(controller), config_(config) {}

TelemetryLoop::~TelemetryLoop() { Stop(); }

bool TelemetryLoop::Start() {
  if (!config_.IsValid()) {
    LogFormat(platform_, LogLevel::Error, LogEvent::Generic,
              "Telemetry period %u ms out of range", config_.period_ms);
    return false;
  }
  std::unique_lock lock(mutex_);
  if (running_) {
    return true;
  }
  if (thread_.joinable()) {
    lock.unlock();
    thread_.join();
    lock.lock();
  }
  running_ = true;
  thread_ = std::thread(&TelemetryLoop::Run, this);
  return true;
}

void TelemetryLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  stop_cv_.notify_all();
  // Подписчик может остановить цикл из его же потока
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

bool TelemetryLoop::IsRunning() const {
  std::lock_guard lock(mutex_);
  return running_;
}

uint32_t TelemetryLoop::Subscribe(TelemetrySubscriber subscriber) {
  std::lock_guard lock(mutex_);
  const uint32_t id = next_subscriber_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void TelemetryLoop::Unsubscribe(uint32_t id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(id);
}

std::optional<TelemetrySample> TelemetryLoop::LastSample() const {
  std::lock_guard lock(mutex_);
  return last_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Цикл
// ═══════════════════════════════════════════════════════════════════════════

void TelemetryLoop::Run() {
  using Clock = std::chrono::steady_clock;
  const auto period = std::chrono::milliseconds(config_.period_ms);
  auto next = Clock::now();

  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    Tick();
    lock.lock();

    next += period;
    const auto now = Clock::now();
    if (next < now) {
      next = now;  // тик опоздал: не догоняем пачкой
    }
    stop_cv_.wait_until(lock, next, [this] { return !running_; });
  }
}

TelemetrySample TelemetryLoop::Tick() {
  TelemetrySample sample;
  sample.timestamp_ms = platform_.GetTimeMs();

  std::optional<RelativePosition> position;
  if (controller_.IsInitialized()) {
    position = controller_.TryGetRelativePosition(config_.query_budget_ms,
                                                  config_.response_timeout_ms);
  }

  bool log_degraded = false;
  bool log_recovered = false;
  {
    std::lock_guard lock(mutex_);
    if (position) {
      sample.position = *position;
      log_recovered = degraded_logged_;
      degraded_logged_ = false;
    } else {
      // Последние известные значения, помеченные как оценка
      if (last_) {
        sample.position = last_->position;
      }
      sample.position.status = PositionStatus{.estimated = true};
      sample.degraded = true;
      log_degraded = !degraded_logged_;
      degraded_logged_ = true;
    }
    sample.seq = next_seq_++;
    last_ = sample;
  }

  if (log_degraded) {
    platform_.Log(LogLevel::Warning, LogEvent::TelemetryDegraded,
                  "Position unavailable, publishing estimates");
  } else if (log_recovered) {
    platform_.Log(LogLevel::Info, LogEvent::TelemetryDegraded,
                  "Position polling recovered");
  }

  Publish(sample);
  return sample;
}

void TelemetryLoop::Publish(const TelemetrySample& sample) {
  std::vector<std::pair<uint32_t, TelemetrySubscriber>> targets;
  {
    std::lock_guard lock(mutex_);
    targets.assign(subscribers_.begin(), subscribers_.end());
  }

  for (const auto& [id, subscriber] : targets) {
    try {
      subscriber(sample);
    } catch (const std::exception& e) {
      LogFormat(platform_, LogLevel::Warning, LogEvent::SubscriberFailed,
                "Subscriber %u threw: %s", id, e.what());
    } catch (...) {
      LogFormat(platform_, LogLevel::Warning, LogEvent::SubscriberFailed,
                "Subscriber %u threw unknown exception", id);
    }
  }
}

}  // namespace pan_tilt
