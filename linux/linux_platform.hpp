#pragma once

#include <chrono>
#include <cstdio>
#include <mutex>

#include "ptz_platform.hpp"

namespace pan_tilt {

/**
 * @brief Реализация PtzPlatform для Linux
 *
 * - Время: std::chrono::steady_clock от момента создания
 * - Задержки: std::this_thread::sleep_for
 * - Лог: строки "L (ms) tag: message" в stderr (или другой FILE*)
 */
class LinuxPlatform : public PtzPlatform {
 public:
  explicit LinuxPlatform(LogLevel min_level = LogLevel::Info,
                         std::FILE* sink = stderr);

  [[nodiscard]] uint64_t GetTimeMs() const noexcept override;
  void DelayMs(uint32_t ms) override;
  void Log(LogLevel level, LogEvent event,
           std::string_view msg) const override;

  void SetMinLevel(LogLevel level);

 private:
  const std::chrono::steady_clock::time_point start_;
  std::FILE* sink_;
  mutable std::mutex log_mutex_;
  LogLevel min_level_;
};

}  // namespace pan_tilt
