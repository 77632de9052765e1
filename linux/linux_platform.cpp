#include "linux_platform.hpp"

#include <thread>

namespace pan_tilt {

LinuxPlatform::LinuxPlatform(LogLevel min_level, std::FILE* sink)
    : start_(std::chrono::steady_clock::now()),
      sink_(sink),
      min_level_(min_level) {}

uint64_t LinuxPlatform::GetTimeMs() const noexcept {
  const auto elapsed = std::chrono::steady_clock::now() - start_;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void LinuxPlatform::DelayMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void LinuxPlatform::Log(LogLevel level, LogEvent event,
                        std::string_view msg) const {
  std::lock_guard lock(log_mutex_);
  if (level < min_level_ || sink_ == nullptr) {
    return;
  }
  std::fprintf(sink_, "%c (%llu) %s: %.*s\n", LevelLetter(level),
               static_cast<unsigned long long>(GetTimeMs()), ToString(event),
               static_cast<int>(msg.size()), msg.data());
  std::fflush(sink_);
}

void LinuxPlatform::SetMinLevel(LogLevel level) {
  std::lock_guard lock(log_mutex_);
  min_level_ = level;
}

}  // namespace pan_tilt
