#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

#include "config.hpp"
#include "ptz_platform.hpp"
#include "result.hpp"

namespace pan_tilt {

/**
 * @brief Политика повторных попыток: фиксированное число попыток с
 * постоянной паузой между ними.
 */
struct RetryPolicy {
  uint32_t max_attempts{config::RetryConfig::kMaxAttempts};
  uint32_t backoff_ms{config::RetryConfig::kBackoffMs};

  [[nodiscard]] bool IsValid() const noexcept { return max_attempts >= 1; }
};

/**
 * Выполнить операцию с повторами.
 *
 * Повтор выполняется только если ошибка признана временной
 * (should_retry(error) == true) и лимит попыток не исчерпан. Пауза
 * выполняется через платформу, поэтому в тестах время не тратится.
 *
 * @param policy Политика повторов
 * @param platform Платформа (задержка)
 * @param attempt Операция, возвращающая Result<T, E>
 * @param should_retry Предикат временной ошибки
 * @param on_retry Вызывается перед каждой паузой: (номер неудачной попытки,
 * ошибка)
 * @return Результат последней попытки
 */
template <typename Attempt, typename ShouldRetry, typename OnRetry>
  requires std::invocable<Attempt&>
auto RetryWithBackoff(const RetryPolicy& policy, PtzPlatform& platform,
                      Attempt&& attempt, ShouldRetry&& should_retry,
                      OnRetry&& on_retry) -> std::invoke_result_t<Attempt&> {
  auto result = attempt();
  for (uint32_t n = 1; n < policy.max_attempts; ++n) {
    if (IsOk(result) || !should_retry(GetError(result))) {
      break;
    }
    on_retry(n, GetError(result));
    platform.DelayMs(policy.backoff_ms);
    result = attempt();
  }
  return result;
}

}  // namespace pan_tilt
