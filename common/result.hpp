#pragma once

#include <variant>

namespace pan_tilt {

// ═══════════════════════════════════════════════════════════════════════════
// Result type (альтернатива std::expected для C++23)
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Значение или ошибка. Индекс 0 — значение, индекс 1 — ошибка.
 * Операции без значения возвращают Result<bool, E>.
 */
template <typename T, typename E>
using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] inline bool IsOk(const Result<T, E>& r) noexcept {
  return r.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] inline bool IsError(const Result<T, E>& r) noexcept {
  return r.index() == 1;
}

template <typename T, typename E>
[[nodiscard]] inline const T& GetValue(const Result<T, E>& r) noexcept {
  return *std::get_if<0>(&r);
}

template <typename T, typename E>
[[nodiscard]] inline T& GetValue(Result<T, E>& r) noexcept {
  return *std::get_if<0>(&r);
}

template <typename T, typename E>
[[nodiscard]] inline E GetError(const Result<T, E>& r) noexcept {
  return *std::get_if<1>(&r);
}

}  // namespace pan_tilt
