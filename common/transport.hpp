#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

#include "ptz_config.hpp"
#include "ptz_platform.hpp"
#include "result.hpp"

namespace pan_tilt {

// ═══════════════════════════════════════════════════════════════════════════
// Ошибки транспорта
// ═══════════════════════════════════════════════════════════════════════════

enum class TransportError : uint8_t {
  NotOpen,           ///< Операция ввода-вывода на закрытом транспорте
  PortUnavailable,   ///< Устройство/хост не найден
  PermissionDenied,  ///< Нет прав доступа к порту
  Busy,              ///< Порт занят другим процессом
  IoFailure,         ///< Ошибка чтения/записи
  Timeout,           ///< За отведённое время не пришло ни одного байта
  InvalidConfig,     ///< Некорректная конфигурация
  Closed             ///< Соединение закрыто удалённой стороной
};

/** Временные ошибки открытия, при которых имеет смысл повторить попытку. */
[[nodiscard]] bool IsRetriable(TransportError error) noexcept;

[[nodiscard]] const char* ToString(TransportError error) noexcept;

template <typename T>
using TransportResult = Result<T, TransportError>;

using Bytes = std::vector<uint8_t>;

/** Непрерывный буфер байт (data(), size()). */
template <typename T>
concept Bufferable = requires(const T& t) {
  { t.data() } -> std::convertible_to<const uint8_t*>;
  { t.size() } -> std::convertible_to<size_t>;
};

// ═══════════════════════════════════════════════════════════════════════════
// Базовый класс транспорта
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Байтовый транспорт до устройства (serial, TCP, симулятор).
 *
 * Наследники реализуют DoOpen/DoClose/DoIsOpen/DoWrite/DoRead.
 * Повторы при открытии, откат конфигурации, сборка ответа до терминатора,
 * логирование и сериализация доступа к шине реализованы в базе.
 *
 * Доступ к шине защищён рекурсивным мьютексом: каждый Send/Receive
 * захватывает его сам, а пара "запрос-ответ" должна выполняться под
 * AcquireBus(), чтобы ответ не прочитал другой поток.
 *
 * @note Наследники обязаны вызывать Close() в своём деструкторе.
 */
class Transport {
 public:
  using BusLock = std::unique_lock<std::recursive_timed_mutex>;

  Transport(PtzPlatform& platform, ConnectionConfig config);
  virtual ~Transport() = default;

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  // ─────────────────────────────────────────────────────────────────────────
  // Жизненный цикл
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Открыть транспорт. Временные ошибки (PermissionDenied, Busy)
   * повторяются согласно config.retry.
   * @return true или ошибка последней попытки
   */
  [[nodiscard]] TransportResult<bool> Open();

  /** Закрыть транспорт (повторный вызов безопасен). */
  void Close();

  [[nodiscard]] bool IsOpen() const;

  /**
   * Заменить конфигурацию. Открытый транспорт закрывается и открывается
   * заново; если новая конфигурация не открывается, восстанавливается
   * прежняя (попытка переоткрытия с ней).
   * @return true или ошибка открытия с новой конфигурацией
   */
  [[nodiscard]] TransportResult<bool> Configure(const ConnectionConfig& config);

  [[nodiscard]] ConnectionConfig Config() const;

  // ─────────────────────────────────────────────────────────────────────────
  // Ввод-вывод
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * Записать байты целиком.
   * @return Количество записанных байт
   */
  [[nodiscard]] TransportResult<size_t> Send(std::span<const uint8_t> data);

  template <Bufferable Container>
  [[nodiscard]] TransportResult<size_t> Send(const Container& data) {
    return Send(std::span<const uint8_t>(data.data(), data.size()));
  }

  /**
   * Принять то, что пришло за timeout_ms (не меньше одного байта).
   * Результат может быть короче max_len.
   * @return Байты или TransportError::Timeout
   */
  [[nodiscard]] TransportResult<Bytes> Receive(size_t max_len,
                                               uint32_t timeout_ms);

  /**
   * Читать до появления терминатора, исчерпания max_len или таймаута.
   * @return Накопленные байты (включая терминатор, если найден) или Timeout,
   * если не пришло ничего
   */
  [[nodiscard]] TransportResult<Bytes> ReceiveUntil(
      std::span<const uint8_t> terminator, size_t max_len,
      uint32_t timeout_ms);

  /**
   * Сбросить устаревшие входные байты.
   * @return Количество отброшенных байт
   */
  size_t FlushInput(size_t max_bytes, uint32_t timeout_ms);

  // ─────────────────────────────────────────────────────────────────────────
  // Шина
  // ─────────────────────────────────────────────────────────────────────────

  /** Захватить шину для последовательности запрос-ответ. */
  [[nodiscard]] BusLock AcquireBus();

  /**
   * Попытаться захватить шину.
   * @return Блокировка; owns_lock() == false, если шина занята дольше
   * timeout_ms
   */
  [[nodiscard]] BusLock TryAcquireBus(uint32_t timeout_ms);

 protected:
  /** Открыть устройство с заданной конфигурацией. */
  virtual TransportResult<bool> DoOpen(const ConnectionConfig& config) = 0;
  virtual void DoClose() = 0;
  [[nodiscard]] virtual bool DoIsOpen() const = 0;

  /** Записать все байты. */
  virtual TransportResult<size_t> DoWrite(std::span<const uint8_t> data) = 0;

  /**
   * Ждать данные не дольше timeout_ms и прочитать доступное.
   * @return Количество прочитанных байт; 0 — таймаут
   */
  virtual TransportResult<size_t> DoRead(std::span<uint8_t> buffer,
                                         uint32_t timeout_ms) = 0;

  PtzPlatform& platform_;

 private:
  TransportResult<bool> OpenLocked();

  mutable std::recursive_timed_mutex bus_mutex_;
  ConnectionConfig config_;
};

}  // namespace pan_tilt
