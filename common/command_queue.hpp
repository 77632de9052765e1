#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "config.hpp"
#include "ptz_controller.hpp"
#include "ptz_platform.hpp"
#include "result.hpp"

namespace pan_tilt {

/** Итог выполнения команды из очереди. */
struct CommandOutcome {
  uint64_t seq{0};
  std::string name;
  bool ok{false};
  bool cancelled{false};  ///< Очередь остановлена до выполнения
  std::string error;
  uint64_t enqueued_at_ms{0};
  uint64_t started_at_ms{0};
  uint64_t finished_at_ms{0};
};

using CommandFn = std::function<void(PtzController&)>;
using CompletionFn = std::function<void(const CommandOutcome&)>;

/** Команда в очереди; живёт от Enqueue до выполнения. */
struct QueuedCommand {
  uint64_t seq{0};
  std::string name;
  CommandFn operation;
  uint64_t enqueued_at_ms{0};
  CompletionFn on_complete;
};

enum class QueueError : uint8_t {
  NotRunning,  ///< Очередь не запущена или остановлена
  Full         ///< Превышен лимит ожидающих команд
};

[[nodiscard]] const char* ToString(QueueError error) noexcept;

/**
 * FIFO-очередь команд с одним рабочим потоком.
 *
 * В любой момент времени выполняется не более одной команды, поэтому
 * кадры разных вызывающих не перемешиваются на линии. Enqueue не ждёт
 * ввода-вывода. Исключение в команде логируется и передаётся в
 * on_complete, рабочий поток продолжает работу.
 *
 * Stop() не входит в очередь: его вызывают напрямую у контроллера.
 */
class CommandQueue {
 public:
  CommandQueue(PtzPlatform& platform, PtzController& controller,
               size_t max_pending = config::QueueConfig::kMaxPending);
  ~CommandQueue();

  CommandQueue(const CommandQueue&) = delete;
  CommandQueue& operator=(const CommandQueue&) = delete;

  /** Запустить рабочий поток (повторный вызов безопасен). */
  void Start();

  /**
   * Остановить очередь: текущая команда дорабатывает, ожидающие
   * отменяются (on_complete вызывается с cancelled = true).
   */
  void Stop();

  [[nodiscard]] bool IsRunning() const;

  /**
   * Поставить команду в очередь.
   * @return Порядковый номер команды или ошибка
   */
  [[nodiscard]] Result<uint64_t, QueueError> Enqueue(
      std::string name, CommandFn operation, CompletionFn on_complete = {});

  [[nodiscard]] size_t Pending() const;

  /**
   * Дождаться, пока очередь опустеет и рабочий поток освободится.
   * @return false по таймауту
   */
  bool WaitIdle(uint32_t timeout_ms);

 private:
  void WorkerLoop();
  CommandOutcome Execute(QueuedCommand& command);
  void Complete(const QueuedCommand& command, const CommandOutcome& outcome);

  PtzPlatform& platform_;
  PtzController& controller_;
  const size_t max_pending_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<QueuedCommand> queue_;
  bool running_{false};
  bool busy_{false};
  uint64_t next_seq_{1};
  std::thread worker_;
};

}  // namespace pan_tilt
