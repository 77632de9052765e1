#include "command_queue.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace pan_tilt {

const char* ToString(QueueError error) noexcept {
  switch (error) {
    case QueueError::NotRunning:
      return "queue not running";
    case QueueError::Full:
      return "queue full";
  }
  return "unknown";
}

CommandQueue::CommandQueue(PtzPlatform& platform, PtzController& controller,
                           size_t max_pending)
    : platform_(platform), controller_(controller), max_pending_(max_pending) {}

CommandQueue::~CommandQueue() { Stop(); }

// ═══════════════════════════════════════════════════════════════════════════
// Жизненный цикл
// ═══════════════════════════════════════════════════════════════════════════

void CommandQueue::Start() {
  std::unique_lock lock(mutex_);
  if (running_) {
    return;
  }
  if (worker_.joinable()) {
    // Прошлый поток остановлен из своего же колбэка и ещё не присоединён
    lock.unlock();
    worker_.join();
    lock.lock();
  }
  running_ = true;
  worker_ = std::thread(&CommandQueue::WorkerLoop, this);
}

void CommandQueue::Stop() {
  std::deque<QueuedCommand> cancelled;
  {
    std::lock_guard lock(mutex_);
    if (!running_ && !worker_.joinable()) {
      return;
    }
    running_ = false;
    cancelled.swap(queue_);
  }
  work_cv_.notify_all();
  // Из колбэка завершения поток выйдет сам, когда колбэк вернётся
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
  idle_cv_.notify_all();

  for (const QueuedCommand& command : cancelled) {
    LogFormat(platform_, LogLevel::Warning, LogEvent::CommandDropped,
              "Command #%llu '%s' cancelled on shutdown",
              static_cast<unsigned long long>(command.seq),
              command.name.c_str());
    CommandOutcome outcome{.seq = command.seq,
                           .name = command.name,
                           .cancelled = true,
                           .error = "cancelled",
                           .enqueued_at_ms = command.enqueued_at_ms,
                           .finished_at_ms = platform_.GetTimeMs()};
    Complete(command, outcome);
  }
}

bool CommandQueue::IsRunning() const {
  std::lock_guard lock(mutex_);
  return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Постановка в очередь
// ═══════════════════════════════════════════════════════════════════════════

Result<uint64_t, QueueError> CommandQueue::Enqueue(std::string name,
                                                   CommandFn operation,
                                                   CompletionFn on_complete) {
  uint64_t seq = 0;
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return QueueError::NotRunning;
    }
    if (queue_.size() >= max_pending_) {
      LogFormat(platform_, LogLevel::Warning, LogEvent::CommandDropped,
                "Queue full (%zu), '%s' rejected", max_pending_, name.c_str());
      return QueueError::Full;
    }
    seq = next_seq_++;
    queue_.push_back(QueuedCommand{.seq = seq,
                                   .name = std::move(name),
                                   .operation = std::move(operation),
                                   .enqueued_at_ms = platform_.GetTimeMs(),
                                   .on_complete = std::move(on_complete)});
  }
  work_cv_.notify_one();
  return seq;
}

size_t CommandQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool CommandQueue::WaitIdle(uint32_t timeout_ms) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [this] { return queue_.empty() && !busy_; });
}

// ═══════════════════════════════════════════════════════════════════════════
// Рабочий поток
// ═══════════════════════════════════════════════════════════════════════════

void CommandQueue::WorkerLoop() {
  while (true) {
    QueuedCommand command;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
      if (!running_) {
        break;
      }
      command = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    const CommandOutcome outcome = Execute(command);
    Complete(command, outcome);

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

CommandOutcome CommandQueue::Execute(QueuedCommand& command) {
  CommandOutcome outcome{.seq = command.seq,
                         .name = command.name,
                         .enqueued_at_ms = command.enqueued_at_ms,
                         .started_at_ms = platform_.GetTimeMs()};
  try {
    if (command.operation) {
      command.operation(controller_);
    }
    outcome.ok = true;
  } catch (const std::exception& e) {
    outcome.error = e.what();
  } catch (...) {
    outcome.error = "unknown exception";
  }
  outcome.finished_at_ms = platform_.GetTimeMs();

  if (!outcome.ok) {
    LogFormat(platform_, LogLevel::Error, LogEvent::CommandFailed,
              "Command #%llu '%s' failed: %s",
              static_cast<unsigned long long>(command.seq),
              command.name.c_str(), outcome.error.c_str());
  }
  return outcome;
}

void CommandQueue::Complete(const QueuedCommand& command,
                            const CommandOutcome& outcome) {
  if (!command.on_complete) {
    return;
  }
  try {
    command.on_complete(outcome);
  } catch (const std::exception& e) {
    LogFormat(platform_, LogLevel::Error, LogEvent::CommandFailed,
              "Completion of #%llu '%s' threw: %s",
              static_cast<unsigned long long>(command.seq),
              command.name.c_str(), e.what());
  } catch (...) {
    LogFormat(platform_, LogLevel::Error, LogEvent::CommandFailed,
              "Completion of #%llu '%s' threw unknown exception",
              static_cast<unsigned long long>(command.seq),
              command.name.c_str());
  }
}

}  // namespace pan_tilt
