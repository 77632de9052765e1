#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "command_queue.hpp"
#include "mock_platform.hpp"
#include "scripted_transport.hpp"
#include "test_helpers.hpp"

using namespace pan_tilt;
using namespace pan_tilt::testing;

/**
 * @brief Queue over an unopened controller: commands are plain closures
 */
class CommandQueueTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_unique<ScriptedTransport>(platform_);
    controller_ = std::make_unique<PtzController>(platform_, *transport_);
  }

  std::unique_ptr<CommandQueue> MakeQueue(size_t max_pending = 64) {
    return std::make_unique<CommandQueue>(platform_, *controller_,
                                          max_pending);
  }

  FakePlatform platform_;
  std::unique_ptr<ScriptedTransport> transport_;
  std::unique_ptr<PtzController> controller_;
};

TEST_F(CommandQueueTest, EnqueueFailsWhenNotRunning) {
  auto queue = MakeQueue();

  auto result = queue->Enqueue("noop", [](PtzController&) {});

  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), QueueError::NotRunning);
}

TEST_F(CommandQueueTest, ExecutesInSubmissionOrder) {
  auto queue = MakeQueue();
  queue->Start();

  std::mutex mutex;
  std::vector<int> order;
  for (int i = 0; i < 50; ++i) {
    auto result = queue->Enqueue("step", [&, i](PtzController&) {
      std::lock_guard lock(mutex);
      order.push_back(i);
    });
    ASSERT_TRUE(IsOk(result));
  }

  ASSERT_TRUE(queue->WaitIdle(5000)) << "Queue should drain";
  ASSERT_EQ(order.size(), 50u);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

TEST_F(CommandQueueTest, SequenceNumbersIncrease) {
  auto queue = MakeQueue();
  queue->Start();

  auto first = queue->Enqueue("a", [](PtzController&) {});
  auto second = queue->Enqueue("b", [](PtzController&) {});

  ASSERT_TRUE(IsOk(first));
  ASSERT_TRUE(IsOk(second));
  EXPECT_LT(GetValue(first), GetValue(second));
  EXPECT_TRUE(queue->WaitIdle(5000));
}

TEST_F(CommandQueueTest, ConcurrentCallersNeverOverlap) {
  auto queue = MakeQueue(1000);
  queue->Start();

  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  std::atomic<int> executed{0};

  auto op = [&](PtzController&) {
    const int now = ++active;
    int seen = max_active.load();
    while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::microseconds(200));
    ++executed;
    --active;
  };

  std::vector<std::thread> callers;
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&] {
      for (int i = 0; i < 25; ++i) {
        auto result = queue->Enqueue("concurrent", op);
        EXPECT_TRUE(IsOk(result));
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }

  ASSERT_TRUE(queue->WaitIdle(10000));
  EXPECT_EQ(executed.load(), 100);
  EXPECT_EQ(max_active.load(), 1) << "Only one command may run at a time";
}

TEST_F(CommandQueueTest, FramesReachTransportInEnqueueOrder) {
  ASSERT_TRUE(IsOk(transport_->Open()));
  auto queue = MakeQueue(1000);
  queue->Start();

  std::mutex mutex;
  std::vector<std::pair<uint64_t, uint8_t>> accepted;
  std::vector<std::thread> callers;
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&, t] {
      for (int i = 0; i < 25; ++i) {
        const auto id = static_cast<uint8_t>(t * 25 + i + 1);
        auto result = queue->Enqueue(
            "preset", [id](PtzController& c) { c.SetPreset(id); });
        ASSERT_TRUE(IsOk(result));
        std::lock_guard lock(mutex);
        accepted.emplace_back(GetValue(result), id);
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  ASSERT_TRUE(queue->WaitIdle(10000));

  std::sort(accepted.begin(), accepted.end());
  const auto frames = transport_->SentFrames();
  ASSERT_EQ(frames.size(), accepted.size());
  for (size_t i = 0; i < frames.size(); ++i) {
    ASSERT_EQ(frames[i].size(), 7u) << "Frame " << i << " was interleaved";
    EXPECT_EQ(frames[i][5], accepted[i].second) << "Frame " << i;
  }
}

TEST_F(CommandQueueTest, ThrowingCommandDoesNotStopWorker) {
  auto queue = MakeQueue();
  queue->Start();

  std::promise<CommandOutcome> failed;
  std::atomic<bool> next_ran{false};
  (void)queue->Enqueue(
      "explode",
      [](PtzController&) { throw std::runtime_error("boom"); },
      [&](const CommandOutcome& outcome) { failed.set_value(outcome); });
  (void)queue->Enqueue("after", [&](PtzController&) { next_ran = true; });

  ASSERT_TRUE(queue->WaitIdle(5000));
  const CommandOutcome outcome = failed.get_future().get();
  EXPECT_FALSE(outcome.ok);
  EXPECT_FALSE(outcome.cancelled);
  EXPECT_EQ(outcome.error, "boom");
  EXPECT_EQ(outcome.name, "explode");
  EXPECT_TRUE(next_ran.load()) << "Worker must survive a failing command";
  EXPECT_TRUE(platform_.HasEvent(LogEvent::CommandFailed));
}

TEST_F(CommandQueueTest, ThrowingCompletionIsContained) {
  auto queue = MakeQueue();
  queue->Start();

  std::atomic<bool> next_ran{false};
  (void)queue->Enqueue(
      "a", [](PtzController&) {},
      [](const CommandOutcome&) { throw std::logic_error("callback"); });
  (void)queue->Enqueue("b", [&](PtzController&) { next_ran = true; });

  ASSERT_TRUE(queue->WaitIdle(5000));
  EXPECT_TRUE(next_ran.load());
}

TEST_F(CommandQueueTest, CompletionCarriesSequenceAndTimes) {
  auto queue = MakeQueue();
  queue->Start();

  std::promise<CommandOutcome> done;
  auto seq = queue->Enqueue(
      "move", [](PtzController&) {},
      [&](const CommandOutcome& outcome) { done.set_value(outcome); });
  ASSERT_TRUE(IsOk(seq));

  const CommandOutcome outcome = done.get_future().get();
  EXPECT_EQ(outcome.seq, GetValue(seq));
  EXPECT_TRUE(outcome.ok);
  EXPECT_LE(outcome.enqueued_at_ms, outcome.started_at_ms);
  EXPECT_LE(outcome.started_at_ms, outcome.finished_at_ms);
}

TEST_F(CommandQueueTest, RejectsWhenFull) {
  auto queue = MakeQueue(2);
  queue->Start();

  std::promise<void> started;
  std::promise<void> release;
  auto release_future = release.get_future().share();
  (void)queue->Enqueue("blocker", [&](PtzController&) {
    started.set_value();
    release_future.wait();
  });
  started.get_future().wait();

  EXPECT_TRUE(IsOk(queue->Enqueue("one", [](PtzController&) {})));
  EXPECT_TRUE(IsOk(queue->Enqueue("two", [](PtzController&) {})));
  auto overflow = queue->Enqueue("three", [](PtzController&) {});

  ASSERT_TRUE(IsError(overflow));
  EXPECT_EQ(GetError(overflow), QueueError::Full);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::CommandDropped));

  release.set_value();
  EXPECT_TRUE(queue->WaitIdle(5000));
}

TEST_F(CommandQueueTest, StopCancelsPendingCommands) {
  auto queue = MakeQueue();
  queue->Start();

  std::promise<void> started;
  std::promise<void> release;
  auto release_future = release.get_future().share();
  std::atomic<bool> blocker_done{false};
  (void)queue->Enqueue(
      "blocker",
      [&](PtzController&) {
        started.set_value();
        release_future.wait();
      },
      [&](const CommandOutcome& outcome) { blocker_done = outcome.ok; });
  started.get_future().wait();

  std::atomic<int> ran{0};
  std::atomic<int> cancelled{0};
  for (int i = 0; i < 2; ++i) {
    (void)queue->Enqueue(
        "pending", [&](PtzController&) { ++ran; },
        [&](const CommandOutcome& outcome) {
          if (outcome.cancelled) ++cancelled;
        });
  }

  std::thread stopper([&] { queue->Stop(); });
  while (queue->Pending() != 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  release.set_value();
  stopper.join();

  EXPECT_TRUE(blocker_done.load()) << "Running command finishes";
  EXPECT_EQ(ran.load(), 0);
  EXPECT_EQ(cancelled.load(), 2);
  EXPECT_EQ(platform_.CountEvents(LogEvent::CommandDropped), 2u);
  EXPECT_FALSE(queue->IsRunning());
  EXPECT_TRUE(IsError(queue->Enqueue("late", [](PtzController&) {})));
}

TEST_F(CommandQueueTest, StopFromCompletionCallbackCancelsRest) {
  auto queue = MakeQueue();
  queue->Start();

  std::promise<void> second_queued;
  auto second_queued_future = second_queued.get_future().share();
  std::promise<CommandOutcome> second_done;
  (void)queue->Enqueue(
      "shutdown",
      [&](PtzController&) { second_queued_future.wait(); },
      [&](const CommandOutcome&) { queue->Stop(); });
  (void)queue->Enqueue(
      "late", [](PtzController&) {},
      [&](const CommandOutcome& outcome) { second_done.set_value(outcome); });
  second_queued.set_value();

  const CommandOutcome outcome = second_done.get_future().get();
  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.ok);
  EXPECT_FALSE(queue->IsRunning());
  EXPECT_FALSE(platform_.HasEvent(LogEvent::CommandFailed))
      << "Stopping from the worker thread must not throw";

  queue->Start();
  EXPECT_TRUE(IsOk(queue->Enqueue("restart", [](PtzController&) {})));
  EXPECT_TRUE(queue->WaitIdle(5000));
}
