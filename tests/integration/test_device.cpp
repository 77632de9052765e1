#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "mock_platform.hpp"
#include "ptz_device.hpp"
#include "simulator_transport.hpp"
#include "test_helpers.hpp"

using namespace pan_tilt;
using namespace pan_tilt::testing;

/**
 * @brief Whole device over the simulator with instant slew
 */
class PtzDeviceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto transport = std::make_unique<SimulatorTransport>(
        platform_, MakeSimulatorConfig({.slew_deg_per_sec = 0.0,
                                        .initial_pan_deg = 10.0,
                                        .initial_tilt_deg = 5.0}));
    sim_ = transport.get();
    device_ = std::make_unique<PtzDevice>(
        platform_, std::move(transport), ControllerConfig{},
        TelemetryConfig{.period_ms = 150});
  }

  void TearDown() override { device_.reset(); }

  void OpenDevice(bool with_telemetry = false) {
    auto result = device_->Open(with_telemetry);
    ASSERT_TRUE(IsOk(result)) << "Device should open over the simulator";
  }

  FakePlatform platform_;
  SimulatorTransport* sim_{nullptr};
  std::unique_ptr<PtzDevice> device_;
};

TEST_F(PtzDeviceTest, RejectsWorkBeforeOpen) {
  EXPECT_FALSE(device_->IsOpen());

  auto queued = device_->Move(Direction::Right, 0x20);
  ASSERT_TRUE(IsError(queued));
  EXPECT_EQ(GetError(queued), QueueError::NotRunning);

  auto position = device_->Position();
  ASSERT_TRUE(IsError(position));
  EXPECT_EQ(GetError(position), ControllerError::NotInitialized);
}

TEST_F(PtzDeviceTest, OpenCapturesZeroPoint) {
  OpenDevice();

  EXPECT_TRUE(device_->IsOpen());
  const ZeroPoint zero = device_->Controller().GetZeroPoint();
  EXPECT_NEAR(zero.pan_deg, 10.0, 0.01);
  EXPECT_NEAR(zero.tilt_deg, 5.0, 0.01);

  auto position = device_->Position();
  ASSERT_TRUE(IsOk(position));
  EXPECT_NEAR(GetValue(position).pan_deg, 0.0, 0.01);
  EXPECT_NEAR(GetValue(position).tilt_deg, 0.0, 0.01);
}

TEST_F(PtzDeviceTest, QueuedMoveStartsMotionAndStopHalts) {
  OpenDevice();

  std::promise<CommandOutcome> done;
  auto queued = device_->Move(
      Direction::Right, 0x3F,
      [&](const CommandOutcome& outcome) { done.set_value(outcome); });
  ASSERT_TRUE(IsOk(queued));
  const CommandOutcome outcome = done.get_future().get();
  EXPECT_TRUE(outcome.ok);
  EXPECT_EQ(outcome.name, "move");
  EXPECT_GT(sim_->State().pan_velocity_dps, 0.0);

  EXPECT_TRUE(device_->Stop());
  EXPECT_DOUBLE_EQ(sim_->State().pan_velocity_dps, 0.0);
}

TEST_F(PtzDeviceTest, AbsoluteMoveThroughQueue) {
  OpenDevice();

  auto queued = device_->Absolute(90.0, -20.0);
  ASSERT_TRUE(IsOk(queued));
  ASSERT_TRUE(device_->Queue().WaitIdle(5000));

  const SimulatorState state = sim_->State();
  EXPECT_NEAR(state.pan_deg, 90.0, 0.1);
  EXPECT_NEAR(state.tilt_deg, -20.0, 0.1);

  auto position = device_->Position();
  ASSERT_TRUE(IsOk(position));
  EXPECT_NEAR(GetValue(position).pan_deg, 80.0, 0.1);
  EXPECT_NEAR(GetValue(position).tilt_deg, -25.0, 0.1);
}

TEST_F(PtzDeviceTest, SingleAxisAbsoluteLeavesOtherAxis) {
  OpenDevice();

  ASSERT_TRUE(IsOk(device_->Absolute(std::nullopt, 30.0)));
  ASSERT_TRUE(device_->Queue().WaitIdle(5000));

  const SimulatorState state = sim_->State();
  EXPECT_NEAR(state.pan_deg, 10.0, 0.1);
  EXPECT_NEAR(state.tilt_deg, 30.0, 0.1);
}

TEST_F(PtzDeviceTest, HomeResetsRelativePosition) {
  OpenDevice();
  ASSERT_TRUE(IsOk(device_->Absolute(200.0, 40.0)));
  ASSERT_TRUE(IsOk(device_->Home()));
  ASSERT_TRUE(device_->Queue().WaitIdle(5000));

  auto position = device_->Position();
  ASSERT_TRUE(IsOk(position));
  EXPECT_NEAR(GetValue(position).pan_deg, 0.0, 0.1);
  EXPECT_NEAR(GetValue(position).tilt_deg, 0.0, 0.1);
  EXPECT_NEAR(GetValue(position).absolute.pan_deg, 200.0, 0.1);
}

TEST_F(PtzDeviceTest, TelemetryDeliversSamples) {
  std::atomic<int> fresh{0};
  (void)device_->SubscribeTelemetry([&](const TelemetrySample& sample) {
    if (!sample.degraded) ++fresh;
  });
  OpenDevice(true);
  EXPECT_TRUE(device_->Telemetry().IsRunning());

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (fresh.load() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  EXPECT_GE(fresh.load(), 2);
}

TEST_F(PtzDeviceTest, CloseStopsEverything) {
  OpenDevice(true);

  device_->Close();

  EXPECT_FALSE(device_->IsOpen());
  EXPECT_FALSE(device_->Telemetry().IsRunning());
  EXPECT_FALSE(device_->GetTransport().IsOpen());
  EXPECT_TRUE(IsError(device_->Home()));
}
