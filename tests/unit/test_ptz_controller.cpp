#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "mock_platform.hpp"
#include "protocol.hpp"
#include "ptz_controller.hpp"
#include "scripted_transport.hpp"
#include "simulator_transport.hpp"
#include "test_helpers.hpp"

using namespace pan_tilt;
using namespace pan_tilt::testing;
using protocol::Command;
using protocol::Operation;
using protocol::Protocol;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

Bytes Encoded(const Command& cmd) {
  const auto bytes = Protocol::Encode(cmd, 1).Bytes();
  return Bytes(bytes.begin(), bytes.end());
}

}  // namespace

class PtzControllerTest : public ControllerTestBase {};

// ═══════════════════════════════════════════════════════════════════════════
// Initialization Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PtzControllerTest, InitZeroesAxesAndCapturesZeroPoint) {
  transport_->AddReply({PanResponse(10.0)});
  transport_->AddReply({TiltResponse(-5.0)});

  auto result = controller_->Init();

  ASSERT_TRUE(IsOk(result));
  EXPECT_TRUE(controller_->IsInitialized());

  const auto sent = transport_->SentFrames();
  ASSERT_EQ(sent.size(), 4u);
  EXPECT_EQ(sent[0], Encoded({.op = Operation::SetPanZero}));
  EXPECT_EQ(sent[1], Encoded({.op = Operation::SetTiltZero}));
  EXPECT_EQ(sent[2], Encoded({.op = Operation::QueryPan}));
  EXPECT_EQ(sent[3], Encoded({.op = Operation::QueryTilt}));

  const ZeroPoint zero = controller_->GetZeroPoint();
  EXPECT_DOUBLE_EQ(zero.pan_deg, 10.0);
  EXPECT_DOUBLE_EQ(zero.tilt_deg, -5.0);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::ZeroPointCaptured));
}

TEST_F(PtzControllerTest, InitWaitsAfterEachZeroCommand) {
  transport_->AddReply({PanResponse(0.0)});
  transport_->AddReply({TiltResponse(0.0)});

  ASSERT_TRUE(IsOk(controller_->Init()));

  // 100 мс сброса входа + 2 × 200 мс после команд нуля
  EXPECT_EQ(platform_.GetTotalDelayMs(), 500u);
}

TEST_F(PtzControllerTest, InitFlushesStaleInput) {
  transport_->PushInput({0x12, 0x34, 0x56});
  transport_->AddReply({PanResponse(45.0)});
  transport_->AddReply({TiltResponse(15.0)});

  ASSERT_TRUE(IsOk(controller_->Init()));

  EXPECT_DOUBLE_EQ(controller_->GetZeroPoint().pan_deg, 45.0)
      << "Stale bytes must not corrupt the first response";
  EXPECT_DOUBLE_EQ(controller_->GetZeroPoint().tilt_deg, 15.0);
}

TEST_F(PtzControllerTest, InitFailsWhenTransportCannotOpen) {
  transport_->FailOpens(10, TransportError::PortUnavailable);

  auto result = controller_->Init();

  ASSERT_TRUE(IsError(result));
  EXPECT_EQ(GetError(result), ControllerError::TransportFailed);
  EXPECT_FALSE(controller_->IsInitialized());
}

TEST_F(PtzControllerTest, InitToleratesSilentDevice) {
  auto result = controller_->Init();

  ASSERT_TRUE(IsOk(result)) << "Queries are fail-soft";
  EXPECT_DOUBLE_EQ(controller_->GetZeroPoint().pan_deg, 0.0);
  EXPECT_EQ(platform_.CountEvents(LogEvent::QueryFailed), 2u);
}

TEST_F(PtzControllerTest, CloseClearsInitialized) {
  InitController();

  controller_->Close();

  EXPECT_FALSE(controller_->IsInitialized());
  EXPECT_FALSE(transport_->IsOpen());
}

// ═══════════════════════════════════════════════════════════════════════════
// Query Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PtzControllerTest, QueryPanDecodesVendorResponse) {
  InitController();
  transport_->AddReply({Bytes{0x00, 0x59, 0x23, 0x28, 0xA4}});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 90.0);
  EXPECT_EQ(transport_->SentFrames().back(),
            Encoded({.op = Operation::QueryPan}));
}

TEST_F(PtzControllerTest, QueryAcceptsStandardResponse) {
  InitController();
  transport_->AddReply({StandardResponse(0x01, 0x5B, 33000)});

  EXPECT_DOUBLE_EQ(controller_->QueryTiltPosition(), 30.0);
}

TEST_F(PtzControllerTest, QueryReassemblesPartialResponse) {
  InitController();
  transport_->AddReply(std::vector<Bytes>{{0x00, 0x59}, {0x23}, {0x28, 0xA4}});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 90.0);
  EXPECT_FALSE(platform_.HasEvent(LogEvent::PartialFrame));
}

TEST_F(PtzControllerTest, QueryTimeoutReturnsZero) {
  InitController();
  transport_->AddSilence();

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 0.0);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::QueryFailed));
  EXPECT_TRUE(platform_.HasEvent(LogEvent::ReceiveTimeout));
}

TEST_F(PtzControllerTest, TruncatedResponseIsDiscarded) {
  InitController();
  transport_->AddReply(std::vector<Bytes>{{0x00, 0x59, 0x23}});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 0.0);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::PartialFrame));
}

TEST_F(PtzControllerTest, ChecksumMismatchIsDiscardedWithWarning) {
  InitController();
  transport_->AddReply({VendorResponse(protocol::TAG_PAN_POSITION, 9000, 2)});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 0.0);
  EXPECT_EQ(platform_.CountEvents(LogEvent::ChecksumMismatch,
                                  LogLevel::Warning),
            1u);
}

TEST_F(PtzControllerTest, ChecksumQuirkIsAcceptedQuietly) {
  InitController();
  transport_->AddReply({VendorResponse(protocol::TAG_PAN_POSITION, 9000, 1)});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 90.0);
  EXPECT_FALSE(platform_.HasEvent(LogEvent::ChecksumMismatch));
  EXPECT_EQ(platform_.CountEvents(LogEvent::ChecksumQuirk, LogLevel::Debug),
            1u);
}

TEST_F(PtzControllerTest, WrongAxisResponseReturnsZero) {
  InitController();
  transport_->AddReply({TiltResponse(30.0)});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 0.0);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::UnexpectedResponse));
}

TEST_F(PtzControllerTest, GarbageResponseReturnsZero) {
  InitController();
  transport_->AddReply({Bytes{0x00, 0x42, 0x00, 0x00, 0x42}});

  EXPECT_DOUBLE_EQ(controller_->QueryPanPosition(), 0.0);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::DecodeFailed));
}

TEST_F(PtzControllerTest, QueryPositionReadsBothAxes) {
  InitController();
  transport_->AddReply({PanResponse(123.45)});
  transport_->AddReply({TiltResponse(-12.5)});

  const Position pos = controller_->QueryPosition();

  EXPECT_NEAR(pos.pan_deg, 123.45, 1e-9);
  EXPECT_NEAR(pos.tilt_deg, -12.5, 1e-9);
  EXPECT_EQ(pos.raw_pan, 12345);
  EXPECT_EQ(pos.raw_tilt, 1250);
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PtzControllerTest, DirectionalMovesAreSentOnce) {
  InitController();

  EXPECT_TRUE(controller_->MoveLeft(0x20));
  EXPECT_TRUE(controller_->MoveUp(0x50));
  EXPECT_TRUE(controller_->Move(Direction::RightDown, 5, 6));
  EXPECT_TRUE(controller_->Stop());

  const auto sent = transport_->SentFrames();
  ASSERT_EQ(sent.size(), 4u);
  EXPECT_EQ(sent[0], Encoded({.op = Operation::Left, .pan_speed = 0x20}));
  EXPECT_EQ(sent[1], Encoded({.op = Operation::Up, .tilt_speed = 0x3F}))
      << "Speed above 0x3F is clamped";
  EXPECT_EQ(sent[2], Encoded({.op = Operation::RightDown,
                              .pan_speed = 5,
                              .tilt_speed = 6}));
  EXPECT_EQ(sent[3], Encoded({.op = Operation::Stop}));
}

TEST_F(PtzControllerTest, PresetAuxAndOpticsCommands) {
  InitController();

  controller_->SetPreset(3);
  controller_->CallPreset(3);
  controller_->ClearPreset(3);
  controller_->AuxOn(1);
  controller_->ZoomIn();
  controller_->IrisClose();
  controller_->SetGuard(true);
  controller_->SetRealtimeFeedback(false);

  EXPECT_EQ(transport_->SentOpcodes(),
            (std::vector<uint8_t>{0x03, 0x07, 0x05, 0x09, 0x20, 0x00, 0x03,
                                  0x07}));
}

TEST_F(PtzControllerTest, SendFailureIsReportedNotThrown) {
  InitController();
  transport_->FailWrites(true);

  EXPECT_FALSE(controller_->Stop());
  EXPECT_TRUE(platform_.HasEvent(LogEvent::CommandFailed));
}

TEST_F(PtzControllerTest, FactoryDefaultSendsFourStepsWithPauses) {
  InitController();
  const uint64_t delay_before = platform_.GetTotalDelayMs();

  EXPECT_TRUE(controller_->FactoryDefault());

  const auto expected = Protocol::FactoryDefaultSequence(1);
  const auto sent = transport_->SentFrames();
  ASSERT_EQ(sent.size(), 4u);
  for (size_t i = 0; i < sent.size(); ++i) {
    const auto bytes = expected[i].Bytes();
    EXPECT_EQ(sent[i], Bytes(bytes.begin(), bytes.end())) << "step " << i;
  }
  EXPECT_EQ(platform_.GetTotalDelayMs() - delay_before, 1500u);
}

TEST(PtzControllerMockTest, ZeroPointCommandsWaitBetweenSteps) {
  NiceMock<MockPlatform> platform;
  ON_CALL(platform, GetTimeMs()).WillByDefault(Return(0));
  ScriptedTransport transport(platform);
  ASSERT_TRUE(IsOk(transport.Open()));
  PtzController controller(platform, transport);

  EXPECT_CALL(platform, DelayMs(200)).Times(2);

  EXPECT_TRUE(controller.SendZeroPointCommands());
  EXPECT_EQ(transport.SentFrames().size(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Absolute Positioning Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PtzControllerTest, AbsolutePanNormalizesNegativeAngle) {
  InitController();

  const MoveResult result = controller_->AbsolutePan(-90.0);

  EXPECT_DOUBLE_EQ(result.target_deg, 270.0);
  EXPECT_FALSE(result.blocking);
  EXPECT_DOUBLE_EQ(result.final_deg, 270.0);
  ASSERT_EQ(transport_->SentFrames().size(), 1u) << "No query when not blocking";
  const auto frame = transport_->SentFrames()[0];
  EXPECT_EQ(frame[3], 0x4B);
  EXPECT_EQ((frame[4] << 8) | frame[5], 27000);
}

TEST_F(PtzControllerTest, AbsoluteTiltIsClamped) {
  InitController();

  const MoveResult result = controller_->AbsoluteTilt(120.0);

  EXPECT_DOUBLE_EQ(result.target_deg, 90.0);
  EXPECT_EQ(transport_->SentFrames()[0],
            Encoded({.op = Operation::AbsoluteTilt, .angle_deg = 90.0}));
}

TEST(PtzControllerDirectionTest, ShortestArcSelection) {
  EXPECT_EQ(PtzController::SelectPanDirection(0.0, 90.0),
            PanDirection::Clockwise);
  EXPECT_EQ(PtzController::SelectPanDirection(90.0, 0.0),
            PanDirection::CounterClockwise);
  EXPECT_EQ(PtzController::SelectPanDirection(350.0, 10.0),
            PanDirection::Clockwise)
      << "Crossing 0 is shorter than sweeping back";
  EXPECT_EQ(PtzController::SelectPanDirection(10.0, 350.0),
            PanDirection::CounterClockwise);
  EXPECT_EQ(PtzController::SelectPanDirection(45.0, 45.0),
            PanDirection::None);
}

TEST_F(PtzControllerTest, BlockingWaitTimesOutWhenDeviceIsSilent) {
  InitController();
  const uint64_t start = platform_.GetTimeMs();

  const MoveResult result = controller_->AbsolutePan(90.0, true);

  EXPECT_FALSE(result.reached);
  EXPECT_TRUE(result.blocking);
  EXPECT_DOUBLE_EQ(result.final_deg, 0.0);
  EXPECT_GE(result.elapsed_ms, 5000u);
  EXPECT_LT(platform_.GetTimeMs() - start,
            5000u + 2 * (config_.response_timeout_ms + config_.poll_interval_ms))
      << "Wait is bounded by max_wait plus one poll cycle";
  EXPECT_TRUE(platform_.HasEvent(LogEvent::BlockingWaitTimeout));
}

/**
 * @brief Controller over the simulator on a fake clock
 */
class PtzControllerSimTest : public ::testing::Test {
 protected:
  void Start(SimulatorOptions options, ControllerConfig config = {}) {
    sim_ = std::make_unique<SimulatorTransport>(platform_,
                                                MakeSimulatorConfig(options));
    controller_ = std::make_unique<PtzController>(platform_, *sim_, config);
    ASSERT_TRUE(IsOk(controller_->Init()));
  }

  FakePlatform platform_;
  std::unique_ptr<SimulatorTransport> sim_;
  std::unique_ptr<PtzController> controller_;
};

TEST_F(PtzControllerSimTest, BlockingPanReachesTarget) {
  Start({.slew_deg_per_sec = 90.0}, {.blocking = true});

  const MoveResult result = controller_->AbsolutePan(90.0);

  EXPECT_TRUE(result.reached);
  EXPECT_EQ(result.direction, PanDirection::Clockwise);
  EXPECT_NEAR(result.final_deg, 90.0, 0.2);
  EXPECT_GE(result.elapsed_ms, 950u) << "90 deg at 90 deg/s";
  EXPECT_LE(result.elapsed_ms, 1100u);
  EXPECT_TRUE(platform_.HasEvent(LogEvent::BlockingWaitReached));
}

TEST_F(PtzControllerSimTest, BlockingTiltReachesTarget) {
  Start({.slew_deg_per_sec = 45.0});

  const MoveResult result = controller_->AbsoluteTilt(-30.0, true);

  EXPECT_TRUE(result.reached);
  EXPECT_NEAR(result.final_deg, -30.0, 0.2);
}

TEST_F(PtzControllerSimTest, StalledMotorTimesOutWithLastReading) {
  Start({.stalled = true, .initial_pan_deg = 30.0});
  const uint64_t start = platform_.GetTimeMs();

  const MoveResult result = controller_->AbsolutePan(90.0, true);

  EXPECT_FALSE(result.reached);
  EXPECT_DOUBLE_EQ(result.final_deg, 30.0) << "Last known reading";
  EXPECT_GE(result.elapsed_ms, 5000u);
  EXPECT_LT(platform_.GetTimeMs() - start, 5100u);
  EXPECT_EQ(platform_.CountEvents(LogEvent::BlockingWaitTimeout), 1u);
}

TEST_F(PtzControllerSimTest, WaitForSettledAfterMove) {
  Start({.slew_deg_per_sec = 90.0});

  controller_->AbsolutePan(45.0);
  EXPECT_TRUE(controller_->WaitForSettled(300, 10000));
  EXPECT_NEAR(sim_->State().pan_deg, 45.0, 1e-6);
}

TEST_F(PtzControllerSimTest, WaitForSettledGivesUpWhileMoving) {
  Start({});

  controller_->MoveRight(protocol::MAX_SPEED);
  EXPECT_FALSE(controller_->WaitForSettled(300, 2000));
}

// ═══════════════════════════════════════════════════════════════════════════
// Zero Point Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PtzControllerTest, SetHomeMakesCurrentPositionZero) {
  InitController();
  transport_->AddReply({PanResponse(30.0)});
  transport_->AddReply({TiltResponse(10.0)});

  ASSERT_TRUE(controller_->SetHome());

  transport_->AddReply({PanResponse(30.0)});
  transport_->AddReply({TiltResponse(10.0)});
  const RelativePosition rel = controller_->GetRelativePosition();

  EXPECT_NEAR(rel.pan_deg, 0.0, 1e-9);
  EXPECT_NEAR(rel.tilt_deg, 0.0, 1e-9);
  EXPECT_NEAR(rel.absolute.pan_deg, 30.0, 1e-9);
  EXPECT_NEAR(rel.absolute.tilt_deg, 10.0, 1e-9);
  EXPECT_TRUE(rel.status.pan_valid);
  EXPECT_TRUE(rel.status.tilt_valid);
  EXPECT_FALSE(rel.status.estimated);
}

TEST_F(PtzControllerTest, SetHomeIsIdempotent) {
  InitController();
  for (int i = 0; i < 2; ++i) {
    transport_->AddReply({PanResponse(200.0)});
    transport_->AddReply({TiltResponse(-20.0)});
    ASSERT_TRUE(controller_->SetHome());
  }

  const ZeroPoint zero = controller_->GetZeroPoint();
  EXPECT_DOUBLE_EQ(zero.pan_deg, 200.0);
  EXPECT_DOUBLE_EQ(zero.tilt_deg, -20.0);
}

TEST_F(PtzControllerTest, SetHomeKeepsOldValueForFailedAxis) {
  InitController(0.0, 5.0);
  transport_->AddReply({PanResponse(30.0)});
  transport_->AddSilence();

  EXPECT_FALSE(controller_->SetHome());

  const ZeroPoint zero = controller_->GetZeroPoint();
  EXPECT_DOUBLE_EQ(zero.pan_deg, 30.0);
  EXPECT_DOUBLE_EQ(zero.tilt_deg, 5.0) << "Failed read must not zero the axis";
  EXPECT_TRUE(platform_.HasEvent(LogEvent::HomeCaptureFailed));
}

TEST_F(PtzControllerTest, RelativePositionIsPlainDifference) {
  InitController(350.0, 0.0);
  transport_->AddReply({PanResponse(10.0)});
  transport_->AddReply({TiltResponse(20.0)});

  const RelativePosition rel = controller_->GetRelativePosition();

  EXPECT_NEAR(rel.pan_deg, -340.0, 1e-9) << "No wrap on relative pan";
  EXPECT_NEAR(rel.tilt_deg, 20.0, 1e-9);
}

TEST_F(PtzControllerTest, ValidityHeuristicAtZeroPosition) {
  InitController();
  transport_->AddReply({PanResponse(0.0)});
  transport_->AddReply({TiltResponse(0.0)});

  const RelativePosition rel = controller_->GetRelativePosition();

  EXPECT_FALSE(rel.status.pan_valid) << "Pan exactly 0 reads as invalid";
  EXPECT_TRUE(rel.status.tilt_valid) << "Tilt 0 arrives as raw 36000";
}

TEST_F(PtzControllerTest, ValidityFlagsOnFailedQueries) {
  InitController();
  transport_->AddSilence();
  transport_->AddSilence();

  const RelativePosition rel = controller_->GetRelativePosition();

  EXPECT_FALSE(rel.status.pan_valid);
  EXPECT_FALSE(rel.status.tilt_valid);
  EXPECT_DOUBLE_EQ(rel.pan_deg, 0.0);
}

TEST_F(PtzControllerTest, TryGetRelativePositionHonoursBusBudget) {
  InitController();
  std::promise<void> held;
  std::promise<void> release;
  std::thread holder([&] {
    auto bus = transport_->AcquireBus();
    held.set_value();
    release.get_future().wait();
  });
  held.get_future().wait();

  const auto result = controller_->TryGetRelativePosition(20, 80);

  release.set_value();
  holder.join();
  EXPECT_FALSE(result.has_value()) << "Busy bus yields no sample";
}

// ═══════════════════════════════════════════════════════════════════════════
// Config Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(ControllerConfigTest, DefaultsAreValid) {
  const ControllerConfig config;
  EXPECT_TRUE(config.IsValid());
  EXPECT_DOUBLE_EQ(config.tolerance_deg, 0.2);
  EXPECT_EQ(config.poll_interval_ms, 50u);
  EXPECT_EQ(config.max_wait_ms, 5000u);
}

TEST(ControllerConfigTest, RejectsInconsistentValues) {
  EXPECT_FALSE((ControllerConfig{.tolerance_deg = 0.0}).IsValid());
  EXPECT_FALSE((ControllerConfig{.poll_interval_ms = 100, .max_wait_ms = 50})
                    .IsValid());
  EXPECT_FALSE((ControllerConfig{.default_speed = 0x40}).IsValid());
}
