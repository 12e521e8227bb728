#include <gtest/gtest.h>
#include "FakeSerialLink.hpp"
#include "PositionStore.hpp"
#include "rotators/MotionPlanner.hpp"
#include "rotators/Sequencer.hpp"
#include <future>

namespace {

const Limits kLimits = {0.0, 360.0, 45.0, 135.0};
const SpeedConfig kSpeeds = {1000.0, 500.0};

class SequencerTest : public ::testing::Test {
protected:
  PositionStore store;
  FakeSerialLink link;
  MotionPlanner planner;
  Sequencer sequencer;

  void SetUp() override
  {
    ASSERT_TRUE(store.Initialize(kLimits, kSpeeds, {0.0, 90.0}));
    PlannerConfig config;
    config.tickIntervalMs = 5;
    config.settleMs = 0;
    planner.Initialize(&store, &link, config);
    planner.Start();
    sequencer.Initialize(&planner);
  }

  std::future<SequenceResult> Run(const std::string &name, std::vector<SequenceStep> steps, PositionCallback cb = nullptr)
  {
    auto promise = std::make_shared<std::promise<SequenceResult>>();
    EXPECT_TRUE(sequencer.Start(name, std::move(steps), std::move(cb),
      [promise](SequenceResult result) { promise->set_value(result); }));
    return promise->get_future();
  }
};

SequenceStep moveStep(double azi, double ele, int dwellMs)
{
  SequenceStep step;
  step.request.cmd = CHANGE_POS;
  step.request.payload.ChangePos.aziRequested = azi;
  step.request.payload.ChangePos.eleRequested = ele;
  step.dwellMs = dwellMs;
  return step;
}

}

TEST(SequencerScripts, DemoSweepsTheCornersOfTheLimits) {
  auto steps = Sequencer::DemoSequence(kLimits, {0.0, 90.0}, 500);
  ASSERT_EQ(steps.size(), 6u);

  EXPECT_EQ(steps.front().request.cmd, CHANGE_POS);
  EXPECT_DOUBLE_EQ(steps[1].request.payload.ChangePos.aziRequested, 0.0);
  EXPECT_DOUBLE_EQ(steps[1].request.payload.ChangePos.eleRequested, 45.0);
  EXPECT_DOUBLE_EQ(steps[3].request.payload.ChangePos.aziRequested, 360.0);
  EXPECT_DOUBLE_EQ(steps[3].request.payload.ChangePos.eleRequested, 135.0);
  EXPECT_DOUBLE_EQ(steps.back().request.payload.ChangePos.eleRequested, 90.0);
  EXPECT_EQ(steps[0].dwellMs, 500);
  EXPECT_EQ(steps.back().dwellMs, 0);
}

TEST_F(SequencerTest, CalibrationResetsToReferenceExactly) {
  store.SetPosition({211.3, 118.9});

  SequenceResult result = Run("Calibration", Sequencer::CalibrationSequence()).get();
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.stepsCompleted, 1u);

  Position pos = store.GetPosition();
  EXPECT_EQ(pos.azi, 0.0);
  EXPECT_EQ(pos.ele, 90.0);
}

TEST_F(SequencerTest, DemoRunsEveryStepAndReportsPositions) {
  std::vector<Position> seen;
  SequenceResult result = Run("Demo", Sequencer::DemoSequence(kLimits, {0.0, 90.0}, 1),
    [&seen](Position pos) { seen.push_back(pos); }).get();

  EXPECT_TRUE(result.success) << result.message;
  EXPECT_EQ(result.stepsCompleted, 6u);
  ASSERT_EQ(seen.size(), 6u);
  EXPECT_DOUBLE_EQ(seen[2].azi, 360.0);
  EXPECT_DOUBLE_EQ(seen[2].ele, 45.0);
  EXPECT_DOUBLE_EQ(seen.back().azi, 0.0);
  EXPECT_DOUBLE_EQ(seen.back().ele, 90.0);
}

TEST_F(SequencerTest, StopDuringDwellAbortsRemainingSteps) {
  std::promise<void> firstDone;
  auto firstDoneFuture = firstDone.get_future();
  bool signalled = false;

  auto result = Run("Script", {moveStep(10.0, 90.0, 5000), moveStep(20.0, 90.0, 0)},
    [&](Position) {
      if (!signalled) {
        signalled = true;
        firstDone.set_value();
      }
    });

  firstDoneFuture.wait();
  planner.Stop();

  ASSERT_EQ(result.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  SequenceResult r = result.get();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.stepsCompleted, 1u);
  EXPECT_DOUBLE_EQ(store.GetPosition().azi, 10.0);
}

TEST_F(SequencerTest, StopDuringStepCancelsTheMove) {
  auto result = Run("Script", {moveStep(360.0, 90.0, 0), moveStep(0.0, 90.0, 0)});

  for (int i = 0; i < 1000 && planner.Status() != RotatorController::ROTATING; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  planner.Stop();

  SequenceResult r = result.get();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.stepsCompleted, 0u);
  EXPECT_LT(store.GetPosition().azi, 360.0);

  // planner is free for the next command source
  EXPECT_TRUE(planner.MoveTo(5.0, 90.0).success);
}

TEST_F(SequencerTest, OnlyOneSequenceAtATime) {
  auto first = Run("Long", {moveStep(360.0, 90.0, 0)});
  EXPECT_FALSE(sequencer.Start("Second", {moveStep(0.0, 90.0, 0)}, nullptr, nullptr));
  first.get();
  sequencer.WaitForClose();
  EXPECT_FALSE(sequencer.Running());
}

TEST_F(SequencerTest, TransportErrorAbortsSequence) {
  link.FailAfter(0);

  SequenceResult r = Run("Script", {moveStep(50.0, 90.0, 0), moveStep(100.0, 90.0, 0)}).get();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.stepsCompleted, 0u);
  EXPECT_NE(r.message.find("Transport error"), std::string::npos) << r.message;
  EXPECT_DOUBLE_EQ(store.GetPosition().azi, 0.0);
}

TEST_F(SequencerTest, StopAtAnyPointHaltsTheSequence) {
  std::vector<SequenceStep> steps;
  for (int i = 0; i < 40; i++) {
    steps.push_back(moveStep(i % 2 ? 0.0 : 20.0, 90.0, 0));
  }

  for (int attempt = 0; attempt < 20; attempt++) {
    auto result = Run("Script", steps);
    std::this_thread::sleep_for(std::chrono::microseconds(500 * attempt));
    planner.Stop();
    size_t drives = link.DriveCount();

    SequenceResult r = result.get();
    sequencer.WaitForClose();
    EXPECT_EQ(link.DriveCount(), drives) << "attempt " << attempt;
    EXPECT_LT(r.stepsCompleted, steps.size());
  }
}
