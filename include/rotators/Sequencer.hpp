#pragma once

#include "RotatorCommon.hpp"
#include "rotators/MotionPlanner.hpp"
#include <vector>

struct SequenceStep {
  RotatorRequest request;  // CHANGE_POS, CHANGE_AZI, CHANGE_ELE, NUDGE or CALIBRATE
  int dwellMs;             // pause after the step completes
};

struct SequenceResult {
  bool success = false;
  size_t stepsCompleted = 0;
  size_t stepsTotal = 0;
  Position position = {0.0, 0.0};
  std::string message;
};

// Runs a scripted list of planner requests on its own thread so a long
// sweep never blocks the command handlers. A MotionPlanner::Stop() issued
// by anyone aborts the sequence, whether a step is driving or dwelling.
class Sequencer {
private:
  MotionPlanner *planner = nullptr;

  std::mutex lifecycleMutex;
  std::thread worker;
  std::atomic<bool> running{false};
  std::atomic<bool> threadClosing{false};

  static void threadMain(
    Sequencer *self, std::string name, std::vector<SequenceStep> steps, uint64_t stopGen,
    PositionCallback onPositionChange, std::function<void(SequenceResult)> onDone
  );

  bool interrupted(uint64_t stopGen) const;
  bool dwell(int ms, uint64_t stopGen) const;

public:
  ~Sequencer();

  void Initialize(MotionPlanner *planner);

  // false if a sequence is already running. onDone runs on the sequencer
  // thread and must not call Start().
  bool Start(
    const std::string &name,
    std::vector<SequenceStep> steps,
    PositionCallback onPositionChange,
    std::function<void(SequenceResult)> onDone
  );

  bool Running() const;
  void WaitForClose();
  // stops the rotor if a sequence is in progress, then joins
  void Terminate();

  static std::vector<SequenceStep> CalibrationSequence();
  // range-of-motion sweep over the corners of limits, ending at reference
  static std::vector<SequenceStep> DemoSequence(const Limits &limits, Position reference, int dwellMs = 1000);
};
