#pragma once

#include "RotatorCommon.hpp"
#include "PositionStore.hpp"
#include "rotators/SerialLink.hpp"

enum DriveOrder {
  DRIVE_SIMULTANEOUS,  // pan and tilt bits in the same frame
  DRIVE_SEQUENTIAL     // longer-duration axis first, then the other
};

struct PlannerConfig {
  uint8_t address = 0x01;
  int aziSpeedByte = 0x20;  // must match SpeedConfig::aziSpeedDps on the hardware
  int eleSpeedByte = 0x20;
  int tickIntervalMs = 100;
  int settleMs = 250;       // pause after a cancelled move before the next one
  DriveOrder driveOrder = DRIVE_SIMULTANEOUS;
  Position reference = {0.0, 90.0};  // calibration home
};

// Open-loop controller and sole writer of the serial link.
//
// Move requests are queued to a single worker thread, so at most one move is
// driving at a time. Each request gets a ticket; a newer ticket or Stop()
// cancels the driving move at its next tick, and queued moves that were
// superseded before they started resolve as cancelled without driving.
class MotionPlanner : public RotatorController {
private:
  PositionStore *store = nullptr;
  SerialTransport *link = nullptr;
  PlannerConfig config;

  std::atomic<bool> threadClosing{false};
  std::atomic<bool> threadExited{true};

  std::thread worker;

  struct MoveJob {
    RotatorRequest req;
    std::function<void(RotatorResponse)> callback;
    uint64_t ticket;
  };
  ThreadsafeQueue<MoveJob> jobQueue;

  // signal mechanism
  std::mutex jobEventMutex;
  std::condition_variable jobEvent;

  // one writer on the link at any instant
  std::mutex serialMutex;

  std::atomic<bool> cancelRequested{false};
  std::atomic<uint64_t> latestTicket{0};
  std::atomic<uint64_t> stopGeneration{0};
  std::atomic<RotatorStatus> status{IDLE};

  static void threadMain(MotionPlanner *self);

  RotatorResponse runJob(const MoveJob &job);
  RotatorResponse driveTo(Position target, const PositionCallback &onPositionChange, uint64_t ticket);
  enum DriveResult {
    DRIVE_SENT,
    DRIVE_SKIPPED,       // move was cancelled before the frame went out
    DRIVE_WRITE_FAILED
  };

  bool sendFrame(const PelcoFrame &frame);
  DriveResult sendDriveFrame(const PelcoFrame &frame, uint64_t ticket);
  bool shouldCancel(uint64_t ticket) const;
  Position commit(Position pos, const PositionCallback &onPositionChange);

public:
  ~MotionPlanner() override;

  void Initialize(PositionStore *store, SerialTransport *link, const PlannerConfig &config);

  virtual void Start() override;
  virtual void Terminate() override;
  virtual bool Request(RotatorRequest req, std::function<void(RotatorResponse)> callback) override;

  // blocking helpers over Request()
  RotatorResponse MoveTo(double azi, double ele, PositionCallback onPositionChange = nullptr);
  RotatorResponse Nudge(RotatorAxis axis, int direction, double degrees, PositionCallback onPositionChange = nullptr);
  RotatorResponse Calibrate(PositionCallback onPositionChange = nullptr);
  // halts motion, then declares the rotor to be at the reference without driving
  RotatorResponse Reset(PositionCallback onPositionChange = nullptr);

  // callable from any thread at any time; idempotent
  void Stop();

  RotatorResponse SetHorizon();

  RotatorStatus Status() const;
  uint64_t StopGeneration() const;
  const PlannerConfig &Config() const;

  // seconds needed to cover delta at speedDps
  static double DriveDuration(double delta, double speedDps);
  // dead-reckoned axis position after elapsedSec of driving from start toward target
  static double Interpolate(double start, double target, double speedDps, double elapsedSec);
};
