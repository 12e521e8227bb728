#pragma once

#include "RotatorCommon.hpp"

struct Limits {
  double aziMin;
  double aziMax;
  double eleMin;
  double eleMax;
};

struct SpeedConfig {
  double aziSpeedDps;
  double eleSpeedDps;
};

// Tracked rotor state shared by every component. The rotor has no position
// sensor, so the position held here is whatever the motion planner last
// committed by dead reckoning.
class PositionStore {
private:
  mutable std::mutex mutex;

  Position position;
  Limits limits;
  SpeedConfig speeds;

public:
  // false if a bound pair is inverted or a speed is not positive
  bool Initialize(Limits limits, SpeedConfig speeds, Position initial);

  Position GetPosition() const;
  // clamped to the current limits
  Position SetPosition(Position pos);

  Limits GetLimits() const;
  SpeedConfig GetSpeeds() const;

  // "AZIMUTH_SPEED_DPS" or "ELEVATION_SPEED_DPS"
  std::optional<double> GetConfig(const std::string &key) const;

  Position Clamp(Position pos) const;

  // moves the elevation floor to the current elevation; returns the new floor
  double CaptureHorizon();

  static Position ClampTo(const Limits &limits, Position pos);
};
