#include "PositionStore.hpp"
#include <algorithm>

bool PositionStore::Initialize(Limits limits, SpeedConfig speeds, Position initial)
{
  if (limits.aziMin > limits.aziMax || limits.eleMin > limits.eleMax) {
    fprintf(stderr, "PositionStore: inverted limits az=[%lf, %lf] el=[%lf, %lf]\n",
            limits.aziMin, limits.aziMax, limits.eleMin, limits.eleMax);
    return false;
  }

  if (!(speeds.aziSpeedDps > 0) || !(speeds.eleSpeedDps > 0)) {
    fprintf(stderr, "PositionStore: speeds must be positive, az=%lf el=%lf\n",
            speeds.aziSpeedDps, speeds.eleSpeedDps);
    return false;
  }

  std::lock_guard<std::mutex> lk(mutex);
  this->limits = limits;
  this->speeds = speeds;
  this->position = ClampTo(limits, initial);
  return true;
}

Position PositionStore::GetPosition() const
{
  std::lock_guard<std::mutex> lk(mutex);
  return position;
}

Position PositionStore::SetPosition(Position pos)
{
  std::lock_guard<std::mutex> lk(mutex);
  position = ClampTo(limits, pos);
  return position;
}

Limits PositionStore::GetLimits() const
{
  std::lock_guard<std::mutex> lk(mutex);
  return limits;
}

SpeedConfig PositionStore::GetSpeeds() const
{
  std::lock_guard<std::mutex> lk(mutex);
  return speeds;
}

std::optional<double> PositionStore::GetConfig(const std::string &key) const
{
  std::lock_guard<std::mutex> lk(mutex);
  if (key == "AZIMUTH_SPEED_DPS") {
    return speeds.aziSpeedDps;
  } else if (key == "ELEVATION_SPEED_DPS") {
    return speeds.eleSpeedDps;
  }
  return {};
}

Position PositionStore::Clamp(Position pos) const
{
  std::lock_guard<std::mutex> lk(mutex);
  return ClampTo(limits, pos);
}

double PositionStore::CaptureHorizon()
{
  std::lock_guard<std::mutex> lk(mutex);
  // position is always inside limits, so eleMin <= eleMax still holds
  limits.eleMin = position.ele;
  return limits.eleMin;
}

Position PositionStore::ClampTo(const Limits &limits, Position pos)
{
  Position ret;
  ret.azi = std::min(std::max(pos.azi, limits.aziMin), limits.aziMax);
  ret.ele = std::min(std::max(pos.ele, limits.eleMin), limits.eleMax);
  return ret;
}
