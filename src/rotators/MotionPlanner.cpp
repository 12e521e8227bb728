#include "rotators/MotionPlanner.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

struct AxisDrive {
  bool active;
  int direction;
  double start;
  double target;
  double speed;
  double duration;
};

AxisDrive planAxis(double start, double target, double speed)
{
  AxisDrive d;
  d.start = start;
  d.target = target;
  d.speed = speed;
  d.duration = MotionPlanner::DriveDuration(target - start, speed);
  d.direction = (target > start) ? 1 : ((target < start) ? -1 : 0);
  d.active = d.direction != 0;
  return d;
}

RotatorResponse makeResponse(bool success, MoveStatus status, Position pos, const std::string &message)
{
  RotatorResponse resp;
  resp.success = success;
  resp.status = status;
  resp.position = pos;
  resp.message = message;
  return resp;
}

std::string formatPosition(const char *prefix, Position pos)
{
  char buf[96];
  snprintf(buf, sizeof(buf), "%s AZ %.1f EL %.1f", prefix, pos.azi, pos.ele);
  return buf;
}

}

MotionPlanner::~MotionPlanner()
{
  Terminate();
}

void MotionPlanner::Initialize(PositionStore *store, SerialTransport *link, const PlannerConfig &config)
{
  this->store = store;
  this->link = link;
  this->config = config;
  if (this->config.tickIntervalMs <= 0) {
    this->config.tickIntervalMs = 1;
  }
}

double MotionPlanner::DriveDuration(double delta, double speedDps)
{
  if (speedDps <= 0) {
    return 0;
  }
  return std::abs(delta) / speedDps;
}

double MotionPlanner::Interpolate(double start, double target, double speedDps, double elapsedSec)
{
  double delta = target - start;
  double travelled = speedDps * std::max(elapsedSec, 0.0);
  if (travelled >= std::abs(delta)) {
    return target;
  }
  return delta > 0 ? start + travelled : start - travelled;
}

bool MotionPlanner::sendFrame(const PelcoFrame &frame)
{
  if (link == nullptr) {
    fprintf(stderr, "MotionPlanner: no serial link\n");
    return false;
  }

  std::lock_guard<std::mutex> lk(serialMutex);
  return link->Write(frame);
}

MotionPlanner::DriveResult MotionPlanner::sendDriveFrame(const PelcoFrame &frame, uint64_t ticket)
{
  if (link == nullptr) {
    fprintf(stderr, "MotionPlanner: no serial link\n");
    return DRIVE_WRITE_FAILED;
  }

  // checked under the link lock so no drive frame follows a Stop() frame
  std::lock_guard<std::mutex> lk(serialMutex);
  if (shouldCancel(ticket)) {
    return DRIVE_SKIPPED;
  }
  return link->Write(frame) ? DRIVE_SENT : DRIVE_WRITE_FAILED;
}

bool MotionPlanner::shouldCancel(uint64_t ticket) const
{
  return cancelRequested.load() || threadClosing.load() || latestTicket.load() != ticket;
}

Position MotionPlanner::commit(Position pos, const PositionCallback &onPositionChange)
{
  Position committed = store->SetPosition(pos);
  if (onPositionChange) {
    onPositionChange(committed);
  }
  return committed;
}

void MotionPlanner::threadMain(MotionPlanner *self)
{
  while (true) {
    std::optional<MoveJob> job;

    // Wait on job
    {
      std::unique_lock<std::mutex> lk(self->jobEventMutex);
      self->jobEvent.wait(lk, [self]
                          { return (self->jobQueue.size() > 0) || (self->threadClosing.load()); });

      if (self->threadClosing.load()) {
        break;
      }
      job = self->jobQueue.pop();
    }

    if (!job.has_value()) {
      continue;
    }

    RotatorResponse resp = self->runJob(*job);
    if (job->callback) {
      job->callback(resp);
    }
  }

  // nothing may wait forever on a job we will never run
  while (auto job = self->jobQueue.pop()) {
    if (job->callback) {
      job->callback(makeResponse(false, MOVE_CANCELLED, self->store->GetPosition(), "Planner shutting down"));
    }
  }

  self->threadExited = true;
  printf("MotionPlanner Thread: exited.\n");
}

RotatorResponse MotionPlanner::runJob(const MoveJob &job)
{
  Position current = store->GetPosition();

  if (job.ticket != latestTicket.load()) {
    return makeResponse(false, MOVE_CANCELLED, current, "Move superseded by a newer request");
  }
  cancelRequested = false;

  if (job.req.cmd == RESET_POS) {
    // no motion, the rotor is declared to be at the reference
    Position pos = commit(config.reference, job.req.onPositionChange);
    RotatorResponse resp = makeResponse(true, MOVE_COMPLETED, pos, formatPosition("Position reset to", pos));
    printf("MotionPlanner Thread: %s\n", resp.message.c_str());
    return resp;
  }

  Position target = current;
  switch (job.req.cmd) {
  case CHANGE_POS:
    target.azi = job.req.payload.ChangePos.aziRequested;
    target.ele = job.req.payload.ChangePos.eleRequested;
    break;

  case CHANGE_AZI:
    target.azi = job.req.payload.ChangeAzi.aziRequested;
    break;

  case CHANGE_ELE:
    target.ele = job.req.payload.ChangeEle.eleRequested;
    break;

  case NUDGE: {
    int direction = job.req.payload.Nudge.direction >= 0 ? 1 : -1;
    double offset = direction * std::abs(job.req.payload.Nudge.degrees);
    if (job.req.payload.Nudge.axis == AXIS_AZI) {
      target.azi += offset;
    } else {
      target.ele += offset;
    }
    break;
  }

  case CALIBRATE:
    target = config.reference;
    break;

  default:
    fprintf(stderr, "Unknown command in MotionPlanner job. Ignore.\n");
    return makeResponse(false, MOVE_REJECTED, current, "Unknown command");
  }

  if (!std::isfinite(target.azi) || !std::isfinite(target.ele)) {
    return makeResponse(false, MOVE_REJECTED, current, "Target is not a number");
  }

  RotatorResponse resp = driveTo(target, job.req.onPositionChange, job.ticket);

  if (job.req.cmd == CALIBRATE && resp.status == MOVE_COMPLETED) {
    // absolute reset: the reference mark is where the rotor now physically is
    resp.position = commit(config.reference, job.req.onPositionChange);
    resp.message = formatPosition("Calibrated, position reset to", resp.position);
    printf("MotionPlanner Thread: %s\n", resp.message.c_str());
  }

  return resp;
}

RotatorResponse MotionPlanner::driveTo(Position target, const PositionCallback &onPositionChange, uint64_t ticket)
{
  target = store->Clamp(target);
  Position start = store->GetPosition();
  SpeedConfig speeds = store->GetSpeeds();

  AxisDrive axes[2];
  axes[AXIS_AZI] = planAxis(start.azi, target.azi, speeds.aziSpeedDps);
  axes[AXIS_ELE] = planAxis(start.ele, target.ele, speeds.eleSpeedDps);

  if (!axes[AXIS_AZI].active && !axes[AXIS_ELE].active) {
    Position pos = commit(target, onPositionChange);
    return makeResponse(true, MOVE_COMPLETED, pos, formatPosition("Already at", pos));
  }

  std::vector<std::vector<RotatorAxis>> phases;
  if (config.driveOrder == DRIVE_SEQUENTIAL) {
    RotatorAxis first = axes[AXIS_AZI].duration >= axes[AXIS_ELE].duration ? AXIS_AZI : AXIS_ELE;
    RotatorAxis second = first == AXIS_AZI ? AXIS_ELE : AXIS_AZI;
    phases.push_back({first});
    if (axes[second].active) {
      phases.push_back({second});
    }
  } else {
    std::vector<RotatorAxis> phase;
    for (RotatorAxis axis : {AXIS_AZI, AXIS_ELE}) {
      if (axes[axis].active) {
        phase.push_back(axis);
      }
    }
    phases.push_back(phase);
  }

  printf("MotionPlanner Thread: Moving AZ %.1f -> %.1f (%.2fs), EL %.1f -> %.1f (%.2fs)\n",
         start.azi, target.azi, axes[AXIS_AZI].duration,
         start.ele, target.ele, axes[AXIS_ELE].duration);

  status = ROTATING;

  const double tickSec = config.tickIntervalMs / 1000.0;
  Position current = start;
  bool cancelled = false;
  bool failed = false;

  for (const auto &phase : phases) {
    // restarted once the first drive frame is on the wire
    auto phaseStart = std::chrono::steady_clock::now();
    // 2: no drive frame sent yet in this phase
    int lastPan = 2, lastTilt = 2;

    while (true) {
      double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - phaseStart).count();
      int panDir = 0, tiltDir = 0;
      double nextEvent = tickSec;

      for (RotatorAxis axis : phase) {
        const AxisDrive &d = axes[axis];
        double value = Interpolate(d.start, d.target, d.speed, elapsed);
        if (axis == AXIS_AZI) {
          current.azi = value;
        } else {
          current.ele = value;
        }

        if (elapsed < d.duration) {
          if (axis == AXIS_AZI) {
            panDir = d.direction;
          } else {
            tiltDir = d.direction;
          }
          nextEvent = std::min(nextEvent, d.duration - elapsed);
        }
      }

      current = commit(current, onPositionChange);

      if (panDir == 0 && tiltDir == 0) {
        break;
      }

      if (shouldCancel(ticket)) {
        cancelled = true;
        break;
      }

      // a new frame only when the set of driving axes changes
      if (panDir != lastPan || tiltDir != lastTilt) {
        auto frame = pelcoDrive(config.address, panDir, tiltDir, config.aziSpeedByte, config.eleSpeedByte);
        DriveResult sent = sendDriveFrame(frame, ticket);
        if (sent == DRIVE_SKIPPED) {
          cancelled = true;
          break;
        }
        if (sent == DRIVE_WRITE_FAILED) {
          fprintf(stderr, "MotionPlanner Thread: drive frame write failed, aborting move\n");
          failed = true;
          break;
        }
        if (lastPan == 2) {
          phaseStart = std::chrono::steady_clock::now();
        }
        lastPan = panDir;
        lastTilt = tiltDir;
      }

      std::this_thread::sleep_for(std::chrono::duration<double>(nextEvent));
    }

    if (cancelled || failed) {
      break;
    }
  }

  // never retried: a repeated half-sent drive could run the rotor away
  bool stopSent = sendFrame(pelcoStop(config.address));
  if (!stopSent) {
    fprintf(stderr, "MotionPlanner Thread: stop frame write failed\n");
  }

  RotatorResponse resp;
  if (failed || !stopSent) {
    Position pos = store->GetPosition();
    resp = makeResponse(false, MOVE_FAILED, pos, formatPosition("Transport error: serial write failed, last known", pos));
  } else if (cancelled) {
    Position pos = store->GetPosition();
    resp = makeResponse(false, MOVE_CANCELLED, pos, formatPosition("Move cancelled at", pos));
  } else {
    Position pos = commit(target, onPositionChange);
    resp = makeResponse(true, MOVE_COMPLETED, pos, formatPosition("Moved to", pos));
  }

  status = IDLE;
  printf("MotionPlanner Thread: %s\n", resp.message.c_str());

  if (cancelled && config.settleMs > 0 && !threadClosing.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(config.settleMs));
  }

  return resp;
}

void MotionPlanner::Start()
{
  if (worker.joinable()) {
    return;
  }

  threadClosing = false;
  threadExited = false;
  worker = std::thread(MotionPlanner::threadMain, this);
  printf("MotionPlanner Initialized.\n");
}

bool MotionPlanner::Request(RotatorRequest req, std::function<void(RotatorResponse)> callback)
{
  if (req.cmd == GET_POS) {
    Position pos = store->GetPosition();
    if (callback) {
      callback(makeResponse(true, MOVE_COMPLETED, pos, formatPosition("Position", pos)));
    }
    return true;
  }

  if (req.cmd == STOP_MOTION) {
    Stop();
    if (callback) {
      callback(makeResponse(true, MOVE_COMPLETED, store->GetPosition(), "Rotor stopped."));
    }
    return true;
  }

  bool stopped = false;
  {
    std::lock_guard<std::mutex> lk(jobEventMutex);
    if (threadExited.load() || threadClosing.load()) {
      fprintf(stderr, "MotionPlanner: worker closed, unable to request\n");
      return false;
    }

    // Stop() bumps the generation under this lock: a request either sees the
    // stop here or is queued before it and superseded by it
    if (req.stopGeneration.has_value() && *req.stopGeneration != stopGeneration.load()) {
      stopped = true;
    } else {
      MoveJob job;
      job.req = std::move(req);
      job.callback = callback;
      // supersedes whatever is driving or queued
      job.ticket = ++latestTicket;
      jobQueue.push(std::move(job));
    }
  }

  if (stopped) {
    printf("MotionPlanner: request dropped, a stop came after it was issued\n");
    if (callback) {
      callback(makeResponse(false, MOVE_CANCELLED, store->GetPosition(), "Move cancelled by stop"));
    }
    return true;
  }

  jobEvent.notify_all();
  return true;
}

static RotatorResponse unwrap(const std::optional<RotatorResponse> &ret, Position pos)
{
  if (ret.has_value()) {
    return ret.value();
  }
  return makeResponse(false, MOVE_REJECTED, pos, "Motion planner is not running");
}

RotatorResponse MotionPlanner::MoveTo(double azi, double ele, PositionCallback onPositionChange)
{
  RotatorRequest req;
  req.cmd = CHANGE_POS;
  req.payload.ChangePos.aziRequested = azi;
  req.payload.ChangePos.eleRequested = ele;
  req.onPositionChange = std::move(onPositionChange);
  return unwrap(RequestSync(std::move(req)), store->GetPosition());
}

RotatorResponse MotionPlanner::Nudge(RotatorAxis axis, int direction, double degrees, PositionCallback onPositionChange)
{
  RotatorRequest req;
  req.cmd = NUDGE;
  req.payload.Nudge.axis = axis;
  req.payload.Nudge.direction = direction;
  req.payload.Nudge.degrees = degrees;
  req.onPositionChange = std::move(onPositionChange);
  return unwrap(RequestSync(std::move(req)), store->GetPosition());
}

RotatorResponse MotionPlanner::Calibrate(PositionCallback onPositionChange)
{
  RotatorRequest req;
  req.cmd = CALIBRATE;
  req.onPositionChange = std::move(onPositionChange);
  return unwrap(RequestSync(std::move(req)), store->GetPosition());
}

RotatorResponse MotionPlanner::Reset(PositionCallback onPositionChange)
{
  Stop();
  RotatorRequest req;
  req.cmd = RESET_POS;
  req.onPositionChange = std::move(onPositionChange);
  return unwrap(RequestSync(std::move(req)), store->GetPosition());
}

void MotionPlanner::Stop()
{
  {
    std::lock_guard<std::mutex> lk(jobEventMutex);
    cancelRequested = true;
    ++latestTicket;
    ++stopGeneration;
  }

  if (!sendFrame(pelcoStop(config.address))) {
    fprintf(stderr, "MotionPlanner: stop frame write failed\n");
  }
  printf("MotionPlanner: Stop requested.\n");
}

RotatorResponse MotionPlanner::SetHorizon()
{
  double floor = store->CaptureHorizon();
  char buf[64];
  snprintf(buf, sizeof(buf), "Horizon set at EL %.1f", floor);
  printf("MotionPlanner: %s\n", buf);
  return makeResponse(true, MOVE_COMPLETED, store->GetPosition(), buf);
}

RotatorController::RotatorStatus MotionPlanner::Status() const
{
  return status.load();
}

uint64_t MotionPlanner::StopGeneration() const
{
  return stopGeneration.load();
}

const PlannerConfig &MotionPlanner::Config() const
{
  return config;
}

void MotionPlanner::Terminate()
{
  {
    std::lock_guard<std::mutex> lk(jobEventMutex);
    threadClosing = true;
  }
  jobEvent.notify_all();

  if (worker.joinable()) {
    worker.join();
  }
  threadExited = true;
}
