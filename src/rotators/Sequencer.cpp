#include "rotators/Sequencer.hpp"
#include <algorithm>
#include <string>

static SequenceStep moveStep(double azi, double ele, int dwellMs)
{
  SequenceStep step;
  step.request.cmd = CHANGE_POS;
  step.request.payload.ChangePos.aziRequested = azi;
  step.request.payload.ChangePos.eleRequested = ele;
  step.dwellMs = dwellMs;
  return step;
}

Sequencer::~Sequencer()
{
  Terminate();
}

void Sequencer::Initialize(MotionPlanner *planner)
{
  this->planner = planner;
}

bool Sequencer::interrupted(uint64_t stopGen) const
{
  return threadClosing.load() || planner->StopGeneration() != stopGen;
}

bool Sequencer::dwell(int ms, uint64_t stopGen) const
{
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  auto tick = std::chrono::milliseconds(std::max(planner->Config().tickIntervalMs, 1));

  while (std::chrono::steady_clock::now() < deadline) {
    if (interrupted(stopGen)) {
      return false;
    }
    auto remaining = deadline - std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(tick, remaining));
  }
  return !interrupted(stopGen);
}

void Sequencer::threadMain(
  Sequencer *self, std::string name, std::vector<SequenceStep> steps, uint64_t stopGen,
  PositionCallback onPositionChange, std::function<void(SequenceResult)> onDone)
{
  SequenceResult result;
  result.stepsTotal = steps.size();
  result.success = true;

  printf("Sequencer: %s started, %zu steps.\n", name.c_str(), steps.size());

  for (auto &step : steps) {
    if (self->interrupted(stopGen)) {
      result.success = false;
      result.message = name + " stopped";
      break;
    }

    // a Stop() between the check above and the queuing below still lands
    step.request.stopGeneration = stopGen;
    auto ret = self->planner->RequestSync(step.request);
    if (!ret.has_value()) {
      result.success = false;
      result.message = name + " aborted: motion planner is not running";
      break;
    }

    result.position = ret->position;
    if (onPositionChange) {
      onPositionChange(ret->position);
    }

    if (!ret->success) {
      // a transport error or a stop ends the sequence; the planner already
      // committed the last interpolated position
      result.success = false;
      result.message = name + " aborted at step " + std::to_string(result.stepsCompleted + 1) + ": " + ret->message;
      break;
    }

    result.stepsCompleted++;

    if (step.dwellMs > 0 && !self->dwell(step.dwellMs, stopGen)) {
      // the last step already finished; only a stop mid-sweep is a failure
      if (result.stepsCompleted < result.stepsTotal) {
        result.success = false;
        result.message = name + " stopped";
        break;
      }
    }
  }

  if (result.success) {
    result.message = name + " complete";
    printf("Sequencer: %s\n", result.message.c_str());
  } else {
    fprintf(stderr, "Sequencer: %s\n", result.message.c_str());
  }

  self->running = false;
  if (onDone) {
    onDone(result);
  }
}

bool Sequencer::Start(
  const std::string &name,
  std::vector<SequenceStep> steps,
  PositionCallback onPositionChange,
  std::function<void(SequenceResult)> onDone)
{
  std::lock_guard<std::mutex> lk(lifecycleMutex);
  if (running.load()) {
    fprintf(stderr, "Sequencer: %s rejected, a sequence is already running\n", name.c_str());
    return false;
  }

  if (worker.joinable()) {
    worker.join();
  }

  threadClosing = false;
  running = true;
  // taken here, not on the new thread, so a Stop() racing with Start() is seen
  uint64_t stopGen = planner->StopGeneration();
  worker = std::thread(
    Sequencer::threadMain, this, name, std::move(steps), stopGen,
    std::move(onPositionChange), std::move(onDone)
  );
  return true;
}

bool Sequencer::Running() const
{
  return running.load();
}

void Sequencer::WaitForClose()
{
  std::lock_guard<std::mutex> lk(lifecycleMutex);
  if (worker.joinable()) {
    worker.join();
  }
}

void Sequencer::Terminate()
{
  std::lock_guard<std::mutex> lk(lifecycleMutex);
  threadClosing = true;
  if (running.load() && planner != nullptr) {
    planner->Stop();
  }
  if (worker.joinable()) {
    worker.join();
  }
}

std::vector<SequenceStep> Sequencer::CalibrationSequence()
{
  SequenceStep step;
  step.request.cmd = CALIBRATE;
  step.dwellMs = 0;
  return {step};
}

std::vector<SequenceStep> Sequencer::DemoSequence(const Limits &limits, Position reference, int dwellMs)
{
  return {
    moveStep(reference.azi, reference.ele, dwellMs),
    moveStep(limits.aziMin, limits.eleMin, dwellMs),
    moveStep(limits.aziMax, limits.eleMin, dwellMs),
    moveStep(limits.aziMax, limits.eleMax, dwellMs),
    moveStep(limits.aziMin, limits.eleMax, dwellMs),
    moveStep(reference.azi, reference.ele, 0),
  };
}
