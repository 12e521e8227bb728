#include <popl.hpp>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include "PositionStore.hpp"
#include "rotators/MotionPlanner.hpp"
#include "rotators/Sequencer.hpp"
#include "rotators/SerialLink.hpp"
#include "rotators/easycomm.hpp"
#include "RotatorCommon.hpp"

int main(int argc, char *argv[]) {
  popl::OptionParser op("Allowed options");
  auto helpOption   = op.add<popl::Switch>("h", "help", "produce help message");
  auto serialPort   = op.add<popl::Value<std::string>>("p", "port", "Serial port of the rotor (e.g. /dev/ttyUSB0)");
  auto serialBaud   = op.add<popl::Value<int>>("b", "baud", "Serial baud rate", 2400);
  auto pelcoAddress = op.add<popl::Value<int>>("", "address", "Pelco-D address of the rotor", 1);
  auto srcTcpHost = op.add<popl::Value<std::string>>("", "easycomm-tcp-host", "TCP host to bind for EasyComm clients", "0.0.0.0");
  auto srcTcpPort = op.add<popl::Value<int>>("", "easycomm-tcp-port", "TCP port to bind for EasyComm clients", 4533);
  auto aziSpeed = op.add<popl::Value<double>>("", "az-speed-dps", "azimuth speed in degrees per second", 6.0);
  auto eleSpeed = op.add<popl::Value<double>>("", "el-speed-dps", "elevation speed in degrees per second", 3.0);
  auto aziSpeedByte = op.add<popl::Value<int>>("", "az-speed-byte", "Pelco pan speed byte (0-63)", 0x20);
  auto eleSpeedByte = op.add<popl::Value<int>>("", "el-speed-byte", "Pelco tilt speed byte (0-63)", 0x20);
  auto aziMin = op.add<popl::Value<double>>("", "az-min", "azimuth lower limit", 0.0);
  auto aziMax = op.add<popl::Value<double>>("", "az-max", "azimuth upper limit", 360.0);
  auto eleMin = op.add<popl::Value<double>>("", "el-min", "elevation lower limit", 45.0);
  auto eleMax = op.add<popl::Value<double>>("", "el-max", "elevation upper limit", 135.0);
  auto tickMs = op.add<popl::Value<int>>("", "tick-ms", "dead reckoning update interval (ms)", 100);
  auto settleMs = op.add<popl::Value<int>>("", "settle-ms", "pause after a cancelled move (ms)", 250);
  auto driveOrder = op.add<popl::Value<std::string>>("", "drive-order", "simultaneous or sequential", "simultaneous");
  auto calibrateOnStart = op.add<popl::Switch>("", "calibrate-on-start", "Home the rotor before serving clients");
  auto runDemo = op.add<popl::Switch>("", "demo", "Run the range-of-motion demo sequence");

  try {
    op.parse(argc, argv);
  } catch (const popl::invalid_option &e) {
    std::cerr << "Invalid option: " << e.what() << "\n" << op << "\n";
    return 1;
  }

  std::cout << "PelTrack: Pelco-D rotor controller with EasyComm server" << std::endl;

  // print auto-generated help message
  if (helpOption->is_set()) {
    std::cout << op << "\n";
    return 0;
  }

  if (!serialPort->is_set()) {
    std::cerr << "--port is required\n" << op << "\n";
    return 1;
  }

  PlannerConfig plannerConfig;
  plannerConfig.address = (uint8_t)pelcoAddress->value();
  plannerConfig.aziSpeedByte = aziSpeedByte->value();
  plannerConfig.eleSpeedByte = eleSpeedByte->value();
  plannerConfig.tickIntervalMs = tickMs->value();
  plannerConfig.settleMs = settleMs->value();
  if (driveOrder->value() == "sequential") {
    plannerConfig.driveOrder = DRIVE_SEQUENTIAL;
  } else if (driveOrder->value() == "simultaneous") {
    plannerConfig.driveOrder = DRIVE_SIMULTANEOUS;
  } else {
    std::cerr << "--drive-order must be simultaneous or sequential\n";
    return 1;
  }

  Limits limits = {aziMin->value(), aziMax->value(), eleMin->value(), eleMax->value()};
  SpeedConfig speeds = {aziSpeed->value(), eleSpeed->value()};

  PositionStore store;
  if (!store.Initialize(limits, speeds, plannerConfig.reference)) {
    return 1;
  }

  TermiosSerialLink serial;
  if (!serial.Open(serialPort->value(), serialBaud->value())) {
    fprintf(stderr, "[Pipeline] Serial link unavailable, no motion is possible. Exiting.\n");
    return 2;
  }

  // handled by sigwait below; blocked before any thread starts so every
  // thread inherits the mask
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  signal(SIGPIPE, SIG_IGN);

  MotionPlanner planner;
  planner.Initialize(&store, &serial, plannerConfig);
  planner.Start();

  Sequencer sequencer;
  sequencer.Initialize(&planner);

  auto printPosition = [](Position pos) {
    printf("[Pipeline] Position AZ %.1f EL %.1f\n", pos.azi, pos.ele);
  };

  easycomm source;
  source.Initialize(srcTcpHost->value(), srcTcpPort->value());

  source.SetRequestHandler(makeEasyCommHandler(planner, store));

  if (!source.Start()) {
    planner.Terminate();
    serial.Close();
    return 1;
  }

  if (calibrateOnStart->is_set() || runDemo->is_set()) {
    std::vector<SequenceStep> steps;
    if (calibrateOnStart->is_set()) {
      steps = Sequencer::CalibrationSequence();
    }
    if (runDemo->is_set()) {
      auto demo = Sequencer::DemoSequence(store.GetLimits(), plannerConfig.reference);
      steps.insert(steps.end(), demo.begin(), demo.end());
    }

    sequencer.Start(runDemo->is_set() ? "Demo" : "Calibration", steps, printPosition,
      [](SequenceResult result) {
        printf("[Pipeline] %s (%zu/%zu steps)\n", result.message.c_str(), result.stepsCompleted, result.stepsTotal);
      });
  }

  int sig = 0;
  sigwait(&signals, &sig);
  printf("[Pipeline] Signal %d received, shutting down.\n", sig);

  source.Terminate();
  sequencer.Terminate();
  planner.Terminate();
  planner.Stop();
  serial.Close();

  return 0;
}
