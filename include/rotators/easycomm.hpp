#pragma once

#include "RotatorCommon.hpp"
#include "PositionStore.hpp"
#include "rotators/MotionPlanner.hpp"
#include <map>
#include <set>
#include <vector>

#define EASYCOMM_VERSION_STRING "PELTRACK 1.0"

enum EasyCommKind {
  EASYCOMM_EMPTY,
  EASYCOMM_REQUEST,
  EASYCOMM_VERSION,
  EASYCOMM_INVALID
};

struct EasyCommCommand {
  EasyCommKind kind = EASYCOMM_EMPTY;
  RotatorRequest request;  // valid for EASYCOMM_REQUEST
  std::string error;       // valid for EASYCOMM_INVALID
};

// Parses one EasyComm line (terminator already stripped).
//
//   AZ EL               query position (either keyword alone also queries)
//   AZ<az> EL<el>       set both axes
//   AZ<az> | EL<el>     set one axis
//   SA SE               stop
//   VE                  version
//
// Keywords are case-insensitive. EasyComm I trailing fields (UP..., DN...,
// XXX) are accepted and ignored.
EasyCommCommand easycommParse(const std::string &line);

// "AZ<az> EL<el>\n" with one decimal
std::string easycommFormatPosition(Position pos);

// Runs one line through the parser and handler; returns the reply, which is
// empty for a blank line.
std::string easycommHandleLine(
  const std::string &line,
  const std::function<RotatorResponse(RotatorRequest)> &handler
);

// Request handler that serves EasyComm clients from planner. Queries and
// stops are answered synchronously; set targets are clamped to the store's
// limits, queued on the planner and acknowledged at once, with the reply
// position carrying the clamped target.
std::function<RotatorResponse(RotatorRequest)> makeEasyCommHandler(MotionPlanner &planner, PositionStore &store);

class easycomm : public PseudoRotator {
private:
  std::string tcpHost;
  int tcpPort;
  int boundPort = 0;

  int sock = -1;
  std::atomic<bool> sockActive{false};
  std::atomic<bool> threadClosing{false};
  std::atomic<bool> threadExited{true};

  std::thread worker;

  std::mutex clientMutex;
  uint64_t nextClientId = 0;
  std::map<uint64_t, std::thread> clientWorkers;
  std::vector<uint64_t> finishedClients;  // exited, waiting to be joined
  std::set<int> clientSocks;

  std::function<RotatorResponse(RotatorRequest)> requestHandler;

  bool connStart();
  void connTerminate();
  static void connThreadMain(easycomm *self, int connSock, struct sockaddr_in clientAddr);
  void reapClients();
  static void threadMain(easycomm *self);

public:
  ~easycomm() override;

  // port 0 binds an ephemeral port, see BoundPort()
  void Initialize(std::string tcpHost, int tcpPort);

  // false if the listening socket could not be set up
  virtual bool Start() override;
  // stops accepting, closes every client connection and joins all threads;
  // motion already handed to the request handler is not touched
  virtual void Terminate() override;
  virtual bool SetRequestHandler(std::function<RotatorResponse(RotatorRequest)> callback) override;

  int BoundPort() const;
};
