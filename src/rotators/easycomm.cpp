#include "rotators/easycomm.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

// longest line we buffer before giving up on finding its terminator
static const size_t MAX_LINE_LENGTH = 128;

static bool parseNumber(const std::string &text, double *value)
{
  if (text.empty()) {
    return false;
  }

  char *end = nullptr;
  errno = 0;
  double v = strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(v)) {
    return false;
  }

  *value = v;
  return true;
}

static bool startsWith(const std::string &s, const char *prefix)
{
  return s.compare(0, strlen(prefix), prefix) == 0;
}

EasyCommCommand easycommParse(const std::string &line)
{
  EasyCommCommand ret;
  ret.request.cmd = GET_POS;

  bool any = false;
  bool query = false, stop = false, version = false;
  bool setAzi = false, setEle = false;
  double azi = 0, ele = 0;

  std::istringstream in(line);
  std::string token;
  while (in >> token) {
    any = true;
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });

    if (token == "AZ" || token == "EL") {
      query = true;
    } else if (token == "SA" || token == "SE") {
      stop = true;
    } else if (token == "VE") {
      version = true;
    } else if (startsWith(token, "AZ")) {
      if (!parseNumber(token.substr(2), &azi)) {
        ret.kind = EASYCOMM_INVALID;
        ret.error = "Invalid azimuth '" + token.substr(2) + "'";
        return ret;
      }
      setAzi = true;
    } else if (startsWith(token, "EL")) {
      if (!parseNumber(token.substr(2), &ele)) {
        ret.kind = EASYCOMM_INVALID;
        ret.error = "Invalid elevation '" + token.substr(2) + "'";
        return ret;
      }
      setEle = true;
    } else if (startsWith(token, "UP") || startsWith(token, "DN") || token == "XXX") {
      // EasyComm I uplink/downlink fields, no rotator meaning
      continue;
    } else {
      ret.kind = EASYCOMM_INVALID;
      ret.error = "Unknown command '" + token + "'";
      return ret;
    }
  }

  if (!any) {
    ret.kind = EASYCOMM_EMPTY;
    return ret;
  }

  ret.kind = EASYCOMM_REQUEST;
  if (setAzi && setEle) {
    ret.request.cmd = CHANGE_POS;
    ret.request.payload.ChangePos.aziRequested = azi;
    ret.request.payload.ChangePos.eleRequested = ele;
  } else if (setAzi) {
    ret.request.cmd = CHANGE_AZI;
    ret.request.payload.ChangeAzi.aziRequested = azi;
  } else if (setEle) {
    ret.request.cmd = CHANGE_ELE;
    ret.request.payload.ChangeEle.eleRequested = ele;
  } else if (stop) {
    ret.request.cmd = STOP_MOTION;
  } else if (query) {
    ret.request.cmd = GET_POS;
  } else if (version) {
    ret.kind = EASYCOMM_VERSION;
  } else {
    ret.kind = EASYCOMM_INVALID;
    ret.error = "No command";
  }

  return ret;
}

std::string easycommFormatPosition(Position pos)
{
  char buf[64];
  snprintf(buf, sizeof(buf), "AZ%.1f EL%.1f\n", pos.azi, pos.ele);
  return buf;
}

std::string easycommHandleLine(
  const std::string &line,
  const std::function<RotatorResponse(RotatorRequest)> &handler)
{
  EasyCommCommand cmd = easycommParse(line);

  switch (cmd.kind) {
  case EASYCOMM_EMPTY:
    return "";

  case EASYCOMM_INVALID:
    return "ERR " + cmd.error + "\n";

  case EASYCOMM_VERSION:
    return std::string("VE") + EASYCOMM_VERSION_STRING + "\n";

  case EASYCOMM_REQUEST:
    break;
  }

  if (!handler) {
    return "ERR No request handler\n";
  }

  bool isQuery = cmd.request.cmd == GET_POS;
  RotatorResponse resp = handler(cmd.request);
  if (!resp.success) {
    return "ERR " + (resp.message.empty() ? std::string("Request failed") : resp.message) + "\n";
  }

  if (isQuery) {
    return easycommFormatPosition(resp.position);
  }
  return "OK\n";
}

std::function<RotatorResponse(RotatorRequest)> makeEasyCommHandler(MotionPlanner &planner, PositionStore &store)
{
  return [&planner, &store](RotatorRequest req) -> RotatorResponse {
    RotatorResponse resp;

    if (req.cmd == GET_POS || req.cmd == STOP_MOTION) {
      auto ret = planner.RequestSync(req);
      if (!ret.has_value()) {
        resp.message = "Motion planner is not running";
        return resp;
      }
      return ret.value();
    }

    // out-of-range targets are clamped here, never refused
    Position target = store.GetPosition();
    if (req.cmd == CHANGE_POS) {
      target = store.Clamp({req.payload.ChangePos.aziRequested, req.payload.ChangePos.eleRequested});
      req.payload.ChangePos.aziRequested = target.azi;
      req.payload.ChangePos.eleRequested = target.ele;
      printf("easycomm: Requested new position, newAzi=%lf, newEle=%lf\n", target.azi, target.ele);
    } else if (req.cmd == CHANGE_AZI) {
      target = store.Clamp({req.payload.ChangeAzi.aziRequested, target.ele});
      req.payload.ChangeAzi.aziRequested = target.azi;
      printf("easycomm: Requested new Azi change, newAzi=%lf\n", target.azi);
    } else if (req.cmd == CHANGE_ELE) {
      target = store.Clamp({target.azi, req.payload.ChangeEle.eleRequested});
      req.payload.ChangeEle.eleRequested = target.ele;
      printf("easycomm: Requested new Ele change, newEle=%lf\n", target.ele);
    }

    // moves run on the planner thread; the client only gets the ack
    bool queued = planner.Request(req, [](RotatorResponse result) {
      if (!result.success) {
        fprintf(stderr, "easycomm: %s\n", result.message.c_str());
      }
    });

    resp.success = queued;
    resp.status = queued ? MOVE_COMPLETED : MOVE_REJECTED;
    resp.position = target;
    if (!queued) {
      resp.message = "Motion planner is not running";
    }
    return resp;
  };
}

easycomm::~easycomm()
{
  Terminate();
}

void easycomm::Initialize(std::string tcpHost, int tcpPort)
{
  this->tcpHost = tcpHost;
  this->tcpPort = tcpPort;
}

bool easycomm::connStart()
{
  sock = socket(PF_INET, SOCK_STREAM, IPPROTO_TCP);
  if (sock == -1) {
    SOCKET_PRINT_ERROR("Error creating socket");
    return false;
  }

  int reuse = 1;
  if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    SOCKET_PRINT_ERROR("easycomm: setsockopt(SO_REUSEADDR)");
  }

  struct sockaddr_in serverAddr;
  memset(&serverAddr, 0, sizeof(serverAddr));
  serverAddr.sin_family = AF_INET;
  serverAddr.sin_port = htons(tcpPort);
  if (inet_pton(AF_INET, tcpHost.c_str(), &serverAddr.sin_addr) != 1) {
    fprintf(stderr, "easycomm: invalid bind address %s\n", tcpHost.c_str());
    CLOSE_SOCKET(sock);
    sock = -1;
    return false;
  }

  if (bind(sock, (struct sockaddr *)&serverAddr, sizeof(serverAddr)) < 0) {
    fprintf(stderr, "easycomm: error binding to %s:%d: %s\n", tcpHost.c_str(), tcpPort, strerror(errno));
    CLOSE_SOCKET(sock);
    sock = -1;
    return false;
  }

  if (listen(sock, SOMAXCONN) < 0) {
    fprintf(stderr, "easycomm: error listening to port %d\n", tcpPort);
    CLOSE_SOCKET(sock);
    sock = -1;
    return false;
  }

  socklen_t addrLen = sizeof(serverAddr);
  if (getsockname(sock, (struct sockaddr *)&serverAddr, &addrLen) == 0) {
    boundPort = ntohs(serverAddr.sin_port);
  } else {
    boundPort = tcpPort;
  }

  sockActive = true;
  return true;
}

void easycomm::connTerminate()
{
  if (sock >= 0) {
    CLOSE_SOCKET(sock);
    sock = -1;
  }
  sockActive = false;
}

void easycomm::reapClients()
{
  std::vector<std::thread> done;
  {
    std::lock_guard<std::mutex> lk(clientMutex);
    for (uint64_t id : finishedClients) {
      auto it = clientWorkers.find(id);
      if (it != clientWorkers.end()) {
        done.push_back(std::move(it->second));
        clientWorkers.erase(it);
      }
    }
    finishedClients.clear();
  }

  for (auto &t : done) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void easycomm::threadMain(easycomm *self)
{
  while (!self->threadClosing.load()) {
    struct sockaddr_in clientAddr;
    socklen_t clientAddrLen = sizeof(clientAddr);
    int connSock = accept(self->sock, (struct sockaddr *)&clientAddr, &clientAddrLen);

    if (connSock < 0) {
      if (self->threadClosing.load()) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      fprintf(stderr, "easycomm Thread: error accepting: %s\n", strerror(errno));
      break;
    }

    self->reapClients();

    char str[INET_ADDRSTRLEN];
    printf("easycomm Thread: New connection from %s at PORT %d\n",
           inet_ntop(AF_INET, &clientAddr.sin_addr, str, sizeof(str)),
           ntohs(clientAddr.sin_port));

    std::lock_guard<std::mutex> lk(self->clientMutex);
    if (self->threadClosing.load()) {
      CLOSE_SOCKET(connSock);
      break;
    }

    uint64_t id = self->nextClientId++;
    self->clientSocks.insert(connSock);
    self->clientWorkers[id] = std::thread(
      [](easycomm *self, int connSock, struct sockaddr_in clientAddr, uint64_t id) {
        easycomm::connThreadMain(self, connSock, clientAddr);

        std::lock_guard<std::mutex> lk(self->clientMutex);
        self->clientSocks.erase(connSock);
        CLOSE_SOCKET(connSock);
        self->finishedClients.push_back(id);
        printf("easycomm Thread: Client exited.\n");
      },
      self, connSock, clientAddr, id
    );
  }

  self->threadExited = true;
}

void easycomm::connThreadMain(easycomm *self, int connSock, struct sockaddr_in clientAddr)
{
  (void)clientAddr;
  std::string pending;
  char buf[256];

  while (!self->threadClosing.load()) {
    ssize_t n = recv(connSock, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      // peer closed, or Terminate() shut the socket down
      return;
    }

    pending.append(buf, n);

    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, pos);
      pending.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }

      std::string reply = easycommHandleLine(line, self->requestHandler);
      if (reply.empty()) {
        continue;
      }

      if (send_fixed(connSock, reply.c_str(), reply.size(), MSG_NOSIGNAL) < 0) {
        fprintf(stderr, "easycomm Thread: failed to send response.\n");
        return;
      }
    }

    if (pending.size() > MAX_LINE_LENGTH) {
      pending.clear();
      std::string reply = "ERR Line too long\n";
      if (send_fixed(connSock, reply.c_str(), reply.size(), MSG_NOSIGNAL) < 0) {
        fprintf(stderr, "easycomm Thread: failed to send response.\n");
        return;
      }
    }
  }
}

bool easycomm::Start()
{
  if (worker.joinable()) {
    return true;
  }

  if (!connStart()) {
    fprintf(stderr, "easycomm: Error binding to target\n");
    return false;
  }

  threadClosing = false;
  threadExited = false;
  worker = std::thread(easycomm::threadMain, this);
  printf("easycomm Initialized, listening on %s:%d.\n", tcpHost.c_str(), boundPort);
  return true;
}

void easycomm::Terminate()
{
  threadClosing = true;

  // wakes accept()
  if (sockActive.load()) {
    shutdown(sock, SHUT_RDWR);
  }
  if (worker.joinable()) {
    worker.join();
  }
  connTerminate();

  std::map<uint64_t, std::thread> workers;
  {
    std::lock_guard<std::mutex> lk(clientMutex);
    // wakes each recv(); the client thread closes its own socket
    for (int fd : clientSocks) {
      shutdown(fd, SHUT_RDWR);
    }
    workers.swap(clientWorkers);
    finishedClients.clear();
  }

  for (auto &entry : workers) {
    if (entry.second.joinable()) {
      entry.second.join();
    }
  }

  threadExited = true;
}

bool easycomm::SetRequestHandler(
  std::function<RotatorResponse(RotatorRequest)> callback
) {
  requestHandler = callback;
  return true;
}

int easycomm::BoundPort() const
{
  return boundPort;
}
