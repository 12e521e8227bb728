#pragma once

#include <string>
#include <queue>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>

/* NETWORK */
#include <arpa/inet.h>          /* htons() */
#include <netinet/in.h>         /* struct sockaddr_in */
#include <sys/socket.h>         /* socket(), bind(), send() */
#include <unistd.h>             /* close() */
#define CLOSE_SOCKET(X) close(X)
#define SOCKET_PRINT_ERROR(X) perror(X)

inline int send_fixed(int sockfd, const char *buf, size_t buflen, int opts) {
  size_t bytes_written = 0;
  while (bytes_written < buflen) {
    ssize_t ret = send(sockfd, buf + bytes_written, buflen - bytes_written, opts);
    if (ret < 0) {
      return -1;
    }

    bytes_written += ret;
  }
  return (int)bytes_written;
}

// thread safe queue, from https://codetrips.com/2020/07/26/modern-c-writing-a-thread-safe-queue/
template<typename T>
class ThreadsafeQueue {
  std::queue<T> queue_;
  mutable std::mutex mutex_;

 public:
  ThreadsafeQueue() = default;
  ThreadsafeQueue(const ThreadsafeQueue<T> &) = delete ;
  ThreadsafeQueue& operator=(const ThreadsafeQueue<T> &) = delete ;

  virtual ~ThreadsafeQueue() { }

  unsigned long size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  std::optional<T> pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return {};
    }
    T tmp = std::move(queue_.front());
    queue_.pop();
    return tmp;
  }

  void push(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(item));
  }
};

// ele = 90 means pointing the antenna to zenith; values above 90 are past
// the zenith on the far side (over-the-top elevation rotors)
struct Position {
  double azi;
  double ele;
};

using PositionCallback = std::function<void(Position)>;

enum RotatorAxis {
  AXIS_AZI,
  AXIS_ELE
};

enum RotatorCmd {
  GET_POS,
  CHANGE_POS,
  CHANGE_AZI,
  CHANGE_ELE,
  NUDGE,
  CALIBRATE,
  RESET_POS,
  STOP_MOTION
};

struct RotatorRequest {
  RotatorCmd cmd;
  union {
    struct {
      double aziRequested;
      double eleRequested;
    } ChangePos;
    struct {
      double aziRequested;
    } ChangeAzi;
    struct {
      double eleRequested;
    } ChangeEle;
    struct {
      RotatorAxis axis;
      int direction;  // +1 or -1
      double degrees;
    } Nudge;
  } payload;

  // invoked after every committed position update; may be empty
  PositionCallback onPositionChange;

  // stop generation the caller last saw; a Stop() since then cancels the
  // request instead of queuing it
  std::optional<uint64_t> stopGeneration;
};

enum MoveStatus {
  MOVE_COMPLETED,
  MOVE_CANCELLED,
  MOVE_FAILED,    // serial write failed mid-move
  MOVE_REJECTED   // worker not running, or command not understood
};

struct RotatorResponse {
  bool success = false;
  MoveStatus status = MOVE_REJECTED;
  Position position = {0.0, 0.0};
  std::string message;
};

class RotatorController {
public:
  enum RotatorStatus {
    IDLE,
    ROTATING
  };

  virtual ~RotatorController() = default;

  virtual void Start() = 0;
  virtual void Terminate() = 0;

  virtual bool Request(RotatorRequest req, std::function<void(RotatorResponse)> callback) = 0;

  // synchronized version; timeout in milliseconds; 0 for unlimited
  inline std::optional<RotatorResponse> RequestSync(
    RotatorRequest req,
    int timeout_msec = 0
  ) {
    struct SyncState {
      std::mutex m;
      std::condition_variable cv;
      bool done = false;
      RotatorResponse resp;
    };
    // shared so a late callback after a timeout never touches a dead frame
    auto state = std::make_shared<SyncState>();

    bool ret = this->Request(std::move(req), [state](RotatorResponse resp) {
      std::lock_guard<std::mutex> lk(state->m);
      state->resp = std::move(resp);
      state->done = true;
      state->cv.notify_all();
    });

    // failed to submit
    if (!ret) {
      return {};
    }

    std::unique_lock<std::mutex> lk(state->m);
    if (timeout_msec == 0) {
      state->cv.wait(lk, [&state] { return state->done; });
    } else {
      state->cv.wait_for(lk, std::chrono::milliseconds(timeout_msec), [&state] { return state->done; });
    }

    if (!state->done) {
      return {};
    }
    return state->resp;
  }
};

class PseudoRotator {
public:
  virtual ~PseudoRotator() = default;

  virtual bool Start() = 0;
  virtual void Terminate() = 0;

  virtual bool SetRequestHandler(std::function<RotatorResponse(RotatorRequest)> callback) = 0;
};
