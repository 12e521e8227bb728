#pragma once

#include "RotatorCommon.hpp"
#include "rotators/PelcoD.hpp"

// Byte channel the motion planner writes Pelco frames to. Implementations do
// no framing and no retries: a failed write is reported once.
class SerialTransport {
public:
  virtual ~SerialTransport() = default;

  // false: link unavailable
  virtual bool Open(const std::string &port, int baud) = 0;
  // false: transport error
  virtual bool Write(const PelcoFrame &frame) = 0;
  virtual void Close() = 0;
};

class TermiosSerialLink : public SerialTransport {
private:
  int fd = -1;
  std::string portName;

public:
  ~TermiosSerialLink() override;

  virtual bool Open(const std::string &port, int baud) override;
  virtual bool Write(const PelcoFrame &frame) override;
  virtual void Close() override;
};
