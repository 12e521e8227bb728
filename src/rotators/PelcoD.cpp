#include "rotators/PelcoD.hpp"

static uint8_t clampSpeed(int speed)
{
  if (speed < 0) {
    return 0;
  } else if (speed > PELCO_MAX_SPEED) {
    return PELCO_MAX_SPEED;
  }
  return (uint8_t)speed;
}

std::array<uint8_t, PELCO_FRAME_SIZE> PelcoFrame::Bytes() const
{
  return {PELCO_SYNC, address, command1, command2, data1, data2, checksum};
}

uint8_t pelcoChecksum(uint8_t address, uint8_t command1, uint8_t command2, uint8_t data1, uint8_t data2)
{
  unsigned int sum = address + command1 + command2 + data1 + data2;
  return (uint8_t)(sum % 256);
}

PelcoFrame pelcoMake(uint8_t address, uint8_t command1, uint8_t command2, uint8_t data1, uint8_t data2)
{
  PelcoFrame frame;
  frame.address = address;
  frame.command1 = command1;
  frame.command2 = command2;
  frame.data1 = data1;
  frame.data2 = data2;
  frame.checksum = pelcoChecksum(address, command1, command2, data1, data2);
  return frame;
}

PelcoFrame pelcoDrive(uint8_t address, int panDir, int tiltDir, int panSpeed, int tiltSpeed)
{
  uint8_t cmd2 = 0x00;
  uint8_t data1 = 0x00;
  uint8_t data2 = 0x00;

  if (panDir > 0) {
    cmd2 |= PELCO_CMD2_RIGHT;
  } else if (panDir < 0) {
    cmd2 |= PELCO_CMD2_LEFT;
  }
  if (panDir != 0) {
    data1 = clampSpeed(panSpeed);
  }

  if (tiltDir > 0) {
    cmd2 |= PELCO_CMD2_UP;
  } else if (tiltDir < 0) {
    cmd2 |= PELCO_CMD2_DOWN;
  }
  if (tiltDir != 0) {
    data2 = clampSpeed(tiltSpeed);
  }

  return pelcoMake(address, 0x00, cmd2, data1, data2);
}

PelcoFrame pelcoStop(uint8_t address)
{
  return pelcoMake(address, 0x00, 0x00, 0x00, 0x00);
}

std::optional<PelcoFrame> pelcoDecode(const uint8_t *buf, size_t len)
{
  if (buf == nullptr || len != PELCO_FRAME_SIZE || buf[0] != PELCO_SYNC) {
    return {};
  }

  PelcoFrame frame = pelcoMake(buf[1], buf[2], buf[3], buf[4], buf[5]);
  if (frame.checksum != buf[6]) {
    return {};
  }
  return frame;
}
