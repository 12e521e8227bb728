#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>

// Pelco-D: 7 bytes on the wire
// [0xFF] [address] [command1] [command2] [data1 = pan speed] [data2 = tilt speed] [checksum]
// checksum = (address + command1 + command2 + data1 + data2) mod 256

const uint8_t PELCO_SYNC = 0xFF;
const size_t PELCO_FRAME_SIZE = 7;
const uint8_t PELCO_MAX_SPEED = 0x3F;

// command2 direction bits
const uint8_t PELCO_CMD2_RIGHT = 0x02;
const uint8_t PELCO_CMD2_LEFT  = 0x04;
const uint8_t PELCO_CMD2_UP    = 0x08;
const uint8_t PELCO_CMD2_DOWN  = 0x10;

struct PelcoFrame {
  uint8_t address;
  uint8_t command1;
  uint8_t command2;
  uint8_t data1;
  uint8_t data2;
  uint8_t checksum;

  std::array<uint8_t, PELCO_FRAME_SIZE> Bytes() const;
};

uint8_t pelcoChecksum(uint8_t address, uint8_t command1, uint8_t command2, uint8_t data1, uint8_t data2);

PelcoFrame pelcoMake(uint8_t address, uint8_t command1, uint8_t command2, uint8_t data1, uint8_t data2);

// panDir / tiltDir: +1 right/up, -1 left/down, 0 idle on that axis.
// Speeds above PELCO_MAX_SPEED are clamped; an idle axis always carries speed 0.
PelcoFrame pelcoDrive(uint8_t address, int panDir, int tiltDir, int panSpeed, int tiltSpeed);

PelcoFrame pelcoStop(uint8_t address);

// none if the buffer is not a well-formed frame (size, sync byte or checksum)
std::optional<PelcoFrame> pelcoDecode(const uint8_t *buf, size_t len);
