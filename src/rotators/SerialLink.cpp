#include "rotators/SerialLink.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <termios.h>

static bool baudToSpeed(int baud, speed_t *speed)
{
  switch (baud) {
  case 1200: *speed = B1200; return true;
  case 2400: *speed = B2400; return true;
  case 4800: *speed = B4800; return true;
  case 9600: *speed = B9600; return true;
  case 19200: *speed = B19200; return true;
  case 38400: *speed = B38400; return true;
  case 57600: *speed = B57600; return true;
  case 115200: *speed = B115200; return true;
  default: return false;
  }
}

TermiosSerialLink::~TermiosSerialLink()
{
  Close();
}

bool TermiosSerialLink::Open(const std::string &port, int baud)
{
  speed_t speed;
  if (!baudToSpeed(baud, &speed)) {
    fprintf(stderr, "SerialLink: unsupported baud rate %d\n", baud);
    return false;
  }

  fd = open(port.c_str(), O_RDWR | O_NOCTTY);
  if (fd < 0) {
    fprintf(stderr, "SerialLink: error opening %s: %s(%d)\n", port.c_str(), strerror(errno), errno);
    return false;
  }

  struct termios tty_setting;
  if (tcgetattr(fd, &tty_setting)) {
    fprintf(stderr, "SerialLink: error getting tty attributes %s(%d)\n", strerror(errno), errno);
    Close();
    return false;
  }

  // 8N1, raw, no flow control
  cfmakeraw(&tty_setting);
  tty_setting.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);
  tty_setting.c_cflag |= CS8 | CLOCAL | CREAD;

  if (cfsetspeed(&tty_setting, speed)) {
    fprintf(stderr, "SerialLink: error setting serial speed %s(%d)\n", strerror(errno), errno);
    Close();
    return false;
  }

  if (tcsetattr(fd, TCSANOW, &tty_setting)) {
    fprintf(stderr, "SerialLink: error setting tty attributes %s(%d)\n", strerror(errno), errno);
    Close();
    return false;
  }

  portName = port;
  printf("SerialLink: %s opened at %d baud.\n", port.c_str(), baud);
  return true;
}

bool TermiosSerialLink::Write(const PelcoFrame &frame)
{
  if (fd < 0) {
    fprintf(stderr, "SerialLink: write on closed link\n");
    return false;
  }

  auto bytes = frame.Bytes();
  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t ret = write(fd, bytes.data() + written, bytes.size() - written);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      fprintf(stderr, "SerialLink: write to %s failed: %s(%d)\n", portName.c_str(), strerror(errno), errno);
      return false;
    }
    written += ret;
  }

  if (tcdrain(fd)) {
    fprintf(stderr, "SerialLink: drain on %s failed: %s(%d)\n", portName.c_str(), strerror(errno), errno);
    return false;
  }
  return true;
}

void TermiosSerialLink::Close()
{
  if (fd >= 0) {
    close(fd);
    fd = -1;
    printf("SerialLink: %s closed.\n", portName.c_str());
  }
}
