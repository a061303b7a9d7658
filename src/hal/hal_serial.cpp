// termios plumbing for the synth's programming UART.  Everything here is plain
// POSIX so it runs on Linux and macOS alike; the only platform wrinkle is the
// set of high baud constants, which glibc exposes and BSDs mostly do not.
#include "hal/hal_serial.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace hal {
namespace serial {

namespace {

struct BaudEntry {
  int rate;
  speed_t constant;
};

constexpr BaudEntry kBaudTable[] = {
    {9600, B9600},       {19200, B19200},     {38400, B38400},
    {57600, B57600},     {115200, B115200},   {230400, B230400},
#ifdef B460800
    {460800, B460800},
#endif
#ifdef B500000
    {500000, B500000},
#endif
#ifdef B576000
    {576000, B576000},
#endif
#ifdef B921600
    {921600, B921600},
#endif
#ifdef B1000000
    {1000000, B1000000},
#endif
#ifdef B1500000
    {1500000, B1500000},
#endif
#ifdef B2000000
    {2000000, B2000000},
#endif
#ifdef B3000000
    {3000000, B3000000},
#endif
#ifdef B4000000
    {4000000, B4000000},
#endif
};

bool lookupBaud(int rate, speed_t& out) {
  for (const auto& entry : kBaudTable) {
    if (entry.rate == rate) {
      out = entry.constant;
      return true;
    }
  }
  return false;
}

}  // namespace

PosixSerialPort::~PosixSerialPort() { close(); }

bool PosixSerialPort::supportsBaudRate(int baudRate) {
  speed_t unused{};
  return lookupBaud(baudRate, unused);
}

juce::Result PosixSerialPort::open(const std::string& path, int baudRate, int settleMs) {
  close();

  speed_t speed{};
  if (!lookupBaud(baudRate, speed)) {
    return juce::Result::fail("unsupported baud rate " + juce::String(baudRate));
  }

  path_ = path;
  fd_ = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd_ < 0) {
    return failure("open");
  }

  termios tty{};
  if (::tcgetattr(fd_, &tty) != 0) {
    const auto result = failure("tcgetattr");
    close();
    return result;
  }

  ::cfmakeraw(&tty);
  tty.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);
  tty.c_cflag &= static_cast<tcflag_t>(~CSTOPB);
  tty.c_cflag &= static_cast<tcflag_t>(~PARENB);
#ifdef CRTSCTS
  tty.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
  tty.c_iflag &= static_cast<tcflag_t>(~(IXON | IXOFF | IXANY));
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = kReadTimeoutDeciseconds;

  if (::cfsetispeed(&tty, speed) != 0 || ::cfsetospeed(&tty, speed) != 0) {
    const auto result = failure("cfsetspeed");
    close();
    return result;
  }
  if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
    const auto result = failure("tcsetattr");
    close();
    return result;
  }

  // Many USB-serial bridges reset the attached board when the port opens.
  if (settleMs > 0) {
    juce::Thread::sleep(settleMs);
  }
  const auto drained = discardInput();
  if (drained.failed()) {
    close();
    return drained;
  }
  return juce::Result::ok();
}

void PosixSerialPort::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

juce::Result PosixSerialPort::discardInput() {
  if (fd_ < 0) {
    return juce::Result::fail("serial port is not open");
  }
  if (::tcflush(fd_, TCIFLUSH) != 0) {
    return failure("tcflush");
  }
  return juce::Result::ok();
}

juce::Result PosixSerialPort::write(const std::uint8_t* data, std::size_t size) {
  if (fd_ < 0) {
    return juce::Result::fail("serial port is not open");
  }
  std::size_t written = 0;
  while (written < size) {
    const ssize_t n = ::write(fd_, data + written, size - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return failure("write");
    }
    written += static_cast<std::size_t>(n);
  }
  return juce::Result::ok();
}

juce::Result PosixSerialPort::flush() {
  if (fd_ < 0) {
    return juce::Result::fail("serial port is not open");
  }
  while (::tcdrain(fd_) != 0) {
    if (errno != EINTR) {
      return failure("tcdrain");
    }
  }
  return juce::Result::ok();
}

juce::Result PosixSerialPort::read(std::uint8_t* data, std::size_t capacity, std::size_t& received) {
  received = 0;
  if (fd_ < 0) {
    return juce::Result::fail("serial port is not open");
  }
  for (;;) {
    const ssize_t n = ::read(fd_, data, capacity);
    if (n >= 0) {
      received = static_cast<std::size_t>(n);
      return juce::Result::ok();
    }
    if (errno != EINTR) {
      return failure("read");
    }
  }
}

juce::Result PosixSerialPort::failure(const char* what) const {
  const int err = errno;
  return juce::Result::fail(juce::String(path_) + ": " + what + " failed: " + std::strerror(err));
}

}  // namespace serial
}  // namespace hal
