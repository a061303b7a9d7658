#pragma once

//
// HAL serial link facade.
// -----------------------
// The synth takes its programming over a plain UART.  `SerialLink` is the
// byte-pipe contract the protocol layer writes through; `PosixSerialPort` is
// the termios-backed implementation used on the rig and tests swap in a fake
// that records every byte.  Every call reports through `juce::Result` so the
// OS error text reaches the run log untouched.

#include <cstddef>
#include <cstdint>
#include <string>

#include <juce_core/juce_core.h>

namespace hal {
namespace serial {

class SerialLink {
 public:
  virtual ~SerialLink() = default;

  virtual bool isOpen() const = 0;
  // Drop anything the device sent that nobody read yet.
  virtual juce::Result discardInput() = 0;
  virtual juce::Result write(const std::uint8_t* data, std::size_t size) = 0;
  // Block until the OS has pushed every written byte onto the wire.
  virtual juce::Result flush() = 0;
};

// Raw 8N1, no flow control.  Reads time out after one second (VMIN=0,
// VTIME=10) so a wedged device can never hang the control thread.
class PosixSerialPort final : public SerialLink {
 public:
  static constexpr int kReadTimeoutDeciseconds = 10;
  static constexpr int kOpenSettleMs = 500;

  PosixSerialPort() = default;
  ~PosixSerialPort() override;

  PosixSerialPort(const PosixSerialPort&) = delete;
  PosixSerialPort& operator=(const PosixSerialPort&) = delete;

  // Open and configure `path`, wait for the port to settle, then discard
  // whatever the device chattered during boot.
  juce::Result open(const std::string& path, int baudRate, int settleMs = kOpenSettleMs);
  void close();

  bool isOpen() const override { return fd_ >= 0; }
  juce::Result discardInput() override;
  juce::Result write(const std::uint8_t* data, std::size_t size) override;
  juce::Result flush() override;

  // Single read honouring the port timeout.  `received` is 0 on timeout.
  juce::Result read(std::uint8_t* data, std::size_t capacity, std::size_t& received);

  const std::string& path() const { return path_; }

  // True when `baudRate` maps onto a termios speed constant on this platform.
  static bool supportsBaudRate(int baudRate);

 private:
  juce::Result failure(const char* what) const;

  int fd_{-1};
  std::string path_;
};

}  // namespace serial
}  // namespace hal
