#pragma once
#include <string>
#include <vector>

#include "transport.hpp"

extern const std::vector<std::string> kSerialCandidates;

// first candidate that exists, else the first candidate
std::string detect_serial_port(const std::vector<std::string>& candidates = kSerialCandidates);

struct SerialConfig {
  std::string path;        // empty = detect
  unsigned baud = 9600;
};

// termios raw 8N1 port. A port that fails to open is logged once and
// behaves as a no-op sink.
class SerialPort : public Transport {
public:
  explicit SerialPort(SerialConfig cfg);
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  const std::string& path() const { return path_; }

  bool is_open() const override { return fd_ >= 0; }
  bool write(const std::vector<uint8_t>& bytes) override;
  std::optional<uint8_t> read_byte(std::chrono::milliseconds timeout) override;
  void drain() override;
  void discard_input() override;

private:
  bool open_port(unsigned baud);

  std::string path_;
  int fd_ = -1;
};
