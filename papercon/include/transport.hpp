#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

// Byte pipe to the printer. Implementations never throw: a closed
// transport swallows writes and answers reads with nothing.
class Transport {
public:
  virtual ~Transport() = default;

  virtual bool is_open() const = 0;
  virtual bool write(const std::vector<uint8_t>& bytes) = 0;
  // one byte or nullopt when nothing arrived within timeout
  virtual std::optional<uint8_t> read_byte(std::chrono::milliseconds timeout) = 0;
  // blocks until queued output has been transmitted
  virtual void drain() = 0;
  // drops unread input so a status reply is not mistaken for an older one
  virtual void discard_input() = 0;
};
