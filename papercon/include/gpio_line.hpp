#pragma once
#include <gpiod.h>
#include <chrono>
#include <string>
#include <vector>

#include "hw_error.hpp"
#include "press_tracker.hpp"

enum class Bias { AsIs, PullUp, PullDown, Disabled };

// Owns an open /dev/gpiochipN. Throws GpioError(DeviceUnavailable).
class GpioChip {
public:
  explicit GpioChip(const std::string& path);
  ~GpioChip();

  GpioChip(const GpioChip&) = delete;
  GpioChip& operator=(const GpioChip&) = delete;

  gpiod_chip* get() const { return chip_; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  gpiod_chip* chip_{};
};

struct GpioLineCfg {
  std::string chip;   // e.g. "/dev/gpiochip0"
  unsigned line;      // e.g. 0..n
  bool edge_rising = true;
  bool edge_falling = true;
  Bias bias = Bias::PullUp;
  bool active_low = false;
  std::string consumer = "papercon";
};

// Single line requested for edge events.
class GpioLine {
public:
  explicit GpioLine(const GpioLineCfg& cfg);
  ~GpioLine();

  GpioLine(const GpioLine&) = delete;
  GpioLine& operator=(const GpioLine&) = delete;
  GpioLine(GpioLine&&) = delete;
  GpioLine& operator=(GpioLine&&) = delete;

  // true if an event is pending before the timeout expires
  bool wait(std::chrono::milliseconds timeout);

  // reads up to max_events pending edges, oldest first
  std::vector<Edge> read_events(unsigned max_events = 16);

private:
  GpioChip chip_;
  gpiod_line* line_{};
};

struct GpioBankCfg {
  std::string chip;
  std::vector<unsigned> lines;
  bool output = false;
  Bias bias = Bias::AsIs;
  bool active_low = false;
  std::vector<int> defaults;  // output only, one per line
  std::string consumer = "papercon";
};

// Up to 64 lines requested together for polled reads or writes.
class GpioLineBank {
public:
  explicit GpioLineBank(const GpioBankCfg& cfg);
  ~GpioLineBank();

  GpioLineBank(const GpioLineBank&) = delete;
  GpioLineBank& operator=(const GpioLineBank&) = delete;

  std::vector<int> get_values();
  void set_values(const std::vector<int>& values);
  size_t size() const { return count_; }

private:
  GpioChip chip_;
  gpiod_line_bulk bulk_{};
  size_t count_ = 0;
  bool requested_ = false;
};
