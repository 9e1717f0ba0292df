#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "gpio_line.hpp"
#include "init_retry.hpp"

constexpr int kDialPositions = 8;

// Lowest-numbered line reading low (1-based). With no line low the switch is
// between contacts and the last known position is kept.
int position_from_levels(const std::vector<int>& levels, int last);

struct DialConfig {
  std::string chip = "/dev/gpiochip0";
  std::vector<unsigned> lines = {5, 6, 13, 19, 26, 16, 20, 21};
  std::optional<unsigned> common_line;  // driven low when the common pin is not tied to GND
  std::chrono::milliseconds poll = std::chrono::milliseconds(100);
  RetryPolicy retry;
  std::string consumer = "papercon-dial";
};

// 1-pole 8-position rotary switch, one pull-up input per position.
class DialDriver {
public:
  using Listener = std::function<void(int)>;

  explicit DialDriver(DialConfig cfg);
  ~DialDriver();

  DialDriver(const DialDriver&) = delete;
  DialDriver& operator=(const DialDriver&) = delete;

  void register_position_listener(Listener cb);

  void start();
  void stop();

  int read_position() const { return position_.load(); }
  // software override for running without the switch; notifies listeners
  bool set_position(int position);
  // feeds one frame of raw line levels; returns true if the position changed
  bool update(const std::vector<int>& levels);

  bool available() const { return retry_ && retry_->state() == InitState::Ready; }
  InitState state() const { return retry_ ? retry_->state() : InitState::Uninit; }

private:
  bool try_init();
  void poll_loop();
  void notify(int position);

  DialConfig cfg_;
  std::atomic<int> position_{1};

  std::mutex listeners_mu_;
  std::vector<Listener> listeners_;

  std::unique_ptr<GpioLineBank> inputs_;
  std::unique_ptr<GpioLineBank> common_;
  std::unique_ptr<InitRetry> retry_;
  std::atomic<bool> running_{false};
  std::thread poller_;
};
