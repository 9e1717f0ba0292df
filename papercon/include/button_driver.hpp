#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "gpio_line.hpp"
#include "init_retry.hpp"
#include "press_tracker.hpp"

struct ButtonConfig {
  std::string chip = "/dev/gpiochip0";
  unsigned line = 18;
  PressThresholds thresholds;
  std::chrono::milliseconds hold_check = std::chrono::milliseconds(100);
  RetryPolicy retry;
  std::string consumer = "papercon-button";
};

// Momentary push button on one pull-up line (pressed = low).
// Edge events and the periodic hold check run on one monitor thread;
// callbacks are invoked from that thread.
class ButtonDriver {
public:
  using Callback = std::function<void()>;

  explicit ButtonDriver(ButtonConfig cfg);
  ~ButtonDriver();

  ButtonDriver(const ButtonDriver&) = delete;
  ButtonDriver& operator=(const ButtonDriver&) = delete;

  void set_tap_callback(Callback cb);
  void set_long_press_callback(Callback cb);
  void set_factory_reset_callback(Callback cb);
  void set_long_press_ready_callback(Callback cb);

  // Requests the line and starts monitoring. Never throws: on failure the
  // driver stays disabled and retries in the background.
  void start();
  void stop();

  bool available() const { return retry_ && retry_->state() == InitState::Ready; }
  InitState state() const { return retry_ ? retry_->state() : InitState::Uninit; }

  // feeds the state machine directly; used by the monitor loop
  void handle(const EdgeStamp& es);
  void tick(std::chrono::nanoseconds now);

private:
  bool try_init();
  void monitor_loop();
  void fire(PressAction a);

  ButtonConfig cfg_;
  PressTracker tracker_;
  std::mutex tracker_mu_;

  std::mutex cb_mu_;
  Callback on_tap_, on_long_press_, on_factory_reset_, on_ready_;

  std::unique_ptr<GpioLine> line_;
  std::unique_ptr<InitRetry> retry_;
  std::atomic<bool> running_{false};
  std::thread monitor_;
};
