#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

// Print-in-progress flag plus last-start timestamp under one mutex.
// Start attempts while busy or inside the debounce window are rejected,
// never queued.
class PrintGate {
public:
  using Clock = std::chrono::steady_clock;

  explicit PrintGate(std::chrono::milliseconds debounce = std::chrono::seconds(2))
      : debounce_(debounce) {}

  bool try_begin(Clock::time_point now = Clock::now());
  // waits for a running job to finish, then begins; ignores the debounce
  // window
  void begin_wait();
  void finish();
  bool busy() const;

private:
  mutable std::mutex mu_;
  std::condition_variable idle_;
  std::chrono::milliseconds debounce_;
  bool in_progress_ = false;
  std::optional<Clock::time_point> last_start_;
};
